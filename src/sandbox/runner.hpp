#pragma once

#include <istream>
#include <ostream>

namespace snipguard::sandbox {

// Entry point of the `runner` child: reads a runner message from `in`, installs hard
// limits, runs the snippet and writes exactly one outcome line to `out`.
int RunChild(std::istream& in, std::ostream& out);

}  // namespace snipguard::sandbox
