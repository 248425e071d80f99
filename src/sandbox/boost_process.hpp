#pragma once

#include <boost/version.hpp>

#if BOOST_VERSION >= 108600
#include <boost/process/v1.hpp>
namespace snipguard::sandbox {
namespace bp = boost::process::v1;
}  // namespace snipguard::sandbox
#else
#include <boost/process.hpp>
namespace snipguard::sandbox {
namespace bp = boost::process;
}  // namespace snipguard::sandbox
#endif
