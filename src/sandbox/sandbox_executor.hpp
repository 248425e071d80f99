#pragma once

#include <chrono>
#include <cstdint>

#include "sandbox/executor.hpp"
#include "sandbox/sandbox_profile.hpp"

namespace snipguard::sandbox {

// Runs each snippet in a fresh `runner` child: empty environment, private temp
// directory as working directory, own process group. The parent deadline is the
// child's wall ceiling plus the grace margin; on overrun the whole group is killed.
class SandboxExecutor : public Executor {
public:
    explicit SandboxExecutor(SandboxProfile profile);

    const char* Name() const override { return "isolated"; }
    ExecutionOutcome Run(const ExecutionRequest& request,
                         const CapabilitySet& capabilities,
                         bus::EventEmitter& events) override;

private:
    SandboxProfile profile_;
};

// Outcome for a runner that died from `signal_number`. SIGKILL is the CPU limit only
// when the child's CPU time shows the budget was spent; otherwise it is unexplained.
ExecutionOutcome ClassifyTermination(int signal_number,
                                     std::chrono::milliseconds child_cpu,
                                     const ExecutionLimits& limits,
                                     std::int64_t elapsed_ms);

}  // namespace snipguard::sandbox
