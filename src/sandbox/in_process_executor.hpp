#pragma once

#include "sandbox/executor.hpp"
#include "sandbox/timeout_supervisor.hpp"

namespace snipguard::sandbox {

enum class LimitMode {
    // Lower RLIMIT_AS for the call and restore it afterwards.
    kScoped,
    // The caller already installed irreversible limits (runner child).
    kHard
};

// Runs the snippet on the calling thread inside the embedded interpreter.
// The supervisor thread is started here, before any limit is installed.
class InProcessExecutor : public Executor {
public:
    explicit InProcessExecutor(LimitMode mode = LimitMode::kScoped);

    const char* Name() const override { return "in_process"; }
    ExecutionOutcome Run(const ExecutionRequest& request,
                         const CapabilitySet& capabilities,
                         bus::EventEmitter& events) override;

private:
    LimitMode mode_;
    TimeoutSupervisor supervisor_;
};

}  // namespace snipguard::sandbox
