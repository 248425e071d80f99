#pragma once

#include "bus/event_emitter.hpp"
#include "sandbox/capability_allowlist.hpp"
#include "sandbox/types.hpp"

namespace snipguard::sandbox {

class Executor {
public:
    virtual ~Executor() = default;
    virtual const char* Name() const = 0;
    // Never throws for snippet behaviour; every exit is one ExecutionOutcome.
    virtual ExecutionOutcome Run(const ExecutionRequest& request,
                                 const CapabilitySet& capabilities,
                                 bus::EventEmitter& events) = 0;
};

}  // namespace snipguard::sandbox
