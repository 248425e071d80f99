#pragma once

#include <sys/resource.h>

#include <cstdint>

#include "sandbox/types.hpp"

namespace snipguard::sandbox {

class ResourceLimiter {
public:
    // Current virtual size of this process in bytes, read from /proc/self/statm.
    static std::uint64_t CurrentAddressSpace();

    // Irreversible; meant for the runner child before it builds the namespace.
    // Throws SandboxError when a ceiling cannot be installed.
    static void ApplyHardLimits(const ExecutionLimits& limits);
};

// Lowers the soft RLIMIT_AS and RLIMIT_NPROC for the lifetime of the object and
// restores them afterwards. Never raises a ceiling that is already tighter.
class ScopedLimits {
public:
    explicit ScopedLimits(const ExecutionLimits& limits);
    ~ScopedLimits();

    ScopedLimits(const ScopedLimits&) = delete;
    ScopedLimits& operator=(const ScopedLimits&) = delete;

    rlim_t AddressSpaceCeiling() const { return address_space_.ceiling; }
    rlim_t ProcessCeiling() const { return processes_.ceiling; }

private:
    struct SoftLimit {
        int resource = 0;
        const char* name = "";
        struct rlimit saved{};
        rlim_t ceiling = RLIM_INFINITY;
        bool installed = false;
    };

    static void Lower(SoftLimit& limit, rlim_t wanted);
    static void Restore(const SoftLimit& limit);

    SoftLimit address_space_;
    SoftLimit processes_;
};

}  // namespace snipguard::sandbox
