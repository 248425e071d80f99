#include "sandbox/resource_limiter.hpp"

#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <fstream>
#include <string>

#include "utils/logging.hpp"

namespace snipguard::sandbox {
namespace {

void SetLimit(int resource, const char* name, rlim_t soft, rlim_t hard) {
    struct rlimit limit{};
    limit.rlim_cur = soft;
    limit.rlim_max = hard;
    if (::setrlimit(resource, &limit) != 0) {
        throw SandboxError(std::string("setrlimit ") + name + " failed: " + std::strerror(errno));
    }
}

rlim_t Clamp(rlim_t wanted, rlim_t hard) {
    if (hard != RLIM_INFINITY && wanted > hard) {
        return hard;
    }
    return wanted;
}

}  // namespace

std::uint64_t ResourceLimiter::CurrentAddressSpace() {
    std::ifstream statm("/proc/self/statm");
    std::uint64_t pages = 0;
    if (!(statm >> pages)) {
        throw SandboxError("cannot read /proc/self/statm");
    }
    return pages * static_cast<std::uint64_t>(::sysconf(_SC_PAGESIZE));
}

void ResourceLimiter::ApplyHardLimits(const ExecutionLimits& limits) {
    const auto address_space = static_cast<rlim_t>(CurrentAddressSpace() + limits.max_memory_bytes);
    SetLimit(RLIMIT_AS, "RLIMIT_AS", address_space, address_space);
    SetLimit(RLIMIT_CPU, "RLIMIT_CPU",
             static_cast<rlim_t>(limits.max_cpu_seconds) + 1,
             static_cast<rlim_t>(limits.max_cpu_seconds) + 2);
    SetLimit(RLIMIT_NPROC, "RLIMIT_NPROC",
             static_cast<rlim_t>(limits.max_processes),
             static_cast<rlim_t>(limits.max_processes));
    SetLimit(RLIMIT_FSIZE, "RLIMIT_FSIZE",
             static_cast<rlim_t>(limits.max_file_bytes),
             static_cast<rlim_t>(limits.max_file_bytes));
    SetLimit(RLIMIT_CORE, "RLIMIT_CORE", 0, 0);
    utils::Log(utils::LogLevel::kDebug, "limits", "hard limits installed",
               {{"as", std::to_string(address_space)},
                {"cpu", std::to_string(limits.max_cpu_seconds)},
                {"nproc", std::to_string(limits.max_processes)},
                {"fsize", std::to_string(limits.max_file_bytes)}});
}

ScopedLimits::ScopedLimits(const ExecutionLimits& limits) {
    address_space_.resource = RLIMIT_AS;
    address_space_.name = "RLIMIT_AS";
    processes_.resource = RLIMIT_NPROC;
    processes_.name = "RLIMIT_NPROC";

    Lower(address_space_,
          static_cast<rlim_t>(ResourceLimiter::CurrentAddressSpace() + limits.max_memory_bytes));
    try {
        Lower(processes_, static_cast<rlim_t>(limits.max_processes));
    } catch (const SandboxError&) {
        Restore(address_space_);
        throw;
    }
}

ScopedLimits::~ScopedLimits() {
    Restore(processes_);
    Restore(address_space_);
}

void ScopedLimits::Lower(SoftLimit& limit, rlim_t wanted) {
    if (::getrlimit(limit.resource, &limit.saved) != 0) {
        throw SandboxError(std::string("getrlimit ") + limit.name + " failed: " + std::strerror(errno));
    }
    wanted = Clamp(wanted, limit.saved.rlim_max);
    if (limit.saved.rlim_cur != RLIM_INFINITY && limit.saved.rlim_cur <= wanted) {
        limit.ceiling = limit.saved.rlim_cur;
        return;
    }
    SetLimit(limit.resource, limit.name, wanted, limit.saved.rlim_max);
    limit.ceiling = wanted;
    limit.installed = true;
}

void ScopedLimits::Restore(const SoftLimit& limit) {
    if (!limit.installed) {
        return;
    }
    if (::setrlimit(limit.resource, &limit.saved) != 0) {
        utils::Log(utils::LogLevel::kError, "limits", std::string("failed to restore ") + limit.name,
                   {{"error", std::strerror(errno)}});
    }
}

}  // namespace snipguard::sandbox
