#include <gtest/gtest.h>

#include <sys/resource.h>

#include "sandbox/resource_limiter.hpp"

using namespace snipguard::sandbox;

namespace {

rlim_t CurrentSoft(int resource) {
    struct rlimit limit{};
    EXPECT_EQ(0, ::getrlimit(resource, &limit));
    return limit.rlim_cur;
}

rlim_t CurrentSoftAddressSpace() {
    return CurrentSoft(RLIMIT_AS);
}

}  // namespace

TEST(ResourceLimiterTest, AddressSpaceIsReadable) {
    EXPECT_GT(ResourceLimiter::CurrentAddressSpace(), 0u);
}

TEST(ResourceLimiterTest, ScopedLimitsLowerAndRestoreAddressSpace) {
    const auto before = CurrentSoftAddressSpace();
    ExecutionLimits limits;
    limits.max_memory_bytes = 256ull * 1024 * 1024;
    {
        ScopedLimits scoped(limits);
        const auto during = CurrentSoftAddressSpace();
        EXPECT_NE(RLIM_INFINITY, during);
        EXPECT_EQ(scoped.AddressSpaceCeiling(), during);
        EXPECT_GE(during, static_cast<rlim_t>(limits.max_memory_bytes));
    }
    EXPECT_EQ(before, CurrentSoftAddressSpace());
}

TEST(ResourceLimiterTest, NestedScopeNeverRaisesTighterCeiling) {
    ExecutionLimits tight;
    tight.max_memory_bytes = 128ull * 1024 * 1024;
    ExecutionLimits loose;
    loose.max_memory_bytes = 1024ull * 1024 * 1024;

    ScopedLimits outer(tight);
    const auto ceiling = CurrentSoftAddressSpace();
    {
        ScopedLimits inner(loose);
        EXPECT_EQ(ceiling, CurrentSoftAddressSpace());
    }
    EXPECT_EQ(ceiling, CurrentSoftAddressSpace());
}

TEST(ResourceLimiterTest, ScopedLimitsLowerAndRestoreProcessCount) {
    const auto before = CurrentSoft(RLIMIT_NPROC);
    ExecutionLimits limits;
    limits.max_processes = 1;
    {
        ScopedLimits scoped(limits);
        const auto during = CurrentSoft(RLIMIT_NPROC);
        EXPECT_EQ(scoped.ProcessCeiling(), during);
        EXPECT_LE(during, static_cast<rlim_t>(1));
    }
    EXPECT_EQ(before, CurrentSoft(RLIMIT_NPROC));
}
