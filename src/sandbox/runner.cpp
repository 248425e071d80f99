#include "sandbox/runner.hpp"

#include <unistd.h>

#include <chrono>
#include <iterator>
#include <mutex>
#include <string>

#include "bus/event_emitter.hpp"
#include "sandbox/capability_allowlist.hpp"
#include "sandbox/in_process_executor.hpp"
#include "sandbox/python_runtime.hpp"
#include "sandbox/resource_limiter.hpp"
#include "sandbox/timeout_supervisor.hpp"
#include "sandbox/wire_codec.hpp"
#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace snipguard::sandbox {
namespace {

// How long past the wall limit native code may hold the interpreter before the
// runner reports the timeout itself and exits.
constexpr std::chrono::milliseconds kHardStopSlack{500};

void WriteOutcome(std::ostream& out, const ExecutionOutcome& outcome) {
    out << EncodeOutcome(outcome).dump(-1, ' ', false, nlohmann::json::error_handler_t::replace) << std::endl;
}

}  // namespace

int RunChild(std::istream& in, std::ostream& out) {
    const auto start = std::chrono::steady_clock::now();
    std::mutex out_mutex;
    // Created before the process limits so its thread exists even under RLIMIT_NPROC.
    TimeoutSupervisor hard_stop;

    ExecutionOutcome outcome = InternalError{"runner did not start", std::nullopt};
    try {
        const std::string raw((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
        const auto input = DecodeRunnerInput(nlohmann::json::parse(raw));

        PythonRuntime::Instance();
        InProcessExecutor executor(LimitMode::kHard);
        ResourceLimiter::ApplyHardLimits(input.request.limits);

        const auto capabilities = CapabilityAllowlist::BuildNamespace(input.namespaces);
        bus::EventEmitter events;
        events.SubscribeProgress([](const bus::ProgressEvent& event) {
            utils::Log(utils::LogLevel::kDebug, "runner", "phase", {{"step", bus::ToString(event.phase)}});
        });

        hard_stop.Arm(std::chrono::seconds(input.request.limits.max_wall_seconds) + kHardStopSlack,
                      [&](ExpiryReason, std::uint64_t generation) {
                          std::lock_guard<std::mutex> lock(out_mutex);
                          if (!hard_stop.StillArmed(generation)) {
                              return;
                          }
                          WriteOutcome(out, TimedOut{utils::ElapsedMs(start)});
                          ::_exit(0);
                      });
        outcome = executor.Run(input.request, capabilities, events);
    } catch (const std::exception& ex) {
        utils::Log(utils::LogLevel::kError, "runner", "failed", {{"error", ex.what()}});
        outcome = InternalError{ex.what(), std::nullopt};
    }

    std::lock_guard<std::mutex> lock(out_mutex);
    hard_stop.Disarm();
    WriteOutcome(out, outcome);
    return 0;
}

}  // namespace snipguard::sandbox
