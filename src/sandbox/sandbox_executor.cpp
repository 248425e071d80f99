#include "sandbox/sandbox_executor.hpp"

#include <signal.h>
#include <sys/resource.h>
#include <sys/wait.h>

#include <boost/asio/buffer.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <chrono>
#include <future>
#include <sstream>
#include <system_error>

#include "sandbox/boost_process.hpp"
#include "sandbox/wire_codec.hpp"
#include "utils/common.hpp"
#include "utils/logging.hpp"
#include "utils/scoped_temp_dir.hpp"

namespace snipguard::sandbox {
namespace {

std::string LastLine(const std::string& text) {
    std::istringstream stream(text);
    std::string line;
    std::string last;
    while (std::getline(stream, line)) {
        if (!line.empty()) {
            last = line;
        }
    }
    return last;
}

// User plus system time of every reaped child so far.
std::chrono::milliseconds ChildrenCpuTime() {
    struct rusage usage{};
    if (::getrusage(RUSAGE_CHILDREN, &usage) != 0) {
        return std::chrono::milliseconds(0);
    }
    const auto micros = (usage.ru_utime.tv_sec + usage.ru_stime.tv_sec) * 1000000LL +
                        usage.ru_utime.tv_usec + usage.ru_stime.tv_usec;
    return std::chrono::milliseconds(micros / 1000);
}

}  // namespace

ExecutionOutcome ClassifyTermination(int signal_number,
                                     std::chrono::milliseconds child_cpu,
                                     const ExecutionLimits& limits,
                                     std::int64_t elapsed_ms) {
    switch (signal_number) {
        case SIGXCPU:
            return ResourceExceeded{ResourceKind::kCpu, elapsed_ms};
        case SIGXFSZ:
            return ResourceExceeded{ResourceKind::kFileSize, elapsed_ms};
        case SIGKILL:
            if (child_cpu >= std::chrono::seconds(limits.max_cpu_seconds)) {
                return ResourceExceeded{ResourceKind::kCpu, elapsed_ms};
            }
            break;
        default:
            break;
    }
    return InternalError{"runner terminated by signal " + std::to_string(signal_number), elapsed_ms};
}

SandboxExecutor::SandboxExecutor(SandboxProfile profile)
    : profile_(std::move(profile)) {}

ExecutionOutcome SandboxExecutor::Run(const ExecutionRequest& request,
                                      const CapabilitySet& capabilities,
                                      bus::EventEmitter& events) {
    const auto start = std::chrono::steady_clock::now();
    if (profile_.runner_path.empty()) {
        return InternalError{"runner executable is not configured", utils::ElapsedMs(start)};
    }

    events.Progress(bus::Phase::kPreparingEnvironment, "Preparing execution environment");
    utils::ScopedTempDir scope(profile_.temp_root, "snipguard-");

    SandboxProfile profile = profile_;
    profile.namespaces = capabilities.NamespaceNames();
    const auto input = EncodeRunnerInput(request, profile).dump(
        -1, ' ', false, nlohmann::json::error_handler_t::replace);
    if (request.HasContext()) {
        events.Progress(bus::Phase::kLoadingContext, "Loading context data");
    }

    boost::asio::io_context io;
    boost::asio::steady_timer timer(io);
    std::future<std::string> stdout_future;
    std::future<std::string> stderr_future;
    bp::group group;
    bool killed = false;

    events.Progress(bus::Phase::kExecuting, "Executing code");
    utils::Log(utils::LogLevel::kDebug, "sandbox", "spawn runner",
               {{"runner", profile_.runner_path.string()}, {"cwd", scope.Path().string()}});
    int native_status = 0;
    const auto cpu_before = ChildrenCpuTime();
    try {
        bp::environment env;
        bp::child child(
            profile_.runner_path.string(),
            "runner",
            env,
            bp::start_dir = scope.Path().string(),
            bp::std_in < boost::asio::buffer(input),
            bp::std_out > stdout_future,
            bp::std_err > stderr_future,
            io,
            group,
            bp::on_exit([&timer](int, const std::error_code&) { timer.cancel(); }));

        timer.expires_after(std::chrono::seconds(request.limits.max_wall_seconds) + profile_.grace);
        timer.async_wait([&group, &killed](const boost::system::error_code& ec) {
            if (ec) {
                return;
            }
            killed = true;
            std::error_code kill_ec;
            group.terminate(kill_ec);
            if (kill_ec) {
                utils::Log(utils::LogLevel::kError, "sandbox", "failed to kill runner group",
                           {{"error", kill_ec.message()}});
            }
        });
        io.run();
        native_status = child.native_exit_code();
    } catch (const bp::process_error& ex) {
        std::error_code ec;
        group.terminate(ec);
        return InternalError{std::string("failed to spawn runner: ") + ex.what(), utils::ElapsedMs(start)};
    }

    std::error_code cleanup_ec;
    group.terminate(cleanup_ec);
    if (cleanup_ec && cleanup_ec != std::errc::no_such_process) {
        utils::Log(utils::LogLevel::kWarn, "sandbox", "runner group cleanup failed",
                   {{"error", cleanup_ec.message()}});
    }

    const auto elapsed = utils::ElapsedMs(start);
    const auto child_stdout = stdout_future.get();
    const auto child_stderr = stderr_future.get();
    if (!child_stderr.empty()) {
        utils::Log(utils::LogLevel::kDebug, "sandbox", "runner stderr", {{"text", child_stderr}});
    }

    if (killed) {
        utils::Log(utils::LogLevel::kInfo, "sandbox", "runner killed at parent deadline",
                   {{"elapsed_ms", std::to_string(elapsed)}});
        return TimedOut{elapsed};
    }
    if (WIFSIGNALED(native_status)) {
        const auto child_cpu = ChildrenCpuTime() - cpu_before;
        utils::Log(utils::LogLevel::kInfo, "sandbox", "runner terminated by signal",
                   {{"signal", std::to_string(WTERMSIG(native_status))},
                    {"cpu_ms", std::to_string(child_cpu.count())}});
        return ClassifyTermination(WTERMSIG(native_status), child_cpu, request.limits, elapsed);
    }

    const auto line = LastLine(child_stdout);
    if (line.empty()) {
        const auto code = WIFEXITED(native_status) ? WEXITSTATUS(native_status) : -1;
        return InternalError{"runner exited with status " + std::to_string(code) + " and no outcome",
                             elapsed};
    }
    try {
        return DecodeOutcome(nlohmann::json::parse(line));
    } catch (const nlohmann::json::exception& ex) {
        return InternalError{std::string("runner produced invalid output: ") + ex.what(), elapsed};
    } catch (const SandboxError& ex) {
        return InternalError{std::string("runner produced invalid output: ") + ex.what(), elapsed};
    }
}

}  // namespace snipguard::sandbox
