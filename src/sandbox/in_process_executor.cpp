#include "sandbox/in_process_executor.hpp"

#include <pthread.h>

#include <chrono>
#include <optional>

#include "sandbox/python_runtime.hpp"
#include "sandbox/resource_limiter.hpp"
#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace bp = boost::python;

namespace snipguard::sandbox {
namespace {

constexpr const char* kSnippetFile = "<snippet>";

bp::dict BuildGlobals(const CapabilitySet& capabilities) {
    bp::object builtins = bp::import("builtins");
    bp::dict safe_builtins;
    for (const auto& name : capabilities.AllowedPrimitives()) {
        safe_builtins[name] = builtins.attr(name.c_str());
    }
    // Needed by the class statement itself.
    safe_builtins["__build_class__"] = builtins.attr("__build_class__");

    bp::dict modules;
    for (const auto& [name, handle] : capabilities.AllowedNamespaces()) {
        modules[name] = MakeNamespaceModule(name, handle);
    }
    safe_builtins["__import__"] = MakeImportGate(capabilities, modules);

    bp::dict globals;
    globals["__builtins__"] = safe_builtins;
    globals["__name__"] = "__main__";
    globals.update(modules);
    return globals;
}

void LoadContext(bp::dict& globals, const ExecutionRequest& request) {
    for (const auto& [name, value] : request.context_variables) {
        globals[name] = JsonToPython(value);
    }
    if (request.context_data) {
        globals["data"] = JsonToPython(*request.context_data);
    }
}

// Expression snippets yield their value; statement snippets yield the `result` binding.
bp::object Evaluate(const std::string& snippet, bp::dict& globals) {
    PyObject* expression = Py_CompileString(snippet.c_str(), kSnippetFile, Py_eval_input);
    if (expression == nullptr) {
        if (!PyErr_ExceptionMatches(PyExc_SyntaxError)) {
            bp::throw_error_already_set();
        }
        PyErr_Clear();
        bp::handle<> module(Py_CompileString(snippet.c_str(), kSnippetFile, Py_file_input));
        bp::handle<> ignored(PyEval_EvalCode(module.get(), globals.ptr(), globals.ptr()));
        return globals.get("result");
    }
    bp::handle<> code(expression);
    return bp::object(bp::handle<>(PyEval_EvalCode(code.get(), globals.ptr(), globals.ptr())));
}

bool IsProcessExhaustion(const PythonError& error) {
    return error.Matches(PyExc_BlockingIOError) ||
           (error.Matches(PyExc_RuntimeError) && error.message == "can't start new thread");
}

std::optional<CpuBudget> ThreadCpuBudget(std::uint32_t seconds) {
    clockid_t clock{};
    if (::pthread_getcpuclockid(::pthread_self(), &clock) != 0) {
        utils::Log(utils::LogLevel::kWarn, "sandbox", "thread cpu clock unavailable, cpu budget off");
        return std::nullopt;
    }
    return CpuBudget{clock, std::chrono::seconds(seconds)};
}

}  // namespace

InProcessExecutor::InProcessExecutor(LimitMode mode)
    : mode_(mode) {}

ExecutionOutcome InProcessExecutor::Run(const ExecutionRequest& request,
                                        const CapabilitySet& capabilities,
                                        bus::EventEmitter& events) {
    const auto start = std::chrono::steady_clock::now();
    PythonRuntime& runtime = PythonRuntime::Instance();

    std::optional<ScopedLimits> limits;
    try {
        if (mode_ == LimitMode::kScoped) {
            limits.emplace(request.limits);
            utils::Log(utils::LogLevel::kDebug, "sandbox", "scoped limits installed",
                       {{"as", std::to_string(limits->AddressSpaceCeiling())},
                        {"nproc", std::to_string(limits->ProcessCeiling())}});
        }
    } catch (const SandboxError& ex) {
        return InternalError{ex.what(), utils::ElapsedMs(start)};
    }

    ScopedGil gil;
    const auto thread_id = PyThread_get_thread_ident();
    auto interrupt = [this, &runtime, thread_id](ExpiryReason reason, std::uint64_t generation) {
        ScopedGil handler_gil;
        if (!supervisor_.StillArmed(generation)) {
            return;
        }
        PyObject* type = reason == ExpiryReason::kCpuTime ? runtime.CpuLimitErrorType()
                                                          : runtime.TimeoutErrorType();
        PyThreadState_SetAsyncExc(thread_id, type);
    };

    bp::dict globals;
    try {
        events.Progress(bus::Phase::kPreparingEnvironment, "Preparing execution environment");
        globals = BuildGlobals(capabilities);
        if (request.HasContext()) {
            events.Progress(bus::Phase::kLoadingContext, "Loading context data");
            LoadContext(globals, request);
        }
    } catch (const bp::error_already_set&) {
        const auto error = FetchPythonError();
        if (error.Matches(PyExc_MemoryError)) {
            return ResourceExceeded{ResourceKind::kMemory, utils::ElapsedMs(start)};
        }
        return InternalError{"failed to build namespace: " + error.type_name + ": " + error.message,
                             utils::ElapsedMs(start)};
    }

    events.Progress(bus::Phase::kExecuting, "Executing code");
    std::optional<OutputCapture> capture;
    try {
        capture.emplace();
    } catch (const bp::error_already_set&) {
        const auto error = FetchPythonError();
        return InternalError{"failed to capture output: " + error.message, utils::ElapsedMs(start)};
    }

    nlohmann::json return_value;
    std::optional<PythonError> failure;
    {
        ScopedDeadline deadline(supervisor_,
                                std::chrono::seconds(request.limits.max_wall_seconds),
                                interrupt,
                                ThreadCpuBudget(request.limits.max_cpu_seconds));
        try {
            const bp::object result = Evaluate(request.snippet, globals);
            return_value = PythonToJson(result);
        } catch (const bp::error_already_set&) {
            failure = FetchPythonError();
        }
    }
    PyThreadState_SetAsyncExc(thread_id, nullptr);
    capture->Restore();
    const auto elapsed = utils::ElapsedMs(start);

    if (const auto reason = supervisor_.Reason()) {
        utils::Log(utils::LogLevel::kInfo, "sandbox", "deadline hit",
                   {{"reason", *reason == ExpiryReason::kCpuTime ? "cpu" : "wall"},
                    {"elapsed_ms", std::to_string(elapsed)}});
        if (*reason == ExpiryReason::kCpuTime) {
            return ResourceExceeded{ResourceKind::kCpu, elapsed};
        }
        return TimedOut{elapsed};
    }

    std::string output;
    std::string error_output;
    try {
        output = capture->Stdout();
        error_output = capture->Stderr();
    } catch (const bp::error_already_set&) {
        const auto error = FetchPythonError();
        if (error.Matches(PyExc_MemoryError)) {
            return ResourceExceeded{ResourceKind::kMemory, elapsed};
        }
        return InternalError{"failed to read captured output: " + error.message, elapsed};
    }

    if (failure) {
        if (failure->Matches(PyExc_MemoryError)) {
            return ResourceExceeded{ResourceKind::kMemory, elapsed};
        }
        if (IsProcessExhaustion(*failure)) {
            return ResourceExceeded{ResourceKind::kProcesses, elapsed};
        }
        return RuntimeError{failure->message, output, elapsed};
    }
    return Success{output, error_output, return_value, elapsed};
}

}  // namespace snipguard::sandbox
