#pragma once

#include <boost/python.hpp>

#include <string>

#include "nlohmann/json.hpp"
#include "sandbox/capability_allowlist.hpp"

namespace snipguard::sandbox {

// Process-wide embedded interpreter. Initialized once, never finalized; the GIL is
// released after start-up so callers on any thread take it through ScopedGil.
class PythonRuntime {
public:
    static PythonRuntime& Instance();

    PyObject* TimeoutErrorType() const { return timeout_type_; }
    PyObject* CpuLimitErrorType() const { return cpu_limit_type_; }

    PythonRuntime(const PythonRuntime&) = delete;
    PythonRuntime& operator=(const PythonRuntime&) = delete;

private:
    PythonRuntime();

    PyObject* timeout_type_ = nullptr;
    PyObject* cpu_limit_type_ = nullptr;
};

class ScopedGil {
public:
    ScopedGil() : state_(PyGILState_Ensure()) {}
    ~ScopedGil() { PyGILState_Release(state_); }

    ScopedGil(const ScopedGil&) = delete;
    ScopedGil& operator=(const ScopedGil&) = delete;

private:
    PyGILState_STATE state_;
};

struct PythonError {
    boost::python::object type;
    std::string type_name;
    std::string message;

    bool Matches(PyObject* exception_type) const;
};

// Fetches and clears the pending Python exception. Must hold the GIL.
PythonError FetchPythonError();

boost::python::object JsonToPython(const nlohmann::json& value);
// Values without a JSON shape fall back to str(value).
nlohmann::json PythonToJson(const boost::python::object& value);

// Fresh module object carrying only the approved members of `handle`, so that one
// execution's rebinding never reaches the next. Members the interpreter lacks are skipped.
boost::python::object MakeNamespaceModule(const std::string& name, const NamespaceHandle& handle);

// Callable installed as __builtins__["__import__"]: hands out only the given modules.
boost::python::object MakeImportGate(const CapabilitySet& capabilities,
                                     const boost::python::dict& modules);

// Swaps sys.stdout / sys.stderr for in-memory buffers until destroyed.
class OutputCapture {
public:
    OutputCapture();
    ~OutputCapture();

    OutputCapture(const OutputCapture&) = delete;
    OutputCapture& operator=(const OutputCapture&) = delete;

    std::string Stdout() const;
    std::string Stderr() const;
    void Restore();

private:
    boost::python::object sys_;
    boost::python::object saved_stdout_;
    boost::python::object saved_stderr_;
    boost::python::object stdout_buffer_;
    boost::python::object stderr_buffer_;
    bool restored_ = false;
};

}  // namespace snipguard::sandbox
