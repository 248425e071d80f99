#include "sandbox/python_runtime.hpp"

#include <cmath>
#include <utility>

#include "sandbox/types.hpp"
#include "utils/logging.hpp"

namespace bp = boost::python;

namespace snipguard::sandbox {
namespace {

constexpr int kMaxJsonDepth = 64;

std::string Utf8Of(PyObject* text) {
    Py_ssize_t size = 0;
    const char* data = PyUnicode_AsUTF8AndSize(text, &size);
    if (data == nullptr) {
        PyErr_Clear();
        return {};
    }
    return std::string(data, static_cast<std::size_t>(size));
}

std::string StrOf(PyObject* value) {
    PyObject* text = PyObject_Str(value);
    if (text == nullptr) {
        PyErr_Clear();
        return std::string("<unprintable ") + Py_TYPE(value)->tp_name + ">";
    }
    bp::handle<> owned(text);
    return Utf8Of(text);
}

nlohmann::json ToJson(PyObject* raw, int depth) {
    if (raw == Py_None) {
        return nullptr;
    }
    if (PyBool_Check(raw)) {
        return raw == Py_True;
    }
    if (PyLong_Check(raw)) {
        int overflow = 0;
        const long long value = PyLong_AsLongLongAndOverflow(raw, &overflow);
        if (overflow == 0 && !(value == -1 && PyErr_Occurred())) {
            return value;
        }
        PyErr_Clear();
        return StrOf(raw);
    }
    if (PyFloat_Check(raw)) {
        const double value = PyFloat_AsDouble(raw);
        if (std::isfinite(value)) {
            return value;
        }
        return StrOf(raw);
    }
    if (PyUnicode_Check(raw)) {
        return Utf8Of(raw);
    }
    if (depth >= kMaxJsonDepth) {
        return StrOf(raw);
    }
    if (PyList_Check(raw) || PyTuple_Check(raw)) {
        nlohmann::json array = nlohmann::json::array();
        bp::object sequence{bp::handle<>(bp::borrowed(raw))};
        const auto size = bp::len(sequence);
        for (Py_ssize_t i = 0; i < size; ++i) {
            bp::object item = sequence[i];
            array.push_back(ToJson(item.ptr(), depth + 1));
        }
        return array;
    }
    if (PyDict_Check(raw)) {
        nlohmann::json object = nlohmann::json::object();
        bp::list items{bp::handle<>(PyDict_Items(raw))};
        const auto size = bp::len(items);
        for (Py_ssize_t i = 0; i < size; ++i) {
            bp::object key = items[i][0];
            bp::object value = items[i][1];
            const auto name = PyUnicode_Check(key.ptr()) ? Utf8Of(key.ptr()) : StrOf(key.ptr());
            object[name] = ToJson(value.ptr(), depth + 1);
        }
        return object;
    }
    return StrOf(raw);
}

class ImportGate {
public:
    ImportGate(bp::dict modules, std::string unavailable_suffix)
        : modules_(std::move(modules))
        , unavailable_suffix_(std::move(unavailable_suffix)) {}

    bp::object Import(const std::string& name, int level) const {
        if (level != 0) {
            PyErr_SetString(PyExc_ImportError, "Relative imports are not available in this environment");
            bp::throw_error_already_set();
        }
        if (!modules_.has_key(name)) {
            const auto message = "Module '" + name + "' is not available in this environment. " +
                                 unavailable_suffix_;
            PyErr_SetString(PyExc_ImportError, message.c_str());
            bp::throw_error_already_set();
        }
        return modules_[name];
    }

private:
    bp::dict modules_;
    std::string unavailable_suffix_;
};

// __import__(name, globals=None, locals=None, fromlist=(), level=0)
bp::object CallImportGate(bp::tuple args, bp::dict kwargs) {
    const ImportGate& gate = bp::extract<const ImportGate&>(args[0]);
    bp::extract<std::string> name(args[1]);
    if (!name.check()) {
        PyErr_SetString(PyExc_TypeError, "module name must be a string");
        bp::throw_error_already_set();
    }
    int level = 0;
    if (bp::len(args) > 5) {
        level = bp::extract<int>(args[5]);
    } else if (kwargs.has_key("level")) {
        level = bp::extract<int>(kwargs["level"]);
    }
    return gate.Import(name(), level);
}

}  // namespace
}  // namespace snipguard::sandbox

BOOST_PYTHON_MODULE(_snipguard) {
    using snipguard::sandbox::ImportGate;
    bp::class_<ImportGate>("ImportGate", bp::no_init)
        .def("__call__", bp::raw_function(&snipguard::sandbox::CallImportGate, 2));
}

namespace snipguard::sandbox {

PythonRuntime& PythonRuntime::Instance() {
    static PythonRuntime runtime;
    return runtime;
}

PythonRuntime::PythonRuntime() {
    if (PyImport_AppendInittab("_snipguard", &PyInit__snipguard) == -1) {
        throw SandboxError("failed to register the _snipguard module");
    }

    PyConfig config;
    PyConfig_InitIsolatedConfig(&config);
    config.write_bytecode = 0;
    config.install_signal_handlers = 0;
    config.site_import = 0;
    const PyStatus status = Py_InitializeFromConfig(&config);
    PyConfig_Clear(&config);
    if (PyStatus_Exception(status)) {
        throw SandboxError(std::string("failed to initialize the interpreter: ") +
                           (status.err_msg ? status.err_msg : "unknown error"));
    }

    try {
        bp::import("_snipguard");
    } catch (const bp::error_already_set&) {
        const auto error = FetchPythonError();
        throw SandboxError("failed to load the _snipguard module: " + error.message);
    }
    timeout_type_ = PyErr_NewException("_snipguard.SnippetTimeout", PyExc_BaseException, nullptr);
    cpu_limit_type_ = PyErr_NewException("_snipguard.SnippetCpuLimit", PyExc_BaseException, nullptr);
    if (timeout_type_ == nullptr || cpu_limit_type_ == nullptr) {
        const auto error = FetchPythonError();
        throw SandboxError("failed to create interrupt types: " + error.message);
    }

    PyEval_SaveThread();
    utils::Log(utils::LogLevel::kDebug, "python", "interpreter ready", {{"version", Py_GetVersion()}});
}

bool PythonError::Matches(PyObject* exception_type) const {
    return !type.is_none() && PyErr_GivenExceptionMatches(type.ptr(), exception_type);
}

PythonError FetchPythonError() {
    PyObject* type = nullptr;
    PyObject* value = nullptr;
    PyObject* traceback = nullptr;
    PyErr_Fetch(&type, &value, &traceback);
    PyErr_NormalizeException(&type, &value, &traceback);
    bp::handle<> type_handle(bp::allow_null(type));
    bp::handle<> value_handle(bp::allow_null(value));
    bp::handle<> traceback_handle(bp::allow_null(traceback));

    PythonError error;
    if (type == nullptr) {
        error.message = "unknown error";
        return error;
    }
    error.type = bp::object(type_handle);
    error.type_name = PyExceptionClass_Check(type) ? PyExceptionClass_Name(type) : Py_TYPE(type)->tp_name;
    error.message = value != nullptr ? StrOf(value) : std::string();
    return error;
}

bp::object JsonToPython(const nlohmann::json& value) {
    switch (value.type()) {
        case nlohmann::json::value_t::boolean:
            return bp::object(value.get<bool>());
        case nlohmann::json::value_t::number_integer:
            return bp::object(value.get<long long>());
        case nlohmann::json::value_t::number_unsigned:
            return bp::object(value.get<unsigned long long>());
        case nlohmann::json::value_t::number_float:
            return bp::object(value.get<double>());
        case nlohmann::json::value_t::string: {
            const auto& text = value.get_ref<const std::string&>();
            return bp::object(bp::handle<>(PyUnicode_FromStringAndSize(
                text.data(), static_cast<Py_ssize_t>(text.size()))));
        }
        case nlohmann::json::value_t::array: {
            bp::list list;
            for (const auto& item : value) {
                list.append(JsonToPython(item));
            }
            return std::move(list);
        }
        case nlohmann::json::value_t::object: {
            bp::dict dict;
            for (const auto& [key, item] : value.items()) {
                dict[key] = JsonToPython(item);
            }
            return std::move(dict);
        }
        default:
            return bp::object();
    }
}

nlohmann::json PythonToJson(const bp::object& value) {
    return ToJson(value.ptr(), 0);
}

bp::object MakeNamespaceModule(const std::string& name, const NamespaceHandle& handle) {
    bp::object source = bp::import(handle.module.c_str());
    bp::object instance;
    if (!handle.bound_to.empty()) {
        instance = source.attr(handle.bound_to.c_str())();
    }
    bp::object proxy{bp::handle<>(PyModule_New(name.c_str()))};
    for (const auto& member : handle.members) {
        const char* key = member.c_str();
        if (!instance.is_none() && member != handle.bound_to &&
            PyObject_HasAttrString(instance.ptr(), key)) {
            proxy.attr(key) = instance.attr(key);
        } else if (PyObject_HasAttrString(source.ptr(), key)) {
            proxy.attr(key) = source.attr(key);
        }
    }
    return proxy;
}

bp::object MakeImportGate(const CapabilitySet& capabilities, const bp::dict& modules) {
    const auto full = capabilities.UnavailableMessage("");
    const auto suffix = full.substr(full.find("Available:"));
    return bp::object(ImportGate(modules, suffix));
}

OutputCapture::OutputCapture()
    : sys_(bp::import("sys")) {
    bp::object string_io = bp::import("io").attr("StringIO");
    saved_stdout_ = sys_.attr("stdout");
    saved_stderr_ = sys_.attr("stderr");
    stdout_buffer_ = string_io();
    stderr_buffer_ = string_io();
    sys_.attr("stdout") = stdout_buffer_;
    sys_.attr("stderr") = stderr_buffer_;
}

OutputCapture::~OutputCapture() {
    Restore();
}

std::string OutputCapture::Stdout() const {
    return bp::extract<std::string>(stdout_buffer_.attr("getvalue")());
}

std::string OutputCapture::Stderr() const {
    return bp::extract<std::string>(stderr_buffer_.attr("getvalue")());
}

void OutputCapture::Restore() {
    if (restored_) {
        return;
    }
    restored_ = true;
    if (PyObject_SetAttrString(sys_.ptr(), "stdout", saved_stdout_.ptr()) != 0 ||
        PyObject_SetAttrString(sys_.ptr(), "stderr", saved_stderr_.ptr()) != 0) {
        const auto error = FetchPythonError();
        utils::Log(utils::LogLevel::kError, "python", "failed to restore stdio",
                   {{"error", error.message}});
    }
}

}  // namespace snipguard::sandbox
