#include "sandbox/structural_analyzer.hpp"

#include <optional>
#include <utility>

#include "sandbox/python_runtime.hpp"
#include "sandbox/types.hpp"
#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace bp = boost::python;

namespace snipguard::sandbox {
namespace {

const std::set<std::string>& ForbiddenAttributes() {
    static const std::set<std::string> kNames = {
        "os", "sys", "subprocess", "socket", "builtins", "importlib", "ctypes", "shutil",
        "posix", "io", "pathlib", "signal", "threading", "multiprocessing", "platform",
        "inspect", "gc", "marshal", "pickle", "types", "codecs", "tempfile", "glob", "pty",
        "resource", "select", "mmap", "fcntl", "pwd", "grp",
        "system", "popen", "fork", "kill", "remove", "unlink", "rmdir",
        "load_module", "modules",
    };
    return kNames;
}

// Frame, generator, coroutine, traceback and code object attributes.
const std::vector<std::string>& IntrospectionPrefixes() {
    static const std::vector<std::string> kPrefixes = {
        "f_", "gi_", "cr_", "ag_", "tb_", "co_", "func_",
    };
    return kPrefixes;
}

bool StartsWith(const std::string& value, const std::string& prefix) {
    return value.compare(0, prefix.size(), prefix) == 0;
}

std::string Str(const bp::object& value) {
    return bp::extract<std::string>(value);
}

bool IsInstance(const bp::object& node, const bp::object& type) {
    const int result = PyObject_IsInstance(node.ptr(), type.ptr());
    if (result < 0) {
        bp::throw_error_already_set();
    }
    return result == 1;
}

struct AstTypes {
    explicit AstTypes(const bp::object& ast)
        : name(ast.attr("Name"))
        , attribute(ast.attr("Attribute"))
        , store(ast.attr("Store"))
        , del(ast.attr("Del"))
        , function_def(ast.attr("FunctionDef"))
        , async_function_def(ast.attr("AsyncFunctionDef"))
        , class_def(ast.attr("ClassDef"))
        , arg(ast.attr("arg"))
        , alias(ast.attr("alias"))
        , except_handler(ast.attr("ExceptHandler"))
        , global(ast.attr("Global"))
        , nonlocal(ast.attr("Nonlocal"))
        , match_as(ast.attr("MatchAs"))
        , match_star(ast.attr("MatchStar"))
        , match_mapping(ast.attr("MatchMapping"))
        , import(ast.attr("Import"))
        , import_from(ast.attr("ImportFrom"))
        , constant(ast.attr("Constant")) {}

    bp::object name;
    bp::object attribute;
    bp::object store;
    bp::object del;
    bp::object function_def;
    bp::object async_function_def;
    bp::object class_def;
    bp::object arg;
    bp::object alias;
    bp::object except_handler;
    bp::object global;
    bp::object nonlocal;
    bp::object match_as;
    bp::object match_star;
    bp::object match_mapping;
    bp::object import;
    bp::object import_from;
    bp::object constant;
};

void AddOptionalName(std::set<std::string>& names, const bp::object& value) {
    if (!value.is_none()) {
        names.insert(Str(value));
    }
}

std::set<std::string> CollectBoundNames(const bp::object& nodes, const AstTypes& types) {
    std::set<std::string> bound;
    bp::stl_input_iterator<bp::object> it(nodes), end;
    for (; it != end; ++it) {
        const bp::object node = *it;
        if (IsInstance(node, types.name)) {
            const bp::object ctx = node.attr("ctx");
            if (IsInstance(ctx, types.store) || IsInstance(ctx, types.del)) {
                bound.insert(Str(node.attr("id")));
            }
        } else if (IsInstance(node, types.function_def) || IsInstance(node, types.async_function_def) ||
                   IsInstance(node, types.class_def)) {
            bound.insert(Str(node.attr("name")));
        } else if (IsInstance(node, types.arg)) {
            bound.insert(Str(node.attr("arg")));
        } else if (IsInstance(node, types.alias)) {
            const bp::object asname = node.attr("asname");
            if (!asname.is_none()) {
                bound.insert(Str(asname));
            } else {
                const auto name = Str(node.attr("name"));
                bound.insert(name.substr(0, name.find('.')));
            }
        } else if (IsInstance(node, types.except_handler)) {
            AddOptionalName(bound, node.attr("name"));
        } else if (IsInstance(node, types.global) || IsInstance(node, types.nonlocal)) {
            bp::stl_input_iterator<bp::object> name_it(node.attr("names")), name_end;
            for (; name_it != name_end; ++name_it) {
                bound.insert(Str(*name_it));
            }
        } else if (IsInstance(node, types.match_as) || IsInstance(node, types.match_star)) {
            AddOptionalName(bound, node.attr("name"));
        } else if (IsInstance(node, types.match_mapping)) {
            AddOptionalName(bound, node.attr("rest"));
        }
    }
    return bound;
}

// Local names that refer to a namespace: the predefined ones plus `import x as y`.
// A predefined name the snippet assigns or takes as a parameter is its own variable.
std::map<std::string, std::string> NamespaceAliases(const bp::object& nodes, const AstTypes& types,
                                                    const CapabilitySet& capabilities) {
    std::map<std::string, std::string> aliases;
    for (const auto& name : capabilities.NamespaceNames()) {
        aliases.emplace(name, name);
    }
    std::vector<bp::object> imports;
    bp::stl_input_iterator<bp::object> it(nodes), end;
    for (; it != end; ++it) {
        const bp::object node = *it;
        if (IsInstance(node, types.import)) {
            imports.push_back(node);
        } else if (IsInstance(node, types.name) && IsInstance(node.attr("ctx"), types.store)) {
            aliases.erase(Str(node.attr("id")));
        } else if (IsInstance(node, types.arg)) {
            aliases.erase(Str(node.attr("arg")));
        }
    }
    for (const auto& node : imports) {
        bp::stl_input_iterator<bp::object> alias_it(node.attr("names")), alias_end;
        for (; alias_it != alias_end; ++alias_it) {
            const bp::object asname = (*alias_it).attr("asname");
            const auto module = Str((*alias_it).attr("name"));
            aliases[asname.is_none() ? module : Str(asname)] = module;
        }
    }
    return aliases;
}

// Returns the first replacement field that reaches through an attribute, searching
// nested fields inside format specs too. Throws ValueError for malformed templates.
std::optional<std::string> TraversingField(const bp::object& parser, const std::string& text,
                                           int depth) {
    if (depth > 2) {
        return std::nullopt;
    }
    bp::stl_input_iterator<bp::tuple> it(parser(text)), end;
    for (; it != end; ++it) {
        const bp::tuple part = *it;
        const bp::object field = part[1];
        if (!field.is_none() && Str(field).find('.') != std::string::npos) {
            return Str(field);
        }
        const bp::object spec = part[2];
        if (!spec.is_none()) {
            if (auto nested = TraversingField(parser, Str(spec), depth + 1)) {
                return nested;
            }
        }
    }
    return std::nullopt;
}

}  // namespace

StructuralAnalyzer::StructuralAnalyzer(CapabilitySet capabilities)
    : capabilities_(std::move(capabilities)) {}

bool StructuralAnalyzer::IsForbiddenAttribute(const std::string& name) {
    if (StartsWith(name, "_")) {
        return true;
    }
    if (StartsWith(name, "exec") || StartsWith(name, "spawn")) {
        return true;
    }
    for (const auto& prefix : IntrospectionPrefixes()) {
        if (StartsWith(name, prefix)) {
            return true;
        }
    }
    return ForbiddenAttributes().count(name) > 0;
}

std::string StructuralAnalyzer::UnavailableModule(const std::string& name) const {
    return "Module '" + name + "' is not available in this environment. Available: [" +
           utils::Join(capabilities_.NamespaceNames(), ", ") + "]";
}

ValidationResult StructuralAnalyzer::Analyze(const std::string& snippet,
                                             const std::vector<std::string>& context_names) const {
    PythonRuntime::Instance();
    ScopedGil gil;

    bp::object ast;
    bp::object tree;
    try {
        ast = bp::import("ast");
        tree = ast.attr("parse")(snippet, "<snippet>", "exec");
    } catch (const bp::error_already_set&) {
        const auto error = FetchPythonError();
        if (error.Matches(PyExc_SyntaxError)) {
            return ValidationResult::Ok();
        }
        if (error.Matches(PyExc_UnicodeError)) {
            return ValidationResult::Rejected("encoding", "Code is not valid UTF-8");
        }
        if (error.Matches(PyExc_RecursionError) || error.Matches(PyExc_MemoryError)) {
            return ValidationResult::Rejected("structure", "Snippet too complex to analyze");
        }
        throw SandboxError("structural analysis failed: " + error.type_name + ": " + error.message);
    }

    try {
        const AstTypes types(ast);
        const bp::object formatter_parser = bp::import("_string").attr("formatter_parser");
        const auto aliases = NamespaceAliases(ast.attr("walk")(tree), types, capabilities_);
        auto allowed = CollectBoundNames(ast.attr("walk")(tree), types);
        for (const auto& [alias, _] : aliases) {
            allowed.insert(alias);
        }
        allowed.insert(context_names.begin(), context_names.end());
        allowed.insert("data");
        allowed.insert("result");

        bp::stl_input_iterator<bp::object> it(ast.attr("walk")(tree)), end;
        for (; it != end; ++it) {
            const bp::object node = *it;
            if (IsInstance(node, types.name)) {
                const auto id = Str(node.attr("id"));
                if (StartsWith(id, "__")) {
                    return ValidationResult::Rejected(id, "Name '" + id + "' is not allowed");
                }
                if (allowed.count(id) == 0 && !capabilities_.AllowsPrimitive(id)) {
                    return ValidationResult::Rejected(
                        id, "Name '" + id + "' is not available in this environment");
                }
            } else if (IsInstance(node, types.attribute)) {
                const auto attr = Str(node.attr("attr"));
                if (IsForbiddenAttribute(attr)) {
                    return ValidationResult::Rejected(
                        attr, "Access to attribute '" + attr + "' is not allowed");
                }
                const bp::object receiver = node.attr("value");
                if (IsInstance(receiver, types.name)) {
                    const auto alias = aliases.find(Str(receiver.attr("id")));
                    if (alias != aliases.end() && !capabilities_.AllowsMember(alias->second, attr)) {
                        const auto qualified = alias->second + "." + attr;
                        return ValidationResult::Rejected(
                            qualified, "Access to '" + qualified + "' is not allowed");
                    }
                }
                if (attr == "format" || attr == "format_map") {
                    if (!IsInstance(receiver, types.constant) ||
                        !PyUnicode_Check(bp::object(receiver.attr("value")).ptr())) {
                        return ValidationResult::Rejected(
                            attr, "String formatting is only allowed on literal templates");
                    }
                    std::optional<std::string> field;
                    try {
                        field = TraversingField(formatter_parser, Str(receiver.attr("value")), 0);
                    } catch (const bp::error_already_set&) {
                        const auto error = FetchPythonError();
                        if (!error.Matches(PyExc_ValueError)) {
                            throw SandboxError("structural analysis failed: " + error.type_name +
                                               ": " + error.message);
                        }
                        return ValidationResult::Rejected(attr, "Invalid format template: " + error.message);
                    }
                    if (field) {
                        return ValidationResult::Rejected(
                            *field, "Attribute access in format field '" + *field + "' is not allowed");
                    }
                }
            } else if (IsInstance(node, types.import)) {
                bp::stl_input_iterator<bp::object> alias_it(node.attr("names")), alias_end;
                for (; alias_it != alias_end; ++alias_it) {
                    const auto module = Str((*alias_it).attr("name"));
                    if (!capabilities_.AllowsNamespace(module)) {
                        return ValidationResult::Rejected("import " + module, UnavailableModule(module));
                    }
                }
            } else if (IsInstance(node, types.import_from)) {
                const int level = bp::extract<int>(node.attr("level"));
                const bp::object module = node.attr("module");
                if (level != 0 || module.is_none()) {
                    return ValidationResult::Rejected("from .", "Relative imports are not allowed");
                }
                const auto name = Str(module);
                if (!capabilities_.AllowsNamespace(name)) {
                    return ValidationResult::Rejected("from " + name, UnavailableModule(name));
                }
                bp::stl_input_iterator<bp::object> alias_it(node.attr("names")), alias_end;
                for (; alias_it != alias_end; ++alias_it) {
                    const auto member = Str((*alias_it).attr("name"));
                    if (member == "*") {
                        return ValidationResult::Rejected("from " + name + " import *",
                                                          "Wildcard imports are not allowed");
                    }
                    if (!capabilities_.AllowsMember(name, member)) {
                        const auto qualified = name + "." + member;
                        return ValidationResult::Rejected(
                            qualified, "Access to '" + qualified + "' is not allowed");
                    }
                }
            }
        }
    } catch (const bp::error_already_set&) {
        const auto error = FetchPythonError();
        if (error.Matches(PyExc_RecursionError) || error.Matches(PyExc_MemoryError)) {
            return ValidationResult::Rejected("structure", "Snippet too complex to analyze");
        }
        throw SandboxError("structural analysis failed: " + error.type_name + ": " + error.message);
    }
    return ValidationResult::Ok();
}

}  // namespace snipguard::sandbox
