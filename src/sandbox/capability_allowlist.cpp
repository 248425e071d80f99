#include "sandbox/capability_allowlist.hpp"

#include <algorithm>

#include "sandbox/types.hpp"
#include "utils/common.hpp"

namespace snipguard::sandbox {
namespace {

std::string UnavailableText(const std::string& name, std::vector<std::string> available) {
    std::sort(available.begin(), available.end());
    return "Module '" + name + "' is not available in this environment. Available: [" +
           utils::Join(available, ", ") + "]";
}

// Public members a snippet may reach through each namespace. Anything that turns a
// runtime string into an attribute lookup (operator.attrgetter, operator.methodcaller,
// string.Formatter), touches process-wide state (decimal.getcontext) or shells out
// (uuid.uuid1, uuid.getnode) is left out.
const std::map<std::string, NamespaceHandle>& DefaultHandles() {
    static const std::map<std::string, NamespaceHandle> kHandles = {
        {"math", {"math", {
            "pi", "e", "tau", "inf", "nan",
            "acos", "acosh", "asin", "asinh", "atan", "atan2", "atanh", "cbrt", "ceil", "comb",
            "copysign", "cos", "cosh", "degrees", "dist", "erf", "erfc", "exp", "exp2", "expm1",
            "fabs", "factorial", "floor", "fmod", "frexp", "fsum", "gamma", "gcd", "hypot",
            "isclose", "isfinite", "isinf", "isnan", "isqrt", "lcm", "ldexp", "lgamma", "log",
            "log10", "log1p", "log2", "modf", "nextafter", "perm", "pow", "prod", "radians",
            "remainder", "sin", "sinh", "sqrt", "tan", "tanh", "trunc", "ulp"}, ""}},
        {"statistics", {"statistics", {
            "correlation", "covariance", "fmean", "geometric_mean", "harmonic_mean",
            "linear_regression", "mean", "median", "median_grouped", "median_high", "median_low",
            "mode", "multimode", "NormalDist", "pstdev", "pvariance", "quantiles",
            "StatisticsError", "stdev", "variance"}, ""}},
        {"random", {"random", {
            "betavariate", "choice", "choices", "expovariate", "gammavariate", "gauss",
            "getrandbits", "lognormvariate", "normalvariate", "paretovariate", "randbytes",
            "randint", "random", "randrange", "sample", "seed", "shuffle", "triangular",
            "uniform", "vonmisesvariate", "weibullvariate", "Random"}, "Random"}},
        {"re", {"re", {
            "A", "ASCII", "DOTALL", "I", "IGNORECASE", "M", "MULTILINE", "S", "VERBOSE", "X",
            "compile", "error", "escape", "findall", "finditer", "fullmatch", "match", "Match",
            "Pattern", "search", "split", "sub", "subn"}, ""}},
        {"json", {"json", {"dumps", "JSONDecodeError", "JSONDecoder", "JSONEncoder", "loads"}, ""}},
        {"time", {"time", {
            "asctime", "ctime", "gmtime", "localtime", "mktime", "monotonic", "monotonic_ns",
            "perf_counter", "perf_counter_ns", "process_time", "sleep", "strftime", "strptime",
            "time", "time_ns"}, ""}},
        {"datetime", {"datetime", {
            "date", "datetime", "MAXYEAR", "MINYEAR", "time", "timedelta", "timezone"}, ""}},
        {"decimal", {"decimal", {
            "Context", "Decimal", "DivisionByZero", "InvalidOperation", "localcontext",
            "ROUND_05UP", "ROUND_CEILING", "ROUND_DOWN", "ROUND_FLOOR", "ROUND_HALF_DOWN",
            "ROUND_HALF_EVEN", "ROUND_HALF_UP", "ROUND_UP"}, ""}},
        {"fractions", {"fractions", {"Fraction"}, ""}},
        {"collections", {"collections", {
            "ChainMap", "Counter", "defaultdict", "deque", "namedtuple", "OrderedDict",
            "UserDict", "UserList"}, ""}},
        {"itertools", {"itertools", {
            "accumulate", "chain", "combinations", "combinations_with_replacement", "compress",
            "count", "cycle", "dropwhile", "filterfalse", "groupby", "islice", "pairwise",
            "permutations", "product", "repeat", "starmap", "takewhile", "tee", "zip_longest"}, ""}},
        {"operator", {"operator", {
            "abs", "add", "and_", "concat", "contains", "countOf", "eq", "floordiv", "ge",
            "getitem", "gt", "index", "indexOf", "inv", "invert", "is_", "is_not", "itemgetter",
            "le", "lshift", "lt", "matmul", "mod", "mul", "ne", "neg", "not_", "or_", "pos",
            "pow", "rshift", "sub", "truediv", "truth", "xor"}, ""}},
        {"functools", {"functools", {
            "cache", "cached_property", "cmp_to_key", "lru_cache", "partial", "reduce",
            "total_ordering", "wraps"}, ""}},
        {"bisect", {"bisect", {
            "bisect", "bisect_left", "bisect_right", "insort", "insort_left", "insort_right"}, ""}},
        {"heapq", {"heapq", {
            "heapify", "heappop", "heappush", "heappushpop", "heapreplace", "merge", "nlargest",
            "nsmallest"}, ""}},
        {"uuid", {"uuid", {
            "NAMESPACE_DNS", "NAMESPACE_OID", "NAMESPACE_URL", "NAMESPACE_X500", "UUID",
            "uuid3", "uuid4", "uuid5"}, ""}},
        {"hashlib", {"hashlib", {
            "algorithms_available", "algorithms_guaranteed", "blake2b", "blake2s", "md5", "new",
            "sha1", "sha224", "sha256", "sha384", "sha3_256", "sha3_512", "sha512"}, ""}},
        {"base64", {"base64", {
            "b16decode", "b16encode", "b32decode", "b32encode", "b64decode", "b64encode",
            "b85decode", "b85encode", "standard_b64decode", "standard_b64encode",
            "urlsafe_b64decode", "urlsafe_b64encode"}, ""}},
        {"string", {"string", {
            "ascii_letters", "ascii_lowercase", "ascii_uppercase", "capwords", "digits",
            "hexdigits", "octdigits", "printable", "punctuation", "Template", "whitespace"}, ""}},
    };
    return kHandles;
}

}  // namespace

CapabilitySet::CapabilitySet(std::set<std::string> primitives,
                             std::map<std::string, NamespaceHandle> namespaces)
    : primitives_(std::move(primitives))
    , namespaces_(std::move(namespaces)) {}

bool CapabilitySet::AllowsPrimitive(const std::string& name) const {
    return primitives_.count(name) > 0;
}

bool CapabilitySet::AllowsNamespace(const std::string& name) const {
    return namespaces_.count(name) > 0;
}

bool CapabilitySet::AllowsMember(const std::string& name, const std::string& member) const {
    auto it = namespaces_.find(name);
    return it != namespaces_.end() && it->second.members.count(member) > 0;
}

std::vector<std::string> CapabilitySet::NamespaceNames() const {
    std::vector<std::string> names;
    names.reserve(namespaces_.size());
    for (const auto& [name, _] : namespaces_) {
        names.push_back(name);
    }
    return names;
}

std::string CapabilitySet::UnavailableMessage(const std::string& name) const {
    return UnavailableText(name, NamespaceNames());
}

const std::vector<std::string>& CapabilityAllowlist::DefaultPrimitives() {
    static const std::vector<std::string> kPrimitives = {
        // arithmetic and conversion
        "abs", "bool", "chr", "divmod", "float", "format", "hex", "int", "oct", "ord",
        "pow", "repr", "round", "str",
        // collections and iteration
        "all", "any", "dict", "enumerate", "filter", "frozenset", "iter", "len", "list",
        "map", "max", "min", "next", "range", "reversed", "set", "slice", "sorted", "sum",
        "tuple", "zip",
        // comparison and typing
        "isinstance", "issubclass", "type",
        "print",
        // catchable failures
        "Exception", "ArithmeticError", "AssertionError", "AttributeError", "ImportError",
        "IndexError", "KeyError", "LookupError", "NameError", "OverflowError",
        "RuntimeError", "StopIteration", "TypeError", "ValueError", "ZeroDivisionError",
    };
    return kPrimitives;
}

const std::vector<std::string>& CapabilityAllowlist::DefaultNamespaces() {
    static const std::vector<std::string> kNamespaces = {
        "math", "statistics", "random", "re", "json", "time", "datetime",
        "decimal", "fractions", "collections", "itertools", "operator",
        "functools", "bisect", "heapq", "uuid", "hashlib", "base64", "string",
    };
    return kNamespaces;
}

CapabilitySet CapabilityAllowlist::BuildNamespace() {
    return BuildNamespace(DefaultNamespaces());
}

CapabilitySet CapabilityAllowlist::BuildNamespace(const std::vector<std::string>& namespaces) {
    const auto& defaults = DefaultNamespaces();
    std::map<std::string, NamespaceHandle> handles;
    for (const auto& name : namespaces) {
        if (std::find(defaults.begin(), defaults.end(), name) == defaults.end()) {
            throw CapabilityError(UnavailableText(name, defaults));
        }
        handles.emplace(name, DefaultHandles().at(name));
    }
    const auto& primitives = DefaultPrimitives();
    return CapabilitySet(std::set<std::string>(primitives.begin(), primitives.end()),
                         std::move(handles));
}

}  // namespace snipguard::sandbox
