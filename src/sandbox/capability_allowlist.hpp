#pragma once

#include <map>
#include <set>
#include <string>
#include <vector>

namespace snipguard::sandbox {

// One approved namespace. Only `members` are exposed to a snippet; when `bound_to` names
// a class, members it provides are taken from a fresh instance of it per execution.
struct NamespaceHandle {
    std::string module;
    std::set<std::string> members;
    std::string bound_to;
};

// Permitted primitives and namespaces for one execution. Fixed at construction.
class CapabilitySet {
public:
    CapabilitySet(std::set<std::string> primitives,
                  std::map<std::string, NamespaceHandle> namespaces);

    const std::set<std::string>& AllowedPrimitives() const { return primitives_; }
    const std::map<std::string, NamespaceHandle>& AllowedNamespaces() const { return namespaces_; }

    bool AllowsPrimitive(const std::string& name) const;
    bool AllowsNamespace(const std::string& name) const;
    bool AllowsMember(const std::string& name, const std::string& member) const;

    std::vector<std::string> NamespaceNames() const;
    std::string UnavailableMessage(const std::string& name) const;

private:
    const std::set<std::string> primitives_;
    const std::map<std::string, NamespaceHandle> namespaces_;
};

class CapabilityAllowlist {
public:
    static const std::vector<std::string>& DefaultPrimitives();
    static const std::vector<std::string>& DefaultNamespaces();

    static CapabilitySet BuildNamespace();
    // Narrows the default set; a name outside it is a CapabilityError, never a widening.
    static CapabilitySet BuildNamespace(const std::vector<std::string>& namespaces);
};

}  // namespace snipguard::sandbox
