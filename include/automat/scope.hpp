#pragma once
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "automat/types.hpp"

namespace automat {

using ScopeId = uint32_t;

// Parent-linked scopes stored in one arena; the typed tree refers to them by id.
class ScopeArena {
public:
    ScopeId create(std::optional<ScopeId> parent = std::nullopt);

    // False when the name already exists in this exact scope.
    bool declare(ScopeId scope, const std::string& name, TypeId type);
    // Innermost to outermost, first hit wins.
    std::optional<TypeId> lookup(ScopeId scope, const std::string& name) const;
    std::optional<TypeId> lookup_local(ScopeId scope, const std::string& name) const;

    std::optional<ScopeId> parent(ScopeId scope) const { return scopes_.at(scope).parent; }
    // Every name reachable from scope (for suggestions).
    std::vector<std::string> visible_names(ScopeId scope) const;
    size_t size() const { return scopes_.size(); }

private:
    struct Record {
        std::optional<ScopeId> parent;
        std::map<std::string, TypeId> names;
    };
    std::vector<Record> scopes_;
};

} // namespace automat
