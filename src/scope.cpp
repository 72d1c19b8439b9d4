#include "automat/scope.hpp"

#include <set>

namespace automat {

ScopeId ScopeArena::create(std::optional<ScopeId> parent){
    scopes_.push_back(Record{parent, {}});
    return static_cast<ScopeId>(scopes_.size() - 1);
}

bool ScopeArena::declare(ScopeId scope, const std::string& name, TypeId type){
    return scopes_.at(scope).names.emplace(name, type).second;
}

std::optional<TypeId> ScopeArena::lookup_local(ScopeId scope, const std::string& name) const {
    const auto& names = scopes_.at(scope).names;
    auto it = names.find(name);
    if(it == names.end()) return std::nullopt;
    return it->second;
}

std::optional<TypeId> ScopeArena::lookup(ScopeId scope, const std::string& name) const {
    std::optional<ScopeId> cur = scope;
    while(cur){
        if(auto t = lookup_local(*cur, name)) return t;
        cur = scopes_.at(*cur).parent;
    }
    return std::nullopt;
}

std::vector<std::string> ScopeArena::visible_names(ScopeId scope) const {
    std::set<std::string> seen;
    std::vector<std::string> out;
    std::optional<ScopeId> cur = scope;
    while(cur){
        for(const auto& kv : scopes_.at(*cur).names)
            if(seen.insert(kv.first).second) out.push_back(kv.first);
        cur = scopes_.at(*cur).parent;
    }
    return out;
}

} // namespace automat
