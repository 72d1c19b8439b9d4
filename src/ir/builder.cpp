#include "automat/ir/builder.hpp"
#include "automat/env.hpp"

namespace automat::ir::builder {

llvm::AllocaInst* create_entry_alloca(State& S, llvm::Type* ty, const std::string& name){
    llvm::BasicBlock& entry = S.fn->getEntryBlock();
    llvm::IRBuilder<> tmp(&entry, entry.begin());
    return tmp.CreateAlloca(ty, nullptr, name);
}

llvm::AllocaInst* declare_local(State& S, const std::string& name, TypeId type){
    auto* slot = create_entry_alloca(S, S.map_type(type), name);
    if(S.frames.empty()) push_frame(S);
    S.frames.back()[name] = Slot{slot, type};
    if(S.trace) trace("emit", "local %s at depth %zu", name.c_str(), S.frames.size());
    return slot;
}

const Slot* lookup(const State& S, const std::string& name){
    for(auto it = S.frames.rbegin(); it != S.frames.rend(); ++it){
        auto hit = it->find(name);
        if(hit != it->end()) return &hit->second;
    }
    auto g = S.globals.find(name);
    if(g != S.globals.end()) return &g->second;
    return nullptr;
}

} // namespace automat::ir::builder
