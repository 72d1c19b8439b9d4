#pragma once

#include <functional>
#include <string>
#include <unordered_map>
#include <vector>

#include <llvm/IR/Constants.h>
#include <llvm/IR/IRBuilder.h>
#include <llvm/IR/LLVMContext.h>
#include <llvm/IR/Module.h>
#include <llvm/IR/Value.h>

#include "automat/types.hpp"

namespace automat::ir::builder {

// Storage for one named variable: an entry-block alloca or a module global.
struct Slot { llvm::Value* ptr; TypeId type; };

// Shared state for the instruction helpers. The emitter owns exactly one of
// these per module; `builder`'s insertion block is the current block.
struct State {
    llvm::IRBuilder<>& builder;
    llvm::LLVMContext& llctx;
    llvm::Module& module;
    const TypeContext& tctx;
    std::function<llvm::Type*(TypeId)> map_type; // supplied by IREmitter

    llvm::Function* fn = nullptr; // function being built

    std::unordered_map<std::string, Slot> globals;
    // Functions by source name; globals and functions may share a name, so
    // the module symbol table alone is not enough.
    std::unordered_map<std::string, llvm::Function*> functions;
    // One frame per lexical block, innermost last. Names in an inner frame
    // shadow outer ones; popping a frame makes the outer binding visible again.
    std::vector<std::unordered_map<std::string, Slot>> frames;

    // printf formats, created once per module
    std::unordered_map<std::string, llvm::Constant*> formats;
    bool trace = false;
};

inline void push_frame(State& S){ S.frames.emplace_back(); }
inline void pop_frame(State& S){ if(!S.frames.empty()) S.frames.pop_back(); }

// True while the current block can still take instructions.
inline bool block_open(State& S){
    auto* bb = S.builder.GetInsertBlock();
    return bb && !bb->getTerminator();
}

// Allocas always go to the top of the entry block so loops never re-allocate.
llvm::AllocaInst* create_entry_alloca(State& S, llvm::Type* ty, const std::string& name);

// Allocate and bind `name` in the innermost frame.
llvm::AllocaInst* declare_local(State& S, const std::string& name, TypeId type);

// Locals innermost-out, then globals; nullptr when unbound.
const Slot* lookup(const State& S, const std::string& name);

} // namespace automat::ir::builder
