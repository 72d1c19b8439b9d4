#pragma once
#include <string>
#include <vector>

#include <llvm/IR/DerivedTypes.h>
#include <llvm/IR/Function.h>

#include "automat/ir/builder.hpp"

namespace automat::ir::call_ops {

// Source function name -> LLVM symbol (MAIN becomes main so lli can run the module).
std::string symbol_name(const std::string& source);

// i32 printf(i8*, ...)
llvm::FunctionCallee get_printf(builder::State& S);

// print/printstr: one printf call, format chosen by the argument's static type.
void emit_print(builder::State& S, TypeId argType, llvm::Value* arg);

// Call a user function by source name; the result is named NAME_result unless void.
llvm::Value* emit_user_call(builder::State& S, const std::string& callee, TypeId ret, const std::vector<llvm::Value*>& args);

} // namespace automat::ir::call_ops
