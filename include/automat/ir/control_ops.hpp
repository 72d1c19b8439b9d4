#pragma once

#include <functional>

#include <llvm/IR/BasicBlock.h>
#include <llvm/IR/Value.h>

#include "automat/ir/builder.hpp"

namespace automat::ir::control_ops {

using EmitFn = std::function<void()>;
using CondFn = std::function<llvm::Value*()>;

// then/else/merge; each branch falls through to merge only if it is still open.
void emit_if(builder::State& S, llvm::Value* cond, const EmitFn& emitThen, const EmitFn& emitElse);

// while/while_body/merge with the test in front of the body.
void emit_while(builder::State& S, const CondFn& emitCond, const EmitFn& emitBody);

} // namespace automat::ir::control_ops
