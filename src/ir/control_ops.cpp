#include "automat/ir/control_ops.hpp"
#include "automat/env.hpp"

namespace automat::ir::control_ops {

void emit_if(builder::State& S, llvm::Value* cond, const EmitFn& emitThen, const EmitFn& emitElse){
    auto& B = S.builder;
    auto* thenBB = llvm::BasicBlock::Create(S.llctx, "then", S.fn);
    auto* elseBB = llvm::BasicBlock::Create(S.llctx, "else", S.fn);
    auto* mergeBB = llvm::BasicBlock::Create(S.llctx, "merge", S.fn);
    if(builder::block_open(S)) B.CreateCondBr(cond, thenBB, elseBB);

    B.SetInsertPoint(thenBB);
    emitThen();
    if(builder::block_open(S)) B.CreateBr(mergeBB);

    B.SetInsertPoint(elseBB);
    emitElse();
    if(builder::block_open(S)) B.CreateBr(mergeBB);

    B.SetInsertPoint(mergeBB);
    if(S.trace) trace("emit", "if -> %s", mergeBB->getName().str().c_str());
}

void emit_while(builder::State& S, const CondFn& emitCond, const EmitFn& emitBody){
    auto& B = S.builder;
    auto* condBB = llvm::BasicBlock::Create(S.llctx, "while", S.fn);
    auto* bodyBB = llvm::BasicBlock::Create(S.llctx, "while_body", S.fn);
    auto* mergeBB = llvm::BasicBlock::Create(S.llctx, "merge", S.fn);
    if(builder::block_open(S)) B.CreateBr(condBB);

    B.SetInsertPoint(condBB);
    llvm::Value* cond = emitCond();
    B.CreateCondBr(cond, bodyBB, mergeBB);

    B.SetInsertPoint(bodyBB);
    emitBody();
    if(builder::block_open(S)) B.CreateBr(condBB);

    B.SetInsertPoint(mergeBB);
    if(S.trace) trace("emit", "while -> %s", mergeBB->getName().str().c_str());
}

} // namespace automat::ir::control_ops
