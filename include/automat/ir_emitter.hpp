#pragma once
#include <memory>
#include <string>

#include <llvm/ExecutionEngine/Orc/ThreadSafeModule.h>
#include <llvm/IR/DerivedTypes.h>
#include <llvm/IR/IRBuilder.h>
#include <llvm/IR/LLVMContext.h>
#include <llvm/IR/Module.h>
#include <llvm/IR/Type.h>
#include <llvm/IR/Value.h>

#include "automat/env.hpp"
#include "automat/ir/builder.hpp"
#include "automat/sast.hpp"
#include "automat/types.hpp"

namespace automat {

// Typed tree -> LLVM module. Internal errors (I0001..I0006) throw CompileError;
// the module is only handed out after a complete, successful emission.
class IREmitter {
public:
    IREmitter(const TypeContext& tctx, const CompileEnv& env);
    ~IREmitter();

    llvm::Module* emit(const sast::SProgram& prog, const std::string& moduleName = "automat.module");
    llvm::Module* module() { return module_.get(); }
    // Ownership transfer into ORC JIT
    llvm::orc::ThreadSafeModule toThreadSafeModule();

    llvm::Type* map_type(TypeId id);
    // Like map_type, but void (and auto) are errors: the type must hold a value.
    llvm::Type* value_type(TypeId id);

private:
    const TypeContext& tctx_;
    const CompileEnv& env_;
    std::unique_ptr<llvm::LLVMContext> llctx_;
    std::unique_ptr<llvm::Module> module_;
    std::unique_ptr<llvm::IRBuilder<>> builder_;
    std::unique_ptr<ir::builder::State> S_;

    void declare_globals(const sast::SProgram& prog);
    void declare_functions(const sast::SProgram& prog);
    void emit_function(const sast::SFunction& fn);
    void emit_block_stmts(const sast::SBlock& b);
    void emit_stmt(const sast::SStmt& s);
    llvm::Value* emit_expr(const sast::SExpr& e);
    llvm::Constant* emit_scalar_constant(const sast::SExpr& e);
};

} // namespace automat
