#include "automat/ir_emitter.hpp"
#include "automat/diagnostics.hpp"
#include "automat/ir/binop_table.hpp"
#include "automat/ir/call_ops.hpp"
#include "automat/ir/context.hpp"
#include "automat/ir/control_ops.hpp"
#include "automat/ir/matrix_ops.hpp"
#include "automat/lower.hpp"

#include <llvm/IR/Constants.h>
#include <llvm/IR/Function.h>
#include <llvm/IR/GlobalVariable.h>

namespace automat {

using namespace sast;
namespace B = ir::builder;

IREmitter::IREmitter(const TypeContext& tctx, const CompileEnv& env)
    : tctx_(tctx), env_(env), llctx_(std::make_unique<llvm::LLVMContext>()) {}
IREmitter::~IREmitter() = default;

llvm::Type* IREmitter::map_type(TypeId id){
    const Type& t = tctx_.at(id);
    if(t.kind == Type::Kind::Matrix){
        return llvm::PointerType::getUnqual(ir::matrix_ops::storage_type(*S_, id));
    }
    switch(t.base){
        case BaseType::Int: return llvm::Type::getInt32Ty(*llctx_);
        case BaseType::Bool: return llvm::Type::getInt1Ty(*llctx_);
        case BaseType::Float: return llvm::Type::getDoubleTy(*llctx_);
        case BaseType::Void: return llvm::Type::getVoidTy(*llctx_);
        case BaseType::String: return llvm::PointerType::getUnqual(llvm::Type::getInt8Ty(*llctx_));
        case BaseType::Auto: break;
    }
    internal_error("I0001", "'auto' type reached code generation");
}

llvm::Type* IREmitter::value_type(TypeId id){
    if(tctx_.is_base(id, BaseType::Void)) internal_error("I0002", "void used as a value");
    return map_type(id);
}

llvm::Module* IREmitter::emit(const SProgram& prog, const std::string& moduleName){
    module_ = std::make_unique<llvm::Module>(moduleName, *llctx_);
    ir::applyEnvToModule(*module_, env_);
    builder_ = std::make_unique<llvm::IRBuilder<>>(*llctx_);
    S_ = std::make_unique<B::State>(B::State{*builder_, *llctx_, *module_, tctx_, [this](TypeId t){ return value_type(t); }});
    S_->trace = env_.debugEmit;
    try {
        declare_globals(prog);
        declare_functions(prog);
        for(const auto& fn : prog.functions) emit_function(fn);
        ir::verifyIfRequested(*module_, env_);
    } catch(...) {
        // No partial module ever escapes.
        S_.reset();
        builder_.reset();
        module_.reset();
        throw;
    }
    return module_.get();
}

llvm::orc::ThreadSafeModule IREmitter::toThreadSafeModule(){
    S_.reset();
    builder_.reset();
    return llvm::orc::ThreadSafeModule(std::move(module_), std::move(llctx_));
}

// --- declarations -----------------------------------------------------------

void IREmitter::declare_globals(const SProgram& prog){
    for(const auto& g : prog.globals){
        llvm::Type* ty = value_type(g.type);
        auto* gv = new llvm::GlobalVariable(*module_, ty, /*isConstant*/false, llvm::GlobalValue::ExternalLinkage,
                                            llvm::Constant::getNullValue(ty), g.name);
        S_->globals[g.name] = B::Slot{gv, g.type};
        if(env_.debugEmit) trace("emit", "global %s : %s", g.name.c_str(), tctx_.to_string(g.type).c_str());
    }
}

void IREmitter::declare_functions(const SProgram& prog){
    for(const auto& fn : prog.functions){
        std::vector<llvm::Type*> params;
        for(const auto& f : fn.formals) params.push_back(value_type(f.type));
        auto* fty = llvm::FunctionType::get(map_type(fn.ret), params, false);
        auto* F = llvm::Function::Create(fty, llvm::Function::ExternalLinkage, ir::call_ops::symbol_name(fn.name), module_.get());
        size_t i = 0;
        for(auto& arg : F->args()) arg.setName(fn.formals[i++].name);
        S_->functions[fn.name] = F;
    }
}

void IREmitter::emit_function(const SFunction& fn){
    auto& S = *S_;
    llvm::Function* F = S.functions.at(fn.name);
    S.fn = F;
    S.frames.clear();
    auto* entry = llvm::BasicBlock::Create(*llctx_, "entry", F);
    builder_->SetInsertPoint(entry);
    if(env_.debugEmit) trace("emit", "function %s", fn.name.c_str());

    B::push_frame(S);
    size_t i = 0;
    for(auto& arg : F->args()){
        const SFormal& formal = fn.formals[i++];
        auto* slot = B::declare_local(S, formal.name, formal.type);
        builder_->CreateStore(&arg, slot);
    }
    // Top-level statements share the formals' frame.
    emit_block_stmts(fn.body);

    // Falling off the end returns void or the zero value.
    if(B::block_open(S)){
        if(tctx_.is_base(fn.ret, BaseType::Void)) builder_->CreateRetVoid();
        else builder_->CreateRet(llvm::Constant::getNullValue(map_type(fn.ret)));
    }
    B::pop_frame(S);
    S.fn = nullptr;
}

// --- statements -------------------------------------------------------------

void IREmitter::emit_block_stmts(const SBlock& b){
    for(const auto& s : b.stmts){
        if(!B::block_open(*S_)) break; // rest of the block is unreachable
        emit_stmt(*s);
    }
}

void IREmitter::emit_stmt(const SStmt& s){
    auto& S = *S_;
    if(auto b = std::get_if<SBlock>(&s.data)){
        B::push_frame(S);
        emit_block_stmts(*b);
        B::pop_frame(S);
        return;
    }
    if(auto v = std::get_if<SVarDecl>(&s.data)){
        llvm::Value* init = v->init ? emit_expr(*v->init) : llvm::Constant::getNullValue(value_type(v->type));
        auto* slot = B::declare_local(S, v->name, v->type);
        builder_->CreateStore(init, slot);
        return;
    }
    if(auto e = std::get_if<SExprStmt>(&s.data)){
        emit_expr(*e->expr);
        return;
    }
    if(auto r = std::get_if<SReturn>(&s.data)){
        if(r->value) builder_->CreateRet(emit_expr(*r->value));
        else builder_->CreateRetVoid();
        return;
    }
    if(auto i = std::get_if<SIf>(&s.data)){
        llvm::Value* cond = emit_expr(*i->cond);
        ir::control_ops::emit_if(S, cond,
            [&]{ emit_stmt(*i->then_branch); },
            [&]{ emit_stmt(*i->else_branch); });
        return;
    }
    if(auto w = std::get_if<SWhile>(&s.data)){
        ir::control_ops::emit_while(S,
            [&]{ return emit_expr(*w->cond); },
            [&]{ emit_stmt(*w->body); });
        return;
    }
    emit_stmt(*lower::desugar_for(std::get<SFor>(s.data)));
}

// --- expressions ------------------------------------------------------------

llvm::Constant* IREmitter::emit_scalar_constant(const SExpr& e){
    if(auto v = std::get_if<SIntLit>(&e.data)) return llvm::ConstantInt::get(llvm::Type::getInt32Ty(*llctx_), static_cast<uint64_t>(static_cast<int64_t>(v->value)), true);
    if(auto v = std::get_if<SFloatLit>(&e.data)) return llvm::ConstantFP::get(llvm::Type::getDoubleTy(*llctx_), v->value);
    if(auto v = std::get_if<SBoolLit>(&e.data)) return llvm::ConstantInt::get(llvm::Type::getInt1Ty(*llctx_), v->value ? 1 : 0);
    internal_error("I0003", "matrix element is not a scalar literal");
}

llvm::Value* IREmitter::emit_expr(const SExpr& e){
    auto& S = *S_;
    auto& Bd = *builder_;
    if(tctx_.is_base(e.type, BaseType::Auto)) internal_error("I0001", "'auto' type reached code generation");

    if(std::holds_alternative<SIntLit>(e.data) || std::holds_alternative<SFloatLit>(e.data) || std::holds_alternative<SBoolLit>(e.data))
        return emit_scalar_constant(e);
    if(auto s = std::get_if<SStrLit>(&e.data)) return Bd.CreateGlobalStringPtr(s->value, "str", 0, module_.get());
    if(auto m = std::get_if<SMatrixLit>(&e.data)){
        std::vector<std::vector<llvm::Constant*>> rows;
        for(const auto& r : m->rows){
            std::vector<llvm::Constant*> row;
            for(const auto& x : r) row.push_back(emit_scalar_constant(*x));
            rows.push_back(std::move(row));
        }
        return ir::matrix_ops::emit_literal(S, e.type, rows);
    }
    if(auto id = std::get_if<SId>(&e.data)){
        const B::Slot* slot = B::lookup(S, id->name);
        if(!slot) internal_error("I0006", "no storage for '" + id->name + "'");
        return Bd.CreateLoad(value_type(slot->type), slot->ptr, id->name);
    }
    if(auto b = std::get_if<SBinary>(&e.data)){
        llvm::Value* lhs = emit_expr(*b->lhs);
        llvm::Value* rhs = emit_expr(*b->rhs);
        return ir::binop_table::lower(S, b->op, b->lhs->type, lhs, rhs);
    }
    if(auto u = std::get_if<SUnary>(&e.data)){
        llvm::Value* v = emit_expr(*u->operand);
        if(u->op == ast::UnOp::Not) return Bd.CreateNot(v, "tmp");
        if(tctx_.is_base(u->operand->type, BaseType::Float)) return Bd.CreateFNeg(v, "tmp");
        return Bd.CreateNeg(v, "tmp");
    }
    if(auto a = std::get_if<SAssign>(&e.data)){
        llvm::Value* v = emit_expr(*a->value);
        const B::Slot* slot = B::lookup(S, a->name);
        if(!slot) internal_error("I0006", "no storage for '" + a->name + "'");
        Bd.CreateStore(v, slot->ptr);
        return v;
    }
    if(auto c = std::get_if<SCall>(&e.data)){
        std::vector<llvm::Value*> args;
        for(const auto& a : c->args) args.push_back(emit_expr(*a));
        return ir::call_ops::emit_user_call(S, c->callee, e.type, args);
    }
    if(auto c = std::get_if<SBuiltinCall>(&e.data)){
        const SExpr& arg = *c->args.at(0);
        llvm::Value* v = emit_expr(arg);
        switch(c->fn){
            case ast::Builtin::Print:
            case ast::Builtin::PrintStr:
                ir::call_ops::emit_print(S, arg.type, v);
                return nullptr;
            case ast::Builtin::Rows:
                return ir::matrix_ops::emit_dimension(S, v, tctx_.at(arg.type).rows, "rows");
            case ast::Builtin::Cols:
                return ir::matrix_ops::emit_dimension(S, v, tctx_.at(arg.type).cols, "cols");
        }
    }
    return nullptr; // SNoExpr
}

} // namespace automat
