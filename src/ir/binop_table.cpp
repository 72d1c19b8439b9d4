#include "automat/ir/binop_table.hpp"
#include "automat/diagnostics.hpp"

namespace automat::ir::binop_table {

using B = llvm::IRBuilder<>;
using V = llvm::Value*;
using N = const llvm::Twine&;

static const Entry kTable[] = {
    { ast::BinOp::Add, [](B& b, V l, V r, N n)->V{ return b.CreateAdd(l, r, n); },
                       [](B& b, V l, V r, N n)->V{ return b.CreateFAdd(l, r, n); } },
    { ast::BinOp::Sub, [](B& b, V l, V r, N n)->V{ return b.CreateSub(l, r, n); },
                       [](B& b, V l, V r, N n)->V{ return b.CreateFSub(l, r, n); } },
    { ast::BinOp::Mul, [](B& b, V l, V r, N n)->V{ return b.CreateMul(l, r, n); },
                       [](B& b, V l, V r, N n)->V{ return b.CreateFMul(l, r, n); } },
    { ast::BinOp::Div, [](B& b, V l, V r, N n)->V{ return b.CreateSDiv(l, r, n); },
                       [](B& b, V l, V r, N n)->V{ return b.CreateFDiv(l, r, n); } },
    { ast::BinOp::Eq,  [](B& b, V l, V r, N n)->V{ return b.CreateICmpEQ(l, r, n); },
                       [](B& b, V l, V r, N n)->V{ return b.CreateFCmpOEQ(l, r, n); } },
    { ast::BinOp::Ne,  [](B& b, V l, V r, N n)->V{ return b.CreateICmpNE(l, r, n); },
                       [](B& b, V l, V r, N n)->V{ return b.CreateFCmpONE(l, r, n); } },
    { ast::BinOp::Lt,  [](B& b, V l, V r, N n)->V{ return b.CreateICmpSLT(l, r, n); },
                       [](B& b, V l, V r, N n)->V{ return b.CreateFCmpOLT(l, r, n); } },
    { ast::BinOp::Le,  [](B& b, V l, V r, N n)->V{ return b.CreateICmpSLE(l, r, n); },
                       [](B& b, V l, V r, N n)->V{ return b.CreateFCmpOLE(l, r, n); } },
    { ast::BinOp::Gt,  [](B& b, V l, V r, N n)->V{ return b.CreateICmpSGT(l, r, n); },
                       [](B& b, V l, V r, N n)->V{ return b.CreateFCmpOGT(l, r, n); } },
    { ast::BinOp::Ge,  [](B& b, V l, V r, N n)->V{ return b.CreateICmpSGE(l, r, n); },
                       [](B& b, V l, V r, N n)->V{ return b.CreateFCmpOGE(l, r, n); } },
    // operands are i1, so bitwise forms are the logical ones
    { ast::BinOp::And, [](B& b, V l, V r, N n)->V{ return b.CreateAnd(l, r, n); }, nullptr },
    { ast::BinOp::Or,  [](B& b, V l, V r, N n)->V{ return b.CreateOr(l, r, n); }, nullptr },
};

const Entry& lookup(ast::BinOp op){
    for(const auto& e : kTable) if(e.op == op) return e;
    internal_error("I0005", std::string("no lowering for operator '") + ast::binop_symbol(op) + "'");
}

llvm::Value* lower(builder::State& S, ast::BinOp op, TypeId lhsType, llvm::Value* lhs, llvm::Value* rhs){
    const Entry& e = lookup(op);
    bool isFloat = S.tctx.is_base(lhsType, BaseType::Float);
    Form form = isFloat ? e.floatForm : e.intForm;
    if(!form)
        internal_error("I0005", std::string("operator '") + ast::binop_symbol(op) + "' has no form for " + S.tctx.to_string(lhsType));
    return form(S.builder, lhs, rhs, "tmp");
}

} // namespace automat::ir::binop_table
