#pragma once
#include <llvm/IR/IRBuilder.h>

#include "automat/ast.hpp"
#include "automat/ir/builder.hpp"

namespace automat::ir::binop_table {

using Form = llvm::Value* (*)(llvm::IRBuilder<>&, llvm::Value*, llvm::Value*, const llvm::Twine&);

// One row per operator: integer form and floating-point form. A null form
// means the analyzer never lets that combination through.
struct Entry {
    ast::BinOp op;
    Form intForm;
    Form floatForm;
};

const Entry& lookup(ast::BinOp op);

// Picks the form by the left operand's static type.
llvm::Value* lower(builder::State& S, ast::BinOp op, TypeId lhsType, llvm::Value* lhs, llvm::Value* rhs);

} // namespace automat::ir::binop_table
