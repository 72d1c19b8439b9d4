#include "automat/ir/matrix_ops.hpp"
#include "automat/diagnostics.hpp"

#include <llvm/IR/GlobalVariable.h>

namespace automat::ir::matrix_ops {

llvm::ArrayType* storage_type(builder::State& S, TypeId matrixType){
    const Type& t = S.tctx.at(matrixType);
    if(t.kind != Type::Kind::Matrix) internal_error("I0003", "expected a matrix type, got " + S.tctx.to_string(matrixType));
    if(!S.tctx.is_scalar(t.elem)) internal_error("I0003", "unknown matrix element type " + S.tctx.to_string(t.elem));
    llvm::Type* elem = S.map_type(t.elem);
    return llvm::ArrayType::get(llvm::ArrayType::get(elem, t.cols), t.rows);
}

llvm::Value* emit_literal(builder::State& S, TypeId matrixType, const std::vector<std::vector<llvm::Constant*>>& rows){
    llvm::ArrayType* outer = storage_type(S, matrixType);
    auto* rowTy = llvm::cast<llvm::ArrayType>(outer->getElementType());
    std::vector<llvm::Constant*> rowConsts;
    rowConsts.reserve(rows.size());
    for(const auto& r : rows) rowConsts.push_back(llvm::ConstantArray::get(rowTy, r));
    auto* init = llvm::ConstantArray::get(outer, rowConsts);
    return new llvm::GlobalVariable(S.module, outer, /*isConstant*/true, llvm::GlobalValue::PrivateLinkage, init, "matrix");
}

llvm::Value* emit_dimension(builder::State& S, llvm::Value* matrix, uint32_t n, const char* name){
    auto& B = S.builder;
    auto* i32 = llvm::Type::getInt32Ty(S.llctx);
    llvm::Value* isNull = B.CreateIsNull(matrix, "isnull");
    return B.CreateSelect(isNull, llvm::ConstantInt::get(i32, 0), llvm::ConstantInt::get(i32, n), name);
}

} // namespace automat::ir::matrix_ops
