#pragma once
#include <cstdint>
#include <vector>

#include <llvm/IR/Constants.h>
#include <llvm/IR/DerivedTypes.h>

#include "automat/ir/builder.hpp"

namespace automat::ir::matrix_ops {

// [rows x [cols x elem]]; values of matrix type are pointers to this.
llvm::ArrayType* storage_type(builder::State& S, TypeId matrixType);

// Literal rows become a private constant global; the value is its address.
llvm::Value* emit_literal(builder::State& S, TypeId matrixType, const std::vector<std::vector<llvm::Constant*>>& rows);

// rows()/cols(): the static dimension, or 0 for a null matrix reference.
llvm::Value* emit_dimension(builder::State& S, llvm::Value* matrix, uint32_t n, const char* name);

} // namespace automat::ir::matrix_ops
