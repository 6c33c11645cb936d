#pragma once

#include <llvm/IR/DerivedTypes.h>
#include <llvm/IR/LLVMContext.h>

#include "tagc/types.hpp"

namespace tagc::ir::types {

// %tagc.value = { i32 tag, i64 payload }, the layout of TagcValue.
llvm::StructType* value_type(llvm::LLVMContext& C);
// Opaque heap handle (list, string, struct, tuple, enum records).
llvm::PointerType* handle_type(llvm::LLVMContext& C);

// bool -> i1, i64 -> i64, f64 -> double, null -> i8, void -> void,
// value -> %tagc.value, every heap-owning kind -> handle.
llvm::Type* map_type(llvm::LLVMContext& C, const TypeContext& tctx, TypeId id);

} // namespace tagc::ir::types
