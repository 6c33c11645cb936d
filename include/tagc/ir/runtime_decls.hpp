#pragma once

#include <llvm/IR/DerivedTypes.h>
#include <llvm/IR/Module.h>

namespace tagc::ir {

// Runtime library entry points, declared once per module during the declaration pass.
struct RuntimeFunctions {
    llvm::StructType* valueTy = nullptr;  // %tagc.value = { i32, i64 }
    llvm::PointerType* valuePtrTy = nullptr;
    llvm::PointerType* handleTy = nullptr; // i8*, every heap object handle

    llvm::FunctionCallee value_free;
    llvm::FunctionCallee list_create, list_create_with_capacity, list_push, list_get, list_pop, list_len, list_is_empty, list_free;
    llvm::FunctionCallee string_new, string_len, string_free;
    llvm::FunctionCallee record_new, record_set, record_get, record_take, record_free;
    llvm::FunctionCallee enum_new, enum_discriminant, enum_set_field, enum_get_field, enum_take_field, enum_free;
    llvm::FunctionCallee print_int, print_float, print_bool, print_string, print_value;
    llvm::FunctionCallee panic, panic_tag_mismatch;
};

RuntimeFunctions declare_runtime(llvm::Module& M);

} // namespace tagc::ir
