#pragma once

#include <llvm/IR/Value.h>

#include "tagc/types.hpp"
#include "tagc/ir/builder.hpp"

namespace tagc::ir::marshal {

// Native value of static type `t` -> %tagc.value. A `value` operand passes through.
llvm::Value* box(builder::State& S, llvm::Value* v, tagc::TypeId t);

// %tagc.value -> native value of type `t`. Emits an explicit tag check: the failure block
// calls tagc_rt_panic_tag_mismatch(expected, actual) and never returns.
llvm::Value* unbox(builder::State& S, llvm::Value* boxed, tagc::TypeId t);

// Stores an aggregate into a fresh entry-block slot and returns the %tagc.value* for runtime calls.
llvm::Value* spill(builder::State& S, llvm::Value* boxed, const char* name = "boxed");
// Fresh slot the runtime writes a value into.
llvm::Value* out_slot(builder::State& S, const char* name = "out");
llvm::Value* load_slot(builder::State& S, llvm::Value* slot);

} // namespace tagc::ir::marshal
