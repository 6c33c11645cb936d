#pragma once

#include <string>
#include <unordered_map>
#include <unordered_set>
#include <functional>
#include <stdexcept>

#include <llvm/IR/IRBuilder.h>
#include <llvm/IR/LLVMContext.h>
#include <llvm/IR/Module.h>
#include <llvm/IR/Value.h>

#include "tagc/sexpr.hpp"
#include "tagc/types.hpp"
#include "tagc/type_check.hpp"
#include "tagc/ir/context.hpp"
#include "tagc/ir/runtime_decls.hpp"

namespace tagc::ir {

// Malformed annotated tree reaching code generation.
struct codegen_error : std::runtime_error {
    using std::runtime_error::runtime_error;
};

} // namespace tagc::ir

namespace tagc::ir::builder {

// Generation session for one function body. Everything an instruction handler needs is
// reachable from here; handlers never consult module-level state.
struct State {
    llvm::IRBuilder<>& builder;
    llvm::LLVMContext& llctx;
    llvm::Module& module;
    tagc::TypeContext& tctx;
    const RuntimeFunctions& rt;
    const std::unordered_map<std::string, StructInfo>& structs;
    const std::unordered_map<std::string, EnumInfo>& enums;
    const EmitEnv& env;
    llvm::Function* fn = nullptr;

    std::unordered_map<std::string, llvm::Value*> vmap;           // SSA values by name
    std::unordered_map<std::string, tagc::TypeId> vtypes;         // static type of every name
    std::unordered_map<std::string, llvm::AllocaInst*> varSlots;  // mutable `var` slots
    std::unordered_set<llvm::Value*> named;                       // values that already carry a name

    // Emits a nested instruction vector, then its scope-exit drops if control reaches the end.
    std::function<void(const tagc::node_ptr&)> emit_scope;
    int cfCounter = 0;
};

llvm::Type* map_type(State& S, tagc::TypeId id);
// `%x` -> "x", throws codegen_error otherwise
std::string var_name(const tagc::node_ptr& n);
llvm::Value* get_value(State& S, const tagc::node_ptr& operand);
llvm::Value* lookup(State& S, const std::string& name);
tagc::TypeId type_of(State& S, const tagc::node_ptr& operand);
void bind(State& S, const std::string& name, llvm::Value* v, tagc::TypeId t);
// "type-id" annotation left by the checker
tagc::TypeId annotated_type(const tagc::node& inst);
int64_t meta_i64(const tagc::node& n, const std::string& key);
llvm::AllocaInst* entry_alloca(State& S, llvm::Type* ty, const std::string& name);
bool terminated(State& S);
llvm::BasicBlock* new_block(State& S, const std::string& name);
llvm::Value* global_cstr(State& S, const std::string& text, const std::string& name);
// Logs `[tagc][area] msg` to stderr when TAGC_DEBUG=1.
void trace(State& S, const char* area, const std::string& msg);

} // namespace tagc::ir::builder
