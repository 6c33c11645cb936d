#pragma once
#include "tagc/sexpr.hpp"
#include "tagc/types.hpp"
#include "tagc/type_check.hpp"
#include "tagc/ir/context.hpp"
#include <memory>

#include <llvm/IR/Module.h>
#include <llvm/IR/LLVMContext.h>
#include <llvm/ExecutionEngine/Orc/ThreadSafeModule.h>

namespace tagc {

// Lowers one checked (module ...) tree to an LLVM module.
class IREmitter {
public:
    explicit IREmitter(TypeContext& tctx);
    ~IREmitter();
    // Runs the type checker, then compile_program. Returns nullptr when checking fails
    // (diagnostics in tc_result) or the produced IR does not verify.
    llvm::Module* emit(const node_ptr& module_ast, TypeCheckResult& tc_result);
    // Two passes over an annotated tree: declare the runtime and every function signature,
    // then emit bodies. `annotated` must come from a successful check with the same TypeContext.
    // Throws ir::codegen_error on a malformed tree; returns nullptr if TAGC_VERIFY_IR rejects
    // the module or TAGC_PASS_PIPELINE does not parse.
    llvm::Module* compile_program(const node_ptr& annotated);
    // Ownership transfer into ORC JIT
    llvm::orc::ThreadSafeModule toThreadSafeModule();
    const EmitEnv& env() const { return env_; }
private:
    TypeContext& tctx_;
    EmitEnv env_;
    std::unique_ptr<llvm::LLVMContext> llctx_;
    std::unique_ptr<llvm::Module> module_;
};

} // namespace tagc
