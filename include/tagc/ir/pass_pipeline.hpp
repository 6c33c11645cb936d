#pragma once

#include <llvm/IR/Module.h>

#include "tagc/ir/context.hpp"

namespace tagc::ir::pass_pipeline {

// Verify `M`; prints verifier output to llvm::errs() and returns false when broken.
bool verify(llvm::Module& M, const char* stage);

// Run the optional optimization pipeline selected by `env`:
//   enablePasses gates everything, passPipeline overrides the preset,
//   optLevel picks the preset, verifyIR checks before and after.
// Returns false if verification failed.
bool run_pass_pipeline(llvm::Module& M, const EmitEnv& env);

} // namespace tagc::ir::pass_pipeline
