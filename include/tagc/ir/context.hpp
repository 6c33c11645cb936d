#pragma once
#include <string>

#include <llvm/IR/Module.h>

namespace tagc {

// Emission settings read from TAGC_* environment variables.
struct EmitEnv {
    bool debugLog = false;           // TAGC_DEBUG=1: [tagc][area] traces on stderr
    bool verifyIR = false;           // TAGC_VERIFY_IR=1
    bool enablePasses = false;       // TAGC_ENABLE_PASSES=1
    std::string passPipeline;        // TAGC_PASS_PIPELINE, textual new-PM pipeline
    int optLevel = 1;                // TAGC_OPT_LEVEL 0..3 (or O0..O3)
    bool installFatalHandler = false;// TAGC_INSTALL_FATAL_HANDLER=1
    std::string targetTriple;        // TAGC_TARGET_TRIPLE, empty = default
};

EmitEnv detectEnv();

// Apply environment configuration to a module (e.g., target triple). Safe to call with defaults.
void applyEnvToModule(llvm::Module& M, const EmitEnv& env);

} // namespace tagc
