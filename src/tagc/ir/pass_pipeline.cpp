#include "tagc/ir/pass_pipeline.hpp"
#include <string>
#include <llvm/IR/Verifier.h>
#include <llvm/Passes/PassBuilder.h>
#include <llvm/Support/raw_ostream.h>

namespace tagc::ir::pass_pipeline {

bool verify(llvm::Module& M, const char* stage){
    if(!llvm::verifyModule(M, &llvm::errs())) return true;
    llvm::errs() << "[tagc] IR verify failed " << stage << "\n";
    return false;
}

bool run_pass_pipeline(llvm::Module& M, const EmitEnv& env){
    if(env.verifyIR && !verify(M, "after emission")) return false;
    if(!env.enablePasses) return true;
    llvm::PassBuilder PB;
    llvm::LoopAnalysisManager LAM;
    llvm::FunctionAnalysisManager FAM;
    llvm::CGSCCAnalysisManager CGAM;
    llvm::ModuleAnalysisManager MAM;
    PB.registerModuleAnalyses(MAM);
    PB.registerCGSCCAnalyses(CGAM);
    PB.registerFunctionAnalyses(FAM);
    PB.registerLoopAnalyses(LAM);
    PB.crossRegisterProxies(LAM, FAM, CGAM, MAM);

    llvm::ModulePassManager MPM;
    if(!env.passPipeline.empty()){
        if(auto Err = PB.parsePassPipeline(MPM, env.passPipeline)){
            llvm::errs() << "[tagc] invalid TAGC_PASS_PIPELINE '" << env.passPipeline << "': " << llvm::toString(std::move(Err)) << "\n";
            return false;
        }
    } else {
        if(env.optLevel == 0) return true; // leave unoptimized
        llvm::OptimizationLevel lvl = env.optLevel == 3 ? llvm::OptimizationLevel::O3
                                    : env.optLevel == 2 ? llvm::OptimizationLevel::O2
                                    : llvm::OptimizationLevel::O1;
        MPM = PB.buildPerModuleDefaultPipeline(lvl);
    }
    MPM.run(M, MAM);
    if(env.verifyIR && !verify(M, "after pass pipeline")) return false;
    return true;
}

} // namespace tagc::ir::pass_pipeline
