#include <iostream>
#include <fstream>
#include <sstream>
#include <cstring>
#include "tagc/sexpr.hpp"
#include "tagc/ir_emitter.hpp"
#include "tagc/ir/builder.hpp"
#include "tagc/diagnostics_json.hpp"
#include "tagc/runtime/runtime.h"

#include <llvm/Config/llvm-config.h>
#include <llvm/ExecutionEngine/Orc/LLJIT.h>
#include <llvm/ExecutionEngine/Orc/ExecutionUtils.h>
#include <llvm/ExecutionEngine/Orc/ThreadSafeModule.h>
#include <llvm/Support/TargetSelect.h>
#include <llvm/Support/Error.h>
#include <llvm/Support/raw_ostream.h>

using namespace tagc;

static std::string read_file(const std::string& path){ std::ifstream ifs(path); std::stringstream ss; ss<<ifs.rdbuf(); return ss.str(); }

int main(int argc, char** argv){
    if(argc<2){ std::cerr << "usage: tagc-run <file.tagc> [--emit-ir]\n"; return 1; }
    std::string file = argv[1];
    bool emitIR = argc>2 && std::strcmp(argv[2], "--emit-ir")==0;
    std::string src = read_file(file); if(src.empty()){ std::cerr << "failed to read " << file << "\n"; return 1; }

    TypeContext tctx; IREmitter emitter(tctx); TypeCheckResult tcres;
    llvm::Module* mod = nullptr;
    try {
        auto ast = parse(src);
        mod = emitter.emit(ast, tcres);
    } catch(const parse_error& e){
        std::cerr << file << ": parse error: " << e.what() << "\n"; return 2;
    } catch(const ir::codegen_error& e){
        std::cerr << file << ": codegen error: " << e.what() << "\n"; return 3;
    }
    if(!tcres.success){ std::cerr << format_diagnostics(tcres, file) << "Type check failed\n"; return 2; }
    if(!tcres.warnings.empty()) std::cerr << format_diagnostics(tcres, file);
    if(!mod){ std::cerr << "IR verification failed\n"; return 3; }
    if(emitIR){ mod->print(llvm::outs(), nullptr); return 0; }

    llvm::InitializeNativeTarget(); llvm::InitializeNativeTargetAsmPrinter();
    auto jitExp = llvm::orc::LLJITBuilder().create();
    if(!jitExp){ std::cerr << "Failed to create JIT: " << llvm::toString(jitExp.takeError()) << "\n"; return 4; }
    auto jit = std::move(*jitExp);
    // runtime symbols come from libtagc_runtime, already loaded into this process
    jit->getMainJITDylib().addGenerator(llvm::cantFail(
        llvm::orc::DynamicLibrarySearchGenerator::GetForCurrentProcess(
            jit->getDataLayout().getGlobalPrefix())));
    if(auto err = jit->addIRModule(emitter.toThreadSafeModule())){ std::cerr << "Failed to add module: " << llvm::toString(std::move(err)) << "\n"; return 4; }
    auto sym = jit->lookup("main");
    if(!sym){ std::cerr << "Entry function not found: " << llvm::toString(sym.takeError()) << "\n"; return 5; }
    using FnTy = int64_t(*)(void);
#if LLVM_VERSION_MAJOR >= 15
    auto fn = sym->toPtr<FnTy>();
#else
    auto fn = reinterpret_cast<FnTy>(sym->getAddress());
#endif
    int64_t result = fn();
    std::cout << "Result: " << result << "\n";
    if(int64_t live = tagc_rt_live_allocations()) std::cerr << "[tagc][leak] " << live << " runtime allocation(s) still live\n";
    return 0;
}
