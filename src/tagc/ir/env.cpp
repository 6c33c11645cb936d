#include "tagc/ir/context.hpp"
#include <cstdlib>
#include <cctype>
#include <string>

namespace tagc {

EmitEnv detectEnv(){
    EmitEnv e{};
    auto get = [](const char* k)->const char*{ const char* v = std::getenv(k); return (v && *v) ? v : nullptr; };
    auto on = [&](const char* k){ const char* v = get(k); return v && std::string(v) == "1"; };

    e.debugLog = on("TAGC_DEBUG");
    e.verifyIR = on("TAGC_VERIFY_IR");
    e.enablePasses = on("TAGC_ENABLE_PASSES");
    e.installFatalHandler = on("TAGC_INSTALL_FATAL_HANDLER");
    if (const char* v = get("TAGC_PASS_PIPELINE")) e.passPipeline = v;
    if (const char* v = get("TAGC_OPT_LEVEL")) {
        std::string s = v; for (char &c : s) c = (char)std::tolower((unsigned char)c);
        if (s == "0" || s == "o0") e.optLevel = 0;
        else if (s == "2" || s == "o2") e.optLevel = 2;
        else if (s == "3" || s == "o3") e.optLevel = 3;
        else e.optLevel = 1;
    }
    if (const char* v = get("TAGC_TARGET_TRIPLE")) e.targetTriple = v;
    return e;
}

void applyEnvToModule(llvm::Module& M, const EmitEnv& env){
    if(!env.targetTriple.empty())
        M.setTargetTriple(env.targetTriple);
}

} // namespace tagc
