#include "tagc/ir/call_ops.hpp"

namespace tagc::ir::call_ops {

bool handle(builder::State& S, const std::vector<tagc::node_ptr>& il, const tagc::node_ptr& inst){
    if(tagc::head_of(*inst) != "call") return false;
    std::string callee = tagc::name_of(il[3]);
    llvm::Function* F = S.module.getFunction(callee);
    if(!F) throw codegen_error("call to undeclared function '" + callee + "'");
    std::vector<llvm::Value*> args;
    for(size_t i = 4; i < il.size(); ++i) args.push_back(builder::get_value(S, il[i]));
    if(F->getReturnType()->isVoidTy()){
        S.builder.CreateCall(F, args);
        return true;
    }
    std::string dst = builder::var_name(il[1]);
    builder::bind(S, dst, S.builder.CreateCall(F, args, dst), builder::annotated_type(*inst));
    return true;
}

}
