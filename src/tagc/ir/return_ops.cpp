#include "tagc/ir/return_ops.hpp"
#include "tagc/ir/scope_ops.hpp"

namespace tagc::ir::return_ops {

bool handle(builder::State& S, const std::vector<tagc::node_ptr>& il, const tagc::node_ptr& inst){
    if(tagc::head_of(*inst) != "ret") return false;
    llvm::Value* rv = nullptr;
    if(il.size() == 3 && !S.fn->getReturnType()->isVoidTy()) rv = builder::get_value(S, il[2]);
    scope_ops::emit_drops(S, tagc::decode_drops(*inst, "drops"));
    if(rv) S.builder.CreateRet(rv);
    else S.builder.CreateRetVoid();
    return true;
}

}
