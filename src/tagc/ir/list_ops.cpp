#include "tagc/ir/list_ops.hpp"
#include "tagc/ir/marshal.hpp"

#include <llvm/IR/Constants.h>

namespace tagc::ir::list_ops {

bool handle(builder::State& S, const std::vector<tagc::node_ptr>& il, const tagc::node_ptr& inst){
    auto& B = S.builder;
    const std::string op = tagc::head_of(*inst);
    if(op.rfind("list-", 0) != 0) return false;
    auto I64 = S.tctx.get_base(tagc::BaseType::I64);

    if(op == "list-new"){
        builder::bind(S, builder::var_name(il[1]), B.CreateCall(S.rt.list_create), S.tctx.get_list());
        return true;
    }
    if(op == "list-with-capacity"){
        auto* l = B.CreateCall(S.rt.list_create_with_capacity, {builder::get_value(S, il[2])});
        builder::bind(S, builder::var_name(il[1]), l, S.tctx.get_list());
        return true;
    }
    if(op == "list-push"){ // element ownership moves into the list
        llvm::Value* boxed = marshal::box(S, builder::get_value(S, il[2]), builder::type_of(S, il[2]));
        B.CreateCall(S.rt.list_push, {builder::get_value(S, il[1]), marshal::spill(S, boxed, "push.slot")});
        return true;
    }
    if(op == "list-get" || op == "list-pop"){
        tagc::TypeId t = builder::annotated_type(*inst);
        auto* slot = marshal::out_slot(S, op == "list-get" ? "get.slot" : "pop.slot");
        if(op == "list-get") B.CreateCall(S.rt.list_get, {builder::get_value(S, il[3]), builder::get_value(S, il[4]), slot});
        else B.CreateCall(S.rt.list_pop, {builder::get_value(S, il[3]), slot});
        builder::bind(S, builder::var_name(il[1]), marshal::unbox(S, marshal::load_slot(S, slot), t), t);
        return true;
    }
    if(op == "list-len"){
        builder::bind(S, builder::var_name(il[1]), B.CreateCall(S.rt.list_len, {builder::get_value(S, il[2])}), I64);
        return true;
    }
    if(op == "list-is-empty"){
        auto* raw = B.CreateCall(S.rt.list_is_empty, {builder::get_value(S, il[2])});
        auto* b = B.CreateICmpNE(raw, llvm::ConstantInt::get(raw->getType(), 0));
        builder::bind(S, builder::var_name(il[1]), b, S.tctx.get_base(tagc::BaseType::Bool));
        return true;
    }
    return false;
}

}
