#include "tagc/ir/enum_ops.hpp"
#include "tagc/ir/marshal.hpp"
#include "tagc/ir/core_ops.hpp"
#include "tagc/ir/control_ops.hpp"

#include <llvm/IR/Constants.h>

namespace tagc::ir::enum_ops {

static llvm::ConstantInt* i64c(builder::State& S, int64_t v){ return llvm::ConstantInt::get(llvm::Type::getInt64Ty(S.llctx), (uint64_t)v, true); }
static llvm::ConstantInt* i32c(builder::State& S, int32_t v){ return llvm::ConstantInt::get(llvm::Type::getInt32Ty(S.llctx), (uint64_t)v, true); }

bool handle_enum_new(builder::State& S, const std::vector<tagc::node_ptr>& il, const tagc::node_ptr& inst){
    if(tagc::head_of(*inst) != "enum-new") return false;
    auto& B = S.builder;
    std::string ename = tagc::name_of(il[2]), vname = tagc::name_of(il[3]);
    static const std::vector<tagc::node_ptr> none;
    const auto& args = il.size() == 5 ? std::get<tagc::vector_t>(il[4]->data).elems : none;
    auto disc = (int32_t)builder::meta_i64(*inst, "discriminant");
    llvm::Value* e = B.CreateCall(S.rt.enum_new, {
        builder::global_cstr(S, ename, "enum.name"), builder::global_cstr(S, vname, "variant.name"),
        i32c(S, disc), i64c(S, (int64_t)args.size())});
    for(size_t i = 0; i < args.size(); ++i){
        llvm::Value* boxed = marshal::box(S, builder::get_value(S, args[i]), builder::type_of(S, args[i]));
        B.CreateCall(S.rt.enum_set_field, {e, i64c(S, (int64_t)i), marshal::spill(S, boxed, "variant.slot")});
    }
    builder::trace(S, "enum", ename + "::" + vname + " disc=" + std::to_string(disc));
    builder::bind(S, builder::var_name(il[1]), e, builder::annotated_type(*inst));
    return true;
}

bool handle_match(builder::State& S, const std::vector<tagc::node_ptr>& il, const tagc::node_ptr& inst){
    if(tagc::head_of(*inst) != "match") return false;
    auto& B = S.builder;
    auto& l = std::get<tagc::list>(inst->data);
    llvm::Value* scrut = builder::get_value(S, il[2]);
    llvm::Value* disc = B.CreateCall(S.rt.enum_discriminant, {scrut}, "disc");
    int n = S.cfCounter++;
    auto* endBB = builder::new_block(S, "match.end." + std::to_string(n));

    const auto& cases = std::get<tagc::vector_t>(tagc::kw_arg(l, "cases")->data).elems;
    for(size_t k = 0; k < cases.size(); ++k){
        auto& c = cases[k];
        auto& cl = std::get<tagc::list>(c->data);
        auto* caseBB = builder::new_block(S, "match.case." + std::to_string(n) + "." + std::to_string(k));
        auto* nextBB = builder::new_block(S, k + 1 == cases.size() ? "match.default." + std::to_string(n)
                                                                   : "match.next." + std::to_string(n) + "." + std::to_string(k));
        auto want = (int32_t)builder::meta_i64(*c, "discriminant");
        B.CreateCondBr(B.CreateICmpEQ(disc, i32c(S, want)), caseBB, nextBB);

        B.SetInsertPoint(caseBB);
        if(auto binds = tagc::kw_arg(cl, "binds")){
            for(auto& b : std::get<tagc::vector_t>(binds->data).elems){
                auto& bl = std::get<tagc::list>(b->data).elems;
                tagc::TypeId t = builder::annotated_type(*b);
                auto* slot = marshal::out_slot(S, "bind.slot");
                B.CreateCall(S.tctx.is_heap_owning(t) ? S.rt.enum_take_field : S.rt.enum_get_field,
                             {scrut, i64c(S, std::get<int64_t>(bl[2]->data)), slot});
                builder::bind(S, builder::var_name(bl[1]), marshal::unbox(S, marshal::load_slot(S, slot), t), t);
            }
        }
        // heap fields now belong to the binds; release what is left of the scrutinee
        if(c->metadata.count("consumes")) B.CreateCall(S.rt.enum_free, {scrut});
        S.emit_scope(tagc::kw_arg(cl, "body"));
        if(!builder::terminated(S)) B.CreateBr(endBB);
        B.SetInsertPoint(nextBB);
    }

    if(auto dflt = tagc::kw_arg(l, "default")){
        S.emit_scope(dflt);
        if(!builder::terminated(S)) B.CreateBr(endBB);
    } else {
        core_ops::emit_panic(S, "invalid discriminant in match on " + tagc::name_of(il[1]));
    }
    control_ops::seal_join(S, endBB);
    return true;
}

}
