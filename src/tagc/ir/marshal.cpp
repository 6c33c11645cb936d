#include "tagc/ir/marshal.hpp"
#include "tagc/value.hpp"

#include <llvm/IR/Constants.h>

namespace tagc::ir::marshal {

static llvm::ConstantInt* tag_const(builder::State& S, tagc::ValueTag tag){
    return llvm::ConstantInt::get(llvm::Type::getInt32Ty(S.llctx), (uint64_t)(int32_t)tag, true);
}

static tagc::ValueTag tag_or_throw(builder::State& S, tagc::TypeId t){
    auto tag = S.tctx.tag_for(t);
    if(!tag) throw codegen_error("type " + S.tctx.to_string(t) + " has no value tag");
    return *tag;
}

llvm::Value* box(builder::State& S, llvm::Value* v, tagc::TypeId t){
    auto& B = S.builder;
    if(S.tctx.at(t).kind == tagc::Type::Kind::Value) return v;
    auto tag = tag_or_throw(S, t);
    auto* i64 = llvm::Type::getInt64Ty(S.llctx);
    llvm::Value* payload = nullptr;
    switch(tag){
    case tagc::ValueTag::Integer: payload = v; break;
    case tagc::ValueTag::Float:   payload = B.CreateBitCast(v, i64, "box.bits"); break;
    case tagc::ValueTag::Boolean: payload = B.CreateZExt(v, i64, "box.bool"); break;
    case tagc::ValueTag::Null:    payload = llvm::ConstantInt::get(i64, 0); break;
    default:                      payload = B.CreatePtrToInt(v, i64, "box.ref"); break;
    }
    llvm::Value* agg = llvm::UndefValue::get(S.rt.valueTy);
    agg = B.CreateInsertValue(agg, tag_const(S, tag), {0u});
    return B.CreateInsertValue(agg, payload, {1u}, "boxed");
}

llvm::Value* unbox(builder::State& S, llvm::Value* boxed, tagc::TypeId t){
    auto& B = S.builder;
    if(S.tctx.at(t).kind == tagc::Type::Kind::Value) return boxed;
    auto tag = tag_or_throw(S, t);
    int n = S.cfCounter++;
    llvm::Value* actual = B.CreateExtractValue(boxed, {0u}, "tag");
    llvm::Value* ok = B.CreateICmpEQ(actual, tag_const(S, tag), "tag.ok");
    auto* okBB = builder::new_block(S, "unbox.ok" + std::to_string(n));
    auto* failBB = builder::new_block(S, "unbox.fail" + std::to_string(n));
    B.CreateCondBr(ok, okBB, failBB);

    B.SetInsertPoint(failBB);
    B.CreateCall(S.rt.panic_tag_mismatch, {tag_const(S, tag), actual});
    B.CreateUnreachable();

    B.SetInsertPoint(okBB);
    llvm::Value* payload = B.CreateExtractValue(boxed, {1u}, "payload");
    switch(tag){
    case tagc::ValueTag::Integer: return payload;
    case tagc::ValueTag::Float:   return B.CreateBitCast(payload, llvm::Type::getDoubleTy(S.llctx), "unboxed");
    case tagc::ValueTag::Boolean: return B.CreateICmpNE(payload, llvm::ConstantInt::get(payload->getType(), 0), "unboxed");
    case tagc::ValueTag::Null:    return llvm::ConstantInt::get(llvm::Type::getInt8Ty(S.llctx), 0);
    default:                      return B.CreateIntToPtr(payload, S.rt.handleTy, "unboxed");
    }
}

llvm::Value* out_slot(builder::State& S, const char* name){ return builder::entry_alloca(S, S.rt.valueTy, name); }

llvm::Value* spill(builder::State& S, llvm::Value* boxed, const char* name){
    auto* slot = out_slot(S, name);
    S.builder.CreateStore(boxed, slot);
    return slot;
}

llvm::Value* load_slot(builder::State& S, llvm::Value* slot){
    return S.builder.CreateLoad(S.rt.valueTy, slot, "loaded");
}

} // namespace tagc::ir::marshal
