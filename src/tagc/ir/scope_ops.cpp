#include "tagc/ir/scope_ops.hpp"
#include "tagc/ir/marshal.hpp"

namespace tagc::ir::scope_ops {

void emit_drop(builder::State& S, const tagc::OwnershipRecord& rec){
    auto& B = S.builder;
    auto it = S.vmap.find(rec.name);
    if(it == S.vmap.end()) throw codegen_error("drop of unknown binding '%" + rec.name + "'");
    llvm::Value* v = it->second;
    builder::trace(S, "drop", rec.name + " : " + S.tctx.to_string(rec.type) + " depth " + std::to_string(rec.depth));
    switch(S.tctx.at(rec.type).kind){
    case tagc::Type::Kind::List:   B.CreateCall(S.rt.list_free, {v}); return;
    case tagc::Type::Kind::String: B.CreateCall(S.rt.string_free, {v}); return;
    case tagc::Type::Kind::Struct:
    case tagc::Type::Kind::Tuple:  B.CreateCall(S.rt.record_free, {v}); return;
    case tagc::Type::Kind::Enum:   B.CreateCall(S.rt.enum_free, {v}); return;
    case tagc::Type::Kind::Value:  B.CreateCall(S.rt.value_free, {marshal::spill(S, v, "drop.slot")}); return;
    default: break;
    }
    throw codegen_error("drop of non-owning type " + S.tctx.to_string(rec.type));
}

void emit_drops(builder::State& S, const std::vector<tagc::OwnershipRecord>& drops){
    for(auto& d : drops) emit_drop(S, d);
}

void emit_scope(builder::State& S, const tagc::node_ptr& vec,
                const std::function<void(const std::vector<tagc::node_ptr>&)>& emit_list){
    auto v = vec ? tagc::as_vector(*vec) : nullptr;
    if(!v) throw codegen_error("expected instruction vector");
    emit_list(v->elems);
    if(!builder::terminated(S)) emit_drops(S, tagc::decode_drops(*vec, "scope-drops"));
}

} // namespace tagc::ir::scope_ops
