#include "tagc/ir/record_ops.hpp"
#include "tagc/ir/marshal.hpp"
#include "tagc/value.hpp"

#include <llvm/IR/Constants.h>

namespace tagc::ir::record_ops {

static llvm::Value* new_record(builder::State& S, tagc::ValueTag kind, const std::string& type_name, size_t n){
    auto* i32 = llvm::Type::getInt32Ty(S.llctx);
    auto* i64 = llvm::Type::getInt64Ty(S.llctx);
    return S.builder.CreateCall(S.rt.record_new, {
        llvm::ConstantInt::get(i32, (uint64_t)(int32_t)kind),
        builder::global_cstr(S, type_name, "type.name"),
        llvm::ConstantInt::get(i64, (uint64_t)n)});
}

static void store_field(builder::State& S, llvm::Value* rec, int64_t index, const tagc::node_ptr& operand){
    llvm::Value* boxed = marshal::box(S, builder::get_value(S, operand), builder::type_of(S, operand));
    S.builder.CreateCall(S.rt.record_set, {rec, llvm::ConstantInt::get(llvm::Type::getInt64Ty(S.llctx), (uint64_t)index), marshal::spill(S, boxed, "field.slot")});
}

static void load_field(builder::State& S, llvm::Value* rec, int64_t index, const tagc::node_ptr& dst, tagc::TypeId t){
    auto* slot = marshal::out_slot(S, "field.out");
    S.builder.CreateCall(S.rt.record_get, {rec, llvm::ConstantInt::get(llvm::Type::getInt64Ty(S.llctx), (uint64_t)index), slot});
    builder::bind(S, builder::var_name(dst), marshal::unbox(S, marshal::load_slot(S, slot), t), t);
}

// Moves every bound field out of `rec`, then frees the record with whatever was not bound.
static void unpack(builder::State& S, llvm::Value* rec, const tagc::node_ptr& binds, bool by_name){
    auto* i64 = llvm::Type::getInt64Ty(S.llctx);
    for(auto& b : std::get<tagc::vector_t>(binds->data).elems){
        auto& bl = std::get<tagc::list>(b->data).elems;
        int64_t index = by_name ? builder::meta_i64(*b, "field-index") : std::get<int64_t>(bl[2]->data);
        tagc::TypeId t = builder::annotated_type(*b);
        auto* slot = marshal::out_slot(S, "unpack.slot");
        S.builder.CreateCall(S.tctx.is_heap_owning(t) ? S.rt.record_take : S.rt.record_get,
                             {rec, llvm::ConstantInt::get(i64, (uint64_t)index), slot});
        builder::bind(S, builder::var_name(bl[1]), marshal::unbox(S, marshal::load_slot(S, slot), t), t);
    }
    S.builder.CreateCall(S.rt.record_free, {rec});
}

bool handle(builder::State& S, const std::vector<tagc::node_ptr>& il, const tagc::node_ptr& inst){
    const std::string op = tagc::head_of(*inst);

    if(op == "struct-new"){ // (struct-new %p P [ (init :name x :value %x) ... ])
        std::string sname = tagc::name_of(il[2]);
        auto sit = S.structs.find(sname);
        if(sit == S.structs.end()) throw codegen_error("struct-new of undeclared struct " + sname);
        llvm::Value* rec = new_record(S, tagc::ValueTag::Struct, sname, sit->second.fields.size());
        for(auto& in : std::get<tagc::vector_t>(il[3]->data).elems)
            store_field(S, rec, builder::meta_i64(*in, "field-index"), tagc::kw_arg(std::get<tagc::list>(in->data), "value"));
        builder::bind(S, builder::var_name(il[1]), rec, builder::annotated_type(*inst));
        return true;
    }
    if(op == "struct-get"){ // (struct-get %v P %p field)
        load_field(S, builder::get_value(S, il[3]), builder::meta_i64(*inst, "field-index"), il[1], builder::annotated_type(*inst));
        return true;
    }
    if(op == "struct-unpack"){ // (struct-unpack P %p [ (bind %x field) ... ])
        unpack(S, builder::get_value(S, il[2]), il[3], true);
        return true;
    }
    if(op == "tuple-unpack"){ // (tuple-unpack %t [ (bind %x 0) ... ])
        unpack(S, builder::get_value(S, il[1]), il[2], false);
        return true;
    }
    if(op == "tuple-new"){ // (tuple-new %t [ %a %b ])
        auto& elems = std::get<tagc::vector_t>(il[2]->data).elems;
        llvm::Value* rec = new_record(S, tagc::ValueTag::Tuple, "tuple", elems.size());
        for(size_t i = 0; i < elems.size(); ++i) store_field(S, rec, (int64_t)i, elems[i]);
        builder::bind(S, builder::var_name(il[1]), rec, builder::annotated_type(*inst));
        return true;
    }
    if(op == "tuple-get"){ // (tuple-get %x %t <index>)
        load_field(S, builder::get_value(S, il[2]), std::get<int64_t>(il[3]->data), il[1], builder::annotated_type(*inst));
        return true;
    }
    return false;
}

}
