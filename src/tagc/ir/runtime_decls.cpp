#include "tagc/ir/runtime_decls.hpp"
#include "tagc/ir/types.hpp"

#include <llvm/IR/Attributes.h>
#include <llvm/IR/Function.h>

namespace tagc::ir {

RuntimeFunctions declare_runtime(llvm::Module& M){
    auto& C = M.getContext();
    RuntimeFunctions rt;
    rt.valueTy = types::value_type(C);
    rt.valuePtrTy = llvm::PointerType::getUnqual(rt.valueTy);
    rt.handleTy = types::handle_type(C);
    auto* voidTy = llvm::Type::getVoidTy(C);
    auto* i32 = llvm::Type::getInt32Ty(C);
    auto* i64 = llvm::Type::getInt64Ty(C);
    auto* f64 = llvm::Type::getDoubleTy(C);
    auto* h = rt.handleTy;
    auto* vp = rt.valuePtrTy;
    auto fn = [&](const char* name, llvm::Type* ret, std::initializer_list<llvm::Type*> params){
        return M.getOrInsertFunction(name, llvm::FunctionType::get(ret, llvm::ArrayRef<llvm::Type*>(params.begin(), params.size()), false));
    };

    rt.value_free = fn("tagc_rt_value_free", voidTy, {vp});

    rt.list_create = fn("tagc_rt_list_create", h, {});
    rt.list_create_with_capacity = fn("tagc_rt_list_create_with_capacity", h, {i64});
    rt.list_push = fn("tagc_rt_list_push", voidTy, {h, vp});
    rt.list_get = fn("tagc_rt_list_get", voidTy, {h, i64, vp});
    rt.list_pop = fn("tagc_rt_list_pop", voidTy, {h, vp});
    rt.list_len = fn("tagc_rt_list_len", i64, {h});
    rt.list_is_empty = fn("tagc_rt_list_is_empty", i32, {h});
    rt.list_free = fn("tagc_rt_list_free", voidTy, {h});

    rt.string_new = fn("tagc_rt_string_new", h, {h, i64});
    rt.string_len = fn("tagc_rt_string_len", i64, {h});
    rt.string_free = fn("tagc_rt_string_free", voidTy, {h});

    rt.record_new = fn("tagc_rt_record_new", h, {i32, h, i64});
    rt.record_set = fn("tagc_rt_record_set", voidTy, {h, i64, vp});
    rt.record_get = fn("tagc_rt_record_get", voidTy, {h, i64, vp});
    rt.record_take = fn("tagc_rt_record_take", voidTy, {h, i64, vp});
    rt.record_free = fn("tagc_rt_record_free", voidTy, {h});

    rt.enum_new = fn("tagc_rt_enum_new", h, {h, h, i32, i64});
    rt.enum_discriminant = fn("tagc_rt_enum_discriminant", i32, {h});
    rt.enum_set_field = fn("tagc_rt_enum_set_field", voidTy, {h, i64, vp});
    rt.enum_get_field = fn("tagc_rt_enum_get_field", voidTy, {h, i64, vp});
    rt.enum_take_field = fn("tagc_rt_enum_take_field", voidTy, {h, i64, vp});
    rt.enum_free = fn("tagc_rt_enum_free", voidTy, {h});

    rt.print_int = fn("tagc_rt_print_int", voidTy, {i64});
    rt.print_float = fn("tagc_rt_print_float", voidTy, {f64});
    rt.print_bool = fn("tagc_rt_print_bool", voidTy, {i32});
    rt.print_string = fn("tagc_rt_print_string", voidTy, {h});
    rt.print_value = fn("tagc_rt_print_value", voidTy, {vp});

    rt.panic = fn("tagc_rt_panic", voidTy, {h, i64});
    rt.panic_tag_mismatch = fn("tagc_rt_panic_tag_mismatch", voidTy, {i32, i32});
    for(auto* callee : {rt.panic.getCallee(), rt.panic_tag_mismatch.getCallee()}){
        if(auto* F = llvm::dyn_cast<llvm::Function>(callee)){
            F->addFnAttr(llvm::Attribute::NoReturn);
            F->addFnAttr(llvm::Attribute::Cold);
        }
    }
    return rt;
}

} // namespace tagc::ir
