#include "tagc/ir/value_ops.hpp"
#include "tagc/ir/marshal.hpp"

namespace tagc::ir::value_ops {

bool handle(builder::State& S, const std::vector<tagc::node_ptr>& il, const tagc::node_ptr& inst){
    const std::string op = tagc::head_of(*inst);
    if(op == "box"){
        llvm::Value* boxed = marshal::box(S, builder::get_value(S, il[2]), builder::type_of(S, il[2]));
        builder::bind(S, builder::var_name(il[1]), boxed, S.tctx.get_value());
        return true;
    }
    if(op == "unbox"){
        tagc::TypeId t = builder::annotated_type(*inst);
        llvm::Value* v = marshal::unbox(S, builder::get_value(S, il[3]), t);
        builder::bind(S, builder::var_name(il[1]), v, t);
        return true;
    }
    return false;
}

}
