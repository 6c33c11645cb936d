#include "tagc/ir/control_ops.hpp"

#include <llvm/IR/CFG.h>

namespace tagc::ir::control_ops {

void seal_join(builder::State& S, llvm::BasicBlock* join){
    if(join != &S.fn->back()) join->moveAfter(&S.fn->back());
    S.builder.SetInsertPoint(join);
    if(llvm::pred_empty(join)) S.builder.CreateUnreachable();
}

bool handle(builder::State& S, const std::vector<tagc::node_ptr>& il, const tagc::node_ptr& inst){
    auto& B = S.builder;
    const std::string op = tagc::head_of(*inst);

    if(op == "block"){
        S.emit_scope(tagc::kw_arg(std::get<tagc::list>(inst->data), "body"));
        return true;
    }

    if(op == "if"){ // (if %c [then] [else]), the checker always supplies the else vector
        if(il.size() != 4) throw codegen_error("if without else arm in annotated tree");
        llvm::Value* cond = builder::get_value(S, il[1]);
        int n = S.cfCounter++;
        auto* thenBB = builder::new_block(S, "if.then" + std::to_string(n));
        auto* elseBB = builder::new_block(S, "if.else" + std::to_string(n));
        auto* endBB = builder::new_block(S, "if.end" + std::to_string(n));
        B.CreateCondBr(cond, thenBB, elseBB);
        for(auto arm : {std::make_pair(thenBB, il[2]), std::make_pair(elseBB, il[3])}){
            B.SetInsertPoint(arm.first);
            S.emit_scope(arm.second);
            if(!builder::terminated(S)) B.CreateBr(endBB);
        }
        seal_join(S, endBB);
        return true;
    }

    if(op == "while"){ // (while :cond [ ... ] :test %c :body [ ... ])
        auto& l = std::get<tagc::list>(inst->data);
        auto cond = tagc::kw_arg(l, "cond");
        int n = S.cfCounter++;
        auto* condBB = builder::new_block(S, "while.cond" + std::to_string(n));
        auto* bodyBB = builder::new_block(S, "while.body" + std::to_string(n));
        auto* endBB = builder::new_block(S, "while.end" + std::to_string(n));
        B.CreateBr(condBB);
        B.SetInsertPoint(condBB);
        if(cond) S.emit_scope(cond);
        B.CreateCondBr(builder::get_value(S, tagc::kw_arg(l, "test")), bodyBB, endBB);
        B.SetInsertPoint(bodyBB);
        S.emit_scope(tagc::kw_arg(l, "body"));
        if(!builder::terminated(S)) B.CreateBr(condBB);
        seal_join(S, endBB);
        builder::trace(S, "loop", "while" + std::to_string(n));
        return true;
    }
    return false;
}

}
