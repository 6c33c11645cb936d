#include "tagc/ir/core_ops.hpp"
#include "tagc/ir/marshal.hpp"

#include <llvm/IR/Constants.h>
#include <llvm/IR/DerivedTypes.h>
#include <cstdint>
#include <limits>

namespace tagc::ir::core_ops {

using tagc::TypeId;
using tagc::BaseType;

static llvm::ConstantInt* i64c(builder::State& S, int64_t v){ return llvm::ConstantInt::get(llvm::Type::getInt64Ty(S.llctx), (uint64_t)v, true); }

void emit_panic(builder::State& S, const std::string& message){
    auto* msg = builder::global_cstr(S, message, "panic.msg");
    S.builder.CreateCall(S.rt.panic, {msg, i64c(S, (int64_t)message.size())});
    S.builder.CreateUnreachable();
}

bool handle_literal(builder::State& S, const std::vector<tagc::node_ptr>& il, const tagc::node_ptr& inst){
    const std::string op = tagc::head_of(*inst);
    if(op == "const"){ // (const %x <ty> <literal>)
        TypeId t = builder::annotated_type(*inst);
        auto& lit = il[3]->data;
        llvm::Value* v = nullptr;
        if(t == S.tctx.get_base(BaseType::I64)) v = i64c(S, std::get<int64_t>(lit));
        else if(t == S.tctx.get_base(BaseType::F64)){
            double d = std::holds_alternative<double>(lit) ? std::get<double>(lit) : (double)std::get<int64_t>(lit);
            v = llvm::ConstantFP::get(llvm::Type::getDoubleTy(S.llctx), d);
        }
        else if(t == S.tctx.get_base(BaseType::Bool)) v = llvm::ConstantInt::get(llvm::Type::getInt1Ty(S.llctx), std::get<bool>(lit) ? 1 : 0);
        else throw codegen_error("const of type " + S.tctx.to_string(t));
        builder::bind(S, builder::var_name(il[1]), v, t);
        return true;
    }
    if(op == "null"){
        builder::bind(S, builder::var_name(il[1]), llvm::ConstantInt::get(llvm::Type::getInt8Ty(S.llctx), 0), S.tctx.get_base(BaseType::Null));
        return true;
    }
    if(op == "str"){ // (str %s "text")
        const auto& text = std::get<std::string>(il[2]->data);
        auto* data = builder::global_cstr(S, text, "str.data");
        auto* s = S.builder.CreateCall(S.rt.string_new, {data, i64c(S, (int64_t)text.size())});
        builder::bind(S, builder::var_name(il[1]), s, S.tctx.get_string());
        return true;
    }
    if(op == "string-len"){
        auto* n = S.builder.CreateCall(S.rt.string_len, {builder::get_value(S, il[2])});
        builder::bind(S, builder::var_name(il[1]), n, S.tctx.get_base(BaseType::I64));
        return true;
    }
    return false;
}

bool handle_arith(builder::State& S, const std::vector<tagc::node_ptr>& il){
    const std::string op = tagc::as_symbol(*il[0])->name;
    static const char* ops[] = {"add","sub","mul","sdiv","srem","fadd","fsub","fmul","fdiv"};
    bool known = false; for(auto* o : ops) if(op == o) known = true;
    if(!known) return false;
    auto& B = S.builder;
    llvm::Value* a = builder::get_value(S, il[3]);
    llvm::Value* b = builder::get_value(S, il[4]);
    std::string dst = builder::var_name(il[1]);
    llvm::Value* r = nullptr;
    if(op == "sdiv" || op == "srem"){
        // a zero divisor and INT64_MIN / -1 trap in hardware; both are runtime panics
        auto* zero = B.CreateICmpEQ(b, i64c(S, 0), "div.zero");
        int n = S.cfCounter++;
        auto* failBB = builder::new_block(S, "div.fail" + std::to_string(n));
        auto* checkBB = builder::new_block(S, "div.check" + std::to_string(n));
        auto* overflowBB = builder::new_block(S, "div.overflow" + std::to_string(n));
        auto* okBB = builder::new_block(S, "div.ok" + std::to_string(n));
        B.CreateCondBr(zero, failBB, checkBB);
        B.SetInsertPoint(failBB);
        emit_panic(S, "division by zero");
        B.SetInsertPoint(checkBB);
        auto* overflow = B.CreateAnd(B.CreateICmpEQ(a, i64c(S, std::numeric_limits<int64_t>::min()), "div.min"),
                                     B.CreateICmpEQ(b, i64c(S, -1), "div.neg1"), "div.ovf");
        B.CreateCondBr(overflow, overflowBB, okBB);
        B.SetInsertPoint(overflowBB);
        emit_panic(S, "integer overflow in division");
        B.SetInsertPoint(okBB);
        r = op == "sdiv" ? B.CreateSDiv(a, b, dst) : B.CreateSRem(a, b, dst);
    }
    else if(op == "add") r = B.CreateAdd(a, b, dst);
    else if(op == "sub") r = B.CreateSub(a, b, dst);
    else if(op == "mul") r = B.CreateMul(a, b, dst);
    else if(op == "fadd") r = B.CreateFAdd(a, b, dst);
    else if(op == "fsub") r = B.CreateFSub(a, b, dst);
    else if(op == "fmul") r = B.CreateFMul(a, b, dst);
    else r = B.CreateFDiv(a, b, dst);
    builder::bind(S, dst, r, S.tctx.get_base(op[0] == 'f' ? BaseType::F64 : BaseType::I64));
    return true;
}

bool handle_compare(builder::State& S, const std::vector<tagc::node_ptr>& il){
    const std::string op = tagc::as_symbol(*il[0])->name;
    if(op!="eq" && op!="ne" && op!="lt" && op!="le" && op!="gt" && op!="ge") return false;
    auto& B = S.builder;
    llvm::Value* a = builder::get_value(S, il[3]);
    llvm::Value* b = builder::get_value(S, il[4]);
    std::string dst = builder::var_name(il[1]);
    llvm::Value* r = nullptr;
    if(a->getType()->isDoubleTy()){
        llvm::CmpInst::Predicate p = op=="eq" ? llvm::CmpInst::FCMP_OEQ : op=="ne" ? llvm::CmpInst::FCMP_UNE
            : op=="lt" ? llvm::CmpInst::FCMP_OLT : op=="le" ? llvm::CmpInst::FCMP_OLE
            : op=="gt" ? llvm::CmpInst::FCMP_OGT : llvm::CmpInst::FCMP_OGE;
        r = B.CreateFCmp(p, a, b, dst);
    } else {
        llvm::CmpInst::Predicate p = op=="eq" ? llvm::CmpInst::ICMP_EQ : op=="ne" ? llvm::CmpInst::ICMP_NE
            : op=="lt" ? llvm::CmpInst::ICMP_SLT : op=="le" ? llvm::CmpInst::ICMP_SLE
            : op=="gt" ? llvm::CmpInst::ICMP_SGT : llvm::CmpInst::ICMP_SGE;
        r = B.CreateICmp(p, a, b, dst);
    }
    builder::bind(S, dst, r, S.tctx.get_base(BaseType::Bool));
    return true;
}

bool handle_binding(builder::State& S, const std::vector<tagc::node_ptr>& il, const tagc::node_ptr& inst){
    const std::string op = tagc::head_of(*inst);
    if(op == "var"){ // (var %i <ty> %init)
        std::string name = builder::var_name(il[1]);
        TypeId t = builder::annotated_type(*inst);
        llvm::Value* init = builder::get_value(S, il[3]);
        auto* slot = builder::entry_alloca(S, builder::map_type(S, t), name + ".slot");
        S.builder.CreateStore(init, slot);
        S.varSlots[name] = slot;
        S.vtypes[name] = t;
        return true;
    }
    if(op == "set"){ // (set %i %v)
        std::string name = builder::var_name(il[1]);
        auto it = S.varSlots.find(name);
        if(it == S.varSlots.end()) throw codegen_error("set of non-var '%" + name + "'");
        S.builder.CreateStore(builder::get_value(S, il[2]), it->second);
        return true;
    }
    if(op == "let"){ // (let %b <ty> %a), ownership moves with the SSA value
        builder::bind(S, builder::var_name(il[1]), builder::get_value(S, il[3]), builder::annotated_type(*inst));
        return true;
    }
    return false;
}

bool handle_print(builder::State& S, const std::vector<tagc::node_ptr>& il){
    if(tagc::as_symbol(*il[0])->name != "print") return false;
    auto& B = S.builder;
    TypeId t = builder::type_of(S, il[1]);
    llvm::Value* v = builder::get_value(S, il[1]);
    const auto& T = S.tctx.at(t);
    if(t == S.tctx.get_base(BaseType::I64)) B.CreateCall(S.rt.print_int, {v});
    else if(t == S.tctx.get_base(BaseType::F64)) B.CreateCall(S.rt.print_float, {v});
    else if(t == S.tctx.get_base(BaseType::Bool)) B.CreateCall(S.rt.print_bool, {B.CreateZExt(v, llvm::Type::getInt32Ty(S.llctx))});
    else if(T.kind == tagc::Type::Kind::String) B.CreateCall(S.rt.print_string, {v});
    else B.CreateCall(S.rt.print_value, {marshal::spill(S, marshal::box(S, v, t), "print.slot")});
    return true;
}

bool handle_panic(builder::State& S, const std::vector<tagc::node_ptr>& il){
    if(tagc::as_symbol(*il[0])->name != "panic") return false;
    emit_panic(S, std::get<std::string>(il[1]->data));
    return true;
}

}
