#include "tagc/ir/builder.hpp"
#include "tagc/ir/types.hpp"
#include <cstdio>

namespace tagc::ir::builder {

llvm::Type* map_type(State& S, tagc::TypeId id){ return types::map_type(S.llctx, S.tctx, id); }

std::string var_name(const tagc::node_ptr& n){
    auto s = n ? as_symbol(*n) : nullptr;
    if(!s || s->name.size() < 2 || s->name[0] != '%')
        throw codegen_error("expected %variable, got " + (n ? tagc::to_string(n) : std::string("<null>")));
    return s->name.substr(1);
}

llvm::Value* lookup(State& S, const std::string& name){
    if(auto it = S.varSlots.find(name); it != S.varSlots.end())
        return S.builder.CreateLoad(it->second->getAllocatedType(), it->second, name + ".val");
    if(auto it = S.vmap.find(name); it != S.vmap.end()) return it->second;
    throw codegen_error("undefined value '%" + name + "' during emission");
}

llvm::Value* get_value(State& S, const tagc::node_ptr& operand){ return lookup(S, var_name(operand)); }

tagc::TypeId type_of(State& S, const tagc::node_ptr& operand){
    auto name = var_name(operand);
    auto it = S.vtypes.find(name);
    if(it == S.vtypes.end()) throw codegen_error("no type recorded for '%" + name + "'");
    return it->second;
}

void bind(State& S, const std::string& name, llvm::Value* v, tagc::TypeId t){
    // the first name wins; later binds of the same value are aliases
    bool alias = !S.named.insert(v).second;
    if(!alias && !v->getType()->isVoidTy() && !llvm::isa<llvm::Constant>(v) && !llvm::isa<llvm::Argument>(v)) v->setName(name);
    S.vmap[name] = v;
    S.vtypes[name] = t;
}

int64_t meta_i64(const tagc::node& n, const std::string& key){
    auto it = n.metadata.find(key);
    if(it == n.metadata.end() || !it->second) throw codegen_error("missing '" + key + "' annotation on " + tagc::to_string(n));
    if(auto v = std::get_if<int64_t>(&it->second->data)) return *v;
    throw codegen_error("bad '" + key + "' annotation");
}

tagc::TypeId annotated_type(const tagc::node& inst){ return (tagc::TypeId)meta_i64(inst, "type-id"); }

llvm::AllocaInst* entry_alloca(State& S, llvm::Type* ty, const std::string& name){
    llvm::IRBuilder<> tmp(&S.fn->getEntryBlock(), S.fn->getEntryBlock().begin());
    return tmp.CreateAlloca(ty, nullptr, name);
}

bool terminated(State& S){
    auto* bb = S.builder.GetInsertBlock();
    return !bb || bb->getTerminator() != nullptr;
}

llvm::BasicBlock* new_block(State& S, const std::string& name){ return llvm::BasicBlock::Create(S.llctx, name, S.fn); }

llvm::Value* global_cstr(State& S, const std::string& text, const std::string& name){
    return S.builder.CreateGlobalStringPtr(text, name);
}

void trace(State& S, const char* area, const std::string& msg){
    if(S.env.debugLog) std::fprintf(stderr, "[tagc][%s] %s\n", area, msg.c_str());
}

} // namespace tagc::ir::builder
