// Type checker and ownership analysis for tagc modules.
#include "tagc/type_check.hpp"
#include <algorithm>
#include <cstdlib>

namespace tagc {

namespace {
constexpr TypeId kNoType = (TypeId)-1;

// `%x` -> "x"; anything else -> ""
std::string var_name(const node_ptr& n){
    if(!n) return {};
    auto s=as_symbol(*n); if(!s || s->name.size()<2 || s->name[0]!='%') return {};
    return s->name.substr(1);
}
void attach(const node_ptr& n, TypeId t){ n->metadata["type-id"]=detail::make_int((int64_t)t); }
void set_meta(const node_ptr& n, const std::string& k, int64_t v){ n->metadata[k]=detail::make_int(v); }
const std::vector<node_ptr>* seq_of(const node_ptr& n){ if(!n) return nullptr; if(auto v=as_vector(*n)) return &v->elems; return nullptr; }
bool contains(const std::vector<OwnershipRecord>& xs, const std::string& name){
    return std::any_of(xs.begin(), xs.end(), [&](const OwnershipRecord& o){ return o.name==name; });
}
template<class M> std::vector<std::string> keys_of(const M& m){ std::vector<std::string> out; for(auto &kv: m) out.push_back(kv.first); std::sort(out.begin(), out.end()); return out; }
} // namespace

void TypeChecker::error_code(TypeCheckResult& r, const node& n, std::string code, std::string msg, std::string hint){
    ErrorReporter rep{&r.errors,&r.warnings};
    rep.emit_error(rep.make_error(std::move(code), std::move(msg), std::move(hint), line(n), col(n)));
    r.success=false;
}
void TypeChecker::warn_code(TypeCheckResult& r, const node& n, std::string code, std::string msg, std::string hint){
    ErrorReporter rep{&r.errors,&r.warnings};
    rep.emit_warning(rep.make_warning(std::move(code), std::move(msg), std::move(hint), line(n), col(n)));
}
void TypeChecker::type_mismatch(TypeCheckResult& r, const node& n, const std::string& role, TypeId expected, TypeId actual){
    ErrorReporter rep{&r.errors,&r.warnings};
    std::string expStr = ctx_.to_string(expected);
    std::string actStr = ctx_.to_string(actual);
    auto err = rep.make_error(diag::TypeMismatch, role+" type mismatch", "ensure "+role+" has type "+expStr, line(n), col(n));
    err.notes.push_back(TypeNote{"expected: "+expStr, line(n), col(n)});
    err.notes.push_back(TypeNote{"   found: "+actStr, line(n), col(n)});
    rep.emit_error(err);
    r.success=false;
}

void TypeChecker::reset(){ structs_.clear(); enums_.clear(); functions_.clear(); defined_.clear(); mutable_.clear(); poisoned_.clear(); type_decls_.clear(); }

int TypeChecker::edit_distance(const std::string& a, const std::string& b){
    size_t n=a.size(), m=b.size();
    if(n>64||m>64){ int dist=0; for(size_t i=0;i<std::min(n,m);++i) if(a[i]!=b[i]) ++dist; return dist + (int)std::max(n,m) - (int)std::min(n,m); }
    int dp[65][65];
    for(size_t i=0;i<=n;++i) dp[i][0]=(int)i;
    for(size_t j=0;j<=m;++j) dp[0][j]=(int)j;
    for(size_t i=1;i<=n;++i) for(size_t j=1;j<=m;++j){ int c = a[i-1]==b[j-1]?0:1; dp[i][j]=std::min({dp[i-1][j]+1, dp[i][j-1]+1, dp[i-1][j-1]+c}); }
    return dp[n][m];
}
std::vector<std::string> TypeChecker::fuzzy_candidates(const std::string& target, const std::vector<std::string>& pool, int maxDist){
    std::vector<std::string> out; for(auto &c: pool){ if(c.empty()||c==target) continue; if(edit_distance(target,c)<=maxDist) out.push_back(c); }
    if(out.size()>5) out.resize(5);
    return out;
}
void TypeChecker::append_suggestions(TypeError& err, const std::vector<std::string>& suggs){
    if(suggs.empty()) return;
    if(const char* env = std::getenv("TAGC_SUGGEST")){ if(env[0]=='0') return; }
    std::string msg="did you mean ";
    for(size_t i=0;i<suggs.size();++i){ msg+=suggs[i]; if(i+1<suggs.size()) msg+= i+2==suggs.size()?" or ":", "; }
    err.notes.push_back(TypeNote{msg,err.line,err.col});
}
void TypeChecker::suggest_error(TypeCheckResult& r, const node& n, const std::string& code, const std::string& msg, const std::string& hint, const std::string& target, const std::vector<std::string>& pool){
    ErrorReporter rep{&r.errors,&r.warnings};
    auto err = rep.make_error(code, msg, hint, line(n), col(n));
    append_suggestions(err, fuzzy_candidates(target, pool));
    rep.emit_error(err);
    r.success=false;
}

TypeId TypeChecker::parse_type_node(const node_ptr& n, TypeCheckResult& r){
    if(!n){ return kNoType; }
    try { return ctx_.parse_type(n); }
    catch(const type_error& e){
        std::string name = name_of(n);
        if(!name.empty()) suggest_error(r,*n,diag::UndefinedType,e.what(),"declare the type before use",name,keys_of(type_decls_));
        else error_code(r,*n,diag::UndefinedType,e.what(),"use i64, f64, bool, null, string, list, value, (tuple ...) or a declared name");
        return kNoType;
    }
}

// ---------------------------------------------------------------- declarations
void TypeChecker::collect_types(TypeCheckResult& r, const std::vector<node_ptr>& elems){
    for(size_t i=1;i<elems.size(); ++i){
        auto &n=elems[i]; std::string head=head_of(*n);
        if(head!="struct" && head!="enum") continue;
        std::string name=name_of(kw_arg(std::get<list>(n->data), "name"));
        if(name.empty()){ error_code(r,*n,diag::MalformedDecl,head+" missing :name","provide ("+head+" :name T ...)"); continue; }
        if(type_decls_.count(name)){ error_code(r,*n,diag::DuplicateDecl,head+" redefinition '"+name+"'","choose a unique type name"); continue; }
        try { head=="struct" ? ctx_.declare_struct(name) : ctx_.declare_enum(name); }
        catch(const type_error& e){ error_code(r,*n,diag::DuplicateDecl,e.what(),"choose a unique type name"); continue; }
        type_decls_[name]=n;
    }
}

void TypeChecker::collect_structs(TypeCheckResult& r, const std::vector<node_ptr>& elems){
    // (struct :name P :fields [ (field :name x :type i64) ... ])
    for(size_t i=1;i<elems.size(); ++i){
        auto &n=elems[i]; if(head_of(*n)!="struct") continue;
        auto &l=std::get<list>(n->data);
        std::string name=name_of(kw_arg(l,"name"));
        auto it=type_decls_.find(name); if(it==type_decls_.end() || it->second!=n) continue;
        auto fields=seq_of(kw_arg(l,"fields"));
        if(!fields){ error_code(r,*n,diag::MalformedDecl,"struct missing :fields","add :fields [ (field :name x :type <type>) ... ]"); continue; }
        StructInfo info; info.name=name;
        for(auto &f: *fields){
            if(head_of(*f)!="field"){ error_code(r,*f,diag::MalformedDecl,"struct field malformed","use (field :name x :type <type>)"); continue; }
            auto &fl=std::get<list>(f->data);
            std::string fname=name_of(kw_arg(fl,"name")); auto tyNode=kw_arg(fl,"type");
            if(fname.empty()||!tyNode){ error_code(r,*f,diag::MalformedDecl,"struct field malformed","need :name and :type"); continue; }
            if(info.field_index.count(fname)){ error_code(r,*f,diag::DuplicateMember,"duplicate field '"+fname+"' in struct "+name,"rename field"); continue; }
            TypeId ft=parse_type_node(tyNode,r); if(ft==kNoType) continue;
            if(ctx_.is_void(ft)){ error_code(r,*f,diag::MalformedDecl,"field '"+fname+"' cannot be void"); continue; }
            info.field_index[fname]=info.fields.size();
            info.fields.push_back(FieldInfo{fname,ft,info.fields.size()});
        }
        structs_[name]=std::move(info);
    }
}

void TypeChecker::collect_enums(TypeCheckResult& r, const std::vector<node_ptr>& elems){
    // (enum :name Color :variants [ (variant :name Red) (variant :name RGB :fields [ i64 i64 i64 ]) ])
    for(size_t i=1;i<elems.size(); ++i){
        auto &n=elems[i]; if(head_of(*n)!="enum") continue;
        auto &l=std::get<list>(n->data);
        std::string name=name_of(kw_arg(l,"name"));
        auto it=type_decls_.find(name); if(it==type_decls_.end() || it->second!=n) continue;
        auto variants=seq_of(kw_arg(l,"variants"));
        if(!variants || variants->empty()){ error_code(r,*n,diag::MalformedDecl,"enum "+name+" has no :variants","add :variants [ (variant :name A) ... ]"); continue; }
        EnumInfo info; info.name=name;
        for(auto &v: *variants){
            if(head_of(*v)!="variant"){ error_code(r,*v,diag::MalformedDecl,"enum variant malformed","use (variant :name A :fields [ <types>* ])"); continue; }
            auto &vl=std::get<list>(v->data);
            std::string vname=name_of(kw_arg(vl,"name"));
            if(vname.empty()){ error_code(r,*v,diag::MalformedDecl,"variant missing :name"); continue; }
            if(info.variant_index.count(vname)){ error_code(r,*v,diag::DuplicateMember,"duplicate variant '"+vname+"' in enum "+name,"rename variant"); continue; }
            VariantInfo vi; vi.name=vname; vi.discriminant=(int32_t)info.variants.size();
            if(auto fieldsNode=kw_arg(vl,"fields")){
                auto fs=seq_of(fieldsNode);
                if(!fs){ error_code(r,*fieldsNode,diag::MalformedDecl,"variant :fields must be vector","use [ <types>* ]"); continue; }
                for(auto &ft: *fs){ TypeId t=parse_type_node(ft,r); if(t!=kNoType && !ctx_.is_void(t)) vi.fields.push_back(t); }
            }
            info.variant_index[vname]=info.variants.size();
            info.variants.push_back(std::move(vi));
        }
        enums_[name]=std::move(info);
    }
}

bool TypeChecker::parse_function_header(TypeCheckResult& r, const node_ptr& fn, FunctionInfoTC& out_fn){
    if(head_of(*fn)!="fn") return false;
    auto &l=std::get<list>(fn->data);
    out_fn.name=name_of(kw_arg(l,"name"));
    if(out_fn.name.empty()){ error_code(r,*fn,diag::MalformedDecl,"function missing :name","add :name \"f\""); return false; }
    out_fn.ret=ctx_.get_base(BaseType::Void);
    if(auto ret=kw_arg(l,"ret")){ TypeId t=parse_type_node(ret,r); if(t!=kNoType) out_fn.ret=t; }
    if(auto ext=kw_arg(l,"external")){ if(auto b=std::get_if<bool>(&ext->data)) out_fn.external=*b; else error_code(r,*ext,diag::MalformedDecl,":external expects bool"); }
    if(auto params=kw_arg(l,"params")){
        auto ps=seq_of(params);
        if(!ps){ error_code(r,*params,diag::MalformedDecl,":params must be vector","use [ (param <type> %x) ... ]"); return true; }
        for(auto &p: *ps){
            auto pl=as_list(*p);
            if(head_of(*p)!="param" || pl->elems.size()!=3 || var_name(pl->elems[2]).empty()){ error_code(r,*p,diag::MalformedDecl,"parameter malformed","use (param <type> %x)"); continue; }
            TypeId pt=parse_type_node(pl->elems[1],r); if(pt==kNoType) continue;
            if(ctx_.is_void(pt)){ error_code(r,*p,diag::MalformedDecl,"parameter cannot be void"); continue; }
            out_fn.params.push_back(ParamInfoTC{var_name(pl->elems[2]),pt});
        }
    }
    return true;
}

void TypeChecker::collect_functions_headers(TypeCheckResult& r, const std::vector<node_ptr>& elems){
    for(size_t i=1;i<elems.size(); ++i){
        FunctionInfoTC fi;
        if(!parse_function_header(r, elems[i], fi)) continue;
        if(functions_.count(fi.name)){ error_code(r,*elems[i],diag::DuplicateDecl,"duplicate function '"+fi.name+"'","rename one definition"); continue; }
        functions_[fi.name]=fi;
    }
}

void TypeChecker::check_functions(TypeCheckResult& r, const std::vector<node_ptr>& elems){
    for(size_t i=1;i<elems.size(); ++i){
        auto &n=elems[i]; if(head_of(*n)!="fn") continue;
        auto it=functions_.find(name_of(kw_arg(std::get<list>(n->data),"name")));
        if(it==functions_.end() || it->second.external) continue;
        check_function_body(r,n,it->second);
    }
}

void TypeChecker::check_function_body(TypeCheckResult& r, const node_ptr& fn, const FunctionInfoTC& info){
    auto body=kw_arg(std::get<list>(fn->data),"body");
    if(!seq_of(body)){ error_code(r,*fn,diag::MalformedDecl,":body missing or not vector","add :body [ ... ] or :external true"); return; }
    OwnershipTracker tracker(ctx_);
    tracker_=&tracker; fn_=&info;
    defined_.clear(); mutable_.clear(); poisoned_.clear();
    // Parameters live in the function scope, exactly like its top-level locals.
    tracker.enter_scope();
    for(auto &p: info.params){
        if(defined_.count(p.name)){ error_code(r,*fn,diag::Redefinition,"duplicate parameter '%"+p.name+"'"); continue; }
        defined_.insert(p.name); tracker.declare(p.name,p.type);
    }
    bool terminated=check_instruction_list(r, std::get<vector_t>(body->data).elems);
    body->metadata["scope-drops"]=encode_drops(tracker.exit_scope());
    if(!terminated && !ctx_.is_void(info.ret))
        error_code(r,*fn,diag::MissingReturn,"function '"+info.name+"' can reach its end without returning","add (ret "+ctx_.to_string(info.ret)+" %x)");
    tracker_=nullptr; fn_=nullptr;
}

// ---------------------------------------------------------------- scopes and ownership
void TypeChecker::report_access(TypeCheckResult& r, const node& at, const std::string& name, Access a){
    switch(a){
    case Access::Ok: return;
    case Access::Undefined:{
        std::vector<std::string> pool; for(auto &kv: tracker_->snapshot().bindings) pool.push_back(kv.first);
        std::sort(pool.begin(),pool.end());
        suggest_error(r,at,diag::UndefinedVariable,"undefined variable '%"+name+"'","define it before use; names from a nested scope end with it",name,pool);
        return; }
    case Access::Moved:
        error_code(r,at,diag::UseAfterMove,"use of moved value '%"+name+"'","ownership was transferred earlier; use the new owner instead");
        return;
    case Access::MovedInLoop:
        error_code(r,at,diag::MoveInLoop,"'%"+name+"' moved inside a loop but declared outside it","the value would be moved again on the next iteration");
        return;
    }
}

TypeId TypeChecker::use_operand(TypeCheckResult& r, const node_ptr& operand, bool consume){
    std::string name=var_name(operand);
    if(name.empty()){ error_code(r,*operand,diag::InvalidOperand,"expected %variable operand, got "+to_string(operand)); return kNoType; }
    if(poisoned_.count(name)) return kNoType;
    Access a = consume ? tracker_->move(name) : tracker_->read(name);
    report_access(r,*operand,name,a);
    if(auto b=tracker_->binding(name)) return b->type;
    return kNoType;
}

void TypeChecker::declare(TypeCheckResult& r, const node_ptr& dst_node, const std::string& dst, TypeId t){
    if(dst.empty()){ error_code(r,*dst_node,diag::InvalidOperand,"destination must be a %variable"); return; }
    if(defined_.count(dst)){ error_code(r,*dst_node,diag::Redefinition,"redefinition of '%"+dst+"'","each name is defined once per function"); return; }
    defined_.insert(dst);
    if(t==kNoType){ poisoned_.insert(dst); return; }
    tracker_->declare(dst,t);
}

bool TypeChecker::check_scope(TypeCheckResult& r, const node_ptr& vec, const std::function<void()>& prologue){
    auto insts=seq_of(vec);
    if(!insts){ error_code(r,*vec,diag::MalformedDecl,"expected instruction vector [ ... ]"); return false; }
    tracker_->enter_scope();
    if(prologue) prologue();
    bool terminated=check_instruction_list(r,*insts);
    vec->metadata["scope-drops"]=encode_drops(tracker_->exit_scope());
    return terminated;
}

bool TypeChecker::merge_arms(const OwnershipTracker::State& entry, std::vector<ArmResult>& arms){
    bool all_terminated=true;
    std::vector<OwnershipRecord> moved_any;
    for(auto &rec: entry.records){
        for(auto &a: arms) if(!a.terminated && contains(a.moved,rec.name)){ moved_any.push_back(rec); break; }
    }
    for(auto &a: arms){
        if(a.terminated) continue;
        all_terminated=false;
        // an arm that kept a value moved elsewhere destroys it on its own exit
        auto drops=decode_drops(*a.scope,"scope-drops");
        for(auto it=moved_any.rbegin(); it!=moved_any.rend(); ++it) if(!contains(a.moved,it->name)) drops.push_back(*it);
        a.scope->metadata["scope-drops"]=encode_drops(drops);
    }
    tracker_->restore(entry);
    for(auto &m: moved_any) tracker_->mark_moved(m.name);
    return all_terminated;
}

bool TypeChecker::check_instruction_list(TypeCheckResult& r, const std::vector<node_ptr>& insts){
    for(size_t i=0;i<insts.size();++i){
        if(!check_instruction(r,insts[i])) continue;
        if(i+1<insts.size()) warn_code(r,*insts[i+1],diag::UnreachableCode,"unreachable instruction after terminator","remove code after ret/panic");
        return true;
    }
    return false;
}

// ---------------------------------------------------------------- instructions
bool TypeChecker::check_instruction(TypeCheckResult& r, const node_ptr& n){
    if(!n || !is_list(*n) || head_of(*n).empty()){ error_code(r,*n,diag::InvalidOperand,"instruction must be a list starting with an opcode"); return false; }
    auto &il=std::get<list>(n->data).elems;
    std::string op=head_of(*n);
    auto arity=[&](size_t k, const char* form)->bool{ if(il.size()==k) return true; error_code(r,*n,diag::InvalidOperand,op+" arity","expected "+std::string(form)); return false; };
    auto expect=[&](const node_ptr& at, const std::string& role, TypeId want, TypeId got){ if(want!=kNoType && got!=kNoType && want!=got) type_mismatch(r,*at,role,want,got); };
    const TypeId I64=ctx_.get_base(BaseType::I64), F64=ctx_.get_base(BaseType::F64), BOOL=ctx_.get_base(BaseType::Bool), VALUE=ctx_.get_value(), LIST=ctx_.get_list();
    auto boxable=[&](TypeId t){ return t!=kNoType && ctx_.tag_for(t).has_value(); };
    auto storable=[&](TypeId t){ return t==VALUE || boxable(t); };
    auto copy_only=[&](const node_ptr& at, TypeId t, const std::string& what)->bool{
        if(t==kNoType || !ctx_.is_heap_owning(t)) return true;
        error_code(r,*at,diag::HeapCopyOut,what+" of heap type "+ctx_.to_string(t)+" cannot be copied out","move it out with list-pop, struct-unpack, tuple-unpack or a match bind");
        return false; };
    auto def=[&](size_t i, TypeId t){ attach(n,t); declare(r,il[i],var_name(il[i]),t); };

    if(op=="const"){ // (const %x <ty> <literal>)
        if(!arity(4,"(const %x <type> <literal>)")) return false;
        TypeId t=parse_type_node(il[2],r); auto &lit=il[3]->data; bool ok=false;
        if(t==I64) ok=std::holds_alternative<int64_t>(lit);
        else if(t==F64) ok=std::holds_alternative<double>(lit)||std::holds_alternative<int64_t>(lit);
        else if(t==BOOL) ok=std::holds_alternative<bool>(lit);
        else if(t!=kNoType){ error_code(r,*il[2],diag::InvalidOperand,"const supports i64, f64 and bool","use (str ...) or (null ...) for other literals"); t=kNoType; ok=true; }
        if(!ok){ error_code(r,*il[3],diag::TypeMismatch,"literal does not match type "+ctx_.to_string(t)); }
        def(1,t); return false;
    }
    if(op=="null"){ if(!arity(2,"(null %x)")) return false; def(1,ctx_.get_base(BaseType::Null)); return false; }
    if(op=="str"){ // (str %s "text")
        if(!arity(3,"(str %s \"text\")")) return false;
        if(!std::holds_alternative<std::string>(il[2]->data)) error_code(r,*il[2],diag::InvalidOperand,"str expects a string literal");
        def(1,ctx_.get_string()); return false;
    }
    if(op=="string-len"){ if(!arity(3,"(string-len %n %s)")) return false; expect(il[2],"string-len operand",ctx_.get_string(),use_operand(r,il[2],false)); def(1,I64); return false; }
    if(op=="add"||op=="sub"||op=="mul"||op=="sdiv"||op=="srem"||op=="fadd"||op=="fsub"||op=="fmul"||op=="fdiv"){
        if(!arity(5,"(op %dst <type> %a %b)")) return false;
        TypeId want = op[0]=='f' ? F64 : I64;
        TypeId t=parse_type_node(il[2],r); expect(il[2],op+" result",want,t);
        expect(il[3],op+" lhs",want,use_operand(r,il[3],false));
        expect(il[4],op+" rhs",want,use_operand(r,il[4],false));
        def(1,want); return false;
    }
    if(op=="eq"||op=="ne"||op=="lt"||op=="le"||op=="gt"||op=="ge"){
        if(!arity(5,"(op %dst <type> %a %b)")) return false;
        TypeId t=parse_type_node(il[2],r);
        if(t!=kNoType && !ctx_.is_numeric(t) && !(t==BOOL && (op=="eq"||op=="ne"))){ error_code(r,*il[2],diag::InvalidOperand,"comparison operand type must be i64 or f64"); t=kNoType; }
        expect(il[3],op+" lhs",t,use_operand(r,il[3],false));
        expect(il[4],op+" rhs",t,use_operand(r,il[4],false));
        def(1,BOOL); return false;
    }
    if(op=="var"){ // (var %i <ty> %init)
        if(!arity(4,"(var %x <type> %init)")) return false;
        TypeId t=parse_type_node(il[2],r);
        if(t!=kNoType && ctx_.is_heap_owning(t)){ error_code(r,*n,diag::MutableHeapVar,"mutable slot of heap type "+ctx_.to_string(t),"use let; heap values have a single owner"); }
        expect(il[3],"var initializer",t,use_operand(r,il[3],false));
        def(1,t); mutable_.insert(var_name(il[1])); return false;
    }
    if(op=="set"){ // (set %i %v)
        if(!arity(3,"(set %x %value)")) return false;
        std::string dst=var_name(il[1]);
        TypeId t=use_operand(r,il[1],false);
        if(!dst.empty() && t!=kNoType && !mutable_.count(dst)) error_code(r,*il[1],diag::InvalidOperand,"'%"+dst+"' is not a mutable var","declare it with (var ...)");
        expect(il[2],"assigned value",t,use_operand(r,il[2],false));
        return false;
    }
    if(op=="let"){ // (let %b <ty> %a)
        if(!arity(4,"(let %x <type> %src)")) return false;
        TypeId t=parse_type_node(il[2],r);
        expect(il[3],"let source",t,use_operand(r,il[3],true));
        def(1,t); return false;
    }
    if(op=="call"){ // (call %dst <ret> callee %args...)
        if(il.size()<4){ error_code(r,*n,diag::InvalidOperand,"call arity","expected (call %dst <type> callee %args...)"); return false; }
        TypeId t=parse_type_node(il[2],r);
        std::string callee=name_of(il[3]);
        auto fit=functions_.find(callee);
        if(fit==functions_.end()){
            suggest_error(r,*il[3],diag::UnknownFunction,"unknown function '"+callee+"'","declare it in the module",callee,keys_of(functions_));
            for(size_t i=4;i<il.size();++i) use_operand(r,il[i],true);
            if(t!=kNoType && !ctx_.is_void(t)) def(1,kNoType);
            return false;
        }
        auto &fi=fit->second;
        expect(il[2],"call result",fi.ret,t);
        size_t argc=il.size()-4;
        if(argc!=fi.params.size()) error_code(r,*n,diag::CallArity,"call to '"+callee+"' expects "+std::to_string(fi.params.size())+" argument(s), got "+std::to_string(argc));
        for(size_t i=0;i<argc;++i){
            TypeId at=use_operand(r,il[4+i],true); // heap arguments move into the callee
            if(i<fi.params.size()) expect(il[4+i],"argument "+std::to_string(i),fi.params[i].type,at);
        }
        if(ctx_.is_void(fi.ret)) attach(n,fi.ret); else def(1,fi.ret);
        return false;
    }
    if(op=="ret"){ // (ret <ty> %x) | (ret void)
        if(il.size()<2){ error_code(r,*n,diag::InvalidOperand,"ret arity","expected (ret <type> %x) or (ret void)"); return true; }
        TypeId t=parse_type_node(il[1],r);
        expect(il[1],"return",fn_->ret,t);
        if(t!=kNoType && !ctx_.is_void(t)){
            if(il.size()!=3) error_code(r,*n,diag::InvalidOperand,"ret needs a value","(ret "+ctx_.to_string(t)+" %x)");
            else expect(il[2],"return value",t,use_operand(r,il[2],true));
        }
        attach(n,fn_->ret);
        n->metadata["drops"]=encode_drops(tracker_->live_records());
        return true;
    }
    if(op=="panic"){ // (panic "msg")
        if(il.size()!=2 || !std::holds_alternative<std::string>(il[1]->data)) error_code(r,*n,diag::InvalidOperand,"panic expects a message string","(panic \"message\")");
        return true;
    }
    if(op=="print"){ if(!arity(2,"(print %x)")) return false; use_operand(r,il[1],false); return false; }
    if(op=="block"){ // (block :body [ ... ])
        auto body=kw_arg(std::get<list>(n->data),"body");
        if(!body){ error_code(r,*n,diag::InvalidOperand,"block missing :body"); return false; }
        return check_scope(r,body);
    }
    if(op=="if"){ // (if %c [then] [else])
        if(il.size()<3||il.size()>4){ error_code(r,*n,diag::InvalidOperand,"if arity","expected (if %cond [then...] [else...])"); return false; }
        expect(il[1],"if condition",BOOL,use_operand(r,il[1],false));
        if(il.size()==3) il.push_back(node_vec({})); // explicit else arm carries compensation drops
        auto entry=tracker_->snapshot();
        std::vector<ArmResult> arms;
        for(size_t i=2;i<4;++i){
            tracker_->restore(entry);
            bool t=check_scope(r,il[i]);
            arms.push_back(ArmResult{il[i],t,tracker_->moved_since(entry)});
        }
        return merge_arms(entry,arms);
    }
    if(op=="while"){ // (while :cond [ ... ] :test %c :body [ ... ])
        auto &l=std::get<list>(n->data);
        auto cond=kw_arg(l,"cond"); auto test=kw_arg(l,"test"); auto body=kw_arg(l,"body");
        if(!test||!body){ error_code(r,*n,diag::InvalidOperand,"while needs :test and :body","(while :cond [ ... ] :test %c :body [ ... ])"); return false; }
        tracker_->enter_loop();
        tracker_->enter_scope();
        if(cond){
            auto insts=seq_of(cond);
            if(!insts) error_code(r,*cond,diag::InvalidOperand,":cond must be an instruction vector");
            else {
                if(check_instruction_list(r,*insts)) error_code(r,*cond,diag::InvalidOperand,"loop condition cannot terminate the function");
                for(auto &rec: tracker_->live_records()) if(rec.depth==tracker_->depth())
                    error_code(r,*cond,diag::HeapInLoopCondition,"heap value '%"+rec.name+"' created in loop condition","compute it before the loop");
            }
        }
        expect(test,"loop test",BOOL,use_operand(r,test,false));
        check_scope(r,body);
        auto leftover=tracker_->exit_scope();
        if(cond) cond->metadata["scope-drops"]=encode_drops(leftover);
        tracker_->exit_loop();
        return false;
    }
    if(op=="box"){ // (box %v %x)
        if(!arity(3,"(box %v %x)")) return false;
        TypeId t=use_operand(r,il[2],true);
        if(t!=kNoType && !boxable(t)) error_code(r,*il[2],diag::InvalidOperand,"cannot box value of type "+ctx_.to_string(t));
        def(1,VALUE); return false;
    }
    if(op=="unbox"){ // (unbox %x <ty> %v)
        if(!arity(4,"(unbox %x <type> %v)")) return false;
        TypeId t=parse_type_node(il[2],r);
        if(t!=kNoType && !boxable(t)){ error_code(r,*il[2],diag::InvalidOperand,"cannot unbox to type "+ctx_.to_string(t)); t=kNoType; }
        bool consume = t!=kNoType && ctx_.is_heap_owning(t);
        expect(il[3],"unbox source",VALUE,use_operand(r,il[3],consume));
        def(1,t); return false;
    }
    if(op=="list-new"){ if(!arity(2,"(list-new %l)")) return false; def(1,LIST); return false; }
    if(op=="list-with-capacity"){ if(!arity(3,"(list-with-capacity %l %n)")) return false; expect(il[2],"capacity",I64,use_operand(r,il[2],false)); def(1,LIST); return false; }
    if(op=="list-push"){ // (list-push %l %x)
        if(!arity(3,"(list-push %l %x)")) return false;
        // the element moves before the target is read, so (list-push %l %l) is a use after move
        TypeId t=use_operand(r,il[2],true);
        expect(il[1],"list-push target",LIST,use_operand(r,il[1],false));
        if(t!=kNoType && !storable(t)) error_code(r,*il[2],diag::InvalidOperand,"cannot store value of type "+ctx_.to_string(t)+" in a list");
        return false;
    }
    if(op=="list-get"){ // (list-get %x <ty> %l %i)
        if(!arity(5,"(list-get %x <type> %l %i)")) return false;
        TypeId t=parse_type_node(il[2],r);
        if(t!=kNoType && !copy_only(il[2],t,"list element")) t=kNoType;
        expect(il[3],"list-get source",LIST,use_operand(r,il[3],false));
        expect(il[4],"list index",I64,use_operand(r,il[4],false));
        def(1,t); return false;
    }
    if(op=="list-pop"){ // (list-pop %x <ty> %l)
        if(!arity(4,"(list-pop %x <type> %l)")) return false;
        TypeId t=parse_type_node(il[2],r);
        if(t!=kNoType && !storable(t)){ error_code(r,*il[2],diag::InvalidOperand,"cannot pop value of type "+ctx_.to_string(t)); t=kNoType; }
        expect(il[3],"list-pop source",LIST,use_operand(r,il[3],false));
        def(1,t); return false;
    }
    if(op=="list-len"||op=="list-is-empty"){
        if(!arity(3,"(list-len %n %l)")) return false;
        expect(il[2],op+" operand",LIST,use_operand(r,il[2],false));
        def(1,op=="list-len"?I64:BOOL); return false;
    }
    if(op=="tuple-new"){ // (tuple-new %t [ %a %b ])
        if(!arity(3,"(tuple-new %t [ %a ... ])")) return false;
        auto elems=seq_of(il[2]);
        if(!elems || elems->empty()){ error_code(r,*il[2],diag::InvalidOperand,"tuple-new expects a non-empty vector of operands"); def(1,kNoType); return false; }
        std::vector<TypeId> tys; bool ok=true;
        for(auto &e: *elems){
            TypeId t=use_operand(r,e,true);
            if(t==kNoType || !storable(t)){ if(t!=kNoType) error_code(r,*e,diag::InvalidOperand,"cannot store "+ctx_.to_string(t)+" in a tuple"); ok=false; continue; }
            tys.push_back(t);
        }
        def(1, ok ? ctx_.get_tuple(tys) : kNoType); return false;
    }
    if(op=="tuple-get"){ // (tuple-get %x %t <index>)
        if(!arity(4,"(tuple-get %x %t <index>)")) return false;
        TypeId tt=use_operand(r,il[2],false); TypeId t=kNoType;
        auto idx=std::get_if<int64_t>(&il[3]->data);
        if(tt!=kNoType && ctx_.at(tt).kind!=Type::Kind::Tuple) error_code(r,*il[2],diag::TypeMismatch,"tuple-get operand is "+ctx_.to_string(tt)+", not a tuple");
        else if(tt!=kNoType){
            auto &elts=ctx_.at(tt).params;
            if(!idx || *idx<0 || (size_t)*idx>=elts.size()) error_code(r,*il[3],diag::BindIndex,"tuple index out of range for "+ctx_.to_string(tt));
            else { t=elts[(size_t)*idx]; if(!copy_only(il[3],t,"tuple element")) t=kNoType; }
        }
        def(1,t); return false;
    }
    if(op=="struct-new"){ // (struct-new %p P [ (init :name x :value %x) ... ])
        if(!arity(4,"(struct-new %p <Struct> [ (init :name f :value %v) ... ])")) return false;
        std::string sname=name_of(il[2]);
        auto sit=structs_.find(sname);
        auto inits=seq_of(il[3]);
        if(sit==structs_.end()){
            suggest_error(r,*il[2],diag::UndefinedType,"undefined struct type '"+sname+"'","declare (struct :name "+sname+" ...)",sname,keys_of(structs_));
            def(1,kNoType); return false;
        }
        auto &si=sit->second;
        if(!inits){ error_code(r,*il[3],diag::InvalidOperand,"struct-new expects an init vector"); def(1,kNoType); return false; }
        std::unordered_set<std::string> seen;
        for(auto &in: *inits){
            if(head_of(*in)!="init"){ error_code(r,*in,diag::InvalidOperand,"struct init malformed","use (init :name f :value %v)"); continue; }
            auto &inl=std::get<list>(in->data);
            std::string fname=name_of(kw_arg(inl,"name")); auto val=kw_arg(inl,"value");
            if(fname.empty()||!val){ error_code(r,*in,diag::InvalidOperand,"struct init malformed","need :name and :value"); continue; }
            TypeId vt=use_operand(r,val,true);
            auto fit=si.field_index.find(fname);
            if(fit==si.field_index.end()){ suggest_error(r,*in,diag::UndefinedField,"struct "+sname+" has no field '"+fname+"'","check the struct declaration",fname,keys_of(si.field_index)); continue; }
            if(!seen.insert(fname).second){ error_code(r,*in,diag::DuplicateInit,"field '"+fname+"' initialized twice"); continue; }
            auto &fi=si.fields[fit->second];
            if(vt!=kNoType && vt!=fi.type){
                ErrorReporter rep{&r.errors,&r.warnings};
                auto err=rep.make_error(diag::FieldTypeMismatch,"field '"+fname+"' of "+sname+" type mismatch","ensure field has type "+ctx_.to_string(fi.type),line(*in),col(*in));
                err.notes.push_back(TypeNote{"expected: "+ctx_.to_string(fi.type),line(*in),col(*in)});
                err.notes.push_back(TypeNote{"   found: "+ctx_.to_string(vt),line(*in),col(*in)});
                rep.emit_error(err); r.success=false;
            }
            set_meta(in,"field-index",(int64_t)fi.index);
        }
        for(auto &f: si.fields) if(!seen.count(f.name))
            error_code(r,*n,diag::MissingField,"missing field '"+f.name+"' in "+sname+" literal","initialize every field");
        def(1,*ctx_.lookup_named(sname)); return false;
    }
    if(op=="struct-get"){ // (struct-get %v P %p field)
        if(!arity(5,"(struct-get %v <Struct> %p field)")) return false;
        std::string sname=name_of(il[2]);
        auto sit=structs_.find(sname);
        TypeId pt=use_operand(r,il[3],false);
        if(sit==structs_.end()){ suggest_error(r,*il[2],diag::UndefinedType,"undefined struct type '"+sname+"'","declare the struct",sname,keys_of(structs_)); def(1,kNoType); return false; }
        expect(il[3],"struct-get operand",*ctx_.lookup_named(sname),pt);
        std::string fname=name_of(il[4]);
        auto fit=sit->second.field_index.find(fname);
        if(fit==sit->second.field_index.end()){ suggest_error(r,*il[4],diag::UndefinedField,"struct "+sname+" has no field '"+fname+"'","check the struct declaration",fname,keys_of(sit->second.field_index)); def(1,kNoType); return false; }
        auto &fi=sit->second.fields[fit->second];
        set_meta(n,"field-index",(int64_t)fi.index);
        def(1, copy_only(il[4],fi.type,"field '"+fname+"'") ? fi.type : kNoType); return false;
    }
    if(op=="struct-unpack"){ // (struct-unpack P %p [ (bind %x field) ... ])
        if(!arity(4,"(struct-unpack <Struct> %p [ (bind %x field) ... ])")) return false;
        std::string sname=name_of(il[1]);
        auto sit=structs_.find(sname);
        TypeId pt=use_operand(r,il[2],true);
        auto binds=seq_of(il[3]);
        if(sit==structs_.end()) suggest_error(r,*il[1],diag::UndefinedType,"undefined struct type '"+sname+"'","declare the struct",sname,keys_of(structs_));
        else expect(il[2],"struct-unpack operand",*ctx_.lookup_named(sname),pt);
        if(!binds){ error_code(r,*il[3],diag::InvalidOperand,"struct-unpack expects a bind vector"); return false; }
        std::unordered_set<std::string> seen;
        for(auto &b: *binds){
            auto bl=as_list(*b);
            if(head_of(*b)!="bind" || bl->elems.size()!=3){ error_code(r,*b,diag::InvalidOperand,"bind malformed","use (bind %x <field>)"); continue; }
            TypeId ft=kNoType;
            std::string fname=name_of(bl->elems[2]);
            if(sit!=structs_.end()){
                auto fit=sit->second.field_index.find(fname);
                if(fit==sit->second.field_index.end()) suggest_error(r,*b,diag::UndefinedField,"struct "+sname+" has no field '"+fname+"'","check the struct declaration",fname,keys_of(sit->second.field_index));
                else if(!seen.insert(fname).second) error_code(r,*b,diag::DuplicateInit,"field '"+fname+"' bound twice");
                else { auto &fi=sit->second.fields[fit->second]; ft=fi.type; set_meta(b,"field-index",(int64_t)fi.index); }
            }
            attach(b,ft==kNoType?0:ft);
            declare(r,bl->elems[1],var_name(bl->elems[1]),ft);
        }
        return false;
    }
    if(op=="tuple-unpack"){ // (tuple-unpack %t [ (bind %x 0) ... ])
        if(!arity(3,"(tuple-unpack %t [ (bind %x <index>) ... ])")) return false;
        TypeId tt=use_operand(r,il[1],true);
        auto binds=seq_of(il[2]);
        const std::vector<TypeId>* elts=nullptr;
        if(tt!=kNoType && ctx_.at(tt).kind!=Type::Kind::Tuple) error_code(r,*il[1],diag::TypeMismatch,"tuple-unpack operand is "+ctx_.to_string(tt)+", not a tuple");
        else if(tt!=kNoType) elts=&ctx_.at(tt).params;
        if(!binds){ error_code(r,*il[2],diag::InvalidOperand,"tuple-unpack expects a bind vector"); return false; }
        std::unordered_set<int64_t> seen;
        for(auto &b: *binds){
            auto bl=as_list(*b);
            if(head_of(*b)!="bind" || bl->elems.size()!=3){ error_code(r,*b,diag::InvalidOperand,"bind malformed","use (bind %x <index>)"); continue; }
            TypeId et=kNoType;
            auto idx=std::get_if<int64_t>(&bl->elems[2]->data);
            if(elts){
                if(!idx || *idx<0 || (size_t)*idx>=elts->size()) error_code(r,*b,diag::BindIndex,"tuple index out of range for "+ctx_.to_string(tt));
                else if(!seen.insert(*idx).second) error_code(r,*b,diag::DuplicateInit,"tuple element "+std::to_string(*idx)+" bound twice");
                else et=(*elts)[(size_t)*idx];
            }
            attach(b,et==kNoType?0:et);
            declare(r,bl->elems[1],var_name(bl->elems[1]),et);
        }
        return false;
    }
    if(op=="enum-new"){ // (enum-new %c Color RGB [ %r %g %b ])
        if(il.size()<4||il.size()>5){ error_code(r,*n,diag::InvalidOperand,"enum-new arity","expected (enum-new %c <Enum> <Variant> [ %args... ])"); return false; }
        std::string ename=name_of(il[2]), vname=name_of(il[3]);
        auto eit=enums_.find(ename);
        const std::vector<node_ptr> none; auto args=il.size()==5 ? seq_of(il[4]) : &none;
        if(!args){ error_code(r,*il[4],diag::InvalidOperand,"enum-new arguments must be a vector"); args=&none; }
        if(eit==enums_.end()){
            suggest_error(r,*il[2],diag::UndefinedType,"undefined enum type '"+ename+"'","declare (enum :name "+ename+" ...)",ename,keys_of(enums_));
            def(1,kNoType); return false;
        }
        TypeId et=*ctx_.lookup_named(ename);
        auto vit=eit->second.variant_index.find(vname);
        if(vit==eit->second.variant_index.end()){
            suggest_error(r,*il[3],diag::UndefinedVariant,"enum "+ename+" has no variant '"+vname+"'","use one of the declared variants",vname,keys_of(eit->second.variant_index));
            for(auto &a: *args) use_operand(r,a,true);
            def(1,et); return false;
        }
        auto &vi=eit->second.variants[vit->second];
        if(args->size()!=vi.fields.size()){
            ErrorReporter rep{&r.errors,&r.warnings};
            auto err=rep.make_error(diag::ArityMismatch,ename+"::"+vname+" takes "+std::to_string(vi.fields.size())+" field(s) but "+std::to_string(args->size())+" were supplied","match the variant declaration",line(*n),col(*n));
            err.notes.push_back(TypeNote{"expected: "+std::to_string(vi.fields.size()),line(*n),col(*n)});
            err.notes.push_back(TypeNote{"   found: "+std::to_string(args->size()),line(*n),col(*n)});
            rep.emit_error(err); r.success=false;
        }
        for(size_t i=0;i<args->size();++i){
            TypeId at=use_operand(r,(*args)[i],true);
            if(i<vi.fields.size()) expect((*args)[i],ename+"::"+vname+" field "+std::to_string(i),vi.fields[i],at);
        }
        set_meta(n,"discriminant",vi.discriminant);
        def(1,et); return false;
    }
    if(op=="match"){ // (match Color %c :cases [ (case V :binds [ (bind %x 0) ] :body [ ... ]) ] :default [ ... ])
        if(il.size()<5){ error_code(r,*n,diag::InvalidOperand,"match arity","expected (match <Enum> %v :cases [ ... ] [:default [ ... ]])"); return false; }
        auto &l=std::get<list>(n->data);
        std::string ename=name_of(il[1]);
        auto eit=enums_.find(ename);
        if(eit==enums_.end()){ suggest_error(r,*il[1],diag::UndefinedType,"undefined enum type '"+ename+"'","declare the enum",ename,keys_of(enums_)); return false; }
        auto &ei=eit->second;
        TypeId et=*ctx_.lookup_named(ename);
        expect(il[2],"match scrutinee",et,use_operand(r,il[2],false));
        auto cases=seq_of(kw_arg(l,"cases"));
        auto dflt=kw_arg(l,"default");
        if(!cases){ error_code(r,*n,diag::InvalidOperand,"match missing :cases vector"); return false; }
        attach(n,et);
        auto entry=tracker_->snapshot();
        std::vector<ArmResult> arms;
        std::unordered_set<std::string> covered;
        for(auto &c: *cases){
            if(head_of(*c)!="case"){ error_code(r,*c,diag::InvalidOperand,"match case malformed","use (case Variant :binds [ ... ] :body [ ... ])"); continue; }
            auto &cl=std::get<list>(c->data);
            std::string vname=cl.elems.size()>1 ? name_of(cl.elems[1]) : std::string{};
            auto vit=ei.variant_index.find(vname);
            if(vit==ei.variant_index.end()){ suggest_error(r,*c,diag::UndefinedVariant,"enum "+ename+" has no variant '"+vname+"'","use one of the declared variants",vname,keys_of(ei.variant_index)); continue; }
            if(!covered.insert(vname).second){ error_code(r,*c,diag::DuplicateCase,"duplicate case for "+ename+"::"+vname,"remove the repeated case"); continue; }
            auto &vi=ei.variants[vit->second];
            set_meta(c,"discriminant",vi.discriminant);
            auto body=kw_arg(cl,"body");
            if(!body){ error_code(r,*c,diag::InvalidOperand,"case missing :body"); continue; }
            std::vector<std::pair<node_ptr,TypeId>> binds;
            bool consumes=false;
            if(auto bs=seq_of(kw_arg(cl,"binds"))){
                for(auto &b: *bs){
                    auto bl=as_list(*b);
                    if(head_of(*b)!="bind" || bl->elems.size()!=3){ error_code(r,*b,diag::InvalidOperand,"bind malformed","use (bind %x <field-index>)"); continue; }
                    auto idx=std::get_if<int64_t>(&bl->elems[2]->data);
                    if(!idx || *idx<0 || (size_t)*idx>=vi.fields.size()){ error_code(r,*b,diag::BindIndex,"bind index out of range for "+ename+"::"+vname+" ("+std::to_string(vi.fields.size())+" field(s))"); continue; }
                    TypeId ft=vi.fields[(size_t)*idx];
                    if(ctx_.is_heap_owning(ft)) consumes=true;
                    binds.emplace_back(b,ft);
                }
            }
            tracker_->restore(entry);
            // binding a heap field moves it out of the scrutinee; the arm owns the fields and frees the shell
            if(consumes){ use_operand(r,il[2],true); set_meta(c,"consumes",1); }
            bool t=check_scope(r,body,[&]{ for(auto &bt: binds){ auto &bl=std::get<list>(bt.first->data).elems; attach(bt.first,bt.second==kNoType?0:bt.second); declare(r,bl[1],var_name(bl[1]),bt.second); } });
            arms.push_back(ArmResult{body,t,tracker_->moved_since(entry)});
        }
        if(dflt){
            tracker_->restore(entry);
            bool t=check_scope(r,dflt);
            arms.push_back(ArmResult{dflt,t,tracker_->moved_since(entry)});
        } else if(covered.size()<ei.variants.size()){
            ErrorReporter rep{&r.errors,&r.warnings};
            auto err=rep.make_error(diag::NonExhaustiveMatch,"non-exhaustive match on "+ename,"add the missing cases or a :default arm",line(*n),col(*n));
            for(auto &v: ei.variants) if(!covered.count(v.name)) err.notes.push_back(TypeNote{"missing: "+ename+"::"+v.name,line(*n),col(*n)});
            rep.emit_error(err); r.success=false;
        }
        if(arms.empty()){ tracker_->restore(entry); return false; }
        return merge_arms(entry,arms);
    }
    error_code(r,*n,"EGEN","unknown instruction '"+op+"'");
    return false;
}

TypeCheckResult TypeChecker::check_module(const node_ptr& m){
    TypeCheckResult res{true,{},{}};
    if(!m || head_of(*m)!="module"){ res.success=false; res.errors.push_back(TypeError{"EMOD1","expected (module ...)","start file with (module ...)",-1,-1,{}}); return res; }
    reset();
    auto &l=std::get<list>(m->data).elems;
    collect_types(res,l);
    collect_structs(res,l);
    collect_enums(res,l);
    collect_functions_headers(res,l);
    check_functions(res,l);
    res.success = res.errors.empty();
    return res;
}

} // namespace tagc
