#include "tagc/ir/collect.hpp"
#include "tagc/ir/builder.hpp"

namespace tagc::ir::collect {

static const std::vector<tagc::node_ptr>& elems_of(const tagc::node_ptr& n, const std::string& what){
    if(n) if(auto v = tagc::as_vector(*n)) return v->elems;
    throw codegen_error(what + " must be a vector");
}

static TypeId resolve(tagc::TypeContext& tctx, const tagc::node_ptr& n){
    try { return tctx.parse_type(n); }
    catch(const type_error& e){ throw codegen_error(std::string("layout: ") + e.what()); }
}

Layouts run(const std::vector<tagc::node_ptr>& top, tagc::TypeContext& tctx){
    Layouts out;
    for(auto& n : top){
        if(!n || !tagc::is_list(*n)) continue;
        std::string head = tagc::head_of(*n);
        if(head != "struct" && head != "enum") continue;
        auto& l = std::get<tagc::list>(n->data);
        std::string name = tagc::name_of(tagc::kw_arg(l, "name"));
        if(name.empty()) throw codegen_error(head + " declaration without :name");

        if(head == "struct"){
            StructInfo info; info.name = name;
            for(auto& f : elems_of(tagc::kw_arg(l, "fields"), "struct " + name + " :fields")){
                auto& fl = std::get<tagc::list>(f->data);
                std::string fname = tagc::name_of(tagc::kw_arg(fl, "name"));
                info.field_index[fname] = info.fields.size();
                info.fields.push_back(FieldInfo{fname, resolve(tctx, tagc::kw_arg(fl, "type")), info.fields.size()});
            }
            out.structs[name] = std::move(info);
            continue;
        }

        EnumInfo info; info.name = name;
        for(auto& v : elems_of(tagc::kw_arg(l, "variants"), "enum " + name + " :variants")){
            auto& vl = std::get<tagc::list>(v->data);
            VariantInfo vi;
            vi.name = tagc::name_of(tagc::kw_arg(vl, "name"));
            vi.discriminant = (int32_t)info.variants.size();
            if(auto fs = tagc::kw_arg(vl, "fields"))
                for(auto& ft : elems_of(fs, name + "::" + vi.name + " :fields")) vi.fields.push_back(resolve(tctx, ft));
            info.variant_index[vi.name] = info.variants.size();
            info.variants.push_back(std::move(vi));
        }
        out.enums[name] = std::move(info);
    }
    return out;
}

} // namespace tagc::ir::collect
