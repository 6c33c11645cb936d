#pragma once

#include <string>
#include <unordered_map>
#include <vector>

#include "tagc/sexpr.hpp"
#include "tagc/type_check.hpp"

namespace tagc::ir::collect {

struct Layouts {
    std::unordered_map<std::string, StructInfo> structs;
    std::unordered_map<std::string, EnumInfo> enums;
};

// Prepass over the annotated module: field order of every struct and the variant table of
// every enum (discriminant = declaration index). Type names must already be interned in
// `tctx` by the checker. Throws codegen_error on a malformed declaration.
Layouts run(const std::vector<tagc::node_ptr>& top, tagc::TypeContext& tctx);

} // namespace tagc::ir::collect
