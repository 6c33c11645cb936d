// Semantic analysis: type resolution, enum/struct validation and ownership tracking.
#pragma once
#include "tagc/sexpr.hpp"
#include "tagc/types.hpp"
#include "tagc/ownership.hpp"
#include "tagc/diagnostic_codes.hpp"
#include <string>
#include <vector>
#include <unordered_map>
#include <unordered_set>
#include <functional>

namespace tagc {

struct TypeNote { std::string message; int line=-1; int col=-1; };
struct TypeError { std::string code; std::string message; std::string hint; int line=-1; int col=-1; std::vector<TypeNote> notes; };
struct TypeWarning { std::string code; std::string message; std::string hint; int line=-1; int col=-1; std::vector<TypeNote> notes; };

struct ErrorReporter {
    std::vector<TypeError>* errors=nullptr;
    std::vector<TypeWarning>* warnings=nullptr;
    void emit_error(const TypeError& e){ if(errors) errors->push_back(e); }
    void emit_warning(const TypeWarning& w){ if(warnings) warnings->push_back(w); }
    TypeError make_error(std::string code, std::string message, std::string hint, int line, int col){ return TypeError{std::move(code),std::move(message),std::move(hint),line,col,{}}; }
    TypeWarning make_warning(std::string code, std::string message, std::string hint, int line, int col){ return TypeWarning{std::move(code),std::move(message),std::move(hint),line,col,{}}; }
};

struct TypeCheckResult { bool success; std::vector<TypeError> errors; std::vector<TypeWarning> warnings; };

struct FieldInfo { std::string name; TypeId type; size_t index; };
struct StructInfo { std::string name; std::vector<FieldInfo> fields; std::unordered_map<std::string,size_t> field_index; };
struct VariantInfo { std::string name; int32_t discriminant; std::vector<TypeId> fields; };
struct EnumInfo { std::string name; std::vector<VariantInfo> variants; std::unordered_map<std::string,size_t> variant_index; };
struct ParamInfoTC { std::string name; TypeId type; };
struct FunctionInfoTC { std::string name; TypeId ret; std::vector<ParamInfoTC> params; bool external=false; };

// Checks a (module ...) form. On success every instruction node carries "type-id" metadata and
// every scope vector, `ret` and branch arm carries the destruction obligations the tracker computed.
class TypeChecker {
public:
    explicit TypeChecker(TypeContext& ctx): ctx_(ctx){}
    TypeCheckResult check_module(const node_ptr& module_ast);

    const std::unordered_map<std::string, StructInfo>& structs() const { return structs_; }
    const std::unordered_map<std::string, EnumInfo>& enums() const { return enums_; }
    const std::unordered_map<std::string, FunctionInfoTC>& functions() const { return functions_; }

private:
    TypeContext& ctx_;
    void error_code(TypeCheckResult& r, const node& n, std::string code, std::string msg, std::string hint="");
    void warn_code(TypeCheckResult& r, const node& n, std::string code, std::string msg, std::string hint="");
    void type_mismatch(TypeCheckResult& r, const node& n, const std::string& role, TypeId expected, TypeId actual);

    std::unordered_map<std::string, StructInfo> structs_;
    std::unordered_map<std::string, EnumInfo> enums_;
    std::unordered_map<std::string, FunctionInfoTC> functions_;
    std::unordered_map<std::string, node_ptr> type_decls_; // struct and enum declarations by name

    // per-function state
    std::unordered_set<std::string> defined_;   // every name defined so far in the function
    std::unordered_set<std::string> mutable_;   // `var` slots
    std::unordered_set<std::string> poisoned_;  // defined with an unresolvable type; uses stay silent
    OwnershipTracker* tracker_=nullptr;
    const FunctionInfoTC* fn_=nullptr;

    void reset();
    void collect_types(TypeCheckResult& r, const std::vector<node_ptr>& elems);
    void collect_structs(TypeCheckResult& r, const std::vector<node_ptr>& elems);
    void collect_enums(TypeCheckResult& r, const std::vector<node_ptr>& elems);
    void collect_functions_headers(TypeCheckResult& r, const std::vector<node_ptr>& elems);
    void check_functions(TypeCheckResult& r, const std::vector<node_ptr>& elems);
    bool parse_function_header(TypeCheckResult& r, const node_ptr& fn_list, FunctionInfoTC& out_fn);
    void check_function_body(TypeCheckResult& r, const node_ptr& fn_node, const FunctionInfoTC& fn_info);
    TypeId parse_type_node(const node_ptr& n, TypeCheckResult& r);

    // Returns true when the list ends in a terminator (ret / panic) on every path.
    bool check_instruction_list(TypeCheckResult& r, const std::vector<node_ptr>& insts);
    bool check_instruction(TypeCheckResult& r, const node_ptr& inst);
    // Checks a nested scope vector and annotates it with its scope-exit drops.
    bool check_scope(TypeCheckResult& r, const node_ptr& vec, const std::function<void()>& prologue = {});
    struct ArmResult { node_ptr scope; bool terminated; std::vector<OwnershipRecord> moved; };
    // Joins branch arms analysed from the same entry state; returns true if every arm terminates.
    bool merge_arms(const OwnershipTracker::State& entry, std::vector<ArmResult>& arms);

    // operand helpers: look the name up, report UndefinedVariable / UseAfterMove
    TypeId use_operand(TypeCheckResult& r, const node_ptr& operand, bool consume);
    void declare(TypeCheckResult& r, const node_ptr& dst_node, const std::string& dst, TypeId t);
    void report_access(TypeCheckResult& r, const node& at, const std::string& name, Access a);

    int edit_distance(const std::string& a, const std::string& b);
    std::vector<std::string> fuzzy_candidates(const std::string& target, const std::vector<std::string>& pool, int maxDist=2);
    void append_suggestions(TypeError& err, const std::vector<std::string>& suggs);
    void suggest_error(TypeCheckResult& r, const node& n, const std::string& code, const std::string& msg, const std::string& hint, const std::string& target, const std::vector<std::string>& pool);
};

} // namespace tagc
