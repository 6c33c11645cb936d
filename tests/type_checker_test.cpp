#include <cassert>
#include <iostream>
#include <algorithm>
#include <gtest/gtest.h>
#include "tagc/sexpr.hpp"
#include "tagc/type_check.hpp"

using namespace tagc;

namespace {

const char* COLOR = R"((enum :name Color :variants [ (variant :name Red) (variant :name Green) (variant :name Blue) (variant :name RGB :fields [ i64 i64 i64 ]) ]))";
const char* POINT = R"((struct :name Point :fields [ (field :name x :type i64) (field :name y :type i64) ]))";

std::string module_with(const std::string& body, const std::string& decls = ""){
    return "(module " + decls + " (fn :name \"main\" :ret void :params [ ] :body [ " + body + " ]))";
}

TypeCheckResult check(const std::string& src){ TypeContext ctx; TypeChecker tc(ctx); return tc.check_module(parse(src)); }
TypeCheckResult check(const std::string& src, node_ptr& ast){ ast = parse(src); TypeContext ctx; TypeChecker tc(ctx); return tc.check_module(ast); }

bool has_code(const TypeCheckResult& r, const std::string& code){
    return std::any_of(r.errors.begin(), r.errors.end(), [&](const TypeError& e){ return e.code==code; });
}
void dump(const TypeCheckResult& r){ for(auto &e: r.errors) std::cerr << e.code << " " << e.message << "\n"; }

void ok(const std::string& src){ auto r=check(src); if(!r.success) dump(r); assert(r.success); }
void err(const std::string& src, const std::string& code){ auto r=check(src); if(!has_code(r,code)){ std::cerr<<"Expected code "<<code<<" not found. Errors:\n"; dump(r); } assert(!r.success && has_code(r,code)); }

std::vector<std::string> drop_names(const node& n, const std::string& key){ std::vector<std::string> out; for(auto &d: decode_drops(n,key)) out.push_back(d.name); return out; }

} // namespace

void run_type_checker_tests(){
    std::cout << "[check] use after move...\n";
    err(module_with("(list-new %a) (let %b list %a) (list-len %n %a)"), diag::UseAfterMove);
    ok(module_with("(list-new %a) (let %b list %a) (list-len %n %b)"));
    std::cout << "[check] copy types are never moved...\n";
    ok(module_with("(const %a i64 1) (let %b i64 %a) (add %c i64 %a %b)"));
    std::cout << "[check] enum arity...\n";
    err(module_with("(const %r i64 255) (const %g i64 0) (enum-new %c Color RGB [ %r %g ])", COLOR), diag::ArityMismatch);
    std::cout << "[check] undefined enum and variant...\n";
    err(module_with("(enum-new %c Colour Red [ ])", COLOR), diag::UndefinedType);
    err(module_with("(enum-new %c Color Purple [ ])", COLOR), diag::UndefinedVariant);
    std::cout << "[check] struct literal fields...\n";
    err(module_with("(const %x i64 1) (struct-new %p Point [ (init :name x :value %x) ])", POINT), diag::MissingField);
    err(module_with("(const %x i64 1) (const %z i64 2) (struct-new %p Point [ (init :name x :value %x) (init :name z :value %z) ])", POINT), diag::UndefinedField);
    std::cout << "[check] variables...\n";
    err(module_with("(print %nope)"), diag::UndefinedVariable);
    err(module_with("(const %a i64 1) (const %a i64 2)"), diag::Redefinition);
    std::cout << "[check] type checker tests passed\n";
}

TEST(TypeChecker, DiagnosticsAreCollectedInOnePass){
    auto r = check(module_with(
        "(const %r i64 1) (enum-new %c Color RGB [ %r ]) (enum-new %d Colour Red [ ]) (enum-new %e Color Pink [ ]) (const %x i64 1) (struct-new %p Point [ (init :name x :value %x) (init :name w :value %x) ])",
        std::string(COLOR) + POINT));
    EXPECT_FALSE(r.success);
    EXPECT_TRUE(has_code(r, diag::ArityMismatch));
    EXPECT_TRUE(has_code(r, diag::UndefinedType));
    EXPECT_TRUE(has_code(r, diag::UndefinedVariant));
    EXPECT_TRUE(has_code(r, diag::UndefinedField));
    EXPECT_TRUE(has_code(r, diag::MissingField));
}

TEST(TypeChecker, ArityMismatchCarriesExpectedAndFound){
    auto r = check(module_with("(const %r i64 255) (const %g i64 0) (enum-new %c Color RGB [ %r %g ])", COLOR));
    ASSERT_EQ(r.errors.size(), 1u);
    EXPECT_EQ(r.errors[0].message, "Color::RGB takes 3 field(s) but 2 were supplied");
    ASSERT_EQ(r.errors[0].notes.size(), 2u);
    EXPECT_EQ(r.errors[0].notes[0].message, "expected: 3");
}

TEST(TypeChecker, UndefinedTypeSuggestsCloseName){
    auto r = check(module_with("(enum-new %c Colr Red [ ])", COLOR));
    ASSERT_FALSE(r.errors.empty());
    std::string all = r.errors[0].hint;
    for(auto &n: r.errors[0].notes) all += n.message;
    EXPECT_NE(all.find("Color"), std::string::npos);
}

TEST(TypeChecker, MatchMustBeExhaustiveWithoutDefault){
    auto r = check(module_with("(enum-new %c Color Red [ ]) (match Color %c :cases [ (case Red :body [ ]) (case Green :body [ ]) ])", COLOR));
    EXPECT_TRUE(has_code(r, diag::NonExhaustiveMatch));
    ok(module_with("(enum-new %c Color Red [ ]) (match Color %c :cases [ (case Red :body [ ]) ] :default [ ])", COLOR));
}

TEST(TypeChecker, MatchCaseChecks){
    EXPECT_TRUE(has_code(check(module_with("(enum-new %c Color Red [ ]) (match Color %c :cases [ (case Red :body [ ]) (case Red :body [ ]) ] :default [ ])", COLOR)), diag::DuplicateCase));
    EXPECT_TRUE(has_code(check(module_with("(enum-new %c Color Red [ ]) (match Color %c :cases [ (case RGB :binds [ (bind %b 3) ] :body [ ]) ] :default [ ])", COLOR)), diag::BindIndex));
    EXPECT_TRUE(has_code(check(module_with("(enum-new %c Color Red [ ]) (match Color %c :cases [ (case Mauve :body [ ]) ] :default [ ])", COLOR)), diag::UndefinedVariant));
}

TEST(TypeChecker, LoopRules){
    EXPECT_TRUE(has_code(check(module_with("(str %s \"x\") (const %t bool false) (while :cond [ ] :test %t :body [ (let %u string %s) ])")), diag::MoveInLoop));
    EXPECT_TRUE(has_code(check(module_with("(while :cond [ (str %s \"x\") (const %t bool false) ] :test %t :body [ ])")), diag::HeapInLoopCondition));
    ok(module_with("(const %zero i64 0) (var %i i64 %zero) (const %one i64 1) (const %ten i64 10) "
                   "(while :cond [ (lt %c i64 %i %ten) ] :test %c :body [ (add %n i64 %i %one) (set %i %n) (str %tmp \"t\") ])"));
}

TEST(TypeChecker, HeapValuesAreMovedNotCopied){
    EXPECT_TRUE(has_code(check(module_with("(list-new %l) (const %i i64 0) (list-get %x string %l %i)")), diag::HeapCopyOut));
    EXPECT_TRUE(has_code(check(module_with("(str %s \"a\") (var %v string %s)")), diag::MutableHeapVar));
    ok(module_with("(list-new %l) (str %s \"a\") (list-push %l %s) (list-pop %t string %l) (print %t)"));
}

TEST(TypeChecker, UnreachableCodeIsAWarning){
    auto r = check(module_with("(ret void) (const %x i64 1)"));
    EXPECT_TRUE(r.success);
    ASSERT_EQ(r.warnings.size(), 1u);
    EXPECT_EQ(r.warnings[0].code, diag::UnreachableCode);
}

TEST(TypeChecker, NonVoidFunctionMustReturn){
    EXPECT_TRUE(has_code(check("(module (fn :name \"f\" :ret i64 :params [ ] :body [ (const %x i64 1) ]))"), diag::MissingReturn));
}

TEST(TypeChecker, CallsMoveHeapArguments){
    const char* src = R"((module
      (fn :name "consume" :ret void :params [ (param list %xs) ] :body [ ])
      (fn :name "main" :ret void :params [ ] :body [ (list-new %l) (call %u void consume %l) (list-len %n %l) ])))";
    EXPECT_TRUE(has_code(check(src), diag::UseAfterMove));
    EXPECT_TRUE(has_code(check("(module (fn :name \"main\" :ret void :params [ ] :body [ (call %u void nope) ]))"), diag::UnknownFunction));
}

TEST(TypeChecker, ScopeDropsAreReverseDeclarationOrder){
    node_ptr ast;
    auto r = check(module_with("(str %a \"A\") (str %b \"B\") (str %c \"C\") (const %n i64 1)"), ast);
    ASSERT_TRUE(r.success);
    auto &fn = std::get<list>(ast->data).elems[1];
    auto body = kw_arg(std::get<list>(fn->data), "body");
    EXPECT_EQ(drop_names(*body, "scope-drops"), (std::vector<std::string>{"c","b","a"}));
}

TEST(TypeChecker, ParametersAreLiveAtEntry){
    node_ptr ast;
    auto r = check("(module (fn :name \"f\" :ret void :params [ (param list %xs) (param i64 %k) ] :body [ (list-len %n %xs) ]))", ast);
    ASSERT_TRUE(r.success);
    auto body = kw_arg(std::get<list>(std::get<list>(ast->data).elems[1]->data), "body");
    EXPECT_EQ(drop_names(*body, "scope-drops"), std::vector<std::string>{"xs"});
}

TEST(TypeChecker, ReturnDropsEverythingButTheResult){
    node_ptr ast;
    auto r = check("(module (fn :name \"f\" :ret string :params [ ] :body [ (str %a \"A\") (block :body [ (str %b \"B\") (str %r \"R\") (ret string %r) ]) ]))", ast);
    ASSERT_TRUE(r.success);
    auto body = kw_arg(std::get<list>(std::get<list>(ast->data).elems[1]->data), "body");
    auto block = std::get<vector_t>(body->data).elems[1];
    auto ret = std::get<vector_t>(kw_arg(std::get<list>(block->data), "body")->data).elems[2];
    EXPECT_EQ(drop_names(*ret, "drops"), (std::vector<std::string>{"b","a"}));
}

TEST(TypeChecker, BranchMergeCompensatesTheArmThatKeptTheValue){
    node_ptr ast;
    auto r = check(module_with("(str %s \"x\") (const %c bool true) (if %c [ (let %t string %s) ])"), ast);
    ASSERT_TRUE(r.success);
    auto body = kw_arg(std::get<list>(std::get<list>(ast->data).elems[1]->data), "body");
    auto ifn = std::get<vector_t>(body->data).elems[2];
    auto &il = std::get<list>(ifn->data).elems;
    ASSERT_EQ(il.size(), 4u); // synthesized else arm
    EXPECT_EQ(drop_names(*il[2], "scope-drops"), std::vector<std::string>{"t"});
    EXPECT_EQ(drop_names(*il[3], "scope-drops"), std::vector<std::string>{"s"});
    EXPECT_TRUE(drop_names(*body, "scope-drops").empty());
    // after the merge the value counts as moved
    EXPECT_TRUE(has_code(check(module_with("(str %s \"x\") (const %c bool true) (if %c [ (let %t string %s) ]) (print %s)")), diag::UseAfterMove));
}

TEST(TypeChecker, TerminatingArmDoesNotPoisonTheOther){
    ok(module_with("(str %s \"x\") (const %c bool true) (if %c [ (let %t string %s) (ret void) ] [ ]) (print %s)"));
}

TEST(TypeChecker, PushingAListIntoItselfIsAUseAfterMove){
    EXPECT_TRUE(has_code(check(module_with("(list-new %l) (list-push %l %l)")), diag::UseAfterMove));
    ok(module_with("(list-new %l) (list-new %m) (list-push %l %m)"));
}

namespace {
const char* MSG = R"((enum :name Msg :variants [ (variant :name Quit) (variant :name Text :fields [ string i64 ]) ]))";
const char* PERSON = R"((struct :name Person :fields [ (field :name name :type string) (field :name age :type i64) ]))";
}

TEST(TypeChecker, HeapFieldBindMovesTheScrutinee){
    node_ptr ast;
    auto r = check(module_with(
        "(str %s \"hi\") (const %n i64 1) (enum-new %m Msg Text [ %s %n ]) "
        "(match Msg %m :cases [ (case Text :binds [ (bind %t 0) (bind %k 1) ] :body [ (print %t) ]) ] :default [ ])", MSG), ast);
    if(!r.success) dump(r);
    ASSERT_TRUE(r.success);
    auto body = kw_arg(std::get<list>(std::get<list>(ast->data).elems[1]->data), "body");
    auto match = std::get<vector_t>(body->data).elems[3];
    auto cases = std::get<vector_t>(kw_arg(std::get<list>(match->data), "cases")->data).elems;
    EXPECT_EQ(cases[0]->metadata.count("consumes"), 1u);
    auto arm = kw_arg(std::get<list>(cases[0]->data), "body");
    EXPECT_EQ(drop_names(*arm, "scope-drops"), std::vector<std::string>{"t"});
    // the default arm kept the enum, so it frees it; nothing is left for the function scope
    auto dflt = kw_arg(std::get<list>(match->data), "default");
    EXPECT_EQ(drop_names(*dflt, "scope-drops"), std::vector<std::string>{"m"});
    EXPECT_TRUE(drop_names(*body, "scope-drops").empty());

    EXPECT_TRUE(has_code(check(module_with(
        "(str %s \"hi\") (const %n i64 1) (enum-new %m Msg Text [ %s %n ]) "
        "(match Msg %m :cases [ (case Text :binds [ (bind %t 0) ] :body [ ]) ] :default [ ]) (print %m)", MSG)), diag::UseAfterMove));
    // copy binds leave the scrutinee in place
    ok(module_with(
        "(str %s \"hi\") (const %n i64 1) (enum-new %m Msg Text [ %s %n ]) "
        "(match Msg %m :cases [ (case Text :binds [ (bind %k 1) ] :body [ ]) ] :default [ ]) (print %m)", MSG));
}

TEST(TypeChecker, UnpackMovesRecordsApart){
    ok(module_with("(str %s \"ann\") (const %a i64 40) (struct-new %p Person [ (init :name name :value %s) (init :name age :value %a) ]) "
                   "(struct-unpack Person %p [ (bind %nm name) ]) (print %nm)", PERSON));
    ok(module_with("(str %s \"x\") (const %a i64 1) (tuple-new %t [ %s %a ]) (tuple-unpack %t [ (bind %x 0) (bind %y 1) ]) (print %x)"));
    EXPECT_TRUE(has_code(check(module_with("(str %s \"ann\") (const %a i64 40) (struct-new %p Person [ (init :name name :value %s) (init :name age :value %a) ]) "
                                           "(struct-unpack Person %p [ (bind %nm name) ]) (struct-get %x Person %p age)", PERSON)), diag::UseAfterMove));
    EXPECT_TRUE(has_code(check(module_with("(str %s \"ann\") (const %a i64 40) (struct-new %p Person [ (init :name name :value %s) (init :name age :value %a) ]) "
                                           "(struct-unpack Person %p [ (bind %x name) (bind %y name) ])", PERSON)), diag::DuplicateInit));
    EXPECT_TRUE(has_code(check(module_with("(str %s \"ann\") (const %a i64 40) (struct-new %p Person [ (init :name name :value %s) (init :name age :value %a) ]) "
                                           "(struct-unpack Person %p [ (bind %x nickname) ])", PERSON)), diag::UndefinedField));
    EXPECT_TRUE(has_code(check(module_with("(const %a i64 1) (tuple-new %t [ %a ]) (tuple-unpack %t [ (bind %x 3) ])")), diag::BindIndex));
    // reading a heap field in place is still rejected
    EXPECT_TRUE(has_code(check(module_with("(str %s \"ann\") (const %a i64 40) (struct-new %p Person [ (init :name name :value %s) (init :name age :value %a) ]) "
                                           "(struct-get %x Person %p name)", PERSON)), diag::HeapCopyOut));
}
