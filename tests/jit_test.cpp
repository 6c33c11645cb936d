#include <cassert>
#include <cmath>
#include <cstring>
#include <iostream>
#include <limits>
#include <string>
#include <vector>
#include <gtest/gtest.h>
#include "jit_util.hpp"
#include "tagc/runtime/runtime.h"

using namespace tagc;
using tagc::test::jit_compile;
using tagc::test::lookup;
using tagc::test::run_main;

namespace {

const char* COLOR = R"((enum :name Color :variants [ (variant :name Red) (variant :name Green) (variant :name Blue) (variant :name RGB :fields [ i64 i64 i64 ]) ]))";
const char* POINT = R"((struct :name Point :fields [ (field :name x :type i64) (field :name y :type i64) ]))";

const char* MARSHAL = R"((module
  (fn :name "rt_i64" :ret i64 :params [ (param i64 %x) ] :body [ (box %v %x) (unbox %y i64 %v) (ret i64 %y) ])
  (fn :name "rt_f64" :ret f64 :params [ (param f64 %x) ] :body [ (box %v %x) (unbox %y f64 %v) (ret f64 %y) ])
  (fn :name "rt_bool" :ret i64 :params [ (param i64 %x) ] :body [
      (const %zero i64 0) (const %one i64 1) (ne %b i64 %x %zero)
      (box %v %b) (unbox %y bool %v)
      (if %y [ (ret i64 %one) ] [ (ret i64 %zero) ]) ])
  (fn :name "rt_null" :ret i64 :params [ ] :body [ (null %n) (box %v %n) (unbox %m null %v) (const %k i64 8) (ret i64 %k) ])
  (fn :name "wrong" :ret f64 :params [ (param i64 %x) ] :body [ (box %v %x) (unbox %y f64 %v) (ret f64 %y) ])))";

std::string colors(){
    return std::string("(module ") + COLOR + R"(
  (fn :name "encode" :ret i64 :params [ (param i64 %r) (param i64 %g) (param i64 %b) ] :body [
      (enum-new %c Color RGB [ %r %g %b ])
      (match Color %c :cases [
          (case RGB :binds [ (bind %x 0) (bind %y 1) (bind %z 2) ] :body [
              (const %m i64 1000000) (const %k i64 1000)
              (mul %xm i64 %x %m) (mul %yk i64 %y %k) (add %s1 i64 %xm %yk) (add %s i64 %s1 %z)
              (ret i64 %s) ])
          (case Red :body [ (const %neg i64 -1) (ret i64 %neg) ]) ]
        :default [ (const %d i64 -2) (ret i64 %d) ]) ])
  (fn :name "pick" :ret Color :params [ (param i64 %which) ] :body [
      (const %zero i64 0) (const %one i64 1) (const %two i64 2)
      (eq %is0 i64 %which %zero)
      (if %is0 [ (enum-new %red Color Red [ ]) (ret Color %red) ])
      (eq %is1 i64 %which %one)
      (if %is1 [ (enum-new %green Color Green [ ]) (ret Color %green) ])
      (eq %is2 i64 %which %two)
      (if %is2 [ (enum-new %blue Color Blue [ ]) (ret Color %blue) ])
      (enum-new %rgb Color RGB [ %which %which %which ]) (ret Color %rgb) ])
  (fn :name "classify" :ret i64 :params [ (param i64 %which) ] :body [
      (call %c Color pick %which)
      (match Color %c :cases [
          (case Red :body [ (const %a i64 10) (ret i64 %a) ])
          (case Green :body [ (const %b i64 20) (ret i64 %b) ])
          (case Blue :body [ (const %d i64 30) (ret i64 %d) ])
          (case RGB :binds [ (bind %x 0) ] :body [ (ret i64 %x) ]) ]) ])))";
}

std::vector<std::string> g_freed;
void remember_free(int32_t kind, const void* obj){
    if(kind == TAGC_TAG_STRING) g_freed.emplace_back(tagc_rt_string_data(static_cast<const TagcString*>(obj)));
    else g_freed.emplace_back(tagc_rt_tag_name(kind));
}

uint64_t bits_of(double d){ uint64_t b; std::memcpy(&b, &d, sizeof b); return b; }

} // namespace

void run_jit_tests(){
    std::cout << "[jit] while loop...\n";
    int64_t sum = run_main(R"((module (fn :name "main" :ret i64 :params [ ] :body [
        (const %zero i64 0) (const %one i64 1) (const %ten i64 10)
        (var %i i64 %one) (var %acc i64 %zero)
        (while :cond [ (le %c i64 %i %ten) ] :test %c :body [
            (add %a2 i64 %acc %i) (set %acc %a2) (add %i2 i64 %i %one) (set %i %i2) ])
        (ret i64 %acc) ])))");
    assert(sum == 55);

    std::cout << "[jit] calls across functions...\n";
    int64_t r = run_main(R"((module
      (fn :name "main" :ret i64 :params [ ] :body [ (const %a i64 6) (const %b i64 7) (call %p i64 times %a %b) (ret i64 %p) ])
      (fn :name "times" :ret i64 :params [ (param i64 %x) (param i64 %y) ] :body [ (mul %z i64 %x %y) (ret i64 %z) ])))");
    assert(r == 42);

    std::cout << "[jit] if/else...\n";
    r = run_main(R"((module (fn :name "main" :ret i64 :params [ ] :body [
        (const %a i64 3) (const %b i64 4) (var %out i64 %a)
        (gt %c i64 %a %b)
        (if %c [ (set %out %a) ] [ (set %out %b) ])
        (ret i64 %out) ])))");
    assert(r == 4);
    std::cout << "[jit] jit tests passed\n";
}

TEST(JitMarshal, IntegersRoundTrip){
    auto jit = jit_compile(MARSHAL);
    ASSERT_TRUE(jit);
    auto f = lookup<int64_t(*)(int64_t)>(*jit, "rt_i64");
    ASSERT_TRUE(f);
    for(int64_t v : {int64_t(0), int64_t(-1), int64_t(42), std::numeric_limits<int64_t>::min(), std::numeric_limits<int64_t>::max()})
        EXPECT_EQ(f(v), v);
}

TEST(JitMarshal, FloatsKeepTheirBits){
    auto jit = jit_compile(MARSHAL);
    ASSERT_TRUE(jit);
    auto f = lookup<double(*)(double)>(*jit, "rt_f64");
    ASSERT_TRUE(f);
    for(double v : {0.0, -0.0, 1.5, -2.25e300, std::numeric_limits<double>::infinity(),
                    -std::numeric_limits<double>::infinity(), std::numeric_limits<double>::denorm_min()})
        EXPECT_EQ(bits_of(f(v)), bits_of(v));
    double nan = std::numeric_limits<double>::quiet_NaN();
    EXPECT_TRUE(std::isnan(f(nan)));
    EXPECT_EQ(bits_of(f(nan)), bits_of(nan));
}

TEST(JitMarshal, BooleansAndNull){
    auto jit = jit_compile(MARSHAL);
    ASSERT_TRUE(jit);
    auto b = lookup<int64_t(*)(int64_t)>(*jit, "rt_bool");
    auto n = lookup<int64_t(*)()>(*jit, "rt_null");
    ASSERT_TRUE(b && n);
    EXPECT_EQ(b(0), 0);
    EXPECT_EQ(b(5), 1);
    EXPECT_EQ(n(), 8);
}

TEST(JitMarshal, WrongTagPanics){
    auto jit = jit_compile(MARSHAL);
    ASSERT_TRUE(jit);
    auto f = lookup<double(*)(int64_t)>(*jit, "wrong");
    ASSERT_TRUE(f);
    EXPECT_EXIT(f(42), ::testing::ExitedWithCode(101), "type tag mismatch: expected Float, found Integer");
}

TEST(JitEnum, MatchRecoversVariantFields){
    auto jit = jit_compile(colors());
    ASSERT_TRUE(jit);
    auto encode = lookup<int64_t(*)(int64_t, int64_t, int64_t)>(*jit, "encode");
    ASSERT_TRUE(encode);
    int64_t base = tagc_rt_live_allocations();
    EXPECT_EQ(encode(255, 0, 0), 255000000);
    EXPECT_EQ(encode(1, 2, 3), 1002003);
    EXPECT_EQ(tagc_rt_live_allocations(), base);
}

TEST(JitEnum, ExhaustiveMatchSelectsEachVariant){
    auto jit = jit_compile(colors());
    ASSERT_TRUE(jit);
    auto classify = lookup<int64_t(*)(int64_t)>(*jit, "classify");
    ASSERT_TRUE(classify);
    int64_t base = tagc_rt_live_allocations();
    EXPECT_EQ(classify(0), 10);
    EXPECT_EQ(classify(1), 20);
    EXPECT_EQ(classify(2), 30);
    EXPECT_EQ(classify(77), 77);
    EXPECT_EQ(tagc_rt_live_allocations(), base);
}

TEST(JitOwnership, ScopeExitDestroysInReverseOrder){
    auto jit = jit_compile(R"((module (fn :name "scoped" :ret void :params [ ] :body [
        (str %a "A") (block :body [ (str %inner "I") ]) (str %b "B") (str %c "C") ])))");
    ASSERT_TRUE(jit);
    auto f = lookup<void(*)()>(*jit, "scoped");
    ASSERT_TRUE(f);
    g_freed.clear();
    tagc_rt_set_free_hook(remember_free);
    f();
    tagc_rt_set_free_hook(nullptr);
    EXPECT_EQ(g_freed, (std::vector<std::string>{"I", "C", "B", "A"}));
}

TEST(JitOwnership, ReturnKeepsTheResultAlive){
    auto jit = jit_compile(R"((module (fn :name "early" :ret string :params [ ] :body [
        (str %a "A") (str %r "R") (str %z "Z") (ret string %r) ])))");
    ASSERT_TRUE(jit);
    auto f = lookup<TagcString*(*)()>(*jit, "early");
    ASSERT_TRUE(f);
    g_freed.clear();
    tagc_rt_set_free_hook(remember_free);
    TagcString* s = f();
    tagc_rt_set_free_hook(nullptr);
    EXPECT_EQ(g_freed, (std::vector<std::string>{"Z", "A"}));
    ASSERT_NE(s, nullptr);
    EXPECT_STREQ(tagc_rt_string_data(s), "R");
    tagc_rt_string_free(s);
}

TEST(JitOwnership, CompensationDropOnUntakenArm){
    auto jit = jit_compile(R"((module
      (fn :name "sink" :ret void :params [ (param string %s) ] :body [ ])
      (fn :name "maybe" :ret void :params [ (param i64 %k) ] :body [
        (const %zero i64 0) (str %s "S") (ne %c i64 %k %zero)
        (if %c [ (call %u void sink %s) ]) ])))");
    ASSERT_TRUE(jit);
    auto f = lookup<void(*)(int64_t)>(*jit, "maybe");
    ASSERT_TRUE(f);
    int64_t base = tagc_rt_live_allocations();
    for(int64_t k : {0, 1}){
        g_freed.clear();
        tagc_rt_set_free_hook(remember_free);
        f(k);
        tagc_rt_set_free_hook(nullptr);
        EXPECT_EQ(g_freed, std::vector<std::string>{"S"}) << "k=" << k;
    }
    EXPECT_EQ(tagc_rt_live_allocations(), base);
}

TEST(JitOwnership, NestedHeapValuesAreReleased){
    auto jit = jit_compile(std::string("(module ") + COLOR + POINT + R"(
      (fn :name "churn" :ret i64 :params [ ] :body [
        (list-new %l) (const %one i64 1) (const %two i64 2)
        (list-push %l %one) (str %s "s") (list-push %l %s)
        (list-new %inner) (list-push %inner %two) (list-push %l %inner)
        (struct-new %p Point [ (init :name x :value %one) (init :name y :value %two) ])
        (struct-get %px Point %p x)
        (str %label "t") (tuple-new %t [ %px %label ])
        (tuple-get %t0 %t 0)
        (const %r i64 255) (const %z i64 0)
        (enum-new %c Color RGB [ %r %z %z ])
        (list-push %l %c)
        (list-pop %back Color %l)
        (match Color %back :cases [ (case RGB :binds [ (bind %rr 0) ] :body [ (print %rr) ]) ] :default [ ])
        (list-len %n %l)
        (add %s1 i64 %n %px) (add %s2 i64 %s1 %t0)
        (ret i64 %s2) ])))");
    ASSERT_TRUE(jit);
    auto f = lookup<int64_t(*)()>(*jit, "churn");
    ASSERT_TRUE(f);
    int64_t base = tagc_rt_live_allocations();
    EXPECT_EQ(f(), 5);
    EXPECT_EQ(tagc_rt_live_allocations(), base);
}

TEST(JitList, KeepsInsertionOrder){
    const char* src = R"((module
      (fn :name "order" :ret i64 :params [ ] :body [
        (list-new %l) (const %a i64 10) (const %b i64 20) (const %c i64 30)
        (list-push %l %a) (list-push %l %b) (list-push %l %c)
        (const %i0 i64 0) (const %i2 i64 2)
        (list-get %x i64 %l %i0) (list-get %y i64 %l %i2) (list-pop %p i64 %l)
        (const %m i64 1000000) (const %k i64 1000)
        (mul %xm i64 %x %m) (mul %yk i64 %y %k) (add %s1 i64 %xm %yk) (add %s i64 %s1 %p)
        (ret i64 %s) ])
      (fn :name "oob" :ret i64 :params [ (param i64 %i) ] :body [
        (list-new %l) (const %a i64 1) (list-push %l %a) (list-push %l %a) (list-push %l %a)
        (list-get %x i64 %l %i) (ret i64 %x) ])
      (fn :name "empty" :ret i64 :params [ ] :body [
        (list-new %l) (list-is-empty %e %l) (const %one i64 1) (const %zero i64 0)
        (if %e [ (ret i64 %one) ] [ (ret i64 %zero) ]) ])))";
    auto jit = jit_compile(src);
    ASSERT_TRUE(jit);
    auto order = lookup<int64_t(*)()>(*jit, "order");
    auto oob = lookup<int64_t(*)(int64_t)>(*jit, "oob");
    auto empty = lookup<int64_t(*)()>(*jit, "empty");
    ASSERT_TRUE(order && oob && empty);
    EXPECT_EQ(order(), 10030030);
    EXPECT_EQ(oob(2), 1);
    EXPECT_EQ(empty(), 1);
    EXPECT_EXIT(oob(5), ::testing::ExitedWithCode(101), "list index out of bounds: index 5, length 3");
}

TEST(JitPanic, DivisionByZero){
    auto jit = jit_compile("(module (fn :name \"div\" :ret i64 :params [ (param i64 %a) (param i64 %b) ] :body [ (sdiv %q i64 %a %b) (ret i64 %q) ]))");
    ASSERT_TRUE(jit);
    auto f = lookup<int64_t(*)(int64_t, int64_t)>(*jit, "div");
    ASSERT_TRUE(f);
    EXPECT_EQ(f(84, 2), 42);
    EXPECT_EXIT(f(1, 0), ::testing::ExitedWithCode(101), "panic: division by zero");
}

TEST(JitPanic, DivisionOverflow){
    auto jit = jit_compile("(module (fn :name \"div\" :ret i64 :params [ (param i64 %a) (param i64 %b) ] :body [ (sdiv %q i64 %a %b) (ret i64 %q) ])"
                           " (fn :name \"rem\" :ret i64 :params [ (param i64 %a) (param i64 %b) ] :body [ (srem %q i64 %a %b) (ret i64 %q) ]))");
    ASSERT_TRUE(jit);
    auto div = lookup<int64_t(*)(int64_t, int64_t)>(*jit, "div");
    auto rem = lookup<int64_t(*)(int64_t, int64_t)>(*jit, "rem");
    ASSERT_TRUE(div && rem);
    const int64_t lo = std::numeric_limits<int64_t>::min();
    EXPECT_EQ(div(lo, 1), lo);
    EXPECT_EQ(div(lo + 1, -1), std::numeric_limits<int64_t>::max());
    EXPECT_EQ(rem(-7, 2), -1);
    EXPECT_EXIT(div(lo, -1), ::testing::ExitedWithCode(101), "panic: integer overflow in division");
    EXPECT_EXIT(rem(lo, -1), ::testing::ExitedWithCode(101), "panic: integer overflow in division");
}

TEST(JitPanic, ExplicitPanicMessage){
    auto jit = jit_compile("(module (fn :name \"boom\" :ret void :params [ ] :body [ (panic \"unreachable state\") ]))");
    ASSERT_TRUE(jit);
    auto f = lookup<void(*)()>(*jit, "boom");
    ASSERT_TRUE(f);
    EXPECT_EXIT(f(), ::testing::ExitedWithCode(101), "panic: unreachable state");
}

namespace {

struct BoxKind { const char* type; const char* make; int32_t tag; };

// One producer per tag; each defines %x.
const BoxKind kBoxKinds[] = {
    {"i64", "(const %x i64 7)", TAGC_TAG_INTEGER},
    {"f64", "(const %x f64 1.5)", TAGC_TAG_FLOAT},
    {"bool", "(const %x bool true)", TAGC_TAG_BOOLEAN},
    {"null", "(null %x)", TAGC_TAG_NULL},
    {"string", "(str %x \"s\")", TAGC_TAG_STRING},
    {"list", "(list-new %x)", TAGC_TAG_LIST},
    {"Color", "(enum-new %x Color Red [ ])", TAGC_TAG_ENUM},
};

std::string mismatch_fn(size_t from, size_t to){
    return "mismatch_" + std::to_string(from) + "_" + std::to_string(to);
}

} // namespace

TEST(JitMarshal, EveryWrongTagPanics){
    std::string src = std::string("(module ") + COLOR;
    const size_t n = sizeof(kBoxKinds) / sizeof(kBoxKinds[0]);
    for(size_t from = 0; from < n; ++from)
        for(size_t to = 0; to < n; ++to){
            if(from == to) continue;
            src += "(fn :name \"" + mismatch_fn(from, to) + "\" :ret void :params [ ] :body [ " + kBoxKinds[from].make +
                   " (box %v %x) (unbox %y " + kBoxKinds[to].type + " %v) ])";
        }
    src += ")";
    auto jit = jit_compile(src);
    ASSERT_TRUE(jit);
    for(size_t from = 0; from < n; ++from)
        for(size_t to = 0; to < n; ++to){
            if(from == to) continue;
            auto f = lookup<void(*)()>(*jit, mismatch_fn(from, to).c_str());
            ASSERT_TRUE(f);
            std::string expected = std::string("type tag mismatch: expected ") + tagc_rt_tag_name(kBoxKinds[to].tag) +
                                   ", found " + tagc_rt_tag_name(kBoxKinds[from].tag);
            EXPECT_EXIT(f(), ::testing::ExitedWithCode(101), expected) << kBoxKinds[from].type << " as " << kBoxKinds[to].type;
        }
}

TEST(JitMarshal, ListElementReadAsWrongType){
    auto jit = jit_compile(R"((module (fn :name "peek" :ret i64 :params [ ] :body [
        (list-new %l) (str %s "text") (list-push %l %s) (const %i i64 0)
        (list-get %x i64 %l %i) (ret i64 %x) ])))");
    ASSERT_TRUE(jit);
    auto f = lookup<int64_t(*)()>(*jit, "peek");
    ASSERT_TRUE(f);
    EXPECT_EXIT(f(), ::testing::ExitedWithCode(101), "type tag mismatch: expected Integer, found String");
}

TEST(JitOwnership, MatchBindTakesHeapFields){
    auto jit = jit_compile(R"((module
      (enum :name Msg :variants [ (variant :name Quit) (variant :name Text :fields [ string i64 ]) (variant :name Batch :fields [ list string ]) ])
      (fn :name "make" :ret Msg :params [ (param i64 %which) ] :body [
          (const %zero i64 0) (const %one i64 1)
          (eq %q i64 %which %zero)
          (if %q [ (enum-new %quit Msg Quit [ ]) (ret Msg %quit) ])
          (eq %t i64 %which %one)
          (if %t [ (str %s "hello") (const %n i64 5) (enum-new %text Msg Text [ %s %n ]) (ret Msg %text) ])
          (list-new %xs) (str %inner "i") (list-push %xs %inner) (str %label "batch")
          (enum-new %batch Msg Batch [ %xs %label ]) (ret Msg %batch) ])
      (fn :name "size" :ret i64 :params [ (param i64 %which) ] :body [
          (call %m Msg make %which)
          (match Msg %m :cases [
              (case Text :binds [ (bind %s 0) (bind %n 1) ] :body [
                  (string-len %len %s) (add %r i64 %len %n) (ret i64 %r) ])
              (case Batch :binds [ (bind %xs 0) ] :body [
                  (list-len %r2 %xs) (ret i64 %r2) ]) ]
            :default [ (const %none i64 -1) (ret i64 %none) ]) ])
      (fn :name "text_len" :ret i64 :params [ (param i64 %which) ] :body [
          (call %m Msg make %which)
          (const %zero i64 0) (var %out i64 %zero)
          (match Msg %m :cases [ (case Text :binds [ (bind %s 0) ] :body [ (string-len %len %s) (set %out %len) ]) ] :default [ ])
          (ret i64 %out) ])))");
    ASSERT_TRUE(jit);
    auto size = lookup<int64_t(*)(int64_t)>(*jit, "size");
    auto text_len = lookup<int64_t(*)(int64_t)>(*jit, "text_len");
    ASSERT_TRUE(size && text_len);
    int64_t base = tagc_rt_live_allocations();
    EXPECT_EQ(size(0), -1);
    EXPECT_EQ(size(1), 10);
    EXPECT_EQ(size(2), 1);
    EXPECT_EQ(tagc_rt_live_allocations(), base);
    // non-terminating arms: one consumes, the default drops the whole enum
    EXPECT_EQ(text_len(1), 5);
    EXPECT_EQ(text_len(0), 0);
    EXPECT_EQ(text_len(2), 0);
    EXPECT_EQ(tagc_rt_live_allocations(), base);
}

TEST(JitOwnership, UnpackTakesRecordFields){
    auto jit = jit_compile(R"((module
      (struct :name Person :fields [ (field :name name :type string) (field :name tags :type list) (field :name age :type i64) ])
      (fn :name "person" :ret i64 :params [ ] :body [
          (str %s "ann") (list-new %l) (str %tag "x") (list-push %l %tag) (const %a i64 40)
          (struct-new %p Person [ (init :name name :value %s) (init :name tags :value %l) (init :name age :value %a) ])
          (struct-unpack Person %p [ (bind %nm name) (bind %age age) ])
          (string-len %len %nm) (add %r i64 %len %age) (ret i64 %r) ])
      (fn :name "pair" :ret string :params [ ] :body [
          (str %a "left") (str %b "right") (tuple-new %t [ %a %b ])
          (tuple-unpack %t [ (bind %r 1) ])
          (ret string %r) ])))");
    ASSERT_TRUE(jit);
    auto person = lookup<int64_t(*)()>(*jit, "person");
    auto pair = lookup<TagcString*(*)()>(*jit, "pair");
    ASSERT_TRUE(person && pair);
    int64_t base = tagc_rt_live_allocations();
    EXPECT_EQ(person(), 43);
    EXPECT_EQ(tagc_rt_live_allocations(), base);
    TagcString* s = pair();
    ASSERT_NE(s, nullptr);
    EXPECT_STREQ(tagc_rt_string_data(s), "right");
    tagc_rt_string_free(s);
    EXPECT_EQ(tagc_rt_live_allocations(), base);
}
