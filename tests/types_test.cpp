// Tests for the reader, the type table and the tagged value layout
#include <cassert>
#include <iostream>
#include <gtest/gtest.h>
#include "tagc/sexpr.hpp"
#include "tagc/types.hpp"
#include "tagc/value.hpp"

using namespace tagc;

void run_type_tests(){
    std::cout << "[types] reader...\n";
    auto n = parse("(const %x i64 42) ; trailing comment");
    assert(is_list(*n) && head_of(*n)=="const");
    auto &el = std::get<list>(n->data).elems;
    assert(el.size()==4 && std::get<int64_t>(el[3]->data)==42);
    assert(as_symbol(*el[1])->name=="%x");
    auto v = parse("[ 1, 2, 3 ]");
    assert(as_vector(*v)->elems.size()==3);
    auto kw = parse("(fn :name \"main\" :ret i64)");
    assert(name_of(kw_arg(std::get<list>(kw->data),"name"))=="main");
    assert(name_of(kw_arg(std::get<list>(kw->data),"ret"))=="i64");
    assert(!kw_arg(std::get<list>(kw->data),"params"));

    std::cout << "[types] interning...\n";
    TypeContext ctx;
    auto i64a = ctx.parse_type(parse("i64")); auto i64b = ctx.parse_type(parse("i64"));
    assert(i64a==i64b);
    assert(ctx.parse_type(parse("bool"))==ctx.parse_type(parse("i1")));
    auto t1 = ctx.parse_type(parse("(tuple i64 string)"));
    auto t2 = ctx.parse_type(parse("(tuple i64 string)"));
    assert(t1==t2 && ctx.to_string(t1)=="(tuple i64 string)");
    std::cout << "[types] type tests passed\n";
}

TEST(Reader, AttachesLineAndColumn){
    auto n = parse("(module\n  (fn :name f))");
    auto &el = std::get<list>(n->data).elems;
    EXPECT_EQ(line(*n), 1);
    EXPECT_EQ(line(*el[1]), 2);
    EXPECT_EQ(col(*el[1]), 3);
}

TEST(Reader, RejectsUnterminatedList){
    EXPECT_THROW(parse("(module (fn"), parse_error);
}

TEST(Reader, ReadsLiterals){
    auto n = parse("[ -3 1.5 true false nil \"s\\n\" :kw Color::RGB ]");
    auto &el = as_vector(*n)->elems;
    ASSERT_EQ(el.size(), 8u);
    EXPECT_EQ(std::get<int64_t>(el[0]->data), -3);
    EXPECT_DOUBLE_EQ(std::get<double>(el[1]->data), 1.5);
    EXPECT_TRUE(std::get<bool>(el[2]->data));
    EXPECT_FALSE(std::get<bool>(el[3]->data));
    EXPECT_TRUE(std::holds_alternative<std::monostate>(el[4]->data));
    EXPECT_EQ(std::get<std::string>(el[5]->data), "s\n");
    EXPECT_TRUE(is_keyword(*el[6]));
    EXPECT_EQ(as_symbol(*el[7])->name, "Color::RGB");
}

TEST(Types, HeapOwnershipAndTags){
    TypeContext ctx;
    auto I64 = ctx.get_base(BaseType::I64), F64 = ctx.get_base(BaseType::F64);
    EXPECT_FALSE(ctx.is_heap_owning(I64));
    EXPECT_FALSE(ctx.is_heap_owning(ctx.get_base(BaseType::Null)));
    EXPECT_TRUE(ctx.is_heap_owning(ctx.get_string()));
    EXPECT_TRUE(ctx.is_heap_owning(ctx.get_list()));
    EXPECT_TRUE(ctx.is_heap_owning(ctx.get_value()));
    auto color = ctx.declare_enum("Color");
    EXPECT_TRUE(ctx.is_heap_owning(color));
    EXPECT_EQ(ctx.tag_for(F64), ValueTag::Float);
    EXPECT_EQ(ctx.tag_for(color), ValueTag::Enum);
    EXPECT_FALSE(ctx.tag_for(ctx.get_value()).has_value());
    EXPECT_FALSE(ctx.tag_for(ctx.get_base(BaseType::Void)).has_value());
}

TEST(Types, NamedTypesNeedDeclaration){
    TypeContext ctx;
    EXPECT_THROW(ctx.parse_type(parse("Point")), type_error);
    auto p = ctx.declare_struct("Point");
    EXPECT_EQ(ctx.parse_type(parse("Point")), p);
    EXPECT_THROW(ctx.declare_enum("Point"), type_error);
    EXPECT_THROW(ctx.parse_type(parse("(tuple)")), type_error);
}

TEST(Value, LayoutAndTagNames){
    EXPECT_EQ(sizeof(TagcValue), 16u);
    EXPECT_EQ(static_cast<int32_t>(ValueTag::Integer), 0);
    EXPECT_EQ(static_cast<int32_t>(ValueTag::Null), 8);
    EXPECT_STREQ(tag_name(ValueTag::Tuple), "Tuple");
    EXPECT_EQ(tag_from_name("Boolean"), ValueTag::Boolean);
    EXPECT_FALSE(tag_from_name("Pointer").has_value());
    EXPECT_TRUE(is_heap_tag(ValueTag::String));
    EXPECT_FALSE(is_heap_tag(ValueTag::Null));
    EXPECT_FALSE(is_valid_tag(9));
}
