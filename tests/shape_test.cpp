#include <gtest/gtest.h>
#include <complex>
#include <functional>
#include "fixtures.hpp"

using namespace paramdec;

TEST(Shape, ScalarKindsAndWidths){
    EXPECT_EQ(shape_of<bool>().kind, Shape::Kind::Bool);
    EXPECT_EQ(shape_of<int8_t>().kind, Shape::Kind::Int);
    EXPECT_EQ(shape_of<int8_t>().bits, 8u);
    EXPECT_EQ(shape_of<int64_t>().name, "int64");
    EXPECT_EQ(shape_of<uint16_t>().kind, Shape::Kind::Uint);
    EXPECT_EQ(shape_of<uint16_t>().name, "uint16");
    EXPECT_EQ(shape_of<float>().bits, 32u);
    EXPECT_EQ(shape_of<double>().name, "float64");
    EXPECT_EQ(shape_of<long double>().bits, 64u);
    EXPECT_EQ(shape_of<std::string>().name, "string");
    EXPECT_EQ(shape_of<fixtures::Label>().kind, Shape::Kind::String);
    EXPECT_EQ(shape_of<fixtures::Level>().kind, Shape::Kind::Int);
    EXPECT_EQ(shape_of<fixtures::Mask>().kind, Shape::Kind::Uint);
    EXPECT_EQ(shape_of<fixtures::Mask>().bits, 16u);
    EXPECT_TRUE(is_leaf(shape_of<fixtures::Color>()));
    EXPECT_FALSE(is_leaf(shape_of<std::vector<int>>()));
}

TEST(Shape, TextDecoderTakesPrecedence){
    EXPECT_EQ(shape_of<fixtures::Color>().kind, Shape::Kind::Text);
    EXPECT_NE(shape_of<fixtures::Color>().decode_text, nullptr);
}

TEST(Shape, ContainersDescribeChildren){
    const Shape& m = shape_of<std::map<std::string, std::vector<int>>>();
    EXPECT_EQ(m.kind, Shape::Kind::Map);
    EXPECT_EQ(m.name, "map<string, vector<int32>>");
    EXPECT_EQ(m.key, &shape_of<std::string>());
    EXPECT_EQ(m.elem, &shape_of<std::vector<int>>());
    EXPECT_NE(m.map_update, nullptr);

    const Shape& int_keyed = shape_of<std::map<int, int>>();
    EXPECT_EQ(int_keyed.map_update, nullptr);

    EXPECT_EQ(shape_of<std::optional<int>>().name, "optional<int32>");
    EXPECT_EQ(shape_of<std::unique_ptr<fixtures::Sub>>().name, "unique_ptr<Sub>");
    EXPECT_EQ(shape_of<std::shared_ptr<std::unique_ptr<int>>>().name, "shared_ptr<unique_ptr<int32>>");
    EXPECT_EQ(shape_of<std::vector<bool>>().kind, Shape::Kind::Sequence);
}

TEST(Shape, RecordsAndUnsupported){
    const Shape& r = shape_of<fixtures::Everything>();
    EXPECT_EQ(r.kind, Shape::Kind::Record);
    EXPECT_EQ(r.name, "Everything");
    std::vector<FieldDecl> decls;
    r.describe(decls);
    ASSERT_FALSE(decls.empty());
    EXPECT_EQ(decls.front().identifier, "Bool");

    EXPECT_EQ(shape_of<std::complex<double>>().kind, Shape::Kind::Unsupported);
    EXPECT_EQ(shape_of<std::function<void()>>().kind, Shape::Kind::Unsupported);
    EXPECT_EQ(shape_of<int*>().kind, Shape::Kind::Unsupported);
    EXPECT_EQ(route(shape_of<int*>()), nullptr);
    const Shape& array = shape_of<std::array<int, 2>>();
    EXPECT_EQ(array.name.rfind("std::array<int", 0), 0u);
}

TEST(Shape, ExternalName){
    FieldDecl d;
    d.identifier = "Field";
    EXPECT_EQ(external_name(d), "Field");
    d.json(",omitempty");
    EXPECT_EQ(external_name(d), "Field");
    d.json("field,omitempty");
    EXPECT_EQ(external_name(d), "field");
    d.param("f");
    EXPECT_EQ(external_name(d), "f");
}
