/// @file
/// @b License: @n Apache License v2.0
/// @copyright Robert Dunnagan
#include <gtest/gtest.h>

#include <stash/json/json.hxx>

#include <cmath>
#include <sstream>

using namespace stash;
using namespace stash::json::impl;

using Adapter = parse::StringStreamAdapter;

TEST(Json, ParseNull) {
    Parser parser{Adapter{"null"}};
    ASSERT_TRUE(parser.parse_object('\0'));
    EXPECT_TRUE(parser.m_curr == nil);
}

TEST(Json, ParseBoolTrue) {
    Parser parser{Adapter{"true"}};
    ASSERT_TRUE(parser.parse_object('\0'));
    EXPECT_EQ(parser.m_curr.type(), Value::BOOL);
    EXPECT_EQ(parser.m_curr, true);
}

TEST(Json, ParseNumberSignedInt) {
    Parser parser{Adapter{"-37"}};
    ASSERT_TRUE(parser.parse_number());
    EXPECT_EQ(parser.m_curr.as<Int>(), -37);
}

TEST(Json, ParseNumberUnsignedInt) {
    UInt value = 0xFFFFFFFFFFFFFFFFULL;
    auto text = std::to_string(value);
    Parser parser{Adapter{text}};
    ASSERT_TRUE(parser.parse_number());
    EXPECT_EQ(parser.m_curr.as<UInt>(), value);
}

TEST(Json, ParseNumberRangeError) {
    Parser parser{Adapter{"1000000000000000000000"}};
    EXPECT_FALSE(parser.parse_number());
    EXPECT_TRUE(parser.m_curr.is_empty());
}

TEST(Json, ParseNumberFloat) {
    Parser parser{Adapter{"3.14159"}};
    EXPECT_TRUE(parser.parse_number());
    EXPECT_EQ(parser.m_curr.as<Float>(), 3.14159);
}

TEST(Json, ParseNumberExponent) {
    Parser parser1{Adapter{"100E+3"}};
    EXPECT_TRUE(parser1.parse_number());
    EXPECT_EQ(parser1.m_curr.as<Float>(), 100000.0);

    Parser parser2{Adapter{"1000e-3"}};
    EXPECT_TRUE(parser2.parse_number());
    EXPECT_EQ(parser2.m_curr.as<Float>(), 1.0);
}

TEST(Json, ParseNumberMinusSignAlone) {
    Parser parser{Adapter{"-"}};
    EXPECT_FALSE(parser.parse_number());
}

TEST(Json, ParseNonFinite) {
    auto value = json::parse("[NaN, Infinity, -Infinity]");
    ASSERT_EQ(value.size(), 3UL);
    EXPECT_TRUE(std::isnan(value.get(0).as<Float>()));
    EXPECT_EQ(value.get(1).as<Float>(), HUGE_VAL);
    EXPECT_EQ(value.get(2).as<Float>(), -HUGE_VAL);
}

TEST(Json, ParseEscapes) {
    auto value = json::parse(R"("a\"b\\c\/d\n\tA\u00e9")");
    EXPECT_EQ(value.as<String>(), "a\"b\\c/d\n\tA\xc3\xa9");
}

TEST(Json, ParseSurrogatePair) {
    auto value = json::parse(R"("\ud83d\ude00")");
    EXPECT_EQ(value.as<String>(), "\xf0\x9f\x98\x80");
}

TEST(Json, ParseListThreeInts) {
    Parser parser{Adapter{"[2, 4, 6]"}};
    EXPECT_TRUE(parser.parse_list());
    Value curr = parser.m_curr;
    ASSERT_EQ(curr.size(), 3UL);
    EXPECT_EQ(curr.get(0).as<Int>(), 2);
    EXPECT_EQ(curr.get(1).as<Int>(), 4);
    EXPECT_EQ(curr.get(2).as<Int>(), 6);
}

TEST(Json, ParseMapKeepsOrder) {
    auto value = json::parse(R"({"z": [1], "a": {"y": null}, "m": "x"})");
    ASSERT_EQ(value.type(), Value::MAP);
    EXPECT_EQ(value.keys(), (std::vector<String>{"z", "a", "m"}));
    EXPECT_EQ(value.get("z").get(0), 1);
    EXPECT_EQ(value.lookup("a.y"_path), nil);
}

TEST(Json, ParseListErrantColon) {
    Parser parser{Adapter{R"(["a", :"b", "c"])"}};
    EXPECT_FALSE(parser.parse_object('\0'));
    EXPECT_TRUE(parser.m_curr.is_empty());
}

TEST(Json, ParseMapDoubleComma) {
    Parser parser{Adapter{R"({"a": [1],, "b"})"}};
    EXPECT_FALSE(parser.parse_object('\0'));
    EXPECT_TRUE(parser.m_curr.is_empty());
}

TEST(Json, ParseErrorBadNumberInList) {
    Parser parser{Adapter{"[2x]"}};
    parser.parse_list();
    EXPECT_TRUE(parser.m_curr.is_empty());
}

TEST(Json, ParseTrailingCharacters) {
    EXPECT_THROW(json::parse("{} x"), parse::SyntaxError);
}

TEST(Json, ParseUnterminatedString) {
    EXPECT_THROW(json::parse("\"tea"), parse::SyntaxError);
}

TEST(Json, ParseStream) {
    std::stringstream stream{R"({"teas": ["Assam", "Darjeeling"]})"};
    auto value = json::parse(stream);
    EXPECT_EQ(value.lookup("teas[1]"_path), "Darjeeling");
}

TEST(Json, WriteCompact) {
    Map map;
    map.insert({"b", List{1, 2.5, "x"}});
    map.insert({"a", nil});
    map.insert({"c", true});
    EXPECT_EQ(json::to_json(map), R"({"b": [1, 2.5, "x"], "a": null, "c": true})");
}

TEST(Json, WriteIndent) {
    Map map;
    map.insert({"a", List{1}});
    EXPECT_EQ(json::to_json(map, 2), "{\n  \"a\": [\n    1\n  ]\n}");
}

TEST(Json, WriteFloatKeepsType) {
    auto text = json::to_json(List{1.0, -0.5});
    EXPECT_EQ(text, "[1.0, -0.5]");
    auto value = json::parse(text);
    EXPECT_EQ(value.get(0).type(), Value::FLOAT);
}

TEST(Json, WriteEscapesRoundTrip) {
    String str = "quote\" backslash\\ newline\n tab\t bell\x07";
    auto value = json::parse(json::to_json(str));
    EXPECT_EQ(value.as<String>(), str);
}

TEST(Json, WriteBytesIsError) {
    EXPECT_THROW(json::to_json(Bytes{1, 2}), WrongType);
    EXPECT_FALSE(json::is_json(List{Bytes{1}}));
    EXPECT_TRUE(json::is_json(List{1, "a", nil}));
}
