/// @file
/// @b License: @n Apache License v2.0
/// @copyright Robert Dunnagan
#include <gtest/gtest.h>

#include <stash/core/Value.hxx>

using namespace stash;

namespace {

struct Point : public Stateful
{
    Point() = default;
    Point(Int x, Int y) : x{x}, y{y} {}

    Value get_state() const override {
        Map state;
        state.insert({"x", x});
        state.insert({"y", y});
        return state;
    }

    void set_state(const Value& state) override {
        x = state.get("x").as<Int>();
        y = state.get("y").as<Int>();
    }

    Opaque* clone() const override { return new Point{x, y}; }
    String str() const override    { return "Point"; }

    Int x = 0;
    Int y = 0;
};

} // namespace

TEST(Key, IndexAndName) {
    Key index{3};
    Key name{"tea"};
    EXPECT_TRUE(index.is_index());
    EXPECT_TRUE(name.is_name());
    EXPECT_EQ(index.index(), 3);
    EXPECT_EQ(name.name(), "tea");
    EXPECT_THROW(index.name(), WrongType);
    EXPECT_THROW(name.index(), WrongType);
    EXPECT_FALSE(Key{0} == Key{"0"});
    EXPECT_TRUE(Key{size_t{7}} == Key{7});
}

TEST(Key, IsIdentifier) {
    EXPECT_TRUE(Key::is_identifier("tea_2"));
    EXPECT_FALSE(Key::is_identifier(""));
    EXPECT_FALSE(Key::is_identifier("x y"));
    EXPECT_FALSE(Key::is_identifier("a.b"));
}

TEST(Path, Parse) {
    Path path("a.b[0]['x y'][-1]");
    ASSERT_EQ(path.size(), 5UL);
    EXPECT_EQ(path[0], Key{"a"});
    EXPECT_EQ(path[1], Key{"b"});
    EXPECT_EQ(path[2], Key{0});
    EXPECT_EQ(path[3], Key{"x y"});
    EXPECT_EQ(path[4], Key{-1});
}

TEST(Path, ParseDoubleQuoted) {
    Path path(R"(a["it's"])");
    ASSERT_EQ(path.size(), 2UL);
    EXPECT_EQ(path[1], Key{"it's"});
}

TEST(Path, ParseEscapedQuote) {
    Path path(R"(['a\'b'])");
    ASSERT_EQ(path.size(), 1UL);
    EXPECT_EQ(path[0], Key{"a'b"});
}

TEST(Path, ToStr) {
    EXPECT_EQ("a.b[0]"_path.to_str(), "a.b[0]");
    EXPECT_EQ("[1].x"_path.to_str(), "[1].x");
    EXPECT_EQ(Path{}.to_str(), "");

    Path path;
    path.append("x y");
    path.append(2);
    path.append("z");
    EXPECT_EQ(path.to_str(), "['x y'][2].z");
    EXPECT_EQ(Path(path.to_str()), path);
}

TEST(Path, EmptyIsRoot) {
    EXPECT_TRUE(Path{}.is_root());
    EXPECT_TRUE(Path("").is_root());
    EXPECT_FALSE("a"_path.is_root());
}

TEST(Path, ParentChildPrefix) {
    auto path = "a.b[3]"_path;
    EXPECT_EQ(path.parent(), "a.b"_path);
    EXPECT_EQ(path.prefix(1), "a"_path);
    EXPECT_EQ(path.child("c"), "a.b[3].c"_path);
    EXPECT_EQ(path.rebase(2, "x[0]"_path), "x[0][3]"_path);
    EXPECT_EQ(path.tail(), Key{3});
    EXPECT_THROW(Path{}.tail(), StashException);
}

TEST(Path, SyntaxErrors) {
    EXPECT_THROW(Path("a..b"), parse::SyntaxError);
    EXPECT_THROW(Path("a[x]"), parse::SyntaxError);
    EXPECT_THROW(Path("a[0"), parse::SyntaxError);
    EXPECT_THROW(Path("a['b"), parse::SyntaxError);
    EXPECT_THROW(Path("a b"), parse::SyntaxError);
}

TEST(Value, TypeName) {
    EXPECT_EQ(Value{}.type_name(), "empty");
    EXPECT_EQ(Value{nil}.type_name(), "nil");
    EXPECT_EQ(Value{true}.type_name(), "bool");
    EXPECT_EQ(Value{-1}.type_name(), "int");
    EXPECT_EQ(Value{1U}.type_name(), "uint");
    EXPECT_EQ(Value{1.5}.type_name(), "float");
    EXPECT_EQ(Value{"x"}.type_name(), "str");
    EXPECT_EQ(Value{Bytes{}}.type_name(), "bytes");
    EXPECT_EQ(Value{Value::LIST}.type_name(), "list");
    EXPECT_EQ(Value{Value::MAP}.type_name(), "map");
    EXPECT_EQ(Value::make<Point>(1, 2).type_name(), "opaque");
}

TEST(Value, ConstructWithInvalidRepr) {
    EXPECT_THROW(Value{Value::OPAQUE}, WrongType);
}

TEST(Value, AsWrongType) {
    Value value{"tea"};
    EXPECT_EQ(value.as<String>(), "tea");
    EXPECT_THROW(value.as<Int>(), WrongType);
    EXPECT_THROW(value.as<Point>(), WrongType);
    EXPECT_EQ(value.as_opaque<Point>(), nullptr);
}

TEST(Value, ToIntToFloat) {
    EXPECT_EQ(Value{"12"}.to_int(), 12);
    EXPECT_EQ(Value{2.75}.to_int(), 2);
    EXPECT_EQ(Value{true}.to_int(), 1);
    EXPECT_EQ(Value{"0.5"}.to_float(), 0.5);
    EXPECT_EQ(Value{UInt{3}}.to_float(), 3.0);
    EXPECT_THROW(Value{nil}.to_int(), WrongType);
    EXPECT_THROW(Value{"x"}.to_int(), StashException);
}

TEST(Value, CompareNumbers) {
    EXPECT_EQ(Value{1}, Value{1.0});
    EXPECT_EQ(Value{UInt{1}}, Value{1});
    EXPECT_FALSE(Value{-1} == Value{UInt{0xFFFFFFFFFFFFFFFFULL}});
    EXPECT_FALSE(Value{true} == Value{1});
    EXPECT_FALSE(Value{nil} == Value{0});
    EXPECT_TRUE(Value{nil} == nil);
}

TEST(Value, ReferenceSemantics) {
    Value a = List{1, 2};
    Value b = a;
    b.append(3);
    EXPECT_EQ(a.size(), 3UL);
    EXPECT_TRUE(a.is(b));
    EXPECT_EQ(a.id(), b.id());
    EXPECT_EQ(a.ref_count(), 2UL);
}

TEST(Value, DeepCopy) {
    Map map;
    map.insert({"inner", List{1, 2}});
    Value a = map;
    Value b = a.copy();
    EXPECT_EQ(a, b);
    EXPECT_FALSE(a.is(b));
    EXPECT_FALSE(a.get("inner").is(b.get("inner")));

    b.get("inner").append(3);
    EXPECT_EQ(a.get("inner").size(), 2UL);
}

TEST(Value, EqualButDistinct) {
    Value a = List{1, 2};
    Value b = List{1, 2};
    EXPECT_EQ(a, b);
    EXPECT_FALSE(a.is(b));
}

TEST(Value, ScalarsHaveNoIdentity) {
    Value a{5};
    EXPECT_EQ(a.id(), nullptr);
    EXPECT_TRUE(a.is(Value{5}));
}

TEST(Value, ListGetSet) {
    Value list = List{"a", "b", "c"};
    EXPECT_EQ(list.get(0), "a");
    EXPECT_EQ(list.get(-1), "c");
    EXPECT_EQ(list.get(3), nil);
    EXPECT_EQ(list.get("x"), nil);

    list.set(1, 20);
    EXPECT_EQ(list.get(1), 20);
    list.set(-1, 30);
    EXPECT_EQ(list.get(2), 30);
    EXPECT_THROW(list.set(5, 0), StashException);
}

TEST(Value, MapKeepsInsertionOrder) {
    Value map = Value::MAP;
    map.set("z", 1);
    map.set("a", 2);
    map.set("m", 3);
    map.set("z", 4);
    EXPECT_EQ(map.keys(), (std::vector<String>{"z", "a", "m"}));
    EXPECT_EQ(map.get("z"), 4);
    EXPECT_TRUE(map.contains("a"));
    EXPECT_FALSE(map.contains("b"));
    EXPECT_EQ(map.get("b"), nil);
    EXPECT_EQ(map.get(0), nil);
}

TEST(Value, SubscriptInsertsNil) {
    Value map = Value::MAP;
    map["tea"] = "Assam";
    EXPECT_EQ(map.get("tea"), "Assam");
    EXPECT_EQ(map["coffee"], nil);
    EXPECT_EQ(map.size(), 2UL);
}

TEST(Value, GetOnScalar) {
    EXPECT_THROW(Value{1}.get(0), WrongType);
}

TEST(Value, Lookup) {
    Map inner;
    inner.insert({"teas", List{"Assam", "Darjeeling"}});
    Map outer;
    outer.insert({"shop", inner});
    Value value = outer;
    EXPECT_EQ(value.lookup("shop.teas[1]"_path), "Darjeeling");
    EXPECT_EQ(value.lookup("shop.teas[-2]"_path), "Assam");
    EXPECT_EQ(value.lookup("shop.coffee"_path), nil);
    EXPECT_EQ(value.lookup("shop.teas[0].x"_path), nil);
    EXPECT_TRUE(value.lookup(Path{}).is(value));
}

TEST(Value, ToStr) {
    Map map;
    map.insert({"a", 1});
    map.insert({"b", List{true, nil, 1.5, "x"}});
    map.insert({"c", Bytes{1, 2, 3}});
    EXPECT_EQ(Value{map}.to_str(), R"({"a": 1, "b": [true, nil, 1.5, "x"], "c": <bytes size=3>})");
    EXPECT_EQ(Value{2.0}.to_str(), "2.0");
}

TEST(Value, OpaqueEquality) {
    auto a = Value::make<Point>(1, 2);
    auto b = Value::make<Point>(1, 2);
    auto c = Value::make<Point>(1, 3);
    EXPECT_EQ(a, b);
    EXPECT_FALSE(a == c);
    EXPECT_EQ(a.as<Point>().y, 2);
    EXPECT_EQ(a.runtime_type(), std::type_index{typeid(Point)});
}

TEST(Value, OpaqueCopy) {
    auto a = Value::make<Point>(4, 5);
    auto b = a.copy();
    EXPECT_EQ(a, b);
    EXPECT_FALSE(a.is(b));
    b.as<Point>().x = 0;
    EXPECT_EQ(a.as<Point>().x, 4);
}

TEST(Value, RuntimeType) {
    EXPECT_EQ(Value{nil}.runtime_type(), std::type_index{typeid(nil_t)});
    EXPECT_EQ(Value{1}.runtime_type(), std::type_index{typeid(Int)});
    EXPECT_EQ(Value{List{}}.runtime_type(), std::type_index{typeid(List)});
    EXPECT_EQ(Value{Map{}}.runtime_type(), std::type_index{typeid(Map)});
}

TEST(Value, SelfAssignThroughChild) {
    Value outer = List{List{1}};
    outer = outer.get(0);
    EXPECT_EQ(outer.size(), 1UL);
    EXPECT_EQ(outer.get(0), 1);
}
