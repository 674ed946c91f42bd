/// @file
/// @b License: @n Apache License v2.0
/// @copyright Robert Dunnagan
#include <gtest/gtest.h>

#include <stash/archive/Registry.hxx>
#include <stash/adapters/adapters.hxx>
#include <stash/support/Finally.hxx>

using namespace stash;

namespace {

struct Counter : public Stateful
{
    Value get_state() const override {
        Map state;
        state.insert({"n", n});
        return state;
    }

    void set_state(const Value& state) override { n = state.get("n").as<Int>(); }

    Opaque* clone() const override { return new Counter{*this}; }
    String str() const override    { return "Counter"; }

    Int n = 0;
};

struct BadState : public Stateful
{
    Value get_state() const override     { return List{1}; }
    void set_state(const Value&) override {}
    Opaque* clone() const override       { return new BadState{}; }
    String str() const override          { return "BadState"; }
};

struct Unregistered : public Opaque
{
    Opaque* clone() const override { return new Unregistered{}; }
    String str() const override    { return "Unregistered"; }
};

struct Pair : public SequenceLike
{
    List to_list() const override  { return List{1, 2}; }
    Opaque* clone() const override { return new Pair{}; }
    String str() const override    { return "Pair"; }
};

struct Settings : public MappingLike
{
    Map to_map() const override {
        Map map;
        map.insert({"debug", true});
        return map;
    }
    Opaque* clone() const override { return new Settings{}; }
    String str() const override    { return "Settings"; }
};

} // namespace

TEST(Registry, BuiltinTypeTags) {
    auto r_registry = default_registry();
    for (auto tag : {"none", "bool", "int", "uint", "float", "str", "bytes", "list", "dict",
                     "tuple", "set", "complex", "datetime", "ndarray", "table"})
        EXPECT_TRUE(r_registry->has_type_tag(tag)) << tag;
}

TEST(Registry, ResolveForEncode) {
    auto r_registry = default_registry();
    EXPECT_EQ(r_registry->resolve_for_encode(nil, "a"_path).type_tag, "none");
    EXPECT_EQ(r_registry->resolve_for_encode(true, "a"_path).type_tag, "bool");
    EXPECT_EQ(r_registry->resolve_for_encode(3, "a"_path).type_tag, "int");
    EXPECT_EQ(r_registry->resolve_for_encode(UInt{3}, "a"_path).type_tag, "uint");
    EXPECT_EQ(r_registry->resolve_for_encode(0.5, "a"_path).type_tag, "float");
    EXPECT_EQ(r_registry->resolve_for_encode("x", "a"_path).type_tag, "str");
    EXPECT_EQ(r_registry->resolve_for_encode(Bytes{}, "a"_path).type_tag, "bytes");
    EXPECT_EQ(r_registry->resolve_for_encode(List{}, "a"_path).type_tag, "list");
    EXPECT_EQ(r_registry->resolve_for_encode(Map{}, "a"_path).type_tag, "dict");
    EXPECT_EQ(r_registry->resolve_for_encode(Value::make<Complex>(1, 2), "a"_path).type_tag, "complex");
}

TEST(Registry, UnsupportedType) {
    auto r_registry = default_registry();
    EXPECT_THROW(r_registry->resolve_for_encode(Value::make<Unregistered>(), "a.b"_path), UnsupportedTypeError);
    try {
        r_registry->resolve_for_encode(Value::make<Unregistered>(), "a.b"_path);
    } catch (const UnsupportedTypeError& exc) {
        EXPECT_NE(String{exc.message()}.find("path=a.b"), String::npos);
    }
}

TEST(Registry, UnknownTypeTag) {
    auto r_registry = default_registry();
    EXPECT_THROW(r_registry->resolve_for_decode("quaternion", "q"_path), UnknownTypeTagError);
}

TEST(Registry, Fallbacks) {
    auto r_registry = default_registry();
    EXPECT_EQ(r_registry->resolve_for_encode(Value::make<Pair>(), "a"_path).type_tag, "list");
    EXPECT_EQ(r_registry->resolve_for_encode(Value::make<Settings>(), "a"_path).type_tag, "dict");
}

TEST(Registry, ExactBeforeFallback) {
    TypeRegistry registry;
    add_builtin_types(registry);
    registry.add<Pair>("pair", new codecs::ListCodec());
    EXPECT_EQ(registry.resolve_for_encode(Value::make<Pair>(), "a"_path).type_tag, "pair");
}

TEST(Registry, AddStateful) {
    TypeRegistry registry;
    registry.add_stateful<Counter>("counter");
    auto resolved = registry.resolve_for_encode(Value::make<Counter>(), "c"_path);
    EXPECT_EQ(resolved.type_tag, "counter");
    EXPECT_TRUE(registry.has_type_tag("counter"));
}

TEST(Registry, Remove) {
    TypeRegistry registry;
    add_builtin_types(registry);
    registry.remove("list");
    EXPECT_FALSE(registry.has_type_tag("list"));
    EXPECT_THROW(registry.resolve_for_encode(List{}, "a"_path), UnsupportedTypeError);
    EXPECT_THROW(registry.resolve_for_encode(Value::make<Pair>(), "a"_path), UnsupportedTypeError);
}

TEST(Registry, AddDecoderOnly) {
    TypeRegistry registry;
    registry.add_decoder("legacy_int", new codecs::IntCodec());
    EXPECT_TRUE(registry.has_type_tag("legacy_int"));
    EXPECT_THROW(registry.resolve_for_encode(1, "a"_path), UnsupportedTypeError);
}

TEST(Registry, SnapshotIsolation) {
    auto r_before = default_registry();
    register_stateful<Counter>("test_counter");
    Finally finally{ [] () { update_default_registry([] (TypeRegistry& registry) { registry.remove("test_counter"); }); } };

    auto r_after = default_registry();
    EXPECT_FALSE(r_before->has_type_tag("test_counter"));
    EXPECT_TRUE(r_after->has_type_tag("test_counter"));
}

TEST(Codecs, Scalars) {
    codecs::IntCodec int_codec;
    auto encoding = int_codec.encode(-5);
    EXPECT_EQ(encoding.kind, ContainerKind::SCALAR);
    EXPECT_EQ(encoding.inline_value, -5);
    EXPECT_FALSE(encoding.payload.has_value());
    EXPECT_EQ(int_codec.decode(encoding), -5);

    Encoding from_uint{.inline_value = UInt{5}};
    EXPECT_EQ(int_codec.decode(from_uint).type(), Value::INT);

    codecs::FloatCodec float_codec;
    Encoding from_int{.inline_value = 2};
    auto value = float_codec.decode(from_int);
    EXPECT_EQ(value.type(), Value::FLOAT);
    EXPECT_EQ(value, 2.0);
}

TEST(Codecs, MissingInline) {
    codecs::StrCodec codec;
    EXPECT_THROW(codec.decode(Encoding{}), StashException);
}

TEST(Codecs, BytesUsePayload) {
    codecs::BytesCodec codec;
    auto encoding = codec.encode(Bytes{1, 2, 3});
    ASSERT_TRUE(encoding.payload.has_value());
    EXPECT_EQ(*encoding.payload, (Bytes{1, 2, 3}));
    EXPECT_TRUE(encoding.inline_value.is_empty());
    EXPECT_EQ(codec.decode(encoding), Value{Bytes{1, 2, 3}});
    EXPECT_THROW(codec.decode(Encoding{}), StashException);
}

TEST(Codecs, ContainersExposeChildren) {
    codecs::ListCodec list_codec;
    Value list = List{1, "a"};
    auto encoding = list_codec.encode(list);
    EXPECT_EQ(encoding.kind, ContainerKind::SEQUENCE);
    EXPECT_TRUE(encoding.children.is(list));

    codecs::MappingLikeCodec mapping_codec;
    auto map_encoding = mapping_codec.encode(Value::make<Settings>());
    EXPECT_EQ(map_encoding.kind, ContainerKind::MAPPING);
    EXPECT_EQ(map_encoding.children.get("debug"), true);
}

TEST(Codecs, Stateful) {
    codecs::StatefulCodec<Counter> codec;
    auto value = Value::make<Counter>();
    value.as<Counter>().n = 5;

    auto encoding = codec.encode(value);
    EXPECT_EQ(encoding.kind, ContainerKind::OBJECT);
    EXPECT_EQ(encoding.children.get("n"), 5);

    auto decoded = codec.decode(encoding);
    ASSERT_NE(decoded.as_opaque<Counter>(), nullptr);
    EXPECT_EQ(decoded.as<Counter>().n, 5);
    EXPECT_EQ(decoded, value);
}

TEST(Codecs, StatefulStateMustBeMap) {
    codecs::StatefulCodec<BadState> codec;
    EXPECT_THROW(codec.encode(Value::make<BadState>()), StashException);
}
