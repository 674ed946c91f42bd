/// @b License: @n Apache License v2.0
/// @copyright Robert Dunnagan
#pragma once

#include <stash/archive/Codec.hxx>
#include <stash/support/exception.hxx>

#include <fmt/format.h>

#include <memory>

namespace stash::codecs {

inline
void require_inline(const Encoding& encoding, std::string_view type_tag) {
    if (encoding.inline_value.is_empty())
        throw StashException{fmt::format("Missing inline value for type {}", type_tag)};
}

inline
const Bytes& require_payload(const Encoding& encoding, std::string_view type_tag) {
    if (!encoding.payload)
        throw StashException{fmt::format("Missing payload for type {}", type_tag)};
    return *encoding.payload;
}

class NilCodec : public Codec
{
  public:
    Encoding encode(const Value&) const override { return {.inline_value = nil}; }
    Value decode(const Encoding&) const override { return nil; }
};

class BoolCodec : public Codec
{
  public:
    Encoding encode(const Value& value) const override { return {.inline_value = value.as<bool>()}; }

    Value decode(const Encoding& encoding) const override {
        require_inline(encoding, "bool");
        return encoding.inline_value.as<bool>();
    }
};

class IntCodec : public Codec
{
  public:
    Encoding encode(const Value& value) const override { return {.inline_value = value.as<Int>()}; }

    Value decode(const Encoding& encoding) const override {
        require_inline(encoding, "int");
        auto& value = encoding.inline_value;
        switch (value.type()) {
            case Value::INT:  return value.as<Int>();
            case Value::UINT: return (Int)value.as<UInt>();
            default:          throw WrongType{value.type_name(), "int"};
        }
    }
};

class UIntCodec : public Codec
{
  public:
    Encoding encode(const Value& value) const override { return {.inline_value = value.as<UInt>()}; }

    Value decode(const Encoding& encoding) const override {
        require_inline(encoding, "uint");
        auto& value = encoding.inline_value;
        switch (value.type()) {
            case Value::INT:  return (UInt)value.as<Int>();
            case Value::UINT: return value.as<UInt>();
            default:          throw WrongType{value.type_name(), "uint"};
        }
    }
};

class FloatCodec : public Codec
{
  public:
    Encoding encode(const Value& value) const override { return {.inline_value = value.as<Float>()}; }

    Value decode(const Encoding& encoding) const override {
        require_inline(encoding, "float");
        return encoding.inline_value.to_float();
    }
};

class StrCodec : public Codec
{
  public:
    Encoding encode(const Value& value) const override { return {.inline_value = value.as<String>()}; }

    Value decode(const Encoding& encoding) const override {
        require_inline(encoding, "str");
        return encoding.inline_value.as<String>();
    }
};

/// Binary data is stored in a payload member.
class BytesCodec : public Codec
{
  public:
    Encoding encode(const Value& value) const override {
        return {.payload = value.as<Bytes>(), .extension = "bin"};
    }

    Value decode(const Encoding& encoding) const override {
        return require_payload(encoding, "bytes");
    }
};

class ListCodec : public Codec
{
  public:
    Encoding encode(const Value& value) const override {
        return {.kind = ContainerKind::SEQUENCE, .children = value};
    }

    Value decode(const Encoding& encoding) const override {
        return encoding.children;
    }
};

class MapCodec : public Codec
{
  public:
    Encoding encode(const Value& value) const override {
        return {.kind = ContainerKind::MAPPING, .children = value};
    }

    Value decode(const Encoding& encoding) const override {
        return encoding.children;
    }
};

/// Stores a SequenceLike object as a plain list.
class SequenceLikeCodec : public Codec
{
  public:
    Encoding encode(const Value& value) const override {
        auto p_seq = value.as_opaque<SequenceLike>();
        if (p_seq == nullptr) throw WrongType{value.type_name(), "SequenceLike"};
        return {.kind = ContainerKind::SEQUENCE, .children = p_seq->to_list()};
    }

    Value decode(const Encoding& encoding) const override {
        return encoding.children;
    }
};

/// Stores a MappingLike object as a plain map.
class MappingLikeCodec : public Codec
{
  public:
    Encoding encode(const Value& value) const override {
        auto p_map = value.as_opaque<MappingLike>();
        if (p_map == nullptr) throw WrongType{value.type_name(), "MappingLike"};
        return {.kind = ContainerKind::MAPPING, .children = p_map->to_map()};
    }

    Value decode(const Encoding& encoding) const override {
        return encoding.children;
    }
};

/////////////////////////////////////////////////////////////////////////////
/// Codec for a user-defined type implementing Stateful.
/// - The state map becomes the children of the stored node.
/// - Decoding default constructs a `T` and passes it the decoded state.
/////////////////////////////////////////////////////////////////////////////
template <class T>
class StatefulCodec : public Codec
{
  public:
    static_assert(std::is_base_of<Stateful, T>::value);

    Encoding encode(const Value& value) const override {
        auto p_obj = value.as_opaque<T>();
        if (p_obj == nullptr) throw WrongType{value.type_name(), typeid(T).name()};
        auto state = p_obj->get_state();
        if (state.type() != Value::MAP)
            throw StashException{fmt::format("get_state returned {}, expected map", state.type_name())};
        return {.kind = ContainerKind::OBJECT, .children = state};
    }

    Value decode(const Encoding& encoding) const override {
        auto p_obj = std::make_unique<T>();
        p_obj->set_state(encoding.children);
        return Value{std::unique_ptr<Opaque>{p_obj.release()}};
    }
};

} // namespace stash::codecs
