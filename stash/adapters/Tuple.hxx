/// @b License: @n Apache License v2.0
/// @copyright Robert Dunnagan
#pragma once

#include <stash/archive/codecs.hxx>

#include <sstream>

namespace stash {

/////////////////////////////////////////////////////////////////////////////
/// A fixed sequence of values held by a Value.
/// - Stored like a list, under its own type tag, so that it is restored as
///   a Tuple rather than a List.
/////////////////////////////////////////////////////////////////////////////
class Tuple : public SequenceLike
{
  public:
    Tuple() = default;
    Tuple(const List& items) : m_items(items) {}
    Tuple(List&& items) : m_items(std::forward<List>(items)) {}
    Tuple(std::initializer_list<Value> items) : m_items{items} {}

    size_t size() const { return m_items.size(); }
    const Value& operator [] (size_t i) const { return m_items.at(i); }
    const List& items() const { return m_items; }

    List to_list() const override  { return m_items; }
    Opaque* clone() const override { return new Tuple(m_items); }

    String str() const override {
        std::stringstream ss;
        ss << '(';
        for (size_t i = 0; i < m_items.size(); ++i) {
            if (i > 0) ss << ", ";
            ss << m_items[i];
        }
        if (m_items.size() == 1) ss << ',';
        ss << ')';
        return ss.str();
    }

    bool equals(const Opaque& other) const override {
        auto p_other = dynamic_cast<const Tuple*>(&other);
        return p_other != nullptr && p_other->m_items == m_items;
    }

  private:
    List m_items;
};

namespace codecs {

class TupleCodec : public Codec
{
  public:
    Encoding encode(const Value& value) const override {
        return {.kind = ContainerKind::SEQUENCE, .children = value.as<Tuple>().to_list()};
    }

    Value decode(const Encoding& encoding) const override {
        return Value::make<Tuple>(encoding.children.as<List>());
    }
};

} // namespace codecs
} // namespace stash
