/// @b License: @n Apache License v2.0
/// @copyright Robert Dunnagan
#pragma once

#include <stash/archive/codecs.hxx>

#include <algorithm>
#include <sstream>

namespace stash {

/////////////////////////////////////////////////////////////////////////////
/// A collection of distinct values held by a Value.
/// - Values are compared with `Value::operator ==`, so a list and a map may
///   be members.  Insertion order is kept.
/// - Two sets are equal when they hold the same members in any order.
/////////////////////////////////////////////////////////////////////////////
class Set : public SequenceLike
{
  public:
    Set() = default;
    Set(const List& items)                   { for (auto& item : items) add(item); }
    Set(std::initializer_list<Value> items)  { for (auto& item : items) add(item); }

    /// Returns false if an equal value is already a member.
    bool add(const Value& item) {
        if (contains(item)) return false;
        m_items.push_back(item);
        return true;
    }

    bool contains(const Value& item) const {
        return std::find(m_items.begin(), m_items.end(), item) != m_items.end();
    }

    size_t size() const { return m_items.size(); }
    const List& items() const { return m_items; }

    List to_list() const override  { return m_items; }
    Opaque* clone() const override { return new Set(m_items); }

    String str() const override {
        std::stringstream ss;
        ss << '{';
        for (size_t i = 0; i < m_items.size(); ++i) {
            if (i > 0) ss << ", ";
            ss << m_items[i];
        }
        ss << '}';
        return ss.str();
    }

    bool equals(const Opaque& other) const override {
        auto p_other = dynamic_cast<const Set*>(&other);
        if (p_other == nullptr || p_other->size() != size()) return false;
        for (auto& item : m_items)
            if (!p_other->contains(item)) return false;
        return true;
    }

  private:
    List m_items;
};

namespace codecs {

/// Members are stored as the children of a sequence, in insertion order.
class SetCodec : public Codec
{
  public:
    Encoding encode(const Value& value) const override {
        return {.kind = ContainerKind::SEQUENCE, .children = value.as<Set>().to_list()};
    }

    Value decode(const Encoding& encoding) const override {
        return Value::make<Set>(encoding.children.as<List>());
    }
};

} // namespace codecs
} // namespace stash
