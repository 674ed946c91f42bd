/// @b License: @n Apache License v2.0
/// @copyright Robert Dunnagan
#pragma once

#include <stash/support/types.hxx>
#include <stash/support/string.hxx>
#include <stash/support/exception.hxx>

#include <cctype>
#include <functional>
#include <ostream>

namespace stash {

/////////////////////////////////////////////////////////////////////////////
/// One step of a Path.
/// - A string key selects a map entry, or a field of a stateful object.
/// - An integer key selects a list element.
/////////////////////////////////////////////////////////////////////////////
class Key
{
  public:
    enum ReprIX {
        INT,
        STR
    };

  public:
    Key()                    : m_repr_ix{STR} {}
    Key(is_like_Int auto v)  : m_repr_ix{INT}, m_index{(Int)v} {}
    Key(is_like_UInt auto v) : m_repr_ix{INT}, m_index{(Int)v} {}
    Key(const char* s)       : m_repr_ix{STR}, m_name{s} {}
    Key(const String& s)     : m_repr_ix{STR}, m_name{s} {}
    Key(String&& s)          : m_repr_ix{STR}, m_name{std::forward<String>(s)} {}
    Key(const StringView& s) : m_repr_ix{STR}, m_name{s} {}

    ReprIX type() const { return m_repr_ix; }
    bool is_index() const { return m_repr_ix == INT; }
    bool is_name() const { return m_repr_ix == STR; }

    Int index() const {
        if (m_repr_ix != INT) throw WrongType{"string", "int"};
        return m_index;
    }

    const String& name() const {
        if (m_repr_ix != STR) throw WrongType{"int", "string"};
        return m_name;
    }

    bool operator == (const Key& other) const {
        if (m_repr_ix != other.m_repr_ix) return false;
        return m_repr_ix == INT? m_index == other.m_index: m_name == other.m_name;
    }

    size_t hash() const {
        return m_repr_ix == INT? std::hash<Int>{}(m_index): std::hash<String>{}(m_name);
    }

    /// Write this key as a path step, `.name`, `[index]` or `['quoted name']`.
    void to_step(std::ostream& stream, bool is_first = false) const {
        if (m_repr_ix == INT) {
            stream << '[' << int_to_str(m_index) << ']';
        } else if (is_identifier(m_name)) {
            if (!is_first) stream << '.';
            stream << m_name;
        } else {
            stream << '[' << quoted(m_name, '\'') << ']';
        }
    }

    String to_str() const {
        return m_repr_ix == INT? int_to_str(m_index): m_name;
    }

    static bool is_identifier(const StringView& name) {
        if (name.size() == 0) return false;
        for (char c : name)
            if (!std::isalnum((unsigned char)c) && c != '_')
                return false;
        return true;
    }

  private:
    ReprIX m_repr_ix;
    Int m_index = 0;
    String m_name;
};

struct KeyHash
{
    size_t operator () (const Key& key) const { return key.hash(); }
};

inline
std::ostream& operator << (std::ostream& os, const Key& key) {
    return os << key.to_str();
}

} // namespace stash
