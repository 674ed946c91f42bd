/// @b License: @n Apache License v2.0
/// @copyright Robert Dunnagan
#pragma once

#include <stash/core/Key.hxx>
#include <stash/support/parse.hxx>

#include <sstream>
#include <vector>

namespace stash {

using KeyList = std::vector<Key>;

/////////////////////////////////////////////////////////////////////////////
/// A sequence of keys addressing one node of a stored object graph.
/// - The textual form is `a.b[0]['x y']`.  Names that are not identifiers
///   are quoted with single quotes, and backslash escapes quotes.
/// - The empty path addresses the root.
/// - The canonical text form, @ref to_str, is the metadata index key.
/////////////////////////////////////////////////////////////////////////////
class Path
{
  public:
    using Iterator = KeyList::iterator;
    using ConstIterator = KeyList::const_iterator;

    Path() {}

    /// Construct a path from a string path specification.
    /// @param spec The string to parse.
    /// @throws parse::SyntaxError if the specification is malformed.
    Path(const StringView& spec);
    Path(const char* spec) : Path(StringView{spec}) {}
    Path(const String& spec) : Path(StringView{spec}) {}

    Path(const KeyList& keys) : m_keys{keys} {}
    Path(KeyList&& keys)      : m_keys{std::forward<KeyList>(keys)} {}
    Path(std::initializer_list<Key> keys) : m_keys{keys} {}

    void append(const Key& key) { m_keys.push_back(key); }
    void append(Key&& key)      { m_keys.emplace_back(std::forward<Key>(key)); }

    /// Returns a new path extended by one key.
    Path child(const Key& key) const {
        Path path{*this};
        path.append(key);
        return path;
    }

    /// Returns a copy of this path excepting the last key.
    Path parent() const {
        if (m_keys.size() < 2) return {};
        return KeyList{m_keys.begin(), m_keys.end() - 1};
    }

    /// Returns the first `n` keys of this path.
    Path prefix(size_t n) const {
        if (n >= m_keys.size()) return *this;
        return KeyList{m_keys.begin(), m_keys.begin() + n};
    }

    /// Returns this path with its first `n` keys replaced by `head`.
    Path rebase(size_t n, const Path& head) const {
        Path path{head};
        for (size_t i = n; i < m_keys.size(); ++i)
            path.append(m_keys[i]);
        return path;
    }

    const Key& tail() const {
        if (m_keys.size() == 0) throw StashException{"Empty path has no tail"};
        return m_keys.back();
    }

    bool is_root() const { return m_keys.size() == 0; }
    size_t size() const  { return m_keys.size(); }

    const Key& operator [] (size_t i) const { return m_keys[i]; }

    Iterator begin() { return m_keys.begin(); }
    Iterator end()   { return m_keys.end(); }
    ConstIterator begin() const { return m_keys.cbegin(); }
    ConstIterator end() const   { return m_keys.cend(); }

    bool operator == (const Path& other) const { return m_keys == other.m_keys; }

    String to_str() const {
        std::stringstream ss;
        bool is_first = true;
        for (auto& key : m_keys) {
            key.to_step(ss, is_first);
            is_first = false;
        }
        return ss.str();
    }

  private:
    static Key parse_brace_key(const StringView& spec, StringView::const_iterator& it);
    static Key parse_dot_key(const StringView& spec, StringView::const_iterator& it);
    static String parse_quoted(const StringView& spec, StringView::const_iterator& it);
    static void consume_whitespace(const StringView& spec, StringView::const_iterator& it);

  private:
    KeyList m_keys;
};

inline
Path::Path(const StringView& spec) {
    auto it = spec.cbegin();
    consume_whitespace(spec, it);
    if (it == spec.cend()) return;

    char c = *it;
    if (c != '.' && c != '[') {
        append(parse_dot_key(spec, it));
    }

    while (it != spec.cend()) {
        char c = *it;
        if (c == '.') {
            if (++it == spec.cend())
                throw parse::SyntaxError{spec, it - spec.cbegin(), "Expected key:"};
            append(parse_dot_key(spec, it));
        } else if (c == '[') {
            if (++it == spec.cend())
                throw parse::SyntaxError{spec, it - spec.cbegin(), "Missing closing ']':"};
            append(parse_brace_key(spec, it));
        } else {
            throw parse::SyntaxError{spec, it - spec.cbegin(), "Expected '.' or '[':"};
        }
    }
}

inline
Key Path::parse_brace_key(const StringView& spec, StringView::const_iterator& it) {
    auto key_start = it;
    consume_whitespace(spec, it);
    if (it == spec.cend()) throw parse::SyntaxError{spec, key_start - spec.cbegin(), "Missing closing ']':"};
    char c = *it;
    if (c == '\'' || c == '"') {
        auto key = parse_quoted(spec, it);
        consume_whitespace(spec, it);
        if (it == spec.cend() || *it != ']') throw parse::SyntaxError{spec, key_start - spec.cbegin(), "Missing closing ']':"};
        ++it;
        return key;
    } else {
        for (; it != spec.cend() && *it != ']'; ++it);
        if (it == spec.cend()) throw parse::SyntaxError{spec, key_start - spec.cbegin(), "Missing closing ']':"};
        StringView key{key_start, it};
        ++it;
        try {
            return str_to_int(key);
        } catch (const StashException&) {
            throw parse::SyntaxError{spec, key_start - spec.cbegin(), "Expected integer index:"};
        }
    }
}

inline
Key Path::parse_dot_key(const StringView& spec, StringView::const_iterator& it) {
    auto key_start = it;
    for (; it != spec.cend() && (std::isalnum((unsigned char)*it) || *it == '_'); ++it);
    if (it == key_start) throw parse::SyntaxError{spec, key_start - spec.cbegin(), "Expected key:"};
    return StringView{key_start, it};
}

inline
String Path::parse_quoted(const StringView& spec, StringView::const_iterator& it) {
    char quote = *it; ++it;
    String key;
    bool escaped = false;
    for (; it != spec.cend(); ++it) {
        char c = *it;
        if (escaped) {
            key.push_back(c);
            escaped = false;
        } else if (c == '\\') {
            escaped = true;
        } else if (c == quote) {
            ++it;
            return key;
        } else {
            key.push_back(c);
        }
    }
    throw parse::SyntaxError(spec, spec.size() - 1, "Missing closing quote:");
}

inline
void Path::consume_whitespace(const StringView& spec, StringView::const_iterator& it) {
    for (; it != spec.cend() && std::isspace((unsigned char)*it); ++it);
}

inline
Path operator ""_path (const char* str, size_t size) {
    return StringView{str, size};
}

inline
std::ostream& operator << (std::ostream& os, const Path& path) {
    return os << path.to_str();
}

} // namespace stash
