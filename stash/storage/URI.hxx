/// @b License: @n Apache License v2.0
/// @copyright Robert Dunnagan
#pragma once

#include <stash/core/Value.hxx>
#include <stash/support/exception.hxx>

#include <regex>

namespace stash {

/////////////////////////////////////////////////////////////////////////////
/// A parsed URI.
/// - The parts are stored in a map with the keys `scheme`, `user`, `host`,
///   `port`, `path`, `query` and `fragment`.  Only the parts present in the
///   specification are stored.
/// - The `query` part is itself a map of the query parameters.
/// - Examples: `file:///tmp/a.zip`, `file://?path=rel/a.zip`, `mem://name`.
/////////////////////////////////////////////////////////////////////////////
class URI : public Value
{
  public:
    URI(const String& s) : Value{nil} { parse(s); }
    URI(const char* s)   : URI(String{s}) {}

    /// Returns the scheme, or an empty string.
    String scheme() const { return part("scheme"); }
    String host() const   { return part("host"); }
    String path() const   { return part("path"); }

    /// Returns the query parameter, or nil.
    Value query(const String& key) const {
        if (!is_valid()) return nil;
        auto query = get("query");
        if (query.is_nil()) return nil;
        return query.get(key);
    }

    /// Returns the query parameters, or an empty map.
    Map query() const {
        if (!is_valid()) return {};
        auto query = get("query");
        if (query.is_nil()) return {};
        return query.as<Map>();
    }

    bool is_valid() const { return type() == Value::MAP; }

    const String& spec() const { return m_spec; }

  private:
    String part(const String& key) const {
        if (!is_valid()) return {};
        auto value = get(key);
        if (value.is_nil()) return {};
        return value.type() == Value::STR? value.as<String>(): value.to_str();
    }

    void parse(const String&);
    Value parse_uri_query(const String&);

  private:
    String m_spec;
};

inline
Value URI::parse_uri_query(const String& query) {
    Value result = Value::MAP;
    auto it = query.cbegin();
    auto end = query.cend();
    std::string key;
    std::string val;
    std::string* p_target = &key;
    for (; it != end; ++it) {
        char c = *it;
        if (c == '=') {
            p_target = &val;
        } else if (c == '&' || c == ';') {
            p_target = &key;
            result.set(key, val);
            key.clear();
            val.clear();
        } else {
            p_target->push_back(c);
        }
    }
    if (key.size() != 0)
        result.set(key, val);
    return result;
}

inline
void URI::parse(const String& spec) {
    static std::regex uri_re{R"(([^:]+)://(([^@]+\@)?([^:/?#]*)(:(\d+))?)?((/[^?#]*)?(\?[^#]+)?(\#.*)?)?)"};

    m_spec = spec;
    std::smatch match;
    if (std::regex_match(spec, match, uri_re)) {
        (*(Value*)this) = Value{Value::MAP};
        if (match[1].length() > 0) set("scheme", match[1].str());
        if (match[3].length() > 0) set("user", match[3].str().substr(0, match[3].length() - 1));
        if (match[4].length() > 0) set("host", match[4].str());
        if (match[6].length() > 0) set("port", str_to_int(match[6].str()));
        if (match[8].length() > 0) set("path", match[8].str());
        if (match[9].length() > 0) set("query", parse_uri_query(match[9].str().substr(1)));
        if (match[10].length() > 0) set("fragment", match[10].str().substr(1));
    }
}

inline
URI operator ""_uri(const char* str, size_t size) {
    return URI{String{str, size}};
}

} // namespace stash
