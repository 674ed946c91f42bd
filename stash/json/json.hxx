/// @b License: @n Apache License v2.0
/// @copyright Robert Dunnagan
#pragma once

#include <stash/core/Value.hxx>
#include <stash/support/parse.hxx>
#include <stash/support/exception.hxx>

#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <cstring>
#include <ctype.h>
#include <fstream>
#include <sstream>

namespace stash {
namespace json {

namespace impl {

template <typename StreamType>
struct Parser
{
  public:
    Parser(const StreamType& stream) : m_it{stream} {}

    Parser(Parser&&) =  default;
    Parser(const Parser&) = delete;
    auto operator = (Parser&&) = delete;
    auto operator = (const Parser&) = delete;

    bool parse_document();
    bool parse_object(char term_char);
    bool parse_number();
    bool parse_string();
    bool parse_map();
    bool parse_list();

    template <typename T>
    bool expect(const char* seq, T value);

    bool parse_escape(std::string& str);
    void consume_whitespace();
    void create_error(const std::string& message);

    StreamType m_it;
    Value m_curr;
    std::string m_scratch;
    std::string m_error;
    size_t m_error_offset = 0;
};

template <typename StreamType>
bool Parser<StreamType>::parse_document()
{
    m_curr = nil;
    if (!parse_object('\0')) {
        if (m_error.size() == 0) create_error("No object in json stream");
        return false;
    }
    consume_whitespace();
    if (!m_it.done()) {
        create_error("Unexpected trailing characters");
        return false;
    }
    return true;
}

template <typename StreamType>
bool Parser<StreamType>::parse_object(char term_char)
{
    for (; !m_it.done(); m_it.next()) {
        switch (m_it.peek())
        {
            case ' ':
            case '\t':
            case '\r':
            case '\n':
                continue;

            case '-':
            case '0':
            case '1':
            case '2':
            case '3':
            case '4':
            case '5':
            case '6':
            case '7':
            case '8':
            case '9':
                return parse_number();

            case '"':
                return parse_string();

            case '[': return parse_list();
            case '{': return parse_map();

            case 't': return expect("true", true);
            case 'f': return expect("false", false);
            case 'n': return expect("null", nil);
            case 'N': return expect("NaN", std::nan(""));
            case 'I': return expect("Infinity", HUGE_VAL);

            default:
                if (m_it.peek() != term_char) create_error("Unexpected character");
                return false;
        }
    }
    return false;
}

template <typename StreamType>
bool Parser<StreamType>::parse_number() {
    m_scratch.clear();

    bool is_done = false;
    bool is_float = false;
    for (; !m_it.done(); m_it.next()) {
        char c = m_it.peek();
        switch (c) {
            case '+':
            case '-':
            case '0':
            case '1':
            case '2':
            case '3':
            case '4':
            case '5':
            case '6':
            case '7':
            case '8':
            case '9':
                break;
            case '.':
            case 'e':
            case 'E':
                is_float = true;
                break;
            case 'I':
                if (m_scratch == "-") {
                    m_scratch.clear();
                    return expect("Infinity", -HUGE_VAL);
                }
                is_done = true;
                break;
            default:
                is_done = true;
                break;
        }
        if (is_done) break;
        m_scratch.push_back(c);
    }

    const char* str = m_scratch.c_str();
    const char* scratch_end = str + m_scratch.size();
    char* end = 0;
    errno = 0;
    if (is_float) {
        m_curr = Value{strtod(str, &end)};
    } else {
        m_curr = Value{(Int)strtoll(str, &end, 10)};
        if (errno == ERANGE && str[0] != '-') {
            errno = 0;
            m_curr = Value{(UInt)strtoull(str, &end, 10)};
        }
    }

    if (errno) {
        create_error(strerror(errno));
        errno = 0;
        return false;
    } else if (end != scratch_end) {
        create_error("Numeric syntax error");
        return false;
    } else {
        return true;
    }
}

template <typename StreamType>
bool Parser<StreamType>::parse_escape(std::string& str) {
    char c = m_it.peek();
    switch (c) {
        case '"':  str.push_back('"'); break;
        case '\\': str.push_back('\\'); break;
        case '/':  str.push_back('/'); break;
        case 'b':  str.push_back('\b'); break;
        case 'f':  str.push_back('\f'); break;
        case 'n':  str.push_back('\n'); break;
        case 'r':  str.push_back('\r'); break;
        case 't':  str.push_back('\t'); break;
        case 'u': {
            auto read_hex4 = [this] (uint32_t& code) -> bool {
                code = 0;
                for (int i = 0; i < 4; ++i) {
                    m_it.next();
                    if (m_it.done()) return false;
                    char h = m_it.peek();
                    code <<= 4;
                    if (h >= '0' && h <= '9')      code |= h - '0';
                    else if (h >= 'a' && h <= 'f') code |= h - 'a' + 10;
                    else if (h >= 'A' && h <= 'F') code |= h - 'A' + 10;
                    else return false;
                }
                return true;
            };

            uint32_t code;
            if (!read_hex4(code)) {
                create_error("Invalid unicode escape");
                return false;
            }

            // surrogate pair
            if (code >= 0xD800 && code <= 0xDBFF) {
                m_it.next();
                if (m_it.done() || m_it.peek() != '\\') { create_error("Invalid surrogate pair"); return false; }
                m_it.next();
                if (m_it.done() || m_it.peek() != 'u') { create_error("Invalid surrogate pair"); return false; }
                uint32_t low;
                if (!read_hex4(low) || low < 0xDC00 || low > 0xDFFF) {
                    create_error("Invalid surrogate pair");
                    return false;
                }
                code = 0x10000 + ((code - 0xD800) << 10) + (low - 0xDC00);
            }

            // utf-8 encode
            if (code < 0x80) {
                str.push_back((char)code);
            } else if (code < 0x800) {
                str.push_back((char)(0xC0 | (code >> 6)));
                str.push_back((char)(0x80 | (code & 0x3F)));
            } else if (code < 0x10000) {
                str.push_back((char)(0xE0 | (code >> 12)));
                str.push_back((char)(0x80 | ((code >> 6) & 0x3F)));
                str.push_back((char)(0x80 | (code & 0x3F)));
            } else {
                str.push_back((char)(0xF0 | (code >> 18)));
                str.push_back((char)(0x80 | ((code >> 12) & 0x3F)));
                str.push_back((char)(0x80 | ((code >> 6) & 0x3F)));
                str.push_back((char)(0x80 | (code & 0x3F)));
            }
            break;
        }
        default:
            create_error("Invalid escape sequence");
            return false;
    }
    return true;
}

template <typename StreamType>
bool Parser<StreamType>::parse_string() {
    m_it.next();  // consume "
    bool closed = false;
    std::string str;
    for(; !m_it.done(); m_it.next()) {
        char c = m_it.peek();
        if (c == '\\') {
            m_it.next();
            if (m_it.done()) break;
            if (!parse_escape(str)) return false;
        } else if (c == '"') {
            m_it.next();
            closed = true;
            break;
        } else {
            str.push_back(c);
        }
    }

    if (!closed) {
        create_error("Unterminated string");
        return false;
    }

    m_curr = Value{std::move(str)};
    return true;
}

template <typename StreamType>
bool Parser<StreamType>::parse_list() {
    List list;
    m_it.next();  // consume [
    consume_whitespace();
    if (m_it.peek() == ']') {
        m_it.next();
        m_curr = Value{std::move(list)};
        return true;
    }
    while (!m_it.done()) {
        if (!parse_object(']')) {
            if (m_error.size() == 0) create_error("Expected value or object");
            return false;
        }
        list.push_back(m_curr);
        consume_whitespace();
        char c = m_it.peek();
        if (c == ']') {
            m_it.next();
            m_curr = Value{std::move(list)};
            return true;
        } else if (c == ',') {
            m_it.next();
            continue;
        } else {
            create_error("Expected token ',' or ']'");
            return false;
        }
    }

    create_error("Unterminated list");
    return false;
}

template <typename StreamType>
bool Parser<StreamType>::parse_map() {
    Map map;

    m_it.next();  // consume {
    consume_whitespace();
    if (m_it.peek() == '}') {
        m_it.next();
        m_curr = Value{std::move(map)};
        return true;
    }

    while (!m_it.done()) {
        // key
        consume_whitespace();
        if (m_it.peek() != '"') {
            create_error("Expected dictionary key");
            return false;
        }
        if (!parse_string()) return false;
        String key = m_curr.as<String>();

        consume_whitespace();
        char c = m_it.peek();
        if (c != ':') {
            create_error("Expected token ':'");
            return false;
        }

        // consume :
        m_it.next();

        // value
        if (!parse_object('}')) {
            if (m_error.size() == 0) create_error("Expected dictionary value or object");
            return false;
        }

        map.insert_or_assign(key, m_curr);
        consume_whitespace();

        c = m_it.peek();
        if (c == '}') {
            m_it.next();
            m_curr = Value{std::move(map)};
            return true;
        } else if (c == ',') {
            m_it.next();
            continue;
        } else {
            create_error("Expected token ',' or '}'");
            return false;
        }
    }

    create_error("Unterminated map");
    return false;
}

template <typename StreamType>
template <typename T>
bool Parser<StreamType>::expect(const char* seq, T value) {
    const char* seq_it = seq;
    for (; *seq_it != 0 && !m_it.done(); m_it.next(), seq_it++) {
        if (*seq_it != m_it.peek()) {
            create_error("Invalid literal");
            return false;
        }
    }
    if (*seq_it != 0) {
        create_error("Invalid literal");
        return false;
    }
    m_curr = Value{value};
    return true;
}

template <typename StreamType>
void Parser<StreamType>::consume_whitespace()
{
    while (!m_it.done() && std::isspace((unsigned char)m_it.peek())) m_it.next();
}

template <typename StreamType>
void Parser<StreamType>::create_error(const std::string& message)
{
    m_error = message;
    m_error_offset = m_it.consumed();
    m_curr = Value{};
}

} // namespace impl


/// Parse a JSON document.
/// @throws parse::SyntaxError with the offset of the first error.
inline
Value parse(const std::string_view& str) {
    impl::Parser parser{parse::StringStreamAdapter{str}};
    if (!parser.parse_document())
        throw parse::SyntaxError{str, (std::ptrdiff_t)parser.m_error_offset, "JSON parse error: "s + parser.m_error};
    return parser.m_curr;
}

inline
Value parse(std::istream& stream) {
    impl::Parser parser{parse::StreamAdapter{stream}};
    if (!parser.parse_document())
        throw parse::SyntaxError{(std::ptrdiff_t)parser.m_error_offset, "JSON parse error: "s + parser.m_error};
    return parser.m_curr;
}

inline
Value parse_file(const std::string& file_name) {
    std::ifstream f_in{file_name, std::ios::in};
    if (!f_in.is_open())
        throw StashException{"Error opening file: "s + file_name};
    return parse(f_in);
}

//----------------------------------------------------------------------------------
// Writer
//----------------------------------------------------------------------------------

inline
void write_string(std::ostream& os, const std::string_view& str) {
    static const char* hex = "0123456789abcdef";
    os << '"';
    for (char c : str) {
        switch (c) {
            case '"':  os << "\\\""; break;
            case '\\': os << "\\\\"; break;
            case '\b': os << "\\b"; break;
            case '\f': os << "\\f"; break;
            case '\n': os << "\\n"; break;
            case '\r': os << "\\r"; break;
            case '\t': os << "\\t"; break;
            default:
                if ((unsigned char)c < 0x20) {
                    os << "\\u00" << hex[(c >> 4) & 0xF] << hex[c & 0xF];
                } else {
                    os << c;
                }
                break;
        }
    }
    os << '"';
}

inline
void write_float(std::ostream& os, Float f) {
    if (std::isnan(f))      os << "NaN";
    else if (std::isinf(f)) os << (f < 0? "-Infinity": "Infinity");
    else                    os << float_to_str(f);
}

namespace impl {

inline
void newline(std::ostream& os, int indent, int depth) {
    if (indent <= 0) return;
    os << '\n';
    for (int i = 0; i < indent * depth; ++i) os << ' ';
}

inline
void write(std::ostream& os, const Value& value, int indent, int depth) {
    switch (value.type()) {
        case Value::NIL:   os << "null"; break;
        case Value::BOOL:  os << (value.as<bool>()? "true": "false"); break;
        case Value::INT:   os << int_to_str(value.as<Int>()); break;
        case Value::UINT:  os << int_to_str(value.as<UInt>()); break;
        case Value::FLOAT: write_float(os, value.as<Float>()); break;
        case Value::STR:   write_string(os, value.as<String>()); break;
        case Value::LIST: {
            auto& list = value.as<List>();
            if (list.size() == 0) { os << "[]"; break; }
            os << '[';
            bool first = true;
            for (auto& item : list) {
                if (!first) os << ',';
                if (indent <= 0 && !first) os << ' ';
                newline(os, indent, depth + 1);
                write(os, item, indent, depth + 1);
                first = false;
            }
            newline(os, indent, depth);
            os << ']';
            break;
        }
        case Value::MAP: {
            auto& map = value.as<Map>();
            if (map.size() == 0) { os << "{}"; break; }
            os << '{';
            bool first = true;
            for (auto& [key, item] : map) {
                if (!first) os << ',';
                if (indent <= 0 && !first) os << ' ';
                newline(os, indent, depth + 1);
                write_string(os, key);
                os << ": ";
                write(os, item, indent, depth + 1);
                first = false;
            }
            newline(os, indent, depth);
            os << '}';
            break;
        }
        default:
            throw WrongType{value.type_name(), "json"};
    }
}

} // namespace impl

/// Write a value as JSON text.
/// @param indent Number of spaces per nesting level, or 0 for single line output.
/// @throws WrongType if the value, or any value it contains, is bytes or a
/// user-defined object.
inline
void write(std::ostream& os, const Value& value, int indent = 0) {
    impl::write(os, value, indent, 0);
}

inline
String to_json(const Value& value, int indent = 0) {
    std::stringstream ss;
    write(ss, value, indent);
    return ss.str();
}

/// Returns true if the value, and everything it contains, is JSON representable.
inline
bool is_json(const Value& value) {
    switch (value.type()) {
        case Value::NIL:
        case Value::BOOL:
        case Value::INT:
        case Value::UINT:
        case Value::FLOAT:
        case Value::STR:   return true;
        case Value::LIST: {
            for (auto& item : value.as<List>())
                if (!is_json(item)) return false;
            return true;
        }
        case Value::MAP: {
            for (auto& [key, item] : value.as<Map>())
                if (!is_json(item)) return false;
            return true;
        }
        default:
            return false;
    }
}

} // namespace json
} // namespace stash
