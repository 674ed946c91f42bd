/// @b License: @n Apache License v2.0
/// @copyright Robert Dunnagan
#pragma once

#include <stash/core/Value.hxx>
#include <stash/support/parse.hxx>

#include <fmt/format.h>

#include <optional>
#include <sstream>

namespace stash {
namespace csv {

namespace impl {

/////////////////////////////////////////////////////////////////////////////
/// RFC-4180 style CSV parser.
/// - Returns a list of rows, each a list of cells.
/// - A quoted cell is always a string, and `""` inside quotes is a literal
///   quote.  An empty unquoted cell is nil.
/////////////////////////////////////////////////////////////////////////////
template <typename StreamType>
class Parser
{
  public:
    Parser(const StreamType& stream) : m_it{stream} {}

    Value parse();

    size_t pos() const               { return m_it.consumed(); }
    const std::string& error() const { return m_error; }

  private:
    bool parse_row(List& table);
    bool parse_field(List& row);
    bool parse_quoted(String& str);
    void parse_unquoted(String& str);
    void set_error(const std::string& message);

  private:
    StreamType m_it;
    std::string m_error;
};


template <typename StreamType>
Value Parser<StreamType>::parse() {
    List table;
    while (!m_it.done())
        if (!parse_row(table))
            return Value{};
    return table;
}

template <typename StreamType>
bool Parser<StreamType>::parse_row(List& table) {
    List row;

    while (true) {
        if (!parse_field(row)) return false;
        if (m_it.done()) {
            table.push_back(std::move(row));
            return true;
        }
        char c = m_it.peek();
        switch (c) {
            case ',':
                m_it.next();
                if (m_it.done()) {
                    row.push_back(nil);
                    table.push_back(std::move(row));
                    return true;
                }
                break;
            case '\r':
                m_it.next();
                if (!m_it.done() && m_it.peek() == '\n') m_it.next();
                table.push_back(std::move(row));
                return true;
            case '\n':
                m_it.next();
                table.push_back(std::move(row));
                return true;
            default:
                set_error("Expected comma or new-line");
                return false;
        }
    }
}

template <typename StreamType>
bool Parser<StreamType>::parse_field(List& row) {
    if (m_it.done()) {
        row.push_back(nil);
        return true;
    }
    char c = m_it.peek();
    switch (c) {
        case ',':
        case '\r':
        case '\n':
            row.push_back(nil);
            return true;
        case '"': {
            String str;
            if (!parse_quoted(str)) return false;
            row.push_back(std::move(str));
            return true;
        }
        default: {
            String str;
            parse_unquoted(str);
            row.push_back(std::move(str));
            return true;
        }
    }
}

template <typename StreamType>
bool Parser<StreamType>::parse_quoted(String& str) {
    m_it.next();  // consume "
    while (!m_it.done()) {
        char c = m_it.peek();
        m_it.next();
        if (c == '"') {
            if (!m_it.done() && m_it.peek() == '"') {
                str.push_back('"');
                m_it.next();
            } else {
                return true;
            }
        } else {
            str.push_back(c);
        }
    }
    set_error("Unterminated quoted field");
    return false;
}

template <typename StreamType>
void Parser<StreamType>::parse_unquoted(String& str) {
    for (char c = m_it.peek(); !m_it.done() && c != ',' && c != '\n' && c != '\r'; m_it.next(), c = m_it.peek()) {
        str.push_back(c);
    }
}

template <typename StreamType>
void Parser<StreamType>::set_error(const std::string& message) {
    m_error = message;
}

} // namespace impl


struct ParseError
{
    size_t error_offset = 0;
    std::string error_message;

    std::string to_str() const {
        return fmt::format("CSV parse error at {}: {}", error_offset, error_message);
    }
};


inline
Value parse(const std::string_view& str, std::optional<ParseError>& error) {
    impl::Parser parser{parse::StringStreamAdapter{str}};
    Value result = parser.parse();
    if (result.is_empty())
        error = ParseError{parser.pos(), parser.error()};
    return result;
}

/// Parse CSV text into a list of rows.
/// @throws parse::SyntaxError if the text is malformed.
inline
Value parse(const std::string_view& str) {
    std::optional<ParseError> error;
    Value result = parse(str, error);
    if (error)
        throw parse::SyntaxError{str, (std::ptrdiff_t)error->error_offset, error->to_str()};
    return result;
}

inline
void write_cell(std::ostream& os, const Value& cell) {
    switch (cell.type()) {
        case Value::NIL:   break;
        case Value::BOOL:  os << (cell.as<bool>()? "true": "false"); break;
        case Value::INT:   os << int_to_str(cell.as<Int>()); break;
        case Value::UINT:  os << int_to_str(cell.as<UInt>()); break;
        case Value::FLOAT: os << float_to_str(cell.as<Float>()); break;
        case Value::STR: {
            auto& str = cell.as<String>();
            if (str.size() > 0 && str.find_first_of(",\"\r\n") == String::npos) {
                os << str;
            } else {
                os << '"';
                for (char c : str) {
                    if (c == '"') os << '"';
                    os << c;
                }
                os << '"';
            }
            break;
        }
        default:
            throw WrongType{cell.type_name(), "csv cell"};
    }
}

/// Write a list of rows as CSV text, with `\n` line endings.
inline
void write(std::ostream& os, const List& rows) {
    for (auto& row : rows) {
        bool first = true;
        for (auto& cell : row.as<List>()) {
            if (!first) os << ',';
            write_cell(os, cell);
            first = false;
        }
        os << '\n';
    }
}

} // namespace csv
} // namespace stash
