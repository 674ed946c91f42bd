/// @b License: @n Apache License v2.0
/// @copyright Robert Dunnagan
#pragma once

#include <stash/archive/codecs.hxx>
#include <stash/csv/csv.hxx>

#include <fmt/format.h>

#include <limits>
#include <sstream>

namespace stash {

/////////////////////////////////////////////////////////////////////////////
/// A table of named, typed columns of equal length.
/// - Column dtypes are `int`, `float`, `str` and `bool`.  Any cell may be nil.
/// - Tables are stored as CSV, with the column schema in the metadata index.
/////////////////////////////////////////////////////////////////////////////
class Table : public Opaque
{
  public:
    struct Column
    {
        String name;
        String dtype;
        List values;

        bool operator == (const Column& other) const {
            return name == other.name && dtype == other.dtype && Value{values} == Value{other.values};
        }
    };

    Table() = default;

    /// @throws StashException if the dtype is unknown, the name is already
    /// used, or the length differs from the other columns.
    void add_column(const String& name, const String& dtype, const List& values);

    const std::vector<Column>& columns() const { return m_columns; }

    /// @throws StashException if there is no such column.
    const Column& column(const String& name) const;

    size_t n_rows() const { return m_columns.size() == 0? 0: m_columns[0].values.size(); }
    size_t n_columns() const { return m_columns.size(); }

    /// Returns the cell converted to the column dtype.
    static Value convert(const Value& cell, const String& dtype);
    static bool is_dtype(const String& dtype) {
        return dtype == "int" || dtype == "float" || dtype == "str" || dtype == "bool";
    }

    String to_csv() const;

    /// @param names The column names, which must match the CSV header.
    /// @param dtypes The column dtypes.
    /// @throws StashException if the CSV does not match the schema.
    static Table from_csv(const StringView& text, const std::vector<String>& names, const std::vector<String>& dtypes);

    Opaque* clone() const override { return new Table{*this}; }

    String str() const override {
        return fmt::format("table(columns={}, rows={})", n_columns(), n_rows());
    }

    bool equals(const Opaque& other) const override {
        auto p_other = dynamic_cast<const Table*>(&other);
        return p_other != nullptr && p_other->m_columns == m_columns;
    }

  private:
    std::vector<Column> m_columns;
};

inline
void Table::add_column(const String& name, const String& dtype, const List& values) {
    if (!is_dtype(dtype)) throw StashException{fmt::format("Unsupported column dtype: {}", dtype)};
    for (auto& column : m_columns)
        if (column.name == name) throw StashException{fmt::format("Duplicate column: {}", name)};
    if (m_columns.size() > 0 && values.size() != n_rows())
        throw StashException{fmt::format("Column {} has {} rows, expected {}", name, values.size(), n_rows())};

    List converted;
    converted.reserve(values.size());
    for (auto& cell : values)
        converted.push_back(convert(cell, dtype));
    m_columns.push_back(Column{name, dtype, std::move(converted)});
}

inline
const Table::Column& Table::column(const String& name) const {
    for (auto& column : m_columns)
        if (column.name == name) return column;
    throw StashException{fmt::format("No such column: {}", name)};
}

inline
Value Table::convert(const Value& cell, const String& dtype) {
    if (cell.is_nil()) return nil;
    if (dtype == "str") {
        if (cell.type() == Value::STR) return cell;
        throw WrongType{cell.type_name(), "str"};
    }
    if (dtype == "int") {
        if (cell.type() == Value::INT) return cell;
        if (cell.type() == Value::UINT) {
            if (cell.as<UInt>() > (UInt)std::numeric_limits<Int>::max())
                throw WrongType{fmt::format("uint {}", cell.as<UInt>()), "int"};
            return (Int)cell.as<UInt>();
        }
        if (cell.type() == Value::STR) return str_to_int(cell.as<String>());
        throw WrongType{cell.type_name(), "int"};
    }
    if (dtype == "float") {
        if (cell.is_number() || cell.type() == Value::STR) return cell.to_float();
        throw WrongType{cell.type_name(), "float"};
    }
    if (dtype == "bool") {
        if (cell.type() == Value::BOOL) return cell;
        if (cell.type() == Value::STR) return str_to_bool(cell.as<String>());
        throw WrongType{cell.type_name(), "bool"};
    }
    throw StashException{fmt::format("Unsupported column dtype: {}", dtype)};
}

inline
String Table::to_csv() const {
    List rows;
    if (m_columns.size() > 0) {
        List header;
        for (auto& column : m_columns) header.push_back(column.name);
        rows.push_back(header);

        for (size_t i = 0; i < n_rows(); ++i) {
            List row;
            for (auto& column : m_columns) row.push_back(column.values[i]);
            rows.push_back(row);
        }
    }

    std::stringstream ss;
    csv::write(ss, rows);
    return ss.str();
}

inline
Table Table::from_csv(const StringView& text, const std::vector<String>& names, const std::vector<String>& dtypes) {
    if (names.size() != dtypes.size())
        throw StashException{fmt::format("Table schema has {} names and {} dtypes", names.size(), dtypes.size())};

    Table table;
    if (names.size() == 0) return table;

    auto rows = csv::parse(text);
    auto& row_list = rows.as<List>();
    if (row_list.size() == 0) throw StashException{"Table CSV has no header"};

    auto& header = row_list[0].as<List>();
    if (header.size() != names.size())
        throw StashException{fmt::format("Table CSV has {} columns, expected {}", header.size(), names.size())};
    for (size_t j = 0; j < names.size(); ++j) {
        auto cell = header[j];
        auto name = cell.is_nil()? String{}: cell.as<String>();
        if (name != names[j])
            throw StashException{fmt::format("Table CSV column {} is '{}', expected '{}'", j, name, names[j])};
    }

    std::vector<List> columns(names.size());
    for (size_t i = 1; i < row_list.size(); ++i) {
        auto& row = row_list[i].as<List>();
        if (row.size() != names.size())
            throw StashException{fmt::format("Table CSV row {} has {} cells, expected {}", i, row.size(), names.size())};
        for (size_t j = 0; j < names.size(); ++j)
            columns[j].push_back(convert(row[j], dtypes[j]));
    }

    for (size_t j = 0; j < names.size(); ++j)
        table.add_column(names[j], dtypes[j], columns[j]);
    return table;
}

namespace codecs {

/// Stored as a `.csv` payload, with `{"columns", "dtypes", "rows"}` inline.
class TableCodec : public Codec
{
  public:
    Encoding encode(const Value& value) const override {
        auto& table = value.as<Table>();
        List names;
        List dtypes;
        for (auto& column : table.columns()) {
            names.push_back(column.name);
            dtypes.push_back(column.dtype);
        }
        Map json;
        json.insert({"columns", names});
        json.insert({"dtypes", dtypes});
        json.insert({"rows", (UInt)table.n_rows()});

        auto csv = table.to_csv();
        return {.inline_value = json, .payload = Bytes(csv.begin(), csv.end()), .extension = "csv"};
    }

    Value decode(const Encoding& encoding) const override {
        require_inline(encoding, "table");
        auto& payload = require_payload(encoding, "table");
        auto& json = encoding.inline_value;

        std::vector<String> names;
        std::vector<String> dtypes;
        auto columns = json.get("columns");
        auto column_dtypes = json.get("dtypes");
        for (auto& name : columns.as<List>()) names.push_back(name.as<String>());
        for (auto& dtype : column_dtypes.as<List>()) dtypes.push_back(dtype.as<String>());

        String text(payload.begin(), payload.end());
        auto table = Table::from_csv(text, names, dtypes);

        auto rows = json.get("rows");
        if (rows != nil && rows.to_int() != (Int)table.n_rows())
            throw StashException{fmt::format("Table has {} rows, expected {}", table.n_rows(), rows.to_int())};
        return Value::make<Table>(std::move(table));
    }
};

} // namespace codecs
} // namespace stash
