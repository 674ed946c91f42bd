/// @b License: @n Apache License v2.0
/// @copyright Robert Dunnagan
#pragma once

#include <stash/archive/codecs.hxx>

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <bit>
#include <cstring>
#include <numeric>

namespace stash {

template <typename T> struct DType;
template <> struct DType<double>   { static constexpr auto name = "<f8"; };
template <> struct DType<float>    { static constexpr auto name = "<f4"; };
template <> struct DType<int64_t>  { static constexpr auto name = "<i8"; };
template <> struct DType<int32_t>  { static constexpr auto name = "<i4"; };
template <> struct DType<int16_t>  { static constexpr auto name = "<i2"; };
template <> struct DType<int8_t>   { static constexpr auto name = "|i1"; };
template <> struct DType<uint64_t> { static constexpr auto name = "<u8"; };
template <> struct DType<uint32_t> { static constexpr auto name = "<u4"; };
template <> struct DType<uint16_t> { static constexpr auto name = "<u2"; };
template <> struct DType<uint8_t>  { static constexpr auto name = "|u1"; };
template <> struct DType<bool>     { static constexpr auto name = "|b1"; };

/////////////////////////////////////////////////////////////////////////////
/// A dense, C-ordered, n-dimensional array of little-endian numbers.
/// - The element type is a NumPy type string, for example `<f8`.
/// - Arrays are stored in the NumPy `.npy` format, so that they can be read
///   without this library.
/////////////////////////////////////////////////////////////////////////////
class NDArray : public Opaque
{
  public:
    using Shape = std::vector<size_t>;

    NDArray() : m_dtype{DType<double>::name}, m_shape{0} {}

    /// @throws StashException if the dtype is not supported, or the data size
    /// does not match the shape.
    NDArray(const String& dtype, const Shape& shape, Bytes&& data);

    /// Construct a one dimensional array, or an array of `shape`.
    template <typename T>
    static NDArray from_vector(const std::vector<T>& values, const Shape& shape = {});

    /// @throws WrongType if `T` does not match the dtype.
    template <typename T>
    std::vector<T> to_vector() const;

    const String& dtype() const { return m_dtype; }
    const Shape& shape() const  { return m_shape; }
    const Bytes& data() const   { return m_data; }
    size_t size() const         { return element_count(m_shape); }

    Bytes to_npy() const;

    /// @throws StashException if the data is not a supported `.npy` file.
    static NDArray from_npy(const Bytes& npy);

    static size_t item_size(const String& dtype);
    static size_t element_count(const Shape& shape) {
        return std::accumulate(shape.begin(), shape.end(), size_t{1}, std::multiplies<size_t>{});
    }

    Opaque* clone() const override { return new NDArray{*this}; }
    String str() const override    { return fmt::format("ndarray(dtype={}, shape={})", m_dtype, shape_text()); }

    bool equals(const Opaque& other) const override {
        auto p_other = dynamic_cast<const NDArray*>(&other);
        return p_other != nullptr && p_other->m_dtype == m_dtype && p_other->m_shape == m_shape &&
               p_other->m_data == m_data;
    }

    /// Shape in Python tuple syntax, `(2, 3)`, `(3,)` or `()`.
    String shape_text() const;

  private:
    static void check_byte_order() {
        if constexpr (std::endian::native != std::endian::little)
            throw StashException{"NDArray requires a little-endian host"};
    }

  private:
    String m_dtype;
    Shape m_shape;
    Bytes m_data;
};

inline
size_t NDArray::item_size(const String& dtype) {
    if (dtype.size() == 3 && (dtype[0] == '<' || dtype[0] == '|')) {
        switch (dtype[1]) {
            case 'f': if (dtype[2] == '4' || dtype[2] == '8') return dtype[2] - '0'; break;
            case 'i':
            case 'u': if (dtype[2] == '1' || dtype[2] == '2' || dtype[2] == '4' || dtype[2] == '8') return dtype[2] - '0'; break;
            case 'b': if (dtype[2] == '1') return 1; break;
            default:  break;
        }
    }
    throw StashException{fmt::format("Unsupported dtype: {}", dtype)};
}

inline
NDArray::NDArray(const String& dtype, const Shape& shape, Bytes&& data)
  : m_dtype{dtype}, m_shape{shape}, m_data{std::forward<Bytes>(data)} {
    auto expected = element_count(m_shape) * item_size(m_dtype);
    if (m_data.size() != expected)
        throw StashException{fmt::format("NDArray data size {} does not match shape {} and dtype {}",
                                         m_data.size(), shape_text(), m_dtype)};
}

template <typename T>
NDArray NDArray::from_vector(const std::vector<T>& values, const Shape& shape) {
    check_byte_order();
    Shape actual_shape = shape.size() == 0? Shape{values.size()}: shape;
    Bytes data(values.size() * sizeof(T));
    if constexpr (std::is_same<T, bool>::value) {
        for (size_t i = 0; i < values.size(); ++i) data[i] = values[i]? 1: 0;
    } else {
        if (values.size() > 0) std::memcpy(data.data(), values.data(), data.size());
    }
    return NDArray{DType<T>::name, actual_shape, std::move(data)};
}

template <typename T>
std::vector<T> NDArray::to_vector() const {
    check_byte_order();
    if (m_dtype != DType<T>::name) throw WrongType{m_dtype, DType<T>::name};
    std::vector<T> values(size());
    if constexpr (std::is_same<T, bool>::value) {
        for (size_t i = 0; i < values.size(); ++i) values[i] = m_data[i] != 0;
    } else {
        if (values.size() > 0) std::memcpy(values.data(), m_data.data(), m_data.size());
    }
    return values;
}

inline
String NDArray::shape_text() const {
    if (m_shape.size() == 0) return "()";
    if (m_shape.size() == 1) return fmt::format("({},)", m_shape[0]);
    return fmt::format("({})", fmt::join(m_shape, ", "));
}

inline
Bytes NDArray::to_npy() const {
    auto header = fmt::format("{{'descr': '{}', 'fortran_order': False, 'shape': {}, }}", m_dtype, shape_text());

    // magic(6) + version(2) + header length(2) + header + '\n', padded to 64
    size_t total = 10 + header.size() + 1;
    header.append((64 - total % 64) % 64, ' ');
    header.push_back('\n');
    if (header.size() > 0xFFFF) throw StashException{"NDArray header too large"};

    Bytes npy;
    npy.reserve(10 + header.size() + m_data.size());
    for (char c : "\x93NUMPY"sv) npy.push_back((uint8_t)c);
    npy.push_back(1);
    npy.push_back(0);
    npy.push_back((uint8_t)(header.size() & 0xFF));
    npy.push_back((uint8_t)(header.size() >> 8));
    npy.insert(npy.end(), header.begin(), header.end());
    npy.insert(npy.end(), m_data.begin(), m_data.end());
    return npy;
}

namespace impl {

/// Returns the text following `'key':` in a `.npy` header, with leading
/// whitespace removed.
inline
StringView npy_field(const StringView& header, const StringView& key) {
    auto quoted_key = fmt::format("'{}'", key);
    auto pos = header.find(quoted_key);
    if (pos == StringView::npos) throw StashException{fmt::format("npy header has no {}", key)};
    pos = header.find(':', pos + quoted_key.size());
    if (pos == StringView::npos) throw StashException{fmt::format("npy header has no value for {}", key)};
    ++pos;
    while (pos < header.size() && header[pos] == ' ') ++pos;
    return header.substr(pos);
}

} // namespace impl

inline
NDArray NDArray::from_npy(const Bytes& npy) {
    if (npy.size() < 10 || std::memcmp(npy.data(), "\x93NUMPY", 6) != 0)
        throw StashException{"Not a npy file"};

    size_t header_len;
    size_t header_start;
    switch (npy[6]) {
        case 1:
            header_len = npy[8] | (npy[9] << 8);
            header_start = 10;
            break;
        case 2:
        case 3:
            if (npy.size() < 12) throw StashException{"Truncated npy file"};
            header_len = npy[8] | (npy[9] << 8) | (npy[10] << 16) | ((size_t)npy[11] << 24);
            header_start = 12;
            break;
        default:
            throw StashException{fmt::format("Unsupported npy version {}", (int)npy[6])};
    }
    if (npy.size() < header_start + header_len) throw StashException{"Truncated npy file"};

    String header(npy.begin() + header_start, npy.begin() + header_start + header_len);

    auto descr = impl::npy_field(header, "descr");
    if (descr.size() == 0 || descr[0] != '\'') throw StashException{"Invalid npy descr"};
    auto end = descr.find('\'', 1);
    if (end == StringView::npos) throw StashException{"Invalid npy descr"};
    String dtype{descr.substr(1, end - 1)};

    if (impl::npy_field(header, "fortran_order").starts_with("True"))
        throw StashException{"Fortran ordered npy arrays are not supported"};

    auto shape_field = impl::npy_field(header, "shape");
    if (shape_field.size() == 0 || shape_field[0] != '(') throw StashException{"Invalid npy shape"};
    auto shape_end = shape_field.find(')');
    if (shape_end == StringView::npos) throw StashException{"Invalid npy shape"};

    Shape shape;
    auto dims = shape_field.substr(1, shape_end - 1);
    while (dims.size() > 0) {
        auto comma = dims.find(',');
        auto dim = dims.substr(0, comma);
        while (dim.size() > 0 && dim.front() == ' ') dim.remove_prefix(1);
        while (dim.size() > 0 && dim.back() == ' ') dim.remove_suffix(1);
        if (dim.size() > 0) shape.push_back((size_t)str_to_uint(dim));
        if (comma == StringView::npos) break;
        dims.remove_prefix(comma + 1);
    }

    Bytes data(npy.begin() + header_start + header_len, npy.end());
    return NDArray{dtype, shape, std::move(data)};
}

namespace codecs {

/// Stored as a `.npy` payload, with `{"shape", "dtype"}` inline.
class NDArrayCodec : public Codec
{
  public:
    Encoding encode(const Value& value) const override {
        auto& array = value.as<NDArray>();
        List shape;
        for (auto dim : array.shape()) shape.push_back((UInt)dim);
        Map json;
        json.insert({"shape", shape});
        json.insert({"dtype", array.dtype()});
        return {.inline_value = json, .payload = array.to_npy(), .extension = "npy"};
    }

    Value decode(const Encoding& encoding) const override {
        auto array = NDArray::from_npy(require_payload(encoding, "ndarray"));
        auto& json = encoding.inline_value;
        if (json.type() == Value::MAP) {
            auto dtype = json.get("dtype");
            if (dtype != nil && dtype != array.dtype())
                throw StashException{fmt::format("ndarray dtype mismatch: {} != {}", dtype.to_str(), array.dtype())};
            auto shape = json.get("shape");
            if (shape.type() == Value::LIST) {
                auto& dims = shape.as<List>();
                bool match = dims.size() == array.shape().size();
                for (size_t i = 0; match && i < dims.size(); ++i)
                    match = dims[i].to_int() == (Int)array.shape()[i];
                if (!match) throw StashException{fmt::format("ndarray shape mismatch: {}", shape.to_str())};
            }
        }
        return Value::make<NDArray>(std::move(array));
    }
};

} // namespace codecs
} // namespace stash
