/// @b License: @n Apache License v2.0
/// @copyright Robert Dunnagan
#pragma once

#include <stash/support/types.hxx>
#include <stash/support/exception.hxx>

#include <charconv>
#include <cmath>
#include <cstdlib>
#include <iomanip>
#include <sstream>
#include <string>

namespace stash {

inline
std::string quoted(const std::string_view& str, char quote = '"') {
    std::stringstream ss;
    ss << std::quoted(str, quote);
    return ss.str();
}

inline
std::string int_to_str(auto v) {
    // max digits=20
    std::string str(21, ' ');
    auto [ptr, err] = std::to_chars(str.data(), str.data() + str.size(), v);
    STASH_ASSERT(err == std::errc());
    str.resize(ptr - str.data());
    return str;
}

inline
std::string float_to_str(double v) {
    // IEEE 754-1985 - max digits=24
    std::string str(32, ' ');
    auto [ptr, ec] = std::to_chars(str.data(), str.data() + str.size(), v);
    STASH_ASSERT(ec == std::errc());
    str.resize(ptr - str.data());
    // keep a float recognizable as a float when read back
    if (std::isfinite(v) && str.find_first_of(".eE") == std::string::npos)
        str.append(".0");
    return str;
}

inline
bool str_to_bool(const StringView& str) {
    return (str == "true" || str == "True" || str == "1");
}

inline
Int str_to_int(const StringView& str) {
    Int value = 0;
    const char* beg = str.data();
    const char* end = beg + str.size();
    auto [ptr, ec] = std::from_chars(beg, end, value);
    if (ec != std::errc() || ptr != end)
        throw StashException("invalid integer: "s + String{str});
    return value;
}

inline
UInt str_to_uint(const StringView& str) {
    UInt value = 0;
    const char* beg = str.data();
    const char* end = beg + str.size();
    auto [ptr, ec] = std::from_chars(beg, end, value);
    if (ec != std::errc() || ptr != end)
        throw StashException("invalid unsigned integer: "s + String{str});
    return value;
}

inline
Float str_to_float(const StringView& str) {
    String copy{str};
    char* end = nullptr;
    Float value = std::strtod(copy.c_str(), &end);
    if (end != copy.c_str() + copy.size())
        throw StashException("invalid float: "s + copy);
    return value;
}

} // namespace stash
