/// @b License: @n Apache License v2.0
/// @copyright Robert Dunnagan
#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

using namespace std::literals::string_literals;
using namespace std::literals::string_view_literals;

namespace stash {

#ifndef STASH_ARCH
#if _WIN32 || _WIN64
#if _WIN64
#define STASH_ARCH 64
#else
#define STASH_ARCH 32
#endif
#endif

#if __GNUC__
#if __x86_64__ || __ppc64__ || __aarch64__
#define STASH_ARCH 64
#else
#define STASH_ARCH 32
#endif
#endif
#endif // STASH_ARCH

#if STASH_ARCH == 32
using refcnt_t = uint32_t;
#else
using refcnt_t = uint64_t;
#endif

using Int = int64_t;
using UInt = uint64_t;
using Float = double;
using String = std::string;
using StringView = std::string_view;
using Bytes = std::vector<uint8_t>;

struct nil_t {};
constexpr static nil_t nil;

template <typename T>
concept is_bool = std::is_same<T, bool>::value;

template<typename T>
concept is_like_Int = std::is_signed<T>::value && std::is_integral<T>::value && std::is_convertible_v<T, Int>;

template<typename T>
concept is_like_UInt = !is_bool<T> && std::is_unsigned<T>::value && std::is_integral<T>::value && std::is_convertible_v<T, UInt>;

template<typename T>
concept is_like_Float = std::is_floating_point<T>::value;

template <typename T>
concept is_byvalue = std::is_same<T, bool>::value || std::is_same<T, Int>::value ||
                     std::is_same<T, UInt>::value || std::is_same<T, Float>::value;

} // namespace stash
