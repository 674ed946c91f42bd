/// @b License: @n Apache License v2.0
/// @copyright Robert Dunnagan
#pragma once

#include <cpptrace/cpptrace.hpp>

#include <exception>
#include <string>
#include <string_view>
#include <sstream>

#define STASH_ASSERT(cond) { if (!(cond)) throw ::stash::Assert{#cond}; }

namespace stash {

class StashException : public cpptrace::exception_with_message
{
  public:
    StashException(std::string&& msg) : cpptrace::exception_with_message(std::forward<std::string>(msg)) {}
    StashException() : StashException{""} {}
};


class Assert : public cpptrace::exception_with_message
{
  public:
    Assert(std::string&& msg) : cpptrace::exception_with_message(std::forward<std::string>(msg)) {}
};


struct WrongType : public StashException
{
    static std::string make_message(const std::string_view& actual) {
        std::stringstream ss;
        ss << "type=" << actual;
        return ss.str();
    }

    static std::string make_message(const std::string_view& actual, const std::string_view& expected) {
        std::stringstream ss;
        ss << "type=" << actual << ", expected=" << expected;
        return ss.str();
    }

    WrongType(const std::string_view& actual) : StashException(make_message(actual)) {}
    WrongType(const std::string_view& actual, const std::string_view& expected) : StashException(make_message(actual, expected)) {}
};

} // namespace stash
