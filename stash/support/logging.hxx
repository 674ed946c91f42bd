/// @b License: @n Apache License v2.0
/// @copyright Robert Dunnagan
#pragma once

#include <fmt/format.h>

#include <atomic>
#include <cstring>
#include <iostream>
#include <string_view>

namespace stash {
namespace log {

enum Level
{
    FATAL,
    ERROR,
    WARNING,
    DEBUG,
};

#define STASH_INIT_LOGGING namespace stash::log { std::atomic<int> level{::stash::log::WARNING}; }
extern std::atomic<int> level;

inline
void set_level(Level new_level) { level = new_level; }

constexpr auto HEADING = "\033[38;5;39m";
constexpr auto MESSAGE = " \033[38;5;39m";
constexpr auto SOURCE = "\033[38;5;7m";
constexpr auto RESTORE = "\033[0m";

inline
std::string_view trim_file_name(const char* file) {
    auto len = std::strlen(file);
    return (len > 20)? std::string_view{(file + len - 20), 20}: std::string_view{file, len};
}

template <typename Arg>
void log(const char* file, int line, const char* level_name, Arg&& arg) {
    std::cout << HEADING << level_name << SOURCE << trim_file_name(file) << ':' << line << MESSAGE <<
        std::forward<Arg>(arg) << RESTORE << std::endl;
}

template <typename ... Args>
void log(const char* file, int line, const char* level_name, const char *format, Args&& ... args) {
    std::cout << HEADING << level_name << SOURCE << trim_file_name(file) << ':' << line << MESSAGE <<
        fmt::format(fmt::runtime(format), std::forward<Args>(args)...) << RESTORE << std::endl;
}

#define STASH_DEBUG(...) { if (::stash::log::level >= ::stash::log::Level::DEBUG)   ::stash::log::log(__FILE__, __LINE__, "[DEBUG] ",   __VA_ARGS__); }
#define STASH_WARN(...)  { if (::stash::log::level >= ::stash::log::Level::WARNING) ::stash::log::log(__FILE__, __LINE__, "[WARNING] ", __VA_ARGS__); }
#define STASH_ERROR(...) { if (::stash::log::level >= ::stash::log::Level::ERROR)   ::stash::log::log(__FILE__, __LINE__, "[ERROR] ",   __VA_ARGS__); }
#define STASH_FATAL(...) { if (::stash::log::level >= ::stash::log::Level::FATAL)   ::stash::log::log(__FILE__, __LINE__, "[FATAL] ",   __VA_ARGS__); }

} // namespace log
} // namespace stash
