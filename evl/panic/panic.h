// Copyright (C) 2025 pointer-to-bios <pointer-to-bios@outlook.com>
// SPDX-License-Identifier: MIT

#pragma once

#include <exception>
#include <format>
#include <functional>
#include <source_location>
#include <string>
#include <string_view>

#include <cpptrace/basic.hpp>

namespace evl::panic {

#ifdef EVL_TESTING
class panicked : public std::exception {
public:
    panicked(std::string msg, std::string loc)
            : m_msg{std::move(msg)}
            , m_loc{std::move(loc)}
            , m_what{std::format("{}\n  {}", m_msg, m_loc)} {}

    const char *what() const noexcept override { return m_what.c_str(); }

    const std::string &message() const noexcept { return m_msg; }

    std::string to_string() const { return m_what; }

private:
    std::string m_msg;
    std::string m_loc;
    std::string m_what;
};
#endif

// Prints the message, the location and a stack trace to stderr, then aborts.
[[noreturn]] void report(std::string msg, std::string loc) noexcept;

void register_callback(std::function<void(cpptrace::stacktrace &, std::string_view)> cb);

inline std::string format_location(const std::source_location &sl) {
    return std::format("at {}:{}:{}", sl.file_name(), sl.line(), sl.column());
}

template<typename... Args>
[[noreturn]] void panic_at(std::source_location sl, std::format_string<Args...> fmt, Args &&...args) {
    auto msg = std::vformat(fmt.get(), std::make_format_args(args...));
#ifdef EVL_TESTING
    throw panicked{std::move(msg), format_location(sl)};
#else
    report(std::move(msg), format_location(sl));
#endif
}

};  // namespace evl::panic
