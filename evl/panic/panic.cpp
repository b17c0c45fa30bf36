// Copyright (C) 2025 pointer-to-bios <pointer-to-bios@outlook.com>
// SPDX-License-Identifier: MIT

#include <evl/panic/panic.h>

#include <cstddef>
#include <cstdlib>
#include <print>
#include <vector>

#include <evl/panic/color.h>

namespace evl::panic {

namespace {

std::vector<std::function<void(cpptrace::stacktrace &, std::string_view)>> panic_callbacks;

std::string format_frame(std::size_t i, const cpptrace::stacktrace_frame &e) {
    std::string res = std::format("{}#{}{} ", number_color, i, reset_color);

    if (e.is_inline)
        res += std::format("{}{:>18}{}", address_color, "(inlined)", reset_color);
    else
        res += std::format("{}{:#018x}{}", address_color, e.raw_address, reset_color);

    res += std::format(" in {}{}{}\n  at ", name_color, e.symbol.empty() ? "??" : e.symbol, reset_color);

    if (e.filename.empty()) {
        res += "??\n";
        return res;
    }
    res += std::format("{}{}{}", file_color, e.filename, reset_color);
    if (e.line.has_value()) {
        res += std::format(":{}{}{}", lineno_color, e.line.value(), reset_color);
        if (e.column.has_value())
            res += std::format(":{}{}{}", lineno_color, e.column.value(), reset_color);
    }
    res += '\n';
    return res;
}

};  // namespace

[[noreturn]] void report(std::string msg, std::string loc) noexcept {
    // Skip report() and the panic_at() template that called it.
    auto st = cpptrace::stacktrace::current(2);
    for (auto &cb : panic_callbacks) { cb(st, msg); }

    std::string trace;
    std::size_t i{0};
    for (const auto &e : st) { trace += format_frame(i++, e); }

    std::println(
        stderr, "{}[EVL] panic{}: {}\n  {}\nStack trace(most recent call first):\n{}", panic_color,
        reset_color, msg, loc, trace);
    std::abort();
}

void register_callback(std::function<void(cpptrace::stacktrace &, std::string_view)> cb) {
    panic_callbacks.push_back(std::move(cb));
}

};  // namespace evl::panic
