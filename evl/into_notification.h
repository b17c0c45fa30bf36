// Copyright (C) 2025 pointer-to-bios <pointer-to-bios@outlook.com>
// SPDX-License-Identifier: MIT

#pragma once

#include <concepts>
#include <limits>
#include <source_location>
#include <type_traits>
#include <utility>

#include <evl/notification.h>
#include <evl/panic/panic.h>
#include <evl/utils/types.h>

namespace evl {

using namespace types;

// Integers that can stand for a wake count. Characters and bool are excluded.
template<typename I>
concept count_integer =
    std::integral<I> && !std::same_as<I, bool> && !std::same_as<I, char> && !std::same_as<I, wchar_t>
    && !std::same_as<I, char8_t> && !std::same_as<I, char16_t> && !std::same_as<I, char32_t>;

template<typename S>
concept into_notification_source =
    notification<std::remove_cvref_t<S>> || count_integer<std::remove_cvref_t<S>>;

// The notification type a source converts into.
template<into_notification_source S>
using notification_of =
    std::conditional_t<count_integer<std::remove_cvref_t<S>>, notify, std::remove_cvref_t<S>>;

namespace detail {

template<count_integer I>
constexpr bool fits_in_count(I n) noexcept {
    if constexpr (std::is_signed_v<I>) {
        if (n < 0)
            return false;
    }
    if constexpr (sizeof(I) > sizeof(size_t)) {
        return static_cast<std::make_unsigned_t<I>>(n) <= std::numeric_limits<size_t>::max();
    } else {
        return true;
    }
}

};  // namespace detail

template<notification N>
N into_notification(N n) {
    return n;
}

// Panics if the value is negative or does not fit in size_t.
template<count_integer I>
notify into_notification(I n, std::source_location sl = std::source_location::current()) {
    if (!detail::fits_in_count(n)) [[unlikely]] {
        panic::panic_at(
            sl, "overflow: {} cannot be converted to a wake count ({}-bit)", n,
            std::numeric_limits<size_t>::digits);
    }
    return notify{static_cast<size_t>(n)};
}

namespace detail {

template<into_notification_source S>
notification_of<S> convert(S &&src, const std::source_location &sl) {
    if constexpr (count_integer<std::remove_cvref_t<S>>)
        return into_notification(src, sl);
    else
        return notification_of<S>(std::forward<S>(src));
}

};  // namespace detail

template<into_notification_source S>
    requires std::same_as<notification_of<S>, notify>
notify_additional additional(S &&src, std::source_location sl = std::source_location::current()) {
    return detail::convert(std::forward<S>(src), sl).additional();
}

template<into_notification_source S>
relaxed_notify<notification_of<S>>
relaxed(S &&src, std::source_location sl = std::source_location::current()) {
    return relaxed_notify<notification_of<S>>{detail::convert(std::forward<S>(src), sl)};
}

template<into_notification_source S, typename T>
    requires untagged_notification<notification_of<S>> && std::copy_constructible<std::decay_t<T>>
tag_notify<notification_of<S>, std::decay_t<T>>
tag(S &&src, T &&value, std::source_location sl = std::source_location::current()) {
    return tag_notify<notification_of<S>, std::decay_t<T>>{
        std::forward<T>(value), detail::convert(std::forward<S>(src), sl)};
}

template<into_notification_source S, typename F>
    requires untagged_notification<notification_of<S>> && tag_generator<std::decay_t<F>>
tag_with_notify<notification_of<S>, std::decay_t<F>>
tag_with(S &&src, F &&gen, std::source_location sl = std::source_location::current()) {
    return tag_with_notify<notification_of<S>, std::decay_t<F>>{
        std::forward<F>(gen), detail::convert(std::forward<S>(src), sl)};
}

};  // namespace evl
