// Copyright (C) 2025 pointer-to-bios <pointer-to-bios@outlook.com>
// SPDX-License-Identifier: MIT

#pragma once

#include <concepts>
#include <format>
#include <functional>
#include <string>
#include <type_traits>
#include <utility>

#include <evl/fence.h>
#include <evl/utils/types.h>

namespace evl {

using namespace types;

// Decides, for one notify operation on a wait queue, how many listeners to wake, what tag each
// woken listener receives and whether a full fence has to be emitted first.
//
// The wait queue calls fence() once, count() once with the number of listeners it considers
// waiting, and then next_tag() exactly count() times in wake order, from a single thread.
template<typename N>
concept notification = std::move_constructible<N> && requires(N &n, const N &cn, size_t waiting) {
    typename N::tag_type;
    { cn.fence() } -> std::same_as<void>;
    { cn.count(waiting) } -> std::same_as<size_t>;
    { n.next_tag() } -> std::same_as<typename N::tag_type>;
};

template<typename N>
concept untagged_notification = notification<N> && std::same_as<typename N::tag_type, unit>;

template<typename F>
concept tag_generator = std::move_constructible<F> && std::invocable<F &>
                        && (!std::is_void_v<std::invoke_result_t<F &>>);

class notify;
class notify_additional;

template<notification N>
class relaxed_notify;

template<untagged_notification N, std::copy_constructible T>
class tag_notify;

template<untagged_notification N, tag_generator F>
class tag_with_notify;

// Fluent composition for notification types. Every builder consumes the notification it is
// called on, so lvalues have to be moved in explicitly.
template<typename Self>
class notification_builder {
public:
    // Reinterprets "top up to n notified listeners" as "wake n more".
    auto additional() &&
        requires std::same_as<Self, notify>
    {
        return notify_additional{self().count(0)};
    }

    auto relaxed() && { return relaxed_notify<Self>{std::move(self())}; }

    template<typename T>
        requires untagged_notification<Self> && std::copy_constructible<std::decay_t<T>>
    auto tag(T &&value) && {
        return tag_notify<Self, std::decay_t<T>>{std::forward<T>(value), std::move(self())};
    }

    template<typename F>
        requires untagged_notification<Self> && tag_generator<std::decay_t<F>>
    auto tag_with(F &&gen) && {
        return tag_with_notify<Self, std::decay_t<F>>{std::forward<F>(gen), std::move(self())};
    }

private:
    Self &self() noexcept { return static_cast<Self &>(*this); }
};

// Wakes listeners until `requested` of them have been notified, counting those already waiting.
class notify : public notification_builder<notify> {
public:
    using tag_type = unit;

    explicit constexpr notify(size_t requested) noexcept
            : m_requested{requested} {}

    void fence() const noexcept { full_fence(); }

    constexpr size_t count(size_t waiting) const noexcept {
        return waiting < m_requested ? m_requested - waiting : 0;
    }

    constexpr tag_type next_tag() noexcept { return {}; }

    constexpr size_t requested() const noexcept { return m_requested; }

private:
    size_t m_requested;
};

// Wakes `requested` more listeners no matter how many are already waiting.
class notify_additional : public notification_builder<notify_additional> {
public:
    using tag_type = unit;

    explicit constexpr notify_additional(size_t requested) noexcept
            : m_requested{requested} {}

    void fence() const noexcept { full_fence(); }

    constexpr size_t count(size_t) const noexcept { return m_requested; }

    constexpr tag_type next_tag() noexcept { return {}; }

    constexpr size_t requested() const noexcept { return m_requested; }

private:
    size_t m_requested;
};

// Skips the fence. Only for callers that already published the triggering change with an
// ordering strong enough for the listeners.
template<notification N>
class relaxed_notify : public notification_builder<relaxed_notify<N>> {
public:
    using tag_type = typename N::tag_type;

    explicit relaxed_notify(N inner)
            : m_inner{std::move(inner)} {}

    void fence() const noexcept {}

    size_t count(size_t waiting) const { return m_inner.count(waiting); }

    tag_type next_tag() { return m_inner.next_tag(); }

    const N &inner() const noexcept { return m_inner; }

private:
    N m_inner;
};

// Hands a copy of the same value to every woken listener.
template<untagged_notification N, std::copy_constructible T>
class tag_notify : public notification_builder<tag_notify<N, T>> {
public:
    using tag_type = T;

    tag_notify(T value, N inner)
            : m_value{std::move(value)}
            , m_inner{std::move(inner)} {}

    void fence() const { m_inner.fence(); }

    size_t count(size_t waiting) const { return m_inner.count(waiting); }

    tag_type next_tag() { return m_value; }

    const T &value() const noexcept { return m_value; }

    const N &inner() const noexcept { return m_inner; }

private:
    T m_value;
    N m_inner;
};

// Calls the generator once per woken listener. The generator may keep state between calls.
template<untagged_notification N, tag_generator F>
class tag_with_notify : public notification_builder<tag_with_notify<N, F>> {
public:
    using tag_type = std::decay_t<std::invoke_result_t<F &>>;

    tag_with_notify(F gen, N inner)
            : m_gen{std::move(gen)}
            , m_inner{std::move(inner)} {}

    void fence() const { m_inner.fence(); }

    size_t count(size_t waiting) const { return m_inner.count(waiting); }

    tag_type next_tag() { return std::invoke(m_gen); }

    const N &inner() const noexcept { return m_inner; }

private:
    F m_gen;
    N m_inner;
};

namespace detail {

template<typename T>
concept formattable = std::is_default_constructible_v<std::formatter<std::remove_cvref_t<T>, char>>;

template<typename T>
std::string format_or_ellipsis(const T &value) {
    if constexpr (formattable<T>)
        return std::format("{}", value);
    else
        return "..";
}

struct notification_formatter {
    constexpr auto parse(std::format_parse_context &ctx) { return ctx.begin(); }
};

};  // namespace detail

};  // namespace evl

template<>
struct std::formatter<evl::notify, char> : evl::detail::notification_formatter {
    template<typename FormatContext>
    auto format(const evl::notify &n, FormatContext &ctx) const {
        return std::format_to(ctx.out(), "notify({})", n.requested());
    }
};

template<>
struct std::formatter<evl::notify_additional, char> : evl::detail::notification_formatter {
    template<typename FormatContext>
    auto format(const evl::notify_additional &n, FormatContext &ctx) const {
        return std::format_to(ctx.out(), "notify_additional({})", n.requested());
    }
};

template<typename N>
struct std::formatter<evl::relaxed_notify<N>, char> : evl::detail::notification_formatter {
    template<typename FormatContext>
    auto format(const evl::relaxed_notify<N> &n, FormatContext &ctx) const {
        return std::format_to(ctx.out(), "relaxed({})", evl::detail::format_or_ellipsis(n.inner()));
    }
};

template<typename N, typename T>
struct std::formatter<evl::tag_notify<N, T>, char> : evl::detail::notification_formatter {
    template<typename FormatContext>
    auto format(const evl::tag_notify<N, T> &n, FormatContext &ctx) const {
        return std::format_to(
            ctx.out(), "tag{{tag: {}, inner: {}}}", evl::detail::format_or_ellipsis(n.value()),
            evl::detail::format_or_ellipsis(n.inner()));
    }
};

template<typename N, typename F>
struct std::formatter<evl::tag_with_notify<N, F>, char> : evl::detail::notification_formatter {
    template<typename FormatContext>
    auto format(const evl::tag_with_notify<N, F> &n, FormatContext &ctx) const {
        return std::format_to(
            ctx.out(), "tag_with{{tag: .., inner: {}}}", evl::detail::format_or_ellipsis(n.inner()));
    }
};
