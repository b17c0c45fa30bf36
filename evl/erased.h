// Copyright (C) 2025 pointer-to-bios <pointer-to-bios@outlook.com>
// SPDX-License-Identifier: MIT

#pragma once

#include <source_location>
#include <utility>

#include <evl/into_notification.h>
#include <evl/notification.h>
#include <evl/utils/types.h>

namespace evl {

using namespace types;

// Runtime-polymorphic view of a notification, for wait queues that are not templates.
template<typename Tag>
class dyn_notification {
public:
    using tag_type = Tag;

    virtual ~dyn_notification() = default;

    virtual void fence() const = 0;
    virtual size_t count(size_t waiting) const = 0;
    virtual Tag next_tag() = 0;
};

template<notification N>
class erased_notification final : public dyn_notification<typename N::tag_type> {
public:
    using tag_type = typename N::tag_type;

    explicit erased_notification(N inner)
            : m_inner{std::move(inner)} {}

    void fence() const override { m_inner.fence(); }

    size_t count(size_t waiting) const override { return m_inner.count(waiting); }

    tag_type next_tag() override { return m_inner.next_tag(); }

    const N &inner() const noexcept { return m_inner; }

private:
    N m_inner;
};

template<into_notification_source S>
erased_notification<notification_of<S>>
erase(S &&src, std::source_location sl = std::source_location::current()) {
    return erased_notification<notification_of<S>>{detail::convert(std::forward<S>(src), sl)};
}

};  // namespace evl

template<typename N>
struct std::formatter<evl::erased_notification<N>, char> : evl::detail::notification_formatter {
    template<typename FormatContext>
    auto format(const evl::erased_notification<N> &n, FormatContext &ctx) const {
        return std::format_to(ctx.out(), "{}", evl::detail::format_or_ellipsis(n.inner()));
    }
};
