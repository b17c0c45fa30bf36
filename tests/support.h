// Copyright (C) 2025 pointer-to-bios <pointer-to-bios@outlook.com>
// SPDX-License-Identifier: MIT

#pragma once

#include <optional>
#include <type_traits>
#include <utility>
#include <vector>

#include <evl/into_notification.h>
#include <evl/notification.h>

namespace evl::testing {

using namespace types;

// Engine side of the notify contract: fence, then count against the listeners that were already
// notified, then one next_tag() per listener woken, in registration order.
template<typename Tag>
class wait_list {
public:
    using listener_id = size_t;

    listener_id listen() {
        slots.push_back({});
        return slots.size() - 1;
    }

    template<typename N>
        requires notification<std::remove_cvref_t<N>>
                 && std::same_as<typename std::remove_cvref_t<N>::tag_type, Tag>
    size_t notify(N &&n) {
        n.fence();
        auto k = n.count(notified);
        size_t woken{0};
        for (auto &s : slots) {
            if (woken == k)
                break;
            if (s.current != phase::pending)
                continue;
            s.tag.emplace(n.next_tag());
            s.current = phase::notified;
            notified++;
            woken++;
        }
        return woken;
    }

    template<into_notification_source S>
        requires(!notification<std::remove_cvref_t<S>>)
    size_t notify(S &&src) {
        return notify(into_notification(std::forward<S>(src)));
    }

    // Consumes the notification of a listener, if it has one.
    std::optional<Tag> take(listener_id id) {
        auto &s = slots.at(id);
        if (s.current != phase::notified)
            return std::nullopt;
        s.current = phase::done;
        notified--;
        return std::move(s.tag);
    }

    bool is_notified(listener_id id) const { return slots.at(id).current == phase::notified; }

    size_t notified_count() const noexcept { return notified; }

private:
    enum class phase { pending, notified, done };

    struct slot {
        phase current{phase::pending};
        std::optional<Tag> tag;
    };

    std::vector<slot> slots;
    size_t notified{0};
};

struct call_counts {
    size_t fence{0};
    size_t count{0};
    size_t next_tag{0};
};

// Behaves like notify but records every call made through it.
class counting_notify : public notification_builder<counting_notify> {
public:
    using tag_type = unit;

    counting_notify(size_t requested, call_counts &calls)
            : inner{requested}
            , calls{&calls} {}

    void fence() const {
        calls->fence++;
        inner.fence();
    }

    size_t count(size_t waiting) const {
        calls->count++;
        return inner.count(waiting);
    }

    tag_type next_tag() {
        calls->next_tag++;
        return inner.next_tag();
    }

private:
    evl::notify inner;
    call_counts *calls;
};

};  // namespace evl::testing
