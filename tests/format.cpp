// Copyright (C) 2025 pointer-to-bios <pointer-to-bios@outlook.com>
// SPDX-License-Identifier: MIT

#include <format>
#include <string>

#include <evl/erased.h>
#include <evl/into_notification.h>
#include <evl/test/test.h>

#include "support.h"

using namespace evl;

namespace {

struct opaque {};

}  // namespace

EVL_TEST(base_strategies_format) {
    EVL_CHECK(std::format("{}", notify{3}) == "notify(3)", "got '{}'", notify{3});
    EVL_CHECK(
        std::format("{}", additional(3)) == "notify_additional(3)", "got '{}'", additional(3));

    EVL_SUCCESS();
}

EVL_TEST(decorators_format_their_inner) {
    auto r = relaxed(2);
    EVL_CHECK(std::format("{}", r) == "relaxed(notify(2))", "got '{}'", r);

    auto t = into_notification(5).tag(std::string{"done"}).relaxed();
    EVL_CHECK(
        std::format("{}", t) == "relaxed(tag{tag: done, inner: notify(5)})", "got '{}'", t);

    auto g = additional(4).tag_with([] { return 1; });
    EVL_CHECK(
        std::format("{}", g) == "tag_with{tag: .., inner: notify_additional(4)}", "got '{}'", g);

    EVL_SUCCESS();
}

EVL_TEST(unformattable_parts_print_as_ellipsis) {
    auto t = tag(1, opaque{});
    EVL_CHECK(std::format("{}", t) == "tag{tag: .., inner: notify(1)}", "got '{}'", t);

    testing::call_counts calls;
    auto r = testing::counting_notify{1, calls}.relaxed();
    EVL_CHECK(std::format("{}", r) == "relaxed(..)", "got '{}'", r);

    auto e = erase(tag(3, 8));
    EVL_CHECK(std::format("{}", e) == "tag{tag: 8, inner: notify(3)}", "got '{}'", e);

    EVL_SUCCESS();
}
