// Copyright (C) 2025 pointer-to-bios <pointer-to-bios@outlook.com>
// SPDX-License-Identifier: MIT

#include <exception>
#include <print>
#include <tuple>
#include <vector>

#include <evl/panic/panic.h>
#include <evl/test/test.h>

namespace evl::test {

auto &get_tests() {
    static std::vector<std::tuple<std::string, test_function>> tests{};
    return tests;
}

bool add_test(std::string name, test_function fn) {
    get_tests().emplace_back(std::move(name), std::move(fn));
    return true;
}

test_result run(const test_function &fn) {
    try {
        return fn();
    } catch (panic::panicked &p) {
        return std::unexpected{std::format("panic: {}", p.to_string())};
    } catch (std::exception &e) {
        return std::unexpected{std::format("发生异常: {}", e.what())};
    } catch (...) { return std::unexpected{"发生异常"}; }
}

};  // namespace evl::test

int main() {
    using namespace evl;

    auto total = test::get_tests().size();
    std::size_t passed{0};

    for (auto &[name, fn] : test::get_tests()) {
        auto success = test::run(fn);
        std::string extra;
        if (!success.has_value()) {
            extra = ": " + success.error();
        } else {
            passed++;
        }
        std::println(
            "[{}] {}{}", success.has_value() ? "\033[1;32m通过\033[0m" : "\033[1;31m失败\033[0m", name, extra);
    }

    std::println("测试结果：{} 通过，{} 失败", passed, total - passed);

    return passed == total ? 0 : 1;
}
