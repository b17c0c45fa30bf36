// Copyright (C) 2025 pointer-to-bios <pointer-to-bios@outlook.com>
// SPDX-License-Identifier: MIT

#pragma once

#include <atomic>

#include <evl/compile_time/platform.h>
#include <evl/utils/types.h>

namespace evl {

using namespace types;

enum class fence_strategy {
    // `lock cmpxchg` on a throwaway cell
    compare_exchange,
    // std::atomic_thread_fence(seq_cst), `mfence` on x86
    thread_fence,
};

namespace detail {

using compile_time::platform::machine;
using compile_time::platform::platform;

consteval fence_strategy select_fence_strategy() {
#ifdef EVL_DIRECT_FENCE
    return fence_strategy::thread_fence;
#else
    if (platform::thread_sanitized())
        return fence_strategy::thread_fence;
    if (platform::machine_is(machine::x86_64) || platform::machine_is(machine::i386))
        return fence_strategy::compare_exchange;
    return fence_strategy::thread_fence;
#endif
}

};  // namespace detail

inline constexpr fence_strategy full_fence_strategy = detail::select_fence_strategy();

// Equivalent to std::atomic_thread_fence(morder::seq_cst).
//
// On x86 both `mfence` and a `lock`-prefixed read-modify-write act as a full barrier, and the
// latter has been measured to be slightly cheaper. The signal fences keep the compiler from
// dropping or reordering around the compare-exchange on the local cell.
inline void full_fence() noexcept {
    if constexpr (full_fence_strategy == fence_strategy::compare_exchange) {
        std::atomic_signal_fence(morder::seq_cst);
        atomic_size_t cell{0};
        size_t expected{0};
        // The outcome is irrelevant, only the locked instruction is.
        [[maybe_unused]] bool exchanged =
            cell.compare_exchange_strong(expected, 1, morder::seq_cst, morder::seq_cst);
        std::atomic_signal_fence(morder::seq_cst);
    } else {
        std::atomic_thread_fence(morder::seq_cst);
    }
}

};  // namespace evl
