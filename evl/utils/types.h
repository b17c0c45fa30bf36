// Copyright (C) 2025 pointer-to-bios <pointer-to-bios@outlook.com>
// SPDX-License-Identifier: MIT

#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <variant>

namespace evl::types {

using size_t = std::size_t;

#ifdef __SIZEOF_INT128__
using int128_t = __int128;
using uint128_t = unsigned __int128;
#endif

using morder = std::memory_order;

using atomic_bool = std::atomic_bool;
using atomic_size_t = std::atomic_size_t;

// Tag type of notifications that carry no payload.
using unit = std::monostate;

};  // namespace evl::types
