// Copyright (C) 2025 pointer-to-bios <pointer-to-bios@outlook.com>
// SPDX-License-Identifier: MIT

#pragma once

namespace evl::compile_time::platform {

namespace types {

enum class machine {
    x86_64,
    i386,
    aarch64,
    arm,
    ppc64,
    ppc,
    riscv64,
    mips,
    loongarch64,
    other,
};

};  // namespace types

struct platform {
    constexpr static types::machine _machine =
#if defined(__x86_64__) || defined(__x86_64) || defined(_M_X64)
        types::machine::x86_64
#elif defined(__i386__) || defined(__i386) || defined(_M_IX86)
        types::machine::i386
#elif defined(__aarch64__) || defined(_M_ARM64)
        types::machine::aarch64
#elif defined(__arm__) || defined(_M_ARM)
        types::machine::arm
#elif defined(__powerpc64__)
        types::machine::ppc64
#elif defined(__powerpc__)
        types::machine::ppc
#elif defined(__riscv) && __riscv_xlen == 64
        types::machine::riscv64
#elif defined(__mips__)
        types::machine::mips
#elif defined(__loongarch__) && _LOONGARCH_SZPTR == 64
        types::machine::loongarch64
#else
        types::machine::other
#endif
        ;
    consteval static types::machine machine() { return _machine; }
    consteval static bool machine_is(types::machine m) { return m == _machine; }

    // ThreadSanitizer models std::atomic_thread_fence but not the ordering side effects of an
    // unrelated read-modify-write, so code that cares must know about it.
    constexpr static bool _thread_sanitized =
#if defined(__SANITIZE_THREAD__)
        true
#elif defined(__has_feature)
#    if __has_feature(thread_sanitizer)
        true
#    else
        false
#    endif
#else
        false
#endif
        ;
    consteval static bool thread_sanitized() { return _thread_sanitized; }
};

using namespace types;

};  // namespace evl::compile_time::platform
