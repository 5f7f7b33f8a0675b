/**
 * @file Platform.hpp
 * @brief Compile-time platform detection, compiler intrinsics, and
 *        portability macros.
 *
 * Detects the target operating system, CPU architecture, and compiler at
 * preprocessing time. Provides branch-prediction hints, the CPU pause hint
 * used by busy-wait loops, and the cooperative-yield build switch.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef AXIOM_CORE_PLATFORM_HPP
    #define AXIOM_CORE_PLATFORM_HPP

// ---- Operating System ----------------------------------------------------

    #if defined(_WIN32) || defined(_WIN64)
        #define AXIOM_OS_WINDOWS 1
    #elif defined(__ANDROID__)
        #define AXIOM_OS_ANDROID 1
    #elif defined(__linux__)
        #define AXIOM_OS_LINUX   1
    #elif defined(__APPLE__)
        #define AXIOM_OS_MACOS   1
    #else
        #define AXIOM_OS_UNKNOWN 1
    #endif

// ---- CPU Architecture ----------------------------------------------------

    #if defined(__x86_64__) || defined(_M_X64)
        #define AXIOM_ARCH_X64    1
    #elif defined(__aarch64__) || defined(_M_ARM64)
        #define AXIOM_ARCH_ARM64  1
    #elif defined(__i386__) || defined(_M_IX86)
        #define AXIOM_ARCH_X86    1
    #elif defined(__arm__)
        #define AXIOM_ARCH_ARM32  1
    #elif defined(__riscv)
        #define AXIOM_ARCH_RISCV  1
    #else
        #define AXIOM_ARCH_UNKNOWN 1
    #endif

// ---- Compiler ------------------------------------------------------------

    #if defined(__clang__)
        #define AXIOM_COMPILER_CLANG 1
    #elif defined(__GNUC__)
        #define AXIOM_COMPILER_GCC   1
    #elif defined(_MSC_VER)
        #define AXIOM_COMPILER_MSVC  1
    #else
        #define AXIOM_COMPILER_UNKNOWN 1
    #endif

// ---- Intrinsics ----------------------------------------------------------

    #if defined(AXIOM_COMPILER_GCC) || defined(AXIOM_COMPILER_CLANG)
        #define AXIOM_LIKELY(x)       __builtin_expect(!!(x), 1)
        #define AXIOM_UNLIKELY(x)     __builtin_expect(!!(x), 0)
    #else
        #define AXIOM_LIKELY(x)       (x)
        #define AXIOM_UNLIKELY(x)     (x)
    #endif

// ---- CPU Pause Hint ------------------------------------------------------

    #if defined(AXIOM_ARCH_X64) || defined(AXIOM_ARCH_X86)
        #if defined(AXIOM_COMPILER_MSVC)
            #include <intrin.h>
        #else
            #include <immintrin.h>
        #endif
        #define AXIOM_CPU_PAUSE() _mm_pause()
    #elif defined(AXIOM_ARCH_ARM64) || defined(AXIOM_ARCH_ARM32)
        #define AXIOM_CPU_PAUSE() __asm__ volatile("yield" ::: "memory")
    #elif defined(AXIOM_ARCH_RISCV)
        // Zihintpause `pause`, encoded so that older assemblers accept it.
        #define AXIOM_CPU_PAUSE() __asm__ volatile(".insn i 0x0F, 0, x0, x0, 0x010" ::: "memory")
    #else
        #define AXIOM_CPU_PAUSE() ((void)0)
    #endif

// ---- Cooperative Yield ---------------------------------------------------

    // 1 when a scheduler yield primitive may be used by busy-wait loops.
    // Schedulerless targets build with AXIOM_ENABLE_YIELD=0.
    #ifndef AXIOM_ENABLE_YIELD
        #if defined(AXIOM_OS_UNKNOWN)
            #define AXIOM_ENABLE_YIELD 0
        #else
            #define AXIOM_ENABLE_YIELD 1
        #endif
    #endif

#endif // AXIOM_CORE_PLATFORM_HPP
