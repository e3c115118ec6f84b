// =============================
// PlatformDefines.hpp
// =============================
#pragma once

// Pure preprocessor platform detection (OS and word size).
// Keep this header *very* lightweight: no runtime logic, no external deps.

// -----------------------------
// OS Detection
// -----------------------------
#if defined(_WIN32) || defined(_WIN64)
#define MINGUI_PLATFORM_WINDOWS 1
#else
#define MINGUI_PLATFORM_WINDOWS 0
#endif

#if defined(__linux__)
#define MINGUI_PLATFORM_LINUX 1
#else
#define MINGUI_PLATFORM_LINUX 0
#endif

#if defined(__APPLE__) && defined(__MACH__)
#define MINGUI_PLATFORM_APPLE 1
#else
#define MINGUI_PLATFORM_APPLE 0
#endif

// -----------------------------
// Word size (32/64 bits)
// -----------------------------
#if defined(_WIN64) || defined(__x86_64__) || defined(__aarch64__) || defined(__ppc64__) || defined(__LP64__)
#define MINGUI_PLATFORM_64BITS 1
#define MINGUI_PLATFORM_32BITS 0
#else
#define MINGUI_PLATFORM_64BITS 0
#define MINGUI_PLATFORM_32BITS 1
#endif

// -----------------------------
// Sanity guards
// -----------------------------
#if ((MINGUI_PLATFORM_32BITS + MINGUI_PLATFORM_64BITS) != 1)
#error "MinGui: Exactly one of MINGUI_PLATFORM_32BITS or MINGUI_PLATFORM_64BITS must be 1."
#endif

// The native message pump only exists on Windows; everything else runs the
// in-process NullNative backend.
#define MINGUI_HAS_NATIVE_WIN32 MINGUI_PLATFORM_WINDOWS

// Keep this file preprocessor-only.
