#pragma once
//
// MinGui - Diagnostics/Check.hpp
// Diagnostics macros for programming errors (thread affinity, lifecycle
// misuse). Runtime conditions use status codes instead; these macros only
// make the misuse visible.
//
// Provided:
//   - MINGUI_CHECK(cond)                  : soft check, no-op in Release.
//   - MINGUI_VERIFY(cond)                 : always evaluates cond.
//   - MINGUI_CHECK_FAILED(Category, Fmt, ...) : logs an Error record in every
//     build, then trips the Debug break when MINGUI_CHECK_BREAK is defined.
//     Callers still return their WrongThread/InvalidState status afterwards.
//
// MINGUI_ASSERT(...) lives in Logger.hpp.
//
// Optional toggles (define before including this header):
//   - MINGUI_CHECK_BREAK   : MINGUI_CHECK / MINGUI_CHECK_FAILED break in Debug
//   - MINGUI_VERIFY_BREAK  : MINGUI_VERIFY breaks in Debug when cond fails
//

#include "MinGui/Logger.hpp"

#ifndef MINGUI_DEBUG
#  ifndef NDEBUG
#    define MINGUI_DEBUG 1
#  else
#    define MINGUI_DEBUG 0
#  endif
#endif

#if MINGUI_DEBUG
#  if defined(_MSC_VER)
#    define MINGUI_INTERNAL_DEBUG_BREAK() __debugbreak()
#  elif defined(__clang__) || defined(__GNUC__)
#    define MINGUI_INTERNAL_DEBUG_BREAK() __builtin_trap()
#  else
#    define MINGUI_INTERNAL_DEBUG_BREAK() ::mingui::core::Logger::Abort()
#  endif
#else
#  define MINGUI_INTERNAL_DEBUG_BREAK() ((void)0)
#endif

#if MINGUI_DEBUG && defined(MINGUI_CHECK_BREAK)
#  define MINGUI_INTERNAL_CHECK_BREAK() MINGUI_INTERNAL_DEBUG_BREAK()
#else
#  define MINGUI_INTERNAL_CHECK_BREAK() ((void)0)
#endif

#ifndef MINGUI_CHECK
#  if MINGUI_DEBUG
#    define MINGUI_CHECK(cond) do { if (!(cond)) { MINGUI_INTERNAL_CHECK_BREAK(); } } while (0)
#  else
#    define MINGUI_CHECK(cond) ((void)0)
#  endif
#endif

#ifndef MINGUI_CHECK_FAILED
#  define MINGUI_CHECK_FAILED(Category, Fmt, ...) do { \
        MINGUI_LOG_ERROR(Category, Fmt __VA_OPT__(,) __VA_ARGS__); \
        MINGUI_INTERNAL_CHECK_BREAK(); \
    } while (0)
#endif

#ifndef MINGUI_VERIFY
#  if MINGUI_DEBUG && defined(MINGUI_VERIFY_BREAK)
#    define MINGUI_VERIFY(cond) do { if (!(cond)) { MINGUI_INTERNAL_DEBUG_BREAK(); } } while (0)
#  else
#    define MINGUI_VERIFY(cond) ((void)(cond))
#  endif
#endif
