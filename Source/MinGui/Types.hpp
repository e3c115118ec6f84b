#pragma once

#include <cstdint>  // int32_t, uint32_t...
#include <cstddef>  // size_t, ptrdiff_t

// =============================
// Types.hpp
// =============================
// Fixed-size aliases used across MinGui. Native word-sized parameters are
// expressed with usize/isize so the same code compiles for 32 and 64-bit
// targets without pulling <windows.h> into public headers.
// =============================

namespace mingui
{
using i8  = std::int8_t;
using i16 = std::int16_t;
using i32 = std::int32_t;
using i64 = std::int64_t;

using u8  = std::uint8_t;
using u16 = std::uint16_t;
using u32 = std::uint32_t;
using u64 = std::uint64_t;

// Machine words: the width of a native message parameter.
using usize = std::size_t;
using isize = std::ptrdiff_t;

// Reported by a native backend through NativeCaps.
enum class DeterminismMode : u8
{
    Unknown = 0,
    Off,     // real OS: message timing depends on the user and the system
    Replay,  // same calls produce the same messages and handles
    Strict
};

enum class ThreadSafetyMode : u8
{
    Unknown = 0,
    ExternalSync,
    ThreadConfined  // every call must come from the thread that owns the windows
};
} // namespace mingui
