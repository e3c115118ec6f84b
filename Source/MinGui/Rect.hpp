// ============================================================================
// MinGui - Source/MinGui/Rect.hpp
// ----------------------------------------------------------------------------
// Purpose : Edge-based rectangle matching the native RECT layout (left, top,
//           right, bottom) with helpers to reposition and resize.
// Contract: Header-only, constexpr, trivially copyable. Width/height are
//           derived from the edges and may be negative for inverted rects.
// Notes   : Sized() swaps edges when given negative extents instead of
//           producing an inverted rect.
// ============================================================================

#pragma once

#include "MinGui/Types.hpp"

#include <type_traits>

namespace mingui
{
    struct Rect
    {
        i32 left   = 0;
        i32 top    = 0;
        i32 right  = 0;
        i32 bottom = 0;

        [[nodiscard]] static constexpr Rect FromSize(i32 width, i32 height) noexcept
        {
            return Rect{ 0, 0, width, height };
        }

        [[nodiscard]] static constexpr Rect FromXYWH(i32 x, i32 y, i32 width, i32 height) noexcept
        {
            return FromSize(width, height).At(x, y);
        }

        [[nodiscard]] constexpr i32 X() const noexcept { return left; }
        [[nodiscard]] constexpr i32 Y() const noexcept { return top; }
        [[nodiscard]] constexpr i32 Width() const noexcept { return right - left; }
        [[nodiscard]] constexpr i32 Height() const noexcept { return bottom - top; }

        // Same size, new origin.
        [[nodiscard]] constexpr Rect At(i32 x, i32 y) const noexcept
        {
            return Rect{ x, y, x + Width(), y + Height() };
        }

        // Same origin, new size. Negative extents grow towards the origin.
        [[nodiscard]] constexpr Rect Sized(i32 width, i32 height) const noexcept
        {
            return Rect{ left + (width < 0 ? width : 0),
                         top + (height < 0 ? height : 0),
                         left + (width > 0 ? width : 0),
                         top + (height > 0 ? height : 0) };
        }

        [[nodiscard]] constexpr Rect ResizedBy(i32 deltaWidth, i32 deltaHeight) const noexcept
        {
            return Sized(Width() + deltaWidth, Height() + deltaHeight);
        }

        [[nodiscard]] constexpr bool Contains(i32 x, i32 y) const noexcept
        {
            return x >= left && x < right && y >= top && y < bottom;
        }

        [[nodiscard]] friend constexpr bool operator==(const Rect&, const Rect&) noexcept = default;
    };

    static_assert(std::is_trivially_copyable_v<Rect>);

} // namespace mingui
