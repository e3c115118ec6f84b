// ============================================================================
// MinGui - Source/MinGui/Messages/MessageCodes.hpp
// ----------------------------------------------------------------------------
// Purpose : Numeric native message codes, mouse/key flag bits and the word
//           packing helpers shared by the translator and the backends.
// Contract: Header-only, constexpr only. Values match the Win32 ABI.
// ============================================================================

#pragma once

#include "MinGui/Types.hpp"

namespace mingui::msg
{
    namespace code
    {
        inline constexpr u32 kCreate         = 0x0001;
        inline constexpr u32 kDestroy        = 0x0002;
        inline constexpr u32 kMove           = 0x0003;
        inline constexpr u32 kSize           = 0x0005;
        inline constexpr u32 kSetFocus       = 0x0007;
        inline constexpr u32 kKillFocus      = 0x0008;
        inline constexpr u32 kPaint          = 0x000F;
        inline constexpr u32 kClose          = 0x0010;
        inline constexpr u32 kQuit           = 0x0012;
        inline constexpr u32 kEraseBkgnd     = 0x0014;
        inline constexpr u32 kGetMinMaxInfo  = 0x0024;
        inline constexpr u32 kNcCreate       = 0x0081;
        inline constexpr u32 kNcDestroy      = 0x0082;
        inline constexpr u32 kKeyDown        = 0x0100;
        inline constexpr u32 kKeyUp          = 0x0101;
        inline constexpr u32 kChar           = 0x0102;
        inline constexpr u32 kSysKeyDown     = 0x0104;
        inline constexpr u32 kSysKeyUp       = 0x0105;
        inline constexpr u32 kInitDialog     = 0x0110;
        inline constexpr u32 kCommand        = 0x0111;
        inline constexpr u32 kTimer          = 0x0113;
        inline constexpr u32 kCtlColorEdit   = 0x0133;
        inline constexpr u32 kCtlColorBtn    = 0x0135;
        inline constexpr u32 kCtlColorDlg    = 0x0136;
        inline constexpr u32 kCtlColorStatic = 0x0138;
        inline constexpr u32 kMouseMove      = 0x0200;
        inline constexpr u32 kLButtonDown    = 0x0201;
        inline constexpr u32 kLButtonUp      = 0x0202;
        inline constexpr u32 kLButtonDblClk  = 0x0203;
        inline constexpr u32 kRButtonDown    = 0x0204;
        inline constexpr u32 kRButtonUp      = 0x0205;
        inline constexpr u32 kRButtonDblClk  = 0x0206;
        inline constexpr u32 kMButtonDown    = 0x0207;
        inline constexpr u32 kMButtonUp      = 0x0208;
        inline constexpr u32 kMButtonDblClk  = 0x0209;
        inline constexpr u32 kMouseWheel     = 0x020A;
        inline constexpr u32 kMouseHWheel    = 0x020E;
        inline constexpr u32 kUser           = 0x0400;
    } // namespace code

    // MK_* bits carried in wParam of mouse messages.
    namespace mk
    {
        inline constexpr u32 kLButton  = 0x0001;
        inline constexpr u32 kRButton  = 0x0002;
        inline constexpr u32 kShift    = 0x0004;
        inline constexpr u32 kControl  = 0x0008;
        inline constexpr u32 kMButton  = 0x0010;
        inline constexpr u32 kXButton1 = 0x0020;
        inline constexpr u32 kXButton2 = 0x0040;
        inline constexpr u32 kAll      = 0x007F;
    } // namespace mk

    // SIZE_* values carried in wParam of the size message.
    namespace size
    {
        inline constexpr u32 kRestored  = 0;
        inline constexpr u32 kMinimized = 1;
        inline constexpr u32 kMaximized = 2;
        inline constexpr u32 kMaxShow   = 3;
        inline constexpr u32 kMaxHide   = 4;
    } // namespace size

    inline constexpr i32 kWheelDelta = 120;

    [[nodiscard]] constexpr u16 LowWord(u64 value) noexcept
    {
        return static_cast<u16>(value & 0xFFFFu);
    }

    [[nodiscard]] constexpr u16 HighWord(u64 value) noexcept
    {
        return static_cast<u16>((value >> 16u) & 0xFFFFu);
    }

    // Sign-extends the low/high 16 bits (GET_X_LPARAM / GET_Y_LPARAM).
    [[nodiscard]] constexpr i32 SignedLowWord(u64 value) noexcept
    {
        return static_cast<i32>(static_cast<i16>(LowWord(value)));
    }

    [[nodiscard]] constexpr i32 SignedHighWord(u64 value) noexcept
    {
        return static_cast<i32>(static_cast<i16>(HighWord(value)));
    }

    // MAKELONG: low word first, result fits either parameter slot.
    [[nodiscard]] constexpr u32 PackWords(u16 low, u16 high) noexcept
    {
        return static_cast<u32>(low) | (static_cast<u32>(high) << 16u);
    }

    [[nodiscard]] constexpr u32 PackPoint(i32 x, i32 y) noexcept
    {
        return PackWords(static_cast<u16>(x), static_cast<u16>(y));
    }

    static_assert(SignedLowWord(PackPoint(-5, 7)) == -5);
    static_assert(SignedHighWord(PackPoint(-5, 7)) == 7);

} // namespace mingui::msg
