// ============================================================================
// MinGui - Source/MinGui/Contracts/NativeStyles.hpp
// ----------------------------------------------------------------------------
// Purpose : Class style, window style and system color constants understood
//           by the native backends. Values match the Win32 ABI so the Win32
//           backend forwards them unchanged.
// Contract: Header-only, constexpr only.
// ============================================================================

#pragma once

#include "MinGui/Contracts/Native.hpp"

namespace mingui::native
{
    struct ClassStyle
    {
        static constexpr u32 kVerticalRedraw   = 0x00000001;
        static constexpr u32 kHorizontalRedraw = 0x00000002;
        static constexpr u32 kDoubleClicks     = 0x00000008;
        static constexpr u32 kOwnDc            = 0x00000020;
        static constexpr u32 kClassDc          = 0x00000040;
        static constexpr u32 kParentDc         = 0x00000080;
        static constexpr u32 kNoClose          = 0x00000200;
        static constexpr u32 kSaveBits         = 0x00000800;
        static constexpr u32 kByteAlignClient  = 0x00001000;
        static constexpr u32 kByteAlignWindow  = 0x00002000;
        static constexpr u32 kGlobalClass      = 0x00004000;
        static constexpr u32 kDropShadow       = 0x00020000;
    };

    struct WindowStyle
    {
        static constexpr u32 kOverlapped   = 0x00000000;
        static constexpr u32 kPopup        = 0x80000000;
        static constexpr u32 kChild        = 0x40000000;
        static constexpr u32 kMinimize     = 0x20000000;
        static constexpr u32 kVisible      = 0x10000000;
        static constexpr u32 kDisabled     = 0x08000000;
        static constexpr u32 kClipSiblings = 0x04000000;
        static constexpr u32 kClipChildren = 0x02000000;
        static constexpr u32 kMaximize     = 0x01000000;
        static constexpr u32 kCaption      = 0x00C00000;
        static constexpr u32 kBorder       = 0x00800000;
        static constexpr u32 kDlgFrame     = 0x00400000;
        static constexpr u32 kVScroll      = 0x00200000;
        static constexpr u32 kHScroll      = 0x00100000;
        static constexpr u32 kSysMenu      = 0x00080000;
        static constexpr u32 kThickFrame   = 0x00040000;
        static constexpr u32 kGroup        = 0x00020000;
        static constexpr u32 kTabStop      = 0x00010000;
        static constexpr u32 kMinimizeBox  = 0x00020000;
        static constexpr u32 kMaximizeBox  = 0x00010000;
        static constexpr u32 kOverlappedWindow =
            kOverlapped | kCaption | kSysMenu | kThickFrame | kMinimizeBox | kMaximizeBox;
    };

    struct ExStyle
    {
        static constexpr u32 kDlgModalFrame    = 0x00000001;
        static constexpr u32 kTopMost          = 0x00000008;
        static constexpr u32 kAcceptFiles      = 0x00000010;
        static constexpr u32 kTransparent      = 0x00000020;
        static constexpr u32 kToolWindow       = 0x00000080;
        static constexpr u32 kWindowEdge       = 0x00000100;
        static constexpr u32 kClientEdge       = 0x00000200;
        static constexpr u32 kAppWindow        = 0x00040000;
        static constexpr u32 kOverlappedWindow = kWindowEdge | kClientEdge;
    };

    // Control-specific style bits (BS_*, ES_*, SS_*, LBS_*, CBS_*).
    struct ControlStyle
    {
        static constexpr u32 kPushButton      = 0x0000;
        static constexpr u32 kDefPushButton   = 0x0001;
        static constexpr u32 kCheckBox        = 0x0002;
        static constexpr u32 kAutoCheckBox    = 0x0003;
        static constexpr u32 kRadioButton     = 0x0004;
        static constexpr u32 kGroupBox        = 0x0007;
        static constexpr u32 kAutoRadioButton = 0x0009;

        static constexpr u32 kEditLeft        = 0x0000;
        static constexpr u32 kEditCenter      = 0x0001;
        static constexpr u32 kEditRight       = 0x0002;
        static constexpr u32 kEditMultiLine   = 0x0004;
        static constexpr u32 kEditPassword    = 0x0020;
        static constexpr u32 kEditAutoVScroll = 0x0040;
        static constexpr u32 kEditAutoHScroll = 0x0080;
        static constexpr u32 kEditReadOnly    = 0x0800;

        static constexpr u32 kStaticLeft      = 0x0000;
        static constexpr u32 kStaticCenter    = 0x0001;
        static constexpr u32 kStaticRight     = 0x0002;

        static constexpr u32 kListBoxNotify   = 0x0001;
        static constexpr u32 kListBoxSort     = 0x0002;

        static constexpr u32 kComboDropDown     = 0x0002;
        static constexpr u32 kComboDropDownList = 0x0003;
    };

    // Notification codes carried in the high word of a control's Command.
    struct Notify
    {
        static constexpr u16 kButtonClicked     = 0x0000;
        static constexpr u16 kListBoxSelChange  = 0x0001;
        static constexpr u16 kComboBoxSelChange = 0x0001;
        static constexpr u16 kEditChange        = 0x0300;
    };

    inline constexpr i32 kUseDefault = static_cast<i32>(0x80000000u);

    enum class SystemColor : i32
    {
        ScrollBar               = 0,
        Desktop                 = 1,
        ActiveCaption           = 2,
        InactiveCaption         = 3,
        Menu                    = 4,
        Window                  = 5,
        WindowFrame             = 6,
        MenuText                = 7,
        WindowText              = 8,
        CaptionText             = 9,
        ActiveBorder            = 10,
        InactiveBorder          = 11,
        AppWorkspace            = 12,
        Highlight               = 13,
        HighlightText           = 14,
        Face3D                  = 15,
        Shadow3D                = 16,
        GrayText                = 17,
        ButtonText              = 18,
        InactiveCaptionText     = 19,
        Highlight3D             = 20,
        DarkShadow3D            = 21,
        Light3D                 = 22,
        InfoText                = 23,
        InfoBackground          = 24,
        HotLight                = 26,
        GradientActiveCaption   = 27,
        GradientInactiveCaption = 28,
        MenuHighlight           = 29,
        MenuBar                 = 30
    };

    // Class background brushes may name a system color as (index + 1).
    [[nodiscard]] constexpr NativeHandle SystemColorBrush(SystemColor color) noexcept
    {
        return NativeHandle{ static_cast<u64>(static_cast<i32>(color) + 1) };
    }

} // namespace mingui::native
