// ============================================================================
// MinGui - Source/MinGui/Native/Win32Native.hpp
// ----------------------------------------------------------------------------
// Purpose : Native contract backed by user32/gdi32 (ANSI entry points).
// Contract: No exceptions/RTTI escape. Must be used from the thread that
//           called Init. Only one initialized Win32Native may exist at a
//           time because the Win32 WNDPROC thunk resolves class procedures
//           through a process-wide pointer to it.
// Notes   : - Compiled only on Windows; <windows.h> stays in the .cpp.
//           - NcCreate/Create reach class procedures with lParam pointing at
//             a NativeCreateParams built from the CREATESTRUCT; CallDefaultProc
//             restores the original CREATESTRUCT before calling DefWindowProc.
//           - Open paint sessions keep their PAINTSTRUCT here until EndPaint.
// ============================================================================

#pragma once

#include "MinGui/Contracts/Native.hpp"

#include <array>
#include <string>
#include <vector>

namespace mingui::native
{
    class Win32Native
    {
    public:
        Win32Native() = default;
        ~Win32Native() { Shutdown(); }

        Win32Native(const Win32Native&) = delete;
        Win32Native& operator=(const Win32Native&) = delete;

        [[nodiscard]] bool Init() noexcept;
        void Shutdown() noexcept;

        [[nodiscard]] constexpr bool IsInitialized() const noexcept
        {
            return m_IsInitialized;
        }

        [[nodiscard]] WindowProc FindClassProc(ClassAtom atom) const noexcept;

        // Records the CREATESTRUCT that the converted create params stand for.
        void PushCreateFrame(const NativeCreateParams* converted, LongParam original);
        void PopCreateFrame() noexcept;

        // --------------------------------------------------------------------
        // Native contract
        // --------------------------------------------------------------------
        [[nodiscard]] NativeCaps GetCaps() const noexcept;
        [[nodiscard]] OsErrorCode GetLastOsError() const noexcept { return m_LastError; }

        [[nodiscard]] NativeStatus RegisterWindowClass(const NativeClassDesc& desc, ClassAtom& outAtom) noexcept;
        [[nodiscard]] NativeStatus UnregisterWindowClass(TextView name) noexcept;

        [[nodiscard]] NativeStatus CreateNativeWindow(const NativeWindowDesc& desc, NativeHandle& outHandle) noexcept;
        [[nodiscard]] NativeStatus DestroyNativeWindow(NativeHandle handle) noexcept;
        [[nodiscard]] bool IsLiveWindow(NativeHandle handle) const noexcept;
        [[nodiscard]] NativeResult CallDefaultProc(NativeHandle handle, u32 code, WordParam wParam, LongParam lParam) noexcept;

        [[nodiscard]] GetMessageResult GetNextMessage(NativeMessage& outMessage) noexcept;
        NativeResult DispatchNativeMessage(const NativeMessage& message) noexcept;
        [[nodiscard]] NativeStatus PostNativeMessage(NativeHandle handle, u32 code, WordParam wParam, LongParam lParam) noexcept;
        [[nodiscard]] NativeStatus SendNativeMessage(NativeHandle handle, u32 code, WordParam wParam, LongParam lParam, NativeResult& outResult) noexcept;
        void PostQuit(i32 exitCode) noexcept;

        [[nodiscard]] NativeStatus SetTimer(NativeHandle handle, TimerId id, u32 elapseMs) noexcept;
        [[nodiscard]] NativeStatus KillTimer(NativeHandle handle, TimerId id) noexcept;

        [[nodiscard]] NativeStatus CreateNativeMenu(MenuKind kind, NativeHandle& outMenu) noexcept;
        [[nodiscard]] NativeStatus AppendMenuItem(NativeHandle menu, u16 id, TextView text) noexcept;
        [[nodiscard]] NativeStatus AppendMenuSeparator(NativeHandle menu) noexcept;
        [[nodiscard]] NativeStatus AppendSubMenu(NativeHandle menu, NativeHandle subMenu, TextView text) noexcept;
        [[nodiscard]] NativeStatus SetWindowMenu(NativeHandle window, NativeHandle menu) noexcept;
        [[nodiscard]] NativeStatus DestroyNativeMenu(NativeHandle menu) noexcept;

        [[nodiscard]] NativeStatus CreateBrush(ColorRef color, NativeHandle& outBrush) noexcept;
        [[nodiscard]] NativeStatus DeleteGdiObject(NativeHandle object) noexcept;

        [[nodiscard]] NativeStatus ShowNativeWindow(NativeHandle handle, ShowCommand command) noexcept;
        [[nodiscard]] NativeStatus UpdateNativeWindow(NativeHandle handle) noexcept;
        [[nodiscard]] NativeStatus SetWindowTitle(NativeHandle handle, TextView text) noexcept;
        [[nodiscard]] NativeStatus GetWindowTitle(NativeHandle handle, char* buffer, u32 capacity, u32& outLength) noexcept;
        [[nodiscard]] NativeStatus GetClientArea(NativeHandle handle, Rect& outRect) noexcept;
        [[nodiscard]] NativeStatus MoveNativeWindow(NativeHandle handle, const Rect& rect) noexcept;

        [[nodiscard]] NativeStatus InvalidateNativeWindow(NativeHandle handle, bool eraseBackground) noexcept;
        [[nodiscard]] NativeStatus BeginNativePaint(NativeHandle handle, NativePaintInfo& outInfo) noexcept;
        [[nodiscard]] NativeStatus EndNativePaint(NativeHandle handle, NativeHandle dc) noexcept;
        [[nodiscard]] NativeStatus FillArea(NativeHandle dc, const Rect& area, NativeHandle brush) noexcept;

    private:
        struct ClassRecord
        {
            std::string name;
            ClassAtom   atom = 0;
            WindowProc  proc = nullptr;
        };

        struct CreateFrame
        {
            const NativeCreateParams* converted = nullptr;
            LongParam                 original  = 0;
        };

        // Opaque PAINTSTRUCT storage; the .cpp checks the size.
        static constexpr usize kPaintStructBytes = 128;

        struct PaintFrame
        {
            u64 window = 0;
            u64 dc = 0;
            alignas(8) std::array<unsigned char, kPaintStructBytes> paintStruct{};
        };

        [[nodiscard]] NativeStatus FailWithLastError(NativeStatus status) noexcept;
        [[nodiscard]] NativeStatus Succeed() noexcept;

        std::vector<ClassRecord> m_Classes;
        std::vector<CreateFrame> m_CreateFrames;
        std::vector<PaintFrame>  m_PaintFrames;
        NativeMessage            m_LastMessage{};
        u32                      m_LastMessageTime = 0;
        i32                      m_LastMessagePointX = 0;
        i32                      m_LastMessagePointY = 0;
        OsErrorCode              m_LastError = os_error::kNone;
        bool                     m_IsInitialized = false;
    };

    static_assert(NativeBackend<Win32Native>, "Win32Native must satisfy native backend concept.");

    [[nodiscard]] inline NativeInterface MakeWin32NativeInterface(Win32Native& backend) noexcept
    {
        return MakeNativeInterface(backend);
    }

} // namespace mingui::native
