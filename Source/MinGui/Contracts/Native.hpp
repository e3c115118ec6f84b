// ============================================================================
// MinGui - Source/MinGui/Contracts/Native.hpp
// ----------------------------------------------------------------------------
// Purpose : Native windowing contract. Everything MinGui needs from the OS
//           (class registration, window lifetime, the message queue, timers,
//           menus, GDI objects, paint sessions, a few window properties) goes
//           through this
//           function table so the dispatch core never includes <windows.h>.
//           BeginNativePaint validates the update region; a Paint reply that
//           never opened a paint session leaves the window invalid.
// Contract: Header-only, no exceptions/RTTI. All types are POD or trivially
//           copyable. Every entry is noexcept. Window procedures registered
//           through this contract may be re-entered synchronously from inside
//           CreateNativeWindow, DestroyNativeWindow, SendNativeMessage and
//           DispatchNativeMessage. For the NcCreate and Create codes, lParam
//           points at a NativeCreateParams valid for the duration of the call.
// Notes   : Identifiers avoid names that <windows.h> redefines as macros
//           (CreateWindow, RegisterClass, SendMessage...).
// ============================================================================

#pragma once

#include "MinGui/Rect.hpp"
#include "MinGui/Types.hpp"

#include <concepts>
#include <string_view>
#include <type_traits>

namespace mingui::native
{
    // ------------------------------------------------------------------------
    // Public POD types
    // ------------------------------------------------------------------------

    struct TextView
    {
        const char* data = nullptr; // Non-owning, not guaranteed null-terminated.
        u32         size = 0;

        [[nodiscard]] constexpr std::string_view AsStringView() const noexcept
        {
            return (data != nullptr) ? std::string_view(data, size) : std::string_view{};
        }
    };

    [[nodiscard]] constexpr TextView MakeTextView(std::string_view text) noexcept
    {
        return TextView{ text.data(), static_cast<u32>(text.size()) };
    }

    // Window class names compare case-insensitively (ASCII folding).
    [[nodiscard]] constexpr bool EqualsIgnoreCaseAscii(std::string_view lhs, std::string_view rhs) noexcept
    {
        if (lhs.size() != rhs.size())
        {
            return false;
        }
        for (usize i = 0; i < lhs.size(); ++i)
        {
            char a = lhs[i];
            char b = rhs[i];
            a = (a >= 'A' && a <= 'Z') ? static_cast<char>(a - 'A' + 'a') : a;
            b = (b >= 'A' && b <= 'Z') ? static_cast<char>(b - 'A' + 'a') : b;
            if (a != b)
            {
                return false;
            }
        }
        return true;
    }

    // Opaque OS identifier for a window, control, menu, GDI object or DC.
    // Unique while alive; the OS may hand the same value out again later.
    struct NativeHandle
    {
        u64 value = 0;

        [[nodiscard]] constexpr bool IsValid() const noexcept { return value != 0; }
        [[nodiscard]] static constexpr NativeHandle Invalid() noexcept { return NativeHandle{}; }

        [[nodiscard]] friend constexpr bool operator==(NativeHandle, NativeHandle) noexcept = default;
    };

    using WordParam    = usize;
    using LongParam    = isize;
    using NativeResult = isize;
    using OsErrorCode  = u32;
    using ClassAtom    = u16;
    using TimerId      = usize;
    using ColorRef     = u32; // 0x00BBGGRR

    [[nodiscard]] constexpr ColorRef MakeRgb(u8 r, u8 g, u8 b) noexcept
    {
        return static_cast<ColorRef>(r) |
               (static_cast<ColorRef>(g) << 8u) |
               (static_cast<ColorRef>(b) << 16u);
    }

    // OS error codes reported through GetLastOsError (Win32 values).
    namespace os_error
    {
        inline constexpr OsErrorCode kNone                = 0;
        inline constexpr OsErrorCode kInvalidHandle       = 6;
        inline constexpr OsErrorCode kNotEnoughMemory     = 8;
        inline constexpr OsErrorCode kInvalidParameter    = 87;
        inline constexpr OsErrorCode kWaitTimeout         = 258;
        inline constexpr OsErrorCode kCancelled           = 1223;
        inline constexpr OsErrorCode kInvalidWindowHandle = 1400;
        inline constexpr OsErrorCode kInvalidMenuHandle   = 1401;
        inline constexpr OsErrorCode kCannotFindClass     = 1407;
        inline constexpr OsErrorCode kClassAlreadyExists  = 1410;
        inline constexpr OsErrorCode kClassDoesNotExist   = 1411;
        inline constexpr OsErrorCode kClassHasWindows     = 1412;
        inline constexpr OsErrorCode kInvalidTimer        = 1402;
    } // namespace os_error

    using WindowProc = NativeResult (*)(NativeHandle handle, u32 code, WordParam wParam, LongParam lParam) noexcept;

    enum class NativeStatus : u8
    {
        Ok = 0,
        InvalidArg,
        NotFound,
        AlreadyExists,
        OutOfResources,
        Rejected,
        Failed
    };

    enum class GetMessageResult : u8
    {
        Message = 0,
        Quit,
        Failed
    };

    enum class ShowCommand : i32
    {
        Hide            = 0,
        ShowNormal      = 1,
        ShowMinimized   = 2,
        ShowMaximized   = 3,
        ShowNoActivate  = 4,
        Show            = 5,
        Minimize        = 6,
        ShowMinNoActive = 7,
        ShowNa          = 8,
        Restore         = 9,
        ShowDefault     = 10,
        ForceMinimize   = 11
    };

    enum class MenuKind : u8
    {
        Bar = 0,
        Popup
    };

    struct NativeClassDesc
    {
        TextView     name{};
        WindowProc   proc = nullptr;
        u32          style = 0;
        NativeHandle icon{};
        NativeHandle smallIcon{};
        NativeHandle cursor{};
        NativeHandle background{};
        u16          menuResource = 0; // 0 = no class menu.
    };

    struct NativeWindowDesc
    {
        TextView     className{};
        TextView     title{};
        u32          style   = 0;
        u32          exStyle = 0;
        i32          x      = 0;
        i32          y      = 0;
        i32          width  = 0;
        i32          height = 0;
        NativeHandle parent{};
        u16          controlId = 0; // Child windows only; 0 = none.
        void*        userParam = nullptr;
    };

    // What lParam points at for NcCreate and Create.
    struct NativeCreateParams
    {
        ClassAtom    classAtom = 0;
        TextView     className{};
        NativeHandle parent{};
        u16          controlId = 0;
        void*        userParam = nullptr;
    };

    struct NativeMessage
    {
        NativeHandle handle{};
        u32          code = 0;
        WordParam    wParam = 0;
        LongParam    lParam = 0;
    };

    // One BeginNativePaint/EndNativePaint pair (the PAINTSTRUCT role).
    struct NativePaintInfo
    {
        NativeHandle dc{};
        Rect         area{};                  // Region to repaint, client coordinates.
        bool         eraseBackground = false; // True when EraseBkgnd was not handled.
    };

    struct NativeCaps
    {
        DeterminismMode  determinism = DeterminismMode::Unknown;
        ThreadSafetyMode threadSafety = ThreadSafetyMode::Unknown;
        bool             blockingQueue = false;   // GetNextMessage may park the thread.
        bool             recyclesHandles = false;
    };

    static_assert(std::is_trivially_copyable_v<TextView>);
    static_assert(std::is_trivially_copyable_v<NativeHandle>);
    static_assert(std::is_trivially_copyable_v<NativeClassDesc>);
    static_assert(std::is_trivially_copyable_v<NativeWindowDesc>);
    static_assert(std::is_trivially_copyable_v<NativeCreateParams>);
    static_assert(std::is_trivially_copyable_v<NativeMessage>);
    static_assert(std::is_trivially_copyable_v<NativePaintInfo>);
    static_assert(std::is_trivially_copyable_v<NativeCaps>);

    // ------------------------------------------------------------------------
    // Dynamic face (v-table for late binding)
    // ------------------------------------------------------------------------

    struct NativeVTable
    {
        using GetCapsFunc             = NativeCaps(*)(const void* userData) noexcept;
        using GetLastOsErrorFunc      = OsErrorCode(*)(const void* userData) noexcept;
        using RegisterWindowClassFunc = NativeStatus(*)(void* userData, const NativeClassDesc& desc, ClassAtom& outAtom) noexcept;
        using UnregisterWindowClassFunc = NativeStatus(*)(void* userData, TextView name) noexcept;
        using CreateNativeWindowFunc  = NativeStatus(*)(void* userData, const NativeWindowDesc& desc, NativeHandle& outHandle) noexcept;
        using DestroyNativeWindowFunc = NativeStatus(*)(void* userData, NativeHandle handle) noexcept;
        using IsLiveWindowFunc        = bool(*)(const void* userData, NativeHandle handle) noexcept;
        using CallDefaultProcFunc     = NativeResult(*)(void* userData, NativeHandle handle, u32 code, WordParam wParam, LongParam lParam) noexcept;
        using GetNextMessageFunc      = GetMessageResult(*)(void* userData, NativeMessage& outMessage) noexcept;
        using DispatchNativeMessageFunc = NativeResult(*)(void* userData, const NativeMessage& message) noexcept;
        using PostNativeMessageFunc   = NativeStatus(*)(void* userData, NativeHandle handle, u32 code, WordParam wParam, LongParam lParam) noexcept;
        using SendNativeMessageFunc   = NativeStatus(*)(void* userData, NativeHandle handle, u32 code, WordParam wParam, LongParam lParam, NativeResult& outResult) noexcept;
        using PostQuitFunc            = void(*)(void* userData, i32 exitCode) noexcept;
        using SetTimerFunc            = NativeStatus(*)(void* userData, NativeHandle handle, TimerId id, u32 elapseMs) noexcept;
        using KillTimerFunc           = NativeStatus(*)(void* userData, NativeHandle handle, TimerId id) noexcept;
        using CreateNativeMenuFunc    = NativeStatus(*)(void* userData, MenuKind kind, NativeHandle& outMenu) noexcept;
        using AppendMenuItemFunc      = NativeStatus(*)(void* userData, NativeHandle menu, u16 id, TextView text) noexcept;
        using AppendMenuSeparatorFunc = NativeStatus(*)(void* userData, NativeHandle menu) noexcept;
        using AppendSubMenuFunc       = NativeStatus(*)(void* userData, NativeHandle menu, NativeHandle subMenu, TextView text) noexcept;
        using SetWindowMenuFunc       = NativeStatus(*)(void* userData, NativeHandle window, NativeHandle menu) noexcept;
        using DestroyNativeMenuFunc   = NativeStatus(*)(void* userData, NativeHandle menu) noexcept;
        using CreateBrushFunc         = NativeStatus(*)(void* userData, ColorRef color, NativeHandle& outBrush) noexcept;
        using DeleteGdiObjectFunc     = NativeStatus(*)(void* userData, NativeHandle object) noexcept;
        using ShowNativeWindowFunc    = NativeStatus(*)(void* userData, NativeHandle handle, ShowCommand command) noexcept;
        using UpdateNativeWindowFunc  = NativeStatus(*)(void* userData, NativeHandle handle) noexcept;
        using SetWindowTitleFunc      = NativeStatus(*)(void* userData, NativeHandle handle, TextView text) noexcept;
        using GetWindowTitleFunc      = NativeStatus(*)(void* userData, NativeHandle handle, char* buffer, u32 capacity, u32& outLength) noexcept;
        using GetClientAreaFunc       = NativeStatus(*)(void* userData, NativeHandle handle, Rect& outRect) noexcept;
        using MoveNativeWindowFunc    = NativeStatus(*)(void* userData, NativeHandle handle, const Rect& rect) noexcept;
        using InvalidateNativeWindowFunc = NativeStatus(*)(void* userData, NativeHandle handle, bool eraseBackground) noexcept;
        using BeginNativePaintFunc    = NativeStatus(*)(void* userData, NativeHandle handle, NativePaintInfo& outInfo) noexcept;
        using EndNativePaintFunc      = NativeStatus(*)(void* userData, NativeHandle handle, NativeHandle dc) noexcept;
        using FillAreaFunc            = NativeStatus(*)(void* userData, NativeHandle dc, const Rect& area, NativeHandle brush) noexcept;

        GetCapsFunc               getCaps               = nullptr;
        GetLastOsErrorFunc        getLastOsError        = nullptr;
        RegisterWindowClassFunc   registerWindowClass   = nullptr;
        UnregisterWindowClassFunc unregisterWindowClass = nullptr;
        CreateNativeWindowFunc    createNativeWindow    = nullptr;
        DestroyNativeWindowFunc   destroyNativeWindow   = nullptr;
        IsLiveWindowFunc          isLiveWindow          = nullptr;
        CallDefaultProcFunc       callDefaultProc       = nullptr;
        GetNextMessageFunc        getNextMessage        = nullptr;
        DispatchNativeMessageFunc dispatchNativeMessage = nullptr;
        PostNativeMessageFunc     postNativeMessage     = nullptr;
        SendNativeMessageFunc     sendNativeMessage     = nullptr;
        PostQuitFunc              postQuit              = nullptr;
        SetTimerFunc              setTimer              = nullptr;
        KillTimerFunc             killTimer             = nullptr;
        CreateNativeMenuFunc      createNativeMenu      = nullptr;
        AppendMenuItemFunc        appendMenuItem        = nullptr;
        AppendMenuSeparatorFunc   appendMenuSeparator   = nullptr;
        AppendSubMenuFunc         appendSubMenu         = nullptr;
        SetWindowMenuFunc         setWindowMenu         = nullptr;
        DestroyNativeMenuFunc     destroyNativeMenu     = nullptr;
        CreateBrushFunc           createBrush           = nullptr;
        DeleteGdiObjectFunc       deleteGdiObject       = nullptr;
        ShowNativeWindowFunc      showNativeWindow      = nullptr;
        UpdateNativeWindowFunc    updateNativeWindow    = nullptr;
        SetWindowTitleFunc        setWindowTitle        = nullptr;
        GetWindowTitleFunc        getWindowTitle        = nullptr;
        GetClientAreaFunc         getClientArea         = nullptr;
        MoveNativeWindowFunc      moveNativeWindow      = nullptr;
        InvalidateNativeWindowFunc invalidateNativeWindow = nullptr;
        BeginNativePaintFunc      beginNativePaint      = nullptr;
        EndNativePaintFunc        endNativePaint        = nullptr;
        FillAreaFunc              fillArea              = nullptr;
    };

    struct NativeInterface
    {
        NativeVTable vtable{};
        void*        userData = nullptr; // Non-owning backend instance pointer.
    };

    // True when every entry is populated; partial tables are rejected at init.
    [[nodiscard]] inline bool IsComplete(const NativeInterface& iface) noexcept
    {
        const NativeVTable& v = iface.vtable;
        return iface.userData != nullptr &&
               v.getCaps && v.getLastOsError && v.registerWindowClass && v.unregisterWindowClass &&
               v.createNativeWindow && v.destroyNativeWindow && v.isLiveWindow && v.callDefaultProc &&
               v.getNextMessage && v.dispatchNativeMessage && v.postNativeMessage && v.sendNativeMessage &&
               v.postQuit && v.setTimer && v.killTimer && v.createNativeMenu && v.appendMenuItem &&
               v.appendMenuSeparator && v.appendSubMenu && v.setWindowMenu && v.destroyNativeMenu &&
               v.createBrush && v.deleteGdiObject && v.showNativeWindow && v.updateNativeWindow &&
               v.setWindowTitle && v.getWindowTitle && v.getClientArea && v.moveNativeWindow &&
               v.invalidateNativeWindow && v.beginNativePaint && v.endNativePaint && v.fillArea;
    }

    [[nodiscard]] inline NativeCaps QueryCaps(const NativeInterface& iface) noexcept
    {
        return (iface.vtable.getCaps && iface.userData) ? iface.vtable.getCaps(iface.userData) : NativeCaps{};
    }

    [[nodiscard]] inline OsErrorCode GetLastOsError(const NativeInterface& iface) noexcept
    {
        return (iface.vtable.getLastOsError && iface.userData) ? iface.vtable.getLastOsError(iface.userData) : 0u;
    }

    [[nodiscard]] inline NativeStatus RegisterWindowClass(NativeInterface& iface, const NativeClassDesc& desc, ClassAtom& outAtom) noexcept
    {
        outAtom = 0;
        return (iface.vtable.registerWindowClass && iface.userData)
            ? iface.vtable.registerWindowClass(iface.userData, desc, outAtom)
            : NativeStatus::InvalidArg;
    }

    [[nodiscard]] inline NativeStatus UnregisterWindowClass(NativeInterface& iface, TextView name) noexcept
    {
        return (iface.vtable.unregisterWindowClass && iface.userData)
            ? iface.vtable.unregisterWindowClass(iface.userData, name)
            : NativeStatus::InvalidArg;
    }

    [[nodiscard]] inline NativeStatus CreateNativeWindow(NativeInterface& iface, const NativeWindowDesc& desc, NativeHandle& outHandle) noexcept
    {
        outHandle = NativeHandle::Invalid();
        return (iface.vtable.createNativeWindow && iface.userData)
            ? iface.vtable.createNativeWindow(iface.userData, desc, outHandle)
            : NativeStatus::InvalidArg;
    }

    [[nodiscard]] inline NativeStatus DestroyNativeWindow(NativeInterface& iface, NativeHandle handle) noexcept
    {
        return (iface.vtable.destroyNativeWindow && iface.userData)
            ? iface.vtable.destroyNativeWindow(iface.userData, handle)
            : NativeStatus::InvalidArg;
    }

    [[nodiscard]] inline bool IsLiveWindow(const NativeInterface& iface, NativeHandle handle) noexcept
    {
        return (iface.vtable.isLiveWindow && iface.userData) ? iface.vtable.isLiveWindow(iface.userData, handle) : false;
    }

    [[nodiscard]] inline NativeResult CallDefaultProc(NativeInterface& iface, NativeHandle handle, u32 code, WordParam wParam, LongParam lParam) noexcept
    {
        return (iface.vtable.callDefaultProc && iface.userData)
            ? iface.vtable.callDefaultProc(iface.userData, handle, code, wParam, lParam)
            : NativeResult{0};
    }

    [[nodiscard]] inline GetMessageResult GetNextMessage(NativeInterface& iface, NativeMessage& outMessage) noexcept
    {
        outMessage = NativeMessage{};
        return (iface.vtable.getNextMessage && iface.userData)
            ? iface.vtable.getNextMessage(iface.userData, outMessage)
            : GetMessageResult::Failed;
    }

    inline NativeResult DispatchNativeMessage(NativeInterface& iface, const NativeMessage& message) noexcept
    {
        return (iface.vtable.dispatchNativeMessage && iface.userData)
            ? iface.vtable.dispatchNativeMessage(iface.userData, message)
            : NativeResult{0};
    }

    [[nodiscard]] inline NativeStatus PostNativeMessage(NativeInterface& iface, NativeHandle handle, u32 code, WordParam wParam, LongParam lParam) noexcept
    {
        return (iface.vtable.postNativeMessage && iface.userData)
            ? iface.vtable.postNativeMessage(iface.userData, handle, code, wParam, lParam)
            : NativeStatus::InvalidArg;
    }

    [[nodiscard]] inline NativeStatus SendNativeMessage(NativeInterface& iface, NativeHandle handle, u32 code, WordParam wParam, LongParam lParam, NativeResult& outResult) noexcept
    {
        outResult = 0;
        return (iface.vtable.sendNativeMessage && iface.userData)
            ? iface.vtable.sendNativeMessage(iface.userData, handle, code, wParam, lParam, outResult)
            : NativeStatus::InvalidArg;
    }

    inline void PostQuit(NativeInterface& iface, i32 exitCode) noexcept
    {
        if (iface.vtable.postQuit && iface.userData)
        {
            iface.vtable.postQuit(iface.userData, exitCode);
        }
    }

    [[nodiscard]] inline NativeStatus SetTimer(NativeInterface& iface, NativeHandle handle, TimerId id, u32 elapseMs) noexcept
    {
        return (iface.vtable.setTimer && iface.userData)
            ? iface.vtable.setTimer(iface.userData, handle, id, elapseMs)
            : NativeStatus::InvalidArg;
    }

    [[nodiscard]] inline NativeStatus KillTimer(NativeInterface& iface, NativeHandle handle, TimerId id) noexcept
    {
        return (iface.vtable.killTimer && iface.userData)
            ? iface.vtable.killTimer(iface.userData, handle, id)
            : NativeStatus::InvalidArg;
    }

    [[nodiscard]] inline NativeStatus CreateNativeMenu(NativeInterface& iface, MenuKind kind, NativeHandle& outMenu) noexcept
    {
        outMenu = NativeHandle::Invalid();
        return (iface.vtable.createNativeMenu && iface.userData)
            ? iface.vtable.createNativeMenu(iface.userData, kind, outMenu)
            : NativeStatus::InvalidArg;
    }

    [[nodiscard]] inline NativeStatus AppendMenuItem(NativeInterface& iface, NativeHandle menu, u16 id, TextView text) noexcept
    {
        return (iface.vtable.appendMenuItem && iface.userData)
            ? iface.vtable.appendMenuItem(iface.userData, menu, id, text)
            : NativeStatus::InvalidArg;
    }

    [[nodiscard]] inline NativeStatus AppendMenuSeparator(NativeInterface& iface, NativeHandle menu) noexcept
    {
        return (iface.vtable.appendMenuSeparator && iface.userData)
            ? iface.vtable.appendMenuSeparator(iface.userData, menu)
            : NativeStatus::InvalidArg;
    }

    [[nodiscard]] inline NativeStatus AppendSubMenu(NativeInterface& iface, NativeHandle menu, NativeHandle subMenu, TextView text) noexcept
    {
        return (iface.vtable.appendSubMenu && iface.userData)
            ? iface.vtable.appendSubMenu(iface.userData, menu, subMenu, text)
            : NativeStatus::InvalidArg;
    }

    [[nodiscard]] inline NativeStatus SetWindowMenu(NativeInterface& iface, NativeHandle window, NativeHandle menu) noexcept
    {
        return (iface.vtable.setWindowMenu && iface.userData)
            ? iface.vtable.setWindowMenu(iface.userData, window, menu)
            : NativeStatus::InvalidArg;
    }

    [[nodiscard]] inline NativeStatus DestroyNativeMenu(NativeInterface& iface, NativeHandle menu) noexcept
    {
        return (iface.vtable.destroyNativeMenu && iface.userData)
            ? iface.vtable.destroyNativeMenu(iface.userData, menu)
            : NativeStatus::InvalidArg;
    }

    [[nodiscard]] inline NativeStatus CreateBrush(NativeInterface& iface, ColorRef color, NativeHandle& outBrush) noexcept
    {
        outBrush = NativeHandle::Invalid();
        return (iface.vtable.createBrush && iface.userData)
            ? iface.vtable.createBrush(iface.userData, color, outBrush)
            : NativeStatus::InvalidArg;
    }

    [[nodiscard]] inline NativeStatus DeleteGdiObject(NativeInterface& iface, NativeHandle object) noexcept
    {
        return (iface.vtable.deleteGdiObject && iface.userData)
            ? iface.vtable.deleteGdiObject(iface.userData, object)
            : NativeStatus::InvalidArg;
    }

    [[nodiscard]] inline NativeStatus ShowNativeWindow(NativeInterface& iface, NativeHandle handle, ShowCommand command) noexcept
    {
        return (iface.vtable.showNativeWindow && iface.userData)
            ? iface.vtable.showNativeWindow(iface.userData, handle, command)
            : NativeStatus::InvalidArg;
    }

    [[nodiscard]] inline NativeStatus UpdateNativeWindow(NativeInterface& iface, NativeHandle handle) noexcept
    {
        return (iface.vtable.updateNativeWindow && iface.userData)
            ? iface.vtable.updateNativeWindow(iface.userData, handle)
            : NativeStatus::InvalidArg;
    }

    [[nodiscard]] inline NativeStatus SetWindowTitle(NativeInterface& iface, NativeHandle handle, TextView text) noexcept
    {
        return (iface.vtable.setWindowTitle && iface.userData)
            ? iface.vtable.setWindowTitle(iface.userData, handle, text)
            : NativeStatus::InvalidArg;
    }

    // A null buffer queries the full length. Otherwise copies at most
    // capacity-1 chars, null-terminates and reports the copied length.
    [[nodiscard]] inline NativeStatus GetWindowTitle(NativeInterface& iface, NativeHandle handle, char* buffer, u32 capacity, u32& outLength) noexcept
    {
        outLength = 0;
        return (iface.vtable.getWindowTitle && iface.userData)
            ? iface.vtable.getWindowTitle(iface.userData, handle, buffer, capacity, outLength)
            : NativeStatus::InvalidArg;
    }

    [[nodiscard]] inline NativeStatus GetClientArea(NativeInterface& iface, NativeHandle handle, Rect& outRect) noexcept
    {
        outRect = Rect{};
        return (iface.vtable.getClientArea && iface.userData)
            ? iface.vtable.getClientArea(iface.userData, handle, outRect)
            : NativeStatus::InvalidArg;
    }

    [[nodiscard]] inline NativeStatus MoveNativeWindow(NativeInterface& iface, NativeHandle handle, const Rect& rect) noexcept
    {
        return (iface.vtable.moveNativeWindow && iface.userData)
            ? iface.vtable.moveNativeWindow(iface.userData, handle, rect)
            : NativeStatus::InvalidArg;
    }

    [[nodiscard]] inline NativeStatus InvalidateNativeWindow(NativeInterface& iface, NativeHandle handle, bool eraseBackground) noexcept
    {
        return (iface.vtable.invalidateNativeWindow && iface.userData)
            ? iface.vtable.invalidateNativeWindow(iface.userData, handle, eraseBackground)
            : NativeStatus::InvalidArg;
    }

    // Sends EraseBkgnd when an erase is pending, then validates the window.
    [[nodiscard]] inline NativeStatus BeginNativePaint(NativeInterface& iface, NativeHandle handle, NativePaintInfo& outInfo) noexcept
    {
        outInfo = NativePaintInfo{};
        return (iface.vtable.beginNativePaint && iface.userData)
            ? iface.vtable.beginNativePaint(iface.userData, handle, outInfo)
            : NativeStatus::InvalidArg;
    }

    [[nodiscard]] inline NativeStatus EndNativePaint(NativeInterface& iface, NativeHandle handle, NativeHandle dc) noexcept
    {
        return (iface.vtable.endNativePaint && iface.userData)
            ? iface.vtable.endNativePaint(iface.userData, handle, dc)
            : NativeStatus::InvalidArg;
    }

    [[nodiscard]] inline NativeStatus FillArea(NativeInterface& iface, NativeHandle dc, const Rect& area, NativeHandle brush) noexcept
    {
        return (iface.vtable.fillArea && iface.userData)
            ? iface.vtable.fillArea(iface.userData, dc, area, brush)
            : NativeStatus::InvalidArg;
    }

    // ------------------------------------------------------------------------
    // Static face (concept + adapter to dynamic v-table)
    // ------------------------------------------------------------------------

    template <typename Backend>
    concept NativeBackend = requires(Backend& backend,
                                     const Backend& constBackend,
                                     const NativeClassDesc& classDesc,
                                     const NativeWindowDesc& windowDesc,
                                     const NativeMessage& message,
                                     NativeMessage& outMessage,
                                     NativeHandle handle,
                                     NativeHandle& outHandle,
                                     ClassAtom& outAtom,
                                     NativeResult& outResult,
                                     TextView text,
                                     char* buffer,
                                     u32& outLength,
                                     Rect& outRect,
                                     const Rect& rect,
                                     NativePaintInfo& outPaint,
                                     u32 code,
                                     WordParam wParam,
                                     LongParam lParam)
    {
        { constBackend.GetCaps() } noexcept -> std::same_as<NativeCaps>;
        { constBackend.GetLastOsError() } noexcept -> std::same_as<OsErrorCode>;
        { backend.RegisterWindowClass(classDesc, outAtom) } noexcept -> std::same_as<NativeStatus>;
        { backend.UnregisterWindowClass(text) } noexcept -> std::same_as<NativeStatus>;
        { backend.CreateNativeWindow(windowDesc, outHandle) } noexcept -> std::same_as<NativeStatus>;
        { backend.DestroyNativeWindow(handle) } noexcept -> std::same_as<NativeStatus>;
        { constBackend.IsLiveWindow(handle) } noexcept -> std::same_as<bool>;
        { backend.CallDefaultProc(handle, code, wParam, lParam) } noexcept -> std::same_as<NativeResult>;
        { backend.GetNextMessage(outMessage) } noexcept -> std::same_as<GetMessageResult>;
        { backend.DispatchNativeMessage(message) } noexcept -> std::same_as<NativeResult>;
        { backend.PostNativeMessage(handle, code, wParam, lParam) } noexcept -> std::same_as<NativeStatus>;
        { backend.SendNativeMessage(handle, code, wParam, lParam, outResult) } noexcept -> std::same_as<NativeStatus>;
        { backend.PostQuit(i32{}) } noexcept -> std::same_as<void>;
        { backend.SetTimer(handle, TimerId{}, u32{}) } noexcept -> std::same_as<NativeStatus>;
        { backend.KillTimer(handle, TimerId{}) } noexcept -> std::same_as<NativeStatus>;
        { backend.CreateNativeMenu(MenuKind::Bar, outHandle) } noexcept -> std::same_as<NativeStatus>;
        { backend.AppendMenuItem(handle, u16{}, text) } noexcept -> std::same_as<NativeStatus>;
        { backend.AppendMenuSeparator(handle) } noexcept -> std::same_as<NativeStatus>;
        { backend.AppendSubMenu(handle, handle, text) } noexcept -> std::same_as<NativeStatus>;
        { backend.SetWindowMenu(handle, handle) } noexcept -> std::same_as<NativeStatus>;
        { backend.DestroyNativeMenu(handle) } noexcept -> std::same_as<NativeStatus>;
        { backend.CreateBrush(ColorRef{}, outHandle) } noexcept -> std::same_as<NativeStatus>;
        { backend.DeleteGdiObject(handle) } noexcept -> std::same_as<NativeStatus>;
        { backend.ShowNativeWindow(handle, ShowCommand::Show) } noexcept -> std::same_as<NativeStatus>;
        { backend.UpdateNativeWindow(handle) } noexcept -> std::same_as<NativeStatus>;
        { backend.SetWindowTitle(handle, text) } noexcept -> std::same_as<NativeStatus>;
        { backend.GetWindowTitle(handle, buffer, u32{}, outLength) } noexcept -> std::same_as<NativeStatus>;
        { backend.GetClientArea(handle, outRect) } noexcept -> std::same_as<NativeStatus>;
        { backend.MoveNativeWindow(handle, rect) } noexcept -> std::same_as<NativeStatus>;
        { backend.InvalidateNativeWindow(handle, bool{}) } noexcept -> std::same_as<NativeStatus>;
        { backend.BeginNativePaint(handle, outPaint) } noexcept -> std::same_as<NativeStatus>;
        { backend.EndNativePaint(handle, handle) } noexcept -> std::same_as<NativeStatus>;
        { backend.FillArea(handle, rect, handle) } noexcept -> std::same_as<NativeStatus>;
    };

    namespace detail
    {
        template <typename Backend>
        struct NativeInterfaceAdapter
        {
            static Backend& Self(void* userData) noexcept { return *static_cast<Backend*>(userData); }
            static const Backend& Self(const void* userData) noexcept { return *static_cast<const Backend*>(userData); }

            static NativeCaps GetCaps(const void* u) noexcept { return Self(u).GetCaps(); }
            static OsErrorCode GetLastOsError(const void* u) noexcept { return Self(u).GetLastOsError(); }
            static NativeStatus RegisterWindowClass(void* u, const NativeClassDesc& d, ClassAtom& a) noexcept { return Self(u).RegisterWindowClass(d, a); }
            static NativeStatus UnregisterWindowClass(void* u, TextView n) noexcept { return Self(u).UnregisterWindowClass(n); }
            static NativeStatus CreateNativeWindow(void* u, const NativeWindowDesc& d, NativeHandle& h) noexcept { return Self(u).CreateNativeWindow(d, h); }
            static NativeStatus DestroyNativeWindow(void* u, NativeHandle h) noexcept { return Self(u).DestroyNativeWindow(h); }
            static bool IsLiveWindow(const void* u, NativeHandle h) noexcept { return Self(u).IsLiveWindow(h); }
            static NativeResult CallDefaultProc(void* u, NativeHandle h, u32 c, WordParam w, LongParam l) noexcept { return Self(u).CallDefaultProc(h, c, w, l); }
            static GetMessageResult GetNextMessage(void* u, NativeMessage& m) noexcept { return Self(u).GetNextMessage(m); }
            static NativeResult DispatchNativeMessage(void* u, const NativeMessage& m) noexcept { return Self(u).DispatchNativeMessage(m); }
            static NativeStatus PostNativeMessage(void* u, NativeHandle h, u32 c, WordParam w, LongParam l) noexcept { return Self(u).PostNativeMessage(h, c, w, l); }
            static NativeStatus SendNativeMessage(void* u, NativeHandle h, u32 c, WordParam w, LongParam l, NativeResult& r) noexcept { return Self(u).SendNativeMessage(h, c, w, l, r); }
            static void PostQuit(void* u, i32 exitCode) noexcept { Self(u).PostQuit(exitCode); }
            static NativeStatus SetTimer(void* u, NativeHandle h, TimerId id, u32 ms) noexcept { return Self(u).SetTimer(h, id, ms); }
            static NativeStatus KillTimer(void* u, NativeHandle h, TimerId id) noexcept { return Self(u).KillTimer(h, id); }
            static NativeStatus CreateNativeMenu(void* u, MenuKind k, NativeHandle& m) noexcept { return Self(u).CreateNativeMenu(k, m); }
            static NativeStatus AppendMenuItem(void* u, NativeHandle m, u16 id, TextView t) noexcept { return Self(u).AppendMenuItem(m, id, t); }
            static NativeStatus AppendMenuSeparator(void* u, NativeHandle m) noexcept { return Self(u).AppendMenuSeparator(m); }
            static NativeStatus AppendSubMenu(void* u, NativeHandle m, NativeHandle s, TextView t) noexcept { return Self(u).AppendSubMenu(m, s, t); }
            static NativeStatus SetWindowMenu(void* u, NativeHandle w, NativeHandle m) noexcept { return Self(u).SetWindowMenu(w, m); }
            static NativeStatus DestroyNativeMenu(void* u, NativeHandle m) noexcept { return Self(u).DestroyNativeMenu(m); }
            static NativeStatus CreateBrush(void* u, ColorRef c, NativeHandle& b) noexcept { return Self(u).CreateBrush(c, b); }
            static NativeStatus DeleteGdiObject(void* u, NativeHandle o) noexcept { return Self(u).DeleteGdiObject(o); }
            static NativeStatus ShowNativeWindow(void* u, NativeHandle h, ShowCommand c) noexcept { return Self(u).ShowNativeWindow(h, c); }
            static NativeStatus UpdateNativeWindow(void* u, NativeHandle h) noexcept { return Self(u).UpdateNativeWindow(h); }
            static NativeStatus SetWindowTitle(void* u, NativeHandle h, TextView t) noexcept { return Self(u).SetWindowTitle(h, t); }
            static NativeStatus GetWindowTitle(void* u, NativeHandle h, char* b, u32 cap, u32& len) noexcept { return Self(u).GetWindowTitle(h, b, cap, len); }
            static NativeStatus GetClientArea(void* u, NativeHandle h, Rect& r) noexcept { return Self(u).GetClientArea(h, r); }
            static NativeStatus MoveNativeWindow(void* u, NativeHandle h, const Rect& r) noexcept { return Self(u).MoveNativeWindow(h, r); }
            static NativeStatus InvalidateNativeWindow(void* u, NativeHandle h, bool e) noexcept { return Self(u).InvalidateNativeWindow(h, e); }
            static NativeStatus BeginNativePaint(void* u, NativeHandle h, NativePaintInfo& p) noexcept { return Self(u).BeginNativePaint(h, p); }
            static NativeStatus EndNativePaint(void* u, NativeHandle h, NativeHandle dc) noexcept { return Self(u).EndNativePaint(h, dc); }
            static NativeStatus FillArea(void* u, NativeHandle dc, const Rect& r, NativeHandle b) noexcept { return Self(u).FillArea(dc, r, b); }
        };
    } // namespace detail

    template <typename Backend>
    [[nodiscard]] inline NativeInterface MakeNativeInterface(Backend& backend) noexcept
    {
        static_assert(NativeBackend<Backend>, "Backend must satisfy NativeBackend concept.");

        using Adapter = detail::NativeInterfaceAdapter<Backend>;

        NativeInterface iface{};
        iface.userData                     = &backend;
        iface.vtable.getCaps               = &Adapter::GetCaps;
        iface.vtable.getLastOsError        = &Adapter::GetLastOsError;
        iface.vtable.registerWindowClass   = &Adapter::RegisterWindowClass;
        iface.vtable.unregisterWindowClass = &Adapter::UnregisterWindowClass;
        iface.vtable.createNativeWindow    = &Adapter::CreateNativeWindow;
        iface.vtable.destroyNativeWindow   = &Adapter::DestroyNativeWindow;
        iface.vtable.isLiveWindow          = &Adapter::IsLiveWindow;
        iface.vtable.callDefaultProc       = &Adapter::CallDefaultProc;
        iface.vtable.getNextMessage        = &Adapter::GetNextMessage;
        iface.vtable.dispatchNativeMessage = &Adapter::DispatchNativeMessage;
        iface.vtable.postNativeMessage     = &Adapter::PostNativeMessage;
        iface.vtable.sendNativeMessage     = &Adapter::SendNativeMessage;
        iface.vtable.postQuit              = &Adapter::PostQuit;
        iface.vtable.setTimer              = &Adapter::SetTimer;
        iface.vtable.killTimer             = &Adapter::KillTimer;
        iface.vtable.createNativeMenu      = &Adapter::CreateNativeMenu;
        iface.vtable.appendMenuItem        = &Adapter::AppendMenuItem;
        iface.vtable.appendMenuSeparator   = &Adapter::AppendMenuSeparator;
        iface.vtable.appendSubMenu         = &Adapter::AppendSubMenu;
        iface.vtable.setWindowMenu         = &Adapter::SetWindowMenu;
        iface.vtable.destroyNativeMenu     = &Adapter::DestroyNativeMenu;
        iface.vtable.createBrush           = &Adapter::CreateBrush;
        iface.vtable.deleteGdiObject       = &Adapter::DeleteGdiObject;
        iface.vtable.showNativeWindow      = &Adapter::ShowNativeWindow;
        iface.vtable.updateNativeWindow    = &Adapter::UpdateNativeWindow;
        iface.vtable.setWindowTitle        = &Adapter::SetWindowTitle;
        iface.vtable.getWindowTitle        = &Adapter::GetWindowTitle;
        iface.vtable.getClientArea         = &Adapter::GetClientArea;
        iface.vtable.moveNativeWindow      = &Adapter::MoveNativeWindow;
        iface.vtable.invalidateNativeWindow = &Adapter::InvalidateNativeWindow;
        iface.vtable.beginNativePaint      = &Adapter::BeginNativePaint;
        iface.vtable.endNativePaint        = &Adapter::EndNativePaint;
        iface.vtable.fillArea              = &Adapter::FillArea;
        return iface;
    }

} // namespace mingui::native
