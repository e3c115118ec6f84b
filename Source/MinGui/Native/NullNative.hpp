// ============================================================================
// MinGui - Source/MinGui/Native/NullNative.hpp
// ----------------------------------------------------------------------------
// Purpose : In-process model of the native windowing API. Satisfies the
//           Native contract without touching any platform API so the whole
//           dispatch core runs deterministically in tests, tools and CI.
// Contract: No exceptions/RTTI escape; all contract methods are noexcept.
//           Single-threaded: callers serialize access (ThreadConfined caps).
//           Class procedures are re-entered synchronously exactly where the
//           real OS would re-enter them (create, destroy, send, dispatch,
//           move, update).
// Notes   : - Class names compare case-insensitively.
//           - Handle values are recycled LIFO after destruction.
//           - GetNextMessage cannot block: an empty queue with no quit
//             pending runs the idle hook once, then fails with
//             os_error::kWaitTimeout.
//           - Timers only advance through AdvanceTime().
//           - Uses std containers; allocation failure inside a contract call
//             terminates, which is acceptable for a test model.
// ============================================================================

#pragma once

#include "MinGui/Contracts/Native.hpp"

#include <deque>
#include <functional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

namespace mingui::native
{
    struct NullNativeConfig
    {
        u32 maxWindows = 256;
    };

    class NullNative
    {
    public:
        using IdleHook = std::function<void(NullNative&)>;

        struct DeliveredMessage
        {
            NativeHandle handle{};
            u32          code = 0;
        };

        NullNative() : NullNative(NullNativeConfig{}) {}
        explicit NullNative(const NullNativeConfig& config);

        NullNative(const NullNative&) = delete;
        NullNative& operator=(const NullNative&) = delete;

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

        // --------------------------------------------------------------------
        // Simulation and inspection
        // --------------------------------------------------------------------
        void SetIdleHook(IdleHook hook) { m_IdleHook = std::move(hook); }
        void AdvanceTime(u32 elapsedMs) noexcept;
        [[nodiscard]] u64 GetTimeMs() const noexcept { return m_NowMs; }
        [[nodiscard]] NativeHandle GetScreenDc() const noexcept { return m_ScreenDc; }

        // Sends the notification a real button posts to its parent when clicked.
        [[nodiscard]] NativeStatus ClickControl(NativeHandle control, NativeResult& outResult) noexcept;
        // Asks the parent for the colors of a control (CtlColor* message).
        [[nodiscard]] NativeStatus RequestControlColor(NativeHandle control, u32 ctlColorCode, NativeResult& outResult) noexcept;

        [[nodiscard]] u32 GetRegistrationCount() const noexcept { return m_RegistrationCount; }
        [[nodiscard]] u32 GetLiveWindowCount() const noexcept { return static_cast<u32>(m_Windows.size()); }
        [[nodiscard]] u32 GetLiveMenuCount() const noexcept { return static_cast<u32>(m_Menus.size()); }
        [[nodiscard]] u32 GetLiveGdiObjectCount() const noexcept { return static_cast<u32>(m_GdiObjects.size()); }
        [[nodiscard]] u32 GetLiveTimerCount() const noexcept { return static_cast<u32>(m_Timers.size()); }
        [[nodiscard]] u32 GetQueuedMessageCount() const noexcept { return static_cast<u32>(m_Queue.size()); }
        [[nodiscard]] bool IsQuitPending() const noexcept { return m_QuitPending; }

        [[nodiscard]] bool IsClassRegistered(std::string_view name) const noexcept;
        [[nodiscard]] bool IsVisible(NativeHandle handle) const noexcept;
        [[nodiscard]] NativeHandle GetParentOf(NativeHandle handle) const noexcept;
        [[nodiscard]] NativeHandle GetMenuOf(NativeHandle window) const noexcept;
        [[nodiscard]] u32 GetMenuItemCount(NativeHandle menu) const noexcept;
        [[nodiscard]] bool IsLiveMenu(NativeHandle menu) const noexcept;
        [[nodiscard]] bool IsLiveGdiObject(NativeHandle object) const noexcept;
        [[nodiscard]] bool IsPaintPending(NativeHandle handle) const noexcept;
        [[nodiscard]] u32 GetActivePaintCount() const noexcept { return static_cast<u32>(m_PaintDcs.size()); }

        // One FillArea call that reached a paint DC.
        struct FillRecord
        {
            NativeHandle window{};
            Rect         area{};
            ColorRef     color = 0;
        };

        [[nodiscard]] const std::vector<FillRecord>& GetFillLog() const noexcept { return m_FillLog; }
        void ClearFillLog() noexcept { m_FillLog.clear(); }

        [[nodiscard]] const std::vector<DeliveredMessage>& GetDeliveryLog() const noexcept { return m_DeliveryLog; }
        void ClearDeliveryLog() noexcept { m_DeliveryLog.clear(); }

    private:
        struct ClassEntry
        {
            std::string name;
            WindowProc  proc = nullptr; // nullptr = built-in system control.
            u32         style = 0;
            ClassAtom   atom = 0;
            u32         liveWindows = 0;
            bool        isSystem = false;
        };

        struct WindowEntry
        {
            ClassAtom         classAtom = 0;
            NativeHandle      parent{};
            u16               controlId = 0;
            std::string       title;
            Rect              rect{};
            bool              visible = false;
            bool              needsPaint = false;
            bool              needsErase = false;
            NativeHandle      paintDc{};
            bool              destroying = false;
            NativeHandle      menu{};
            std::vector<u64>  children;
        };

        struct MenuItem
        {
            u16          id = 0;
            std::string  text;
            NativeHandle subMenu{};
            bool         separator = false;
        };

        struct MenuEntry
        {
            MenuKind              kind = MenuKind::Bar;
            std::vector<MenuItem> items;
            NativeHandle          parentMenu{};
            NativeHandle          ownerWindow{};
        };

        struct TimerEntry
        {
            NativeHandle window{};
            TimerId      id = 0;
            u32          intervalMs = 0;
            u64          dueAtMs = 0;
        };

        [[nodiscard]] NativeStatus Fail(NativeStatus status, OsErrorCode error) noexcept;
        [[nodiscard]] u64 AllocateHandle();
        void ReleaseHandle(u64 value) noexcept;

        [[nodiscard]] ClassEntry* FindClassEntry(std::string_view name) noexcept;
        [[nodiscard]] const ClassEntry* FindClassEntry(std::string_view name) const noexcept;
        [[nodiscard]] ClassEntry* FindClassEntryByAtom(ClassAtom atom) noexcept;
        [[nodiscard]] WindowEntry* FindWindowEntry(NativeHandle handle) noexcept;
        [[nodiscard]] const WindowEntry* FindWindowEntry(NativeHandle handle) const noexcept;
        [[nodiscard]] MenuEntry* FindMenuEntry(NativeHandle menu) noexcept;

        NativeResult Deliver(NativeHandle handle, u32 code, WordParam wParam, LongParam lParam) noexcept;
        void DestroyWindowTree(NativeHandle handle) noexcept;
        void RemoveWindowEntry(NativeHandle handle) noexcept;
        void DestroyMenuTree(NativeHandle menu) noexcept;
        void KillTimersOf(NativeHandle window) noexcept;
        void PurgeQueueFor(NativeHandle window) noexcept;
        void ReleasePaintDc(u64 dc) noexcept;

        u32                                      m_MaxWindows = 256;
        OsErrorCode                              m_LastError = os_error::kNone;
        u32                                      m_RegistrationCount = 0;
        ClassAtom                                m_NextAtom = 0xC000;
        u64                                      m_NextHandleValue = 0x00010010;
        NativeHandle                             m_ScreenDc{};
        std::vector<u64>                         m_FreeHandles;
        std::vector<ClassEntry>                  m_Classes;
        std::unordered_map<u64, WindowEntry>     m_Windows;
        std::unordered_map<u64, MenuEntry>       m_Menus;
        std::unordered_map<u64, ColorRef>        m_GdiObjects;
        std::unordered_map<u64, u64>             m_PaintDcs; // dc -> window
        std::vector<FillRecord>                  m_FillLog;
        std::vector<TimerEntry>                  m_Timers;
        std::deque<NativeMessage>                m_Queue;
        bool                                     m_QuitPending = false;
        i32                                      m_QuitCode = 0;
        u64                                      m_NowMs = 0;
        IdleHook                                 m_IdleHook;
        std::vector<DeliveredMessage>            m_DeliveryLog;
    };

    static_assert(NativeBackend<NullNative>, "NullNative must satisfy native backend concept.");

    [[nodiscard]] inline NativeInterface MakeNullNativeInterface(NullNative& backend) noexcept
    {
        return MakeNativeInterface(backend);
    }

} // namespace mingui::native
