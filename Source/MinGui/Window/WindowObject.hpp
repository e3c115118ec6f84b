// ============================================================================
// MinGui - Source/MinGui/Window/WindowObject.hpp
// ----------------------------------------------------------------------------
// Purpose : One concrete window/control type. Owns its native handle and the
//           sub-resources it created (brushes, timers, attached menu) and
//           routes typed events to per-category handlers.
// Contract: Created only through WindowObject::Create, on the owner thread
//           of the GuiContext. State machine is one-way:
//           Uninitialized -> Created -> Destroyed. The registry entry exists
//           before the OS creation call returns and is removed when the
//           window observes its own NcDestroy. Handler exceptions never
//           cross the native boundary; they become NotHandled.
// Notes   : - Objects are heap-owned (std::unique_ptr) and neither copyable
//             nor movable: the registry stores raw pointers to them.
//           - Destroying a still-alive object destroys its native window.
//           - Children destroyed by the OS cascade each observe their own
//             NcDestroy. System-class controls never reach the trampoline:
//             after any destroy, every registered system control whose
//             native window is gone is marked Destroyed.
//           - Destroy/NcDestroy bookkeeping runs before the handler, so a
//             handler may release its own object.
// ============================================================================

#pragma once

#include "MinGui/Contracts/Native.hpp"
#include "MinGui/Contracts/NativeStyles.hpp"
#include "MinGui/Messages/Event.hpp"
#include "MinGui/Messages/EventTranslator.hpp"
#include "MinGui/Window/ClassRegistrar.hpp"

#include <array>
#include <functional>
#include <memory>
#include <new>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

namespace mingui::runtime
{
    struct GuiContext;
}

namespace mingui::win
{
    class Menu;

    using msg::CategoryMask;
    using msg::Event;
    using msg::EventCategory;
    using msg::HandlerResult;
    using native::ColorRef;
    using native::NativeResult;
    using native::OsErrorCode;
    using native::ShowCommand;
    using native::TimerId;
    using native::WindowStyle;

    enum class WindowState : u8
    {
        Uninitialized = 0,
        Created,
        Destroyed
    };

    enum class WindowStatus : u8
    {
        Ok = 0,
        InvalidArg,
        CreationFailed,
        WrongThread,
        NotInitialized,
        InvalidState,
        NotSupported,
        OsFailure,
        OutOfMemory
    };

    [[nodiscard]] constexpr const char* ToString(WindowStatus status) noexcept
    {
        switch (status)
        {
            case WindowStatus::Ok:             return "Ok";
            case WindowStatus::InvalidArg:     return "InvalidArg";
            case WindowStatus::CreationFailed: return "CreationFailed";
            case WindowStatus::WrongThread:    return "WrongThread";
            case WindowStatus::NotInitialized: return "NotInitialized";
            case WindowStatus::InvalidState:   return "InvalidState";
            case WindowStatus::NotSupported:   return "NotSupported";
            case WindowStatus::OsFailure:      return "OsFailure";
            case WindowStatus::OutOfMemory:    return "OutOfMemory";
            default:                           return "Unknown";
        }
    }

    struct CreationError
    {
        WindowStatus status = WindowStatus::Ok;
        OsErrorCode  osError = native::os_error::kNone;
    };

    using EventHandler = std::function<HandlerResult(const Event&)>;

    struct Subscription
    {
        EventCategory category = EventCategory::Passthrough;
        EventHandler  handler;
    };

    class WindowObject;

    struct CreateParams
    {
        // Either an owned class token or a system class name.
        ClassToken       classToken{};
        std::string_view systemClassName{};

        std::string_view title{};
        u32              style = WindowStyle::kOverlappedWindow;
        u32              exStyle = 0;
        i32              x = native::kUseDefault;
        i32              y = native::kUseDefault;
        i32              width = native::kUseDefault;
        i32              height = native::kUseDefault;
        WindowObject*    parent = nullptr;
        u16              controlId = 0;
        CategoryMask     capabilities = CategoryMask::All();

        // Installed before the OS call so Create and the first Size/Move
        // notifications reach them.
        std::vector<Subscription> handlers;

        bool             quitOnDestroy = false;
        i32              quitExitCode = 0;

        CreateParams& WithRect(const Rect& rect) noexcept
        {
            x = rect.X();
            y = rect.Y();
            width = rect.Width();
            height = rect.Height();
            return *this;
        }
    };

    class WindowObject
    {
    public:
        ~WindowObject();

        WindowObject(const WindowObject&) = delete;
        WindowObject& operator=(const WindowObject&) = delete;
        WindowObject(WindowObject&&) = delete;
        WindowObject& operator=(WindowObject&&) = delete;

        [[nodiscard]] static WindowStatus Create(runtime::GuiContext& context,
                                                 CreateParams params,
                                                 std::unique_ptr<WindowObject>& outWindow,
                                                 CreationError& outError) noexcept;

        // Idempotent. Ok once Destroyed or while the Destroy dispatch runs.
        [[nodiscard]] WindowStatus Destroy() noexcept;

        // Marks Destroyed every registered system control whose native window
        // no longer exists.
        static void PurgeDeadSystemWindows(runtime::GuiContext& context) noexcept;

        // Last registration wins. An empty handler removes the subscription.
        [[nodiscard]] WindowStatus Subscribe(EventCategory category, EventHandler handler) noexcept;
        [[nodiscard]] WindowStatus Unsubscribe(EventCategory category) noexcept;

        // Typed form: fn(const Payload&) -> HandlerResult.
        template <typename Payload, typename Fn>
        [[nodiscard]] WindowStatus On(Fn&& fn) noexcept
        {
            static_assert(msg::kIsEventPayload<Payload>, "On<> needs an EventPayload alternative.");
            static_assert(std::is_invocable_r_v<HandlerResult, Fn&, const Payload&>,
                          "Handler must be callable as HandlerResult(const Payload&).");
            try
            {
                return Subscribe(msg::CategoryOf<Payload>(),
                                 [fn = std::forward<Fn>(fn)](const Event& event) mutable -> HandlerResult {
                                     const Payload* payload = event.As<Payload>();
                                     return (payload != nullptr) ? fn(*payload) : HandlerResult::NotHandled();
                                 });
            }
            catch (const std::bad_alloc&)
            {
                return WindowStatus::OutOfMemory;
            }
        }

        [[nodiscard]] bool IsSubscribed(EventCategory category) const noexcept;

        // Dispatch boundary: runs the subscribed handler, if any.
        [[nodiscard]] HandlerResult SendEvent(const Event& event) noexcept;

        // Entry point used by the trampoline.
        [[nodiscard]] NativeResult HandleNativeMessage(NativeHandle handle,
                                                       u32 code,
                                                       native::WordParam wParam,
                                                       native::LongParam lParam) noexcept;

        // Binds the native handle while the OS is still creating the window.
        [[nodiscard]] bool BindHandle(NativeHandle handle) noexcept;

        // --------------------------------------------------------------------
        // Properties
        // --------------------------------------------------------------------
        [[nodiscard]] WindowStatus Show(ShowCommand command) noexcept;
        [[nodiscard]] WindowStatus Update() noexcept;
        [[nodiscard]] WindowStatus SetTitle(std::string_view title) noexcept;
        [[nodiscard]] WindowStatus GetTitle(std::string& outTitle) const noexcept;
        [[nodiscard]] WindowStatus GetClientRect(Rect& outRect) const noexcept;
        [[nodiscard]] WindowStatus SetRect(const Rect& rect) noexcept;
        // Marks the client area for repaint; Paint follows on Update.
        [[nodiscard]] WindowStatus Invalidate(bool eraseBackground = true) noexcept;
        // Posts Close; default processing destroys the window.
        [[nodiscard]] WindowStatus Close() noexcept;

        // --------------------------------------------------------------------
        // Owned resources
        // --------------------------------------------------------------------
        // The OS frees the attached menu with the window.
        [[nodiscard]] WindowStatus SetMenu(Menu&& menu) noexcept;
        // Brush lives until the window's NcDestroy.
        [[nodiscard]] WindowStatus CreateSolidBrush(ColorRef color, NativeHandle& outBrush) noexcept;
        [[nodiscard]] WindowStatus StartTimer(TimerId id, u32 intervalMs) noexcept;
        [[nodiscard]] WindowStatus StopTimer(TimerId id) noexcept;

        [[nodiscard]] NativeHandle GetHandle() const noexcept { return m_Handle; }
        [[nodiscard]] WindowState GetState() const noexcept { return m_State; }
        [[nodiscard]] bool IsAlive() const noexcept { return m_State == WindowState::Created; }
        // Resolved through the registry; nullptr once either side is gone.
        [[nodiscard]] WindowObject* GetParent() const noexcept;
        [[nodiscard]] u16 GetControlId() const noexcept { return m_ControlId; }
        [[nodiscard]] bool IsSystemControl() const noexcept { return !m_UsesTrampoline; }
        [[nodiscard]] CategoryMask GetCapabilities() const noexcept { return m_Capabilities; }
        [[nodiscard]] NativeHandle GetMenuHandle() const noexcept { return m_Menu; }
        [[nodiscard]] usize GetBrushCount() const noexcept { return m_Brushes.size(); }
        [[nodiscard]] usize GetTimerCount() const noexcept { return m_Timers.size(); }
        [[nodiscard]] OsErrorCode GetLastOsError() const noexcept { return m_LastOsError; }
        [[nodiscard]] runtime::GuiContext& GetContext() const noexcept { return *m_Context; }

    private:
        explicit WindowObject(runtime::GuiContext& context) noexcept;

        [[nodiscard]] WindowStatus CheckUsable() const noexcept;
        [[nodiscard]] WindowStatus SetHandler(EventCategory category, EventHandler&& handler) noexcept;
        [[nodiscard]] WindowStatus OsFailed(const char* operation) noexcept;

        [[nodiscard]] bool TryReflect(const msg::TranslatedMessage& translated, NativeResult& outResult) noexcept;
        void OnDestroyNotification() noexcept;
        void OnFinalNotification() noexcept;
        void MarkDestroyed() noexcept;

        using HandlerSlot = std::shared_ptr<const EventHandler>;

        runtime::GuiContext*                            m_Context = nullptr;
        NativeHandle                                    m_Handle{};
        NativeHandle                                    m_ParentHandle{};
        WindowState                                     m_State = WindowState::Uninitialized;
        u16                                             m_ControlId = 0;
        bool                                            m_UsesTrampoline = true;
        bool                                            m_Destroying = false;
        bool                                            m_QuitOnDestroy = false;
        i32                                             m_QuitExitCode = 0;
        CategoryMask                                    m_Capabilities = CategoryMask::All();
        std::array<HandlerSlot, msg::kEventCategoryCount> m_Handlers{};
        NativeHandle                                    m_Menu{};
        std::vector<NativeHandle>                       m_Brushes;
        std::vector<TimerId>                            m_Timers;
        OsErrorCode                                     m_LastOsError = native::os_error::kNone;
    };

} // namespace mingui::win
