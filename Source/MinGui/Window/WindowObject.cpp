// ============================================================================
// MinGui - Source/MinGui/Window/WindowObject.cpp
// ----------------------------------------------------------------------------
// Notes   : Lifecycle hooks on the native side:
//             NcCreate  -> trampoline binds the handle (state Created)
//             Destroy   -> timers killed, quit posted if requested
//             NcDestroy -> dead system controls purged, brushes deleted,
//                          registry entry removed (state Destroyed)
//           Both hooks run before the handler sees the event.
// ============================================================================

#include "MinGui/Window/WindowObject.hpp"

#include "MinGui/Diagnostics/Check.hpp"
#include "MinGui/Logger.hpp"
#include "MinGui/Messages/MessageCodes.hpp"
#include "MinGui/Runtime/GuiContext.hpp"
#include "MinGui/Window/Menu.hpp"

#include <algorithm>
#include <exception>
#include <optional>

namespace mingui::win
{

WindowObject::WindowObject(runtime::GuiContext& context) noexcept
    : m_Context(&context)
{
}

WindowObject::~WindowObject()
{
    if (m_State != WindowState::Created)
    {
        return;
    }

    if (m_Destroying)
    {
        // Released by its own Destroy handler; the native teardown is
        // already under way.
        MarkDestroyed();
        return;
    }

    if (m_Context->isInitialized && m_Context->IsOwnerThread())
    {
        if (Destroy() == WindowStatus::Ok)
        {
            return;
        }
    }
    else
    {
        MINGUI_LOG_ERROR("Window", "0x{:X} released without a usable context; dropping its registry entry", m_Handle.value);
    }
    MarkDestroyed();
}

// ----------------------------------------------------------------------------
// Creation
// ----------------------------------------------------------------------------

WindowStatus WindowObject::Create(runtime::GuiContext& context,
                                  CreateParams params,
                                  std::unique_ptr<WindowObject>& outWindow,
                                  CreationError& outError) noexcept
{
    outWindow.reset();
    outError = CreationError{};

    const auto fail = [&outError](WindowStatus status, OsErrorCode osError = native::os_error::kNone) noexcept {
        outError.status  = status;
        outError.osError = osError;
        return status;
    };

    if (!context.isInitialized)
    {
        return fail(WindowStatus::NotInitialized);
    }
    if (!context.IsOwnerThread())
    {
        MINGUI_CHECK_FAILED("Window", "Window created off the GUI thread");
        return fail(WindowStatus::WrongThread);
    }

    std::string_view className{};
    bool usesTrampoline = true;
    if (params.classToken.IsValid())
    {
        const RegisteredClass* owned = context.classes.GetClass(params.classToken);
        if (owned == nullptr)
        {
            return fail(WindowStatus::InvalidArg);
        }
        className = owned->name;
    }
    else if (!params.systemClassName.empty())
    {
        const RegisteredClass* owned = context.classes.FindClass(params.systemClassName);
        className      = (owned != nullptr) ? std::string_view(owned->name) : params.systemClassName;
        usesTrampoline = (owned != nullptr);
    }
    else
    {
        return fail(WindowStatus::InvalidArg);
    }

    WindowObject* parent = params.parent;
    if (parent != nullptr && (!parent->IsAlive() || parent->m_Context != &context))
    {
        return fail(WindowStatus::InvalidArg);
    }
    if ((params.style & WindowStyle::kChild) != 0 && parent == nullptr)
    {
        return fail(WindowStatus::InvalidArg);
    }

    std::unique_ptr<WindowObject> object(new (std::nothrow) WindowObject(context));
    if (!object)
    {
        return fail(WindowStatus::OutOfMemory);
    }

    object->m_ParentHandle   = (parent != nullptr) ? parent->m_Handle : NativeHandle::Invalid();
    object->m_ControlId      = (parent != nullptr) ? params.controlId : u16{0};
    object->m_UsesTrampoline = usesTrampoline;
    object->m_QuitOnDestroy  = params.quitOnDestroy;
    object->m_QuitExitCode   = params.quitExitCode;
    object->m_Capabilities   = params.capabilities;

    for (Subscription& subscription : params.handlers)
    {
        if (!subscription.handler)
        {
            continue;
        }
        const WindowStatus installed = object->SetHandler(subscription.category, std::move(subscription.handler));
        if (installed != WindowStatus::Ok)
        {
            return fail(installed);
        }
    }

    native::NativeWindowDesc desc{};
    desc.className = native::MakeTextView(className);
    desc.title     = native::MakeTextView(params.title);
    desc.style     = params.style;
    desc.exStyle   = params.exStyle;
    desc.x         = params.x;
    desc.y         = params.y;
    desc.width     = params.width;
    desc.height    = params.height;
    desc.parent    = object->m_ParentHandle;
    desc.controlId = object->m_ControlId;
    desc.userParam = usesTrampoline ? object.get() : nullptr;

    try
    {
        context.pendingCreations.push_back(object.get());
    }
    catch (const std::bad_alloc&)
    {
        return fail(WindowStatus::OutOfMemory);
    }

    NativeHandle handle{};
    const native::NativeStatus status = native::CreateNativeWindow(context.nativeInterface, desc, handle);
    context.pendingCreations.pop_back();

    if (status != native::NativeStatus::Ok)
    {
        const OsErrorCode osError = native::GetLastOsError(context.nativeInterface);
        // An aborted creation may have bound the handle already.
        object->MarkDestroyed();
        MINGUI_LOG_WARNING("Window", "Creating '{}' failed (os error {})", className, osError);
        return fail(WindowStatus::CreationFailed, osError);
    }

    if (!object->m_Handle.IsValid())
    {
        // System controls never pass through the trampoline.
        if (!object->BindHandle(handle))
        {
            if (native::DestroyNativeWindow(context.nativeInterface, handle) != native::NativeStatus::Ok)
            {
                MINGUI_LOG_ERROR("Window", "Could not destroy unbound window 0x{:X}", handle.value);
            }
            object->m_State = WindowState::Destroyed;
            return fail(WindowStatus::CreationFailed, native::os_error::kInvalidParameter);
        }
    }
    MINGUI_ASSERT(object->m_Handle == handle, "Bound handle differs from the created one");

    MINGUI_LOG_VERBOSE("Window", "Created '{}' as 0x{:X}", className, handle.value);
    outWindow = std::move(object);
    return WindowStatus::Ok;
}

bool WindowObject::BindHandle(NativeHandle handle) noexcept
{
    if (m_State != WindowState::Uninitialized || !handle.IsValid())
    {
        return false;
    }

    // A recycled handle can still map to a system control whose window died
    // without a purge; the OS only hands out handles of dead windows.
    WindowObject* stale = m_Context->registry.Lookup(handle);
    if (stale != nullptr && stale != this && !stale->m_UsesTrampoline)
    {
        MINGUI_LOG_WARNING("Window", "0x{:X} still mapped to a dead system control, dropping it", handle.value);
        stale->MarkDestroyed();
    }

    const RegistryStatus status = m_Context->registry.Register(handle, this);
    if (status != RegistryStatus::Ok)
    {
        MINGUI_LOG_ERROR("Window", "Binding 0x{:X} failed", handle.value);
        return false;
    }

    m_Handle = handle;
    m_State  = WindowState::Created;
    return true;
}

// ----------------------------------------------------------------------------
// Destruction
// ----------------------------------------------------------------------------

WindowStatus WindowObject::Destroy() noexcept
{
    if (m_State == WindowState::Destroyed || m_Destroying)
    {
        return WindowStatus::Ok;
    }

    const WindowStatus usable = CheckUsable();
    if (usable != WindowStatus::Ok)
    {
        return usable;
    }

    runtime::GuiContext& context = *m_Context;
    const NativeHandle handle = m_Handle;
    const native::NativeStatus status = native::DestroyNativeWindow(context.nativeInterface, handle);

    // Trampoline windows finish in their own NcDestroy, where a handler may
    // have released this object. Only a still-registered object is touched.
    if (context.registry.Lookup(handle) != this)
    {
        PurgeDeadSystemWindows(context);
        return WindowStatus::Ok;
    }

    if (status != native::NativeStatus::Ok && native::IsLiveWindow(context.nativeInterface, handle))
    {
        return OsFailed("DestroyNativeWindow");
    }

    // System controls are not told about their own NcDestroy.
    MarkDestroyed();
    PurgeDeadSystemWindows(context);
    return WindowStatus::Ok;
}

void WindowObject::OnDestroyNotification() noexcept
{
    native::NativeInterface& os = m_Context->nativeInterface;
    for (TimerId id : m_Timers)
    {
        if (native::KillTimer(os, m_Handle, id) != native::NativeStatus::Ok)
        {
            MINGUI_LOG_VERBOSE("Window", "Timer {} on 0x{:X} was already gone", id, m_Handle.value);
        }
    }
    m_Timers.clear();

    if (m_QuitOnDestroy)
    {
        MINGUI_LOG_INFO("Window", "0x{:X} destroyed, posting quit ({})", m_Handle.value, m_QuitExitCode);
        native::PostQuit(os, m_QuitExitCode);
    }
}

void WindowObject::OnFinalNotification() noexcept
{
    PurgeDeadSystemWindows(*m_Context);
    MarkDestroyed();
}

void WindowObject::PurgeDeadSystemWindows(runtime::GuiContext& context) noexcept
{
    std::vector<NativeHandle> handles;
    try
    {
        handles = context.registry.SnapshotHandles();
    }
    catch (const std::bad_alloc&)
    {
        MINGUI_LOG_ERROR("Window", "Out of memory listing system controls to purge");
        return;
    }

    for (NativeHandle handle : handles)
    {
        WindowObject* object = context.registry.Lookup(handle);
        if (object != nullptr &&
            !object->m_UsesTrampoline &&
            object->IsAlive() &&
            !native::IsLiveWindow(context.nativeInterface, handle))
        {
            MINGUI_LOG_VERBOSE("Window", "System control 0x{:X} went with its parent", handle.value);
            object->MarkDestroyed();
        }
    }
}

void WindowObject::MarkDestroyed() noexcept
{
    if (m_State == WindowState::Destroyed)
    {
        return;
    }

    if (m_Handle.IsValid() && m_Context->registry.Lookup(m_Handle) == this)
    {
        m_Context->registry.Unregister(m_Handle);
    }

    native::NativeInterface& os = m_Context->nativeInterface;
    for (NativeHandle brush : m_Brushes)
    {
        if (native::DeleteGdiObject(os, brush) != native::NativeStatus::Ok)
        {
            MINGUI_LOG_WARNING("Window", "DeleteGdiObject 0x{:X} failed", brush.value);
        }
    }
    m_Brushes.clear();
    m_Timers.clear();
    m_Menu       = NativeHandle::Invalid();
    m_Destroying = false;
    m_State      = WindowState::Destroyed;
}

// ----------------------------------------------------------------------------
// Subscription and dispatch
// ----------------------------------------------------------------------------

WindowStatus WindowObject::Subscribe(EventCategory category, EventHandler handler) noexcept
{
    const WindowStatus usable = CheckUsable();
    if (usable != WindowStatus::Ok)
    {
        return usable;
    }

    if (!handler)
    {
        return Unsubscribe(category);
    }
    return SetHandler(category, std::move(handler));
}

WindowStatus WindowObject::Unsubscribe(EventCategory category) noexcept
{
    const WindowStatus usable = CheckUsable();
    if (usable != WindowStatus::Ok)
    {
        return usable;
    }
    if (category >= EventCategory::Count)
    {
        return WindowStatus::InvalidArg;
    }

    m_Handlers[static_cast<usize>(category)].reset();
    return WindowStatus::Ok;
}

WindowStatus WindowObject::SetHandler(EventCategory category, EventHandler&& handler) noexcept
{
    if (category >= EventCategory::Count)
    {
        return WindowStatus::InvalidArg;
    }
    if (!m_Capabilities.Contains(category))
    {
        MINGUI_LOG_WARNING("Window", "{} events are not delivered to this window", msg::ToString(category));
        return WindowStatus::NotSupported;
    }

    try
    {
        m_Handlers[static_cast<usize>(category)] = std::make_shared<const EventHandler>(std::move(handler));
    }
    catch (const std::bad_alloc&)
    {
        return WindowStatus::OutOfMemory;
    }
    return WindowStatus::Ok;
}

bool WindowObject::IsSubscribed(EventCategory category) const noexcept
{
    return category < EventCategory::Count && m_Handlers[static_cast<usize>(category)] != nullptr;
}

HandlerResult WindowObject::SendEvent(const Event& event) noexcept
{
    const EventCategory category = event.Category();
    if (category >= EventCategory::Count)
    {
        return HandlerResult::NotHandled();
    }

    // Local copy: the handler may replace its own subscription.
    const HandlerSlot handler = m_Handlers[static_cast<usize>(category)];
    if (!handler || !*handler)
    {
        return HandlerResult::NotHandled();
    }

    try
    {
        return (*handler)(event);
    }
    catch (const std::exception& e)
    {
        MINGUI_LOG_ERROR("Dispatch", "{} handler on 0x{:X} threw: {}", msg::ToString(category), event.handle.value, e.what());
    }
    catch (...)
    {
        MINGUI_LOG_ERROR("Dispatch", "{} handler on 0x{:X} threw a non-standard exception", msg::ToString(category), event.handle.value);
    }
    return HandlerResult::NotHandled();
}

bool WindowObject::TryReflect(const msg::TranslatedMessage& translated, NativeResult& outResult) noexcept
{
    NativeHandle control{};
    if (const auto* command = translated.event.As<msg::CommandPayload>())
    {
        control = command->control;
    }
    else if (const auto* color = translated.event.As<msg::ControlColorPayload>())
    {
        control = color->control;
    }

    if (!control.IsValid() || control == m_Handle)
    {
        return false;
    }

    WindowObject* child = m_Context->registry.Lookup(control);
    if (child == nullptr || child->m_ParentHandle != m_Handle || !child->IsAlive())
    {
        return false;
    }

    Event reflected = translated.event;
    reflected.handle = control;

    const HandlerResult result = child->SendEvent(reflected);
    if (!result.IsHandled())
    {
        return false;
    }

    const std::optional<NativeResult> reply = translated.Encode(result);
    if (!reply)
    {
        return false;
    }

    outResult = *reply;
    return true;
}

NativeResult WindowObject::HandleNativeMessage(NativeHandle handle,
                                               u32 code,
                                               native::WordParam wParam,
                                               native::LongParam lParam) noexcept
{
    runtime::GuiContext& context = *m_Context;
    native::NativeInterface& os = context.nativeInterface;
    if (handle != m_Handle)
    {
        MINGUI_LOG_ERROR("Dispatch", "0x{:X} routed to the object bound to 0x{:X}", handle.value, m_Handle.value);
        return native::CallDefaultProc(os, handle, code, wParam, lParam);
    }

    const msg::TranslatedMessage translated = msg::TranslateNativeMessage(handle, code, wParam, lParam);

    // Lifecycle bookkeeping first: the handler may release this object.
    if (code == msg::code::kDestroy)
    {
        m_Destroying = true;
        OnDestroyNotification();
    }
    else if (code == msg::code::kNcDestroy)
    {
        OnFinalNotification();
    }

    NativeResult result = 0;
    if (TryReflect(translated, result))
    {
        return result;
    }
    if (code != msg::code::kNcDestroy && context.registry.Lookup(handle) != this)
    {
        // Released by a reflected control handler.
        return native::CallDefaultProc(os, handle, code, wParam, lParam);
    }

    // No member access past this point.
    const HandlerResult handlerResult = SendEvent(translated.event);
    const std::optional<NativeResult> reply = translated.Encode(handlerResult);
    return reply ? *reply : native::CallDefaultProc(os, handle, code, wParam, lParam);
}

// ----------------------------------------------------------------------------
// Properties
// ----------------------------------------------------------------------------

WindowStatus WindowObject::CheckUsable() const noexcept
{
    if (m_State != WindowState::Created)
    {
        return WindowStatus::InvalidState;
    }
    if (!m_Context->isInitialized)
    {
        return WindowStatus::NotInitialized;
    }
    if (!m_Context->IsOwnerThread())
    {
        MINGUI_CHECK_FAILED("Window", "0x{:X} used off the GUI thread", m_Handle.value);
        return WindowStatus::WrongThread;
    }
    return WindowStatus::Ok;
}

WindowStatus WindowObject::OsFailed(const char* operation) noexcept
{
    m_LastOsError = native::GetLastOsError(m_Context->nativeInterface);
    MINGUI_LOG_WARNING("Window", "{} on 0x{:X} failed (os error {})", operation, m_Handle.value, m_LastOsError);
    return WindowStatus::OsFailure;
}

WindowStatus WindowObject::Show(ShowCommand command) noexcept
{
    const WindowStatus usable = CheckUsable();
    if (usable != WindowStatus::Ok)
    {
        return usable;
    }
    return (native::ShowNativeWindow(m_Context->nativeInterface, m_Handle, command) == native::NativeStatus::Ok)
        ? WindowStatus::Ok
        : OsFailed("ShowNativeWindow");
}

WindowStatus WindowObject::Update() noexcept
{
    const WindowStatus usable = CheckUsable();
    if (usable != WindowStatus::Ok)
    {
        return usable;
    }
    return (native::UpdateNativeWindow(m_Context->nativeInterface, m_Handle) == native::NativeStatus::Ok)
        ? WindowStatus::Ok
        : OsFailed("UpdateNativeWindow");
}

WindowStatus WindowObject::SetTitle(std::string_view title) noexcept
{
    const WindowStatus usable = CheckUsable();
    if (usable != WindowStatus::Ok)
    {
        return usable;
    }
    return (native::SetWindowTitle(m_Context->nativeInterface, m_Handle, native::MakeTextView(title)) == native::NativeStatus::Ok)
        ? WindowStatus::Ok
        : OsFailed("SetWindowTitle");
}

WindowStatus WindowObject::GetTitle(std::string& outTitle) const noexcept
{
    outTitle.clear();

    const WindowStatus usable = CheckUsable();
    if (usable != WindowStatus::Ok)
    {
        return usable;
    }

    native::NativeInterface& os = m_Context->nativeInterface;
    u32 length = 0;
    if (native::GetWindowTitle(os, m_Handle, nullptr, 0, length) != native::NativeStatus::Ok)
    {
        return WindowStatus::OsFailure;
    }

    try
    {
        outTitle.resize(static_cast<usize>(length) + 1u);
    }
    catch (const std::bad_alloc&)
    {
        return WindowStatus::OutOfMemory;
    }

    u32 copied = 0;
    if (native::GetWindowTitle(os, m_Handle, outTitle.data(), static_cast<u32>(outTitle.size()), copied) != native::NativeStatus::Ok)
    {
        outTitle.clear();
        return WindowStatus::OsFailure;
    }
    outTitle.resize(std::min<usize>(copied, length));
    return WindowStatus::Ok;
}

WindowStatus WindowObject::GetClientRect(Rect& outRect) const noexcept
{
    outRect = Rect{};

    const WindowStatus usable = CheckUsable();
    if (usable != WindowStatus::Ok)
    {
        return usable;
    }
    return (native::GetClientArea(m_Context->nativeInterface, m_Handle, outRect) == native::NativeStatus::Ok)
        ? WindowStatus::Ok
        : WindowStatus::OsFailure;
}

WindowStatus WindowObject::SetRect(const Rect& rect) noexcept
{
    const WindowStatus usable = CheckUsable();
    if (usable != WindowStatus::Ok)
    {
        return usable;
    }
    if (rect.Width() < 0 || rect.Height() < 0)
    {
        return WindowStatus::InvalidArg;
    }
    return (native::MoveNativeWindow(m_Context->nativeInterface, m_Handle, rect) == native::NativeStatus::Ok)
        ? WindowStatus::Ok
        : OsFailed("MoveNativeWindow");
}

WindowStatus WindowObject::Invalidate(bool eraseBackground) noexcept
{
    const WindowStatus usable = CheckUsable();
    if (usable != WindowStatus::Ok)
    {
        return usable;
    }
    return (native::InvalidateNativeWindow(m_Context->nativeInterface, m_Handle, eraseBackground) == native::NativeStatus::Ok)
        ? WindowStatus::Ok
        : OsFailed("InvalidateNativeWindow");
}

WindowObject* WindowObject::GetParent() const noexcept
{
    if (!IsAlive() || !m_ParentHandle.IsValid())
    {
        return nullptr;
    }
    return m_Context->registry.Lookup(m_ParentHandle);
}

WindowStatus WindowObject::Close() noexcept
{
    const WindowStatus usable = CheckUsable();
    if (usable != WindowStatus::Ok)
    {
        return usable;
    }
    return (native::PostNativeMessage(m_Context->nativeInterface, m_Handle, msg::code::kClose, 0, 0) == native::NativeStatus::Ok)
        ? WindowStatus::Ok
        : OsFailed("PostNativeMessage(Close)");
}

// ----------------------------------------------------------------------------
// Owned resources
// ----------------------------------------------------------------------------

WindowStatus WindowObject::SetMenu(Menu&& menu) noexcept
{
    const WindowStatus usable = CheckUsable();
    if (usable != WindowStatus::Ok)
    {
        return usable;
    }
    if (!menu.IsValid() || menu.GetKind() != native::MenuKind::Bar || menu.GetContext() != m_Context)
    {
        return WindowStatus::InvalidArg;
    }
    if (m_ParentHandle.IsValid())
    {
        // Only top-level windows carry a menu bar.
        return WindowStatus::NotSupported;
    }

    native::NativeInterface& os = m_Context->nativeInterface;
    const NativeHandle previous = m_Menu;
    if (native::SetWindowMenu(os, m_Handle, menu.GetHandle()) != native::NativeStatus::Ok)
    {
        return OsFailed("SetWindowMenu");
    }
    m_Menu = menu.Release();

    if (previous.IsValid() && native::DestroyNativeMenu(os, previous) != native::NativeStatus::Ok)
    {
        MINGUI_LOG_WARNING("Window", "Replaced menu 0x{:X} could not be destroyed", previous.value);
    }
    return WindowStatus::Ok;
}

WindowStatus WindowObject::CreateSolidBrush(ColorRef color, NativeHandle& outBrush) noexcept
{
    outBrush = NativeHandle::Invalid();

    const WindowStatus usable = CheckUsable();
    if (usable != WindowStatus::Ok)
    {
        return usable;
    }

    try
    {
        m_Brushes.reserve(m_Brushes.size() + 1u);
    }
    catch (const std::bad_alloc&)
    {
        return WindowStatus::OutOfMemory;
    }

    NativeHandle brush{};
    if (native::CreateBrush(m_Context->nativeInterface, color, brush) != native::NativeStatus::Ok)
    {
        return OsFailed("CreateBrush");
    }

    m_Brushes.push_back(brush);
    outBrush = brush;
    return WindowStatus::Ok;
}

WindowStatus WindowObject::StartTimer(TimerId id, u32 intervalMs) noexcept
{
    const WindowStatus usable = CheckUsable();
    if (usable != WindowStatus::Ok)
    {
        return usable;
    }
    if (id == 0)
    {
        return WindowStatus::InvalidArg;
    }

    const bool known = std::find(m_Timers.begin(), m_Timers.end(), id) != m_Timers.end();
    if (!known)
    {
        try
        {
            m_Timers.reserve(m_Timers.size() + 1u);
        }
        catch (const std::bad_alloc&)
        {
            return WindowStatus::OutOfMemory;
        }
    }

    if (native::SetTimer(m_Context->nativeInterface, m_Handle, id, intervalMs) != native::NativeStatus::Ok)
    {
        return OsFailed("SetTimer");
    }
    if (!known)
    {
        m_Timers.push_back(id);
    }
    return WindowStatus::Ok;
}

WindowStatus WindowObject::StopTimer(TimerId id) noexcept
{
    const WindowStatus usable = CheckUsable();
    if (usable != WindowStatus::Ok)
    {
        return usable;
    }

    const auto it = std::find(m_Timers.begin(), m_Timers.end(), id);
    if (it == m_Timers.end())
    {
        return WindowStatus::InvalidArg;
    }

    m_Timers.erase(it);
    return (native::KillTimer(m_Context->nativeInterface, m_Handle, id) == native::NativeStatus::Ok)
        ? WindowStatus::Ok
        : OsFailed("KillTimer");
}

} // namespace mingui::win
