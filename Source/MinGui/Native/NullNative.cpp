// ============================================================================
// MinGui - Source/MinGui/Native/NullNative.cpp
// ----------------------------------------------------------------------------
// Purpose : Deterministic in-process windowing model backing the Native
//           contract for tests and headless tools.
// Contract: Never holds a reference into its tables across a call into a
//           class procedure; every re-entrant step looks entries up again.
// Notes   : Destruction order per window: Destroy, children (recursively),
//           timers, attached menu, NcDestroy, handle release.
// ============================================================================

#include "MinGui/Native/NullNative.hpp"

#include "MinGui/Contracts/NativeStyles.hpp"
#include "MinGui/Messages/MessageCodes.hpp"

#include <algorithm>
#include <cstring>
#include <new>

namespace mingui::native
{
namespace
{
    constexpr const char* kSystemClassNames[] = {
        "Button",
        "ComboBox",
        "Edit",
        "ListBox",
        "MDIClient",
        "ScrollBar",
        "Static",
        "ToolbarWindow32",
        "ReBarWindow32",
        "msctls_statusbar32",
    };

    constexpr ClassAtom kFirstSystemAtom = 0xC017;
    constexpr i32       kDefaultWidth = 640;
    constexpr i32       kDefaultHeight = 480;

    [[nodiscard]] i32 OrDefault(i32 value, i32 fallback) noexcept
    {
        return (value == kUseDefault) ? fallback : value;
    }

    [[nodiscard]] LongParam PointerToLongParam(const void* pointer) noexcept
    {
        return reinterpret_cast<LongParam>(pointer);
    }
} // namespace

NullNative::NullNative(const NullNativeConfig& config)
    : m_MaxWindows(config.maxWindows)
{
    ClassAtom atom = kFirstSystemAtom;
    for (const char* name : kSystemClassNames)
    {
        ClassEntry entry{};
        entry.name     = name;
        entry.atom     = atom++;
        entry.isSystem = true;
        m_Classes.push_back(std::move(entry));
    }

    m_ScreenDc = NativeHandle{ AllocateHandle() };
}

NativeCaps NullNative::GetCaps() const noexcept
{
    NativeCaps caps{};
    caps.determinism     = DeterminismMode::Replay;
    caps.threadSafety    = ThreadSafetyMode::ThreadConfined;
    caps.blockingQueue   = false;
    caps.recyclesHandles = true;
    return caps;
}

// ----------------------------------------------------------------------------
// Classes
// ----------------------------------------------------------------------------

NativeStatus NullNative::RegisterWindowClass(const NativeClassDesc& desc, ClassAtom& outAtom) noexcept
{
    outAtom = 0;

    const std::string_view name = desc.name.AsStringView();
    if (name.empty() || desc.proc == nullptr)
    {
        return Fail(NativeStatus::InvalidArg, os_error::kInvalidParameter);
    }
    if (FindClassEntry(name) != nullptr)
    {
        return Fail(NativeStatus::AlreadyExists, os_error::kClassAlreadyExists);
    }

    ClassEntry entry{};
    entry.name.assign(name);
    entry.proc  = desc.proc;
    entry.style = desc.style;
    entry.atom  = m_NextAtom++;
    outAtom     = entry.atom;
    m_Classes.push_back(std::move(entry));

    ++m_RegistrationCount;
    m_LastError = os_error::kNone;
    return NativeStatus::Ok;
}

NativeStatus NullNative::UnregisterWindowClass(TextView name) noexcept
{
    const std::string_view key = name.AsStringView();
    const auto it = std::find_if(m_Classes.begin(), m_Classes.end(), [key](const ClassEntry& entry) {
        return EqualsIgnoreCaseAscii(entry.name, key);
    });

    if (it == m_Classes.end())
    {
        return Fail(NativeStatus::NotFound, os_error::kClassDoesNotExist);
    }
    if (it->isSystem)
    {
        return Fail(NativeStatus::Rejected, os_error::kInvalidParameter);
    }
    if (it->liveWindows != 0)
    {
        return Fail(NativeStatus::Rejected, os_error::kClassHasWindows);
    }

    m_Classes.erase(it);
    m_LastError = os_error::kNone;
    return NativeStatus::Ok;
}

// ----------------------------------------------------------------------------
// Window lifetime
// ----------------------------------------------------------------------------

NativeStatus NullNative::CreateNativeWindow(const NativeWindowDesc& desc, NativeHandle& outHandle) noexcept
{
    outHandle = NativeHandle::Invalid();

    ClassEntry* cls = FindClassEntry(desc.className.AsStringView());
    if (cls == nullptr)
    {
        return Fail(NativeStatus::NotFound, os_error::kCannotFindClass);
    }

    if (desc.parent.IsValid())
    {
        const WindowEntry* parent = FindWindowEntry(desc.parent);
        if (parent == nullptr || parent->destroying)
        {
            return Fail(NativeStatus::InvalidArg, os_error::kInvalidWindowHandle);
        }

        if (desc.controlId != 0)
        {
            for (u64 sibling : parent->children)
            {
                const auto found = m_Windows.find(sibling);
                if (found != m_Windows.end() && found->second.controlId == desc.controlId)
                {
                    return Fail(NativeStatus::InvalidArg, os_error::kInvalidParameter);
                }
            }
        }
    }

    if (m_Windows.size() >= m_MaxWindows)
    {
        return Fail(NativeStatus::OutOfResources, os_error::kNotEnoughMemory);
    }

    const NativeHandle handle{ AllocateHandle() };

    WindowEntry entry{};
    entry.classAtom  = cls->atom;
    entry.parent     = desc.parent;
    entry.controlId  = desc.parent.IsValid() ? desc.controlId : u16{0};
    entry.title.assign(desc.title.AsStringView());
    entry.rect       = Rect::FromXYWH(OrDefault(desc.x, 0),
                                      OrDefault(desc.y, 0),
                                      OrDefault(desc.width, kDefaultWidth),
                                      OrDefault(desc.height, kDefaultHeight));
    entry.visible    = (desc.style & WindowStyle::kVisible) != 0;
    entry.needsPaint = entry.visible;
    entry.needsErase = entry.visible;

    ++cls->liveWindows;
    const ClassAtom atom = cls->atom;

    m_Windows.emplace(handle.value, std::move(entry));
    if (desc.parent.IsValid())
    {
        m_Windows.at(desc.parent.value).children.push_back(handle.value);
    }

    NativeCreateParams params{};
    params.classAtom = atom;
    params.className = desc.className;
    params.parent    = desc.parent;
    params.controlId = desc.controlId;
    params.userParam = desc.userParam;

    const NativeResult ncResult = Deliver(handle, msg::code::kNcCreate, 0, PointerToLongParam(&params));
    if (ncResult == 0)
    {
        // A refused NcCreate only sees NcDestroy.
        WindowEntry* refused = FindWindowEntry(handle);
        if (refused != nullptr && !refused->destroying)
        {
            refused->destroying = true;
            (void)Deliver(handle, msg::code::kNcDestroy, 0, 0);
            RemoveWindowEntry(handle);
        }
        return Fail(NativeStatus::Rejected, os_error::kCancelled);
    }

    if (!IsLiveWindow(handle))
    {
        return Fail(NativeStatus::Rejected, os_error::kCancelled);
    }

    const NativeResult createResult = Deliver(handle, msg::code::kCreate, 0, PointerToLongParam(&params));
    if (createResult == -1)
    {
        DestroyWindowTree(handle);
        return Fail(NativeStatus::Rejected, os_error::kCancelled);
    }

    if (!IsLiveWindow(handle))
    {
        return Fail(NativeStatus::Rejected, os_error::kCancelled);
    }

    outHandle   = handle;
    m_LastError = os_error::kNone;
    return NativeStatus::Ok;
}

NativeStatus NullNative::DestroyNativeWindow(NativeHandle handle) noexcept
{
    const WindowEntry* entry = FindWindowEntry(handle);
    if (entry == nullptr)
    {
        return Fail(NativeStatus::InvalidArg, os_error::kInvalidWindowHandle);
    }

    if (!entry->destroying)
    {
        DestroyWindowTree(handle);
    }

    m_LastError = os_error::kNone;
    return NativeStatus::Ok;
}

bool NullNative::IsLiveWindow(NativeHandle handle) const noexcept
{
    return FindWindowEntry(handle) != nullptr;
}

NativeResult NullNative::CallDefaultProc(NativeHandle handle, u32 code, WordParam, LongParam) noexcept
{
    switch (code)
    {
        case msg::code::kNcCreate:
        {
            return 1;
        }
        case msg::code::kClose:
        {
            const WindowEntry* entry = FindWindowEntry(handle);
            if (entry != nullptr && !entry->destroying)
            {
                DestroyWindowTree(handle);
            }
            return 0;
        }
        case msg::code::kPaint:
        {
            WindowEntry* entry = FindWindowEntry(handle);
            if (entry != nullptr)
            {
                entry->needsPaint = false;
                entry->needsErase = false;
            }
            return 0;
        }
        case msg::code::kEraseBkgnd:
        {
            // Erased with the class background.
            return 1;
        }
        default:
        {
            return 0;
        }
    }
}

void NullNative::DestroyWindowTree(NativeHandle handle) noexcept
{
    WindowEntry* entry = FindWindowEntry(handle);
    if (entry == nullptr || entry->destroying)
    {
        return;
    }

    entry->destroying = true;
    (void)Deliver(handle, msg::code::kDestroy, 0, 0);

    entry = FindWindowEntry(handle);
    if (entry == nullptr)
    {
        return;
    }

    const std::vector<u64> children = entry->children;
    for (u64 child : children)
    {
        DestroyWindowTree(NativeHandle{ child });
    }

    KillTimersOf(handle);

    entry = FindWindowEntry(handle);
    if (entry != nullptr && entry->menu.IsValid())
    {
        const NativeHandle menu = entry->menu;
        entry->menu = NativeHandle::Invalid();
        DestroyMenuTree(menu);
    }

    (void)Deliver(handle, msg::code::kNcDestroy, 0, 0);
    RemoveWindowEntry(handle);
}

void NullNative::RemoveWindowEntry(NativeHandle handle) noexcept
{
    const auto it = m_Windows.find(handle.value);
    if (it == m_Windows.end())
    {
        return;
    }

    if (it->second.parent.IsValid())
    {
        const auto parent = m_Windows.find(it->second.parent.value);
        if (parent != m_Windows.end())
        {
            std::erase(parent->second.children, handle.value);
        }
    }

    if (ClassEntry* cls = FindClassEntryByAtom(it->second.classAtom))
    {
        if (cls->liveWindows > 0)
        {
            --cls->liveWindows;
        }
    }

    if (it->second.menu.IsValid())
    {
        if (MenuEntry* menu = FindMenuEntry(it->second.menu))
        {
            menu->ownerWindow = NativeHandle::Invalid();
        }
    }

    if (it->second.paintDc.IsValid())
    {
        ReleasePaintDc(it->second.paintDc.value);
    }

    m_Windows.erase(it);
    PurgeQueueFor(handle);
    ReleaseHandle(handle.value);
}

NativeResult NullNative::Deliver(NativeHandle handle, u32 code, WordParam wParam, LongParam lParam) noexcept
{
    const WindowEntry* entry = FindWindowEntry(handle);
    if (entry == nullptr)
    {
        return 0;
    }

    const ClassEntry* cls = FindClassEntryByAtom(entry->classAtom);
    const WindowProc proc = (cls != nullptr) ? cls->proc : nullptr;

    m_DeliveryLog.push_back(DeliveredMessage{ handle, code });

    if (proc == nullptr)
    {
        return CallDefaultProc(handle, code, wParam, lParam);
    }
    return proc(handle, code, wParam, lParam);
}

// ----------------------------------------------------------------------------
// Queue
// ----------------------------------------------------------------------------

GetMessageResult NullNative::GetNextMessage(NativeMessage& outMessage) noexcept
{
    outMessage = NativeMessage{};

    if (m_Queue.empty() && !m_QuitPending && m_IdleHook)
    {
        m_IdleHook(*this);
    }

    if (!m_Queue.empty())
    {
        outMessage = m_Queue.front();
        m_Queue.pop_front();
        return (outMessage.code == msg::code::kQuit) ? GetMessageResult::Quit : GetMessageResult::Message;
    }

    if (m_QuitPending)
    {
        m_QuitPending     = false;
        outMessage.code   = msg::code::kQuit;
        outMessage.wParam = static_cast<WordParam>(m_QuitCode);
        return GetMessageResult::Quit;
    }

    m_LastError = os_error::kWaitTimeout;
    return GetMessageResult::Failed;
}

NativeResult NullNative::DispatchNativeMessage(const NativeMessage& message) noexcept
{
    if (!message.handle.IsValid() || !IsLiveWindow(message.handle))
    {
        return 0;
    }
    return Deliver(message.handle, message.code, message.wParam, message.lParam);
}

NativeStatus NullNative::PostNativeMessage(NativeHandle handle, u32 code, WordParam wParam, LongParam lParam) noexcept
{
    if (handle.IsValid() && !IsLiveWindow(handle))
    {
        return Fail(NativeStatus::InvalidArg, os_error::kInvalidWindowHandle);
    }

    m_Queue.push_back(NativeMessage{ handle, code, wParam, lParam });
    m_LastError = os_error::kNone;
    return NativeStatus::Ok;
}

NativeStatus NullNative::SendNativeMessage(NativeHandle handle, u32 code, WordParam wParam, LongParam lParam, NativeResult& outResult) noexcept
{
    outResult = 0;
    if (!IsLiveWindow(handle))
    {
        return Fail(NativeStatus::InvalidArg, os_error::kInvalidWindowHandle);
    }

    outResult   = Deliver(handle, code, wParam, lParam);
    m_LastError = os_error::kNone;
    return NativeStatus::Ok;
}

void NullNative::PostQuit(i32 exitCode) noexcept
{
    m_QuitPending = true;
    m_QuitCode    = exitCode;
}

void NullNative::PurgeQueueFor(NativeHandle window) noexcept
{
    std::erase_if(m_Queue, [window](const NativeMessage& message) {
        return message.handle == window;
    });
}

// ----------------------------------------------------------------------------
// Timers
// ----------------------------------------------------------------------------

NativeStatus NullNative::SetTimer(NativeHandle handle, TimerId id, u32 elapseMs) noexcept
{
    if (!IsLiveWindow(handle))
    {
        return Fail(NativeStatus::InvalidArg, os_error::kInvalidWindowHandle);
    }

    const u32 interval = std::max(elapseMs, 1u);
    for (TimerEntry& timer : m_Timers)
    {
        if (timer.window == handle && timer.id == id)
        {
            timer.intervalMs = interval;
            timer.dueAtMs    = m_NowMs + interval;
            m_LastError      = os_error::kNone;
            return NativeStatus::Ok;
        }
    }

    TimerEntry timer{};
    timer.window     = handle;
    timer.id         = id;
    timer.intervalMs = interval;
    timer.dueAtMs    = m_NowMs + interval;
    m_Timers.push_back(timer);

    m_LastError = os_error::kNone;
    return NativeStatus::Ok;
}

NativeStatus NullNative::KillTimer(NativeHandle handle, TimerId id) noexcept
{
    const auto it = std::find_if(m_Timers.begin(), m_Timers.end(), [handle, id](const TimerEntry& timer) {
        return timer.window == handle && timer.id == id;
    });
    if (it == m_Timers.end())
    {
        return Fail(NativeStatus::NotFound, os_error::kInvalidTimer);
    }

    m_Timers.erase(it);
    m_LastError = os_error::kNone;
    return NativeStatus::Ok;
}

void NullNative::KillTimersOf(NativeHandle window) noexcept
{
    std::erase_if(m_Timers, [window](const TimerEntry& timer) {
        return timer.window == window;
    });
}

void NullNative::AdvanceTime(u32 elapsedMs) noexcept
{
    m_NowMs += elapsedMs;

    for (TimerEntry& timer : m_Timers)
    {
        if (timer.dueAtMs > m_NowMs)
        {
            continue;
        }

        while (timer.dueAtMs <= m_NowMs)
        {
            timer.dueAtMs += timer.intervalMs;
        }

        // One pending timer message per timer, like the real queue.
        const bool alreadyQueued = std::any_of(m_Queue.begin(), m_Queue.end(), [&timer](const NativeMessage& message) {
            return message.handle == timer.window &&
                   message.code == msg::code::kTimer &&
                   message.wParam == timer.id;
        });
        if (!alreadyQueued)
        {
            m_Queue.push_back(NativeMessage{ timer.window, msg::code::kTimer, timer.id, 0 });
        }
    }
}

// ----------------------------------------------------------------------------
// Menus
// ----------------------------------------------------------------------------

NativeStatus NullNative::CreateNativeMenu(MenuKind kind, NativeHandle& outMenu) noexcept
{
    const NativeHandle menu{ AllocateHandle() };

    MenuEntry entry{};
    entry.kind = kind;
    m_Menus.emplace(menu.value, std::move(entry));

    outMenu     = menu;
    m_LastError = os_error::kNone;
    return NativeStatus::Ok;
}

NativeStatus NullNative::AppendMenuItem(NativeHandle menu, u16 id, TextView text) noexcept
{
    MenuEntry* entry = FindMenuEntry(menu);
    if (entry == nullptr)
    {
        return Fail(NativeStatus::InvalidArg, os_error::kInvalidMenuHandle);
    }

    MenuItem item{};
    item.id = id;
    item.text.assign(text.AsStringView());
    entry->items.push_back(std::move(item));

    m_LastError = os_error::kNone;
    return NativeStatus::Ok;
}

NativeStatus NullNative::AppendMenuSeparator(NativeHandle menu) noexcept
{
    MenuEntry* entry = FindMenuEntry(menu);
    if (entry == nullptr)
    {
        return Fail(NativeStatus::InvalidArg, os_error::kInvalidMenuHandle);
    }

    MenuItem item{};
    item.separator = true;
    entry->items.push_back(std::move(item));

    m_LastError = os_error::kNone;
    return NativeStatus::Ok;
}

NativeStatus NullNative::AppendSubMenu(NativeHandle menu, NativeHandle subMenu, TextView text) noexcept
{
    MenuEntry* entry = FindMenuEntry(menu);
    MenuEntry* sub   = FindMenuEntry(subMenu);
    if (entry == nullptr || sub == nullptr || menu == subMenu ||
        sub->parentMenu.IsValid() || sub->ownerWindow.IsValid())
    {
        return Fail(NativeStatus::InvalidArg, os_error::kInvalidMenuHandle);
    }

    sub->parentMenu = menu;

    MenuItem item{};
    item.text.assign(text.AsStringView());
    item.subMenu = subMenu;
    entry->items.push_back(std::move(item));

    m_LastError = os_error::kNone;
    return NativeStatus::Ok;
}

NativeStatus NullNative::SetWindowMenu(NativeHandle window, NativeHandle menu) noexcept
{
    WindowEntry* entry = FindWindowEntry(window);
    if (entry == nullptr)
    {
        return Fail(NativeStatus::InvalidArg, os_error::kInvalidWindowHandle);
    }

    MenuEntry* attached = nullptr;
    if (menu.IsValid())
    {
        attached = FindMenuEntry(menu);
        if (attached == nullptr || attached->parentMenu.IsValid() ||
            (attached->ownerWindow.IsValid() && attached->ownerWindow != window))
        {
            return Fail(NativeStatus::InvalidArg, os_error::kInvalidMenuHandle);
        }
    }

    // The previous menu is detached, not destroyed.
    if (entry->menu.IsValid() && entry->menu != menu)
    {
        if (MenuEntry* previous = FindMenuEntry(entry->menu))
        {
            previous->ownerWindow = NativeHandle::Invalid();
        }
    }

    entry->menu = menu;
    if (attached != nullptr)
    {
        attached->ownerWindow = window;
    }

    m_LastError = os_error::kNone;
    return NativeStatus::Ok;
}

NativeStatus NullNative::DestroyNativeMenu(NativeHandle menu) noexcept
{
    MenuEntry* entry = FindMenuEntry(menu);
    if (entry == nullptr)
    {
        return Fail(NativeStatus::InvalidArg, os_error::kInvalidMenuHandle);
    }

    if (entry->parentMenu.IsValid())
    {
        if (MenuEntry* parent = FindMenuEntry(entry->parentMenu))
        {
            std::erase_if(parent->items, [menu](const MenuItem& item) {
                return item.subMenu == menu;
            });
        }
    }

    if (entry->ownerWindow.IsValid())
    {
        if (WindowEntry* owner = FindWindowEntry(entry->ownerWindow))
        {
            owner->menu = NativeHandle::Invalid();
        }
    }

    DestroyMenuTree(menu);
    m_LastError = os_error::kNone;
    return NativeStatus::Ok;
}

void NullNative::DestroyMenuTree(NativeHandle menu) noexcept
{
    const auto it = m_Menus.find(menu.value);
    if (it == m_Menus.end())
    {
        return;
    }

    std::vector<NativeHandle> subMenus;
    for (const MenuItem& item : it->second.items)
    {
        if (item.subMenu.IsValid())
        {
            subMenus.push_back(item.subMenu);
        }
    }

    m_Menus.erase(it);
    ReleaseHandle(menu.value);

    for (NativeHandle sub : subMenus)
    {
        DestroyMenuTree(sub);
    }
}

// ----------------------------------------------------------------------------
// GDI
// ----------------------------------------------------------------------------

NativeStatus NullNative::CreateBrush(ColorRef color, NativeHandle& outBrush) noexcept
{
    const NativeHandle brush{ AllocateHandle() };
    m_GdiObjects.emplace(brush.value, color);

    outBrush    = brush;
    m_LastError = os_error::kNone;
    return NativeStatus::Ok;
}

NativeStatus NullNative::DeleteGdiObject(NativeHandle object) noexcept
{
    const auto it = m_GdiObjects.find(object.value);
    if (it == m_GdiObjects.end())
    {
        return Fail(NativeStatus::InvalidArg, os_error::kInvalidHandle);
    }

    m_GdiObjects.erase(it);
    ReleaseHandle(object.value);
    m_LastError = os_error::kNone;
    return NativeStatus::Ok;
}

// ----------------------------------------------------------------------------
// Window properties
// ----------------------------------------------------------------------------

NativeStatus NullNative::ShowNativeWindow(NativeHandle handle, ShowCommand command) noexcept
{
    WindowEntry* entry = FindWindowEntry(handle);
    if (entry == nullptr)
    {
        return Fail(NativeStatus::InvalidArg, os_error::kInvalidWindowHandle);
    }

    entry->visible = (command != ShowCommand::Hide);
    if (entry->visible)
    {
        entry->needsPaint = true;
        entry->needsErase = true;
    }

    m_LastError = os_error::kNone;
    return NativeStatus::Ok;
}

NativeStatus NullNative::UpdateNativeWindow(NativeHandle handle) noexcept
{
    WindowEntry* entry = FindWindowEntry(handle);
    if (entry == nullptr)
    {
        return Fail(NativeStatus::InvalidArg, os_error::kInvalidWindowHandle);
    }

    // The window stays invalid until a paint session or the default proc
    // validates it.
    if (entry->visible && entry->needsPaint)
    {
        (void)Deliver(handle, msg::code::kPaint, 0, 0);
    }

    m_LastError = os_error::kNone;
    return NativeStatus::Ok;
}

NativeStatus NullNative::SetWindowTitle(NativeHandle handle, TextView text) noexcept
{
    WindowEntry* entry = FindWindowEntry(handle);
    if (entry == nullptr)
    {
        return Fail(NativeStatus::InvalidArg, os_error::kInvalidWindowHandle);
    }

    entry->title.assign(text.AsStringView());
    m_LastError = os_error::kNone;
    return NativeStatus::Ok;
}

NativeStatus NullNative::GetWindowTitle(NativeHandle handle, char* buffer, u32 capacity, u32& outLength) noexcept
{
    outLength = 0;

    const WindowEntry* entry = FindWindowEntry(handle);
    if (entry == nullptr)
    {
        return Fail(NativeStatus::InvalidArg, os_error::kInvalidWindowHandle);
    }

    const u32 length = static_cast<u32>(entry->title.size());
    if (buffer == nullptr)
    {
        outLength   = length;
        m_LastError = os_error::kNone;
        return NativeStatus::Ok;
    }
    if (capacity == 0)
    {
        return Fail(NativeStatus::InvalidArg, os_error::kInvalidParameter);
    }

    const u32 copied = std::min(length, capacity - 1u);
    std::memcpy(buffer, entry->title.data(), copied);
    buffer[copied] = '\0';

    outLength   = copied;
    m_LastError = os_error::kNone;
    return NativeStatus::Ok;
}

NativeStatus NullNative::GetClientArea(NativeHandle handle, Rect& outRect) noexcept
{
    outRect = Rect{};

    const WindowEntry* entry = FindWindowEntry(handle);
    if (entry == nullptr)
    {
        return Fail(NativeStatus::InvalidArg, os_error::kInvalidWindowHandle);
    }

    outRect     = Rect::FromSize(entry->rect.Width(), entry->rect.Height());
    m_LastError = os_error::kNone;
    return NativeStatus::Ok;
}

NativeStatus NullNative::MoveNativeWindow(NativeHandle handle, const Rect& rect) noexcept
{
    WindowEntry* entry = FindWindowEntry(handle);
    if (entry == nullptr)
    {
        return Fail(NativeStatus::InvalidArg, os_error::kInvalidWindowHandle);
    }

    const Rect previous = entry->rect;
    entry->rect = rect;

    const bool moved   = previous.X() != rect.X() || previous.Y() != rect.Y();
    const bool resized = previous.Width() != rect.Width() || previous.Height() != rect.Height();

    if (moved)
    {
        (void)Deliver(handle, msg::code::kMove, 0, static_cast<LongParam>(msg::PackPoint(rect.X(), rect.Y())));
    }
    if (resized)
    {
        const u32 packedSize = msg::PackWords(static_cast<u16>(rect.Width()), static_cast<u16>(rect.Height()));
        (void)Deliver(handle, msg::code::kSize, msg::size::kRestored, static_cast<LongParam>(packedSize));
    }

    m_LastError = os_error::kNone;
    return NativeStatus::Ok;
}

// ----------------------------------------------------------------------------
// Paint
// ----------------------------------------------------------------------------

NativeStatus NullNative::InvalidateNativeWindow(NativeHandle handle, bool eraseBackground) noexcept
{
    WindowEntry* entry = FindWindowEntry(handle);
    if (entry == nullptr)
    {
        return Fail(NativeStatus::InvalidArg, os_error::kInvalidWindowHandle);
    }

    entry->needsPaint = true;
    entry->needsErase = entry->needsErase || eraseBackground;
    m_LastError = os_error::kNone;
    return NativeStatus::Ok;
}

NativeStatus NullNative::BeginNativePaint(NativeHandle handle, NativePaintInfo& outInfo) noexcept
{
    outInfo = NativePaintInfo{};

    WindowEntry* entry = FindWindowEntry(handle);
    if (entry == nullptr)
    {
        return Fail(NativeStatus::InvalidArg, os_error::kInvalidWindowHandle);
    }
    if (entry->paintDc.IsValid())
    {
        return Fail(NativeStatus::Rejected, os_error::kInvalidParameter);
    }

    const NativeHandle dc{ AllocateHandle() };
    m_PaintDcs.emplace(dc.value, handle.value);
    entry->paintDc = dc;

    bool eraseBackground = false;
    if (entry->needsErase)
    {
        entry->needsErase = false;
        const NativeResult erased = Deliver(handle, msg::code::kEraseBkgnd, static_cast<WordParam>(dc.value), 0);
        eraseBackground = (erased == 0);

        // The EraseBkgnd handler may have destroyed the window.
        entry = FindWindowEntry(handle);
        if (entry == nullptr)
        {
            return Fail(NativeStatus::Failed, os_error::kInvalidWindowHandle);
        }
    }

    outInfo.dc              = dc;
    outInfo.area            = entry->needsPaint ? Rect::FromSize(entry->rect.Width(), entry->rect.Height()) : Rect{};
    outInfo.eraseBackground = eraseBackground;
    entry->needsPaint = false;

    m_LastError = os_error::kNone;
    return NativeStatus::Ok;
}

NativeStatus NullNative::EndNativePaint(NativeHandle handle, NativeHandle dc) noexcept
{
    const auto it = m_PaintDcs.find(dc.value);
    if (it == m_PaintDcs.end() || it->second != handle.value)
    {
        return Fail(NativeStatus::InvalidArg, os_error::kInvalidHandle);
    }

    ReleasePaintDc(dc.value);
    m_LastError = os_error::kNone;
    return NativeStatus::Ok;
}

NativeStatus NullNative::FillArea(NativeHandle dc, const Rect& area, NativeHandle brush) noexcept
{
    const auto paint = m_PaintDcs.find(dc.value);
    if (paint == m_PaintDcs.end())
    {
        return Fail(NativeStatus::InvalidArg, os_error::kInvalidHandle);
    }
    const auto gdi = m_GdiObjects.find(brush.value);
    if (gdi == m_GdiObjects.end())
    {
        return Fail(NativeStatus::InvalidArg, os_error::kInvalidHandle);
    }

    try
    {
        m_FillLog.push_back(FillRecord{ NativeHandle{ paint->second }, area, gdi->second });
    }
    catch (const std::bad_alloc&)
    {
        return Fail(NativeStatus::OutOfResources, os_error::kNotEnoughMemory);
    }

    m_LastError = os_error::kNone;
    return NativeStatus::Ok;
}

void NullNative::ReleasePaintDc(u64 dc) noexcept
{
    const auto it = m_PaintDcs.find(dc);
    if (it == m_PaintDcs.end())
    {
        return;
    }

    if (WindowEntry* entry = FindWindowEntry(NativeHandle{ it->second }))
    {
        entry->paintDc = NativeHandle::Invalid();
    }
    m_PaintDcs.erase(it);
    ReleaseHandle(dc);
}

// ----------------------------------------------------------------------------
// Simulation helpers
// ----------------------------------------------------------------------------

NativeStatus NullNative::ClickControl(NativeHandle control, NativeResult& outResult) noexcept
{
    outResult = 0;

    const WindowEntry* entry = FindWindowEntry(control);
    if (entry == nullptr || !entry->parent.IsValid())
    {
        return Fail(NativeStatus::InvalidArg, os_error::kInvalidWindowHandle);
    }

    const NativeHandle parent = entry->parent;
    const WordParam wParam = msg::PackWords(entry->controlId, Notify::kButtonClicked);
    outResult   = Deliver(parent, msg::code::kCommand, wParam, static_cast<LongParam>(control.value));
    m_LastError = os_error::kNone;
    return NativeStatus::Ok;
}

NativeStatus NullNative::RequestControlColor(NativeHandle control, u32 ctlColorCode, NativeResult& outResult) noexcept
{
    outResult = 0;

    const WindowEntry* entry = FindWindowEntry(control);
    if (entry == nullptr || !entry->parent.IsValid())
    {
        return Fail(NativeStatus::InvalidArg, os_error::kInvalidWindowHandle);
    }

    const NativeHandle parent = entry->parent;
    outResult   = Deliver(parent, ctlColorCode, static_cast<WordParam>(m_ScreenDc.value), static_cast<LongParam>(control.value));
    m_LastError = os_error::kNone;
    return NativeStatus::Ok;
}

bool NullNative::IsClassRegistered(std::string_view name) const noexcept
{
    return FindClassEntry(name) != nullptr;
}

bool NullNative::IsVisible(NativeHandle handle) const noexcept
{
    const WindowEntry* entry = FindWindowEntry(handle);
    return entry != nullptr && entry->visible;
}

NativeHandle NullNative::GetParentOf(NativeHandle handle) const noexcept
{
    const WindowEntry* entry = FindWindowEntry(handle);
    return (entry != nullptr) ? entry->parent : NativeHandle::Invalid();
}

NativeHandle NullNative::GetMenuOf(NativeHandle window) const noexcept
{
    const WindowEntry* entry = FindWindowEntry(window);
    return (entry != nullptr) ? entry->menu : NativeHandle::Invalid();
}

u32 NullNative::GetMenuItemCount(NativeHandle menu) const noexcept
{
    const auto it = m_Menus.find(menu.value);
    return (it != m_Menus.end()) ? static_cast<u32>(it->second.items.size()) : 0u;
}

bool NullNative::IsLiveMenu(NativeHandle menu) const noexcept
{
    return m_Menus.find(menu.value) != m_Menus.end();
}

bool NullNative::IsLiveGdiObject(NativeHandle object) const noexcept
{
    return m_GdiObjects.find(object.value) != m_GdiObjects.end();
}

bool NullNative::IsPaintPending(NativeHandle handle) const noexcept
{
    const WindowEntry* entry = FindWindowEntry(handle);
    return entry != nullptr && entry->needsPaint;
}

// ----------------------------------------------------------------------------
// Internals
// ----------------------------------------------------------------------------

NativeStatus NullNative::Fail(NativeStatus status, OsErrorCode error) noexcept
{
    m_LastError = error;
    return status;
}

u64 NullNative::AllocateHandle()
{
    if (!m_FreeHandles.empty())
    {
        const u64 value = m_FreeHandles.back();
        m_FreeHandles.pop_back();
        return value;
    }

    const u64 value = m_NextHandleValue;
    m_NextHandleValue += 2;
    return value;
}

void NullNative::ReleaseHandle(u64 value) noexcept
{
    m_FreeHandles.push_back(value);
}

NullNative::ClassEntry* NullNative::FindClassEntry(std::string_view name) noexcept
{
    for (ClassEntry& entry : m_Classes)
    {
        if (EqualsIgnoreCaseAscii(entry.name, name))
        {
            return &entry;
        }
    }
    return nullptr;
}

const NullNative::ClassEntry* NullNative::FindClassEntry(std::string_view name) const noexcept
{
    for (const ClassEntry& entry : m_Classes)
    {
        if (EqualsIgnoreCaseAscii(entry.name, name))
        {
            return &entry;
        }
    }
    return nullptr;
}

NullNative::ClassEntry* NullNative::FindClassEntryByAtom(ClassAtom atom) noexcept
{
    for (ClassEntry& entry : m_Classes)
    {
        if (entry.atom == atom)
        {
            return &entry;
        }
    }
    return nullptr;
}

NullNative::WindowEntry* NullNative::FindWindowEntry(NativeHandle handle) noexcept
{
    const auto it = m_Windows.find(handle.value);
    return (it != m_Windows.end()) ? &it->second : nullptr;
}

const NullNative::WindowEntry* NullNative::FindWindowEntry(NativeHandle handle) const noexcept
{
    const auto it = m_Windows.find(handle.value);
    return (it != m_Windows.end()) ? &it->second : nullptr;
}

NullNative::MenuEntry* NullNative::FindMenuEntry(NativeHandle menu) noexcept
{
    const auto it = m_Menus.find(menu.value);
    return (it != m_Menus.end()) ? &it->second : nullptr;
}

} // namespace mingui::native
