// ============================================================================
// MinGui - Source/MinGui/Window/Menu.cpp
// ============================================================================

#include "MinGui/Window/Menu.hpp"

#include "MinGui/Diagnostics/Check.hpp"
#include "MinGui/Logger.hpp"
#include "MinGui/Runtime/GuiContext.hpp"

#include <utility>

namespace mingui::win
{

Menu::~Menu()
{
    Reset();
}

Menu::Menu(Menu&& other) noexcept
    : m_Context(std::exchange(other.m_Context, nullptr))
    , m_Handle(std::exchange(other.m_Handle, NativeHandle::Invalid()))
    , m_Kind(other.m_Kind)
{
}

Menu& Menu::operator=(Menu&& other) noexcept
{
    if (this != &other)
    {
        Reset();
        m_Context = std::exchange(other.m_Context, nullptr);
        m_Handle  = std::exchange(other.m_Handle, NativeHandle::Invalid());
        m_Kind    = other.m_Kind;
    }
    return *this;
}

WindowStatus Menu::Create(runtime::GuiContext& context, MenuKind kind, Menu& outMenu) noexcept
{
    outMenu.Reset();

    if (!context.isInitialized)
    {
        return WindowStatus::NotInitialized;
    }
    if (!context.IsOwnerThread())
    {
        MINGUI_CHECK_FAILED("Window", "Menu created off the GUI thread");
        return WindowStatus::WrongThread;
    }

    NativeHandle handle{};
    if (native::CreateNativeMenu(context.nativeInterface, kind, handle) != native::NativeStatus::Ok)
    {
        MINGUI_LOG_WARNING("Window", "CreateNativeMenu failed (os error {})", native::GetLastOsError(context.nativeInterface));
        return WindowStatus::OsFailure;
    }

    outMenu.m_Context = &context;
    outMenu.m_Handle  = handle;
    outMenu.m_Kind    = kind;
    return WindowStatus::Ok;
}

WindowStatus Menu::CheckUsable() const noexcept
{
    if (m_Context == nullptr || !m_Handle.IsValid())
    {
        return WindowStatus::InvalidState;
    }
    if (!m_Context->isInitialized)
    {
        return WindowStatus::NotInitialized;
    }
    if (!m_Context->IsOwnerThread())
    {
        MINGUI_CHECK_FAILED("Window", "Menu used off the GUI thread");
        return WindowStatus::WrongThread;
    }
    return WindowStatus::Ok;
}

WindowStatus Menu::AppendItem(u16 id, std::string_view text) noexcept
{
    const WindowStatus usable = CheckUsable();
    if (usable != WindowStatus::Ok)
    {
        return usable;
    }

    if (native::AppendMenuItem(m_Context->nativeInterface, m_Handle, id, native::MakeTextView(text)) != native::NativeStatus::Ok)
    {
        MINGUI_LOG_WARNING("Window", "AppendMenuItem '{}' failed", text);
        return WindowStatus::OsFailure;
    }
    return WindowStatus::Ok;
}

WindowStatus Menu::AppendSeparator() noexcept
{
    const WindowStatus usable = CheckUsable();
    if (usable != WindowStatus::Ok)
    {
        return usable;
    }

    return (native::AppendMenuSeparator(m_Context->nativeInterface, m_Handle) == native::NativeStatus::Ok)
        ? WindowStatus::Ok
        : WindowStatus::OsFailure;
}

WindowStatus Menu::AppendSubMenu(std::string_view text, Menu&& subMenu) noexcept
{
    const WindowStatus usable = CheckUsable();
    if (usable != WindowStatus::Ok)
    {
        return usable;
    }
    if (!subMenu.IsValid() || subMenu.m_Context != m_Context || &subMenu == this)
    {
        return WindowStatus::InvalidArg;
    }

    if (native::AppendSubMenu(m_Context->nativeInterface, m_Handle, subMenu.m_Handle, native::MakeTextView(text)) != native::NativeStatus::Ok)
    {
        MINGUI_LOG_WARNING("Window", "AppendSubMenu '{}' failed", text);
        return WindowStatus::OsFailure;
    }

    // The parent menu destroys the sub-menu from now on.
    (void)subMenu.Release();
    return WindowStatus::Ok;
}

NativeHandle Menu::Release() noexcept
{
    m_Context = nullptr;
    return std::exchange(m_Handle, NativeHandle::Invalid());
}

void Menu::Reset() noexcept
{
    if (m_Handle.IsValid() && m_Context != nullptr && m_Context->isInitialized)
    {
        if (native::DestroyNativeMenu(m_Context->nativeInterface, m_Handle) != native::NativeStatus::Ok)
        {
            MINGUI_LOG_WARNING("Window", "DestroyNativeMenu 0x{:X} failed", m_Handle.value);
        }
    }
    m_Context = nullptr;
    m_Handle  = NativeHandle::Invalid();
}

} // namespace mingui::win
