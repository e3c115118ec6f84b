// ============================================================================
// MinGui - Source/MinGui/Window/PaintSession.cpp
// ============================================================================

#include "MinGui/Window/PaintSession.hpp"

#include "MinGui/Diagnostics/Check.hpp"
#include "MinGui/Logger.hpp"
#include "MinGui/Runtime/GuiContext.hpp"

#include <utility>

namespace mingui::win
{

PaintSession::~PaintSession()
{
    End();
}

PaintSession::PaintSession(PaintSession&& other) noexcept
    : m_Context(std::exchange(other.m_Context, nullptr))
    , m_Window(std::exchange(other.m_Window, NativeHandle::Invalid()))
    , m_Dc(std::exchange(other.m_Dc, NativeHandle::Invalid()))
    , m_Area(std::exchange(other.m_Area, Rect{}))
    , m_EraseBackground(std::exchange(other.m_EraseBackground, false))
{
}

PaintSession& PaintSession::operator=(PaintSession&& other) noexcept
{
    if (this != &other)
    {
        End();
        m_Context         = std::exchange(other.m_Context, nullptr);
        m_Window          = std::exchange(other.m_Window, NativeHandle::Invalid());
        m_Dc              = std::exchange(other.m_Dc, NativeHandle::Invalid());
        m_Area            = std::exchange(other.m_Area, Rect{});
        m_EraseBackground = std::exchange(other.m_EraseBackground, false);
    }
    return *this;
}

WindowStatus PaintSession::Begin(WindowObject& window, PaintSession& outSession) noexcept
{
    outSession.End();

    if (!window.IsAlive())
    {
        return WindowStatus::InvalidState;
    }

    runtime::GuiContext& context = window.GetContext();
    if (!context.isInitialized)
    {
        return WindowStatus::NotInitialized;
    }
    if (!context.IsOwnerThread())
    {
        MINGUI_CHECK_FAILED("Window", "Paint session opened off the GUI thread");
        return WindowStatus::WrongThread;
    }

    native::NativePaintInfo info{};
    if (native::BeginNativePaint(context.nativeInterface, window.GetHandle(), info) != native::NativeStatus::Ok)
    {
        MINGUI_LOG_WARNING("Window", "BeginNativePaint on 0x{:X} failed (os error {})",
                           window.GetHandle().value, native::GetLastOsError(context.nativeInterface));
        return WindowStatus::OsFailure;
    }

    outSession.m_Context         = &context;
    outSession.m_Window          = window.GetHandle();
    outSession.m_Dc              = info.dc;
    outSession.m_Area            = info.area;
    outSession.m_EraseBackground = info.eraseBackground;
    return WindowStatus::Ok;
}

WindowStatus PaintSession::FillRect(const Rect& area, NativeHandle brush) noexcept
{
    if (m_Context == nullptr || !m_Dc.IsValid())
    {
        return WindowStatus::InvalidState;
    }
    if (!brush.IsValid() || area.Width() < 0 || area.Height() < 0)
    {
        return WindowStatus::InvalidArg;
    }

    if (native::FillArea(m_Context->nativeInterface, m_Dc, area, brush) != native::NativeStatus::Ok)
    {
        MINGUI_LOG_WARNING("Window", "FillArea on 0x{:X} failed", m_Window.value);
        return WindowStatus::OsFailure;
    }
    return WindowStatus::Ok;
}

void PaintSession::End() noexcept
{
    if (m_Context == nullptr || !m_Dc.IsValid())
    {
        return;
    }

    native::NativeInterface& os = m_Context->nativeInterface;
    if (native::EndNativePaint(os, m_Window, m_Dc) != native::NativeStatus::Ok)
    {
        // The DC went with the window when it was destroyed mid-paint.
        if (native::IsLiveWindow(os, m_Window))
        {
            MINGUI_LOG_WARNING("Window", "EndNativePaint on 0x{:X} failed", m_Window.value);
        }
        else
        {
            MINGUI_LOG_VERBOSE("Window", "0x{:X} destroyed before its paint session ended", m_Window.value);
        }
    }

    m_Context         = nullptr;
    m_Window          = NativeHandle::Invalid();
    m_Dc              = NativeHandle::Invalid();
    m_Area            = Rect{};
    m_EraseBackground = false;
}

} // namespace mingui::win
