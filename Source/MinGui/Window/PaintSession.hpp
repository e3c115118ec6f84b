// ============================================================================
// MinGui - Source/MinGui/Window/PaintSession.hpp
// ----------------------------------------------------------------------------
// Purpose : RAII scope of one BeginPaint/EndPaint pair. Opening the session
//           validates the window's update region; the device context it
//           hands out is only valid until the session ends.
// Contract: Move-only. Owner thread only. Opened from a Paint handler; a
//           Paint handler that returns Handled without one leaves the window
//           invalid. EndPaint runs in the destructor unless End ran first.
// Notes   : Fills take a brush from WindowObject::CreateSolidBrush (or any
//           live brush handle); the session never owns brushes.
// ============================================================================

#pragma once

#include "MinGui/Contracts/Native.hpp"
#include "MinGui/Window/WindowObject.hpp"

namespace mingui::win
{
    class PaintSession
    {
    public:
        PaintSession() noexcept = default;
        ~PaintSession();

        PaintSession(const PaintSession&) = delete;
        PaintSession& operator=(const PaintSession&) = delete;

        PaintSession(PaintSession&& other) noexcept;
        PaintSession& operator=(PaintSession&& other) noexcept;

        [[nodiscard]] static WindowStatus Begin(WindowObject& window, PaintSession& outSession) noexcept;

        [[nodiscard]] WindowStatus FillRect(const Rect& area, NativeHandle brush) noexcept;
        // Fills the whole area that needs repainting.
        [[nodiscard]] WindowStatus FillArea(NativeHandle brush) noexcept { return FillRect(m_Area, brush); }

        [[nodiscard]] bool IsActive() const noexcept { return m_Dc.IsValid(); }
        [[nodiscard]] NativeHandle GetDc() const noexcept { return m_Dc; }
        [[nodiscard]] NativeHandle GetWindowHandle() const noexcept { return m_Window; }
        [[nodiscard]] const Rect& GetArea() const noexcept { return m_Area; }
        // True when EraseBkgnd was left unhandled and the background is stale.
        [[nodiscard]] bool ShouldEraseBackground() const noexcept { return m_EraseBackground; }

        void End() noexcept;

    private:
        runtime::GuiContext* m_Context = nullptr;
        NativeHandle         m_Window{};
        NativeHandle         m_Dc{};
        Rect                 m_Area{};
        bool                 m_EraseBackground = false;
    };

} // namespace mingui::win
