// ============================================================================
// MinGui - Source/MinGui/Window/Menu.hpp
// ----------------------------------------------------------------------------
// Purpose : RAII owner of a native menu (menu bar or popup).
// Contract: Move-only. The native menu is destroyed when the Menu goes out of
//           scope unless ownership moved to a window (WindowObject::SetMenu)
//           or to a parent menu (AppendSubMenu). Must not outlive the
//           GuiContext it was created from. Owner thread only.
// Notes   : Item ids arrive as the id of Menu-sourced Command events.
// ============================================================================

#pragma once

#include "MinGui/Contracts/Native.hpp"
#include "MinGui/Window/WindowObject.hpp"

#include <string_view>

namespace mingui::win
{
    using native::MenuKind;

    class Menu
    {
    public:
        Menu() noexcept = default;
        ~Menu();

        Menu(const Menu&) = delete;
        Menu& operator=(const Menu&) = delete;

        Menu(Menu&& other) noexcept;
        Menu& operator=(Menu&& other) noexcept;

        [[nodiscard]] static WindowStatus Create(runtime::GuiContext& context, MenuKind kind, Menu& outMenu) noexcept;

        [[nodiscard]] WindowStatus AppendItem(u16 id, std::string_view text) noexcept;
        [[nodiscard]] WindowStatus AppendSeparator() noexcept;
        // Takes ownership of `subMenu` on success.
        [[nodiscard]] WindowStatus AppendSubMenu(std::string_view text, Menu&& subMenu) noexcept;

        [[nodiscard]] bool IsValid() const noexcept { return m_Handle.IsValid(); }
        [[nodiscard]] NativeHandle GetHandle() const noexcept { return m_Handle; }
        [[nodiscard]] MenuKind GetKind() const noexcept { return m_Kind; }
        [[nodiscard]] runtime::GuiContext* GetContext() const noexcept { return m_Context; }

        // Gives up ownership without destroying the native menu.
        [[nodiscard]] NativeHandle Release() noexcept;

        // Destroys the native menu now.
        void Reset() noexcept;

    private:
        [[nodiscard]] WindowStatus CheckUsable() const noexcept;

        runtime::GuiContext* m_Context = nullptr;
        NativeHandle         m_Handle{};
        MenuKind             m_Kind = MenuKind::Bar;
    };

} // namespace mingui::win
