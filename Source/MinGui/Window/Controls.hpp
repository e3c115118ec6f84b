// ============================================================================
// MinGui - Source/MinGui/Window/Controls.hpp
// ----------------------------------------------------------------------------
// Purpose : Thin constructors for the standard system controls. Each one is
//           a WindowObject created from a system class with the control
//           capability set; nothing here adds behavior.
// Contract: Same as WindowObject::Create. The parent must be alive and the
//           control id unique among its siblings.
// Notes   : Command and ControlColor notifications sent to the parent are
//           offered to the control's own handlers first.
// ============================================================================

#pragma once

#include "MinGui/Window/WindowObject.hpp"

namespace mingui::win
{
    using native::ControlStyle;

    inline constexpr CategoryMask kControlCapabilities = CategoryMask::Of({
        EventCategory::Command,
        EventCategory::ControlColor,
        EventCategory::Destroy,
        EventCategory::Focus,
    });

    struct ControlParams
    {
        std::string_view text{};
        Rect             rect{};
        u16              id = 0;
        u32              style = 0;   // Added to the control's defaults.
        u32              exStyle = 0;
        std::vector<Subscription> handlers;
    };

    [[nodiscard]] WindowStatus CreateButton(WindowObject& parent, ControlParams params,
                                            std::unique_ptr<WindowObject>& outControl, CreationError& outError) noexcept;

    [[nodiscard]] WindowStatus CreateEdit(WindowObject& parent, ControlParams params,
                                          std::unique_ptr<WindowObject>& outControl, CreationError& outError) noexcept;

    [[nodiscard]] WindowStatus CreateStatic(WindowObject& parent, ControlParams params,
                                            std::unique_ptr<WindowObject>& outControl, CreationError& outError) noexcept;

    [[nodiscard]] WindowStatus CreateListBox(WindowObject& parent, ControlParams params,
                                             std::unique_ptr<WindowObject>& outControl, CreationError& outError) noexcept;

    [[nodiscard]] WindowStatus CreateComboBox(WindowObject& parent, ControlParams params,
                                              std::unique_ptr<WindowObject>& outControl, CreationError& outError) noexcept;

} // namespace mingui::win
