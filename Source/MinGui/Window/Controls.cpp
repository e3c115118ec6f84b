// ============================================================================
// MinGui - Source/MinGui/Window/Controls.cpp
// ============================================================================

#include "MinGui/Window/Controls.hpp"

#include <utility>

namespace mingui::win
{
    namespace
    {
        constexpr u32 kChildDefaults = WindowStyle::kChild | WindowStyle::kVisible;

        [[nodiscard]] WindowStatus CreateSystemControl(WindowObject& parent,
                                                       SystemClass systemClass,
                                                       u32 defaultStyle,
                                                       ControlParams&& params,
                                                       std::unique_ptr<WindowObject>& outControl,
                                                       CreationError& outError) noexcept
        {
            CreateParams create{};
            create.systemClassName = SystemClassName(systemClass);
            create.title           = params.text;
            create.style           = kChildDefaults | defaultStyle | params.style;
            create.exStyle         = params.exStyle;
            create.parent          = &parent;
            create.controlId       = params.id;
            create.capabilities    = kControlCapabilities;
            create.handlers        = std::move(params.handlers);
            create.WithRect(params.rect);

            return WindowObject::Create(parent.GetContext(), std::move(create), outControl, outError);
        }
    } // namespace

WindowStatus CreateButton(WindowObject& parent, ControlParams params,
                          std::unique_ptr<WindowObject>& outControl, CreationError& outError) noexcept
{
    return CreateSystemControl(parent, SystemClass::Button,
                               WindowStyle::kTabStop | ControlStyle::kPushButton,
                               std::move(params), outControl, outError);
}

WindowStatus CreateEdit(WindowObject& parent, ControlParams params,
                        std::unique_ptr<WindowObject>& outControl, CreationError& outError) noexcept
{
    return CreateSystemControl(parent, SystemClass::Edit,
                               WindowStyle::kTabStop | WindowStyle::kBorder | ControlStyle::kEditAutoHScroll,
                               std::move(params), outControl, outError);
}

WindowStatus CreateStatic(WindowObject& parent, ControlParams params,
                          std::unique_ptr<WindowObject>& outControl, CreationError& outError) noexcept
{
    return CreateSystemControl(parent, SystemClass::Static, ControlStyle::kStaticLeft,
                               std::move(params), outControl, outError);
}

WindowStatus CreateListBox(WindowObject& parent, ControlParams params,
                           std::unique_ptr<WindowObject>& outControl, CreationError& outError) noexcept
{
    return CreateSystemControl(parent, SystemClass::ListBox,
                               WindowStyle::kTabStop | WindowStyle::kBorder | WindowStyle::kVScroll | ControlStyle::kListBoxNotify,
                               std::move(params), outControl, outError);
}

WindowStatus CreateComboBox(WindowObject& parent, ControlParams params,
                            std::unique_ptr<WindowObject>& outControl, CreationError& outError) noexcept
{
    return CreateSystemControl(parent, SystemClass::ComboBox,
                               WindowStyle::kTabStop | WindowStyle::kVScroll | ControlStyle::kComboDropDownList,
                               std::move(params), outControl, outError);
}

} // namespace mingui::win
