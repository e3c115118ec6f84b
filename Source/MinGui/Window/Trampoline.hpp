// ============================================================================
// MinGui - Source/MinGui/Window/Trampoline.hpp
// ----------------------------------------------------------------------------
// Purpose : The single window procedure installed for every class MinGui
//           registers. Resolves the target WindowObject and forwards.
// Contract: Stateless apart from the active GuiContext. Never throws. Handles
//           without a bound object fall back to the default procedure; an
//           ownerless NcDestroy also purges dead system controls.
// Notes   : Binding happens on NcCreate, the first message a new window
//           receives, when the create parameter names the WindowObject that
//           the active context is currently creating.
// ============================================================================

#pragma once

#include "MinGui/Contracts/Native.hpp"

namespace mingui::win
{
    [[nodiscard]] native::NativeResult WindowTrampoline(native::NativeHandle handle,
                                                        u32 code,
                                                        native::WordParam wParam,
                                                        native::LongParam lParam) noexcept;

} // namespace mingui::win
