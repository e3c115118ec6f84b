// ============================================================================
// MinGui - Source/MinGui/Window/Trampoline.cpp
// ============================================================================

#include "MinGui/Window/Trampoline.hpp"

#include "MinGui/Logger.hpp"
#include "MinGui/Messages/MessageCodes.hpp"
#include "MinGui/Runtime/GuiContext.hpp"
#include "MinGui/Window/WindowObject.hpp"

namespace mingui::win
{

native::NativeResult WindowTrampoline(native::NativeHandle handle,
                                      u32 code,
                                      native::WordParam wParam,
                                      native::LongParam lParam) noexcept
{
    runtime::GuiContext* context = runtime::GetActiveGuiContext();
    if (context == nullptr)
    {
        // No context means no backend to defer to; NcCreate must still
        // succeed so the OS does not loop on a half-built window.
        return (code == msg::code::kNcCreate) ? 1 : 0;
    }

    native::NativeInterface& os = context->nativeInterface;

    WindowObject* object = context->registry.Lookup(handle);
    if (object == nullptr && code == msg::code::kNcCreate && lParam != 0)
    {
        const auto* params = reinterpret_cast<const native::NativeCreateParams*>(lParam);
        WindowObject* pending = static_cast<WindowObject*>(params->userParam);
        if (pending != nullptr && context->IsCreating(pending))
        {
            if (!pending->BindHandle(handle))
            {
                // Returning 0 from NcCreate makes the OS abort the creation.
                return 0;
            }
            object = pending;
        }
    }

    if (object == nullptr)
    {
        MINGUI_LOG_VERBOSE("Dispatch", "0x{:X} code 0x{:04X} has no owner, default processing", handle.value, code);
        const native::NativeResult result = native::CallDefaultProc(os, handle, code, wParam, lParam);
        if (code == msg::code::kNcDestroy)
        {
            // The owner was released during its Destroy dispatch; its system
            // controls are already gone.
            WindowObject::PurgeDeadSystemWindows(*context);
        }
        return result;
    }

    return object->HandleNativeMessage(handle, code, wParam, lParam);
}

} // namespace mingui::win
