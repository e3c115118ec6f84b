#include "GuiSmokeSupport.hpp"

#include "MinGui/Messages/MessageCodes.hpp"
#include "MinGui/Window/Controls.hpp"
#include "MinGui/Window/Trampoline.hpp"

#include <memory>

int RunGuiContextSmoke()
{
    using namespace mingui;
    using namespace mingui::runtime;

    if (ParseBackendName("NULL") != GuiBackend::Null ||
        ParseBackendName("Win32") != GuiBackend::Win32 ||
        ParseBackendName("gdi").has_value() ||
        ParseBackendName("").has_value())
    {
        return 1;
    }
    if (ParseLogLevel("3") != core::LogLevel::Warn ||
        ParseLogLevel("0") != core::LogLevel::Disabled ||
        ParseLogLevel("9").has_value() ||
        ParseLogLevel("12").has_value())
    {
        return 2;
    }

    // Without a context the trampoline lets creation proceed and ignores the rest.
    if (GetActiveGuiContext() != nullptr ||
        win::WindowTrampoline(native::NativeHandle{ 0x10 }, msg::code::kNcCreate, 0, 0) != 1 ||
        win::WindowTrampoline(native::NativeHandle{ 0x10 }, msg::code::kPaint, 0, 0) != 0)
    {
        return 3;
    }

    {
        GuiContext rejected{};
        if (InitGuiContext(rejected, smoke::MakeNullConfig(0)) != GuiStatus::InvalidArg || rejected.isInitialized)
        {
            return 4;
        }
    }

#if !MINGUI_HAS_NATIVE_WIN32
    {
        GuiConfig config = smoke::MakeNullConfig();
        config.backend = GuiBackend::Win32;
        GuiContext unavailable{};
        if (InitGuiContext(unavailable, config) != GuiStatus::BackendUnavailable || GetActiveGuiContext() != nullptr)
        {
            return 5;
        }
    }
#endif

    // One active context per process.
    {
        GuiContext first{};
        if (InitGuiContext(first, smoke::MakeNullConfig()) != GuiStatus::Ok ||
            GetActiveGuiContext() != &first ||
            first.backend != GuiBackend::Null ||
            core::Logger::GetMinLevel() != core::LogLevel::Error)
        {
            return 6;
        }
        if (InitGuiContext(first, smoke::MakeNullConfig()) != GuiStatus::AlreadyInitialized)
        {
            return 7;
        }
        GuiContext second{};
        if (InitGuiContext(second, smoke::MakeNullConfig()) != GuiStatus::AlreadyActive || second.isInitialized)
        {
            return 8;
        }
    }
    // Leaving scope shut the first context down.
    if (GetActiveGuiContext() != nullptr)
    {
        return 9;
    }

    // External backends must be injected and complete.
    native::NullNative external{};
    {
        GuiConfig config = smoke::MakeNullConfig();
        config.backend = GuiBackend::External;

        GuiContext missing{};
        if (InitGuiContext(missing, config) != GuiStatus::InvalidArg)
        {
            return 10;
        }

        native::NativeInterface partial = native::MakeNullNativeInterface(external);
        partial.vtable.moveNativeWindow = nullptr;
        GuiContext incomplete{};
        if (InitGuiContext(incomplete, config, &partial) != GuiStatus::IncompleteBackend ||
            incomplete.isInitialized || GetActiveGuiContext() != nullptr)
        {
            return 11;
        }
    }

    // Shutdown destroys what the application left alive.
    {
        GuiConfig config = smoke::MakeNullConfig();
        config.backend = GuiBackend::External;
        const native::NativeInterface injected = native::MakeNullNativeInterface(external);

        GuiContext context{};
        if (InitGuiContext(context, config, &injected) != GuiStatus::Ok ||
            context.backend != GuiBackend::External || context.GetNullBackend() != nullptr)
        {
            return 12;
        }

        const win::ClassToken frame = smoke::RegisterSmokeClass(context, "ShutdownFrame");
        if (!frame.IsValid() || !external.IsClassRegistered("ShutdownFrame"))
        {
            return 13;
        }

        std::unique_ptr<win::WindowObject> top;
        std::unique_ptr<win::WindowObject> edit;
        win::CreationError error{};
        if (win::WindowObject::Create(context, smoke::TopLevelParams(frame, "Leaked"), top, error) != win::WindowStatus::Ok)
        {
            return 14;
        }
        win::ControlParams editParams{};
        editParams.text = "text";
        editParams.rect = Rect::FromXYWH(4, 4, 120, 22);
        editParams.id   = 7;
        if (win::CreateEdit(*top, std::move(editParams), edit, error) != win::WindowStatus::Ok)
        {
            return 15;
        }
        native::NativeHandle brush{};
        if (top->CreateSolidBrush(native::MakeRgb(0, 0, 0), brush) != win::WindowStatus::Ok ||
            top->StartTimer(1, 100) != win::WindowStatus::Ok)
        {
            return 16;
        }
        if (external.GetLiveWindowCount() != 2 || context.registry.Size() != 2)
        {
            return 17;
        }

        ShutdownGuiContext(context);
        if (context.isInitialized || GetActiveGuiContext() != nullptr)
        {
            return 18;
        }
        if (top->IsAlive() || edit->IsAlive() ||
            external.GetLiveWindowCount() != 0 ||
            external.GetLiveGdiObjectCount() != 0 ||
            external.GetLiveTimerCount() != 0 ||
            external.IsClassRegistered("ShutdownFrame"))
        {
            return 19;
        }

        // Idempotent; objects outliving the context stay inert.
        ShutdownGuiContext(context);
        if (top->Destroy() != win::WindowStatus::Ok || top->SetTitle("gone") != win::WindowStatus::InvalidState)
        {
            return 20;
        }

        std::unique_ptr<win::WindowObject> late;
        if (win::WindowObject::Create(context, smoke::TopLevelParams(frame), late, error) != win::WindowStatus::NotInitialized ||
            error.status != win::WindowStatus::NotInitialized)
        {
            return 21;
        }
    }

    return 0;
}
