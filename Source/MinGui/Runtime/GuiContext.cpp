// ============================================================================
// MinGui - Source/MinGui/Runtime/GuiContext.cpp
// ============================================================================

#include "MinGui/Runtime/GuiContext.hpp"

#include "MinGui/Diagnostics/Check.hpp"
#include "MinGui/Window/Trampoline.hpp"
#include "MinGui/Window/WindowObject.hpp"

#include <cstdlib>
#include <new>

namespace mingui::runtime
{
    namespace
    {
        GuiContext* s_ActiveContext = nullptr;

        [[nodiscard]] std::string_view ReadEnvironment(const char* name) noexcept
        {
            const char* value = std::getenv(name);
            return (value != nullptr) ? std::string_view(value) : std::string_view{};
        }

        [[nodiscard]] GuiBackend ResolveBackend(const GuiConfig& config) noexcept
        {
            if (config.backend.has_value())
            {
                return *config.backend;
            }

            if (config.readEnvironment)
            {
                const std::string_view fromEnv = ReadEnvironment("MINGUI_BACKEND");
                if (!fromEnv.empty())
                {
                    if (const std::optional<GuiBackend> parsed = ParseBackendName(fromEnv))
                    {
                        return *parsed;
                    }
                    MINGUI_LOG_WARNING("Gui", "Ignoring MINGUI_BACKEND='{}'", fromEnv);
                }
            }

            return kDefaultGuiBackend;
        }

        void ApplyLogLevel(const GuiConfig& config) noexcept
        {
            if (config.logLevel.has_value())
            {
                core::Logger::SetMinLevel(*config.logLevel);
                return;
            }

            if (config.readEnvironment)
            {
                const std::string_view fromEnv = ReadEnvironment("MINGUI_LOG_LEVEL");
                if (!fromEnv.empty())
                {
                    if (const std::optional<core::LogLevel> parsed = ParseLogLevel(fromEnv))
                    {
                        core::Logger::SetMinLevel(*parsed);
                        return;
                    }
                    MINGUI_LOG_WARNING("Gui", "Ignoring MINGUI_LOG_LEVEL='{}'", fromEnv);
                }
            }
        }

        void ResetContext(GuiContext& context) noexcept
        {
            context.nativeInterface = native::NativeInterface{};
            context.nullBackend.reset();
#if MINGUI_HAS_NATIVE_WIN32
            context.win32Backend.reset();
#endif
            context.registry.Clear();
            context.classes = win::ClassRegistrar{};
            context.pendingCreations.clear();
            context.ownerThread = std::thread::id{};
            context.isInitialized = false;
        }
    } // namespace

GuiContext::~GuiContext()
{
    ShutdownGuiContext(*this);
}

std::optional<GuiBackend> ParseBackendName(std::string_view name) noexcept
{
    if (native::EqualsIgnoreCaseAscii(name, "null"))
    {
        return GuiBackend::Null;
    }
    if (native::EqualsIgnoreCaseAscii(name, "win32"))
    {
        return GuiBackend::Win32;
    }
    return std::nullopt;
}

std::optional<core::LogLevel> ParseLogLevel(std::string_view text) noexcept
{
    if (text.size() != 1 || text[0] < '0' || text[0] > '5')
    {
        return std::nullopt;
    }
    return static_cast<core::LogLevel>(text[0] - '0');
}

GuiStatus InitGuiContext(GuiContext& context,
                         const GuiConfig& config,
                         const native::NativeInterface* injected) noexcept
{
    if (context.isInitialized)
    {
        return GuiStatus::AlreadyInitialized;
    }
    if (s_ActiveContext != nullptr)
    {
        MINGUI_LOG_ERROR("Gui", "Another GuiContext is already active in this process");
        return GuiStatus::AlreadyActive;
    }

    ApplyLogLevel(config);

    const GuiBackend backend = ResolveBackend(config);
    switch (backend)
    {
        case GuiBackend::Null:
        {
            if (config.nullMaxWindows == 0)
            {
                return GuiStatus::InvalidArg;
            }

            native::NullNativeConfig nullConfig{};
            nullConfig.maxWindows = config.nullMaxWindows;
            try
            {
                context.nullBackend = std::make_unique<native::NullNative>(nullConfig);
            }
            catch (const std::bad_alloc&)
            {
                return GuiStatus::OutOfMemory;
            }
            context.nativeInterface = native::MakeNullNativeInterface(*context.nullBackend);
            break;
        }
        case GuiBackend::Win32:
        {
#if MINGUI_HAS_NATIVE_WIN32
            context.win32Backend.reset(new (std::nothrow) native::Win32Native());
            if (!context.win32Backend)
            {
                return GuiStatus::OutOfMemory;
            }
            if (!context.win32Backend->Init())
            {
                MINGUI_LOG_ERROR("Gui", "Win32 backend failed to initialize");
                context.win32Backend.reset();
                return GuiStatus::BackendUnavailable;
            }
            context.nativeInterface = native::MakeNativeInterface(*context.win32Backend);
            break;
#else
            MINGUI_LOG_ERROR("Gui", "Win32 backend is not available on this platform");
            return GuiStatus::BackendUnavailable;
#endif
        }
        case GuiBackend::External:
        {
            if (injected == nullptr)
            {
                return GuiStatus::InvalidArg;
            }
            context.nativeInterface = *injected;
            break;
        }
        default:
        {
            return GuiStatus::InvalidArg;
        }
    }

    if (!native::IsComplete(context.nativeInterface))
    {
        MINGUI_LOG_ERROR("Gui", "Native backend '{}' has missing entries", ToString(backend));
        ResetContext(context);
        return GuiStatus::IncompleteBackend;
    }

    context.backend = backend;
    context.ownerThread = std::this_thread::get_id();
    context.registry.Clear();
    context.pendingCreations.clear();
    context.classes.Bind(&context.nativeInterface, &win::WindowTrampoline, context.ownerThread);
    context.isInitialized = true;
    s_ActiveContext = &context;

    MINGUI_LOG_INFO("Gui", "GUI context ready (backend {})", ToString(backend));
    return GuiStatus::Ok;
}

void ShutdownGuiContext(GuiContext& context) noexcept
{
    if (!context.isInitialized)
    {
        return;
    }

    MINGUI_CHECK(context.IsOwnerThread());

    win::WindowObject::PurgeDeadSystemWindows(context);

    // Top-level windows first; their children go with them. Handles are
    // re-resolved one at a time because each Destroy can release others.
    for (int pass = 0; pass < 2 && !context.registry.IsEmpty(); ++pass)
    {
        std::vector<native::NativeHandle> handles;
        try
        {
            handles = context.registry.SnapshotHandles();
        }
        catch (const std::bad_alloc&)
        {
            MINGUI_LOG_ERROR("Gui", "Out of memory listing live windows at shutdown");
            break;
        }

        for (native::NativeHandle handle : handles)
        {
            win::WindowObject* window = context.registry.Lookup(handle);
            if (window == nullptr || !window->IsAlive())
            {
                continue;
            }
            if (pass == 0 && window->GetParent() != nullptr)
            {
                continue;
            }

            MINGUI_LOG_WARNING("Gui", "Window 0x{:X} still alive at shutdown, destroying it", handle.value);
            if (window->Destroy() != win::WindowStatus::Ok)
            {
                MINGUI_LOG_ERROR("Gui", "Window 0x{:X} could not be destroyed", handle.value);
            }
        }
    }

    if (!context.registry.IsEmpty())
    {
        MINGUI_LOG_ERROR("Gui", "{} registry entries left at shutdown", context.registry.Size());
    }

    context.classes.UnregisterAll();

#if MINGUI_HAS_NATIVE_WIN32
    if (context.win32Backend)
    {
        context.win32Backend->Shutdown();
    }
#endif

    if (s_ActiveContext == &context)
    {
        s_ActiveContext = nullptr;
    }

    ResetContext(context);
    MINGUI_LOG_INFO("Gui", "GUI context shut down");
}

GuiContext* GetActiveGuiContext() noexcept
{
    return s_ActiveContext;
}

} // namespace mingui::runtime
