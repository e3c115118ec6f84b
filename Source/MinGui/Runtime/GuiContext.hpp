// ============================================================================
// MinGui - Source/MinGui/Runtime/GuiContext.hpp
// ----------------------------------------------------------------------------
// Purpose : Process-wide GUI state: selected native backend, handle registry,
//           class registrar and the thread the GUI is confined to.
// Contract: At most one initialized context per process. Init and shutdown
//           run on the owner thread; every window operation checks
//           IsOwnerThread(). Shutdown is idempotent and destroys windows
//           still alive (logged as warnings) before unregistering classes.
// Notes   : Backend precedence: GuiConfig value, then MINGUI_BACKEND
//           (null|win32), then MINGUI_DEFAULT_BACKEND. Log level follows the
//           same order with MINGUI_LOG_LEVEL (0..5).
// ============================================================================

#pragma once

#include "MinGui/Contracts/Native.hpp"
#include "MinGui/Logger.hpp"
#include "MinGui/Native/NullNative.hpp"
#include "MinGui/Platform/PlatformDefines.hpp"
#include "MinGui/Window/ClassRegistrar.hpp"
#include "MinGui/Window/HandleRegistry.hpp"

#if MINGUI_HAS_NATIVE_WIN32
#include "MinGui/Native/Win32Native.hpp"
#endif

#include <memory>
#include <optional>
#include <string_view>
#include <thread>
#include <vector>

// 0 = Null, 1 = Win32.
#ifndef MINGUI_DEFAULT_BACKEND
#  if MINGUI_HAS_NATIVE_WIN32
#    define MINGUI_DEFAULT_BACKEND 1
#  else
#    define MINGUI_DEFAULT_BACKEND 0
#  endif
#endif

namespace mingui::runtime
{
    enum class GuiBackend : u8
    {
        Null = 0,
        Win32,
        External
    };

    [[nodiscard]] constexpr const char* ToString(GuiBackend backend) noexcept
    {
        switch (backend)
        {
            case GuiBackend::Null:     return "null";
            case GuiBackend::Win32:    return "win32";
            case GuiBackend::External: return "external";
            default:                   return "unknown";
        }
    }

    inline constexpr GuiBackend kDefaultGuiBackend =
        (MINGUI_DEFAULT_BACKEND == 1) ? GuiBackend::Win32 : GuiBackend::Null;

    enum class GuiStatus : u8
    {
        Ok = 0,
        InvalidArg,
        AlreadyInitialized,
        AlreadyActive,
        BackendUnavailable,
        IncompleteBackend,
        OutOfMemory
    };

    struct GuiConfig
    {
        std::optional<GuiBackend>    backend{};
        std::optional<core::LogLevel> logLevel{};
        u32                          nullMaxWindows = 256;
        bool                         readEnvironment = true;
    };

    struct GuiContext
    {
        GuiContext() = default;
        ~GuiContext();

        GuiContext(const GuiContext&) = delete;
        GuiContext& operator=(const GuiContext&) = delete;

        native::NativeInterface              nativeInterface{};
        GuiBackend                           backend = GuiBackend::Null;
        std::unique_ptr<native::NullNative>  nullBackend;
#if MINGUI_HAS_NATIVE_WIN32
        std::unique_ptr<native::Win32Native> win32Backend;
#endif
        win::HandleRegistry                  registry{};
        win::ClassRegistrar                  classes{};
        std::vector<win::WindowObject*>      pendingCreations;
        std::thread::id                      ownerThread{};
        bool                                 isInitialized = false;

        [[nodiscard]] bool IsOwnerThread() const noexcept
        {
            return std::this_thread::get_id() == ownerThread;
        }

        // True while `object` is inside its own WindowObject::Create.
        [[nodiscard]] bool IsCreating(const win::WindowObject* object) const noexcept
        {
            return !pendingCreations.empty() && pendingCreations.back() == object;
        }

        [[nodiscard]] native::NullNative* GetNullBackend() noexcept { return nullBackend.get(); }
    };

    // Parses "null" / "win32" (case-insensitive).
    [[nodiscard]] std::optional<GuiBackend> ParseBackendName(std::string_view name) noexcept;
    // Parses "0".."5".
    [[nodiscard]] std::optional<core::LogLevel> ParseLogLevel(std::string_view text) noexcept;

    // `injected` is required for GuiBackend::External and ignored otherwise.
    [[nodiscard]] GuiStatus InitGuiContext(GuiContext& context,
                                           const GuiConfig& config,
                                           const native::NativeInterface* injected = nullptr) noexcept;

    void ShutdownGuiContext(GuiContext& context) noexcept;

    [[nodiscard]] GuiContext* GetActiveGuiContext() noexcept;

} // namespace mingui::runtime
