// ============================================================================
// MinGui - Source/MinGui/Window/ClassRegistrar.hpp
// ----------------------------------------------------------------------------
// Purpose : Registers window classes with the native backend once per name,
//           all of them routed through the single stateless trampoline.
// Contract: Thread-confined to the owner thread passed to Bind. Identity is
//           the class name compared case-insensitively: registering a name
//           again returns the existing token without touching the OS.
//           Tokens stay valid until UnregisterAll.
// Notes   : System control classes (Button, Edit, ...) are never registered
//           here; SystemClassName gives their OS names for creation.
// ============================================================================

#pragma once

#include "MinGui/Contracts/Native.hpp"
#include "MinGui/Contracts/NativeStyles.hpp"

#include <string>
#include <string_view>
#include <thread>
#include <vector>

namespace mingui::win
{
    using native::ClassStyle;
    using native::NativeHandle;
    using native::SystemColor;

    enum class SystemClass : u8
    {
        Button = 0,
        ComboBox,
        Edit,
        ListBox,
        MdiClient,
        ScrollBar,
        Static,
        Toolbar,
        ReBar,
        StatusBar,
        Count
    };

    [[nodiscard]] constexpr std::string_view SystemClassName(SystemClass systemClass) noexcept
    {
        switch (systemClass)
        {
            case SystemClass::Button:    return "Button";
            case SystemClass::ComboBox:  return "ComboBox";
            case SystemClass::Edit:      return "Edit";
            case SystemClass::ListBox:   return "ListBox";
            case SystemClass::MdiClient: return "MDIClient";
            case SystemClass::ScrollBar: return "ScrollBar";
            case SystemClass::Static:    return "Static";
            case SystemClass::Toolbar:   return "ToolbarWindow32";
            case SystemClass::ReBar:     return "ReBarWindow32";
            case SystemClass::StatusBar: return "msctls_statusbar32";
            default:                     return {};
        }
    }

    struct WindowClassDesc
    {
        std::string_view name{};
        u32              style = ClassStyle::kHorizontalRedraw | ClassStyle::kVerticalRedraw;
        NativeHandle     icon{};
        NativeHandle     smallIcon{};
        NativeHandle     cursor{};
        NativeHandle     background = native::SystemColorBrush(SystemColor::Window);
        u16              menuResource = 0;
    };

    struct ClassToken
    {
        static constexpr u32 kInvalidIndex = ~u32{0};

        native::ClassAtom atom = 0;
        u32               index = kInvalidIndex;

        [[nodiscard]] constexpr bool IsValid() const noexcept { return index != kInvalidIndex; }
        [[nodiscard]] friend constexpr bool operator==(ClassToken, ClassToken) noexcept = default;
    };

    enum class ClassStatus : u8
    {
        Ok = 0,
        InvalidArg,
        NameCollision,  // Name owned by someone else (system or external).
        Rejected,       // OS refused the descriptor.
        WrongThread,
        NotInitialized
    };

    struct RegisteredClass
    {
        std::string       name;
        u32               style = 0;
        NativeHandle      icon{};
        NativeHandle      smallIcon{};
        NativeHandle      cursor{};
        NativeHandle      background{};
        u16               menuResource = 0;
        native::ClassAtom atom = 0;
    };

    class ClassRegistrar
    {
    public:
        // Attaches the registrar to a backend. Called once by context init.
        void Bind(native::NativeInterface* nativeInterface,
                  native::WindowProc trampoline,
                  std::thread::id ownerThread) noexcept;

        [[nodiscard]] bool IsBound() const noexcept { return m_Native != nullptr; }

        [[nodiscard]] ClassStatus RegisterWindowClass(const WindowClassDesc& desc, ClassToken& outToken) noexcept;

        [[nodiscard]] const RegisteredClass* FindClass(std::string_view name) const noexcept;
        [[nodiscard]] const RegisteredClass* GetClass(ClassToken token) const noexcept;

        // Unregisters every owned class in reverse registration order.
        void UnregisterAll() noexcept;

        [[nodiscard]] usize Size() const noexcept { return m_Classes.size(); }
        [[nodiscard]] native::OsErrorCode GetLastOsError() const noexcept { return m_LastOsError; }

    private:
        native::NativeInterface*     m_Native = nullptr;
        native::WindowProc           m_Trampoline = nullptr;
        std::thread::id              m_OwnerThread{};
        std::vector<RegisteredClass> m_Classes;
        native::OsErrorCode          m_LastOsError = native::os_error::kNone;
    };

} // namespace mingui::win
