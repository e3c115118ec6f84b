// ============================================================================
// MinGui - Source/MinGui/Window/ClassRegistrar.cpp
// ============================================================================

#include "MinGui/Window/ClassRegistrar.hpp"

#include "MinGui/Diagnostics/Check.hpp"
#include "MinGui/Logger.hpp"

#include <new>
#include <utility>

namespace mingui::win
{
    namespace
    {
        [[nodiscard]] bool SameDescriptor(const RegisteredClass& existing, const WindowClassDesc& desc) noexcept
        {
            return existing.style == desc.style &&
                   existing.icon == desc.icon &&
                   existing.smallIcon == desc.smallIcon &&
                   existing.cursor == desc.cursor &&
                   existing.background == desc.background &&
                   existing.menuResource == desc.menuResource;
        }
    } // namespace

void ClassRegistrar::Bind(native::NativeInterface* nativeInterface,
                          native::WindowProc trampoline,
                          std::thread::id ownerThread) noexcept
{
    MINGUI_CHECK(m_Classes.empty());
    m_Native = nativeInterface;
    m_Trampoline = trampoline;
    m_OwnerThread = ownerThread;
    m_LastOsError = native::os_error::kNone;
}

ClassStatus ClassRegistrar::RegisterWindowClass(const WindowClassDesc& desc, ClassToken& outToken) noexcept
{
    outToken = ClassToken{};

    if (m_Native == nullptr || m_Trampoline == nullptr)
    {
        return ClassStatus::NotInitialized;
    }

    if (std::this_thread::get_id() != m_OwnerThread)
    {
        MINGUI_CHECK_FAILED("Class", "RegisterWindowClass called off the GUI thread");
        return ClassStatus::WrongThread;
    }

    if (desc.name.empty())
    {
        return ClassStatus::InvalidArg;
    }

    for (usize i = 0; i < m_Classes.size(); ++i)
    {
        const RegisteredClass& existing = m_Classes[i];
        if (!native::EqualsIgnoreCaseAscii(existing.name, desc.name))
        {
            continue;
        }

        if (!SameDescriptor(existing, desc))
        {
            MINGUI_LOG_WARNING("Class", "'{}' already registered with different settings; keeping the first", existing.name);
        }

        outToken.atom = existing.atom;
        outToken.index = static_cast<u32>(i);
        return ClassStatus::Ok;
    }

    RegisteredClass entry{};
    try
    {
        entry.name.assign(desc.name);
        m_Classes.reserve(m_Classes.size() + 1u);
    }
    catch (const std::bad_alloc&)
    {
        MINGUI_LOG_ERROR("Class", "Out of memory registering '{}'", desc.name);
        m_LastOsError = native::os_error::kNotEnoughMemory;
        return ClassStatus::Rejected;
    }

    native::NativeClassDesc nativeDesc{};
    nativeDesc.name         = native::MakeTextView(desc.name);
    nativeDesc.proc         = m_Trampoline;
    nativeDesc.style        = desc.style;
    nativeDesc.icon         = desc.icon;
    nativeDesc.smallIcon    = desc.smallIcon;
    nativeDesc.cursor       = desc.cursor;
    nativeDesc.background   = desc.background;
    nativeDesc.menuResource = desc.menuResource;

    native::ClassAtom atom = 0;
    const native::NativeStatus status = native::RegisterWindowClass(*m_Native, nativeDesc, atom);
    if (status != native::NativeStatus::Ok)
    {
        m_LastOsError = native::GetLastOsError(*m_Native);
        MINGUI_LOG_ERROR("Class", "OS rejected class '{}' (os error {})", desc.name, m_LastOsError);
        return (status == native::NativeStatus::AlreadyExists) ? ClassStatus::NameCollision : ClassStatus::Rejected;
    }

    entry.style        = desc.style;
    entry.icon         = desc.icon;
    entry.smallIcon    = desc.smallIcon;
    entry.cursor       = desc.cursor;
    entry.background   = desc.background;
    entry.menuResource = desc.menuResource;
    entry.atom         = atom;
    m_Classes.push_back(std::move(entry));

    outToken.atom = atom;
    outToken.index = static_cast<u32>(m_Classes.size() - 1u);
    MINGUI_LOG_INFO("Class", "Registered '{}' (atom 0x{:04X})", desc.name, atom);
    return ClassStatus::Ok;
}

const RegisteredClass* ClassRegistrar::FindClass(std::string_view name) const noexcept
{
    for (const RegisteredClass& entry : m_Classes)
    {
        if (native::EqualsIgnoreCaseAscii(entry.name, name))
        {
            return &entry;
        }
    }
    return nullptr;
}

const RegisteredClass* ClassRegistrar::GetClass(ClassToken token) const noexcept
{
    if (!token.IsValid() || token.index >= m_Classes.size())
    {
        return nullptr;
    }

    const RegisteredClass& entry = m_Classes[token.index];
    return (entry.atom == token.atom) ? &entry : nullptr;
}

void ClassRegistrar::UnregisterAll() noexcept
{
    if (m_Native == nullptr)
    {
        m_Classes.clear();
        return;
    }

    while (!m_Classes.empty())
    {
        const RegisteredClass& entry = m_Classes.back();
        if (native::UnregisterWindowClass(*m_Native, native::MakeTextView(entry.name)) != native::NativeStatus::Ok)
        {
            m_LastOsError = native::GetLastOsError(*m_Native);
            MINGUI_LOG_WARNING("Class", "Failed to unregister '{}' (os error {})", entry.name, m_LastOsError);
        }
        else
        {
            MINGUI_LOG_VERBOSE("Class", "Unregistered '{}'", entry.name);
        }
        m_Classes.pop_back();
    }
}

} // namespace mingui::win
