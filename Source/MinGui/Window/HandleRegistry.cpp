// ============================================================================
// MinGui - Source/MinGui/Window/HandleRegistry.cpp
// ============================================================================

#include "MinGui/Window/HandleRegistry.hpp"

#include "MinGui/Logger.hpp"

#include <algorithm>
#include <new>

namespace mingui::win
{

RegistryStatus HandleRegistry::Register(NativeHandle handle, WindowObject* object) noexcept
{
    if (!handle.IsValid() || object == nullptr)
    {
        return RegistryStatus::InvalidArg;
    }

    try
    {
        const auto [it, inserted] = m_Entries.try_emplace(handle.value, object);
        if (!inserted)
        {
            MINGUI_LOG_ERROR("Registry", "Handle 0x{:X} is already bound to another window", handle.value);
            MINGUI_ASSERT(inserted, "Handle registered twice");
            return RegistryStatus::AlreadyRegistered;
        }
    }
    catch (const std::bad_alloc&)
    {
        MINGUI_LOG_ERROR("Registry", "Out of memory binding handle 0x{:X}", handle.value);
        return RegistryStatus::OutOfMemory;
    }

    MINGUI_LOG_VERBOSE("Registry", "Bound 0x{:X} ({} live)", handle.value, m_Entries.size());
    return RegistryStatus::Ok;
}

WindowObject* HandleRegistry::Lookup(NativeHandle handle) const noexcept
{
    const auto it = m_Entries.find(handle.value);
    return (it != m_Entries.end()) ? it->second : nullptr;
}

bool HandleRegistry::Unregister(NativeHandle handle) noexcept
{
    const bool removed = m_Entries.erase(handle.value) != 0;
    if (removed)
    {
        MINGUI_LOG_VERBOSE("Registry", "Unbound 0x{:X} ({} live)", handle.value, m_Entries.size());
    }
    return removed;
}

std::vector<NativeHandle> HandleRegistry::SnapshotHandles() const
{
    std::vector<NativeHandle> handles;
    handles.reserve(m_Entries.size());
    for (const auto& entry : m_Entries)
    {
        handles.push_back(NativeHandle{ entry.first });
    }
    std::sort(handles.begin(), handles.end(), [](NativeHandle a, NativeHandle b) { return a.value < b.value; });
    return handles;
}

} // namespace mingui::win
