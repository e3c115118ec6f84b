// ============================================================================
// MinGui - Source/MinGui/Window/HandleRegistry.hpp
// ----------------------------------------------------------------------------
// Purpose : Maps live native window handles to the WindowObject that owns
//           them. Pure bookkeeping: the registry never owns an object.
// Contract: Thread-confined to the GUI thread, no internal locking. At most
//           one entry per handle. Lookup of an absent handle is a normal
//           outcome (messages arrive before binding and after teardown).
// Notes   : Registering an already-mapped handle is a lifecycle bug; it is
//           logged, asserted and reported as AlreadyRegistered.
// ============================================================================

#pragma once

#include "MinGui/Contracts/Native.hpp"

#include <unordered_map>
#include <vector>

namespace mingui::win
{
    class WindowObject;

    using native::NativeHandle;

    enum class RegistryStatus : u8
    {
        Ok = 0,
        InvalidArg,
        AlreadyRegistered,
        OutOfMemory
    };

    class HandleRegistry
    {
    public:
        [[nodiscard]] RegistryStatus Register(NativeHandle handle, WindowObject* object) noexcept;
        [[nodiscard]] WindowObject* Lookup(NativeHandle handle) const noexcept;
        bool Unregister(NativeHandle handle) noexcept;

        [[nodiscard]] usize Size() const noexcept { return m_Entries.size(); }
        [[nodiscard]] bool IsEmpty() const noexcept { return m_Entries.empty(); }
        void Clear() noexcept { m_Entries.clear(); }

        // Sorted copy of the mapped handles. Callers re-Lookup each one, so
        // entries removed while iterating are skipped instead of dereferenced.
        [[nodiscard]] std::vector<NativeHandle> SnapshotHandles() const;

    private:
        std::unordered_map<u64, WindowObject*> m_Entries;
    };

} // namespace mingui::win
