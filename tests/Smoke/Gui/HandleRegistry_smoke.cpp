#include "MinGui/Window/HandleRegistry.hpp"

namespace
{
    // The registry never dereferences its objects; any distinct address works.
    alignas(16) unsigned char s_FirstSlot[16]{};
    alignas(16) unsigned char s_SecondSlot[16]{};
}

int RunHandleRegistrySmoke()
{
    using namespace mingui::win;

    WindowObject* first  = reinterpret_cast<WindowObject*>(s_FirstSlot);
    WindowObject* second = reinterpret_cast<WindowObject*>(s_SecondSlot);

    HandleRegistry registry{};
    if (!registry.IsEmpty() || registry.Lookup(NativeHandle{ 0x10 }) != nullptr)
    {
        return 1;
    }

    if (registry.Register(NativeHandle::Invalid(), first) != RegistryStatus::InvalidArg ||
        registry.Register(NativeHandle{ 0x10 }, nullptr) != RegistryStatus::InvalidArg)
    {
        return 2;
    }

    if (registry.Register(NativeHandle{ 0x10 }, first) != RegistryStatus::Ok ||
        registry.Register(NativeHandle{ 0x20 }, second) != RegistryStatus::Ok)
    {
        return 3;
    }

    if (registry.Lookup(NativeHandle{ 0x10 }) != first ||
        registry.Lookup(NativeHandle{ 0x20 }) != second ||
        registry.Size() != 2)
    {
        return 4;
    }

    // One entry per handle: the first binding stays.
    if (registry.Register(NativeHandle{ 0x10 }, second) != RegistryStatus::AlreadyRegistered ||
        registry.Lookup(NativeHandle{ 0x10 }) != first)
    {
        return 5;
    }

    const std::vector<NativeHandle> snapshot = registry.SnapshotHandles();
    if (snapshot.size() != 2 || snapshot[0] != NativeHandle{ 0x10 } || snapshot[1] != NativeHandle{ 0x20 })
    {
        return 6;
    }

    if (!registry.Unregister(NativeHandle{ 0x10 }) || registry.Unregister(NativeHandle{ 0x10 }))
    {
        return 7;
    }
    if (registry.Lookup(NativeHandle{ 0x10 }) != nullptr || registry.Size() != 1)
    {
        return 8;
    }

    // A recycled handle value can be bound again once released.
    if (registry.Register(NativeHandle{ 0x10 }, second) != RegistryStatus::Ok ||
        registry.Lookup(NativeHandle{ 0x10 }) != second)
    {
        return 9;
    }

    registry.Clear();
    if (!registry.IsEmpty())
    {
        return 10;
    }

    return 0;
}
