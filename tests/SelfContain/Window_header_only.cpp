#include "MinGui/Window/HandleRegistry.hpp"
#include "MinGui/Window/ClassRegistrar.hpp"
#include "MinGui/Window/Trampoline.hpp"
#include "MinGui/Window/WindowObject.hpp"
#include "MinGui/Window/Menu.hpp"
#include "MinGui/Window/Controls.hpp"
#include "MinGui/Window/PaintSession.hpp"

namespace
{
    using namespace mingui::win;

    static_assert(SystemClassName(SystemClass::ListBox) == "ListBox");
    static_assert(!ClassToken{}.IsValid());
    static_assert(!kControlCapabilities.Contains(EventCategory::Paint));

    void UseWindowTypes() noexcept
    {
        HandleRegistry registry{};
        (void)registry.Lookup(NativeHandle{ 1 });

        CreateParams params{};
        params.WithRect(mingui::Rect::FromXYWH(0, 0, 100, 100));
        (void)ToString(WindowStatus::CreationFailed);

        Menu menu;
        (void)menu.IsValid();

        PaintSession paint;
        (void)paint.IsActive();
    }
}

static_assert(true, "Window header-only TU compiles");
