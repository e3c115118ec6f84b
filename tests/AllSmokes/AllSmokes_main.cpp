// ============================================================================
// MinGui - tests/AllSmokes/AllSmokes_main.cpp
// ----------------------------------------------------------------------------
// Purpose : Aggregate executable that runs all smoke helpers.
// Contract: Deterministic ordering (Null backend only); returns 0 on success.
// Notes   : Assumes Run*Smoke helpers are linked from their respective TUs.
//           Each smoke that needs a GuiContext initializes and shuts down its
//           own, so they must run one after another.
// ============================================================================

#include <cstdio>

int RunHandleRegistrySmoke();
int RunEventTranslatorSmoke();
int RunNullNativeSmoke();
int RunClassRegistrarSmoke();
int RunWindowObjectSmoke();
int RunMessageLoopSmoke();
int RunGuiContextSmoke();

namespace
{
    int Report(const char* name, int result)
    {
        if (result != 0)
        {
            std::fprintf(stderr, "[AllSmokes] %s failed with code %d\n", name, result);
            return 1;
        }
        return 0;
    }
}

int main()
{
    int failures = 0;

    // Each smoke returns 0 on pass, non-zero on failure.
    failures += Report("HandleRegistry", RunHandleRegistrySmoke());
    failures += Report("EventTranslator", RunEventTranslatorSmoke());
    failures += Report("NullNative", RunNullNativeSmoke());
    failures += Report("ClassRegistrar", RunClassRegistrarSmoke());
    failures += Report("WindowObject", RunWindowObjectSmoke());
    failures += Report("MessageLoop", RunMessageLoopSmoke());
    failures += Report("GuiContext", RunGuiContextSmoke());

    return (failures == 0) ? 0 : 1;
}
