#include "MinGui/Messages/EventTranslator.hpp"

namespace
{
    using namespace mingui::msg;

    static_assert(CategoryOf<SizePayload>() == EventCategory::Size);
    static_assert(CategoryOf<ControlColorPayload>() == EventCategory::ControlColor);
    static_assert(CategoryMask::All().Contains(EventCategory::Passthrough));
    static_assert(!CategoryMask::Of({ EventCategory::Command }).Contains(EventCategory::Paint));
    static_assert(HandlerResult::UseBrush(NativeHandle{ 3 }).IsHandled());

    void UseTranslator() noexcept
    {
        const TranslatedMessage translated = TranslateNativeMessage(NativeHandle{ 1 }, code::kPaint, 0, 0);
        (void)translated.Encode(HandlerResult::Handled());
        (void)EncoderFor(EventCategory::Timer);
        (void)IsKnownCode(code::kUser);
    }
}

static_assert(true, "Messages header-only TU compiles");
