#include "MinGui/Messages/EventTranslator.hpp"

int RunEventTranslatorSmoke()
{
    using namespace mingui;
    using namespace mingui::msg;

    const NativeHandle window{ 0x100 };

    // Size: kind in wParam, width/height in lParam words.
    {
        const TranslatedMessage t = TranslateNativeMessage(window, code::kSize, size::kMaximized,
                                                           static_cast<LongParam>(PackWords(800, 600)));
        const SizePayload* payload = t.event.As<SizePayload>();
        if (payload == nullptr || payload->kind != SizeKind::Maximized || payload->width != 800 || payload->height != 600)
        {
            return 1;
        }
        if (t.event.handle != window || t.event.code != code::kSize)
        {
            return 2;
        }
        if (t.Encode(HandlerResult::Handled()) != NativeResult{ 0 } || t.Encode(HandlerResult::NotHandled()).has_value())
        {
            return 3;
        }
    }

    // Out-of-range size kind falls back to Restored.
    {
        const TranslatedMessage t = TranslateNativeMessage(window, code::kSize, 77, 0);
        const SizePayload* payload = t.event.As<SizePayload>();
        if (payload == nullptr || payload->kind != SizeKind::Restored)
        {
            return 4;
        }
    }

    // Mouse coordinates are signed.
    {
        const TranslatedMessage t = TranslateNativeMessage(window, code::kRButtonDblClk, mk::kShift | 0x8000u,
                                                           static_cast<LongParam>(PackPoint(-12, 34)));
        const MouseButtonPayload* payload = t.event.As<MouseButtonPayload>();
        if (payload == nullptr ||
            payload->button != MouseButton::Right ||
            payload->action != ButtonAction::DoubleClick ||
            payload->x != -12 || payload->y != 34 ||
            !payload->modifiers.Has(MouseFlag::Shift) ||
            payload->modifiers.bits != mk::kShift)
        {
            return 5;
        }
    }

    // Wheel delta lives in the high word of wParam.
    {
        const WordParam wParam = PackWords(static_cast<u16>(mk::kControl), static_cast<u16>(-kWheelDelta));
        const TranslatedMessage t = TranslateNativeMessage(window, code::kMouseWheel, wParam,
                                                           static_cast<LongParam>(PackPoint(300, 200)));
        const MouseWheelPayload* payload = t.event.As<MouseWheelPayload>();
        if (payload == nullptr || payload->horizontal || payload->delta != -kWheelDelta ||
            payload->x != 300 || payload->y != 200 || !payload->modifiers.Has(MouseFlag::Control))
        {
            return 6;
        }
    }

    // Key flags: repeat count, scan code, extended, previous state.
    {
        const LongParam lParam = static_cast<LongParam>(3u | (0x1Cu << 16u) | (1u << 24u) | (1u << 30u));
        const TranslatedMessage t = TranslateNativeMessage(window, code::kSysKeyDown, 0x0D, lParam);
        const KeyPayload* payload = t.event.As<KeyPayload>();
        if (payload == nullptr || payload->virtualKey != 0x0D || !payload->pressed || !payload->system ||
            payload->repeatCount != 3 || payload->scanCode != 0x1C || !payload->extended || !payload->previouslyDown)
        {
            return 7;
        }
    }

    // Command source: control handle wins, then accelerator, then menu.
    {
        const TranslatedMessage fromControl = TranslateNativeMessage(window, code::kCommand, PackWords(42, 0), 0x200);
        const TranslatedMessage fromAccel   = TranslateNativeMessage(window, code::kCommand, PackWords(43, 1), 0);
        const TranslatedMessage fromMenu    = TranslateNativeMessage(window, code::kCommand, PackWords(44, 0), 0);
        const CommandPayload* control = fromControl.event.As<CommandPayload>();
        const CommandPayload* accel   = fromAccel.event.As<CommandPayload>();
        const CommandPayload* menu    = fromMenu.event.As<CommandPayload>();
        if (control == nullptr || accel == nullptr || menu == nullptr ||
            control->source != CommandSource::Control || control->id != 42 || control->control != NativeHandle{ 0x200 } ||
            accel->source != CommandSource::Accelerator || accel->id != 43 ||
            menu->source != CommandSource::Menu || menu->id != 44)
        {
            return 8;
        }
    }

    // Create: Handled continues, AbortCreation cancels, otherwise default.
    {
        native::NativeCreateParams params{};
        params.parent    = NativeHandle{ 0x300 };
        params.controlId = 9;
        const TranslatedMessage t = TranslateNativeMessage(window, code::kCreate, 0, reinterpret_cast<LongParam>(&params));
        const CreatePayload* payload = t.event.As<CreatePayload>();
        if (payload == nullptr || payload->parent != NativeHandle{ 0x300 } || payload->controlId != 9)
        {
            return 9;
        }
        if (t.Encode(HandlerResult::Handled()) != NativeResult{ 0 } ||
            t.Encode(HandlerResult::AbortCreation()) != NativeResult{ -1 } ||
            t.Encode(HandlerResult::NotHandled()).has_value())
        {
            return 10;
        }
    }

    // EraseBackground reports non-zero when handled.
    {
        const TranslatedMessage t = TranslateNativeMessage(window, code::kEraseBkgnd, 0x400, 0);
        if (t.Encode(HandlerResult::Handled()) != NativeResult{ 1 } || t.Encode(HandlerResult::NotHandled()).has_value())
        {
            return 11;
        }
    }

    // ControlColor only answers with a valid brush.
    {
        const TranslatedMessage t = TranslateNativeMessage(window, code::kCtlColorStatic, 0x500, 0x600);
        const ControlColorPayload* payload = t.event.As<ControlColorPayload>();
        if (payload == nullptr || payload->kind != ControlColorKind::Static ||
            payload->deviceContext != NativeHandle{ 0x500 } || payload->control != NativeHandle{ 0x600 })
        {
            return 12;
        }
        if (t.Encode(HandlerResult::UseBrush(NativeHandle{ 0x700 })) != NativeResult{ 0x700 } ||
            t.Encode(HandlerResult::UseBrush(NativeHandle::Invalid())).has_value() ||
            t.Encode(HandlerResult::Handled()).has_value())
        {
            return 13;
        }
    }

    // Unknown codes pass through untouched and always defer.
    {
        constexpr u32 kPrivate = code::kUser + 5;
        if (IsKnownCode(kPrivate) || !IsKnownCode(code::kTimer))
        {
            return 14;
        }
        const TranslatedMessage t = TranslateNativeMessage(window, kPrivate, 11, -22);
        const PassthroughPayload* payload = t.event.As<PassthroughPayload>();
        if (t.event.Category() != EventCategory::Passthrough || payload == nullptr ||
            payload->code != kPrivate || payload->wParam != 11 || payload->lParam != -22)
        {
            return 15;
        }
        if (t.Encode(HandlerResult::Handled()).has_value() || t.Encode(HandlerResult::UseBrush(NativeHandle{ 1 })).has_value())
        {
            return 16;
        }
    }

    // Focus direction and the other window.
    {
        const TranslatedMessage gained = TranslateNativeMessage(window, code::kSetFocus, 0x800, 0);
        const TranslatedMessage lost   = TranslateNativeMessage(window, code::kKillFocus, 0, 0);
        const FocusPayload* in  = gained.event.As<FocusPayload>();
        const FocusPayload* out = lost.event.As<FocusPayload>();
        if (in == nullptr || out == nullptr || !in->gained || in->other != NativeHandle{ 0x800 } || out->gained)
        {
            return 17;
        }
    }

    // Timer id and Char code unit.
    {
        const TranslatedMessage timer = TranslateNativeMessage(window, code::kTimer, 7, 0);
        const TranslatedMessage ch    = TranslateNativeMessage(window, code::kChar, 0x00E9, 2);
        const TimerPayload* timerPayload = timer.event.As<TimerPayload>();
        const CharPayload*  charPayload  = ch.event.As<CharPayload>();
        if (timerPayload == nullptr || timerPayload->id != 7 ||
            charPayload == nullptr || charPayload->codeUnit != 0x00E9 || charPayload->repeatCount != 2)
        {
            return 18;
        }
    }

    return 0;
}
