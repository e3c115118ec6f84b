// ============================================================================
// MinGui - Source/MinGui/Messages/EventTranslator.cpp
// ----------------------------------------------------------------------------
// Purpose : Static decode table (code -> decoder + category) and the reply
//           encoders for each category.
// Contract: Table is sorted by code; lookups are binary searches. Decoders
//           only do integer arithmetic on the parameters, except Create,
//           which reads the NativeCreateParams the backend passes in lParam.
// ============================================================================

#include "MinGui/Messages/EventTranslator.hpp"

#include <algorithm>
#include <array>

namespace mingui::msg
{
namespace
{
    using DecodeFn = EventPayload (*)(u32 messageCode, WordParam wParam, LongParam lParam) noexcept;

    struct DecodeEntry
    {
        u32           code = 0;
        EventCategory category = EventCategory::Passthrough;
        DecodeFn      decode = nullptr;
    };

    [[nodiscard]] constexpr u64 Bits(LongParam value) noexcept
    {
        return static_cast<u64>(static_cast<usize>(value));
    }

    [[nodiscard]] constexpr u64 Bits(WordParam value) noexcept
    {
        return static_cast<u64>(value);
    }

    // ------------------------------------------------------------------------
    // Decoders
    // ------------------------------------------------------------------------

    EventPayload DecodeCreate(u32, WordParam, LongParam lParam) noexcept
    {
        CreatePayload payload{};
        const auto* params = reinterpret_cast<const native::NativeCreateParams*>(lParam);
        if (params != nullptr)
        {
            payload.parent    = params->parent;
            payload.controlId = params->controlId;
            payload.className = params->className;
            payload.userParam = params->userParam;
        }
        return payload;
    }

    EventPayload DecodeDestroy(u32, WordParam, LongParam) noexcept
    {
        return DestroyPayload{};
    }

    EventPayload DecodeClose(u32, WordParam, LongParam) noexcept
    {
        return ClosePayload{};
    }

    EventPayload DecodePaint(u32, WordParam, LongParam) noexcept
    {
        return PaintPayload{};
    }

    EventPayload DecodeEraseBackground(u32, WordParam wParam, LongParam) noexcept
    {
        return EraseBackgroundPayload{ NativeHandle{ Bits(wParam) } };
    }

    EventPayload DecodeSize(u32, WordParam wParam, LongParam lParam) noexcept
    {
        SizePayload payload{};
        payload.kind   = (wParam <= size::kMaxHide) ? static_cast<SizeKind>(wParam) : SizeKind::Restored;
        payload.width  = static_cast<i32>(LowWord(Bits(lParam)));
        payload.height = static_cast<i32>(HighWord(Bits(lParam)));
        return payload;
    }

    EventPayload DecodeMove(u32, WordParam, LongParam lParam) noexcept
    {
        return MovePayload{ SignedLowWord(Bits(lParam)), SignedHighWord(Bits(lParam)) };
    }

    EventPayload DecodeMouseButton(u32 messageCode, WordParam wParam, LongParam lParam) noexcept
    {
        MouseButtonPayload payload{};
        switch (messageCode)
        {
            case code::kLButtonDown:   payload.button = MouseButton::Left;   payload.action = ButtonAction::Down;        break;
            case code::kLButtonUp:     payload.button = MouseButton::Left;   payload.action = ButtonAction::Up;          break;
            case code::kLButtonDblClk: payload.button = MouseButton::Left;   payload.action = ButtonAction::DoubleClick; break;
            case code::kRButtonDown:   payload.button = MouseButton::Right;  payload.action = ButtonAction::Down;        break;
            case code::kRButtonUp:     payload.button = MouseButton::Right;  payload.action = ButtonAction::Up;          break;
            case code::kRButtonDblClk: payload.button = MouseButton::Right;  payload.action = ButtonAction::DoubleClick; break;
            case code::kMButtonDown:   payload.button = MouseButton::Middle; payload.action = ButtonAction::Down;        break;
            case code::kMButtonUp:     payload.button = MouseButton::Middle; payload.action = ButtonAction::Up;          break;
            case code::kMButtonDblClk: payload.button = MouseButton::Middle; payload.action = ButtonAction::DoubleClick; break;
            default: break;
        }
        payload.x         = SignedLowWord(Bits(lParam));
        payload.y         = SignedHighWord(Bits(lParam));
        payload.modifiers = MouseModifiers::FromRaw(Bits(wParam));
        return payload;
    }

    EventPayload DecodeMouseMove(u32, WordParam wParam, LongParam lParam) noexcept
    {
        MouseMovePayload payload{};
        payload.x         = SignedLowWord(Bits(lParam));
        payload.y         = SignedHighWord(Bits(lParam));
        payload.modifiers = MouseModifiers::FromRaw(Bits(wParam));
        return payload;
    }

    EventPayload DecodeMouseWheel(u32 messageCode, WordParam wParam, LongParam lParam) noexcept
    {
        MouseWheelPayload payload{};
        payload.horizontal = (messageCode == code::kMouseHWheel);
        payload.delta      = SignedHighWord(Bits(wParam));
        payload.x          = SignedLowWord(Bits(lParam));
        payload.y          = SignedHighWord(Bits(lParam));
        payload.modifiers  = MouseModifiers::FromRaw(LowWord(Bits(wParam)));
        return payload;
    }

    EventPayload DecodeKey(u32 messageCode, WordParam wParam, LongParam lParam) noexcept
    {
        const u64 bits = Bits(lParam);

        KeyPayload payload{};
        payload.virtualKey     = static_cast<u32>(LowWord(Bits(wParam)));
        payload.pressed        = (messageCode == code::kKeyDown || messageCode == code::kSysKeyDown);
        payload.system         = (messageCode == code::kSysKeyDown || messageCode == code::kSysKeyUp);
        payload.repeatCount    = LowWord(bits);
        payload.scanCode       = static_cast<u8>((bits >> 16u) & 0xFFu);
        payload.extended       = ((bits >> 24u) & 1u) != 0;
        payload.previouslyDown = ((bits >> 30u) & 1u) != 0;
        return payload;
    }

    EventPayload DecodeChar(u32, WordParam wParam, LongParam lParam) noexcept
    {
        return CharPayload{ LowWord(Bits(wParam)), LowWord(Bits(lParam)) };
    }

    EventPayload DecodeCommand(u32, WordParam wParam, LongParam lParam) noexcept
    {
        CommandPayload payload{};
        payload.id         = LowWord(Bits(wParam));
        payload.notifyCode = HighWord(Bits(wParam));
        payload.control    = NativeHandle{ Bits(lParam) };

        if (payload.control.IsValid())
        {
            payload.source = CommandSource::Control;
        }
        else if (payload.notifyCode == 1)
        {
            payload.source = CommandSource::Accelerator;
        }
        else
        {
            // Menu selections carry 0; any other code without a control is
            // malformed and treated as a menu selection.
            payload.source = CommandSource::Menu;
        }
        return payload;
    }

    EventPayload DecodeTimer(u32, WordParam wParam, LongParam) noexcept
    {
        return TimerPayload{ static_cast<TimerId>(wParam) };
    }

    EventPayload DecodeFocus(u32 messageCode, WordParam wParam, LongParam) noexcept
    {
        return FocusPayload{ messageCode == code::kSetFocus, NativeHandle{ Bits(wParam) } };
    }

    EventPayload DecodeControlColor(u32 messageCode, WordParam wParam, LongParam lParam) noexcept
    {
        ControlColorPayload payload{};
        switch (messageCode)
        {
            case code::kCtlColorEdit: payload.kind = ControlColorKind::Edit;   break;
            case code::kCtlColorBtn:  payload.kind = ControlColorKind::Button; break;
            case code::kCtlColorDlg:  payload.kind = ControlColorKind::Dialog; break;
            default:                  payload.kind = ControlColorKind::Static; break;
        }
        payload.deviceContext = NativeHandle{ Bits(wParam) };
        payload.control       = NativeHandle{ Bits(lParam) };
        return payload;
    }

    EventPayload DecodePassthrough(u32 messageCode, WordParam wParam, LongParam lParam) noexcept
    {
        return PassthroughPayload{ messageCode, wParam, lParam };
    }

    constexpr std::array<DecodeEntry, 32> kDecodeTable = { {
        { code::kCreate,          EventCategory::Create,          &DecodeCreate },
        { code::kDestroy,         EventCategory::Destroy,         &DecodeDestroy },
        { code::kMove,            EventCategory::Move,            &DecodeMove },
        { code::kSize,            EventCategory::Size,            &DecodeSize },
        { code::kSetFocus,        EventCategory::Focus,           &DecodeFocus },
        { code::kKillFocus,       EventCategory::Focus,           &DecodeFocus },
        { code::kPaint,           EventCategory::Paint,           &DecodePaint },
        { code::kClose,           EventCategory::Close,           &DecodeClose },
        { code::kEraseBkgnd,      EventCategory::EraseBackground, &DecodeEraseBackground },
        { code::kKeyDown,         EventCategory::Key,             &DecodeKey },
        { code::kKeyUp,           EventCategory::Key,             &DecodeKey },
        { code::kChar,            EventCategory::Char,            &DecodeChar },
        { code::kSysKeyDown,      EventCategory::Key,             &DecodeKey },
        { code::kSysKeyUp,        EventCategory::Key,             &DecodeKey },
        { code::kCommand,         EventCategory::Command,         &DecodeCommand },
        { code::kTimer,           EventCategory::Timer,           &DecodeTimer },
        { code::kCtlColorEdit,    EventCategory::ControlColor,    &DecodeControlColor },
        { code::kCtlColorBtn,     EventCategory::ControlColor,    &DecodeControlColor },
        { code::kCtlColorDlg,     EventCategory::ControlColor,    &DecodeControlColor },
        { code::kCtlColorStatic,  EventCategory::ControlColor,    &DecodeControlColor },
        { code::kMouseMove,       EventCategory::MouseMove,       &DecodeMouseMove },
        { code::kLButtonDown,     EventCategory::MouseButton,     &DecodeMouseButton },
        { code::kLButtonUp,       EventCategory::MouseButton,     &DecodeMouseButton },
        { code::kLButtonDblClk,   EventCategory::MouseButton,     &DecodeMouseButton },
        { code::kRButtonDown,     EventCategory::MouseButton,     &DecodeMouseButton },
        { code::kRButtonUp,       EventCategory::MouseButton,     &DecodeMouseButton },
        { code::kRButtonDblClk,   EventCategory::MouseButton,     &DecodeMouseButton },
        { code::kMButtonDown,     EventCategory::MouseButton,     &DecodeMouseButton },
        { code::kMButtonUp,       EventCategory::MouseButton,     &DecodeMouseButton },
        { code::kMButtonDblClk,   EventCategory::MouseButton,     &DecodeMouseButton },
        { code::kMouseWheel,      EventCategory::MouseWheel,      &DecodeMouseWheel },
        { code::kMouseHWheel,     EventCategory::MouseWheel,      &DecodeMouseWheel },
    } };

    [[nodiscard]] constexpr bool IsSortedByCode() noexcept
    {
        for (usize i = 1; i < kDecodeTable.size(); ++i)
        {
            if (kDecodeTable[i - 1].code >= kDecodeTable[i].code)
            {
                return false;
            }
        }
        return true;
    }

    static_assert(IsSortedByCode(), "kDecodeTable must be sorted by code without duplicates.");

    [[nodiscard]] const DecodeEntry* FindEntry(u32 code) noexcept
    {
        const auto it = std::lower_bound(kDecodeTable.begin(), kDecodeTable.end(), code,
                                         [](const DecodeEntry& entry, u32 value) { return entry.code < value; });
        if (it == kDecodeTable.end() || it->code != code)
        {
            return nullptr;
        }
        return &*it;
    }

    // ------------------------------------------------------------------------
    // Encoders
    // ------------------------------------------------------------------------

    std::optional<NativeResult> EncodeCreate(const HandlerResult& result) noexcept
    {
        switch (result.kind)
        {
            case HandlerResultKind::Handled:       return NativeResult{ 0 };
            case HandlerResultKind::AbortCreation: return NativeResult{ -1 };
            default:                               return std::nullopt;
        }
    }

    std::optional<NativeResult> EncodeEraseBackground(const HandlerResult& result) noexcept
    {
        if (result.kind == HandlerResultKind::Handled)
        {
            return NativeResult{ 1 };
        }
        return std::nullopt;
    }

    std::optional<NativeResult> EncodeControlColor(const HandlerResult& result) noexcept
    {
        if (result.kind == HandlerResultKind::UseBrush && result.brush.IsValid())
        {
            return static_cast<NativeResult>(static_cast<usize>(result.brush.value));
        }
        return std::nullopt;
    }

    std::optional<NativeResult> EncodeHandledAsZero(const HandlerResult& result) noexcept
    {
        if (result.kind == HandlerResultKind::Handled)
        {
            return NativeResult{ 0 };
        }
        return std::nullopt;
    }

    std::optional<NativeResult> EncodePassthrough(const HandlerResult&) noexcept
    {
        return std::nullopt;
    }
} // namespace

ReplyEncoder EncoderFor(EventCategory category) noexcept
{
    switch (category)
    {
        case EventCategory::Create:          return &EncodeCreate;
        case EventCategory::EraseBackground: return &EncodeEraseBackground;
        case EventCategory::ControlColor:    return &EncodeControlColor;
        case EventCategory::Passthrough:     return &EncodePassthrough;
        case EventCategory::Count:           return &EncodePassthrough;
        default:                             return &EncodeHandledAsZero;
    }
}

bool IsKnownCode(u32 code) noexcept
{
    return FindEntry(code) != nullptr;
}

TranslatedMessage TranslateNativeMessage(NativeHandle handle, u32 code, WordParam wParam, LongParam lParam) noexcept
{
    TranslatedMessage translated{};
    translated.event.handle = handle;
    translated.event.code   = code;

    const DecodeEntry* entry = FindEntry(code);
    if (entry == nullptr)
    {
        translated.event.payload = DecodePassthrough(code, wParam, lParam);
        translated.encoder       = EncoderFor(EventCategory::Passthrough);
        return translated;
    }

    translated.event.payload = entry->decode(code, wParam, lParam);
    translated.encoder       = EncoderFor(entry->category);
    return translated;
}

} // namespace mingui::msg
