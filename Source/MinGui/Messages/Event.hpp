// ============================================================================
// MinGui - Source/MinGui/Messages/Event.hpp
// ----------------------------------------------------------------------------
// Purpose : Typed event model delivered to window handlers, plus the
//           HandlerResult a handler returns.
// Contract: Header-only. Payloads are trivially copyable. EventPayload lists
//           one alternative per EventCategory, in category order, so the
//           variant index is the category.
// Notes   : Coordinates are signed and already unpacked; flag sets only carry
//           bits MinGui knows about.
// ============================================================================

#pragma once

#include "MinGui/Contracts/Native.hpp"
#include "MinGui/Messages/MessageCodes.hpp"

#include <initializer_list>
#include <type_traits>
#include <variant>

namespace mingui::msg
{
    using native::LongParam;
    using native::NativeHandle;
    using native::NativeResult;
    using native::TextView;
    using native::TimerId;
    using native::WordParam;

    enum class EventCategory : u8
    {
        Create = 0,
        Destroy,
        Close,
        Paint,
        EraseBackground,
        Size,
        Move,
        MouseButton,
        MouseMove,
        MouseWheel,
        Key,
        Char,
        Command,
        Timer,
        Focus,
        ControlColor,
        Passthrough,
        Count
    };

    inline constexpr usize kEventCategoryCount = static_cast<usize>(EventCategory::Count);

    [[nodiscard]] constexpr const char* ToString(EventCategory category) noexcept
    {
        switch (category)
        {
            case EventCategory::Create:          return "Create";
            case EventCategory::Destroy:         return "Destroy";
            case EventCategory::Close:           return "Close";
            case EventCategory::Paint:           return "Paint";
            case EventCategory::EraseBackground: return "EraseBackground";
            case EventCategory::Size:            return "Size";
            case EventCategory::Move:            return "Move";
            case EventCategory::MouseButton:     return "MouseButton";
            case EventCategory::MouseMove:       return "MouseMove";
            case EventCategory::MouseWheel:      return "MouseWheel";
            case EventCategory::Key:             return "Key";
            case EventCategory::Char:            return "Char";
            case EventCategory::Command:         return "Command";
            case EventCategory::Timer:           return "Timer";
            case EventCategory::Focus:           return "Focus";
            case EventCategory::ControlColor:    return "ControlColor";
            case EventCategory::Passthrough:     return "Passthrough";
            default:                             return "Unknown";
        }
    }

    // Bit set of categories a window accepts subscriptions for.
    struct CategoryMask
    {
        u32 bits = 0;

        [[nodiscard]] static constexpr CategoryMask All() noexcept
        {
            return CategoryMask{ (1u << kEventCategoryCount) - 1u };
        }

        [[nodiscard]] static constexpr CategoryMask Of(std::initializer_list<EventCategory> categories) noexcept
        {
            CategoryMask mask{};
            for (EventCategory category : categories)
            {
                mask.bits |= 1u << static_cast<u32>(category);
            }
            return mask;
        }

        [[nodiscard]] constexpr bool Contains(EventCategory category) const noexcept
        {
            return category < EventCategory::Count && (bits & (1u << static_cast<u32>(category))) != 0;
        }
    };

    // ------------------------------------------------------------------------
    // Payload pieces
    // ------------------------------------------------------------------------

    enum class MouseFlag : u32
    {
        LeftButton   = mk::kLButton,
        RightButton  = mk::kRButton,
        Shift        = mk::kShift,
        Control      = mk::kControl,
        MiddleButton = mk::kMButton,
        XButton1     = mk::kXButton1,
        XButton2     = mk::kXButton2
    };

    struct MouseModifiers
    {
        u32 bits = 0;

        // Unknown bits are dropped.
        [[nodiscard]] static constexpr MouseModifiers FromRaw(u64 raw) noexcept
        {
            return MouseModifiers{ static_cast<u32>(raw) & mk::kAll };
        }

        [[nodiscard]] constexpr bool Has(MouseFlag flag) const noexcept
        {
            return (bits & static_cast<u32>(flag)) != 0;
        }

        [[nodiscard]] friend constexpr bool operator==(MouseModifiers, MouseModifiers) noexcept = default;
    };

    enum class SizeKind : u8
    {
        Restored = 0,
        Minimized,
        Maximized,
        MaxShow,
        MaxHide
    };

    enum class MouseButton : u8
    {
        Left = 0,
        Right,
        Middle
    };

    enum class ButtonAction : u8
    {
        Down = 0,
        Up,
        DoubleClick
    };

    enum class CommandSource : u8
    {
        Menu = 0,
        Accelerator,
        Control
    };

    enum class ControlColorKind : u8
    {
        Edit = 0,
        Button,
        Dialog,
        Static
    };

    // ------------------------------------------------------------------------
    // Payloads (one per category, same order as EventCategory)
    // ------------------------------------------------------------------------

    struct CreatePayload
    {
        NativeHandle parent{};
        u16          controlId = 0;
        TextView     className{}; // Valid only during the handler call.
        void*        userParam = nullptr;
    };

    struct DestroyPayload {};
    struct ClosePayload {};
    struct PaintPayload {};

    struct EraseBackgroundPayload
    {
        NativeHandle deviceContext{};
    };

    struct SizePayload
    {
        SizeKind kind   = SizeKind::Restored;
        i32      width  = 0;
        i32      height = 0;
    };

    struct MovePayload
    {
        i32 x = 0;
        i32 y = 0;
    };

    struct MouseButtonPayload
    {
        MouseButton    button = MouseButton::Left;
        ButtonAction   action = ButtonAction::Down;
        i32            x = 0;
        i32            y = 0;
        MouseModifiers modifiers{};
    };

    struct MouseMovePayload
    {
        i32            x = 0;
        i32            y = 0;
        MouseModifiers modifiers{};
    };

    struct MouseWheelPayload
    {
        bool           horizontal = false;
        i32            delta = 0; // Multiples of kWheelDelta per notch.
        i32            x = 0;     // Screen coordinates.
        i32            y = 0;
        MouseModifiers modifiers{};
    };

    struct KeyPayload
    {
        u32  virtualKey = 0;
        bool pressed = false;
        bool system = false;
        u16  repeatCount = 0;
        u8   scanCode = 0;
        bool extended = false;
        bool previouslyDown = false;
    };

    struct CharPayload
    {
        u16 codeUnit = 0; // UTF-16 code unit.
        u16 repeatCount = 0;
    };

    struct CommandPayload
    {
        CommandSource source = CommandSource::Menu;
        u16           id = 0;
        u16           notifyCode = 0;
        NativeHandle  control{};
    };

    struct TimerPayload
    {
        TimerId id = 0;
    };

    struct FocusPayload
    {
        bool         gained = false;
        NativeHandle other{};
    };

    struct ControlColorPayload
    {
        ControlColorKind kind = ControlColorKind::Static;
        NativeHandle     deviceContext{};
        NativeHandle     control{};
    };

    struct PassthroughPayload
    {
        u32       code = 0;
        WordParam wParam = 0;
        LongParam lParam = 0;
    };

    using EventPayload = std::variant<CreatePayload,
                                      DestroyPayload,
                                      ClosePayload,
                                      PaintPayload,
                                      EraseBackgroundPayload,
                                      SizePayload,
                                      MovePayload,
                                      MouseButtonPayload,
                                      MouseMovePayload,
                                      MouseWheelPayload,
                                      KeyPayload,
                                      CharPayload,
                                      CommandPayload,
                                      TimerPayload,
                                      FocusPayload,
                                      ControlColorPayload,
                                      PassthroughPayload>;

    static_assert(std::variant_size_v<EventPayload> == kEventCategoryCount,
                  "EventPayload must list exactly one payload per category.");

    namespace detail
    {
        template <typename T, typename Variant>
        struct VariantIndexOf;

        template <typename T, typename... Ts>
        struct VariantIndexOf<T, std::variant<Ts...>>
        {
            static constexpr usize value = []() constexpr {
                constexpr bool matches[] = { std::is_same_v<T, Ts>... };
                for (usize i = 0; i < sizeof...(Ts); ++i)
                {
                    if (matches[i])
                    {
                        return i;
                    }
                }
                return sizeof...(Ts);
            }();
        };
    } // namespace detail

    template <typename Payload>
    inline constexpr bool kIsEventPayload = detail::VariantIndexOf<Payload, EventPayload>::value < kEventCategoryCount;

    template <typename Payload>
    [[nodiscard]] constexpr EventCategory CategoryOf() noexcept
    {
        static_assert(kIsEventPayload<Payload>, "Payload is not an EventPayload alternative.");
        return static_cast<EventCategory>(detail::VariantIndexOf<Payload, EventPayload>::value);
    }

    static_assert(CategoryOf<CreatePayload>() == EventCategory::Create);
    static_assert(CategoryOf<TimerPayload>() == EventCategory::Timer);
    static_assert(CategoryOf<PassthroughPayload>() == EventCategory::Passthrough);

    struct Event
    {
        NativeHandle handle{};
        u32          code = 0; // Raw native code the event was decoded from.
        EventPayload payload{ PassthroughPayload{} };

        [[nodiscard]] EventCategory Category() const noexcept
        {
            return static_cast<EventCategory>(payload.index());
        }

        template <typename Payload>
        [[nodiscard]] const Payload* As() const noexcept
        {
            return std::get_if<Payload>(&payload);
        }
    };

    // ------------------------------------------------------------------------
    // Handler result
    // ------------------------------------------------------------------------

    enum class HandlerResultKind : u8
    {
        NotHandled = 0,
        Handled,
        AbortCreation, // Create only.
        UseBrush       // ControlColor only.
    };

    struct HandlerResult
    {
        HandlerResultKind kind = HandlerResultKind::NotHandled;
        NativeHandle      brush{};

        [[nodiscard]] static constexpr HandlerResult NotHandled() noexcept { return HandlerResult{}; }
        [[nodiscard]] static constexpr HandlerResult Handled() noexcept { return HandlerResult{ HandlerResultKind::Handled, {} }; }
        [[nodiscard]] static constexpr HandlerResult AbortCreation() noexcept { return HandlerResult{ HandlerResultKind::AbortCreation, {} }; }
        [[nodiscard]] static constexpr HandlerResult UseBrush(NativeHandle brush) noexcept { return HandlerResult{ HandlerResultKind::UseBrush, brush }; }

        [[nodiscard]] constexpr bool IsHandled() const noexcept { return kind != HandlerResultKind::NotHandled; }
    };

} // namespace mingui::msg
