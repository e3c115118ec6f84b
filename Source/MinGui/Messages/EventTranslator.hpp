// ============================================================================
// MinGui - Source/MinGui/Messages/EventTranslator.hpp
// ----------------------------------------------------------------------------
// Purpose : Converts a raw native message into a typed Event and pairs it with
//           the reply encoder that maps the handler's HandlerResult back to
//           the native return value for that category.
// Contract: Never fails and never throws. Unknown codes decode to
//           PassthroughPayload whose encoder always defers. Malformed
//           parameter bits decode to the nearest safe value.
// Notes   : An encoder returning an empty optional means "call the default
//           window procedure".
// ============================================================================

#pragma once

#include "MinGui/Messages/Event.hpp"

#include <optional>

namespace mingui::msg
{
    using ReplyEncoder = std::optional<NativeResult> (*)(const HandlerResult& result) noexcept;

    struct TranslatedMessage
    {
        Event        event{};
        ReplyEncoder encoder = nullptr;

        [[nodiscard]] std::optional<NativeResult> Encode(const HandlerResult& result) const noexcept
        {
            return (encoder != nullptr) ? encoder(result) : std::nullopt;
        }
    };

    [[nodiscard]] TranslatedMessage TranslateNativeMessage(NativeHandle handle,
                                                           u32 code,
                                                           WordParam wParam,
                                                           LongParam lParam) noexcept;

    // Encoder used for every message of the given category.
    [[nodiscard]] ReplyEncoder EncoderFor(EventCategory category) noexcept;

    // True when the code has an entry in the decode table.
    [[nodiscard]] bool IsKnownCode(u32 code) noexcept;

} // namespace mingui::msg
