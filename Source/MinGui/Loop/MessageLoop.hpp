// ============================================================================
// MinGui - Source/MinGui/Loop/MessageLoop.hpp
// ----------------------------------------------------------------------------
// Purpose : Run-until-quit pump: retrieves queued native messages and hands
//           them back to the OS for dispatch to the trampoline chain.
// Contract: Run() executes on the context's owner thread. Retrieval is the
//           only suspension point. The exit code reported is the quit
//           request's code, unchanged. A retrieval failure that is not a
//           quit ends the loop with RetrievalFailed.
// Notes   : Handlers run to completion; there is no mid-dispatch cancel.
// ============================================================================

#pragma once

#include "MinGui/Contracts/Native.hpp"

namespace mingui::runtime
{
    struct GuiContext;
}

namespace mingui::loop
{
    enum class LoopStatus : u8
    {
        Ok = 0,
        RetrievalFailed,
        WrongThread,
        NotInitialized
    };

    [[nodiscard]] constexpr const char* ToString(LoopStatus status) noexcept
    {
        switch (status)
        {
            case LoopStatus::Ok:              return "Ok";
            case LoopStatus::RetrievalFailed: return "RetrievalFailed";
            case LoopStatus::WrongThread:     return "WrongThread";
            case LoopStatus::NotInitialized:  return "NotInitialized";
            default:                          return "Unknown";
        }
    }

    class MessageLoop
    {
    public:
        explicit MessageLoop(runtime::GuiContext& context) noexcept
            : m_Context(&context)
        {
        }

        [[nodiscard]] LoopStatus Run(i32& outExitCode) noexcept;

        // Asks the OS to end the loop once the queue drains.
        void PostQuit(i32 exitCode) noexcept;

        [[nodiscard]] native::OsErrorCode GetLastOsError() const noexcept { return m_LastOsError; }
        [[nodiscard]] u64 GetDispatchedCount() const noexcept { return m_DispatchedCount; }

    private:
        runtime::GuiContext* m_Context = nullptr;
        native::OsErrorCode  m_LastOsError = native::os_error::kNone;
        u64                  m_DispatchedCount = 0;
    };

} // namespace mingui::loop
