// ============================================================================
// MinGui - Source/MinGui/Loop/MessageLoop.cpp
// ============================================================================

#include "MinGui/Loop/MessageLoop.hpp"

#include "MinGui/Diagnostics/Check.hpp"
#include "MinGui/Logger.hpp"
#include "MinGui/Runtime/GuiContext.hpp"

namespace mingui::loop
{

LoopStatus MessageLoop::Run(i32& outExitCode) noexcept
{
    outExitCode = 0;

    if (!m_Context->isInitialized)
    {
        return LoopStatus::NotInitialized;
    }
    if (!m_Context->IsOwnerThread())
    {
        MINGUI_CHECK_FAILED("Loop", "Run called off the GUI thread");
        return LoopStatus::WrongThread;
    }

    native::NativeInterface& os = m_Context->nativeInterface;
    native::NativeMessage message{};

    for (;;)
    {
        switch (native::GetNextMessage(os, message))
        {
            case native::GetMessageResult::Message:
            {
                (void)native::DispatchNativeMessage(os, message);
                ++m_DispatchedCount;
                break;
            }
            case native::GetMessageResult::Quit:
            {
                outExitCode = static_cast<i32>(message.wParam);
                MINGUI_LOG_INFO("Loop", "Quit observed after {} messages, exit code {}", m_DispatchedCount, outExitCode);
                return LoopStatus::Ok;
            }
            case native::GetMessageResult::Failed:
            default:
            {
                m_LastOsError = native::GetLastOsError(os);
                MINGUI_LOG_ERROR("Loop", "Message retrieval failed (os error {})", m_LastOsError);
                return LoopStatus::RetrievalFailed;
            }
        }
    }
}

void MessageLoop::PostQuit(i32 exitCode) noexcept
{
    if (!m_Context->isInitialized)
    {
        return;
    }
    MINGUI_CHECK(m_Context->IsOwnerThread());
    native::PostQuit(m_Context->nativeInterface, exitCode);
}

} // namespace mingui::loop
