#include "MinGui/Native/NullNative.hpp"
#include "MinGui/Contracts/NativeStyles.hpp"
#include "MinGui/Messages/MessageCodes.hpp"

#include <vector>

namespace
{
    using namespace mingui;
    using namespace mingui::native;

    struct ProcRecord
    {
        NativeHandle handle{};
        u32          code = 0;
    };

    std::vector<ProcRecord> s_Records;
    bool                    s_RefuseCreate = false;
    NullNative*             s_Backend = nullptr;

    NativeResult RecordingProc(NativeHandle handle, u32 code, WordParam wParam, LongParam lParam) noexcept
    {
        s_Records.push_back(ProcRecord{ handle, code });
        if (code == msg::code::kCreate && s_RefuseCreate)
        {
            return -1;
        }
        return s_Backend->CallDefaultProc(handle, code, wParam, lParam);
    }

    [[nodiscard]] usize CountCode(NativeHandle handle, u32 code) noexcept
    {
        usize count = 0;
        for (const ProcRecord& record : s_Records)
        {
            if (record.handle == handle && record.code == code)
            {
                ++count;
            }
        }
        return count;
    }

    [[nodiscard]] NativeWindowDesc MakeDesc(std::string_view className, NativeHandle parent = {}, u16 controlId = 0) noexcept
    {
        NativeWindowDesc desc{};
        desc.className = MakeTextView(className);
        desc.title     = MakeTextView("null");
        desc.style     = parent.IsValid() ? (WindowStyle::kChild | WindowStyle::kVisible) : WindowStyle::kOverlappedWindow;
        desc.x         = kUseDefault;
        desc.y         = kUseDefault;
        desc.width     = kUseDefault;
        desc.height    = kUseDefault;
        desc.parent    = parent;
        desc.controlId = controlId;
        return desc;
    }
}

int RunNullNativeSmoke()
{
    s_Records.clear();
    s_RefuseCreate = false;

    NullNativeConfig config{};
    config.maxWindows = 4;
    NullNative backend(config);
    s_Backend = &backend;

    NativeInterface os = MakeNullNativeInterface(backend);
    if (!IsComplete(os))
    {
        return 1;
    }

    const NativeCaps caps = QueryCaps(os);
    if (caps.determinism != DeterminismMode::Replay || caps.blockingQueue || !caps.recyclesHandles)
    {
        return 2;
    }

    // Classes: duplicate names clash case-insensitively, system names too.
    NativeClassDesc classDesc{};
    classDesc.name = MakeTextView("NullSmokeWindow");
    classDesc.proc = &RecordingProc;
    ClassAtom atom = 0;
    if (RegisterWindowClass(os, classDesc, atom) != NativeStatus::Ok || atom == 0)
    {
        return 3;
    }
    classDesc.name = MakeTextView("nullsmokewindow");
    if (RegisterWindowClass(os, classDesc, atom) != NativeStatus::AlreadyExists ||
        GetLastOsError(os) != os_error::kClassAlreadyExists)
    {
        return 4;
    }
    classDesc.name = MakeTextView("BUTTON");
    if (RegisterWindowClass(os, classDesc, atom) != NativeStatus::AlreadyExists || backend.GetRegistrationCount() != 1)
    {
        return 5;
    }

    // Creation errors.
    NativeHandle handle{};
    if (CreateNativeWindow(os, MakeDesc("NoSuchClass"), handle) != NativeStatus::NotFound ||
        GetLastOsError(os) != os_error::kCannotFindClass || handle.IsValid())
    {
        return 6;
    }
    if (CreateNativeWindow(os, MakeDesc("Button", NativeHandle{ 0xDEAD0 }, 1), handle) != NativeStatus::InvalidArg ||
        GetLastOsError(os) != os_error::kInvalidWindowHandle)
    {
        return 7;
    }

    // Top-level window with defaulted geometry.
    NativeHandle top{};
    if (CreateNativeWindow(os, MakeDesc("NullSmokeWindow"), top) != NativeStatus::Ok || !top.IsValid())
    {
        return 8;
    }
    if (CountCode(top, msg::code::kNcCreate) != 1 || CountCode(top, msg::code::kCreate) != 1)
    {
        return 9;
    }
    Rect client{};
    if (GetClientArea(os, top, client) != NativeStatus::Ok || client.Width() != 640 || client.Height() != 480)
    {
        return 10;
    }

    // Children: control ids are unique among siblings.
    NativeHandle button{};
    NativeHandle child{};
    if (CreateNativeWindow(os, MakeDesc("Button", top, 10), button) != NativeStatus::Ok ||
        CreateNativeWindow(os, MakeDesc("NullSmokeWindow", top, 11), child) != NativeStatus::Ok)
    {
        return 11;
    }
    NativeHandle duplicate{};
    if (CreateNativeWindow(os, MakeDesc("Edit", top, 10), duplicate) != NativeStatus::InvalidArg ||
        GetLastOsError(os) != os_error::kInvalidParameter)
    {
        return 12;
    }

    // Capacity: the screen DC is not a window, so four windows fit.
    NativeHandle fourth{};
    if (CreateNativeWindow(os, MakeDesc("Static", top, 12), fourth) != NativeStatus::Ok)
    {
        return 13;
    }
    NativeHandle overflow{};
    if (CreateNativeWindow(os, MakeDesc("Static", top, 13), overflow) != NativeStatus::OutOfResources ||
        GetLastOsError(os) != os_error::kNotEnoughMemory)
    {
        return 14;
    }

    // Capacity is checked before any procedure runs.
    s_Records.clear();
    NativeHandle refused{};
    if (CreateNativeWindow(os, MakeDesc("NullSmokeWindow"), refused) != NativeStatus::OutOfResources || !s_Records.empty())
    {
        return 15;
    }
    if (DestroyNativeWindow(os, fourth) != NativeStatus::Ok || IsLiveWindow(os, fourth))
    {
        return 16;
    }

    // Create returning -1 tears the half-built window down.
    s_Records.clear();
    s_RefuseCreate = true;
    const NativeStatus abortStatus = CreateNativeWindow(os, MakeDesc("NullSmokeWindow"), refused);
    s_RefuseCreate = false;
    if (abortStatus != NativeStatus::Rejected || GetLastOsError(os) != os_error::kCancelled || refused.IsValid())
    {
        return 17;
    }
    if (s_Records.size() != 4 ||
        s_Records[0].code != msg::code::kNcCreate ||
        s_Records[1].code != msg::code::kCreate ||
        s_Records[2].code != msg::code::kDestroy ||
        s_Records[3].code != msg::code::kNcDestroy ||
        backend.GetLiveWindowCount() != 3)
    {
        return 18;
    }

    // Queue: FIFO, dead handles rejected, quit only after the queue drains.
    if (PostNativeMessage(os, top, msg::code::kUser, 1, 0) != NativeStatus::Ok ||
        PostNativeMessage(os, child, msg::code::kUser, 2, 0) != NativeStatus::Ok)
    {
        return 19;
    }
    if (PostNativeMessage(os, NativeHandle{ 0xDEAD0 }, msg::code::kUser, 3, 0) != NativeStatus::InvalidArg)
    {
        return 20;
    }
    PostQuit(os, 9);

    NativeMessage message{};
    if (GetNextMessage(os, message) != GetMessageResult::Message || message.handle != top || message.wParam != 1)
    {
        return 21;
    }
    if (GetNextMessage(os, message) != GetMessageResult::Message || message.handle != child || message.wParam != 2)
    {
        return 22;
    }
    if (GetNextMessage(os, message) != GetMessageResult::Quit || message.wParam != 9 || backend.IsQuitPending())
    {
        return 23;
    }
    if (GetNextMessage(os, message) != GetMessageResult::Failed || GetLastOsError(os) != os_error::kWaitTimeout)
    {
        return 24;
    }

    // Idle hook runs when nothing is queued and may feed the queue.
    int idleCalls = 0;
    backend.SetIdleHook([&idleCalls, top](NullNative& self) {
        ++idleCalls;
        (void)self.PostNativeMessage(top, msg::code::kUser, 4, 0);
    });
    if (GetNextMessage(os, message) != GetMessageResult::Message || message.wParam != 4 || idleCalls != 1)
    {
        return 25;
    }
    backend.SetIdleHook({});

    // Timers: one queued message per timer regardless of elapsed periods.
    if (SetTimer(os, top, 1, 10) != NativeStatus::Ok || backend.GetLiveTimerCount() != 1)
    {
        return 26;
    }
    backend.AdvanceTime(35);
    backend.AdvanceTime(10);
    if (backend.GetQueuedMessageCount() != 1)
    {
        return 27;
    }
    if (GetNextMessage(os, message) != GetMessageResult::Message || message.code != msg::code::kTimer || message.wParam != 1)
    {
        return 28;
    }
    if (KillTimer(os, top, 1) != NativeStatus::Ok || KillTimer(os, top, 1) != NativeStatus::NotFound ||
        GetLastOsError(os) != os_error::kInvalidTimer)
    {
        return 29;
    }

    // Title query: length first, then a truncated copy.
    if (SetWindowTitle(os, top, MakeTextView("Hello")) != NativeStatus::Ok)
    {
        return 30;
    }
    u32 length = 0;
    char small[4]{};
    if (GetWindowTitle(os, top, nullptr, 0, length) != NativeStatus::Ok || length != 5 ||
        GetWindowTitle(os, top, small, 4, length) != NativeStatus::Ok || length != 3 ||
        std::string_view(small) != "Hel")
    {
        return 31;
    }

    // Move/size notifications only for what changed.
    s_Records.clear();
    if (MoveNativeWindow(os, top, Rect::FromXYWH(5, 6, 640, 480)) != NativeStatus::Ok ||
        CountCode(top, msg::code::kMove) != 1 || CountCode(top, msg::code::kSize) != 0)
    {
        return 32;
    }

    // Paint only reaches visible windows that need it.
    s_Records.clear();
    if (UpdateNativeWindow(os, top) != NativeStatus::Ok || CountCode(top, msg::code::kPaint) != 0)
    {
        return 33;
    }
    if (ShowNativeWindow(os, top, ShowCommand::ShowNormal) != NativeStatus::Ok ||
        UpdateNativeWindow(os, top) != NativeStatus::Ok ||
        UpdateNativeWindow(os, top) != NativeStatus::Ok ||
        CountCode(top, msg::code::kPaint) != 1 || !backend.IsVisible(top))
    {
        return 34;
    }

    // Paint sessions: EraseBkgnd on the session DC, then the window is valid.
    s_Records.clear();
    NativeHandle fill{};
    if (InvalidateNativeWindow(os, top, true) != NativeStatus::Ok || !backend.IsPaintPending(top) ||
        CreateBrush(os, MakeRgb(9, 9, 9), fill) != NativeStatus::Ok)
    {
        return 49;
    }
    NativePaintInfo paint{};
    if (BeginNativePaint(os, top, paint) != NativeStatus::Ok || !paint.dc.IsValid() ||
        CountCode(top, msg::code::kEraseBkgnd) != 1 || paint.eraseBackground ||
        paint.area != Rect::FromSize(640, 480) || backend.IsPaintPending(top))
    {
        return 50;
    }
    NativePaintInfo nested{};
    if (BeginNativePaint(os, top, nested) != NativeStatus::Rejected ||
        FillArea(os, paint.dc, Rect::FromXYWH(0, 0, 10, 10), fill) != NativeStatus::Ok ||
        FillArea(os, paint.dc, Rect::FromXYWH(0, 0, 10, 10), NativeHandle{ 0xDEAD }) != NativeStatus::InvalidArg ||
        backend.GetFillLog().size() != 1 || backend.GetFillLog()[0].window != top ||
        backend.GetFillLog()[0].color != MakeRgb(9, 9, 9))
    {
        return 51;
    }
    if (EndNativePaint(os, top, paint.dc) != NativeStatus::Ok ||
        EndNativePaint(os, top, paint.dc) != NativeStatus::InvalidArg ||
        FillArea(os, paint.dc, Rect::FromXYWH(0, 0, 10, 10), fill) != NativeStatus::InvalidArg ||
        backend.GetActivePaintCount() != 0)
    {
        return 52;
    }
    // Nothing invalid: an empty area and no second erase.
    if (BeginNativePaint(os, top, paint) != NativeStatus::Ok || paint.area != Rect{} ||
        CountCode(top, msg::code::kEraseBkgnd) != 1 ||
        EndNativePaint(os, top, paint.dc) != NativeStatus::Ok ||
        DeleteGdiObject(os, fill) != NativeStatus::Ok)
    {
        return 53;
    }

    // Menus: an attached bar goes away with the window.
    NativeHandle bar{};
    NativeHandle popup{};
    if (CreateNativeMenu(os, MenuKind::Bar, bar) != NativeStatus::Ok ||
        CreateNativeMenu(os, MenuKind::Popup, popup) != NativeStatus::Ok ||
        AppendMenuItem(os, popup, 100, MakeTextView("Open")) != NativeStatus::Ok ||
        AppendSubMenu(os, bar, popup, MakeTextView("File")) != NativeStatus::Ok ||
        SetWindowMenu(os, top, bar) != NativeStatus::Ok)
    {
        return 35;
    }
    if (AppendSubMenu(os, bar, popup, MakeTextView("Again")) != NativeStatus::InvalidArg ||
        backend.GetMenuOf(top) != bar || backend.GetMenuItemCount(bar) != 1)
    {
        return 36;
    }

    NativeHandle brush{};
    if (CreateBrush(os, MakeRgb(1, 2, 3), brush) != NativeStatus::Ok || !backend.IsLiveGdiObject(brush))
    {
        return 37;
    }
    if (DeleteGdiObject(os, brush) != NativeStatus::Ok || DeleteGdiObject(os, brush) != NativeStatus::InvalidArg)
    {
        return 38;
    }

    // Simulated notifications reach the parent.
    s_Records.clear();
    NativeResult reply = 0;
    if (backend.ClickControl(button, reply) != NativeStatus::Ok || CountCode(top, msg::code::kCommand) != 1)
    {
        return 39;
    }
    if (backend.ClickControl(top, reply) != NativeStatus::InvalidArg)
    {
        return 40;
    }

    // Destroy order: parent Destroy, children, parent NcDestroy.
    if (SetTimer(os, child, 2, 5) != NativeStatus::Ok ||
        PostNativeMessage(os, child, msg::code::kUser, 0, 0) != NativeStatus::Ok)
    {
        return 41;
    }
    s_Records.clear();
    if (DestroyNativeWindow(os, top) != NativeStatus::Ok)
    {
        return 42;
    }
    if (s_Records.size() != 4 ||
        s_Records[0].handle != top   || s_Records[0].code != msg::code::kDestroy ||
        s_Records[1].handle != child || s_Records[1].code != msg::code::kDestroy ||
        s_Records[2].handle != child || s_Records[2].code != msg::code::kNcDestroy ||
        s_Records[3].handle != top   || s_Records[3].code != msg::code::kNcDestroy)
    {
        return 43;
    }
    if (backend.GetLiveWindowCount() != 0 || backend.GetLiveMenuCount() != 0 ||
        backend.GetLiveTimerCount() != 0 || backend.GetQueuedMessageCount() != 0)
    {
        return 44;
    }
    if (DestroyNativeWindow(os, top) != NativeStatus::InvalidArg || GetLastOsError(os) != os_error::kInvalidWindowHandle)
    {
        return 45;
    }

    // Released handle values come back LIFO.
    NativeHandle reused{};
    if (CreateNativeWindow(os, MakeDesc("NullSmokeWindow"), reused) != NativeStatus::Ok || reused != top)
    {
        return 46;
    }

    // A class with live windows cannot be unregistered.
    if (UnregisterWindowClass(os, MakeTextView("NullSmokeWindow")) != NativeStatus::Rejected ||
        GetLastOsError(os) != os_error::kClassHasWindows)
    {
        return 47;
    }
    if (DestroyNativeWindow(os, reused) != NativeStatus::Ok ||
        UnregisterWindowClass(os, MakeTextView("NullSmokeWindow")) != NativeStatus::Ok ||
        backend.IsClassRegistered("NullSmokeWindow"))
    {
        return 48;
    }

    s_Backend = nullptr;
    return 0;
}
