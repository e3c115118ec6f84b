#include "GuiSmokeSupport.hpp"

#include "MinGui/Messages/MessageCodes.hpp"
#include "MinGui/Window/Controls.hpp"
#include "MinGui/Window/Menu.hpp"
#include "MinGui/Window/PaintSession.hpp"

#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace
{
    using namespace mingui;
    using namespace mingui::win;

    // Delivers every queued message; returns how many were dispatched.
    int Pump(runtime::GuiContext& context) noexcept
    {
        native::NullNative* backend = context.GetNullBackend();
        int dispatched = 0;
        while (backend->GetQueuedMessageCount() != 0)
        {
            native::NativeMessage message{};
            if (native::GetNextMessage(context.nativeInterface, message) != native::GetMessageResult::Message)
            {
                break;
            }
            (void)native::DispatchNativeMessage(context.nativeInterface, message);
            ++dispatched;
        }
        return dispatched;
    }

    int RunLifecycleChecks(runtime::GuiContext& context, ClassToken frame)
    {
        native::NullNative* backend = context.GetNullBackend();

        int createCalls = 0;
        NativeHandle seenInCreate{};
        CreateParams params = smoke::TopLevelParams(frame, "Lifecycle");
        params.handlers.push_back(Subscription{ EventCategory::Create, [&](const Event& event) {
            ++createCalls;
            seenInCreate = event.handle;
            return HandlerResult::Handled();
        } });

        std::unique_ptr<WindowObject> window;
        CreationError error{};
        if (WindowObject::Create(context, std::move(params), window, error) != WindowStatus::Ok || !window)
        {
            return 101;
        }
        const NativeHandle handle = window->GetHandle();
        if (!handle.IsValid() || !window->IsAlive() || window->GetState() != WindowState::Created)
        {
            return 102;
        }
        // The handle is bound before Create reaches the handler.
        if (createCalls != 1 || seenInCreate != handle || context.registry.Lookup(handle) != window.get())
        {
            return 103;
        }

        if (window->Destroy() != WindowStatus::Ok || window->GetState() != WindowState::Destroyed)
        {
            return 104;
        }
        if (context.registry.Lookup(handle) != nullptr || backend->IsLiveWindow(handle))
        {
            return 105;
        }
        // Redundant destroy is harmless; everything else reports the state.
        if (window->Destroy() != WindowStatus::Ok ||
            window->SetTitle("late") != WindowStatus::InvalidState ||
            window->Subscribe(EventCategory::Paint, [](const Event&) { return HandlerResult::Handled(); }) != WindowStatus::InvalidState)
        {
            return 106;
        }

        // Dropping a live object destroys its native window.
        std::unique_ptr<WindowObject> scoped;
        if (WindowObject::Create(context, smoke::TopLevelParams(frame), scoped, error) != WindowStatus::Ok)
        {
            return 107;
        }
        const NativeHandle scopedHandle = scoped->GetHandle();
        scoped.reset();
        if (backend->IsLiveWindow(scopedHandle) || !context.registry.IsEmpty())
        {
            return 108;
        }

        // A child style needs a parent; an unknown token is rejected.
        CreateParams orphan = smoke::TopLevelParams(frame);
        orphan.style = WindowStyle::kChild | WindowStyle::kVisible;
        if (WindowObject::Create(context, std::move(orphan), window, error) != WindowStatus::InvalidArg ||
            error.status != WindowStatus::InvalidArg || window)
        {
            return 109;
        }
        CreateParams noClass{};
        if (WindowObject::Create(context, std::move(noClass), window, error) != WindowStatus::InvalidArg)
        {
            return 110;
        }

        // A Create handler can veto the window.
        const u32 liveBefore = backend->GetLiveWindowCount();
        CreateParams vetoed = smoke::TopLevelParams(frame);
        vetoed.handlers.push_back(Subscription{ EventCategory::Create, [](const Event&) {
            return HandlerResult::AbortCreation();
        } });
        if (WindowObject::Create(context, std::move(vetoed), window, error) != WindowStatus::CreationFailed ||
            error.osError != native::os_error::kCancelled || window)
        {
            return 111;
        }
        if (backend->GetLiveWindowCount() != liveBefore || !context.registry.IsEmpty())
        {
            return 112;
        }

        return 0;
    }

    int RunDispatchChecks(runtime::GuiContext& context, ClassToken frame)
    {
        native::NullNative* backend = context.GetNullBackend();

        std::unique_ptr<WindowObject> window;
        CreationError error{};
        if (WindowObject::Create(context, smoke::TopLevelParams(frame, "Dispatch"), window, error) != WindowStatus::Ok)
        {
            return 201;
        }

        // Last registration wins.
        int firstSize = 0;
        int secondSize = 0;
        i32 seenWidth = 0;
        if (window->On<msg::SizePayload>([&](const msg::SizePayload&) { ++firstSize; return HandlerResult::Handled(); }) != WindowStatus::Ok ||
            window->On<msg::SizePayload>([&](const msg::SizePayload& size) {
                ++secondSize;
                seenWidth = size.width;
                return HandlerResult::Handled();
            }) != WindowStatus::Ok)
        {
            return 202;
        }
        if (window->SetRect(Rect::FromXYWH(0, 0, 320, 200)) != WindowStatus::Ok ||
            firstSize != 0 || secondSize != 1 || seenWidth != 320)
        {
            return 203;
        }
        Rect client{};
        if (window->GetClientRect(client) != WindowStatus::Ok || client.Width() != 320 || client.Height() != 200)
        {
            return 204;
        }
        if (window->SetRect(Rect{ 10, 10, 0, 0 }) != WindowStatus::InvalidArg)
        {
            return 205;
        }

        // A throwing handler degrades to default processing.
        if (window->Subscribe(EventCategory::Move, [](const Event&) -> HandlerResult {
                throw std::runtime_error("move handler failure");
            }) != WindowStatus::Ok)
        {
            return 206;
        }
        if (window->SetRect(Rect::FromXYWH(40, 50, 320, 200)) != WindowStatus::Ok || !window->IsAlive())
        {
            return 207;
        }
        Event move{};
        move.handle  = window->GetHandle();
        move.code    = msg::code::kMove;
        move.payload = msg::MovePayload{ 1, 2 };
        {
            smoke::LogCapture capture{};
            capture.category = "Dispatch";
            const core::ScopedLogSink scopedSink(capture.AsSink());
            if (window->SendEvent(move).IsHandled() || capture.matches != 1)
            {
                return 208;
            }
        }

        // Unsubscribing restores default processing.
        if (window->Unsubscribe(EventCategory::Move) != WindowStatus::Ok ||
            window->IsSubscribed(EventCategory::Move) ||
            !window->IsSubscribed(EventCategory::Size))
        {
            return 209;
        }

        // A handler may replace itself while it runs.
        WindowObject* self = window.get();
        int firstTimer = 0;
        int secondTimer = 0;
        if (window->Subscribe(EventCategory::Timer, [&firstTimer, &secondTimer, self](const Event&) {
                ++firstTimer;
                (void)self->Subscribe(EventCategory::Timer, [&secondTimer](const Event&) {
                    ++secondTimer;
                    return HandlerResult::Handled();
                });
                return HandlerResult::Handled();
            }) != WindowStatus::Ok)
        {
            return 210;
        }
        if (window->StartTimer(0, 10) != WindowStatus::InvalidArg || window->StartTimer(3, 10) != WindowStatus::Ok)
        {
            return 211;
        }
        backend->AdvanceTime(10);
        if (Pump(context) != 1)
        {
            return 212;
        }
        backend->AdvanceTime(10);
        if (Pump(context) != 1 || firstTimer != 1 || secondTimer != 1)
        {
            return 213;
        }
        if (window->StopTimer(3) != WindowStatus::Ok || window->StopTimer(3) != WindowStatus::InvalidArg ||
            backend->GetLiveTimerCount() != 0)
        {
            return 214;
        }

        // Title round trip.
        std::string title;
        if (window->SetTitle("Renamed window") != WindowStatus::Ok ||
            window->GetTitle(title) != WindowStatus::Ok || title != "Renamed window")
        {
            return 215;
        }

        // Paint is delivered once the window is shown and updated.
        int paints = 0;
        if (window->On<msg::PaintPayload>([&paints](const msg::PaintPayload&) { ++paints; return HandlerResult::Handled(); }) != WindowStatus::Ok ||
            window->Show(ShowCommand::ShowNormal) != WindowStatus::Ok ||
            window->Update() != WindowStatus::Ok ||
            paints != 1)
        {
            return 216;
        }

        // A window the library did not create gets default handling.
        const usize registered = context.registry.Size();
        native::NativeWindowDesc foreign{};
        foreign.className = native::MakeTextView("SmokeFrame");
        foreign.style     = WindowStyle::kOverlappedWindow;
        NativeHandle foreignHandle{};
        if (native::CreateNativeWindow(context.nativeInterface, foreign, foreignHandle) != native::NativeStatus::Ok ||
            context.registry.Size() != registered)
        {
            return 217;
        }
        if (native::PostNativeMessage(context.nativeInterface, foreignHandle, msg::code::kClose, 0, 0) != native::NativeStatus::Ok ||
            Pump(context) != 1 || backend->IsLiveWindow(foreignHandle) || context.registry.Size() != registered)
        {
            return 218;
        }

        // Close without a handler falls back to destroying the window.
        if (window->Close() != WindowStatus::Ok || Pump(context) != 1 || window->IsAlive())
        {
            return 219;
        }

        return 0;
    }

    int RunHierarchyChecks(runtime::GuiContext& context, ClassToken frame)
    {
        native::NullNative* backend = context.GetNullBackend();
        CreationError error{};

        // The parent builds a label while handling its own Create.
        std::unique_ptr<WindowObject> label;
        CreateParams parentParams = smoke::TopLevelParams(frame, "Parent");
        parentParams.handlers.push_back(Subscription{ EventCategory::Create, [&context, &label](const Event& event) {
            WindowObject* self = context.registry.Lookup(event.handle);
            if (self == nullptr)
            {
                return HandlerResult::AbortCreation();
            }
            ControlParams labelParams{};
            labelParams.text = "Name:";
            labelParams.rect = Rect::FromXYWH(8, 8, 80, 20);
            labelParams.id   = 1;
            CreationError labelError{};
            if (CreateStatic(*self, std::move(labelParams), label, labelError) != WindowStatus::Ok)
            {
                return HandlerResult::AbortCreation();
            }
            return HandlerResult::Handled();
        } });

        std::unique_ptr<WindowObject> parent;
        if (WindowObject::Create(context, std::move(parentParams), parent, error) != WindowStatus::Ok || !label || !label->IsAlive())
        {
            return 301;
        }
        if (!label->IsSystemControl() || label->GetParent() != parent.get() || label->GetControlId() != 1 ||
            backend->GetParentOf(label->GetHandle()) != parent->GetHandle())
        {
            return 302;
        }

        // Owned child window.
        CreateParams childParams = smoke::TopLevelParams(frame, "Child");
        childParams.style     = WindowStyle::kChild | WindowStyle::kVisible;
        childParams.parent    = parent.get();
        childParams.controlId = 2;
        std::unique_ptr<WindowObject> child;
        if (WindowObject::Create(context, std::move(childParams), child, error) != WindowStatus::Ok || child->IsSystemControl())
        {
            return 303;
        }

        // Child windows cannot carry a menu bar.
        Menu childMenu;
        if (Menu::Create(context, native::MenuKind::Bar, childMenu) != WindowStatus::Ok ||
            child->SetMenu(std::move(childMenu)) != WindowStatus::NotSupported)
        {
            return 304;
        }

        // Button notifications go to the button's own handler first.
        int buttonClicks = 0;
        int parentCommands = 0;
        ControlParams buttonParams{};
        buttonParams.text = "OK";
        buttonParams.rect = Rect::FromXYWH(8, 40, 80, 24);
        buttonParams.id   = 3;
        buttonParams.handlers.push_back(Subscription{ EventCategory::Command, [&buttonClicks](const Event& event) {
            const msg::CommandPayload* command = event.As<msg::CommandPayload>();
            if (command == nullptr || command->notifyCode != native::Notify::kButtonClicked)
            {
                return HandlerResult::NotHandled();
            }
            ++buttonClicks;
            return HandlerResult::Handled();
        } });
        std::unique_ptr<WindowObject> button;
        if (CreateButton(*parent, std::move(buttonParams), button, error) != WindowStatus::Ok)
        {
            return 305;
        }
        if (parent->On<msg::CommandPayload>([&parentCommands](const msg::CommandPayload&) {
                ++parentCommands;
                return HandlerResult::Handled();
            }) != WindowStatus::Ok)
        {
            return 306;
        }

        NativeResult reply = -1;
        if (backend->ClickControl(button->GetHandle(), reply) != native::NativeStatus::Ok ||
            buttonClicks != 1 || parentCommands != 0 || reply != 0)
        {
            return 307;
        }

        // Without a control handler the parent sees the command.
        if (button->Unsubscribe(EventCategory::Command) != WindowStatus::Ok ||
            backend->ClickControl(button->GetHandle(), reply) != native::NativeStatus::Ok ||
            buttonClicks != 1 || parentCommands != 1)
        {
            return 308;
        }

        // Controls only accept the control categories.
        if (button->Subscribe(EventCategory::Paint, [](const Event&) { return HandlerResult::Handled(); }) != WindowStatus::NotSupported)
        {
            return 309;
        }

        // ControlColor answers with a brush the parent owns.
        NativeHandle brush{};
        if (parent->CreateSolidBrush(native::MakeRgb(240, 240, 255), brush) != WindowStatus::Ok ||
            parent->GetBrushCount() != 1 || !backend->IsLiveGdiObject(brush))
        {
            return 310;
        }
        if (button->On<msg::ControlColorPayload>([brush](const msg::ControlColorPayload& color) {
                return (color.kind == msg::ControlColorKind::Button) ? HandlerResult::UseBrush(brush) : HandlerResult::NotHandled();
            }) != WindowStatus::Ok)
        {
            return 311;
        }
        if (backend->RequestControlColor(button->GetHandle(), msg::code::kCtlColorBtn, reply) != native::NativeStatus::Ok ||
            reply != static_cast<NativeResult>(brush.value))
        {
            return 312;
        }

        // Menu bar ownership moves to the window.
        Menu bar;
        Menu file;
        if (Menu::Create(context, native::MenuKind::Bar, bar) != WindowStatus::Ok ||
            Menu::Create(context, native::MenuKind::Popup, file) != WindowStatus::Ok ||
            file.AppendItem(100, "Open") != WindowStatus::Ok ||
            file.AppendSeparator() != WindowStatus::Ok ||
            file.AppendItem(101, "Exit") != WindowStatus::Ok ||
            bar.AppendSubMenu("File", std::move(file)) != WindowStatus::Ok)
        {
            return 313;
        }
        if (file.IsValid() || backend->GetMenuItemCount(bar.GetHandle()) != 1)
        {
            return 314;
        }
        const NativeHandle barHandle = bar.GetHandle();
        if (parent->SetMenu(std::move(bar)) != WindowStatus::Ok || bar.IsValid() ||
            parent->GetMenuHandle() != barHandle || backend->GetMenuOf(parent->GetHandle()) != barHandle)
        {
            return 315;
        }

        const NativeHandle labelHandle  = label->GetHandle();
        const NativeHandle buttonHandle = button->GetHandle();
        const NativeHandle childHandle  = child->GetHandle();
        if (context.registry.Size() != 4)
        {
            return 316;
        }

        // Destroying the parent takes the whole tree and its resources.
        if (parent->Destroy() != WindowStatus::Ok)
        {
            return 317;
        }
        if (child->IsAlive() || button->IsAlive() || label->IsAlive())
        {
            return 318;
        }
        if (context.registry.Lookup(labelHandle) != nullptr ||
            context.registry.Lookup(buttonHandle) != nullptr ||
            context.registry.Lookup(childHandle) != nullptr ||
            !context.registry.IsEmpty())
        {
            return 319;
        }
        // childMenu is still owned by its Menu object.
        if (backend->GetLiveGdiObjectCount() != 0 || backend->GetLiveMenuCount() != 1 || backend->GetLiveWindowCount() != 0)
        {
            return 320;
        }

        return 0;
    }

    int RunNestedControlChecks(runtime::GuiContext& context, ClassToken frame)
    {
        native::NullNative* backend = context.GetNullBackend();
        CreationError error{};

        // A group label that hosts a button of its own.
        std::unique_ptr<WindowObject> top;
        if (WindowObject::Create(context, smoke::TopLevelParams(frame, "Nested"), top, error) != WindowStatus::Ok)
        {
            return 401;
        }
        ControlParams groupParams{};
        groupParams.text = "Options";
        groupParams.rect = Rect::FromXYWH(8, 8, 200, 120);
        groupParams.id   = 10;
        std::unique_ptr<WindowObject> group;
        if (CreateStatic(*top, std::move(groupParams), group, error) != WindowStatus::Ok)
        {
            return 402;
        }
        ControlParams innerParams{};
        innerParams.text = "Apply";
        innerParams.rect = Rect::FromXYWH(8, 24, 80, 24);
        innerParams.id   = 11;
        std::unique_ptr<WindowObject> inner;
        if (CreateButton(*group, std::move(innerParams), inner, error) != WindowStatus::Ok ||
            inner->GetParent() != group.get() || backend->GetParentOf(inner->GetHandle()) != group->GetHandle())
        {
            return 403;
        }

        const NativeHandle innerHandle = inner->GetHandle();
        if (top->Destroy() != WindowStatus::Ok)
        {
            return 404;
        }
        if (group->IsAlive() || inner->IsAlive() || inner->GetParent() != nullptr || !context.registry.IsEmpty())
        {
            return 405;
        }

        // The released handles are handed out again right away.
        bool reusedInner = false;
        std::unique_ptr<WindowObject> fresh[3];
        {
            smoke::LogCapture capture{};
            capture.category = "Window";
            const core::ScopedLogSink scopedSink(capture.AsSink());
            for (std::unique_ptr<WindowObject>& window : fresh)
            {
                if (WindowObject::Create(context, smoke::TopLevelParams(frame, "Fresh"), window, error) != WindowStatus::Ok ||
                    error.osError != native::os_error::kNone)
                {
                    return 406;
                }
                reusedInner = reusedInner || (window->GetHandle() == innerHandle);
            }
            if (capture.matches != 0)
            {
                return 407;
            }
        }
        if (!reusedInner || context.registry.Size() != 3 || backend->GetLiveWindowCount() != 3)
        {
            return 408;
        }

        // Destroying the hosting label directly takes its button too.
        ControlParams hostParams{};
        hostParams.text = "Host";
        hostParams.id   = 12;
        ControlParams leafParams{};
        leafParams.text = "Leaf";
        leafParams.id   = 13;
        if (CreateStatic(*fresh[0], std::move(hostParams), group, error) != WindowStatus::Ok ||
            CreateButton(*group, std::move(leafParams), inner, error) != WindowStatus::Ok)
        {
            return 409;
        }
        if (group->Destroy() != WindowStatus::Ok || inner->IsAlive() || context.registry.Size() != 3)
        {
            return 410;
        }

        for (std::unique_ptr<WindowObject>& window : fresh)
        {
            if (window->Destroy() != WindowStatus::Ok)
            {
                return 411;
            }
        }
        if (!context.registry.IsEmpty() || backend->GetLiveWindowCount() != 0)
        {
            return 412;
        }

        return 0;
    }

    int RunSelfReleaseChecks(runtime::GuiContext& context, ClassToken frame)
    {
        native::NullNative* backend = context.GetNullBackend();
        CreationError error{};

        // A Destroy handler drops the last owner of its own window.
        std::unique_ptr<WindowObject> window;
        CreateParams params = smoke::TopLevelParams(frame, "Released on destroy");
        params.quitOnDestroy = true;
        params.quitExitCode  = 7;
        if (WindowObject::Create(context, std::move(params), window, error) != WindowStatus::Ok)
        {
            return 501;
        }
        NativeHandle brush{};
        if (window->CreateSolidBrush(native::MakeRgb(1, 2, 3), brush) != WindowStatus::Ok ||
            window->StartTimer(5, 10) != WindowStatus::Ok)
        {
            return 502;
        }

        const NativeHandle handle = window->GetHandle();
        int destroys = 0;
        bool reentrantOk = false;
        if (window->Subscribe(EventCategory::Destroy, [&window, &destroys, &reentrantOk](const Event&) {
                ++destroys;
                reentrantOk = (window->Destroy() == WindowStatus::Ok) && window->IsAlive();
                window.reset();
                return HandlerResult::Handled();
            }) != WindowStatus::Ok)
        {
            return 503;
        }
        if (window->Close() != WindowStatus::Ok || Pump(context) != 1)
        {
            return 504;
        }
        if (window || destroys != 1 || !reentrantOk ||
            backend->IsLiveWindow(handle) || !context.registry.IsEmpty())
        {
            return 505;
        }
        // Timers, brushes and the quit request were handled before the handler ran.
        native::NativeMessage quit{};
        if (backend->GetLiveTimerCount() != 0 || backend->IsLiveGdiObject(brush) ||
            native::GetNextMessage(context.nativeInterface, quit) != native::GetMessageResult::Quit ||
            quit.wParam != 7)
        {
            return 506;
        }

        // Same from NcDestroy, which reaches the passthrough handler.
        std::unique_ptr<WindowObject> late;
        if (WindowObject::Create(context, smoke::TopLevelParams(frame, "Released on NcDestroy"), late, error) != WindowStatus::Ok)
        {
            return 507;
        }
        const NativeHandle lateHandle = late->GetHandle();
        int finals = 0;
        if (late->Subscribe(EventCategory::Passthrough, [&late, &finals](const Event& event) {
                if (event.code != msg::code::kNcDestroy)
                {
                    return HandlerResult::NotHandled();
                }
                ++finals;
                late.reset();
                return HandlerResult::NotHandled();
            }) != WindowStatus::Ok)
        {
            return 508;
        }
        if (late->Destroy() != WindowStatus::Ok || late || finals != 1 ||
            backend->IsLiveWindow(lateHandle) || !context.registry.IsEmpty())
        {
            return 509;
        }

        // A control owned by a window released this way is still purged.
        std::unique_ptr<WindowObject> host;
        if (WindowObject::Create(context, smoke::TopLevelParams(frame, "Host"), host, error) != WindowStatus::Ok)
        {
            return 510;
        }
        ControlParams labelParams{};
        labelParams.text = "Status";
        labelParams.id   = 20;
        std::unique_ptr<WindowObject> label;
        if (CreateStatic(*host, std::move(labelParams), label, error) != WindowStatus::Ok ||
            host->Subscribe(EventCategory::Destroy, [&host](const Event&) {
                host.reset();
                return HandlerResult::Handled();
            }) != WindowStatus::Ok)
        {
            return 511;
        }
        if (host->Close() != WindowStatus::Ok || Pump(context) != 1 || host || label->IsAlive() ||
            !context.registry.IsEmpty() || backend->GetLiveWindowCount() != 0)
        {
            return 512;
        }

        return 0;
    }

    int RunPaintChecks(runtime::GuiContext& context, ClassToken frame)
    {
        native::NullNative* backend = context.GetNullBackend();
        CreationError error{};

        std::unique_ptr<WindowObject> window;
        if (WindowObject::Create(context, smoke::TopLevelParams(frame, "Paint"), window, error) != WindowStatus::Ok)
        {
            return 601;
        }
        const NativeHandle handle = window->GetHandle();
        NativeHandle brush{};
        if (window->CreateSolidBrush(native::MakeRgb(10, 20, 30), brush) != WindowStatus::Ok)
        {
            return 602;
        }

        // The handler opens a session and fills what needs repainting.
        backend->ClearFillLog();
        WindowObject* self = window.get();
        int paints = 0;
        Rect painted{};
        WindowStatus fillStatus = WindowStatus::InvalidState;
        if (window->On<msg::PaintPayload>([self, brush, &paints, &painted, &fillStatus](const msg::PaintPayload&) {
                ++paints;
                PaintSession session;
                if (PaintSession::Begin(*self, session) != WindowStatus::Ok)
                {
                    return HandlerResult::NotHandled();
                }
                painted    = session.GetArea();
                fillStatus = session.FillArea(brush);
                return HandlerResult::Handled();
            }) != WindowStatus::Ok)
        {
            return 603;
        }
        if (window->SetRect(Rect::FromXYWH(0, 0, 200, 100)) != WindowStatus::Ok ||
            window->Show(ShowCommand::ShowNormal) != WindowStatus::Ok ||
            window->Update() != WindowStatus::Ok)
        {
            return 604;
        }
        if (paints != 1 || fillStatus != WindowStatus::Ok || painted != Rect::FromSize(200, 100) ||
            backend->IsPaintPending(handle) || backend->GetActivePaintCount() != 0)
        {
            return 605;
        }
        const std::vector<native::NullNative::FillRecord>& fills = backend->GetFillLog();
        if (fills.size() != 1 || fills[0].window != handle ||
            fills[0].color != native::MakeRgb(10, 20, 30) || fills[0].area != Rect::FromSize(200, 100))
        {
            return 606;
        }

        // Validated windows get no further Paint until invalidated.
        if (window->Update() != WindowStatus::Ok || paints != 1)
        {
            return 607;
        }
        if (window->Invalidate() != WindowStatus::Ok || !backend->IsPaintPending(handle) ||
            window->Update() != WindowStatus::Ok || paints != 2 || backend->IsPaintPending(handle))
        {
            return 608;
        }

        // Handled without a session leaves the window invalid.
        int bare = 0;
        if (window->On<msg::PaintPayload>([&bare](const msg::PaintPayload&) { ++bare; return HandlerResult::Handled(); }) != WindowStatus::Ok ||
            window->Invalidate(false) != WindowStatus::Ok ||
            window->Update() != WindowStatus::Ok ||
            window->Update() != WindowStatus::Ok ||
            bare != 2 || !backend->IsPaintPending(handle))
        {
            return 609;
        }

        // EraseBackground runs inside Begin, on the session's DC.
        NativeHandle eraseDc{};
        NativeHandle sessionDc{};
        bool staleBackground = true;
        if (window->On<msg::EraseBackgroundPayload>([&eraseDc](const msg::EraseBackgroundPayload& erase) {
                eraseDc = erase.deviceContext;
                return HandlerResult::Handled();
            }) != WindowStatus::Ok ||
            window->On<msg::PaintPayload>([self, &sessionDc, &staleBackground](const msg::PaintPayload&) {
                PaintSession session;
                if (PaintSession::Begin(*self, session) != WindowStatus::Ok)
                {
                    return HandlerResult::NotHandled();
                }
                sessionDc       = session.GetDc();
                staleBackground = session.ShouldEraseBackground();
                return HandlerResult::Handled();
            }) != WindowStatus::Ok)
        {
            return 610;
        }
        if (window->Invalidate(true) != WindowStatus::Ok || window->Update() != WindowStatus::Ok ||
            !eraseDc.IsValid() || eraseDc != sessionDc || staleBackground || backend->IsPaintPending(handle))
        {
            return 611;
        }

        // Fills need an open session and sane arguments; sessions end on scope exit.
        PaintSession idle;
        if (idle.IsActive() || idle.FillRect(Rect::FromSize(4, 4), brush) != WindowStatus::InvalidState)
        {
            return 612;
        }
        {
            PaintSession outer;
            if (PaintSession::Begin(*window, outer) != WindowStatus::Ok || !outer.IsActive() ||
                outer.GetArea() != Rect{} || backend->GetActivePaintCount() != 1)
            {
                return 613;
            }
            PaintSession moved(std::move(outer));
            if (outer.IsActive() || !moved.IsActive() ||
                moved.FillRect(Rect{ 10, 10, 0, 0 }, brush) != WindowStatus::InvalidArg ||
                moved.FillRect(Rect::FromSize(4, 4), NativeHandle{}) != WindowStatus::InvalidArg)
            {
                return 614;
            }
        }
        if (backend->GetActivePaintCount() != 0)
        {
            return 615;
        }

        // A window destroyed mid-paint takes its DC along.
        {
            PaintSession orphaned;
            if (PaintSession::Begin(*window, orphaned) != WindowStatus::Ok)
            {
                return 616;
            }
            if (window->Destroy() != WindowStatus::Ok || backend->GetActivePaintCount() != 0 ||
                orphaned.FillArea(brush) != WindowStatus::OsFailure)
            {
                return 617;
            }
        }
        PaintSession late;
        if (PaintSession::Begin(*window, late) != WindowStatus::InvalidState || late.IsActive())
        {
            return 618;
        }

        return 0;
    }
}

int RunWindowObjectSmoke()
{
    runtime::GuiContext context{};
    if (runtime::InitGuiContext(context, smoke::MakeNullConfig()) != runtime::GuiStatus::Ok)
    {
        return 1;
    }

    const ClassToken frame = smoke::RegisterSmokeClass(context, "SmokeFrame");
    if (!frame.IsValid())
    {
        return 2;
    }

    if (const int result = RunLifecycleChecks(context, frame); result != 0)
    {
        return result;
    }
    if (const int result = RunDispatchChecks(context, frame); result != 0)
    {
        return result;
    }
    if (const int result = RunHierarchyChecks(context, frame); result != 0)
    {
        return result;
    }
    if (const int result = RunNestedControlChecks(context, frame); result != 0)
    {
        return result;
    }
    if (const int result = RunSelfReleaseChecks(context, frame); result != 0)
    {
        return result;
    }
    if (const int result = RunPaintChecks(context, frame); result != 0)
    {
        return result;
    }

    runtime::ShutdownGuiContext(context);
    return 0;
}
