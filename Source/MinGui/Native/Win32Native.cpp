// ============================================================================
// MinGui - Source/MinGui/Native/Win32Native.cpp
// ----------------------------------------------------------------------------
// Purpose : user32/gdi32 implementation of the Native contract.
// Contract: No exceptions/RTTI escape. Every failing call records
//           GetLastError() for GetLastOsError().
// Notes   : All owned classes share one WNDPROC (Win32WindowThunk) that maps
//           GetClassWord(GCW_ATOM) back to the registered WindowProc.
// ============================================================================

#include "MinGui/Native/Win32Native.hpp"

#include "MinGui/Platform/PlatformDefines.hpp"

#include <algorithm>
#include <new>

#if MINGUI_PLATFORM_WINDOWS
#    ifndef WIN32_LEAN_AND_MEAN
#        define WIN32_LEAN_AND_MEAN
#    endif
#    ifndef NOMINMAX
#        define NOMINMAX
#    endif
#    include <windows.h>
#else
#    error "Win32Native.cpp is only built for Windows targets."
#endif

namespace mingui::native
{
namespace
{
    Win32Native* s_ActiveBackend = nullptr;

    [[nodiscard]] inline HWND ToHwnd(NativeHandle handle) noexcept
    {
        return reinterpret_cast<HWND>(static_cast<UINT_PTR>(handle.value));
    }

    [[nodiscard]] inline HMENU ToHmenu(NativeHandle handle) noexcept
    {
        return reinterpret_cast<HMENU>(static_cast<UINT_PTR>(handle.value));
    }

    template <typename T>
    [[nodiscard]] inline NativeHandle FromPointer(T* pointer) noexcept
    {
        return NativeHandle{ static_cast<u64>(reinterpret_cast<UINT_PTR>(pointer)) };
    }

    [[nodiscard]] inline std::string ToCString(TextView text)
    {
        return std::string(text.AsStringView());
    }

    LRESULT CALLBACK Win32WindowThunk(HWND hwnd, UINT code, WPARAM wParam, LPARAM lParam)
    {
        Win32Native* backend = s_ActiveBackend;
        const ClassAtom atom = static_cast<ClassAtom>(::GetClassWord(hwnd, GCW_ATOM));
        const WindowProc proc = (backend != nullptr) ? backend->FindClassProc(atom) : nullptr;
        if (proc == nullptr)
        {
            return ::DefWindowProcA(hwnd, code, wParam, lParam);
        }

        const NativeHandle handle = FromPointer(hwnd);
        if (code != WM_NCCREATE && code != WM_CREATE)
        {
            return static_cast<LRESULT>(proc(handle, code, static_cast<WordParam>(wParam), static_cast<LongParam>(lParam)));
        }

        const auto* createStruct = reinterpret_cast<const CREATESTRUCTA*>(lParam);

        NativeCreateParams params{};
        params.classAtom = atom;
        if (createStruct->lpszClass != nullptr && !IS_INTRESOURCE(createStruct->lpszClass))
        {
            params.className = MakeTextView(createStruct->lpszClass);
        }
        params.parent    = FromPointer(createStruct->hwndParent);
        params.controlId = ((createStruct->style & WS_CHILD) != 0)
            ? static_cast<u16>(reinterpret_cast<UINT_PTR>(createStruct->hMenu))
            : u16{0};
        params.userParam = createStruct->lpCreateParams;

        try
        {
            backend->PushCreateFrame(&params, static_cast<LongParam>(lParam));
        }
        catch (const std::bad_alloc&)
        {
            return (code == WM_NCCREATE) ? FALSE : -1;
        }

        const NativeResult result = proc(handle, code, static_cast<WordParam>(wParam), reinterpret_cast<LongParam>(&params));
        backend->PopCreateFrame();
        return static_cast<LRESULT>(result);
    }

    [[nodiscard]] NativeStatus StatusFromOsError(OsErrorCode error, NativeStatus fallback) noexcept
    {
        switch (error)
        {
            case os_error::kClassAlreadyExists:  return NativeStatus::AlreadyExists;
            case os_error::kCannotFindClass:     return NativeStatus::NotFound;
            case os_error::kClassDoesNotExist:   return NativeStatus::NotFound;
            case os_error::kInvalidWindowHandle: return NativeStatus::InvalidArg;
            case os_error::kInvalidMenuHandle:   return NativeStatus::InvalidArg;
            case os_error::kInvalidParameter:    return NativeStatus::InvalidArg;
            case os_error::kNotEnoughMemory:     return NativeStatus::OutOfResources;
            default:                             return fallback;
        }
    }
} // namespace

bool Win32Native::Init() noexcept
{
    Shutdown();

    if (s_ActiveBackend != nullptr)
    {
        return false;
    }

    s_ActiveBackend = this;
    m_IsInitialized = true;
    m_LastError     = os_error::kNone;
    return true;
}

void Win32Native::Shutdown() noexcept
{
    if (!m_IsInitialized)
    {
        return;
    }

    HINSTANCE instance = ::GetModuleHandleA(nullptr);
    for (const ClassRecord& record : m_Classes)
    {
        (void)::UnregisterClassA(record.name.c_str(), instance);
    }
    m_Classes.clear();
    m_CreateFrames.clear();
    m_PaintFrames.clear();

    if (s_ActiveBackend == this)
    {
        s_ActiveBackend = nullptr;
    }
    m_IsInitialized = false;
}

WindowProc Win32Native::FindClassProc(ClassAtom atom) const noexcept
{
    for (const ClassRecord& record : m_Classes)
    {
        if (record.atom == atom)
        {
            return record.proc;
        }
    }
    return nullptr;
}

void Win32Native::PushCreateFrame(const NativeCreateParams* converted, LongParam original)
{
    m_CreateFrames.push_back(CreateFrame{ converted, original });
}

void Win32Native::PopCreateFrame() noexcept
{
    if (!m_CreateFrames.empty())
    {
        m_CreateFrames.pop_back();
    }
}

NativeCaps Win32Native::GetCaps() const noexcept
{
    NativeCaps caps{};
    caps.determinism     = DeterminismMode::Off;
    caps.threadSafety    = ThreadSafetyMode::ThreadConfined;
    caps.blockingQueue   = true;
    caps.recyclesHandles = true;
    return caps;
}

NativeStatus Win32Native::FailWithLastError(NativeStatus status) noexcept
{
    m_LastError = static_cast<OsErrorCode>(::GetLastError());
    return StatusFromOsError(m_LastError, status);
}

NativeStatus Win32Native::Succeed() noexcept
{
    m_LastError = os_error::kNone;
    return NativeStatus::Ok;
}

// ----------------------------------------------------------------------------
// Classes
// ----------------------------------------------------------------------------

NativeStatus Win32Native::RegisterWindowClass(const NativeClassDesc& desc, ClassAtom& outAtom) noexcept
{
    outAtom = 0;
    if (!m_IsInitialized || desc.name.size == 0 || desc.proc == nullptr)
    {
        m_LastError = os_error::kInvalidParameter;
        return NativeStatus::InvalidArg;
    }

    try
    {
        ClassRecord record{};
        record.name = ToCString(desc.name);
        record.proc = desc.proc;

        WNDCLASSEXA wc{};
        wc.cbSize        = sizeof(WNDCLASSEXA);
        wc.style         = desc.style;
        wc.lpfnWndProc   = &Win32WindowThunk;
        wc.hInstance     = ::GetModuleHandleA(nullptr);
        wc.hIcon         = reinterpret_cast<HICON>(static_cast<UINT_PTR>(desc.icon.value));
        wc.hIconSm       = reinterpret_cast<HICON>(static_cast<UINT_PTR>(desc.smallIcon.value));
        wc.hCursor       = reinterpret_cast<HCURSOR>(static_cast<UINT_PTR>(desc.cursor.value));
        wc.hbrBackground = reinterpret_cast<HBRUSH>(static_cast<UINT_PTR>(desc.background.value));
        wc.lpszMenuName  = (desc.menuResource != 0) ? MAKEINTRESOURCEA(desc.menuResource) : nullptr;
        wc.lpszClassName = record.name.c_str();

        const ATOM atom = ::RegisterClassExA(&wc);
        if (atom == 0)
        {
            return FailWithLastError(NativeStatus::Rejected);
        }

        record.atom = static_cast<ClassAtom>(atom);
        outAtom = record.atom;
        m_Classes.push_back(std::move(record));
    }
    catch (const std::bad_alloc&)
    {
        m_LastError = os_error::kNotEnoughMemory;
        return NativeStatus::OutOfResources;
    }

    return Succeed();
}

NativeStatus Win32Native::UnregisterWindowClass(TextView name) noexcept
{
    try
    {
        const std::string className = ToCString(name);
        if (::UnregisterClassA(className.c_str(), ::GetModuleHandleA(nullptr)) == FALSE)
        {
            return FailWithLastError(NativeStatus::Rejected);
        }

        std::erase_if(m_Classes, [&className](const ClassRecord& record) {
            return ::lstrcmpiA(record.name.c_str(), className.c_str()) == 0;
        });
    }
    catch (const std::bad_alloc&)
    {
        m_LastError = os_error::kNotEnoughMemory;
        return NativeStatus::OutOfResources;
    }

    return Succeed();
}

// ----------------------------------------------------------------------------
// Window lifetime
// ----------------------------------------------------------------------------

NativeStatus Win32Native::CreateNativeWindow(const NativeWindowDesc& desc, NativeHandle& outHandle) noexcept
{
    outHandle = NativeHandle::Invalid();

    try
    {
        const std::string className = ToCString(desc.className);
        const std::string title     = ToCString(desc.title);

        HMENU menuOrId = nullptr;
        if (desc.parent.IsValid())
        {
            menuOrId = reinterpret_cast<HMENU>(static_cast<UINT_PTR>(desc.controlId));
        }

        ::SetLastError(0);
        HWND hwnd = ::CreateWindowExA(desc.exStyle,
                                      className.c_str(),
                                      title.c_str(),
                                      desc.style,
                                      desc.x,
                                      desc.y,
                                      desc.width,
                                      desc.height,
                                      ToHwnd(desc.parent),
                                      menuOrId,
                                      ::GetModuleHandleA(nullptr),
                                      desc.userParam);
        if (hwnd == nullptr)
        {
            const NativeStatus status = FailWithLastError(NativeStatus::Rejected);
            if (m_LastError == os_error::kNone)
            {
                // Aborted by NcCreate/Create without an OS error.
                m_LastError = os_error::kCancelled;
            }
            return status;
        }

        outHandle = FromPointer(hwnd);
    }
    catch (const std::bad_alloc&)
    {
        m_LastError = os_error::kNotEnoughMemory;
        return NativeStatus::OutOfResources;
    }

    return Succeed();
}

NativeStatus Win32Native::DestroyNativeWindow(NativeHandle handle) noexcept
{
    if (::DestroyWindow(ToHwnd(handle)) == FALSE)
    {
        return FailWithLastError(NativeStatus::Failed);
    }
    return Succeed();
}

bool Win32Native::IsLiveWindow(NativeHandle handle) const noexcept
{
    return handle.IsValid() && ::IsWindow(ToHwnd(handle)) != FALSE;
}

NativeResult Win32Native::CallDefaultProc(NativeHandle handle, u32 code, WordParam wParam, LongParam lParam) noexcept
{
    LongParam forwarded = lParam;
    if (code == WM_NCCREATE || code == WM_CREATE)
    {
        const auto* converted = reinterpret_cast<const NativeCreateParams*>(lParam);
        for (auto it = m_CreateFrames.rbegin(); it != m_CreateFrames.rend(); ++it)
        {
            if (it->converted == converted)
            {
                forwarded = it->original;
                break;
            }
        }
    }

    return static_cast<NativeResult>(::DefWindowProcA(ToHwnd(handle), code,
                                                      static_cast<WPARAM>(wParam),
                                                      static_cast<LPARAM>(forwarded)));
}

// ----------------------------------------------------------------------------
// Queue
// ----------------------------------------------------------------------------

GetMessageResult Win32Native::GetNextMessage(NativeMessage& outMessage) noexcept
{
    outMessage = NativeMessage{};

    MSG msg{};
    const BOOL result = ::GetMessageA(&msg, nullptr, 0, 0);
    if (result == -1)
    {
        m_LastError = static_cast<OsErrorCode>(::GetLastError());
        return GetMessageResult::Failed;
    }

    outMessage.handle = FromPointer(msg.hwnd);
    outMessage.code   = msg.message;
    outMessage.wParam = static_cast<WordParam>(msg.wParam);
    outMessage.lParam = static_cast<LongParam>(msg.lParam);

    m_LastMessage       = outMessage;
    m_LastMessageTime   = msg.time;
    m_LastMessagePointX = msg.pt.x;
    m_LastMessagePointY = msg.pt.y;

    return (result == 0) ? GetMessageResult::Quit : GetMessageResult::Message;
}

NativeResult Win32Native::DispatchNativeMessage(const NativeMessage& message) noexcept
{
    MSG msg{};
    msg.hwnd    = ToHwnd(message.handle);
    msg.message = message.code;
    msg.wParam  = static_cast<WPARAM>(message.wParam);
    msg.lParam  = static_cast<LPARAM>(message.lParam);

    if (message.handle == m_LastMessage.handle && message.code == m_LastMessage.code &&
        message.wParam == m_LastMessage.wParam && message.lParam == m_LastMessage.lParam)
    {
        msg.time = m_LastMessageTime;
        msg.pt.x = m_LastMessagePointX;
        msg.pt.y = m_LastMessagePointY;
    }

    (void)::TranslateMessage(&msg);
    return static_cast<NativeResult>(::DispatchMessageA(&msg));
}

NativeStatus Win32Native::PostNativeMessage(NativeHandle handle, u32 code, WordParam wParam, LongParam lParam) noexcept
{
    if (::PostMessageA(ToHwnd(handle), code, static_cast<WPARAM>(wParam), static_cast<LPARAM>(lParam)) == FALSE)
    {
        return FailWithLastError(NativeStatus::Failed);
    }
    return Succeed();
}

NativeStatus Win32Native::SendNativeMessage(NativeHandle handle, u32 code, WordParam wParam, LongParam lParam, NativeResult& outResult) noexcept
{
    outResult = 0;
    if (!IsLiveWindow(handle))
    {
        m_LastError = os_error::kInvalidWindowHandle;
        return NativeStatus::InvalidArg;
    }

    outResult = static_cast<NativeResult>(::SendMessageA(ToHwnd(handle), code, static_cast<WPARAM>(wParam), static_cast<LPARAM>(lParam)));
    return Succeed();
}

void Win32Native::PostQuit(i32 exitCode) noexcept
{
    ::PostQuitMessage(exitCode);
}

// ----------------------------------------------------------------------------
// Timers
// ----------------------------------------------------------------------------

NativeStatus Win32Native::SetTimer(NativeHandle handle, TimerId id, u32 elapseMs) noexcept
{
    if (::SetTimer(ToHwnd(handle), static_cast<UINT_PTR>(id), elapseMs, nullptr) == 0)
    {
        return FailWithLastError(NativeStatus::Failed);
    }
    return Succeed();
}

NativeStatus Win32Native::KillTimer(NativeHandle handle, TimerId id) noexcept
{
    if (::KillTimer(ToHwnd(handle), static_cast<UINT_PTR>(id)) == FALSE)
    {
        return FailWithLastError(NativeStatus::NotFound);
    }
    return Succeed();
}

// ----------------------------------------------------------------------------
// Menus
// ----------------------------------------------------------------------------

NativeStatus Win32Native::CreateNativeMenu(MenuKind kind, NativeHandle& outMenu) noexcept
{
    outMenu = NativeHandle::Invalid();

    HMENU menu = (kind == MenuKind::Popup) ? ::CreatePopupMenu() : ::CreateMenu();
    if (menu == nullptr)
    {
        return FailWithLastError(NativeStatus::OutOfResources);
    }

    outMenu = FromPointer(menu);
    return Succeed();
}

NativeStatus Win32Native::AppendMenuItem(NativeHandle menu, u16 id, TextView text) noexcept
{
    try
    {
        const std::string label = ToCString(text);
        if (::AppendMenuA(ToHmenu(menu), MF_STRING, static_cast<UINT_PTR>(id), label.c_str()) == FALSE)
        {
            return FailWithLastError(NativeStatus::Failed);
        }
    }
    catch (const std::bad_alloc&)
    {
        m_LastError = os_error::kNotEnoughMemory;
        return NativeStatus::OutOfResources;
    }
    return Succeed();
}

NativeStatus Win32Native::AppendMenuSeparator(NativeHandle menu) noexcept
{
    if (::AppendMenuA(ToHmenu(menu), MF_SEPARATOR, 0, nullptr) == FALSE)
    {
        return FailWithLastError(NativeStatus::Failed);
    }
    return Succeed();
}

NativeStatus Win32Native::AppendSubMenu(NativeHandle menu, NativeHandle subMenu, TextView text) noexcept
{
    try
    {
        const std::string label = ToCString(text);
        if (::AppendMenuA(ToHmenu(menu), MF_POPUP, static_cast<UINT_PTR>(subMenu.value), label.c_str()) == FALSE)
        {
            return FailWithLastError(NativeStatus::Failed);
        }
    }
    catch (const std::bad_alloc&)
    {
        m_LastError = os_error::kNotEnoughMemory;
        return NativeStatus::OutOfResources;
    }
    return Succeed();
}

NativeStatus Win32Native::SetWindowMenu(NativeHandle window, NativeHandle menu) noexcept
{
    if (::SetMenu(ToHwnd(window), ToHmenu(menu)) == FALSE)
    {
        return FailWithLastError(NativeStatus::Failed);
    }
    return Succeed();
}

NativeStatus Win32Native::DestroyNativeMenu(NativeHandle menu) noexcept
{
    if (::DestroyMenu(ToHmenu(menu)) == FALSE)
    {
        return FailWithLastError(NativeStatus::Failed);
    }
    return Succeed();
}

// ----------------------------------------------------------------------------
// GDI
// ----------------------------------------------------------------------------

NativeStatus Win32Native::CreateBrush(ColorRef color, NativeHandle& outBrush) noexcept
{
    outBrush = NativeHandle::Invalid();

    HBRUSH brush = ::CreateSolidBrush(static_cast<COLORREF>(color));
    if (brush == nullptr)
    {
        return FailWithLastError(NativeStatus::OutOfResources);
    }

    outBrush = FromPointer(brush);
    return Succeed();
}

NativeStatus Win32Native::DeleteGdiObject(NativeHandle object) noexcept
{
    if (::DeleteObject(reinterpret_cast<HGDIOBJ>(static_cast<UINT_PTR>(object.value))) == FALSE)
    {
        m_LastError = os_error::kInvalidHandle;
        return NativeStatus::InvalidArg;
    }
    return Succeed();
}

// ----------------------------------------------------------------------------
// Window properties
// ----------------------------------------------------------------------------

NativeStatus Win32Native::ShowNativeWindow(NativeHandle handle, ShowCommand command) noexcept
{
    if (!IsLiveWindow(handle))
    {
        m_LastError = os_error::kInvalidWindowHandle;
        return NativeStatus::InvalidArg;
    }

    // The return value is the previous visibility, not a status.
    (void)::ShowWindow(ToHwnd(handle), static_cast<int>(command));
    return Succeed();
}

NativeStatus Win32Native::UpdateNativeWindow(NativeHandle handle) noexcept
{
    if (::UpdateWindow(ToHwnd(handle)) == FALSE)
    {
        return FailWithLastError(NativeStatus::Failed);
    }
    return Succeed();
}

NativeStatus Win32Native::SetWindowTitle(NativeHandle handle, TextView text) noexcept
{
    try
    {
        const std::string title = ToCString(text);
        if (::SetWindowTextA(ToHwnd(handle), title.c_str()) == FALSE)
        {
            return FailWithLastError(NativeStatus::Failed);
        }
    }
    catch (const std::bad_alloc&)
    {
        m_LastError = os_error::kNotEnoughMemory;
        return NativeStatus::OutOfResources;
    }
    return Succeed();
}

NativeStatus Win32Native::GetWindowTitle(NativeHandle handle, char* buffer, u32 capacity, u32& outLength) noexcept
{
    outLength = 0;
    if (!IsLiveWindow(handle))
    {
        m_LastError = os_error::kInvalidWindowHandle;
        return NativeStatus::InvalidArg;
    }

    if (buffer == nullptr)
    {
        outLength = static_cast<u32>(std::max(::GetWindowTextLengthA(ToHwnd(handle)), 0));
        return Succeed();
    }
    if (capacity == 0)
    {
        m_LastError = os_error::kInvalidParameter;
        return NativeStatus::InvalidArg;
    }

    const int copied = ::GetWindowTextA(ToHwnd(handle), buffer, static_cast<int>(capacity));
    outLength = static_cast<u32>(std::max(copied, 0));
    return Succeed();
}

NativeStatus Win32Native::GetClientArea(NativeHandle handle, Rect& outRect) noexcept
{
    outRect = Rect{};

    RECT rect{};
    if (::GetClientRect(ToHwnd(handle), &rect) == FALSE)
    {
        return FailWithLastError(NativeStatus::Failed);
    }

    outRect = Rect{ rect.left, rect.top, rect.right, rect.bottom };
    return Succeed();
}

NativeStatus Win32Native::MoveNativeWindow(NativeHandle handle, const Rect& rect) noexcept
{
    if (::MoveWindow(ToHwnd(handle), rect.X(), rect.Y(), rect.Width(), rect.Height(), TRUE) == FALSE)
    {
        return FailWithLastError(NativeStatus::Failed);
    }
    return Succeed();
}

// ----------------------------------------------------------------------------
// Paint
// ----------------------------------------------------------------------------

static_assert(sizeof(PAINTSTRUCT) <= 128, "PaintFrame storage is too small for PAINTSTRUCT.");
static_assert(alignof(PAINTSTRUCT) <= 8, "PaintFrame storage is under-aligned for PAINTSTRUCT.");

NativeStatus Win32Native::InvalidateNativeWindow(NativeHandle handle, bool eraseBackground) noexcept
{
    if (::InvalidateRect(ToHwnd(handle), nullptr, eraseBackground ? TRUE : FALSE) == FALSE)
    {
        return FailWithLastError(NativeStatus::Failed);
    }
    return Succeed();
}

NativeStatus Win32Native::BeginNativePaint(NativeHandle handle, NativePaintInfo& outInfo) noexcept
{
    outInfo = NativePaintInfo{};
    if (!IsLiveWindow(handle))
    {
        m_LastError = os_error::kInvalidWindowHandle;
        return NativeStatus::InvalidArg;
    }

    PaintFrame frame{};
    frame.window = handle.value;
    PAINTSTRUCT* paint = reinterpret_cast<PAINTSTRUCT*>(frame.paintStruct.data());

    HDC dc = ::BeginPaint(ToHwnd(handle), paint);
    if (dc == nullptr)
    {
        return FailWithLastError(NativeStatus::Failed);
    }
    frame.dc = FromPointer(dc).value;

    try
    {
        m_PaintFrames.push_back(frame);
    }
    catch (const std::bad_alloc&)
    {
        (void)::EndPaint(ToHwnd(handle), paint);
        m_LastError = os_error::kNotEnoughMemory;
        return NativeStatus::OutOfResources;
    }

    outInfo.dc              = NativeHandle{ frame.dc };
    outInfo.area            = Rect{ paint->rcPaint.left, paint->rcPaint.top, paint->rcPaint.right, paint->rcPaint.bottom };
    outInfo.eraseBackground = (paint->fErase != FALSE);
    return Succeed();
}

NativeStatus Win32Native::EndNativePaint(NativeHandle handle, NativeHandle dc) noexcept
{
    const auto it = std::find_if(m_PaintFrames.begin(), m_PaintFrames.end(), [&](const PaintFrame& frame) {
        return frame.window == handle.value && frame.dc == dc.value;
    });
    if (it == m_PaintFrames.end())
    {
        m_LastError = os_error::kInvalidHandle;
        return NativeStatus::InvalidArg;
    }

    // EndPaint always succeeds.
    (void)::EndPaint(ToHwnd(handle), reinterpret_cast<const PAINTSTRUCT*>(it->paintStruct.data()));
    m_PaintFrames.erase(it);
    return Succeed();
}

NativeStatus Win32Native::FillArea(NativeHandle dc, const Rect& area, NativeHandle brush) noexcept
{
    const RECT rect{ area.left, area.top, area.right, area.bottom };
    if (::FillRect(reinterpret_cast<HDC>(static_cast<UINT_PTR>(dc.value)), &rect,
                   reinterpret_cast<HBRUSH>(static_cast<UINT_PTR>(brush.value))) == 0)
    {
        return FailWithLastError(NativeStatus::Failed);
    }
    return Succeed();
}

} // namespace mingui::native
