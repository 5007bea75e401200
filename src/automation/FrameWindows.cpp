// =============================================================================
// SlideBridge - FrameWindows
// =============================================================================

#include "slidebridge/automation/FrameWindows.h"

#ifndef SLIDEBRIDGE_TESTING
#include "slidebridge/automation/ComHelpers.h"

#include <cwchar>
#endif

namespace SlideBridge
{

uintptr_t matchFrameWindow(const std::string& caption, const std::vector<FrameWindow>& frames)
{
    if (caption.empty())
        return 0;

    const std::string prefix = caption + " - ";
    std::vector<uintptr_t> exact, prefixed;
    for (const auto& f : frames)
    {
        if (f.title == caption)
            exact.push_back(f.hwnd);
        else if (f.title.size() > prefix.size() && f.title.compare(0, prefix.size(), prefix) == 0)
            prefixed.push_back(f.hwnd);
    }

    if (!exact.empty())
        return exact.size() == 1 ? exact.front() : 0;
    return prefixed.size() == 1 ? prefixed.front() : 0;
}

#ifndef SLIDEBRIDGE_TESTING

static const wchar_t* kFrameClass = L"PPTFrameClass";

struct FrameSearch
{
    DWORD processId = 0;
    std::vector<FrameWindow> frames;
};

static BOOL CALLBACK collectFrame(HWND hwnd, LPARAM lParam)
{
    auto* search = reinterpret_cast<FrameSearch*>(lParam);

    DWORD processId = 0;
    GetWindowThreadProcessId(hwnd, &processId);
    if (processId != search->processId)
        return TRUE;

    wchar_t className[64] = {};
    if (GetClassNameW(hwnd, className, 64) == 0 || wcscmp(className, kFrameClass) != 0)
        return TRUE;

    const int length = GetWindowTextLengthW(hwnd);
    if (length <= 0)
        return TRUE;
    std::wstring title(static_cast<size_t>(length) + 1, L'\0');
    const int copied = GetWindowTextW(hwnd, &title[0], length + 1);
    title.resize(static_cast<size_t>(copied > 0 ? copied : 0));

    FrameWindow frame;
    frame.hwnd = reinterpret_cast<uintptr_t>(hwnd);
    frame.title = narrow(title.c_str());
    search->frames.push_back(std::move(frame));
    return TRUE;
}

std::vector<FrameWindow> listFrameWindows(uintptr_t applicationWindow)
{
    FrameSearch search;
    if (applicationWindow == 0 ||
        GetWindowThreadProcessId(reinterpret_cast<HWND>(applicationWindow), &search.processId) == 0)
        return {};

    EnumWindows(collectFrame, reinterpret_cast<LPARAM>(&search));
    return std::move(search.frames);
}

#else // SLIDEBRIDGE_TESTING: no window manager

std::vector<FrameWindow> listFrameWindows(uintptr_t)
{
    return {};
}

#endif // SLIDEBRIDGE_TESTING

} // namespace SlideBridge
