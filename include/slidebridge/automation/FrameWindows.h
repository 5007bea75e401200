#pragma once
// =============================================================================
// SlideBridge - FrameWindows
// The editor's object model gives a document window no handle of its own.
// Each document window lives in a top-level frame whose title starts with
// the window caption, so the frame is found by title among the editor
// process's frames.
// =============================================================================

#include <cstdint>
#include <string>
#include <vector>

namespace SlideBridge
{

struct FrameWindow
{
    uintptr_t   hwnd = 0;
    std::string title;  // UTF-8
};

// The one frame titled exactly `caption`, else the one titled
// "<caption> - <application>". 0 when nothing or more than one matches.
uintptr_t matchFrameWindow(const std::string& caption, const std::vector<FrameWindow>& frames);

// Top-level editor frames in the process that owns applicationWindow.
// Always empty off Windows.
std::vector<FrameWindow> listFrameWindows(uintptr_t applicationWindow);

} // namespace SlideBridge
