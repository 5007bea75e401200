// =============================================================================
// SlideBridge - MessagePump
// Win32: CoInitializeEx(COINIT_APARTMENTTHREADED) and a bounded
// MsgWaitForMultipleObjectsEx wait. Incoming COM calls (event callbacks) are
// delivered as window messages to the apartment's hidden window, so the
// PeekMessage/DispatchMessage loop is what runs the event sink.
// =============================================================================

#include "slidebridge/automation/MessagePump.h"
#include "slidebridge/support/DebugLog.h"

#include <chrono>

namespace SlideBridge
{

// ─── WaitPump ────────────────────────────────────────────────────────────────

void WaitPump::waitAndDispatch(int timeoutMs)
{
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait_for(lock, std::chrono::milliseconds(timeoutMs), [this] { return signaled_; });
    signaled_ = false;
}

void WaitPump::wake()
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        signaled_ = true;
    }
    wakes_.fetch_add(1, std::memory_order_relaxed);
    cv_.notify_one();
}

} // namespace SlideBridge

#ifndef SLIDEBRIDGE_TESTING

#include "slidebridge/common/BridgeMessages.h"

#include <objbase.h>

#pragma comment(lib, "Ole32.lib")

namespace SlideBridge
{

class ApartmentPump : public MessagePump
{
public:
    bool enterApartment() override
    {
        HRESULT hr = CoInitializeEx(nullptr, COINIT_APARTMENTTHREADED);
        if (FAILED(hr))
        {
            logError("CoInitializeEx(STA) failed");
            return false;
        }
        initialized_ = true;

        // Force creation of the thread's message queue before anyone posts.
        MSG msg;
        PeekMessageW(&msg, nullptr, WM_USER, WM_USER, PM_NOREMOVE);
        threadId_.store(GetCurrentThreadId(), std::memory_order_release);
        return true;
    }

    void leaveApartment() override
    {
        threadId_.store(0, std::memory_order_release);
        if (initialized_)
        {
            CoUninitialize();
            initialized_ = false;
        }
    }

    void waitAndDispatch(int timeoutMs) override
    {
        MsgWaitForMultipleObjectsEx(0, nullptr, static_cast<DWORD>(timeoutMs), QS_ALLINPUT,
                                    MWMO_INPUTAVAILABLE);

        MSG msg;
        while (PeekMessageW(&msg, nullptr, 0, 0, PM_REMOVE))
        {
            if (msg.hwnd == nullptr && (msg.message == WM_BRIDGE_WAKE || msg.message == WM_BRIDGE_STOP))
                continue; // only there to end the wait
            TranslateMessage(&msg);
            DispatchMessageW(&msg);
        }
    }

    void wake() override
    {
        DWORD id = threadId_.load(std::memory_order_acquire);
        if (id != 0)
            PostThreadMessageW(id, WM_BRIDGE_WAKE, 0, 0);
    }

private:
    std::atomic<DWORD> threadId_{0};
    bool initialized_ = false;
};

std::unique_ptr<MessagePump> createPlatformPump()
{
    return std::make_unique<ApartmentPump>();
}

} // namespace SlideBridge

#else // SLIDEBRIDGE_TESTING

namespace SlideBridge
{

std::unique_ptr<MessagePump> createPlatformPump()
{
    return std::make_unique<WaitPump>();
}

} // namespace SlideBridge

#endif // SLIDEBRIDGE_TESTING
