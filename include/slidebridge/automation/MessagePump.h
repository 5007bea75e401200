#pragma once
// =============================================================================
// SlideBridge - MessagePump
// The worker's only intentional wait. Protocol callbacks are delivered while
// the pump dispatches, so the worker's event handlers run inside
// waitAndDispatch() on the worker thread.
// =============================================================================

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>

namespace SlideBridge
{

class MessagePump
{
public:
    virtual ~MessagePump() = default;

    // Binds the calling thread to the protocol's single-threaded apartment.
    // Every other method except wake() must be called on that same thread.
    virtual bool enterApartment() = 0;
    virtual void leaveApartment() = 0;

    // Dispatches pending callbacks, waiting at most timeoutMs for one to
    // arrive. Returns early when wake() is called.
    virtual void waitAndDispatch(int timeoutMs) = 0;

    // Any thread.
    virtual void wake() = 0;
};

// Condition-variable pump with no apartment: used off Windows and in tests.
class WaitPump : public MessagePump
{
public:
    bool enterApartment() override { return true; }
    void leaveApartment() override {}
    void waitAndDispatch(int timeoutMs) override;
    void wake() override;

    uint64_t wakeCount() const { return wakes_.load(std::memory_order_relaxed); }

private:
    std::mutex mutex_;
    std::condition_variable cv_;
    bool signaled_ = false;
    std::atomic<uint64_t> wakes_{0};
};

// Windows: COM single-threaded apartment with a thread message pump.
// Elsewhere: WaitPump.
std::unique_ptr<MessagePump> createPlatformPump();

} // namespace SlideBridge
