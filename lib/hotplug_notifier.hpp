#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>

#include "cancel_token.hpp"

// Hands hotplug notifications from the event thread of a backend to the
// scan loop. Once the event thread reports a failure, no notification will
// ever arrive again and waiters have to fall back to polling.
class HotplugNotifier {
public:
    void Notify();
    void SetFailed();
    bool HasFailed();

    // Waits for the first notification, then keeps waiting while further
    // notifications arrive within settleTime. Returns false without waiting
    // for a notification once the event thread has failed.
    bool WaitForEvents(CancelToken &token, std::chrono::milliseconds settleTime);

private:
    std::mutex m_mutex;
    std::condition_variable m_eventCV;
    uint64_t m_pendingEvents = 0;
    bool m_failed = false;
};
