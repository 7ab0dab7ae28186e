#pragma once

#include <condition_variable>
#include <memory>
#include <mutex>

#include "cancel_token.hpp"

// Single-shot broadcast signal. Once set, every current and future waiter
// is released.
class ResumeLatch {
public:
    void Set();
    bool IsSet();

    // Returns false if the token was cancelled before the latch was set.
    bool Wait(CancelToken &token);

private:
    std::mutex m_mutex;
    std::condition_variable m_latchCV;
    bool m_set = false;
};

// Counter of outstanding suspensions guarding a latch that is re-created
// whenever the counter leaves zero and released when it returns to zero.
class SuspendGate {
public:
    SuspendGate() = default;

    SuspendGate(const SuspendGate&) = delete;
    SuspendGate& operator=(const SuspendGate&) = delete;

    void Suspend();
    void Resume();

    bool IsSuspended();
    unsigned int GetSuspendCount();

    // Blocks while the gate is suspended. Returns false if the token was
    // cancelled while waiting.
    bool WaitWhileSuspended(CancelToken &token);

private:
    std::mutex m_mutex;
    unsigned int m_suspendCount = 0;
    std::shared_ptr<ResumeLatch> m_resumeLatch;
};

// Suspends a gate for the lifetime of the object.
class ScopedSuspend {
public:
    explicit ScopedSuspend(SuspendGate &gate) : m_gate{gate}
    {
        m_gate.Suspend();
    }

    ~ScopedSuspend()
    {
        m_gate.Resume();
    }

    ScopedSuspend(const ScopedSuspend&) = delete;
    ScopedSuspend& operator=(const ScopedSuspend&) = delete;

private:
    SuspendGate &m_gate;
};
