#include <stdexcept>

#include "suspend_gate.hpp"
#include "hotplug_log.hpp"

void ResumeLatch::Set()
{
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_set = true;
    }
    m_latchCV.notify_all();
}

bool ResumeLatch::IsSet()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_set;
}

bool ResumeLatch::Wait(CancelToken &token)
{
    CancelCallback wakeOnCancel(token, [this]{
        std::lock_guard<std::mutex> lock(m_mutex);
        m_latchCV.notify_all();
    });

    std::unique_lock<std::mutex> lock(m_mutex);
    m_latchCV.wait(lock, [&]{ return m_set || token.IsCancelled(); });

    return m_set;
}

void SuspendGate::Suspend()
{
    HOTPLUG_LOG;

    std::lock_guard<std::mutex> lock(m_mutex);
    m_suspendCount++;
    if (!m_resumeLatch) {
        m_resumeLatch = std::make_shared<ResumeLatch>();
    }

    log(HOTPLUG_LOG_LEVEL_DEBUG) << "Suspended, count: " << m_suspendCount << endLog;
}

void SuspendGate::Resume()
{
    HOTPLUG_LOG;

    std::shared_ptr<ResumeLatch> latch;

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_suspendCount == 0) {
            throw std::logic_error("Resume() called without a matching Suspend()");
        }

        m_suspendCount--;
        log(HOTPLUG_LOG_LEVEL_DEBUG) << "Resumed, count: " << m_suspendCount << endLog;

        if (m_suspendCount == 0) {
            latch.swap(m_resumeLatch);
        }
    }

    if (latch) {
        latch->Set();
    }
}

bool SuspendGate::IsSuspended()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_suspendCount > 0;
}

unsigned int SuspendGate::GetSuspendCount()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_suspendCount;
}

bool SuspendGate::WaitWhileSuspended(CancelToken &token)
{
    for (;;) {
        std::shared_ptr<ResumeLatch> latch;

        {
            std::lock_guard<std::mutex> lock(m_mutex);
            if (m_suspendCount == 0) {
                return !token.IsCancelled();
            }
            latch = m_resumeLatch;
        }

        // The latch is held by reference count so a Resume() on another
        // thread never releases it from under us.
        if (!latch->Wait(token)) {
            return false;
        }
    }
}
