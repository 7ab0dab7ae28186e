#include "hotplug_notifier.hpp"
#include "hotplug_log.hpp"

void HotplugNotifier::Notify()
{
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_pendingEvents++;
    }
    m_eventCV.notify_all();
}

void HotplugNotifier::SetFailed()
{
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_failed = true;
    }
    m_eventCV.notify_all();
}

bool HotplugNotifier::HasFailed()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_failed;
}

bool HotplugNotifier::WaitForEvents(CancelToken &token, std::chrono::milliseconds settleTime)
{
    HOTPLUG_LOG;

    CancelCallback wakeOnCancel(token, [this]{
        std::lock_guard<std::mutex> lock(m_mutex);
        m_eventCV.notify_all();
    });

    std::unique_lock<std::mutex> lock(m_mutex);
    m_eventCV.wait(lock, [&]{ return m_pendingEvents > 0 || m_failed || token.IsCancelled(); });

    if (m_pendingEvents == 0 && m_failed) {
        return false;
    }

    // Keep waiting while events arrive close to each other so a burst of
    // notifications while the bus settles down triggers a single scan.
    while (!token.IsCancelled() && !m_failed && m_pendingEvents > 0) {
        log(HOTPLUG_LOG_LEVEL_DEBUG) << "Hotplug events pending: " << m_pendingEvents << endLog;
        m_pendingEvents = 0;
        m_eventCV.wait_for(lock, settleTime, [&]{ return m_pendingEvents > 0 || m_failed || token.IsCancelled(); });
    }
    m_pendingEvents = 0;

    return true;
}
