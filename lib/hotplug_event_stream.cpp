#include <deque>
#include <map>
#include <set>

#include "hotplug_event_stream.hpp"
#include "hotplug_log.hpp"

const std::string HotplugEventTypeToString(HotplugEventType type)
{
    switch (type) {
        case HOTPLUG_EVENT_ADDED:
            return "added";
        case HOTPLUG_EVENT_REMOVED:
            return "removed";
        default:
            return "unknown";
    }
}

class HotplugEventStream::HotplugEventStreamImpl {
public:
    HotplugEventStreamImpl(std::shared_ptr<USBBusScanner> scanner, std::shared_ptr<SuspendGate> gate,
        CancelToken &token, std::shared_ptr<std::atomic<bool>> streamOpen)
        : m_scanner{scanner}, m_gate{gate}, m_token{token}, m_streamOpen{streamOpen}
    {}

    ~HotplugEventStreamImpl()
    {
        if (m_streamOpen) {
            m_streamOpen->store(false);
        }
    }

    bool Next(HotplugEvent &event)
    {
        HOTPLUG_LOG;

        while (m_pendingEvents.empty()) {
            if (m_finished || m_token.IsCancelled()) {
                m_finished = true;
                return false;
            }

            try {
                if (m_cycleCount > 0) {
                    m_scanner->WaitUntilNextScan(m_token);
                    if (m_token.IsCancelled()) {
                        continue;
                    }
                }

                if (!m_gate->WaitWhileSuspended(m_token)) {
                    continue;
                }

                RunScanCycle();
            } catch (const std::exception &e) {
                log(HOTPLUG_LOG_LEVEL_ERROR) << "Scan failed: " << e.what() << endLog;
                m_finished = true;
                throw;
            }
        }

        event = m_pendingEvents.front();
        m_pendingEvents.pop_front();
        return true;
    }

    std::vector<std::string> GetActiveKeys() const
    {
        std::vector<std::string> keys;
        for (const auto &entry : m_active) {
            keys.push_back(entry.first);
        }
        return keys;
    }

    unsigned int GetCycleCount() const
    {
        return m_cycleCount;
    }

private:
    std::shared_ptr<USBBusScanner> m_scanner;
    std::shared_ptr<SuspendGate> m_gate;
    CancelToken &m_token;
    std::shared_ptr<std::atomic<bool>> m_streamOpen;

    std::map<std::string, DeviceHandle> m_active;
    std::deque<HotplugEvent> m_pendingEvents;
    unsigned int m_cycleCount = 0;
    bool m_finished = false;

    void RunScanCycle()
    {
        HOTPLUG_LOG;

        std::vector<DeviceHandle> devices = m_scanner->Scan(m_token);
        if (m_token.IsCancelled()) {
            return;
        }

        std::set<std::string> seen;
        std::map<std::string, DeviceHandle> added;

        // A key seen twice in one scan keeps its last handle
        for (const auto &device : devices) {
            std::string key = m_scanner->KeyOf(device);
            if (m_active.count(key)) {
                seen.insert(key);
            } else {
                added[key] = device;
            }
        }

        std::vector<HotplugEvent> removed;
        for (auto it = m_active.begin(); it != m_active.end();) {
            if (seen.count(it->first)) {
                ++it;
            } else {
                removed.push_back(HotplugEvent{HOTPLUG_EVENT_REMOVED, it->second, it->first});
                it = m_active.erase(it);
            }
        }

        m_active.insert(added.begin(), added.end());

        for (const auto &event : removed) {
            log(HOTPLUG_LOG_LEVEL_INFO) << "Device removed: " << event.m_key << endLog;
            m_pendingEvents.push_back(event);
        }

        for (const auto &entry : added) {
            log(HOTPLUG_LOG_LEVEL_INFO) << "Device added: " << entry.first << endLog;
            m_pendingEvents.push_back(HotplugEvent{HOTPLUG_EVENT_ADDED, entry.second, entry.first});
        }

        m_cycleCount++;
        log(HOTPLUG_LOG_LEVEL_DEBUG) << "Scan cycle " << m_cycleCount << ": " << devices.size() << " devices, "
            << removed.size() << " removed, " << added.size() << " added" << endLog;
    }
};

HotplugEventStream::HotplugEventStream(std::shared_ptr<USBBusScanner> scanner, std::shared_ptr<SuspendGate> gate,
    CancelToken &token, std::shared_ptr<std::atomic<bool>> streamOpen)
    : pImpl{std::make_unique<HotplugEventStreamImpl>(scanner, gate, token, streamOpen)}
{}

HotplugEventStream::~HotplugEventStream() = default;

HotplugEventStream::HotplugEventStream(HotplugEventStream&&) noexcept = default;

HotplugEventStream& HotplugEventStream::operator=(HotplugEventStream&&) noexcept = default;

bool HotplugEventStream::Next(HotplugEvent &event)
{
    return pImpl->Next(event);
}

std::vector<std::string> HotplugEventStream::GetActiveKeys() const
{
    return pImpl->GetActiveKeys();
}

unsigned int HotplugEventStream::GetCycleCount() const
{
    return pImpl->GetCycleCount();
}

DeviceStream::DeviceStream(HotplugEventStream events, HotplugEventType type)
    : m_events{std::move(events)}, m_type{type}
{}

bool DeviceStream::Next(DeviceHandle &device)
{
    HotplugEvent event;
    while (m_events.Next(event)) {
        if (event.m_type == m_type) {
            device = event.m_device;
            return true;
        }
    }
    return false;
}
