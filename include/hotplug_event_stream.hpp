#pragma once

#include <atomic>
#include <memory>
#include <string>
#include <vector>

#include "cancel_token.hpp"
#include "hotplug_event.hpp"
#include "suspend_gate.hpp"
#include "usb_bus_scanner.hpp"

// Lazy, endless sequence of hotplug events produced by repeatedly scanning
// the bus and diffing the result against the devices seen so far.
//
// The scan loop runs on the thread that calls Next(). A stream cannot be
// restarted, and once Next() returns false or throws it stays finished.
class HotplugEventStream {
public:
    HotplugEventStream(std::shared_ptr<USBBusScanner> scanner, std::shared_ptr<SuspendGate> gate,
        CancelToken &token, std::shared_ptr<std::atomic<bool>> streamOpen = nullptr);
    ~HotplugEventStream();

    HotplugEventStream(HotplugEventStream&&) noexcept;
    HotplugEventStream& operator=(HotplugEventStream&&) noexcept;

    // Blocks until the next event is available. Returns false once the token
    // is cancelled. Throws ScanError when the backend fails to scan.
    bool Next(HotplugEvent &event);

    // Keys of the devices currently known to be connected.
    std::vector<std::string> GetActiveKeys() const;

    // Number of completed scan cycles.
    unsigned int GetCycleCount() const;

private:
    class HotplugEventStreamImpl;
    std::unique_ptr<HotplugEventStreamImpl> pImpl;
};

// View of an event stream that only reports devices of one event type.
class DeviceStream {
public:
    DeviceStream(HotplugEventStream events, HotplugEventType type);

    bool Next(DeviceHandle &device);

private:
    HotplugEventStream m_events;
    HotplugEventType m_type;
};
