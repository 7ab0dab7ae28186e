#pragma once

#include <chrono>
#include <memory>
#include <string>
#include <vector>

#include "bus_device.hpp"
#include "cancel_token.hpp"
#include "scanner_params.hpp"

// Interface for USB bus scanner backends.
//
// Scan() and WaitUntilNextScan() may block, both must return promptly once
// the token passed to them is cancelled.
class USBBusScanner {
public:
    USBBusScanner()
    {}
    virtual ~USBBusScanner()
    {}

    // Specifies which devices the backend should report. The format of the
    // parameters depends on the backend. Called once before scanning starts.
    virtual void Configure(const ScannerParams &params)
    {}

    virtual bool IsSupported() const = 0;

    // Unique key of a connected device, used for identity comparisons. It must
    // stay the same across scans while the device is connected and must differ
    // between devices that are connected at the same time.
    virtual std::string KeyOf(const DeviceHandle &device) const = 0;

    // Returns the devices currently on the bus. Throws ScanError on failure.
    virtual std::vector<DeviceHandle> Scan(CancelToken &token) = 0;

    // Blocks until the next scan is due. The backend decides whether that is
    // a fixed interval or a hotplug notification from the OS.
    virtual void WaitUntilNextScan(CancelToken &token) = 0;
};

// Picks the best backend for this platform. Falls back to a backend that
// never reports anything when allowDummyFallback is set, throws
// NoBackendError otherwise.
std::shared_ptr<USBBusScanner> ChooseBackend(bool allowDummyFallback = false,
    std::chrono::milliseconds pollInterval = std::chrono::seconds(1),
    std::chrono::milliseconds settleTime = std::chrono::milliseconds(500));
