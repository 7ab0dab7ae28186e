#pragma once

#include <memory>
#include <string>

#include "cancel_token.hpp"
#include "device_task_supervisor.hpp"
#include "hotplug_event.hpp"
#include "hotplug_event_stream.hpp"
#include "scanner_params.hpp"
#include "suspend_gate.hpp"
#include "usb_bus_scanner.hpp"

// Hotplug detector for USB devices.
//
// Scans the USB bus for devices matching the configured parameters and
// reports devices that were added or removed since the previous scan. Only
// one event stream may be open on a detector at a time.
class HotplugDetector {
public:
    // A null scanner picks a backend for the current platform when the first
    // stream is opened.
    explicit HotplugDetector(ScannerParams params = ScannerParams(),
        std::shared_ptr<USBBusScanner> scanner = nullptr,
        bool allowDummyFallback = false);
    ~HotplugDetector();

    HotplugDetector(HotplugDetector&&) noexcept;
    HotplugDetector& operator=(HotplugDetector&&) noexcept;

    // Detector for devices matching a single VID:PID combination. Throws
    // std::invalid_argument if either ID cannot be parsed.
    static HotplugDetector ForDevice(const UsbId &vid, const UsbId &pid,
        std::shared_ptr<USBBusScanner> scanner = nullptr,
        bool allowDummyFallback = false);

    HotplugEventStream Events(CancelToken &token);
    DeviceStream AddedDevices(CancelToken &token);
    DeviceStream RemovedDevices(CancelToken &token);

    // Suspensions nest, the scan loop proceeds once every Suspend() has been
    // matched by a Resume().
    void Suspend();
    void Resume();
    bool IsSuspended() const;
    ScopedSuspend Suspended();

    // Runs a task for each matching device that is added to the bus until the
    // token is cancelled. Tasks of removed devices are cancelled when
    // cancellable is set. Rethrows the first exception thrown by a task.
    void RunForEachDevice(DeviceTask task, CancelToken &token,
        DevicePredicate predicate = nullptr, bool cancellable = true);

    const ScannerParams &GetParams() const;

private:
    class HotplugDetectorImpl;
    std::unique_ptr<HotplugDetectorImpl> pImpl;
};
