#pragma once

#include "usb_bus_scanner.hpp"

// Scanner that never detects anything. Used when no real backend exists for
// the current platform.
class DummyBusScanner : public USBBusScanner {
public:
    DummyBusScanner()
    {}
    ~DummyBusScanner() override
    {}

    bool IsSupported() const override { return true; }
    std::string KeyOf(const DeviceHandle &device) const override;
    std::vector<DeviceHandle> Scan(CancelToken &token) override;
    void WaitUntilNextScan(CancelToken &token) override;
};
