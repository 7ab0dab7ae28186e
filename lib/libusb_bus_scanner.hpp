#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <thread>
#include <libusb-1.0/libusb.h>

#include "hotplug_notifier.hpp"
#include "usb_bus_scanner.hpp"

class LibUSBDevice : public BusDevice {
public:
    LibUSBDevice(std::shared_ptr<libusb_context> ctx, libusb_device *device, const libusb_device_descriptor &desc);
    ~LibUSBDevice() override;

    libusb_device *GetDevice() const { return m_device; }
    const libusb_device_descriptor &GetDescriptor() const { return m_descriptor; }
    uint16_t GetVendorId() const { return m_descriptor.idVendor; }
    uint16_t GetProductId() const { return m_descriptor.idProduct; }
    uint8_t GetBusNumber() const { return m_bus; }
    uint8_t GetAddress() const { return m_address; }

    std::string Describe() const override;

private:
    // Devices keep the context alive so they may outlive the scanner
    std::shared_ptr<libusb_context> m_ctx;
    libusb_device *m_device;
    libusb_device_descriptor m_descriptor;
    uint8_t m_bus;
    uint8_t m_address;
};

class LibUSBBusScanner : public USBBusScanner {
public:
    explicit LibUSBBusScanner(std::chrono::milliseconds pollInterval = std::chrono::seconds(1),
        std::chrono::milliseconds settleTime = std::chrono::milliseconds(500));
    ~LibUSBBusScanner() override;

    void Configure(const ScannerParams &params) override;
    bool IsSupported() const override;
    std::string KeyOf(const DeviceHandle &device) const override;
    std::vector<DeviceHandle> Scan(CancelToken &token) override;
    void WaitUntilNextScan(CancelToken &token) override;

private:
    std::shared_ptr<libusb_context> m_ctx;
    std::map<std::string, int64_t> m_filter;
    std::chrono::milliseconds m_pollInterval;
    std::chrono::milliseconds m_settleTime;

    bool m_hotplugSupported = false;
    libusb_hotplug_callback_handle m_callbackHandle = 0;
    std::thread m_deviceMonitorThread;
    std::atomic<bool> m_running{false};
    HotplugNotifier m_notifier;

    bool Matches(const libusb_device_descriptor &desc, uint8_t bus, uint8_t address) const;
    void StartHotplugMonitor();
    void StopHotplugMonitor();
    void DeviceMonitorThread();

    static int LIBUSB_CALL HotplugEventCallback(libusb_context *ctx, libusb_device *device,
                                                libusb_hotplug_event event, void *user_data);
};
