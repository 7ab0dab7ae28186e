#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <libusb-1.0/libusb.h>

#include "libusb_bus_scanner.hpp"
#include "hotplug_errors.hpp"
#include "hotplug_log.hpp"

LibUSBDevice::LibUSBDevice(std::shared_ptr<libusb_context> ctx, libusb_device *device, const libusb_device_descriptor &desc)
    : m_ctx{ctx}, m_descriptor(desc)
{
    m_device = libusb_ref_device(device);
    m_bus = libusb_get_bus_number(device);
    m_address = libusb_get_device_address(device);
}

LibUSBDevice::~LibUSBDevice()
{
    libusb_unref_device(m_device);
}

std::string LibUSBDevice::Describe() const
{
    std::ostringstream os;
    os << "vid: 0x" << std::hex << std::uppercase << std::setw(4) << std::setfill('0') << m_descriptor.idVendor
        << ", pid: 0x" << std::setw(4) << m_descriptor.idProduct
        << std::dec << ", bus: " << static_cast<int>(m_bus) << ", address: " << static_cast<int>(m_address);
    return os.str();
}

LibUSBBusScanner::LibUSBBusScanner(std::chrono::milliseconds pollInterval, std::chrono::milliseconds settleTime)
    : m_pollInterval{pollInterval}, m_settleTime{settleTime}
{
    HOTPLUG_LOG;

    libusb_context *ctx = nullptr;
    int ret = libusb_init(&ctx);
    if (ret < 0) {
        log(HOTPLUG_LOG_LEVEL_ERROR) << "Failed to initialize libusb: " << libusb_error_name(ret) << endLog;
        return;
    }

    m_ctx = std::shared_ptr<libusb_context>(ctx, libusb_exit);
    m_hotplugSupported = libusb_has_capability(LIBUSB_CAP_HAS_HOTPLUG) != 0;

    log(HOTPLUG_LOG_LEVEL_DEBUG) << "Hotplug is " << (m_hotplugSupported ? "" : "NOT ") << "supported" << endLog;
}

LibUSBBusScanner::~LibUSBBusScanner()
{
    HOTPLUG_LOG;

    StopHotplugMonitor();
}

void LibUSBBusScanner::Configure(const ScannerParams &params)
{
    HOTPLUG_LOG;

    static const char *supportedKeys[] = {
        "idVendor", "idProduct", "bDeviceClass", "bDeviceSubClass",
        "bDeviceProtocol", "bcdDevice", "bus", "address",
    };

    std::map<std::string, int64_t> filter;
    for (const auto &param : params) {
        bool supported = false;
        for (const char *key : supportedKeys) {
            if (param.first == key) {
                supported = true;
                break;
            }
        }

        if (!supported) {
            throw std::invalid_argument("Unsupported libusb scanner parameter: " + param.first);
        }

        filter[param.first] = GetIntParam(params, param.first);
        log(HOTPLUG_LOG_LEVEL_DEBUG) << "Matching " << param.first << " == " << filter[param.first] << endLog;
    }

    m_filter = filter;
}

bool LibUSBBusScanner::IsSupported() const
{
    return m_ctx != nullptr;
}

std::string LibUSBBusScanner::KeyOf(const DeviceHandle &device) const
{
    const LibUSBDevice *usbDevice = dynamic_cast<const LibUSBDevice*>(device.get());
    if (usbDevice == nullptr) {
        throw std::invalid_argument("Device was not created by the libusb scanner");
    }

    // The serial number is left out on purpose, some devices freeze when it
    // is queried on every scan.
    std::ostringstream os;
    os << std::hex << std::uppercase << std::setfill('0')
        << std::setw(4) << usbDevice->GetVendorId() << ":" << std::setw(4) << usbDevice->GetProductId()
        << std::dec << " at bus " << static_cast<int>(usbDevice->GetBusNumber())
        << ", address " << static_cast<int>(usbDevice->GetAddress());
    return os.str();
}

bool LibUSBBusScanner::Matches(const libusb_device_descriptor &desc, uint8_t bus, uint8_t address) const
{
    for (const auto &entry : m_filter) {
        int64_t actual;
        if (entry.first == "idVendor") {
            actual = desc.idVendor;
        } else if (entry.first == "idProduct") {
            actual = desc.idProduct;
        } else if (entry.first == "bDeviceClass") {
            actual = desc.bDeviceClass;
        } else if (entry.first == "bDeviceSubClass") {
            actual = desc.bDeviceSubClass;
        } else if (entry.first == "bDeviceProtocol") {
            actual = desc.bDeviceProtocol;
        } else if (entry.first == "bcdDevice") {
            actual = desc.bcdDevice;
        } else if (entry.first == "bus") {
            actual = bus;
        } else {
            actual = address;
        }

        if (actual != entry.second) {
            return false;
        }
    }

    return true;
}

std::vector<DeviceHandle> LibUSBBusScanner::Scan(CancelToken &token)
{
    HOTPLUG_LOG;

    if (!m_ctx) {
        throw ScanError("libusb is not initialized");
    }

    StartHotplugMonitor();

    std::vector<DeviceHandle> devices;
    if (token.IsCancelled()) {
        return devices;
    }

    libusb_device **deviceList;
    ssize_t count = libusb_get_device_list(m_ctx.get(), &deviceList);
    if (count < 0) {
        log(HOTPLUG_LOG_LEVEL_ERROR) << "Failed to get device list: " << libusb_error_name(count) << endLog;
        throw ScanError(std::string("Failed to get device list: ") + libusb_error_name(count));
    }

    for (ssize_t i = 0; i < count; ++i) {
        libusb_device *device = deviceList[i];
        libusb_device_descriptor desc;
        int ret = libusb_get_device_descriptor(device, &desc);
        if (ret < 0) {
            log(HOTPLUG_LOG_LEVEL_ERROR) << "Failed to get device descriptor: " << libusb_error_name(ret) << endLog;
            continue;
        }

        if (Matches(desc, libusb_get_bus_number(device), libusb_get_device_address(device))) {
            devices.push_back(std::make_shared<LibUSBDevice>(m_ctx, device, desc));
        }
    }

    libusb_free_device_list(deviceList, 1);

    // Enumeration itself cannot be interrupted, a late cancel drops its result
    if (token.IsCancelled()) {
        return {};
    }

    log(HOTPLUG_LOG_LEVEL_DEBUG) << "Scan found " << devices.size() << " matching devices out of " << count << endLog;

    return devices;
}

void LibUSBBusScanner::WaitUntilNextScan(CancelToken &token)
{
    HOTPLUG_LOG;

    if (!m_hotplugSupported || !m_running.load() || !m_notifier.WaitForEvents(token, m_settleTime)) {
        if (m_notifier.HasFailed()) {
            log(HOTPLUG_LOG_LEVEL_DEBUG) << "Hotplug monitor is down, polling" << endLog;
        }
        token.WaitFor(m_pollInterval);
    }
}

void LibUSBBusScanner::StartHotplugMonitor()
{
    HOTPLUG_LOG;

    if (!m_hotplugSupported || m_running.load()) {
        return;
    }

    int ret = libusb_hotplug_register_callback(m_ctx.get(),
                                            LIBUSB_HOTPLUG_EVENT_DEVICE_ARRIVED | LIBUSB_HOTPLUG_EVENT_DEVICE_LEFT,
                                            0,
                                            LIBUSB_HOTPLUG_MATCH_ANY,
                                            LIBUSB_HOTPLUG_MATCH_ANY,
                                            LIBUSB_HOTPLUG_MATCH_ANY,
                                            HotplugEventCallback,
                                            this,
                                            &m_callbackHandle);
    if (ret != LIBUSB_SUCCESS) {
        // Fall back to polling
        log(HOTPLUG_LOG_LEVEL_ERROR) << "Failed to register hotplug callback: " << libusb_error_name(ret) << endLog;
        m_hotplugSupported = false;
        return;
    }

    m_running.store(true);
    m_deviceMonitorThread = std::thread(&LibUSBBusScanner::DeviceMonitorThread, this);
}

void LibUSBBusScanner::StopHotplugMonitor()
{
    HOTPLUG_LOG;

    if (m_running.exchange(false)) {
        libusb_hotplug_deregister_callback(m_ctx.get(), m_callbackHandle);
        m_callbackHandle = 0;

        libusb_interrupt_event_handler(m_ctx.get());
        if (m_deviceMonitorThread.joinable()) {
            m_deviceMonitorThread.join();
        }
    }
}

void LibUSBBusScanner::DeviceMonitorThread()
{
    HOTPLUG_LOG;

    while (m_running.load()) {
        int ret = libusb_handle_events(m_ctx.get());
        if (ret < 0 && ret != LIBUSB_ERROR_INTERRUPTED) {
            log(HOTPLUG_LOG_LEVEL_ERROR) << "Failed to handle events: " << libusb_error_name(ret)
                << ", falling back to polling" << endLog;
            m_notifier.SetFailed();
            break;
        }
    }
}

int LIBUSB_CALL LibUSBBusScanner::HotplugEventCallback(libusb_context *ctx, libusb_device *device,
                                                libusb_hotplug_event event, void *user_data)
{
    HOTPLUG_LOG;

    LibUSBBusScanner *scanner = static_cast<LibUSBBusScanner*>(user_data);

    log(HOTPLUG_LOG_LEVEL_DEBUG) << "Device " << (event == LIBUSB_HOTPLUG_EVENT_DEVICE_ARRIVED ? "arrived" : "left")
        << " at bus " << static_cast<int>(libusb_get_bus_number(device))
        << ", address " << static_cast<int>(libusb_get_device_address(device)) << endLog;

    scanner->m_notifier.Notify();

    return 0;
}
