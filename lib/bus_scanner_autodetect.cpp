#include "usb_bus_scanner.hpp"
#include "libusb_bus_scanner.hpp"
#include "dummy_bus_scanner.hpp"
#include "hotplug_errors.hpp"
#include "hotplug_log.hpp"

std::shared_ptr<USBBusScanner> ChooseBackend(bool allowDummyFallback,
    std::chrono::milliseconds pollInterval, std::chrono::milliseconds settleTime)
{
    HOTPLUG_LOG;

    std::shared_ptr<USBBusScanner> scanner = std::make_shared<LibUSBBusScanner>(pollInterval, settleTime);
    if (scanner->IsSupported()) {
        log(HOTPLUG_LOG_LEVEL_DEBUG) << "Using libusb scanner" << endLog;
        return scanner;
    }

    if (!allowDummyFallback) {
        throw NoBackendError("No suitable USB bus scanner backend for this platform");
    }

    log(HOTPLUG_LOG_LEVEL_WARNING) << "libusb is not available, no devices will be detected" << endLog;
    return std::make_shared<DummyBusScanner>();
}
