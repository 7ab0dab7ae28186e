#include <sstream>

#include "dummy_bus_scanner.hpp"
#include "hotplug_log.hpp"

std::string DummyBusScanner::KeyOf(const DeviceHandle &device) const
{
    std::ostringstream os;
    os << static_cast<const void*>(device.get());
    return os.str();
}

std::vector<DeviceHandle> DummyBusScanner::Scan(CancelToken &token)
{
    return {};
}

void DummyBusScanner::WaitUntilNextScan(CancelToken &token)
{
    HOTPLUG_LOG;

    log(HOTPLUG_LOG_LEVEL_DEBUG) << "Dummy scanner waiting until cancelled" << endLog;
    token.Wait();
}
