#pragma once

#include <memory>
#include <string>

// A device as reported by a bus scanner. The hotplug engine never looks
// inside, it only hands the object back in events.
class BusDevice {
public:
    BusDevice()
    {}
    virtual ~BusDevice()
    {}

    virtual std::string Describe() const = 0;
};

using DeviceHandle = std::shared_ptr<const BusDevice>;
