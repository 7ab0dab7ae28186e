#pragma once

#include <string>

#include "bus_device.hpp"

enum HotplugEventType {
    HOTPLUG_EVENT_ADDED,
    HOTPLUG_EVENT_REMOVED,
};

const std::string HotplugEventTypeToString(HotplugEventType type);

struct HotplugEvent {
    HotplugEventType m_type;
    DeviceHandle m_device;
    std::string m_key;
};
