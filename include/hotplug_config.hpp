#pragma once

#include <chrono>
#include <string>

#include "hotplug_log.hpp"
#include "scanner_params.hpp"

struct HotplugConfig {
    ScannerParams m_params;
    std::chrono::milliseconds m_pollInterval{1000};
    std::chrono::milliseconds m_settleTime{500};
    bool m_allowDummyFallback = false;
    HotplugLogLevel m_logLevel = HOTPLUG_LOG_LEVEL_WARNING;
    std::string m_logFile;
};

// Loads a YAML configuration file. Throws std::invalid_argument if the file
// cannot be read or holds invalid values.
HotplugConfig LoadHotplugConfig(const std::string &path);
