#include <stdexcept>
#include <yaml-cpp/yaml.h>

#include "hotplug_config.hpp"
#include "hotplug_log.hpp"

static ScannerParam YamlToScannerParam(const YAML::Node &node)
{
    // Integers stay integers, anything else is kept as text
    try {
        return node.as<int64_t>();
    } catch (const YAML::BadConversion &) {
        return node.as<std::string>();
    }
}

static std::chrono::milliseconds YamlToMilliseconds(const YAML::Node &node, const std::string &name)
{
    int64_t value = node.as<int64_t>();
    if (value < 0) {
        throw std::invalid_argument(name + " must not be negative");
    }
    return std::chrono::milliseconds(value);
}

HotplugConfig LoadHotplugConfig(const std::string &path)
{
    HOTPLUG_LOG;

    HotplugConfig config;

    try {
        YAML::Node configNode = YAML::LoadFile(path);

        // IDs are always read as hexadecimal text, "0402" is not decimal 402
        if (configNode["vid"]) {
            config.m_params["vid"] = configNode["vid"].as<std::string>();
        }
        if (configNode["pid"]) {
            config.m_params["pid"] = configNode["pid"].as<std::string>();
        }

        if (configNode["match"]) {
            if (!configNode["match"].IsMap()) {
                throw std::invalid_argument("'match' must be a map");
            }
            for (const auto &entry : configNode["match"]) {
                config.m_params[entry.first.as<std::string>()] = YamlToScannerParam(entry.second);
            }
        }

        if (configNode["poll_interval_ms"]) {
            config.m_pollInterval = YamlToMilliseconds(configNode["poll_interval_ms"], "poll_interval_ms");
        }
        if (configNode["settle_time_ms"]) {
            config.m_settleTime = YamlToMilliseconds(configNode["settle_time_ms"], "settle_time_ms");
        }
        if (configNode["allow_dummy_fallback"]) {
            config.m_allowDummyFallback = configNode["allow_dummy_fallback"].as<bool>();
        }
        if (configNode["log_level"]) {
            config.m_logLevel = StringToHotplugLogLevel(configNode["log_level"].as<std::string>());
        }
        if (configNode["log_file"]) {
            config.m_logFile = configNode["log_file"].as<std::string>();
        }

        // Validates the IDs early so a bad file fails before scanning starts
        config.m_params = PreprocessScannerParams(config.m_params);
    } catch (const YAML::BadFile &e) {
        log(HOTPLUG_LOG_LEVEL_ERROR) << "Unable to open the config file: " << e.what() << endLog;
        throw std::invalid_argument("Unable to open config file " + path);
    } catch (const std::exception &e) {
        log(HOTPLUG_LOG_LEVEL_ERROR) << "Invalid config file " << path << ": " << e.what() << endLog;
        throw std::invalid_argument("Invalid config file " + path + ": " + e.what());
    }

    return config;
}
