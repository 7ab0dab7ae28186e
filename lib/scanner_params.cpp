#include <stdexcept>
#include <sstream>

#include "scanner_params.hpp"
#include "hotplug_log.hpp"

static uint16_t CheckUsbIdRange(int64_t value)
{
    if (value < 0 || value > 0xFFFF) {
        throw std::invalid_argument("USB ID out of range: " + std::to_string(value));
    }
    return static_cast<uint16_t>(value);
}

static uint16_t HexStringToUsbId(const std::string &str)
{
    std::string digits = str;
    if (digits.size() > 2 && digits[0] == '0' && (digits[1] == 'x' || digits[1] == 'X')) {
        digits = digits.substr(2);
    }

    if (digits.empty()) {
        throw std::invalid_argument("Invalid USB ID: '" + str + "'");
    }

    size_t consumed = 0;
    unsigned long value;
    try {
        value = std::stoul(digits, &consumed, 16);
    } catch (const std::exception &) {
        throw std::invalid_argument("Invalid USB ID: '" + str + "'");
    }

    if (consumed != digits.size()) {
        throw std::invalid_argument("Invalid USB ID: '" + str + "'");
    }

    if (value > 0xFFFF) {
        throw std::invalid_argument("USB ID out of range: '" + str + "'");
    }

    return static_cast<uint16_t>(value);
}

uint16_t UsbIdToInt(const UsbId &id)
{
    if (std::holds_alternative<std::string>(id)) {
        return HexStringToUsbId(std::get<std::string>(id));
    }
    return CheckUsbIdRange(std::get<int>(id));
}

static int64_t ScannerParamToUsbId(const ScannerParam &param)
{
    if (std::holds_alternative<std::string>(param)) {
        return HexStringToUsbId(std::get<std::string>(param));
    }
    return CheckUsbIdRange(std::get<int64_t>(param));
}

ScannerParams PreprocessScannerParams(ScannerParams params)
{
    HOTPLUG_LOG;

    static const std::map<std::string, std::string> aliases = {
        { "vid", "idVendor" },
        { "pid", "idProduct" },
    };

    for (const auto &alias : aliases) {
        auto it = params.find(alias.first);
        if (it == params.end()) {
            continue;
        }

        if (params.count(alias.second)) {
            log(HOTPLUG_LOG_LEVEL_WARNING) << "Ignoring '" << alias.first << "', '" << alias.second
                << "' is already set" << endLog;
        } else {
            params[alias.second] = ScannerParamToUsbId(it->second);
        }
        params.erase(it);
    }

    return params;
}

int64_t GetIntParam(const ScannerParams &params, const std::string &key)
{
    auto it = params.find(key);
    if (it == params.end()) {
        throw std::invalid_argument("Missing scanner parameter: " + key);
    }

    if (!std::holds_alternative<int64_t>(it->second)) {
        throw std::invalid_argument("Scanner parameter '" + key + "' must be an integer");
    }

    return std::get<int64_t>(it->second);
}

std::string ScannerParamToString(const ScannerParam &param)
{
    if (std::holds_alternative<std::string>(param)) {
        return std::get<std::string>(param);
    }

    std::ostringstream os;
    os << std::get<int64_t>(param);
    return os.str();
}
