#pragma once

#include <string>
#include <sstream>
#include <fstream>
#include <mutex>
#include <iostream>

enum HotplugLogLevel {
    HOTPLUG_LOG_LEVEL_DEBUG,
    HOTPLUG_LOG_LEVEL_INFO,
    HOTPLUG_LOG_LEVEL_WARNING,
    HOTPLUG_LOG_LEVEL_ERROR,
};

const std::string HotplugLogLevelToString(HotplugLogLevel level);
HotplugLogLevel StringToHotplugLogLevel(const std::string &str);

class HotplugLogStore {
public:
    static HotplugLogStore& getInstance()
    {
        static HotplugLogStore instance;
        return instance;
    }

    void Open(const std::string &logPath, HotplugLogLevel minLogLevel);
    void Close();

    void SetMinLogLevel(HotplugLogLevel minLogLevel);
    HotplugLogLevel GetMinLogLevel() const { return m_minLogLevel; }

    void Write(HotplugLogLevel level, const std::string &function, const std::string &message);

private:
    HotplugLogStore() = default;
    ~HotplugLogStore();
    HotplugLogStore(const HotplugLogStore&) = delete;
    HotplugLogStore& operator=(const HotplugLogStore&) = delete;

    std::ofstream m_logFile;
    HotplugLogLevel m_minLogLevel = HOTPLUG_LOG_LEVEL_WARNING;
    std::mutex m_mutex;
};

// One logger per call site. A record is started with log(level) and
// flushed to the store by endLog.
class HotplugLog {
public:
    explicit HotplugLog(const char *function) : m_function{function}
    {}

    HotplugLog& operator()(HotplugLogLevel level)
    {
        m_level = level;
        return *this;
    }

    template<typename T>
    HotplugLog& operator<<(const T &value)
    {
        m_stream << value;
        return *this;
    }

    HotplugLog& operator<<(std::ios_base& (*manip)(std::ios_base&))
    {
        m_stream << manip;
        return *this;
    }

    HotplugLog& operator<<(HotplugLog& (*manip)(HotplugLog&))
    {
        return manip(*this);
    }

    void Flush();

private:
    std::string m_function;
    HotplugLogLevel m_level = HOTPLUG_LOG_LEVEL_INFO;
    std::ostringstream m_stream;
};

HotplugLog& endLog(HotplugLog &log);

#define HOTPLUG_LOG HotplugLog log(__FUNCTION__)
