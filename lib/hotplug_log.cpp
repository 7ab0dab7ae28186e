#include <chrono>
#include <ctime>
#include <iomanip>
#include <stdexcept>

#include "hotplug_log.hpp"

const std::string HotplugLogLevelToString(HotplugLogLevel level)
{
    switch (level) {
        case HOTPLUG_LOG_LEVEL_DEBUG:
            return "DEBUG";
        case HOTPLUG_LOG_LEVEL_INFO:
            return "INFO";
        case HOTPLUG_LOG_LEVEL_WARNING:
            return "WARNING";
        case HOTPLUG_LOG_LEVEL_ERROR:
            return "ERROR";
        default:
            return "UNKNOWN";
    }
}

HotplugLogLevel StringToHotplugLogLevel(const std::string &str)
{
    if (str == "debug") {
        return HOTPLUG_LOG_LEVEL_DEBUG;
    } else if (str == "info") {
        return HOTPLUG_LOG_LEVEL_INFO;
    } else if (str == "warning") {
        return HOTPLUG_LOG_LEVEL_WARNING;
    } else if (str == "error") {
        return HOTPLUG_LOG_LEVEL_ERROR;
    } else {
        throw std::invalid_argument("Unknown log level: " + str);
    }
}

HotplugLogStore::~HotplugLogStore()
{
    Close();
}

void HotplugLogStore::Open(const std::string &logPath, HotplugLogLevel minLogLevel)
{
    std::lock_guard<std::mutex> lock(m_mutex);

    m_minLogLevel = minLogLevel;
    if (m_logFile.is_open()) {
        m_logFile.close();
    }

    if (!logPath.empty()) {
        m_logFile.open(logPath, std::ios::out | std::ios::app);
        if (!m_logFile) {
            std::clog << "Failed to open log file " << logPath << ", logging to stderr" << std::endl;
        }
    }
}

void HotplugLogStore::Close()
{
    std::lock_guard<std::mutex> lock(m_mutex);

    if (m_logFile.is_open()) {
        m_logFile.flush();
        m_logFile.close();
    }
}

void HotplugLogStore::SetMinLogLevel(HotplugLogLevel minLogLevel)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_minLogLevel = minLogLevel;
}

void HotplugLogStore::Write(HotplugLogLevel level, const std::string &function, const std::string &message)
{
    std::lock_guard<std::mutex> lock(m_mutex);

    if (level < m_minLogLevel) {
        return;
    }

    auto now = std::chrono::system_clock::now();
    std::time_t seconds = std::chrono::system_clock::to_time_t(now);
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;

    std::tm tm;
    localtime_r(&seconds, &tm);

    std::ostream &out = m_logFile.is_open() ? static_cast<std::ostream&>(m_logFile) : std::clog;
    out << std::put_time(&tm, "%Y-%m-%d %H:%M:%S") << "." << std::setw(3) << std::setfill('0') << millis.count()
        << " [" << HotplugLogLevelToString(level) << "] " << function << ": " << message << std::endl;
}

void HotplugLog::Flush()
{
    HotplugLogStore::getInstance().Write(m_level, m_function, m_stream.str());
    m_stream.str("");
    m_stream.clear();
}

HotplugLog& endLog(HotplugLog &log)
{
    log.Flush();
    return log;
}
