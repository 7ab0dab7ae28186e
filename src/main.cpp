#include <iostream>
#include <memory>
#include <thread>
#include <csignal>
#include <pthread.h>
#include <cxxopts.hpp>

#include "hotplug_config.hpp"
#include "hotplug_detector.hpp"
#include "hotplug_errors.hpp"
#include "hotplug_log.hpp"

// Cancels the token when SIGINT or SIGTERM arrives. The signals must already
// be blocked in every thread so only this one receives them.
void SignalThread(sigset_t signals, CancelToken &token)
{
    int signal = 0;
    if (sigwait(&signals, &signal) == 0) {
        std::cerr << "Received signal " << signal << ", shutting down" << std::endl;
    }
    token.Cancel();
}

int main(int argc, char* argv[])
{
    cxxopts::Options options("usb-hotplug-monitor", "Prints USB devices as they are added and removed");

    options.add_options()
        ("v,vid", "Vendor ID to match, in hex", cxxopts::value<std::string>())
        ("p,pid", "Product ID to match, in hex", cxxopts::value<std::string>())
        ("c,config", "Config file path", cxxopts::value<std::string>())
        ("l,log", "Log file path", cxxopts::value<std::string>()->default_value(""))
        ("D,debug", "Enable debug logging", cxxopts::value<bool>()->default_value("false"))
        ("allow-dummy", "Keep running when no USB backend is available", cxxopts::value<bool>()->default_value("false"))
        ("h,help", "Print usage");

    HotplugConfig config;

    try {
        auto result = options.parse(argc, argv);

        if (result.count("help")) {
            std::cout << options.help() << std::endl;
            return 0;
        }

        if (result.count("config")) {
            config = LoadHotplugConfig(result["config"].as<std::string>());
        }

        if (result.count("vid")) {
            config.m_params.erase("idVendor");
            config.m_params["vid"] = result["vid"].as<std::string>();
        }
        if (result.count("pid")) {
            config.m_params.erase("idProduct");
            config.m_params["pid"] = result["pid"].as<std::string>();
        }
        if (!result["log"].as<std::string>().empty()) {
            config.m_logFile = result["log"].as<std::string>();
        }
        if (result["debug"].as<bool>()) {
            config.m_logLevel = HOTPLUG_LOG_LEVEL_DEBUG;
        }
        if (result["allow-dummy"].as<bool>()) {
            config.m_allowDummyFallback = true;
        }
    } catch (const std::invalid_argument &e) {
        std::cerr << e.what() << std::endl;
        return 1;
    } catch (const std::exception &e) {
        // Option parsing errors
        std::cerr << e.what() << std::endl << options.help() << std::endl;
        return 1;
    }

    HotplugLogStore::getInstance().Open(config.m_logFile, config.m_logLevel);

    sigset_t signals;
    sigemptyset(&signals);
    sigaddset(&signals, SIGINT);
    sigaddset(&signals, SIGTERM);
    pthread_sigmask(SIG_BLOCK, &signals, nullptr);

    CancelToken token;
    std::thread signalThread(SignalThread, signals, std::ref(token));
    signalThread.detach();

    int ret = 0;

    try {
        std::shared_ptr<USBBusScanner> scanner = ChooseBackend(config.m_allowDummyFallback,
            config.m_pollInterval, config.m_settleTime);
        HotplugDetector detector(config.m_params, scanner);

        HotplugEventStream events = detector.Events(token);
        HotplugEvent event;
        while (events.Next(event)) {
            std::cout << HotplugEventTypeToString(event.m_type) << " device " << event.m_key << std::endl;
        }
    } catch (const std::invalid_argument &e) {
        std::cerr << "Invalid configuration: " << e.what() << std::endl;
        ret = 1;
    } catch (const NoBackendError &e) {
        std::cerr << e.what() << std::endl;
        ret = 1;
    } catch (const ScanError &e) {
        std::cerr << "Scanning failed: " << e.what() << std::endl;
        ret = 1;
    } catch (const std::exception &e) {
        std::cerr << "Unexpected error: " << e.what() << std::endl;
        ret = 1;
    }

    HotplugLogStore::getInstance().Close();

    return ret;
}
