#pragma once

#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "bus_device.hpp"
#include "cancel_token.hpp"

class HotplugDetector;

using DeviceTask = std::function<void(const DeviceHandle &device, CancelToken &token)>;
using DevicePredicate = std::function<bool(const DeviceHandle &device)>;

// Keeps exactly one task running per connected device.
//
// A task is started for every added device that satisfies the predicate
// unless a task for the same key is still registered. When cancellable is
// set the task of a removed device is cancelled, otherwise it runs until it
// returns by itself. Shutting the supervisor down cancels every task.
class DeviceTaskSupervisor {
public:
    DeviceTaskSupervisor(DeviceTask task, DevicePredicate predicate = nullptr, bool cancellable = true);
    ~DeviceTaskSupervisor();

    DeviceTaskSupervisor(const DeviceTaskSupervisor&) = delete;
    DeviceTaskSupervisor& operator=(const DeviceTaskSupervisor&) = delete;

    // Consumes the events of the detector until the token is cancelled or a
    // task fails. Returns after every task has finished. Rethrows the first
    // task failure.
    void Run(HotplugDetector &detector, CancelToken &token);

    bool IsRegistered(const std::string &key);
    std::vector<std::string> GetRegisteredKeys();

private:
    class Registration;

    DeviceTask m_task;
    DevicePredicate m_predicate;
    bool m_cancellable;

    // Null entries mark tasks that are not cancelled on removal
    std::map<std::string, std::shared_ptr<CancelToken>> m_registry;
    std::mutex m_registryMutex;
};
