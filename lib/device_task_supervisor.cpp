#include "device_task_supervisor.hpp"
#include "hotplug_detector.hpp"
#include "hotplug_log.hpp"
#include "task_group.hpp"

// Removes the registry entry of a device task when the task ends, however
// it ends.
class DeviceTaskSupervisor::Registration {
public:
    Registration(DeviceTaskSupervisor &supervisor, const std::string &key)
        : m_supervisor{supervisor}, m_key{key}
    {}

    ~Registration()
    {
        std::lock_guard<std::mutex> lock(m_supervisor.m_registryMutex);
        m_supervisor.m_registry.erase(m_key);
    }

    Registration(const Registration&) = delete;
    Registration& operator=(const Registration&) = delete;

private:
    DeviceTaskSupervisor &m_supervisor;
    std::string m_key;
};

DeviceTaskSupervisor::DeviceTaskSupervisor(DeviceTask task, DevicePredicate predicate, bool cancellable)
    : m_task{task}, m_predicate{predicate}, m_cancellable{cancellable}
{}

DeviceTaskSupervisor::~DeviceTaskSupervisor()
{}

void DeviceTaskSupervisor::Run(HotplugDetector &detector, CancelToken &token)
{
    HOTPLUG_LOG;

    TaskGroup tasks(token);
    HotplugEventStream events = detector.Events(tasks.GetToken());

    HotplugEvent event;
    while (events.Next(event)) {
        if (event.m_type == HOTPLUG_EVENT_ADDED) {
            if (m_predicate && !m_predicate(event.m_device)) {
                log(HOTPLUG_LOG_LEVEL_DEBUG) << "Skipping device " << event.m_key << endLog;
                continue;
            }

            std::lock_guard<std::mutex> lock(m_registryMutex);
            if (m_registry.count(event.m_key)) {
                log(HOTPLUG_LOG_LEVEL_DEBUG) << "Task for " << event.m_key << " is still running" << endLog;
                continue;
            }

            log(HOTPLUG_LOG_LEVEL_INFO) << "Starting task for " << event.m_key << endLog;

            DeviceHandle device = event.m_device;
            std::string key = event.m_key;
            std::shared_ptr<CancelToken> taskToken = tasks.Spawn([this, device, key](CancelToken &cancelToken) {
                Registration registration(*this, key);
                m_task(device, cancelToken);
            });

            m_registry[key] = m_cancellable ? taskToken : nullptr;
        } else {
            std::shared_ptr<CancelToken> taskToken;
            {
                std::lock_guard<std::mutex> lock(m_registryMutex);
                auto it = m_registry.find(event.m_key);
                if (it != m_registry.end()) {
                    taskToken = it->second;
                }
            }

            if (taskToken) {
                log(HOTPLUG_LOG_LEVEL_INFO) << "Cancelling task for " << event.m_key << endLog;
                taskToken->Cancel();
            }
        }
    }

    log(HOTPLUG_LOG_LEVEL_DEBUG) << "Event stream finished, stopping device tasks" << endLog;

    tasks.Cancel();
    tasks.Join();
}

bool DeviceTaskSupervisor::IsRegistered(const std::string &key)
{
    std::lock_guard<std::mutex> lock(m_registryMutex);
    return m_registry.count(key) > 0;
}

std::vector<std::string> DeviceTaskSupervisor::GetRegisteredKeys()
{
    std::lock_guard<std::mutex> lock(m_registryMutex);

    std::vector<std::string> keys;
    for (const auto &entry : m_registry) {
        keys.push_back(entry.first);
    }
    return keys;
}
