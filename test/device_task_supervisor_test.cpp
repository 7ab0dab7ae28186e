#include <map>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <gtest/gtest.h>

#include "device_task_supervisor.hpp"
#include "hotplug_detector.hpp"
#include "mock_bus_scanner.hpp"

// Counts the running tasks and the number of tasks ever started per device.
class TaskCounters {
public:
    void Started(const std::string &name)
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_running[name]++;
        m_started[name]++;
    }

    void Stopped(const std::string &name)
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_running[name]--;
    }

    std::map<std::string, int> Running()
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_running;
    }

    int StartedCount(const std::string &name)
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_started[name];
    }

private:
    std::mutex m_mutex;
    std::map<std::string, int> m_running;
    std::map<std::string, int> m_started;
};

using Counts = std::map<std::string, int>;

class DeviceTaskSupervisorTest : public ::testing::Test {
protected:
    std::shared_ptr<MockBusScanner> m_scanner = std::make_shared<MockBusScanner>();
    HotplugDetector m_detector{ScannerParams(), m_scanner};
    TaskCounters m_counters;
    CancelToken m_token;

    // Runs until the device task is cancelled
    DeviceTask CancellableTask()
    {
        return [this](const DeviceHandle &device, CancelToken &token) {
            m_counters.Started(NameOf(device));
            token.Wait();
            m_counters.Stopped(NameOf(device));
        };
    }

    // Runs until released, removing the device does not stop it
    DeviceTask ReleasableTask(CancelToken &released)
    {
        return [this, &released](const DeviceHandle &device, CancelToken &token) {
            m_counters.Started(NameOf(device));
            while (!released.IsCancelled() && !token.IsCancelled()) {
                released.WaitFor(std::chrono::milliseconds(1));
            }
            m_counters.Stopped(NameOf(device));
        };
    }
};

TEST_F(DeviceTaskSupervisorTest, CancelsTasksOfRemovedDevices)
{
    DeviceTaskSupervisor supervisor(CancellableTask());
    std::thread runner([&]{ supervisor.Run(m_detector, m_token); });

    m_scanner->Add("foo");
    ASSERT_TRUE(WaitUntil([&]{ return m_counters.Running() == Counts({{"foo", 1}}); }));
    EXPECT_TRUE(supervisor.IsRegistered("foo"));

    m_scanner->Add("bar");
    m_scanner->Add("bar");
    m_scanner->Add("bar");
    ASSERT_TRUE(WaitUntil([&]{ return m_counters.Running() == Counts({{"foo", 1}, {"bar", 1}}); }));

    m_scanner->Remove("bar");
    m_scanner->Add("baz");
    ASSERT_TRUE(WaitUntil([&]{ return m_counters.Running() == Counts({{"foo", 1}, {"bar", 0}, {"baz", 1}}); }));
    ASSERT_TRUE(WaitUntil([&]{ return !supervisor.IsRegistered("bar"); }));

    m_scanner->Remove("foo");
    m_scanner->Remove("baz");
    ASSERT_TRUE(WaitUntil([&]{ return m_counters.Running() == Counts({{"foo", 0}, {"bar", 0}, {"baz", 0}}); }));
    ASSERT_TRUE(WaitUntil([&]{ return supervisor.GetRegisteredKeys().empty(); }));

    EXPECT_EQ(m_counters.StartedCount("bar"), 1);

    m_token.Cancel();
    runner.join();
}

TEST_F(DeviceTaskSupervisorTest, NonCancellableTasksOutliveTheirDevice)
{
    CancelToken released;
    DeviceTaskSupervisor supervisor(ReleasableTask(released), nullptr, false);
    std::thread runner([&]{ supervisor.Run(m_detector, m_token); });

    m_scanner->Add("foo");
    ASSERT_TRUE(WaitUntil([&]{ return m_counters.Running() == Counts({{"foo", 1}}); }));

    m_scanner->Add("bar");
    m_scanner->Add("bar");
    m_scanner->Add("bar");
    ASSERT_TRUE(WaitUntil([&]{ return m_counters.Running() == Counts({{"foo", 1}, {"bar", 1}}); }));

    m_scanner->Remove("bar");
    m_scanner->Add("baz");
    ASSERT_TRUE(WaitUntil([&]{ return m_counters.Running() == Counts({{"foo", 1}, {"bar", 1}, {"baz", 1}}); }));

    m_scanner->Remove("foo");
    m_scanner->Remove("baz");
    ASSERT_TRUE(m_scanner->WaitForScans(5));
    EXPECT_EQ(m_counters.Running(), Counts({{"foo", 1}, {"bar", 1}, {"baz", 1}}));
    EXPECT_TRUE(supervisor.IsRegistered("foo"));
    EXPECT_TRUE(supervisor.IsRegistered("bar"));
    EXPECT_TRUE(supervisor.IsRegistered("baz"));

    released.Cancel();
    ASSERT_TRUE(WaitUntil([&]{ return m_counters.Running() == Counts({{"foo", 0}, {"bar", 0}, {"baz", 0}}); }));
    ASSERT_TRUE(WaitUntil([&]{ return supervisor.GetRegisteredKeys().empty(); }));

    m_token.Cancel();
    runner.join();
}

TEST_F(DeviceTaskSupervisorTest, ReaddedDeviceDoesNotStartSecondTask)
{
    CancelToken released;
    DeviceTaskSupervisor supervisor(ReleasableTask(released), nullptr, false);
    std::thread runner([&]{ supervisor.Run(m_detector, m_token); });

    m_scanner->Add("foo");
    ASSERT_TRUE(WaitUntil([&]{ return m_counters.StartedCount("foo") == 1; }));

    m_scanner->Remove("foo");
    ASSERT_TRUE(m_scanner->WaitForScans(3));
    m_scanner->Add("foo");
    ASSERT_TRUE(m_scanner->WaitForScans(3));

    EXPECT_EQ(m_counters.StartedCount("foo"), 1);
    EXPECT_EQ(m_counters.Running(), Counts({{"foo", 1}}));

    m_token.Cancel();
    runner.join();
}

TEST_F(DeviceTaskSupervisorTest, TaskRestartsAfterItFinished)
{
    DeviceTaskSupervisor supervisor(CancellableTask());
    std::thread runner([&]{ supervisor.Run(m_detector, m_token); });

    m_scanner->Add("foo");
    ASSERT_TRUE(WaitUntil([&]{ return m_counters.StartedCount("foo") == 1; }));

    m_scanner->Remove("foo");
    ASSERT_TRUE(WaitUntil([&]{ return !supervisor.IsRegistered("foo"); }));

    m_scanner->Add("foo");
    ASSERT_TRUE(WaitUntil([&]{ return m_counters.StartedCount("foo") == 2; }));
    EXPECT_EQ(m_counters.Running(), Counts({{"foo", 1}}));

    m_token.Cancel();
    runner.join();
}

TEST_F(DeviceTaskSupervisorTest, PredicateFiltersDevices)
{
    DevicePredicate startsWithF = [](const DeviceHandle &device) {
        return NameOf(device).front() == 'f';
    };
    std::thread runner([&]{ m_detector.RunForEachDevice(CancellableTask(), m_token, startsWithF); });

    m_scanner->Add("foo");
    m_scanner->Add("bar");
    ASSERT_TRUE(WaitUntil([&]{ return m_counters.Running() == Counts({{"foo", 1}}); }));
    ASSERT_TRUE(m_scanner->WaitForScans(3));
    EXPECT_EQ(m_counters.StartedCount("bar"), 0);

    m_token.Cancel();
    runner.join();
}

TEST_F(DeviceTaskSupervisorTest, ShutdownCancelsAndJoinsAllTasks)
{
    CancelToken released;
    std::thread runner([&]{ m_detector.RunForEachDevice(ReleasableTask(released), m_token, nullptr, false); });

    m_scanner->Add("foo");
    m_scanner->Add("bar");
    ASSERT_TRUE(WaitUntil([&]{ return m_counters.Running() == Counts({{"foo", 1}, {"bar", 1}}); }));

    m_token.Cancel();
    runner.join();

    // Every task has finished by the time RunForEachDevice returns
    EXPECT_EQ(m_counters.Running(), Counts({{"foo", 0}, {"bar", 0}}));
}

TEST_F(DeviceTaskSupervisorTest, TaskFailureIsRethrownAfterOtherTasksStop)
{
    m_scanner->Add("good");
    m_scanner->Add("bad");

    DeviceTask task = [this](const DeviceHandle &device, CancelToken &token) {
        m_counters.Started(NameOf(device));
        if (NameOf(device) == "bad") {
            m_counters.Stopped(NameOf(device));
            throw std::runtime_error("device task failed");
        }
        token.Wait();
        m_counters.Stopped(NameOf(device));
    };

    EXPECT_THROW(m_detector.RunForEachDevice(task, m_token), std::runtime_error);
    EXPECT_EQ(m_counters.Running(), Counts({{"good", 0}, {"bad", 0}}));
    EXPECT_FALSE(m_token.IsCancelled());
}

TEST_F(DeviceTaskSupervisorTest, FailedTaskIsUnregistered)
{
    m_scanner->Add("foo");
    m_scanner->Add("bar");

    DeviceTask task = [](const DeviceHandle &device, CancelToken &token) {
        throw std::runtime_error("device task failed");
    };
    DeviceTaskSupervisor supervisor(task, nullptr, false);

    EXPECT_THROW(supervisor.Run(m_detector, m_token), std::runtime_error);
    EXPECT_TRUE(supervisor.GetRegisteredKeys().empty());
    EXPECT_FALSE(supervisor.IsRegistered("foo"));
    EXPECT_FALSE(supervisor.IsRegistered("bar"));
}
