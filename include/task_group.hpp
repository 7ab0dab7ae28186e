#pragma once

#include <condition_variable>
#include <exception>
#include <functional>
#include <list>
#include <memory>
#include <mutex>
#include <thread>

#include "cancel_token.hpp"

// Scope that owns a dynamic set of task threads. Cancelling the parent
// token, or any task failing, cancels every task in the group. All tasks are
// joined before the group is destroyed.
class TaskGroup {
public:
    explicit TaskGroup(CancelToken &parent);
    ~TaskGroup();

    TaskGroup(const TaskGroup&) = delete;
    TaskGroup& operator=(const TaskGroup&) = delete;

    // Starts a task on its own thread. The returned token cancels only this
    // task and is also cancelled when the whole group is.
    std::shared_ptr<CancelToken> Spawn(std::function<void(CancelToken&)> task);

    void Cancel();
    CancelToken &GetToken() { return m_token; }

    // Waits for every task to finish, then rethrows the first exception
    // thrown by any of them.
    void Join();

    size_t GetRunningTaskCount();

private:
    struct Task {
        std::thread m_thread;
        std::shared_ptr<CancelToken> m_token;
        bool m_done = false;
    };

    CancelToken m_token;
    std::mutex m_mutex;
    std::condition_variable m_taskDoneCV;
    std::list<std::shared_ptr<Task>> m_tasks;
    std::exception_ptr m_failure;

    void RunTask(std::shared_ptr<Task> task, std::function<void(CancelToken&)> function);
    void ReapFinishedTasks();
    void WaitForAllTasks();
};
