#include "task_group.hpp"
#include "hotplug_log.hpp"

TaskGroup::TaskGroup(CancelToken &parent) : m_token{parent}
{}

TaskGroup::~TaskGroup()
{
    HOTPLUG_LOG;

    m_token.Cancel();
    WaitForAllTasks();

    if (m_failure) {
        try {
            std::rethrow_exception(m_failure);
        } catch (const std::exception &e) {
            log(HOTPLUG_LOG_LEVEL_ERROR) << "Task failure was never collected: " << e.what() << endLog;
        } catch (...) {
            log(HOTPLUG_LOG_LEVEL_ERROR) << "Task failure was never collected" << endLog;
        }
    }
}

std::shared_ptr<CancelToken> TaskGroup::Spawn(std::function<void(CancelToken&)> function)
{
    ReapFinishedTasks();

    std::shared_ptr<Task> task = std::make_shared<Task>();
    task->m_token = std::make_shared<CancelToken>(m_token);

    std::lock_guard<std::mutex> lock(m_mutex);
    task->m_thread = std::thread(&TaskGroup::RunTask, this, task, function);
    m_tasks.push_back(task);

    return task->m_token;
}

void TaskGroup::RunTask(std::shared_ptr<Task> task, std::function<void(CancelToken&)> function)
{
    HOTPLUG_LOG;

    std::exception_ptr failure;
    try {
        function(*task->m_token);
    } catch (const std::exception &e) {
        log(HOTPLUG_LOG_LEVEL_ERROR) << "Task failed: " << e.what() << endLog;
        failure = std::current_exception();
    } catch (...) {
        log(HOTPLUG_LOG_LEVEL_ERROR) << "Task failed with an unknown exception" << endLog;
        failure = std::current_exception();
    }

    if (failure) {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            if (!m_failure) {
                m_failure = failure;
            }
        }
        m_token.Cancel();
    }

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        task->m_done = true;
    }
    m_taskDoneCV.notify_all();
}

void TaskGroup::Cancel()
{
    m_token.Cancel();
}

void TaskGroup::Join()
{
    WaitForAllTasks();

    std::exception_ptr failure;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        failure.swap(m_failure);
    }

    if (failure) {
        std::rethrow_exception(failure);
    }
}

size_t TaskGroup::GetRunningTaskCount()
{
    std::lock_guard<std::mutex> lock(m_mutex);

    size_t count = 0;
    for (const auto &task : m_tasks) {
        if (!task->m_done) {
            count++;
        }
    }
    return count;
}

void TaskGroup::ReapFinishedTasks()
{
    std::list<std::shared_ptr<Task>> finished;

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        for (auto it = m_tasks.begin(); it != m_tasks.end();) {
            if ((*it)->m_done) {
                finished.push_back(*it);
                it = m_tasks.erase(it);
            } else {
                ++it;
            }
        }
    }

    for (auto &task : finished) {
        task->m_thread.join();
    }
}

void TaskGroup::WaitForAllTasks()
{
    std::list<std::shared_ptr<Task>> tasks;

    {
        std::unique_lock<std::mutex> lock(m_mutex);
        m_taskDoneCV.wait(lock, [this]{
            for (const auto &task : m_tasks) {
                if (!task->m_done) {
                    return false;
                }
            }
            return true;
        });
        tasks.swap(m_tasks);
    }

    for (auto &task : tasks) {
        task->m_thread.join();
    }
}
