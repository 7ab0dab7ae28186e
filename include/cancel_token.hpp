#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <thread>

class CancelToken;

// Keeps a callback registered on a token for the lifetime of the object.
class CancelCallback {
public:
    CancelCallback(CancelToken &token, std::function<void()> callback);
    ~CancelCallback();

    CancelCallback(const CancelCallback&) = delete;
    CancelCallback& operator=(const CancelCallback&) = delete;

private:
    CancelToken &m_token;
    uint64_t m_id;
};

// One-shot stop signal shared between the thread that requests a stop and
// the threads that have to honour it.
class CancelToken {
public:
    CancelToken() = default;
    explicit CancelToken(CancelToken &parent);
    ~CancelToken();

    CancelToken(const CancelToken&) = delete;
    CancelToken& operator=(const CancelToken&) = delete;

    void Cancel();
    bool IsCancelled() const { return m_cancelled.load(); }

    // Returns true if the token was cancelled before the timeout expired.
    template<typename Rep, typename Period>
    bool WaitFor(const std::chrono::duration<Rep, Period> &timeout)
    {
        std::unique_lock<std::mutex> lock(m_mutex);
        return m_cancelCV.wait_for(lock, timeout, [this]{ return m_cancelled.load(); });
    }

    void Wait();

private:
    friend class CancelCallback;

    uint64_t AddCallback(std::function<void()> callback);
    void RemoveCallback(uint64_t id);

    std::atomic<bool> m_cancelled{false};
    std::mutex m_mutex;
    std::condition_variable m_cancelCV;
    std::map<uint64_t, std::function<void()>> m_callbacks;
    uint64_t m_nextCallbackId = 1;
    bool m_runningCallbacks = false;
    std::thread::id m_cancellingThread;
    std::condition_variable m_callbacksDoneCV;

    CancelToken *m_parent = nullptr;
    uint64_t m_parentCallbackId = 0;
};
