#include "cancel_token.hpp"

CancelCallback::CancelCallback(CancelToken &token, std::function<void()> callback)
    : m_token{token}, m_id{token.AddCallback(std::move(callback))}
{}

CancelCallback::~CancelCallback()
{
    m_token.RemoveCallback(m_id);
}

CancelToken::CancelToken(CancelToken &parent) : m_parent{&parent}
{
    m_parentCallbackId = m_parent->AddCallback([this]{ Cancel(); });
}

CancelToken::~CancelToken()
{
    if (m_parent) {
        m_parent->RemoveCallback(m_parentCallbackId);
    }
}

void CancelToken::Cancel()
{
    std::map<uint64_t, std::function<void()>> callbacks;

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_cancelled.load()) {
            return;
        }
        m_cancelled.store(true);
        m_runningCallbacks = true;
        m_cancellingThread = std::this_thread::get_id();
        callbacks.swap(m_callbacks);
    }
    m_cancelCV.notify_all();

    for (auto &entry : callbacks) {
        entry.second();
    }

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_runningCallbacks = false;
    }
    m_callbacksDoneCV.notify_all();
}

void CancelToken::Wait()
{
    std::unique_lock<std::mutex> lock(m_mutex);
    m_cancelCV.wait(lock, [this]{ return m_cancelled.load(); });
}

uint64_t CancelToken::AddCallback(std::function<void()> callback)
{
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_cancelled.load()) {
            uint64_t id = m_nextCallbackId++;
            m_callbacks.emplace(id, std::move(callback));
            return id;
        }
    }

    // Already cancelled, run it right away and hand out an id that is never stored
    callback();
    return 0;
}

void CancelToken::RemoveCallback(uint64_t id)
{
    std::unique_lock<std::mutex> lock(m_mutex);
    m_callbacks.erase(id);

    // A callback that is running right now may still touch the state of its owner
    if (m_runningCallbacks && m_cancellingThread != std::this_thread::get_id()) {
        m_callbacksDoneCV.wait(lock, [this]{ return !m_runningCallbacks; });
    }
}
