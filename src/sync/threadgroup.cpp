// Copyright (c) 2025 The Poolnode developers
// Distributed under the MIT software license

#include <sync/threadgroup.h>
#include <util/logging.h>

#include <stdexcept>

// CStopSignal implementation
bool CStopSignal::Set() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_set) {
            return false;
        }
        m_set = true;
    }
    m_cv.notify_all();
    return true;
}

bool CStopSignal::IsSet() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_set;
}

void CStopSignal::Wait() const {
    std::unique_lock<std::mutex> lock(m_mutex);
    m_cv.wait(lock, [this] { return m_set; });
}

// CThreadGroup implementation
CStopSignal& CThreadGroup::StopSignal() {
    std::call_once(m_signal_once, [this] { m_stop_signal = std::make_unique<CStopSignal>(); });
    return *m_stop_signal;
}

bool CThreadGroup::IsStopped() {
    return StopSignal().IsSet();
}

bool CThreadGroup::Acquire() {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_stopped) {
        return false;
    }
    // Incremented while m_mutex is held, so no acquisition can slip in
    // after Stop() has marked the group stopped.
    std::lock_guard<std::mutex> active_lock(m_active_mutex);
    ++m_active;
    return true;
}

void CThreadGroup::Release() {
    std::lock_guard<std::mutex> lock(m_active_mutex);
    if (m_active == 0) {
        throw std::logic_error("CThreadGroup::Release called without a matching Acquire");
    }
    --m_active;
    // Notified under the lock: once Stop() sees zero the owner may destroy the group
    if (m_active == 0) {
        m_active_cv.notify_all();
    }
}

size_t CThreadGroup::ActiveCount() const {
    std::lock_guard<std::mutex> lock(m_active_mutex);
    return m_active;
}

void CThreadGroup::OnStop(StopHook hook) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_stopped) {
            m_hooks.push_back(std::move(hook));
            return;
        }
    }
    RunHook(hook);
}

bool CThreadGroup::Stop() {
    std::vector<StopHook> hooks;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_stopped) {
            return false;
        }
        m_stopped = true;
        StopSignal().Set();
        hooks.swap(m_hooks);
    }

    // Newest first: the last resource registered usually depends on the
    // ones registered before it.
    for (auto it = hooks.rbegin(); it != hooks.rend(); ++it) {
        RunHook(*it);
    }
    hooks.clear();

    std::unique_lock<std::mutex> active_lock(m_active_mutex);
    m_active_cv.wait(active_lock, [this] { return m_active == 0; });
    return true;
}

void CThreadGroup::RunHook(const StopHook& hook) const {
    if (!hook) {
        return;
    }
    try {
        hook();
    } catch (const std::exception& e) {
        // A failing hook must not keep the remaining resources from being released
        LogPrintf(SYNC, ERROR, "Stop hook threw: %s", e.what());
    } catch (...) {
        LogPrintf(SYNC, ERROR, "Stop hook threw a non-standard exception");
    }
}
