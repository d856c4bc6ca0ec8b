// Copyright (c) 2025 The Poolnode developers
// Distributed under the MIT software license

#ifndef POOLNODE_SYNC_THREADGROUP_H
#define POOLNODE_SYNC_THREADGROUP_H

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <vector>

/**
 * CStopSignal - one-shot broadcast
 *
 * Starts unset, is set exactly once, never resets. Any number of threads
 * may wait on it; all of them wake when it is set.
 */
class CStopSignal {
public:
    CStopSignal() = default;

    CStopSignal(const CStopSignal&) = delete;
    CStopSignal& operator=(const CStopSignal&) = delete;

    /**
     * Set the signal and wake all waiters.
     * @return true if this call set it, false if it was already set
     */
    bool Set();

    bool IsSet() const;

    /** Block until the signal is set */
    void Wait() const;

    /**
     * Block until the signal is set or the timeout expires.
     * Use this to interleave a periodic task with shutdown:
     *
     *   while (!signal.WaitFor(std::chrono::seconds(5))) {
     *       DoPeriodicWork();
     *   }
     *
     * @return true if the signal is set
     */
    template <typename Rep, typename Period>
    bool WaitFor(const std::chrono::duration<Rep, Period>& timeout) const {
        std::unique_lock<std::mutex> lock(m_mutex);
        return m_cv.wait_for(lock, timeout, [this] { return m_set; });
    }

private:
    mutable std::mutex m_mutex;
    mutable std::condition_variable m_cv;
    bool m_set{false};
};

/**
 * CThreadGroup - tracks in-flight work and coordinates a one-time shutdown
 *
 * Every long-lived module owns one. Work that must finish before the module
 * releases its resources is bracketed by Acquire()/Release() (or a
 * CThreadGroupGuard). Stop() broadcasts the stop signal, runs the OnStop
 * hooks newest-first, then blocks until every acquisition is released.
 *
 * A group is single-use: after Stop() it refuses new work for good.
 *
 * No user-written constructor: every member has a default initializer and
 * the stop signal is created on first use, so a plain `CThreadGroup tg;`
 * member is ready immediately.
 */
class CThreadGroup {
public:
    using StopHook = std::function<void()>;

    CThreadGroup() = default;
    CThreadGroup(const CThreadGroup&) = delete;
    CThreadGroup& operator=(const CThreadGroup&) = delete;

    /**
     * Register one unit of in-flight work.
     * @return false if the group is already stopped; the caller must not
     *         start the work and must not call Release()
     */
    bool Acquire();

    /**
     * Release a unit acquired with Acquire(). Exactly once per successful
     * Acquire(), on every exit path, or Stop() never returns.
     * @throws std::logic_error if nothing is acquired
     */
    void Release();

    /** The group's stop signal, valid before and after Stop() */
    CStopSignal& StopSignal();

    /** Non-blocking: has Stop() been called? */
    bool IsStopped();

    /**
     * Register a cleanup hook. Hooks run in reverse registration order when
     * Stop() is called. If the group is already stopped, the hook runs
     * here, synchronously, before OnStop returns.
     */
    void OnStop(StopHook hook);

    /**
     * Stop the group: broadcast the stop signal, run the hooks, then wait
     * for all in-flight work to be released.
     * @return false if the group had already been stopped (nothing is done)
     */
    bool Stop();

    /** Current number of acquisitions (for diagnostics and tests) */
    size_t ActiveCount() const;

private:
    void RunHook(const StopHook& hook) const;

    std::once_flag m_signal_once;
    std::unique_ptr<CStopSignal> m_stop_signal;

    // Guards m_stopped and m_hooks only
    std::mutex m_mutex;
    bool m_stopped{false};
    std::vector<StopHook> m_hooks;

    mutable std::mutex m_active_mutex;
    std::condition_variable m_active_cv;
    size_t m_active{0};
};

/**
 * RAII acquisition of a CThreadGroup
 *
 * Usage:
 *   CThreadGroupGuard guard(m_tg);
 *   if (!guard) return false;  // group stopped
 *   ... work ...
 */
class CThreadGroupGuard {
public:
    explicit CThreadGroupGuard(CThreadGroup& tg) : m_tg(tg), m_acquired(tg.Acquire()) {}
    ~CThreadGroupGuard() {
        if (m_acquired) {
            m_tg.Release();
        }
    }

    CThreadGroupGuard(const CThreadGroupGuard&) = delete;
    CThreadGroupGuard& operator=(const CThreadGroupGuard&) = delete;

    explicit operator bool() const { return m_acquired; }

private:
    CThreadGroup& m_tg;
    bool m_acquired;
};

#endif // POOLNODE_SYNC_THREADGROUP_H
