// Copyright (c) 2025 The Proxima Core developers
// Distributed under the MIT software license

#ifndef PROXIMA_UTIL_THREADINTERRUPT_H
#define PROXIMA_UTIL_THREADINTERRUPT_H

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>

/**
 * Cancellation token shared between an owner and its worker loops.
 *
 * Workers sleep through SleepFor(), which returns early (false) once the
 * owner calls Interrupt(). Reset() re-arms the token for a restart.
 */
class CThreadInterrupt {
public:
    CThreadInterrupt() : m_flag(false) {}

    /** True once Interrupt() has been called and not yet Reset() */
    explicit operator bool() const { return m_flag.load(std::memory_order_acquire); }

    void Interrupt();
    void Reset();

    /**
     * Sleep for the given duration unless interrupted.
     * @return false if interrupted before or during the sleep
     */
    bool SleepFor(std::chrono::milliseconds duration);

private:
    std::condition_variable m_cv;
    std::mutex m_mutex;
    std::atomic<bool> m_flag;
};

#endif // PROXIMA_UTIL_THREADINTERRUPT_H
