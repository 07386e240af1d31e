// Copyright (c) 2025 The Proxima Core developers
// Distributed under the MIT software license

#include <util/threadinterrupt.h>

void CThreadInterrupt::Interrupt() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_flag.store(true, std::memory_order_release);
    }
    m_cv.notify_all();
}

void CThreadInterrupt::Reset() {
    m_flag.store(false, std::memory_order_release);
}

bool CThreadInterrupt::SleepFor(std::chrono::milliseconds duration) {
    std::unique_lock<std::mutex> lock(m_mutex);
    return !m_cv.wait_for(lock, duration, [this] { return m_flag.load(std::memory_order_acquire); });
}
