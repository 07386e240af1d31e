// Copyright (c) 2025 The Proxima Core developers
// Distributed under the MIT software license

#include <util/time.h>

#include <atomic>
#include <chrono>
#include <ctime>

static std::atomic<int64_t> g_mock_time{0};

int64_t GetTime() {
    int64_t mock = g_mock_time.load(std::memory_order_relaxed);
    if (mock != 0) {
        return mock;
    }
    return static_cast<int64_t>(time(nullptr));
}

int64_t GetTimeMillis() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now().time_since_epoch()
    ).count();
}

int64_t GetWallTimeMillis() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()
    ).count();
}

void SetMockTime(int64_t mock_time) {
    g_mock_time.store(mock_time, std::memory_order_relaxed);
}
