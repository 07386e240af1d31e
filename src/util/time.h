// Copyright (c) 2025 The Proxima Core developers
// Distributed under the MIT software license

#ifndef PROXIMA_UTIL_TIME_H
#define PROXIMA_UTIL_TIME_H

#include <cstdint>

/**
 * Current unix time in seconds, or the mock time if one is set.
 */
int64_t GetTime();

/**
 * Milliseconds since an arbitrary epoch (steady clock), for timeouts.
 * Not affected by mock time.
 */
int64_t GetTimeMillis();

/** Wall-clock milliseconds since the unix epoch, for log timestamps. Never mocked. */
int64_t GetWallTimeMillis();

/**
 * Pin GetTime() to a fixed value for tests. 0 restores the wall clock.
 */
void SetMockTime(int64_t mock_time);

#endif // PROXIMA_UTIL_TIME_H
