// Copyright (c) 2025 The Proxima Core developers
// Distributed under the MIT software license

#ifndef PROXIMA_CRYPTO_RANDOM_H
#define PROXIMA_CRYPTO_RANDOM_H

#include <cstdint>
#include <cstdlib>
#include <mutex>
#include <random>

/**
 * Generate cryptographically secure random bytes (OpenSSL RAND_bytes)
 *
 * @param buf Output buffer
 * @param len Number of bytes to generate
 * @return true on success, false on failure
 */
bool GetStrongRandBytes(uint8_t* buf, size_t len);

/**
 * Source of uniform samples for differential-privacy noise.
 *
 * Seeded from GetStrongRandBytes unless an explicit seed is given
 * (tests only). Thread-safe.
 */
class CNoiseSource {
public:
    CNoiseSource();
    explicit CNoiseSource(uint64_t seed);

    /** Uniform sample in the open interval (0, 1) */
    double Uniform();

private:
    std::mutex m_mutex;
    std::mt19937_64 m_engine;
};

#endif // PROXIMA_CRYPTO_RANDOM_H
