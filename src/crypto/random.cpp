// Copyright (c) 2025 The Proxima Core developers
// Distributed under the MIT software license

#include <crypto/random.h>

#include <openssl/rand.h>

#include <stdexcept>

bool GetStrongRandBytes(uint8_t* buf, size_t len) {
    if (buf == nullptr || len == 0) return false;
    return RAND_bytes(buf, static_cast<int>(len)) == 1;
}

static uint64_t StrongSeed() {
    uint8_t bytes[8];
    if (!GetStrongRandBytes(bytes, sizeof(bytes))) {
        throw std::runtime_error("CNoiseSource: failed to gather entropy");
    }
    uint64_t seed = 0;
    for (int i = 0; i < 8; i++) {
        seed |= static_cast<uint64_t>(bytes[i]) << (i * 8);
    }
    return seed;
}

CNoiseSource::CNoiseSource() : m_engine(StrongSeed()) {
}

CNoiseSource::CNoiseSource(uint64_t seed) : m_engine(seed) {
}

double CNoiseSource::Uniform() {
    std::lock_guard<std::mutex> lock(m_mutex);
    // 53 random bits, shifted off zero so the result is never 0 or 1
    uint64_t bits = m_engine() >> 11;
    return (static_cast<double>(bits) + 0.5) / 9007199254740992.0;
}
