// Copyright (c) 2025 The Proxima Core developers
// Distributed under the MIT software license

#ifndef PROXIMA_EXCHANGE_INSIGHT_GATE_H
#define PROXIMA_EXCHANGE_INSIGHT_GATE_H

#include <primitives/insight.h>

#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <vector>

/**
 * CInsightGate - per-dimension token bucket in front of the profile store
 *
 * Each dimension holds up to `burst` tokens and regains `refill_per_hour`
 * tokens per hour. Every accepted insight costs one token; insights for a
 * dimension with an empty bucket are dropped. Bounds how fast repeated
 * connections can drift the local profile.
 */
class CInsightGate {
public:
    CInsightGate(double burst, double refill_per_hour);

    /** Insights that passed the gate, in input order */
    std::vector<CLearningInsight> Filter(const std::vector<CLearningInsight>& insights, int64_t now);

    /** Current token balance for a dimension (refilled to now) */
    double GetTokens(const std::string& dimension, int64_t now);

    void Reset();

private:
    struct Bucket {
        double tokens;
        int64_t lastRefill;
    };

    Bucket& RefillBucket(const std::string& dimension, int64_t now);

    const double m_capacity;
    const double m_refillPerSecond;
    std::map<std::string, Bucket> m_buckets;
    std::mutex m_mutex;
};

#endif // PROXIMA_EXCHANGE_INSIGHT_GATE_H
