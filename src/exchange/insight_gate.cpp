// Copyright (c) 2025 The Proxima Core developers
// Distributed under the MIT software license

#include <exchange/insight_gate.h>

#include <util/logging.h>

#include <algorithm>

CInsightGate::CInsightGate(double burst, double refill_per_hour)
    : m_capacity(std::max(0.0, burst)),
      m_refillPerSecond(std::max(0.0, refill_per_hour) / 3600.0)
{
}

CInsightGate::Bucket& CInsightGate::RefillBucket(const std::string& dimension, int64_t now) {
    // Caller holds m_mutex
    auto it = m_buckets.find(dimension);
    if (it == m_buckets.end()) {
        Bucket bucket{m_capacity, now};
        it = m_buckets.emplace(dimension, bucket).first;
        return it->second;
    }

    Bucket& bucket = it->second;
    if (now > bucket.lastRefill) {
        double elapsed = static_cast<double>(now - bucket.lastRefill);
        bucket.tokens = std::min(m_capacity, bucket.tokens + elapsed * m_refillPerSecond);
        bucket.lastRefill = now;
    }
    return bucket;
}

std::vector<CLearningInsight> CInsightGate::Filter(const std::vector<CLearningInsight>& insights, int64_t now) {
    std::lock_guard<std::mutex> lock(m_mutex);

    std::vector<CLearningInsight> accepted;
    for (const CLearningInsight& insight : insights) {
        Bucket& bucket = RefillBucket(insight.dimension, now);
        if (bucket.tokens < 1.0) {
            LogPrintf(PROTOCOL, DEBUG, "Rate limited insight for %s", insight.dimension.c_str());
            continue;
        }
        bucket.tokens -= 1.0;
        accepted.push_back(insight);
    }
    return accepted;
}

double CInsightGate::GetTokens(const std::string& dimension, int64_t now) {
    std::lock_guard<std::mutex> lock(m_mutex);
    return RefillBucket(dimension, now).tokens;
}

void CInsightGate::Reset() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_buckets.clear();
}
