// Copyright (c) 2025 The Proxima Core developers
// Distributed under the MIT software license

#ifndef PROXIMA_PRIMITIVES_INSIGHT_H
#define PROXIMA_PRIMITIVES_INSIGHT_H

#include <cstdint>
#include <string>

/** Which side of a connection produced an insight */
enum class InsightProvenance : uint8_t {
    INITIATOR = 0,
    RESPONDER = 1,
};

const char* InsightProvenanceName(InsightProvenance provenance);

/**
 * CLearningInsight - a small signed nudge for one profile dimension,
 * produced during a connection's exchange phase.
 */
struct CLearningInsight {
    std::string dimension;
    double delta{0.0};        // signed, in dimension units
    double confidence{0.0};   // [0,1]
    InsightProvenance provenance{InsightProvenance::INITIATOR};

    std::string ToString() const;
};

#endif // PROXIMA_PRIMITIVES_INSIGHT_H
