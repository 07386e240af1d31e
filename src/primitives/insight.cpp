// Copyright (c) 2025 The Proxima Core developers
// Distributed under the MIT software license

#include <primitives/insight.h>

#include <util/strencodings.h>

const char* InsightProvenanceName(InsightProvenance provenance) {
    switch (provenance) {
        case InsightProvenance::INITIATOR: return "initiator";
        case InsightProvenance::RESPONDER: return "responder";
    }
    return "unknown";
}

std::string CLearningInsight::ToString() const {
    return strprintf("CLearningInsight(%s, delta=%+.4f, confidence=%.3f, from=%s)",
                     dimension.c_str(), delta, confidence, InsightProvenanceName(provenance));
}
