// Copyright (c) 2025 The Proxima Core developers
// Distributed under the MIT software license

#include <compatibility/analyzer.h>

#include <util/strencodings.h>

#include <algorithm>
#include <cmath>

namespace compatibility {

// Below this norm a centered vector carries no direction
static const double MIN_NORM = 1e-6;

const char* tier_name(DepthTier tier) {
    switch (tier) {
        case DepthTier::SURFACE: return "surface";
        case DepthTier::LIGHT: return "light";
        case DepthTier::MODERATE: return "moderate";
        case DepthTier::DEEP: return "deep";
    }
    return "unknown";
}

DepthTier tier_for(double value) {
    if (value >= CompatibilityResult::TIER_DEEP) return DepthTier::DEEP;
    if (value >= CompatibilityResult::TIER_MODERATE) return DepthTier::MODERATE;
    if (value >= CompatibilityResult::TIER_LIGHT) return DepthTier::LIGHT;
    return DepthTier::SURFACE;
}

size_t insight_budget(DepthTier tier) {
    switch (tier) {
        case DepthTier::DEEP: return 6;
        case DepthTier::MODERATE: return 4;
        case DepthTier::LIGHT: return 2;
        case DepthTier::SURFACE: return 1;
    }
    return 1;
}

CompatibilityResult score(const CVibeFingerprint& local, const CVibeFingerprint& remote,
                          const CompatibilityParams& params) {
    CompatibilityResult result;

    double dot = 0.0, norm_local = 0.0, norm_remote = 0.0, abs_diff = 0.0;
    for (size_t i = 0; i < FINGERPRINT_DIMENSIONS; i++) {
        double a = local.GetDimension(i);
        double b = remote.GetDimension(i);
        double x = a * 2.0 - 1.0;
        double y = b * 2.0 - 1.0;
        dot += x * y;
        norm_local += x * x;
        norm_remote += y * y;
        abs_diff += std::fabs(a - b);

        double delta = b - a;
        double magnitude = std::fabs(delta);
        if (magnitude >= params.band_min && magnitude <= params.band_max) {
            LearningOpportunity op;
            op.dimension = i;
            op.local_value = a;
            op.remote_value = b;
            op.delta = delta;
            op.learning_potential = 1.0 - magnitude;
            result.opportunities.push_back(op);
        }
    }

    norm_local = std::sqrt(norm_local);
    norm_remote = std::sqrt(norm_remote);
    if (norm_local < MIN_NORM || norm_remote < MIN_NORM) {
        // A neutral vector has no direction; fall back to mean closeness
        result.score = 1.0 - abs_diff / FINGERPRINT_DIMENSIONS;
    } else {
        double cosine = dot / (norm_local * norm_remote);
        result.score = (std::clamp(cosine, -1.0, 1.0) + 1.0) / 2.0;
    }

    std::stable_sort(result.opportunities.begin(), result.opportunities.end(),
                     [](const LearningOpportunity& a, const LearningOpportunity& b) {
                         return a.learning_potential > b.learning_potential;
                     });

    result.depth = tier_for(result.score);
    return result;
}

std::string CompatibilityResult::to_string() const {
    return strprintf("score=%.3f depth=%s opportunities=%zu",
                     score, tier_name(depth), opportunities.size());
}

} // namespace compatibility
