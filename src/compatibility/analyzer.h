// Copyright (c) 2025 The Proxima Core developers
// Distributed under the MIT software license

#ifndef PROXIMA_COMPATIBILITY_ANALYZER_H
#define PROXIMA_COMPATIBILITY_ANALYZER_H

/**
 * Compatibility scoring between two fingerprints.
 *
 * Each side scores independently from its own local fingerprint against the
 * remote one it received. The score is the cosine similarity of the
 * centered vectors (value * 2 - 1), mapped from [-1,1] onto [0,1].
 *
 * Depth tiers:
 *   SURFACE   (< 0.2)
 *   LIGHT     (0.2 - 0.5)
 *   MODERATE  (0.5 - 0.8)
 *   DEEP      (>= 0.8)
 */

#include <primitives/fingerprint.h>

#include <cstddef>
#include <string>
#include <vector>

namespace compatibility {

enum class DepthTier {
    SURFACE = 0,
    LIGHT = 1,
    MODERATE = 2,
    DEEP = 3,
};

const char* tier_name(DepthTier tier);
DepthTier tier_for(double value);

/** A dimension where the two sides differ enough to learn from */
struct LearningOpportunity {
    size_t dimension = 0;
    double local_value = 0.0;
    double remote_value = 0.0;
    double delta = 0.0;              // remote - local
    double learning_potential = 0.0; // 1 - |delta|
};

struct CompatibilityParams {
    double band_min = 0.3;  // |delta| below this is near-identical
    double band_max = 0.7;  // |delta| above this is too divergent

    bool is_valid() const {
        return band_min >= 0.0 && band_max <= 1.0 && band_min <= band_max;
    }
};

struct CompatibilityResult {
    double score = 0.0;
    std::vector<LearningOpportunity> opportunities;  // strongest potential first
    DepthTier depth = DepthTier::SURFACE;

    static constexpr double TIER_LIGHT = 0.2;
    static constexpr double TIER_MODERATE = 0.5;
    static constexpr double TIER_DEEP = 0.8;

    std::string to_string() const;
};

/**
 * Pure, deterministic scoring. Never suspends, never touches shared state.
 */
CompatibilityResult score(const CVibeFingerprint& local, const CVibeFingerprint& remote,
                          const CompatibilityParams& params = CompatibilityParams());

/** Insight budget for an effective depth tier */
size_t insight_budget(DepthTier tier);

} // namespace compatibility

#endif // PROXIMA_COMPATIBILITY_ANALYZER_H
