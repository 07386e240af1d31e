// Copyright (c) 2025 The Proxima Core developers
// Distributed under the MIT software license

#include <compatibility/depth.h>

#include <algorithm>
#include <cmath>

namespace compatibility {

static double clamp_depth(double depth) {
    if (!std::isfinite(depth)) return 0.0;
    return std::clamp(depth, 0.0, 1.0);
}

double resolve(double local_depth, double remote_depth) {
    return std::min(clamp_depth(local_depth), clamp_depth(remote_depth));
}

double learning_rate_for(double desired_depth) {
    // 0.1 at the surface up to 0.5 for a fully deep interaction
    return 0.1 + 0.4 * clamp_depth(desired_depth);
}

DepthAgreement resolve_agreement(double desired_local, double desired_remote) {
    DepthAgreement agreement;
    agreement.desired_local = clamp_depth(desired_local);
    agreement.desired_remote = clamp_depth(desired_remote);
    agreement.effective = resolve(desired_local, desired_remote);
    agreement.effective_tier = tier_for(agreement.effective);
    agreement.learning_rate = learning_rate_for(agreement.desired_local);
    return agreement;
}

bool meets_floor(double score, double floor) {
    return std::isfinite(score) && score >= floor;
}

} // namespace compatibility
