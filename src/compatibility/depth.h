// Copyright (c) 2025 The Proxima Core developers
// Distributed under the MIT software license

#ifndef PROXIMA_COMPATIBILITY_DEPTH_H
#define PROXIMA_COMPATIBILITY_DEPTH_H

#include <compatibility/analyzer.h>

namespace compatibility {

/**
 * Outcome of asymmetric depth resolution for one side of a connection.
 *
 * Only the effective depth bounds what is shared. The local desired depth
 * still sets this side's own learning rate, so a side that values the
 * interaction more learns more from the same insights.
 */
struct DepthAgreement {
    double desired_local = 0.0;
    double desired_remote = 0.0;
    double effective = 0.0;
    DepthTier effective_tier = DepthTier::SURFACE;
    double learning_rate = 0.0;
};

/** Absolute floor below which a side refuses to exchange */
static constexpr double DEFAULT_COMPATIBILITY_FLOOR = 0.05;

/** min(local, remote), both clamped to [0,1]; symmetric */
double resolve(double local_depth, double remote_depth);

DepthAgreement resolve_agreement(double desired_local, double desired_remote);

/** Learning rate applied to received insights for a desired depth */
double learning_rate_for(double desired_depth);

bool meets_floor(double score, double floor = DEFAULT_COMPATIBILITY_FLOOR);

} // namespace compatibility

#endif // PROXIMA_COMPATIBILITY_DEPTH_H
