// Copyright (c) 2025 The Proxima Core developers
// Distributed under the MIT software license

#ifndef PROXIMA_PRIMITIVES_PROFILE_H
#define PROXIMA_PRIMITIVES_PROFILE_H

#include <cstdint>
#include <map>
#include <string>

/**
 * CProfileSnapshot - read-only copy of the private personality profile.
 *
 * Never leaves the device. Only the anonymizer reads it, and only to
 * derive a fingerprint and the ephemeral node signature.
 */
struct CProfileSnapshot {
    std::string userId;                        // identity-bearing, hashed before use
    std::map<std::string, double> dimensions;  // core dimension name -> [0,1]
    int64_t nUpdatedAt{0};                     // last time the profile changed
    uint64_t nRevision{0};                     // bumped by every applied change
};

#endif // PROXIMA_PRIMITIVES_PROFILE_H
