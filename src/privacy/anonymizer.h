// Copyright (c) 2025 The Proxima Core developers
// Distributed under the MIT software license

#ifndef PROXIMA_PRIVACY_ANONYMIZER_H
#define PROXIMA_PRIVACY_ANONYMIZER_H

#include <crypto/random.h>
#include <primitives/fingerprint.h>
#include <primitives/nodesig.h>
#include <primitives/profile.h>

#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

/**
 * Thrown when a profile snapshot cannot be turned into a fingerprint:
 * empty identity, missing core dimension, non-finite or out-of-range value,
 * or data too stale to advertise.
 */
class InvalidProfile : public std::runtime_error {
public:
    explicit InvalidProfile(const std::string& what) : std::runtime_error(what) {}
};

enum class PrivacyLevel {
    STANDARD,
    HIGH,
    MAXIMUM,
};

const char* PrivacyLevelName(PrivacyLevel level);
bool ParsePrivacyLevel(const std::string& name, PrivacyLevel& level);

struct AnonymizerOptions {
    PrivacyLevel level{PrivacyLevel::STANDARD};
    int64_t fingerprint_ttl{600};         // seconds
    int64_t signature_rotation{3600};     // node signature epoch length, seconds
    int64_t decay_half_life{30 * 24 * 3600};
};

/**
 * CPrivacyAnonymizer - derives the expiring, noise-injected fingerprint and
 * the ephemeral node signature from the private profile.
 *
 * Derive() has no side effects beyond drawing noise samples.
 */
class CPrivacyAnonymizer {
public:
    static constexpr double SENSITIVITY = 0.02;
    static constexpr double MAX_NOISE = 0.1;
    static constexpr double MIN_DECAY = 0.1;
    static constexpr size_t SECRET_SIZE = 32;

    /**
     * @param install_secret per-install random secret (SECRET_SIZE bytes)
     * @param noise          noise source; nullptr creates a strongly seeded one
     * @throws std::invalid_argument on an empty secret or non-positive ttl/rotation
     */
    CPrivacyAnonymizer(const std::vector<uint8_t>& install_secret, const AnonymizerOptions& options,
                       std::shared_ptr<CNoiseSource> noise = nullptr);

    /**
     * Build a fingerprint valid for [now, now + fingerprint_ttl).
     * @throws InvalidProfile on malformed or incomplete input
     */
    CVibeFingerprint Derive(const CProfileSnapshot& profile, int64_t now) const;

    /**
     * One-way node signature for the current rotation epoch.
     * @throws InvalidProfile if the profile has no identity
     */
    CNodeSignature DeriveNodeSignature(const CProfileSnapshot& profile, int64_t now) const;

    /** Differential-privacy budget for the configured level */
    double GetEpsilon() const { return EpsilonFor(m_options.level); }
    static double EpsilonFor(PrivacyLevel level);

    /** Temporal decay factor for a profile last updated at updated_at */
    double DecayFactor(int64_t updated_at, int64_t now) const;

    /** Laplace(0, scale) by inverse CDF of a uniform sample u in (0,1) */
    static double SampleLaplace(double scale, double u);

    const AnonymizerOptions& GetOptions() const { return m_options; }

private:
    void ValidateProfile(const CProfileSnapshot& profile) const;

    std::vector<uint8_t> m_secret;
    AnonymizerOptions m_options;
    std::shared_ptr<CNoiseSource> m_noise;
};

#endif // PROXIMA_PRIVACY_ANONYMIZER_H
