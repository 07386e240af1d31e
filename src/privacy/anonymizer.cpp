// Copyright (c) 2025 The Proxima Core developers
// Distributed under the MIT software license

#include <privacy/anonymizer.h>

#include <crypto/sha3.h>
#include <net/serialize.h>
#include <util/logging.h>

#include <algorithm>
#include <cmath>
#include <cstring>

static const char* NODE_SIGNATURE_DOMAIN = "proxima/node-signature/v1";

const char* PrivacyLevelName(PrivacyLevel level) {
    switch (level) {
        case PrivacyLevel::STANDARD: return "standard";
        case PrivacyLevel::HIGH: return "high";
        case PrivacyLevel::MAXIMUM: return "maximum";
    }
    return "unknown";
}

bool ParsePrivacyLevel(const std::string& name, PrivacyLevel& level) {
    if (name == "standard") level = PrivacyLevel::STANDARD;
    else if (name == "high") level = PrivacyLevel::HIGH;
    else if (name == "maximum") level = PrivacyLevel::MAXIMUM;
    else return false;
    return true;
}

CPrivacyAnonymizer::CPrivacyAnonymizer(const std::vector<uint8_t>& install_secret,
                                       const AnonymizerOptions& options,
                                       std::shared_ptr<CNoiseSource> noise)
    : m_secret(install_secret), m_options(options), m_noise(std::move(noise))
{
    if (m_secret.empty()) {
        throw std::invalid_argument("CPrivacyAnonymizer: empty install secret");
    }
    if (m_options.fingerprint_ttl <= 0 || m_options.signature_rotation <= 0 ||
        m_options.decay_half_life <= 0) {
        throw std::invalid_argument("CPrivacyAnonymizer: ttl, rotation and half-life must be positive");
    }
    if (!m_noise) {
        m_noise = std::make_shared<CNoiseSource>();
    }
}

double CPrivacyAnonymizer::EpsilonFor(PrivacyLevel level) {
    switch (level) {
        case PrivacyLevel::MAXIMUM: return 0.5;
        case PrivacyLevel::HIGH: return 1.0;
        case PrivacyLevel::STANDARD: return 2.0;
    }
    return 2.0;
}

double CPrivacyAnonymizer::SampleLaplace(double scale, double u) {
    double centered = u - 0.5;
    double sign = centered < 0 ? -1.0 : 1.0;
    return -scale * sign * std::log(1.0 - 2.0 * std::fabs(centered));
}

double CPrivacyAnonymizer::DecayFactor(int64_t updated_at, int64_t now) const {
    int64_t age = std::max<int64_t>(0, now - updated_at);
    return std::exp(-std::log(2.0) * static_cast<double>(age) /
                    static_cast<double>(m_options.decay_half_life));
}

void CPrivacyAnonymizer::ValidateProfile(const CProfileSnapshot& profile) const {
    if (profile.userId.empty()) {
        throw InvalidProfile("profile has no identity");
    }
    for (const char* name : FINGERPRINT_DIMENSION_NAMES) {
        auto it = profile.dimensions.find(name);
        if (it == profile.dimensions.end()) {
            throw InvalidProfile(std::string("missing dimension ") + name);
        }
        if (!std::isfinite(it->second) || it->second < 0.0 || it->second > 1.0) {
            throw InvalidProfile(std::string("dimension out of range: ") + name);
        }
    }
}

CVibeFingerprint CPrivacyAnonymizer::Derive(const CProfileSnapshot& profile, int64_t now) const {
    ValidateProfile(profile);
    if (now <= 0 || now + m_options.fingerprint_ttl > 0xFFFFFFFFLL) {
        throw InvalidProfile("timestamp outside fingerprint range");
    }

    double decay = DecayFactor(profile.nUpdatedAt, now);
    if (decay <= MIN_DECAY) {
        throw InvalidProfile("profile too stale to advertise");
    }

    // Stale profiles drift toward neutral before noise is added
    double retention = 0.5 + 0.5 * decay;
    double scale = SENSITIVITY / GetEpsilon();

    CVibeFingerprint fp;
    for (size_t i = 0; i < FINGERPRINT_DIMENSIONS; i++) {
        double value = profile.dimensions.at(FINGERPRINT_DIMENSION_NAMES[i]);
        value = 0.5 + (value - 0.5) * retention;
        double noise = std::clamp(SampleLaplace(scale, m_noise->Uniform()), -MAX_NOISE, MAX_NOISE);
        fp.SetDimension(i, value + noise);
    }
    fp.nIssuedAt = static_cast<uint32_t>(now);
    fp.nExpiresAt = static_cast<uint32_t>(now + m_options.fingerprint_ttl);

    LogPrintf(PRIVACY, DEBUG, "Derived fingerprint %s (epsilon=%.2f, decay=%.3f, expires=%u)",
              fp.GetSignature().c_str(), GetEpsilon(), decay, fp.nExpiresAt);
    return fp;
}

CNodeSignature CPrivacyAnonymizer::DeriveNodeSignature(const CProfileSnapshot& profile, int64_t now) const {
    if (profile.userId.empty()) {
        throw InvalidProfile("profile has no identity");
    }

    CDataStream epoch;
    epoch.WriteUint64(static_cast<uint64_t>(now / m_options.signature_rotation));

    uint8_t hash[CSHA3_256::OUTPUT_SIZE];
    CSHA3_256 hasher;
    hasher.Write(reinterpret_cast<const uint8_t*>(NODE_SIGNATURE_DOMAIN), strlen(NODE_SIGNATURE_DOMAIN))
          .Write(m_secret)
          .Write(reinterpret_cast<const uint8_t*>(profile.userId.data()), profile.userId.size())
          .Write(epoch.GetData())
          .Finalize(hash);

    CNodeSignature sig;
    memcpy(sig.data, hash, CNodeSignature::SIZE);
    return sig;
}
