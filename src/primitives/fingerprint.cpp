// Copyright (c) 2025 The Proxima Core developers
// Distributed under the MIT software license

#include <primitives/fingerprint.h>

#include <crypto/sha3.h>
#include <net/serialize.h>
#include <util/strencodings.h>

#include <algorithm>
#include <cmath>
#include <sstream>

const std::array<const char*, FINGERPRINT_DIMENSIONS> FINGERPRINT_DIMENSION_NAMES = {{
    "exploration_eagerness",
    "community_orientation",
    "authenticity_preference",
    "social_discovery_style",
    "temporal_flexibility",
    "location_adventurousness",
    "curation_tendency",
    "trust_network_reliance",
}};

bool GetDimensionIndex(const std::string& name, size_t& index) {
    for (size_t i = 0; i < FINGERPRINT_DIMENSIONS; i++) {
        if (name == FINGERPRINT_DIMENSION_NAMES[i]) {
            index = i;
            return true;
        }
    }
    return false;
}

uint16_t CVibeFingerprint::Quantize(double value) {
    if (!std::isfinite(value)) value = 0.0;
    value = std::clamp(value, 0.0, 1.0);
    return static_cast<uint16_t>(std::lround(value * 65535.0));
}

void CVibeFingerprint::SetDimension(size_t index, double value) {
    vDimensions.at(index) = Quantize(value);
}

void CVibeFingerprint::SerializeContent(CDataStream& s) const {
    s.WriteUint8(MAGIC_0);
    s.WriteUint8(MAGIC_1);
    s.WriteUint8(VERSION);
    for (uint16_t dim : vDimensions) {
        s.WriteUint16(dim);
    }
    s.WriteUint32(nIssuedAt);
    s.WriteUint32(nExpiresAt);
}

std::string CVibeFingerprint::GetSignature() const {
    CDataStream s;
    SerializeContent(s);
    uint8_t hash[32];
    SHA3_256(s.GetData().data(), s.size(), hash);
    return HexStr(hash, SIGNATURE_SIZE);
}

std::string CVibeFingerprint::ToString() const {
    std::ostringstream oss;
    oss << "CVibeFingerprint(sig=" << GetSignature()
        << ", issued=" << nIssuedAt
        << ", expires=" << nExpiresAt << ", dims=[";
    for (size_t i = 0; i < FINGERPRINT_DIMENSIONS; i++) {
        if (i > 0) oss << ",";
        oss << GetDimension(i);
    }
    oss << "])";
    return oss.str();
}
