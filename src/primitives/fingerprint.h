// Copyright (c) 2025 The Proxima Core developers
// Distributed under the MIT software license

#ifndef PROXIMA_PRIMITIVES_FINGERPRINT_H
#define PROXIMA_PRIMITIVES_FINGERPRINT_H

#include <array>
#include <cstdint>
#include <string>

class CDataStream;

/** Number of anonymized dimensions carried by every fingerprint */
static constexpr size_t FINGERPRINT_DIMENSIONS = 8;

/** Dimension names, in wire order */
extern const std::array<const char*, FINGERPRINT_DIMENSIONS> FINGERPRINT_DIMENSION_NAMES;

/**
 * Look up a dimension index by name
 * @return false if the name is not a core dimension
 */
bool GetDimensionIndex(const std::string& name, size_t& index);

/**
 * CVibeFingerprint - the only artifact ever transmitted.
 *
 * Dimension values are held as 16-bit fixed point (value * 65535) so that
 * every wire format reproduces them exactly. Immutable once issued by the
 * anonymizer; a fingerprint at or past nExpiresAt is treated as absent.
 */
class CVibeFingerprint {
public:
    static constexpr uint8_t MAGIC_0 = 0x56;
    static constexpr uint8_t MAGIC_1 = 0x42;
    static constexpr uint8_t VERSION = 0x01;

    /** magic(2) + version(1) + dims(8*2) + issuedAt(4) + expiresAt(4) */
    static constexpr size_t COMPACT_SIZE = 27;
    static constexpr size_t SIGNATURE_SIZE = 8;

    std::array<uint16_t, FINGERPRINT_DIMENSIONS> vDimensions;
    uint32_t nIssuedAt;
    uint32_t nExpiresAt;

    CVibeFingerprint() : nIssuedAt(0), nExpiresAt(0) { vDimensions.fill(0); }

    bool IsNull() const { return nExpiresAt == 0; }

    /** Dimension value in [0,1] */
    double GetDimension(size_t index) const { return vDimensions.at(index) / 65535.0; }

    /** Store a value, clamped to [0,1] and quantized */
    void SetDimension(size_t index, double value);

    static uint16_t Quantize(double value);

    bool IsExpired(int64_t now) const { return now >= static_cast<int64_t>(nExpiresAt); }

    /** Write the canonical 27-byte content (the compact wire form) */
    void SerializeContent(CDataStream& s) const;

    /** First 8 bytes of SHA3-256 over the canonical content, as hex */
    std::string GetSignature() const;

    bool operator==(const CVibeFingerprint& other) const {
        return vDimensions == other.vDimensions &&
               nIssuedAt == other.nIssuedAt &&
               nExpiresAt == other.nExpiresAt;
    }
    bool operator!=(const CVibeFingerprint& other) const { return !(*this == other); }

    std::string ToString() const;
};

#endif // PROXIMA_PRIMITIVES_FINGERPRINT_H
