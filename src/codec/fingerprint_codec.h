// Copyright (c) 2025 The Proxima Core developers
// Distributed under the MIT software license

#ifndef PROXIMA_CODEC_FINGERPRINT_CODEC_H
#define PROXIMA_CODEC_FINGERPRINT_CODEC_H

#include <primitives/fingerprint.h>

#include <cstdint>
#include <string>
#include <vector>

/**
 * Wire formats a fingerprint can travel in.
 *
 * COMPACT     fixed 27 bytes, for small advertisement payloads
 * TEXT        Base64 of the compact form, for text-record transports
 * STRUCTURED  self-describing JSON, for stream transports
 */
enum class WireFormat : uint8_t {
    COMPACT = 0,
    TEXT = 1,
    STRUCTURED = 2,
};

enum class DecodeResult {
    OK,
    MALFORMED_PAYLOAD,
    EXPIRED,
};

const char* WireFormatName(WireFormat format);
bool ParseWireFormat(const std::string& name, WireFormat& format);
const char* DecodeResultString(DecodeResult result);

/**
 * Encode a fingerprint in the given format. Never fails for a fingerprint
 * built through CVibeFingerprint (values are already quantized).
 */
std::vector<uint8_t> EncodeFingerprint(const CVibeFingerprint& fingerprint, WireFormat format);

/**
 * Decode a fingerprint.
 *
 * @param payload Raw bytes as received
 * @param format  Format the payload was sent in
 * @param now     Current unix time; a fingerprint with now >= expiresAt is EXPIRED
 * @param out     Filled only when OK is returned
 * @return OK, MALFORMED_PAYLOAD (bad magic/version/length/fields) or EXPIRED
 */
DecodeResult DecodeFingerprint(const std::vector<uint8_t>& payload, WireFormat format,
                               int64_t now, CVibeFingerprint& out);

#endif // PROXIMA_CODEC_FINGERPRINT_CODEC_H
