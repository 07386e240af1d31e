// Copyright (c) 2025 The Proxima Core developers
// Distributed under the MIT software license

#ifndef PROXIMA_EXCHANGE_MESSAGES_H
#define PROXIMA_EXCHANGE_MESSAGES_H

#include <net/serialize.h>
#include <primitives/insight.h>
#include <primitives/nodesig.h>

#include <cstdint>
#include <string>
#include <vector>

/**
 * Learning exchange message set.
 *
 *   hello / helloack  version(u32) | node signature(8) | CompactSize + compact fingerprint
 *   depth             desired depth(u16, 1e-4) | local score(u16, 1e-4)
 *   insights          CompactSize count (<= 16) | count * insight | final(u8)
 *                     insight = dimension index(u8) | delta(i16, 1e-4)
 *                               | confidence(u16, 1e-4) | provenance(u8)
 *   bye               reason string
 *
 * Parse* functions never throw; a payload that does not parse, has
 * trailing bytes or carries out-of-range values is rejected.
 */
namespace Exchange {

/** Fixed-point scale for depths, scores, deltas and confidences */
static const double FIXED_POINT_SCALE = 10000.0;

/** Bye reasons */
extern const char* REASON_NATURAL_COMPLETION;
extern const char* REASON_DURATION_CEILING;
extern const char* REASON_BELOW_FLOOR;
extern const char* REASON_DECODE_FAILURE;
extern const char* REASON_TOO_MANY_CONNECTIONS;
extern const char* REASON_IN_COOLDOWN;
extern const char* REASON_ALREADY_CONNECTING;
extern const char* REASON_SYSTEM_SHUTDOWN;
extern const char* REASON_PROTOCOL_ERROR;
extern const char* REASON_TIMEOUT;
extern const char* REASON_UNREACHABLE;

struct CHelloMessage {
    uint32_t nVersion{0};
    CNodeSignature signature;
    std::vector<uint8_t> vFingerprint;  // compact wire form, decoded by the session
};

struct CDepthMessage {
    double desired{0.0};
    double score{0.0};
};

struct CInsightsMessage {
    std::vector<CLearningInsight> insights;
    bool fFinal{false};
};

struct CByeMessage {
    std::string reason;
};

CNetMessage CreateHelloMessage(const CHelloMessage& msg, bool ack);
CNetMessage CreateDepthMessage(const CDepthMessage& msg);
CNetMessage CreateInsightsMessage(const CInsightsMessage& msg);
CNetMessage CreateByeMessage(const std::string& reason);

bool ParseHelloMessage(const CNetMessage& message, CHelloMessage& msg);
bool ParseDepthMessage(const CNetMessage& message, CDepthMessage& msg);
bool ParseInsightsMessage(const CNetMessage& message, CInsightsMessage& msg);
bool ParseByeMessage(const CNetMessage& message, CByeMessage& msg);

/** Round to the wire's fixed-point resolution */
double ToFixedPoint(double value);

} // namespace Exchange

#endif // PROXIMA_EXCHANGE_MESSAGES_H
