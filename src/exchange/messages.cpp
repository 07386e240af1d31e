// Copyright (c) 2025 The Proxima Core developers
// Distributed under the MIT software license

#include <exchange/messages.h>

#include <primitives/fingerprint.h>
#include <util/logging.h>

#include <algorithm>
#include <cmath>

namespace Exchange {

const char* REASON_NATURAL_COMPLETION = "natural_completion";
const char* REASON_DURATION_CEILING = "duration_ceiling";
const char* REASON_BELOW_FLOOR = "below_compatibility_floor";
const char* REASON_DECODE_FAILURE = "decode_failure";
const char* REASON_TOO_MANY_CONNECTIONS = "too_many_connections";
const char* REASON_IN_COOLDOWN = "in_cooldown";
const char* REASON_ALREADY_CONNECTING = "already_connecting";
const char* REASON_SYSTEM_SHUTDOWN = "system_shutdown";
const char* REASON_PROTOCOL_ERROR = "protocol_error";
const char* REASON_TIMEOUT = "timeout";
const char* REASON_UNREACHABLE = "unreachable";

namespace {

const size_t MAX_REASON_LENGTH = 64;
const size_t MAX_FINGERPRINT_BYTES = 256;

uint16_t EncodeUnit(double value) {
    value = std::min(1.0, std::max(0.0, value));
    return static_cast<uint16_t>(std::lround(value * FIXED_POINT_SCALE));
}

int16_t EncodeSigned(double value) {
    value = std::min(1.0, std::max(-1.0, value));
    return static_cast<int16_t>(std::lround(value * FIXED_POINT_SCALE));
}

bool DecodeUnit(uint16_t raw, double& out) {
    if (raw > FIXED_POINT_SCALE) {
        return false;
    }
    out = raw / FIXED_POINT_SCALE;
    return true;
}

bool ExpectCommand(const CNetMessage& message, const char* command) {
    return message.GetCommand() == command;
}

} // namespace

double ToFixedPoint(double value) {
    return std::lround(value * FIXED_POINT_SCALE) / FIXED_POINT_SCALE;
}

CNetMessage CreateHelloMessage(const CHelloMessage& msg, bool ack) {
    CDataStream stream;
    stream.WriteUint32(msg.nVersion);
    stream.write(msg.signature.begin(), CNodeSignature::SIZE);
    stream.WriteBytes(msg.vFingerprint);
    return CNetMessage(ack ? NetProtocol::HELLOACK : NetProtocol::HELLO, stream.GetData());
}

CNetMessage CreateDepthMessage(const CDepthMessage& msg) {
    CDataStream stream;
    stream.WriteUint16(EncodeUnit(msg.desired));
    stream.WriteUint16(EncodeUnit(msg.score));
    return CNetMessage(NetProtocol::DEPTH, stream.GetData());
}

CNetMessage CreateInsightsMessage(const CInsightsMessage& msg) {
    CDataStream stream;
    size_t count = std::min<size_t>(msg.insights.size(), NetProtocol::MAX_INSIGHTS_PER_MESSAGE);
    stream.WriteCompactSize(count);
    for (size_t i = 0; i < count; i++) {
        const CLearningInsight& insight = msg.insights[i];
        size_t index = 0;
        if (!GetDimensionIndex(insight.dimension, index)) {
            // Callers only build insights from known dimensions
            LogPrintf(PROTOCOL, ERROR, "Insight for unknown dimension %s", insight.dimension.c_str());
        }
        stream.WriteUint8(static_cast<uint8_t>(index));
        stream.WriteInt16(EncodeSigned(insight.delta));
        stream.WriteUint16(EncodeUnit(insight.confidence));
        stream.WriteUint8(static_cast<uint8_t>(insight.provenance));
    }
    stream.WriteUint8(msg.fFinal ? 1 : 0);
    return CNetMessage(NetProtocol::INSIGHTS, stream.GetData());
}

CNetMessage CreateByeMessage(const std::string& reason) {
    CDataStream stream;
    stream.WriteString(reason.substr(0, MAX_REASON_LENGTH));
    return CNetMessage(NetProtocol::BYE, stream.GetData());
}

bool ParseHelloMessage(const CNetMessage& message, CHelloMessage& msg) {
    if (!ExpectCommand(message, NetProtocol::HELLO) && !ExpectCommand(message, NetProtocol::HELLOACK)) {
        return false;
    }
    try {
        CDataStream stream(message.payload);
        CHelloMessage result;
        result.nVersion = stream.ReadUint32();
        stream.read(result.signature.data, CNodeSignature::SIZE);
        result.vFingerprint = stream.ReadBytes(MAX_FINGERPRINT_BYTES);
        if (!stream.eof()) {
            return false;
        }
        msg = result;
        return true;
    } catch (const CSerializeError& e) {
        LogPrintf(PROTOCOL, DEBUG, "Malformed %s: %s", message.GetCommand().c_str(), e.what());
        return false;
    }
}

bool ParseDepthMessage(const CNetMessage& message, CDepthMessage& msg) {
    if (!ExpectCommand(message, NetProtocol::DEPTH)) {
        return false;
    }
    try {
        CDataStream stream(message.payload);
        CDepthMessage result;
        if (!DecodeUnit(stream.ReadUint16(), result.desired) ||
            !DecodeUnit(stream.ReadUint16(), result.score) || !stream.eof()) {
            return false;
        }
        msg = result;
        return true;
    } catch (const CSerializeError& e) {
        LogPrintf(PROTOCOL, DEBUG, "Malformed depth: %s", e.what());
        return false;
    }
}

bool ParseInsightsMessage(const CNetMessage& message, CInsightsMessage& msg) {
    if (!ExpectCommand(message, NetProtocol::INSIGHTS)) {
        return false;
    }
    try {
        CDataStream stream(message.payload);
        uint64_t count = stream.ReadCompactSize();
        if (count > NetProtocol::MAX_INSIGHTS_PER_MESSAGE) {
            LogPrintf(PROTOCOL, DEBUG, "Too many insights in one message (%llu)",
                      static_cast<unsigned long long>(count));
            return false;
        }

        CInsightsMessage result;
        for (uint64_t i = 0; i < count; i++) {
            CLearningInsight insight;
            uint8_t index = stream.ReadUint8();
            int16_t delta = stream.ReadInt16();
            uint16_t confidence = stream.ReadUint16();
            uint8_t provenance = stream.ReadUint8();

            if (index >= FINGERPRINT_DIMENSIONS || std::abs(static_cast<int>(delta)) > FIXED_POINT_SCALE ||
                provenance > static_cast<uint8_t>(InsightProvenance::RESPONDER) ||
                !DecodeUnit(confidence, insight.confidence)) {
                return false;
            }
            insight.dimension = FINGERPRINT_DIMENSION_NAMES[index];
            insight.delta = delta / FIXED_POINT_SCALE;
            insight.provenance = static_cast<InsightProvenance>(provenance);
            result.insights.push_back(insight);
        }

        uint8_t final_flag = stream.ReadUint8();
        if (final_flag > 1 || !stream.eof()) {
            return false;
        }
        result.fFinal = final_flag == 1;
        msg = result;
        return true;
    } catch (const CSerializeError& e) {
        LogPrintf(PROTOCOL, DEBUG, "Malformed insights: %s", e.what());
        return false;
    }
}

bool ParseByeMessage(const CNetMessage& message, CByeMessage& msg) {
    if (!ExpectCommand(message, NetProtocol::BYE)) {
        return false;
    }
    try {
        CDataStream stream(message.payload);
        CByeMessage result;
        result.reason = stream.ReadString(MAX_REASON_LENGTH);
        if (!stream.eof()) {
            return false;
        }
        msg = result;
        return true;
    } catch (const CSerializeError& e) {
        LogPrintf(PROTOCOL, DEBUG, "Malformed bye: %s", e.what());
        return false;
    }
}

} // namespace Exchange
