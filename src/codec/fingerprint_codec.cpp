// Copyright (c) 2025 The Proxima Core developers
// Distributed under the MIT software license

#include <codec/fingerprint_codec.h>

#include <net/serialize.h>
#include <util/logging.h>
#include <util/strencodings.h>

#include <nlohmann/json.hpp>

#include <cmath>

using json = nlohmann::json;

namespace {

// Identity-bearing keys that must never appear in a structured fingerprint
const char* const FORBIDDEN_KEYS[] = {
    "id", "user_id", "userId", "email", "displayName", "photoUrl",
};

const int STRUCTURED_VERSION = 1;

std::vector<uint8_t> EncodeCompact(const CVibeFingerprint& fingerprint) {
    CDataStream s;
    fingerprint.SerializeContent(s);
    return s.GetData();
}

bool DecodeCompact(const std::vector<uint8_t>& payload, CVibeFingerprint& out) {
    if (payload.size() != CVibeFingerprint::COMPACT_SIZE) {
        return false;
    }

    try {
        CDataStream s(payload);
        if (s.ReadUint8() != CVibeFingerprint::MAGIC_0 ||
            s.ReadUint8() != CVibeFingerprint::MAGIC_1) {
            return false;
        }
        if (s.ReadUint8() != CVibeFingerprint::VERSION) {
            return false;
        }
        CVibeFingerprint fp;
        for (size_t i = 0; i < FINGERPRINT_DIMENSIONS; i++) {
            fp.vDimensions[i] = s.ReadUint16();
        }
        fp.nIssuedAt = s.ReadUint32();
        fp.nExpiresAt = s.ReadUint32();
        out = fp;
        return true;
    } catch (const CSerializeError&) {
        return false;
    }
}

std::vector<uint8_t> EncodeStructured(const CVibeFingerprint& fingerprint) {
    json doc;
    doc["v"] = STRUCTURED_VERSION;
    json dims = json::object();
    for (size_t i = 0; i < FINGERPRINT_DIMENSIONS; i++) {
        dims[FINGERPRINT_DIMENSION_NAMES[i]] = fingerprint.GetDimension(i);
    }
    doc["dims"] = dims;
    doc["issued"] = fingerprint.nIssuedAt;
    doc["expires"] = fingerprint.nExpiresAt;
    doc["sig"] = fingerprint.GetSignature();

    std::string text = doc.dump();
    return std::vector<uint8_t>(text.begin(), text.end());
}

bool DecodeStructured(const std::vector<uint8_t>& payload, CVibeFingerprint& out) {
    json doc = json::parse(payload.begin(), payload.end(), nullptr, false);
    if (doc.is_discarded() || !doc.is_object()) {
        return false;
    }

    for (const char* key : FORBIDDEN_KEYS) {
        if (doc.contains(key)) {
            LogPrintf(PRIVACY, WARN, "Structured fingerprint carries identity field '%s', rejecting", key);
            return false;
        }
    }

    auto v = doc.find("v");
    auto dims = doc.find("dims");
    auto issued = doc.find("issued");
    auto expires = doc.find("expires");
    auto sig = doc.find("sig");
    if (v == doc.end() || !v->is_number_integer() || v->get<int>() != STRUCTURED_VERSION) {
        return false;
    }
    if (dims == doc.end() || !dims->is_object() || dims->size() != FINGERPRINT_DIMENSIONS) {
        return false;
    }
    if (issued == doc.end() || !issued->is_number_unsigned() ||
        expires == doc.end() || !expires->is_number_unsigned() ||
        sig == doc.end() || !sig->is_string()) {
        return false;
    }
    if (issued->get<uint64_t>() > 0xFFFFFFFFULL || expires->get<uint64_t>() > 0xFFFFFFFFULL) {
        return false;
    }

    CVibeFingerprint fp;
    for (size_t i = 0; i < FINGERPRINT_DIMENSIONS; i++) {
        auto it = dims->find(FINGERPRINT_DIMENSION_NAMES[i]);
        if (it == dims->end() || !it->is_number()) {
            return false;
        }
        double value = it->get<double>();
        if (!std::isfinite(value) || value < 0.0 || value > 1.0) {
            return false;
        }
        fp.SetDimension(i, value);
    }
    fp.nIssuedAt = static_cast<uint32_t>(issued->get<uint64_t>());
    fp.nExpiresAt = static_cast<uint32_t>(expires->get<uint64_t>());

    if (sig->get<std::string>() != fp.GetSignature()) {
        return false;
    }

    out = fp;
    return true;
}

} // namespace

const char* WireFormatName(WireFormat format) {
    switch (format) {
        case WireFormat::COMPACT: return "compact";
        case WireFormat::TEXT: return "text";
        case WireFormat::STRUCTURED: return "structured";
    }
    return "unknown";
}

bool ParseWireFormat(const std::string& name, WireFormat& format) {
    if (name == "compact") format = WireFormat::COMPACT;
    else if (name == "text") format = WireFormat::TEXT;
    else if (name == "structured") format = WireFormat::STRUCTURED;
    else return false;
    return true;
}

const char* DecodeResultString(DecodeResult result) {
    switch (result) {
        case DecodeResult::OK: return "ok";
        case DecodeResult::MALFORMED_PAYLOAD: return "malformed-payload";
        case DecodeResult::EXPIRED: return "expired";
    }
    return "unknown";
}

std::vector<uint8_t> EncodeFingerprint(const CVibeFingerprint& fingerprint, WireFormat format) {
    switch (format) {
        case WireFormat::COMPACT:
            return EncodeCompact(fingerprint);
        case WireFormat::TEXT: {
            std::string text = EncodeBase64(EncodeCompact(fingerprint));
            return std::vector<uint8_t>(text.begin(), text.end());
        }
        case WireFormat::STRUCTURED:
            return EncodeStructured(fingerprint);
    }
    return std::vector<uint8_t>();
}

DecodeResult DecodeFingerprint(const std::vector<uint8_t>& payload, WireFormat format,
                               int64_t now, CVibeFingerprint& out) {
    CVibeFingerprint fp;
    bool ok = false;

    switch (format) {
        case WireFormat::COMPACT:
            ok = DecodeCompact(payload, fp);
            break;
        case WireFormat::TEXT: {
            std::vector<uint8_t> compact;
            ok = DecodeBase64(std::string(payload.begin(), payload.end()), compact) &&
                 DecodeCompact(compact, fp);
            break;
        }
        case WireFormat::STRUCTURED:
            ok = DecodeStructured(payload, fp);
            break;
    }

    if (!ok || fp.nIssuedAt > fp.nExpiresAt || fp.nExpiresAt == 0) {
        return DecodeResult::MALFORMED_PAYLOAD;
    }
    if (fp.IsExpired(now)) {
        return DecodeResult::EXPIRED;
    }

    out = fp;
    return DecodeResult::OK;
}
