// Copyright (c) 2025 The Proxima Core developers
// Distributed under the MIT software license

#include <connection/connection.h>

#include <net/serialize.h>
#include <util/strencodings.h>

#include <cmath>

namespace {
const uint8_t SUMMARY_VERSION = 2;

uint16_t PackUnit(double value) {
    if (!std::isfinite(value) || value < 0.0) value = 0.0;
    if (value > 1.0) value = 1.0;
    return static_cast<uint16_t>(std::lround(value * 10000.0));
}
}

const char* ConnectionStateName(ConnectionState state) {
    switch (state) {
        case ConnectionState::DISCOVERED: return "discovered";
        case ConnectionState::HANDSHAKING: return "handshaking";
        case ConnectionState::ACTIVE: return "active";
        case ConnectionState::EXCHANGING: return "exchanging";
        case ConnectionState::COMPLETED: return "completed";
        case ConnectionState::ABORTED: return "aborted";
    }
    return "unknown";
}

bool IsTerminalState(ConnectionState state) {
    return state == ConnectionState::COMPLETED || state == ConnectionState::ABORTED;
}

const char* ConnectionDirectionName(ConnectionDirection direction) {
    return direction == ConnectionDirection::INBOUND ? "inbound" : "outbound";
}

// CConnectionSummary

int64_t CConnectionSummary::GetDuration() const {
    if (nCompleted == 0) {
        return 0;
    }
    return nCompleted - nCreated;
}

std::string CConnectionSummary::ToString() const {
    return strprintf("conn=%llu node=%s %s state=%s reason=%s score=%.3f depth=%.3f(%s) "
                     "insights=%u/%u msgs=%u",
                     static_cast<unsigned long long>(nId), remote.GetHex().c_str(),
                     ConnectionDirectionName(direction), ConnectionStateName(state),
                     reason.empty() ? "-" : reason.c_str(), localScore, effectiveDepth,
                     compatibility::tier_name(effectiveTier), nInsightsSent, nInsightsReceived, nMessages);
}

std::vector<uint8_t> CConnectionSummary::Serialize() const {
    CDataStream s;
    s.WriteUint8(SUMMARY_VERSION);
    s.WriteUint64(nId);
    s.write(remote.begin(), CNodeSignature::SIZE);
    s.WriteUint8(static_cast<uint8_t>(direction));
    s.WriteUint8(static_cast<uint8_t>(state));
    s.WriteString(reason);
    s.WriteUint16(PackUnit(localScore));
    s.WriteUint16(PackUnit(desiredLocal));
    s.WriteUint16(PackUnit(desiredRemote));
    s.WriteUint16(PackUnit(effectiveDepth));
    s.WriteUint8(static_cast<uint8_t>(effectiveTier));
    s.WriteUint32(nInsightsSent);
    s.WriteUint32(nInsightsReceived);
    s.WriteUint32(nMessages);
    s.WriteInt64(nCreated);
    s.WriteInt64(nEstablished);
    s.WriteInt64(nCompleted);
    s.WriteCompactSize(vStates.size());
    for (ConnectionState state : vStates) {
        s.WriteUint8(static_cast<uint8_t>(state));
    }
    return s.GetData();
}

bool CConnectionSummary::Deserialize(const std::vector<uint8_t>& data, CConnectionSummary& out) {
    try {
        CDataStream s(data);
        if (s.ReadUint8() != SUMMARY_VERSION) {
            return false;
        }
        CConnectionSummary r;
        r.nId = s.ReadUint64();
        s.read(r.remote.data, CNodeSignature::SIZE);
        uint8_t direction = s.ReadUint8();
        uint8_t state = s.ReadUint8();
        if (direction > static_cast<uint8_t>(ConnectionDirection::INBOUND) ||
            state > static_cast<uint8_t>(ConnectionState::ABORTED)) {
            return false;
        }
        r.direction = static_cast<ConnectionDirection>(direction);
        r.state = static_cast<ConnectionState>(state);
        r.reason = s.ReadString(64);
        r.localScore = s.ReadUint16() / 10000.0;
        r.desiredLocal = s.ReadUint16() / 10000.0;
        r.desiredRemote = s.ReadUint16() / 10000.0;
        r.effectiveDepth = s.ReadUint16() / 10000.0;
        uint8_t tier = s.ReadUint8();
        if (tier > static_cast<uint8_t>(compatibility::DepthTier::DEEP)) {
            return false;
        }
        r.effectiveTier = static_cast<compatibility::DepthTier>(tier);
        r.nInsightsSent = s.ReadUint32();
        r.nInsightsReceived = s.ReadUint32();
        r.nMessages = s.ReadUint32();
        r.nCreated = s.ReadInt64();
        r.nEstablished = s.ReadInt64();
        r.nCompleted = s.ReadInt64();
        uint64_t count = s.ReadCompactSize();
        if (count > 6) {
            return false;
        }
        for (uint64_t i = 0; i < count; i++) {
            uint8_t entered = s.ReadUint8();
            if (entered > static_cast<uint8_t>(ConnectionState::ABORTED)) {
                return false;
            }
            r.vStates.push_back(static_cast<ConnectionState>(entered));
        }
        if (!s.eof()) {
            return false;
        }
        out = r;
        return true;
    } catch (const CSerializeError&) {
        return false;
    }
}

// CConnection

CConnection::CConnection(uint64_t id, const CNodeSignature& remote, ConnectionDirection direction, int64_t now)
    : m_id(id), m_direction(direction)
{
    m_summary.nId = id;
    m_summary.remote = remote;
    m_summary.direction = direction;
    m_summary.state = ConnectionState::DISCOVERED;
    m_summary.nCreated = now;
    m_history.push_back(ConnectionState::DISCOVERED);
}

CNodeSignature CConnection::GetRemote() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_summary.remote;
}

ConnectionState CConnection::GetState() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_summary.state;
}

std::string CConnection::GetReason() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_summary.reason;
}

bool CConnection::AdvanceTo(ConnectionState next, int64_t now) {
    std::lock_guard<std::mutex> lock(m_mutex);
    ConnectionState current = m_summary.state;

    if (IsTerminalState(current)) {
        return false;
    }

    bool allowed = false;
    if (next == ConnectionState::ABORTED) {
        allowed = current != ConnectionState::DISCOVERED;
    } else if (next == ConnectionState::COMPLETED) {
        allowed = current == ConnectionState::EXCHANGING;
    } else {
        allowed = static_cast<uint8_t>(next) == static_cast<uint8_t>(current) + 1;
    }
    if (!allowed) {
        return false;
    }

    m_summary.state = next;
    m_history.push_back(next);
    if (next == ConnectionState::ACTIVE) {
        m_summary.nEstablished = now;
    }
    if (IsTerminalState(next)) {
        m_summary.nCompleted = now;
    }
    return true;
}

std::vector<ConnectionState> CConnection::GetStateHistory() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_history;
}

void CConnection::SetReason(const std::string& reason) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_summary.reason = reason;
}

void CConnection::RecordCompatibility(double local_score, const compatibility::DepthAgreement& agreement) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_summary.localScore = local_score;
    m_summary.desiredLocal = agreement.desired_local;
    m_summary.desiredRemote = agreement.desired_remote;
    m_summary.effectiveDepth = agreement.effective;
    m_summary.effectiveTier = agreement.effective_tier;
}

void CConnection::AddInsightsSent(uint32_t count) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_summary.nInsightsSent += count;
}

void CConnection::AddInsightsReceived(uint32_t count) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_summary.nInsightsReceived += count;
}

void CConnection::AddMessage() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_summary.nMessages++;
}

CConnectionSummary CConnection::GetSummary() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    CConnectionSummary summary = m_summary;
    summary.vStates = m_history;
    return summary;
}

bool CConnection::MarkFinished() {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_finished) {
        return false;
    }
    m_finished = true;
    return true;
}
