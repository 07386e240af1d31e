// Copyright (c) 2025 The Proxima Core developers
// Distributed under the MIT software license

#include <exchange/session.h>

#include <codec/fingerprint_codec.h>
#include <net/protocol.h>
#include <util/logging.h>
#include <util/time.h>

#include <algorithm>

using namespace compatibility;

namespace {
// Receives are sliced so an interrupt is noticed within this bound
const int RECEIVE_SLICE_MS = 100;
}

std::vector<CLearningInsight> BuildInsights(const CompatibilityResult& result, size_t budget,
                                            InsightProvenance provenance) {
    std::vector<CLearningInsight> insights;
    for (const LearningOpportunity& op : result.opportunities) {
        if (insights.size() >= budget) {
            break;
        }
        CLearningInsight insight;
        insight.dimension = FINGERPRINT_DIMENSION_NAMES[op.dimension];
        insight.delta = Exchange::ToFixedPoint(op.local_value - op.remote_value);
        insight.confidence = Exchange::ToFixedPoint(op.learning_potential);
        insight.provenance = provenance;
        insights.push_back(insight);
    }
    return insights;
}

std::vector<CLearningInsight> ScaleInsights(const std::vector<CLearningInsight>& insights,
                                            double learning_rate) {
    std::vector<CLearningInsight> scaled;
    scaled.reserve(insights.size());
    for (CLearningInsight insight : insights) {
        double step = insight.delta * learning_rate;
        insight.delta = std::min(MAX_INSIGHT_STEP, std::max(-MAX_INSIGHT_STEP, step));
        scaled.push_back(insight);
    }
    return scaled;
}

CExchangeSession::CExchangeSession(std::shared_ptr<CConnection> connection, CMessageChannel& channel,
                                   const CLocalAdvert& local, const SessionParams& params,
                                   const CThreadInterrupt& interrupt)
    : m_connection(std::move(connection)),
      m_channel(channel),
      m_local(local),
      m_params(params),
      m_interrupt(interrupt),
      m_deadline(GetTimeMillis() + params.max_duration_ms)
{
}

bool CExchangeSession::SendStep(const CNetMessage& msg) {
    if (!m_channel.Send(msg)) {
        LogPrintf(PROTOCOL, DEBUG, "conn=%llu: send of %s failed",
                  static_cast<unsigned long long>(m_connection->GetId()), msg.GetCommand().c_str());
        return false;
    }
    m_connection->AddMessage();
    return true;
}

CExchangeSession::RecvStatus CExchangeSession::ReceiveStep(CNetMessage& msg) {
    const int64_t step_end = GetTimeMillis() + m_params.step_timeout_ms;
    while (true) {
        if (m_interrupt) {
            return RecvStatus::INTERRUPTED;
        }
        int64_t now = GetTimeMillis();
        if (now >= m_deadline) {
            return RecvStatus::DEADLINE;
        }
        if (now >= step_end) {
            return RecvStatus::TIMEOUT;
        }

        int64_t slice = std::min<int64_t>(RECEIVE_SLICE_MS, std::min(step_end, m_deadline) - now);
        if (m_channel.Receive(msg, static_cast<int>(slice))) {
            m_connection->AddMessage();
            return RecvStatus::OK;
        }
        if (!m_channel.IsOpen()) {
            return RecvStatus::CLOSED;
        }
    }
}

void CExchangeSession::Finish(ConnectionState state, const std::string& reason, bool send_bye) {
    if (m_finished) {
        return;
    }
    m_finished = true;

    if (send_bye && m_channel.IsOpen()) {
        // Best effort; the peer may already be gone
        SendStep(Exchange::CreateByeMessage(reason));
    }

    int64_t now = GetTime();
    if (!m_connection->AdvanceTo(state, now)) {
        state = ConnectionState::ABORTED;
        m_connection->AdvanceTo(state, now);
    }
    m_connection->SetReason(reason);

    m_outcome.state = state;
    m_outcome.reason = reason;

    LogPrintf(CONNECT, INFO, "conn=%llu %s: %s",
              static_cast<unsigned long long>(m_connection->GetId()),
              ConnectionStateName(state), reason.c_str());
}

void CExchangeSession::FailReceive(RecvStatus status, const char* step) {
    bool exchanging = m_connection->GetState() == ConnectionState::EXCHANGING;
    ConnectionState soft = exchanging ? ConnectionState::COMPLETED : ConnectionState::ABORTED;

    switch (status) {
        case RecvStatus::INTERRUPTED:
            Finish(soft, Exchange::REASON_SYSTEM_SHUTDOWN, true);
            break;
        case RecvStatus::DEADLINE:
            Finish(soft, Exchange::REASON_DURATION_CEILING, true);
            break;
        case RecvStatus::TIMEOUT:
            LogPrintf(PROTOCOL, DEBUG, "conn=%llu: timed out waiting for %s",
                      static_cast<unsigned long long>(m_connection->GetId()), step);
            Finish(ConnectionState::ABORTED, Exchange::REASON_TIMEOUT, true);
            break;
        case RecvStatus::CLOSED:
            Finish(ConnectionState::ABORTED, Exchange::REASON_PROTOCOL_ERROR, false);
            break;
        case RecvStatus::OK:
            break;
    }
}

void CExchangeSession::HandlePeerBye(const CNetMessage& msg) {
    Exchange::CByeMessage bye;
    std::string reason = Exchange::ParseByeMessage(msg, bye) ? bye.reason : Exchange::REASON_PROTOCOL_ERROR;
    bool exchanging = m_connection->GetState() == ConnectionState::EXCHANGING;
    Finish(exchanging ? ConnectionState::COMPLETED : ConnectionState::ABORTED, reason, false);
}

bool CExchangeSession::ScoreRemote(const std::vector<uint8_t>& compact_fingerprint) {
    DecodeResult decoded = DecodeFingerprint(compact_fingerprint, WireFormat::COMPACT, GetTime(),
                                             m_remoteFingerprint);
    if (decoded != DecodeResult::OK) {
        LogPrintf(PROTOCOL, DEBUG, "conn=%llu: peer fingerprint rejected (%s)",
                  static_cast<unsigned long long>(m_connection->GetId()), DecodeResultString(decoded));
        Finish(ConnectionState::ABORTED, Exchange::REASON_DECODE_FAILURE, true);
        return false;
    }

    m_result = score(m_local.fingerprint, m_remoteFingerprint, m_params.compat);
    m_outcome.local_score = m_result.score;

    DepthAgreement provisional;
    provisional.desired_local = Exchange::ToFixedPoint(m_result.score);
    m_connection->RecordCompatibility(m_result.score, provisional);

    LogPrintf(CONNECT, DEBUG, "conn=%llu: %s",
              static_cast<unsigned long long>(m_connection->GetId()), m_result.to_string().c_str());

    if (!meets_floor(m_result.score, m_params.compat_floor)) {
        Finish(ConnectionState::ABORTED, Exchange::REASON_BELOW_FLOOR, true);
        return false;
    }
    return true;
}

bool CExchangeSession::NegotiateDepth(bool initiator) {
    Exchange::CDepthMessage mine;
    mine.desired = Exchange::ToFixedPoint(m_result.score);
    mine.score = m_result.score;

    if (initiator && !SendStep(Exchange::CreateDepthMessage(mine))) {
        Finish(ConnectionState::ABORTED, Exchange::REASON_PROTOCOL_ERROR, false);
        return false;
    }

    CNetMessage msg;
    RecvStatus status = ReceiveStep(msg);
    if (status != RecvStatus::OK) {
        FailReceive(status, NetProtocol::DEPTH);
        return false;
    }
    if (msg.GetCommand() == NetProtocol::BYE) {
        HandlePeerBye(msg);
        return false;
    }
    Exchange::CDepthMessage theirs;
    if (!Exchange::ParseDepthMessage(msg, theirs)) {
        Finish(ConnectionState::ABORTED, Exchange::REASON_PROTOCOL_ERROR, true);
        return false;
    }

    if (!initiator && !SendStep(Exchange::CreateDepthMessage(mine))) {
        Finish(ConnectionState::ABORTED, Exchange::REASON_PROTOCOL_ERROR, false);
        return false;
    }

    m_outcome.agreement = resolve_agreement(mine.desired, theirs.desired);
    m_connection->RecordCompatibility(m_result.score, m_outcome.agreement);
    m_connection->AdvanceTo(ConnectionState::EXCHANGING, GetTime());

    LogPrintf(CONNECT, DEBUG, "conn=%llu: desired %.4f/%.4f effective %.4f (%s)",
              static_cast<unsigned long long>(m_connection->GetId()),
              m_outcome.agreement.desired_local, m_outcome.agreement.desired_remote,
              m_outcome.agreement.effective, tier_name(m_outcome.agreement.effective_tier));
    return true;
}

void CExchangeSession::RunExchange(bool initiator) {
    const size_t budget = insight_budget(m_outcome.agreement.effective_tier);
    const std::vector<CLearningInsight> outgoing = BuildInsights(m_result, budget, m_role);

    size_t next = 0;
    size_t messages = 0;
    bool sent_final = false;
    bool recv_final = false;
    bool my_turn = initiator;

    while (!(sent_final && recv_final) && messages < m_params.max_messages) {
        if (m_interrupt) {
            Finish(ConnectionState::COMPLETED, Exchange::REASON_SYSTEM_SHUTDOWN, true);
            return;
        }
        if (GetTimeMillis() >= m_deadline) {
            Finish(ConnectionState::COMPLETED, Exchange::REASON_DURATION_CEILING, true);
            return;
        }

        if (my_turn) {
            Exchange::CInsightsMessage out;
            size_t end = std::min(outgoing.size(), next + NetProtocol::MAX_INSIGHTS_PER_MESSAGE);
            out.insights.assign(outgoing.begin() + next, outgoing.begin() + end);
            next = end;
            out.fFinal = next == outgoing.size();
            if (!SendStep(Exchange::CreateInsightsMessage(out))) {
                Finish(ConnectionState::ABORTED, Exchange::REASON_PROTOCOL_ERROR, false);
                return;
            }
            m_connection->AddInsightsSent(static_cast<uint32_t>(out.insights.size()));
            sent_final = out.fFinal;
        } else {
            CNetMessage msg;
            RecvStatus status = ReceiveStep(msg);
            if (status != RecvStatus::OK) {
                FailReceive(status, NetProtocol::INSIGHTS);
                return;
            }
            if (msg.GetCommand() == NetProtocol::BYE) {
                HandlePeerBye(msg);
                return;
            }
            Exchange::CInsightsMessage in;
            if (!Exchange::ParseInsightsMessage(msg, in) ||
                m_outcome.received.size() + in.insights.size() > budget) {
                LogPrintf(PROTOCOL, DEBUG, "conn=%llu: invalid insights message",
                          static_cast<unsigned long long>(m_connection->GetId()));
                Finish(ConnectionState::ABORTED, Exchange::REASON_PROTOCOL_ERROR, true);
                return;
            }
            m_outcome.received.insert(m_outcome.received.end(), in.insights.begin(), in.insights.end());
            m_connection->AddInsightsReceived(static_cast<uint32_t>(in.insights.size()));
            recv_final = in.fFinal;
        }

        messages++;
        my_turn = !my_turn;
    }

    if (initiator) {
        Finish(ConnectionState::COMPLETED, Exchange::REASON_NATURAL_COMPLETION, true);
        return;
    }

    // The exchange is over either way; the initiator's bye only carries its reason
    CNetMessage msg;
    Exchange::CByeMessage bye;
    if (ReceiveStep(msg) == RecvStatus::OK && Exchange::ParseByeMessage(msg, bye)) {
        Finish(ConnectionState::COMPLETED, bye.reason, false);
    } else {
        Finish(ConnectionState::COMPLETED, Exchange::REASON_NATURAL_COMPLETION, false);
    }
}

bool CExchangeSession::BeginHandshake() {
    // The lifecycle may have entered HANDSHAKING before opening the channel
    return m_connection->GetState() == ConnectionState::HANDSHAKING ||
           m_connection->AdvanceTo(ConnectionState::HANDSHAKING, GetTime());
}

SessionOutcome CExchangeSession::RunInitiator() {
    m_role = InsightProvenance::INITIATOR;

    if (!BeginHandshake()) {
        Finish(ConnectionState::ABORTED, Exchange::REASON_PROTOCOL_ERROR, false);
        return m_outcome;
    }

    Exchange::CHelloMessage hello;
    hello.nVersion = NetProtocol::PROTOCOL_VERSION;
    hello.signature = m_local.signature;
    hello.vFingerprint = EncodeFingerprint(m_local.fingerprint, WireFormat::COMPACT);
    if (!SendStep(Exchange::CreateHelloMessage(hello, false))) {
        Finish(ConnectionState::ABORTED, Exchange::REASON_PROTOCOL_ERROR, false);
        return m_outcome;
    }

    CNetMessage msg;
    RecvStatus status = ReceiveStep(msg);
    if (status != RecvStatus::OK) {
        FailReceive(status, NetProtocol::HELLOACK);
        return m_outcome;
    }
    if (msg.GetCommand() == NetProtocol::BYE) {
        HandlePeerBye(msg);
        return m_outcome;
    }

    Exchange::CHelloMessage ack;
    if (msg.GetCommand() != NetProtocol::HELLOACK || !Exchange::ParseHelloMessage(msg, ack) ||
        ack.nVersion < NetProtocol::MIN_PEER_PROTO_VERSION) {
        Finish(ConnectionState::ABORTED, Exchange::REASON_PROTOCOL_ERROR, true);
        return m_outcome;
    }
    if (ack.signature != m_connection->GetRemote()) {
        // Signatures rotate; the peer may have re-keyed since it was sighted
        LogPrintf(CONNECT, DEBUG, "conn=%llu: peer now signs as %s",
                  static_cast<unsigned long long>(m_connection->GetId()), ack.signature.GetHex().c_str());
    }

    if (!ScoreRemote(ack.vFingerprint)) {
        return m_outcome;
    }
    m_connection->AdvanceTo(ConnectionState::ACTIVE, GetTime());

    if (!NegotiateDepth(true)) {
        return m_outcome;
    }
    RunExchange(true);
    return m_outcome;
}

SessionOutcome CExchangeSession::RunResponder(const Exchange::CHelloMessage& hello) {
    m_role = InsightProvenance::RESPONDER;

    if (!BeginHandshake()) {
        Finish(ConnectionState::ABORTED, Exchange::REASON_PROTOCOL_ERROR, false);
        return m_outcome;
    }
    if (hello.nVersion < NetProtocol::MIN_PEER_PROTO_VERSION) {
        Finish(ConnectionState::ABORTED, Exchange::REASON_PROTOCOL_ERROR, true);
        return m_outcome;
    }
    if (!ScoreRemote(hello.vFingerprint)) {
        return m_outcome;
    }

    Exchange::CHelloMessage ack;
    ack.nVersion = NetProtocol::PROTOCOL_VERSION;
    ack.signature = m_local.signature;
    ack.vFingerprint = EncodeFingerprint(m_local.fingerprint, WireFormat::COMPACT);
    if (!SendStep(Exchange::CreateHelloMessage(ack, true))) {
        Finish(ConnectionState::ABORTED, Exchange::REASON_PROTOCOL_ERROR, false);
        return m_outcome;
    }
    m_connection->AdvanceTo(ConnectionState::ACTIVE, GetTime());

    if (!NegotiateDepth(false)) {
        return m_outcome;
    }
    RunExchange(false);
    return m_outcome;
}
