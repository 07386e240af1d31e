// Copyright (c) 2025 The Proxima Core developers
// Distributed under the MIT software license

#ifndef PROXIMA_EXCHANGE_SESSION_H
#define PROXIMA_EXCHANGE_SESSION_H

#include <compatibility/analyzer.h>
#include <compatibility/depth.h>
#include <connection/connection.h>
#include <discovery/advertiser.h>
#include <exchange/messages.h>
#include <transport/transport.h>
#include <util/threadinterrupt.h>

#include <memory>
#include <string>
#include <vector>

struct SessionParams {
    int step_timeout_ms{5000};          // per network round-trip step
    int64_t max_duration_ms{60000};     // whole-connection ceiling
    size_t max_messages{8};             // insights messages in the exchange phase
    double compat_floor{compatibility::DEFAULT_COMPATIBILITY_FLOOR};
    compatibility::CompatibilityParams compat;
};

/** Largest change one received insight may make to a dimension */
static const double MAX_INSIGHT_STEP = 0.05;

struct SessionOutcome {
    ConnectionState state{ConnectionState::ABORTED};
    std::string reason;
    /** Validated insights as received from the peer, before local scaling */
    std::vector<CLearningInsight> received;
    compatibility::DepthAgreement agreement;
    double local_score{0.0};
};

/**
 * Build this side's insights for the peer from its learning opportunities,
 * strongest first, bounded by budget. Each insight points from the peer's
 * value toward ours.
 */
std::vector<CLearningInsight> BuildInsights(const compatibility::CompatibilityResult& result,
                                            size_t budget, InsightProvenance provenance);

/**
 * Scale received insights by the local learning rate and cap each step at
 * MAX_INSIGHT_STEP before they reach the profile store.
 */
std::vector<CLearningInsight> ScaleInsights(const std::vector<CLearningInsight>& insights,
                                            double learning_rate);

/**
 * CExchangeSession - runs one connection's handshake and learning exchange
 * over a message channel, driving the connection's state as it goes.
 *
 * Initiator                         Responder
 *   hello      ------------------->
 *              <-------------------   helloack   (or bye)
 *   depth      ------------------->
 *              <-------------------   depth
 *   insights   ------------------->
 *              <-------------------   insights  (until both final or cap)
 *   bye        ------------------->
 *
 * Every receive is bounded by the step timeout and the duration ceiling and
 * is abandoned promptly when the interrupt fires.
 */
class CExchangeSession {
public:
    CExchangeSession(std::shared_ptr<CConnection> connection, CMessageChannel& channel,
                     const CLocalAdvert& local, const SessionParams& params,
                     const CThreadInterrupt& interrupt);

    SessionOutcome RunInitiator();

    /** Continue an inbound connection whose hello was already read */
    SessionOutcome RunResponder(const Exchange::CHelloMessage& hello);

private:
    enum class RecvStatus { OK, TIMEOUT, CLOSED, INTERRUPTED, DEADLINE };

    RecvStatus ReceiveStep(CNetMessage& msg);
    bool SendStep(const CNetMessage& msg);

    /** Enter HANDSHAKING unless the lifecycle already did */
    bool BeginHandshake();

    /** Decode and score the peer's fingerprint; false if the session must end */
    bool ScoreRemote(const std::vector<uint8_t>& compact_fingerprint);

    /** Exchange depth messages; initiator sends first */
    bool NegotiateDepth(bool initiator);

    /** Alternate insight messages until both sides are final or the cap is hit */
    void RunExchange(bool initiator);

    /** End the session, telling the peer why when send_bye is set */
    void Finish(ConnectionState state, const std::string& reason, bool send_bye);

    /** Map a failed receive to the right terminal outcome */
    void FailReceive(RecvStatus status, const char* step);

    /** A bye arrived; COMPLETED once exchanging, ABORTED before */
    void HandlePeerBye(const CNetMessage& msg);

    bool IsFinished() const { return m_finished; }

    std::shared_ptr<CConnection> m_connection;
    CMessageChannel& m_channel;
    const CLocalAdvert m_local;
    const SessionParams m_params;
    const CThreadInterrupt& m_interrupt;
    const int64_t m_deadline;
    InsightProvenance m_role{InsightProvenance::INITIATOR};

    CVibeFingerprint m_remoteFingerprint;
    compatibility::CompatibilityResult m_result;
    SessionOutcome m_outcome;
    bool m_finished{false};
};

#endif // PROXIMA_EXCHANGE_SESSION_H
