// Copyright (c) 2025 The Proxima Core developers
// Distributed under the MIT software license

#include <boost/test/unit_test.hpp>

#include <exchange/insight_gate.h>
#include <exchange/messages.h>
#include <exchange/session.h>
#include <net/protocol.h>
#include <transport/loopback.h>
#include <test/test_proxima.h>
#include <util/threadinterrupt.h>
#include <util/time.h>

#include <memory>
#include <string>
#include <thread>
#include <vector>

using namespace compatibility;

namespace {

CLocalAdvert MakeAdvert(const CVibeFingerprint& fp, uint8_t seed) {
    CLocalAdvert advert;
    advert.fingerprint = fp;
    advert.signature = MakeSignature(seed);
    advert.nProfileRevision = 1;
    return advert;
}

SessionParams FastParams() {
    SessionParams params;
    params.step_timeout_ms = 2000;
    params.max_duration_ms = 10000;
    return params;
}

CLearningInsight MakeInsight(size_t dimension, double delta) {
    CLearningInsight insight;
    insight.dimension = FINGERPRINT_DIMENSION_NAMES[dimension];
    insight.delta = delta;
    insight.confidence = 0.5;
    return insight;
}

/** Initiator on its own thread against a hand-driven peer channel */
struct InitiatorHarness {
    std::shared_ptr<CConnection> connection;
    std::unique_ptr<CMessageChannel> mine;
    std::unique_ptr<CMessageChannel> peer;
    CThreadInterrupt interrupt;
    SessionOutcome outcome;
    std::thread thread;

    explicit InitiatorHarness(const SessionParams& params) {
        int64_t now = GetTime();
        connection = std::make_shared<CConnection>(1, MakeSignature(2), ConnectionDirection::OUTBOUND, now);
        auto channels = CreateChannelPair("initiator", "responder");
        mine = std::move(channels.first);
        peer = std::move(channels.second);
        CLocalAdvert local = MakeAdvert(HappyLocal(now), 1);
        thread = std::thread([this, local, params] {
            CExchangeSession session(connection, *mine, local, params, interrupt);
            outcome = session.RunInitiator();
        });
    }

    ~InitiatorHarness() { Join(); }

    void Join() {
        if (thread.joinable()) thread.join();
    }

    CNetMessage Expect(const char* command) {
        CNetMessage msg;
        BOOST_REQUIRE(peer->Receive(msg, 2000));
        BOOST_REQUIRE_EQUAL(msg.GetCommand(), command);
        return msg;
    }
};

}

BOOST_AUTO_TEST_SUITE(exchange_tests)

BOOST_AUTO_TEST_CASE(hello_message) {
    Exchange::CHelloMessage hello;
    hello.nVersion = NetProtocol::PROTOCOL_VERSION;
    hello.signature = MakeSignature(4);
    hello.vFingerprint = EncodeFingerprint(HappyLocal(1700000000), WireFormat::COMPACT);

    CNetMessage msg = Exchange::CreateHelloMessage(hello, false);
    BOOST_CHECK_EQUAL(msg.GetCommand(), NetProtocol::HELLO);
    BOOST_CHECK(msg.IsValid());
    BOOST_CHECK_EQUAL(Exchange::CreateHelloMessage(hello, true).GetCommand(), NetProtocol::HELLOACK);

    Exchange::CHelloMessage parsed;
    BOOST_REQUIRE(Exchange::ParseHelloMessage(msg, parsed));
    BOOST_CHECK_EQUAL(parsed.nVersion, NetProtocol::PROTOCOL_VERSION);
    BOOST_CHECK_EQUAL(parsed.signature, hello.signature);
    BOOST_CHECK(parsed.vFingerprint == hello.vFingerprint);

    CNetMessage trailing = msg;
    trailing.payload.push_back(0);
    BOOST_CHECK(!Exchange::ParseHelloMessage(trailing, parsed));

    Exchange::CDepthMessage depth;
    BOOST_CHECK(!Exchange::ParseDepthMessage(msg, depth));
}

BOOST_AUTO_TEST_CASE(depth_message) {
    Exchange::CDepthMessage depth;
    depth.desired = 0.61234;
    depth.score = 0.7;
    Exchange::CDepthMessage parsed;
    BOOST_REQUIRE(Exchange::ParseDepthMessage(Exchange::CreateDepthMessage(depth), parsed));
    BOOST_CHECK_CLOSE(parsed.desired, 0.6123, 1e-6);
    BOOST_CHECK_CLOSE(parsed.score, 0.7, 1e-6);

    // Values beyond 1.0 in fixed point are invalid
    CDataStream s;
    s.WriteUint16(10001);
    s.WriteUint16(0);
    BOOST_CHECK(!Exchange::ParseDepthMessage(CNetMessage(NetProtocol::DEPTH, s.GetData()), parsed));

    CDataStream short_payload;
    short_payload.WriteUint16(5000);
    BOOST_CHECK(!Exchange::ParseDepthMessage(CNetMessage(NetProtocol::DEPTH, short_payload.GetData()), parsed));
}

BOOST_AUTO_TEST_CASE(insights_message) {
    Exchange::CInsightsMessage out;
    out.insights.push_back(MakeInsight(1, -0.357));
    out.insights.push_back(MakeInsight(6, 0.3));
    out.insights[1].provenance = InsightProvenance::RESPONDER;
    out.fFinal = true;

    Exchange::CInsightsMessage parsed;
    BOOST_REQUIRE(Exchange::ParseInsightsMessage(Exchange::CreateInsightsMessage(out), parsed));
    BOOST_REQUIRE_EQUAL(parsed.insights.size(), 2U);
    BOOST_CHECK(parsed.fFinal);
    BOOST_CHECK_EQUAL(parsed.insights[0].dimension, FINGERPRINT_DIMENSION_NAMES[1]);
    BOOST_CHECK_CLOSE(parsed.insights[0].delta, -0.357, 1e-6);
    BOOST_CHECK_CLOSE(parsed.insights[0].confidence, 0.5, 1e-6);
    BOOST_CHECK(parsed.insights[1].provenance == InsightProvenance::RESPONDER);

    Exchange::CInsightsMessage empty;
    BOOST_REQUIRE(Exchange::ParseInsightsMessage(Exchange::CreateInsightsMessage(empty), parsed));
    BOOST_CHECK(parsed.insights.empty());
    BOOST_CHECK(!parsed.fFinal);
}

BOOST_AUTO_TEST_CASE(insights_message_rejects) {
    Exchange::CInsightsMessage parsed;

    // More insights than one message may carry
    CDataStream too_many;
    too_many.WriteCompactSize(NetProtocol::MAX_INSIGHTS_PER_MESSAGE + 1);
    for (unsigned int i = 0; i <= NetProtocol::MAX_INSIGHTS_PER_MESSAGE; i++) {
        too_many.WriteUint8(0);
        too_many.WriteInt16(100);
        too_many.WriteUint16(100);
        too_many.WriteUint8(0);
    }
    too_many.WriteUint8(1);
    BOOST_CHECK(!Exchange::ParseInsightsMessage(CNetMessage(NetProtocol::INSIGHTS, too_many.GetData()), parsed));

    // Unknown dimension index
    CDataStream bad_dimension;
    bad_dimension.WriteCompactSize(1);
    bad_dimension.WriteUint8(FINGERPRINT_DIMENSIONS);
    bad_dimension.WriteInt16(100);
    bad_dimension.WriteUint16(100);
    bad_dimension.WriteUint8(0);
    bad_dimension.WriteUint8(1);
    BOOST_CHECK(!Exchange::ParseInsightsMessage(CNetMessage(NetProtocol::INSIGHTS, bad_dimension.GetData()), parsed));

    // Delta beyond +-1
    CDataStream bad_delta;
    bad_delta.WriteCompactSize(1);
    bad_delta.WriteUint8(0);
    bad_delta.WriteInt16(-10001);
    bad_delta.WriteUint16(100);
    bad_delta.WriteUint8(0);
    bad_delta.WriteUint8(1);
    BOOST_CHECK(!Exchange::ParseInsightsMessage(CNetMessage(NetProtocol::INSIGHTS, bad_delta.GetData()), parsed));

    // Final flag must be 0 or 1
    CDataStream bad_flag;
    bad_flag.WriteCompactSize(0);
    bad_flag.WriteUint8(2);
    BOOST_CHECK(!Exchange::ParseInsightsMessage(CNetMessage(NetProtocol::INSIGHTS, bad_flag.GetData()), parsed));
}

BOOST_AUTO_TEST_CASE(bye_message) {
    Exchange::CByeMessage bye;
    BOOST_REQUIRE(Exchange::ParseByeMessage(Exchange::CreateByeMessage(Exchange::REASON_IN_COOLDOWN), bye));
    BOOST_CHECK_EQUAL(bye.reason, "in_cooldown");

    BOOST_REQUIRE(Exchange::ParseByeMessage(Exchange::CreateByeMessage(std::string(200, 'x')), bye));
    BOOST_CHECK_EQUAL(bye.reason.size(), 64U);
}

BOOST_AUTO_TEST_CASE(build_and_scale_insights) {
    CompatibilityResult result = score(HappyLocal(1700000000), HappyRemote(1700000000));
    std::vector<CLearningInsight> insights = BuildInsights(result, insight_budget(DepthTier::DEEP),
                                                           InsightProvenance::RESPONDER);
    BOOST_REQUIRE_EQUAL(insights.size(), 1U);
    BOOST_CHECK_EQUAL(insights[0].dimension, FINGERPRINT_DIMENSION_NAMES[1]);
    // Points from the peer's value toward ours
    BOOST_CHECK_CLOSE(insights[0].delta, -0.357, 0.1);
    BOOST_CHECK(insights[0].provenance == InsightProvenance::RESPONDER);
    BOOST_CHECK(BuildInsights(result, 0, InsightProvenance::INITIATOR).empty());

    std::vector<CLearningInsight> scaled = ScaleInsights({MakeInsight(0, 0.3), MakeInsight(1, -0.04)}, 0.5);
    BOOST_REQUIRE_EQUAL(scaled.size(), 2U);
    BOOST_CHECK_CLOSE(scaled[0].delta, MAX_INSIGHT_STEP, 1e-9);
    BOOST_CHECK_CLOSE(scaled[1].delta, -0.02, 1e-9);
    BOOST_CHECK_EQUAL(scaled[0].dimension, FINGERPRINT_DIMENSION_NAMES[0]);
}

BOOST_AUTO_TEST_CASE(insight_gate_rate_limits) {
    CInsightGate gate(2, 3600);
    const int64_t now = 1700000000;
    std::vector<CLearningInsight> burst{MakeInsight(0, 0.01), MakeInsight(0, 0.01), MakeInsight(0, 0.01),
                                        MakeInsight(3, 0.01)};
    std::vector<CLearningInsight> passed = gate.Filter(burst, now);
    BOOST_REQUIRE_EQUAL(passed.size(), 3U);
    BOOST_CHECK_EQUAL(passed[2].dimension, FINGERPRINT_DIMENSION_NAMES[3]);
    BOOST_CHECK_SMALL(gate.GetTokens(FINGERPRINT_DIMENSION_NAMES[0], now), 1e-9);

    // One token per second comes back, up to the burst size
    BOOST_CHECK_CLOSE(gate.GetTokens(FINGERPRINT_DIMENSION_NAMES[0], now + 1), 1.0, 1e-9);
    BOOST_CHECK_CLOSE(gate.GetTokens(FINGERPRINT_DIMENSION_NAMES[0], now + 100), 2.0, 1e-9);

    gate.Reset();
    BOOST_CHECK_EQUAL(gate.Filter(burst, now).size(), 3U);
}

BOOST_AUTO_TEST_CASE(session_happy_path) {
    const int64_t now = GetTime();
    auto channels = CreateChannelPair("initiator", "responder");
    auto initiator_conn = std::make_shared<CConnection>(1, MakeSignature(2), ConnectionDirection::OUTBOUND, now);
    auto responder_conn = std::make_shared<CConnection>(1, MakeSignature(1), ConnectionDirection::INBOUND, now);
    CThreadInterrupt interrupt;

    SessionOutcome initiator_outcome;
    std::thread initiator([&] {
        CExchangeSession session(initiator_conn, *channels.first, MakeAdvert(HappyLocal(now), 1), FastParams(), interrupt);
        initiator_outcome = session.RunInitiator();
    });

    CNetMessage first;
    BOOST_REQUIRE(channels.second->Receive(first, 2000));
    Exchange::CHelloMessage hello;
    BOOST_REQUIRE(Exchange::ParseHelloMessage(first, hello));
    BOOST_CHECK_EQUAL(hello.signature, MakeSignature(1));
    responder_conn->AddMessage();

    CExchangeSession responder(responder_conn, *channels.second, MakeAdvert(HappyRemote(now), 2), FastParams(), interrupt);
    SessionOutcome responder_outcome = responder.RunResponder(hello);
    initiator.join();

    BOOST_CHECK_EQUAL(initiator_outcome.state, ConnectionState::COMPLETED);
    BOOST_CHECK_EQUAL(initiator_outcome.reason, Exchange::REASON_NATURAL_COMPLETION);
    BOOST_CHECK_EQUAL(responder_outcome.state, ConnectionState::COMPLETED);
    BOOST_CHECK_EQUAL(responder_outcome.reason, Exchange::REASON_NATURAL_COMPLETION);

    // Both sides agree on a deep interaction and learned something
    BOOST_CHECK_EQUAL(initiator_outcome.agreement.effective_tier, DepthTier::DEEP);
    BOOST_CHECK_EQUAL(responder_outcome.agreement.effective_tier, DepthTier::DEEP);
    BOOST_CHECK_CLOSE(initiator_outcome.agreement.effective, responder_outcome.agreement.effective, 1e-9);
    BOOST_REQUIRE_EQUAL(initiator_outcome.received.size(), 1U);
    BOOST_REQUIRE_EQUAL(responder_outcome.received.size(), 1U);
    BOOST_CHECK_GT(initiator_outcome.received[0].delta, 0.0);
    BOOST_CHECK_LT(responder_outcome.received[0].delta, 0.0);
    BOOST_CHECK(initiator_outcome.received[0].provenance == InsightProvenance::RESPONDER);

    std::vector<ConnectionState> expected{ConnectionState::DISCOVERED, ConnectionState::HANDSHAKING,
                                          ConnectionState::ACTIVE, ConnectionState::EXCHANGING,
                                          ConnectionState::COMPLETED};
    std::vector<ConnectionState> history = initiator_conn->GetStateHistory();
    BOOST_CHECK_EQUAL_COLLECTIONS(history.begin(), history.end(), expected.begin(), expected.end());
    history = responder_conn->GetStateHistory();
    BOOST_CHECK_EQUAL_COLLECTIONS(history.begin(), history.end(), expected.begin(), expected.end());

    CConnectionSummary summary = initiator_conn->GetSummary();
    BOOST_CHECK_EQUAL(summary.nInsightsSent, 1U);
    BOOST_CHECK_EQUAL(summary.nInsightsReceived, 1U);
    BOOST_CHECK_GE(summary.nMessages, 7U);
}

BOOST_AUTO_TEST_CASE(session_below_floor) {
    const int64_t now = GetTime();
    auto channels = CreateChannelPair("initiator", "responder");
    auto initiator_conn = std::make_shared<CConnection>(1, MakeSignature(2), ConnectionDirection::OUTBOUND, now);
    auto responder_conn = std::make_shared<CConnection>(1, MakeSignature(1), ConnectionDirection::INBOUND, now);
    CThreadInterrupt interrupt;

    SessionOutcome initiator_outcome;
    std::thread initiator([&] {
        CExchangeSession session(initiator_conn, *channels.first, MakeAdvert(HappyLocal(now), 1), FastParams(), interrupt);
        initiator_outcome = session.RunInitiator();
    });

    CNetMessage first;
    BOOST_REQUIRE(channels.second->Receive(first, 2000));
    Exchange::CHelloMessage hello;
    BOOST_REQUIRE(Exchange::ParseHelloMessage(first, hello));

    SessionParams strict = FastParams();
    strict.compat_floor = 0.95;
    CExchangeSession responder(responder_conn, *channels.second, MakeAdvert(HappyRemote(now), 2), strict, interrupt);
    SessionOutcome responder_outcome = responder.RunResponder(hello);
    initiator.join();

    BOOST_CHECK_EQUAL(responder_outcome.state, ConnectionState::ABORTED);
    BOOST_CHECK_EQUAL(responder_outcome.reason, Exchange::REASON_BELOW_FLOOR);
    BOOST_CHECK_EQUAL(initiator_outcome.state, ConnectionState::ABORTED);
    BOOST_CHECK_EQUAL(initiator_outcome.reason, Exchange::REASON_BELOW_FLOOR);
    BOOST_CHECK(initiator_outcome.received.empty());
    BOOST_CHECK_CLOSE(responder_outcome.local_score, 0.85, 0.1);
}

BOOST_AUTO_TEST_CASE(session_peer_declines) {
    InitiatorHarness h(FastParams());
    h.Expect(NetProtocol::HELLO);
    BOOST_REQUIRE(h.peer->Send(Exchange::CreateByeMessage(Exchange::REASON_IN_COOLDOWN)));
    h.Join();
    BOOST_CHECK_EQUAL(h.outcome.state, ConnectionState::ABORTED);
    BOOST_CHECK_EQUAL(h.outcome.reason, Exchange::REASON_IN_COOLDOWN);
    BOOST_CHECK_EQUAL(h.connection->GetReason(), Exchange::REASON_IN_COOLDOWN);
}

BOOST_AUTO_TEST_CASE(session_undecodable_fingerprint) {
    InitiatorHarness h(FastParams());
    h.Expect(NetProtocol::HELLO);
    Exchange::CHelloMessage ack;
    ack.nVersion = NetProtocol::PROTOCOL_VERSION;
    ack.signature = MakeSignature(2);
    ack.vFingerprint = {0x56, 0x42, 0x01, 0x00};
    BOOST_REQUIRE(h.peer->Send(Exchange::CreateHelloMessage(ack, true)));

    CNetMessage bye = h.Expect(NetProtocol::BYE);
    Exchange::CByeMessage parsed;
    BOOST_REQUIRE(Exchange::ParseByeMessage(bye, parsed));
    BOOST_CHECK_EQUAL(parsed.reason, Exchange::REASON_DECODE_FAILURE);
    h.Join();
    BOOST_CHECK_EQUAL(h.outcome.state, ConnectionState::ABORTED);
}

BOOST_AUTO_TEST_CASE(session_peer_bye_while_exchanging_completes) {
    InitiatorHarness h(FastParams());
    h.Expect(NetProtocol::HELLO);
    Exchange::CHelloMessage ack;
    ack.nVersion = NetProtocol::PROTOCOL_VERSION;
    ack.signature = MakeSignature(2);
    ack.vFingerprint = EncodeFingerprint(HappyRemote(GetTime()), WireFormat::COMPACT);
    BOOST_REQUIRE(h.peer->Send(Exchange::CreateHelloMessage(ack, true)));

    h.Expect(NetProtocol::DEPTH);
    Exchange::CDepthMessage depth;
    depth.desired = 0.4;
    depth.score = 0.85;
    BOOST_REQUIRE(h.peer->Send(Exchange::CreateDepthMessage(depth)));

    h.Expect(NetProtocol::INSIGHTS);
    BOOST_REQUIRE(h.peer->Send(Exchange::CreateByeMessage(Exchange::REASON_DURATION_CEILING)));
    h.Join();

    BOOST_CHECK_EQUAL(h.outcome.state, ConnectionState::COMPLETED);
    BOOST_CHECK_EQUAL(h.outcome.reason, Exchange::REASON_DURATION_CEILING);
    // The reluctant peer bounded the effective depth
    BOOST_CHECK_CLOSE(h.outcome.agreement.effective, 0.4, 1e-6);
    BOOST_CHECK_EQUAL(h.outcome.agreement.effective_tier, DepthTier::LIGHT);
    BOOST_CHECK_GT(h.outcome.agreement.learning_rate, learning_rate_for(0.4));
}

BOOST_AUTO_TEST_CASE(session_step_timeout) {
    SessionParams params = FastParams();
    params.step_timeout_ms = 150;
    InitiatorHarness h(params);
    h.Expect(NetProtocol::HELLO);
    h.Join();
    BOOST_CHECK_EQUAL(h.outcome.state, ConnectionState::ABORTED);
    BOOST_CHECK_EQUAL(h.outcome.reason, Exchange::REASON_TIMEOUT);
}

BOOST_AUTO_TEST_CASE(session_duration_ceiling) {
    SessionParams params = FastParams();
    params.max_duration_ms = 150;
    InitiatorHarness h(params);
    h.Expect(NetProtocol::HELLO);
    h.Join();
    BOOST_CHECK_EQUAL(h.outcome.state, ConnectionState::ABORTED);
    BOOST_CHECK_EQUAL(h.outcome.reason, Exchange::REASON_DURATION_CEILING);
}

BOOST_AUTO_TEST_CASE(session_interrupted) {
    InitiatorHarness h(FastParams());
    h.Expect(NetProtocol::HELLO);
    h.interrupt.Interrupt();
    h.Join();
    BOOST_CHECK_EQUAL(h.outcome.state, ConnectionState::ABORTED);
    BOOST_CHECK_EQUAL(h.outcome.reason, Exchange::REASON_SYSTEM_SHUTDOWN);
}

BOOST_AUTO_TEST_SUITE_END()
