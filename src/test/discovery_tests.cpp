// Copyright (c) 2025 The Proxima Core developers
// Distributed under the MIT software license

#include <boost/test/unit_test.hpp>

#include <discovery/advertiser.h>
#include <discovery/discovery.h>
#include <storage/profile_file.h>
#include <transport/loopback.h>
#include <transport/null_transport.h>
#include <test/test_proxima.h>
#include <util/time.h>

#include <chrono>
#include <memory>
#include <thread>
#include <vector>

namespace {

const int64_t NOW = 1700000000;

CSighting MakeSighting(const CNodeSignature& sig, const CVibeFingerprint& fp, int rssi,
                       WireFormat format = WireFormat::COMPACT) {
    CSighting sighting;
    sighting.nodeSignature = sig;
    sighting.address = sig.GetHex();
    sighting.payload = EncodeFingerprint(fp, format);
    sighting.nRssi = rssi;
    return sighting;
}

struct DiscoverySetup {
    DiscoveryOptions options;
    CNodeSignature local;
    std::unique_ptr<CDiscoveryManager> manager;

    DiscoverySetup() {
        options.silence_window = 60;
        local = MakeSignature(200);
        manager.reset(new CDiscoveryManager(options, [this] { return local; }));
        manager->AddAdapter(std::make_shared<CNullTransport>("test"), TransportStatus::AVAILABLE);
    }

    const AdapterCapability& Capability() {
        capabilities = manager->GetCapabilities();
        return capabilities.at(0);
    }

    std::vector<AdapterCapability> capabilities;
};

std::shared_ptr<CPrivacyAnonymizer> MakeAnonymizer(int64_t ttl) {
    AnonymizerOptions options;
    options.fingerprint_ttl = ttl;
    return std::make_shared<CPrivacyAnonymizer>(std::vector<uint8_t>(32, 0x11), options,
                                                std::make_shared<CNoiseSource>(7));
}

}

BOOST_AUTO_TEST_SUITE(discovery_tests)

BOOST_AUTO_TEST_CASE(proximity_from_rssi) {
    CNodeDescriptor node;
    node.nRssi = -30;
    BOOST_CHECK_CLOSE(node.Proximity(), 1.0, 1e-9);
    node.nRssi = -65;
    BOOST_CHECK_CLOSE(node.Proximity(), 0.5, 1e-9);
    node.nRssi = -100;
    BOOST_CHECK_SMALL(node.Proximity(), 1e-9);
    node.nRssi = -120;
    BOOST_CHECK_SMALL(node.Proximity(), 1e-9);
    node.nRssi = -10;
    BOOST_CHECK_CLOSE(node.Proximity(), 1.0, 1e-9);
}

BOOST_FIXTURE_TEST_CASE(new_sighting_becomes_candidate, DiscoverySetup) {
    CVibeFingerprint fp = MakeFingerprint({0.7}, NOW);
    BOOST_CHECK_EQUAL(manager->HandleSighting("test", WireFormat::COMPACT, MakeSighting(MakeSignature(1), fp, -60), NOW),
                      DecodeResult::OK);

    std::vector<CNodeDescriptor> candidates = manager->Candidates(NOW);
    BOOST_REQUIRE_EQUAL(candidates.size(), 1U);
    BOOST_CHECK_EQUAL(candidates[0].signature, MakeSignature(1));
    BOOST_CHECK_EQUAL(candidates[0].transport, "test");
    BOOST_CHECK(candidates[0].fingerprint == fp);
    BOOST_CHECK_EQUAL(candidates[0].nFirstSeen, NOW);
    BOOST_CHECK_EQUAL(Capability().nAccepted, 1U);
}

BOOST_FIXTURE_TEST_CASE(resighting_refreshes_in_place, DiscoverySetup) {
    CNodeSignature sig = MakeSignature(1);
    manager->HandleSighting("test", WireFormat::COMPACT, MakeSighting(sig, MakeFingerprint({0.2}, NOW), -80), NOW);
    CVibeFingerprint newer = MakeFingerprint({0.9}, NOW + 30);
    manager->HandleSighting("test", WireFormat::COMPACT, MakeSighting(sig, newer, -50), NOW + 30);

    BOOST_CHECK_EQUAL(manager->Size(), 1U);
    CNodeDescriptor node;
    BOOST_REQUIRE(manager->GetCandidate(sig, node));
    BOOST_CHECK(node.fingerprint == newer);
    BOOST_CHECK_EQUAL(node.nRssi, -50);
    BOOST_CHECK_EQUAL(node.nFirstSeen, NOW);
    BOOST_CHECK_EQUAL(node.nLastSeen, NOW + 30);
}

BOOST_FIXTURE_TEST_CASE(expired_sighting_is_dropped, DiscoverySetup) {
    CVibeFingerprint fp = MakeFingerprint({0.7}, NOW, 600);
    BOOST_CHECK_EQUAL(manager->HandleSighting("test", WireFormat::COMPACT, MakeSighting(MakeSignature(1), fp, -60), NOW + 600),
                      DecodeResult::EXPIRED);
    BOOST_CHECK_EQUAL(manager->Size(), 0U);
    BOOST_CHECK_EQUAL(Capability().nDropped, 1U);
}

BOOST_FIXTURE_TEST_CASE(expired_readvertisement_removes_node, DiscoverySetup) {
    CNodeSignature sig = MakeSignature(1);
    manager->HandleSighting("test", WireFormat::COMPACT, MakeSighting(sig, MakeFingerprint({0.7}, NOW), -60), NOW);
    BOOST_CHECK_EQUAL(manager->Size(), 1U);

    CVibeFingerprint stale = MakeFingerprint({0.7}, NOW - 100, 50);
    BOOST_CHECK_EQUAL(manager->HandleSighting("test", WireFormat::COMPACT, MakeSighting(sig, stale, -60), NOW + 1),
                      DecodeResult::EXPIRED);
    BOOST_CHECK_EQUAL(manager->Size(), 0U);
}

BOOST_FIXTURE_TEST_CASE(malformed_then_valid, DiscoverySetup) {
    CNodeSignature sig = MakeSignature(1);
    CSighting garbage;
    garbage.nodeSignature = sig;
    garbage.payload = {0x01, 0x02, 0x03};
    BOOST_CHECK_EQUAL(manager->HandleSighting("test", WireFormat::COMPACT, garbage, NOW), DecodeResult::MALFORMED_PAYLOAD);
    BOOST_CHECK_EQUAL(manager->Size(), 0U);

    BOOST_CHECK_EQUAL(manager->HandleSighting("test", WireFormat::COMPACT, MakeSighting(sig, MakeFingerprint({0.4}, NOW), -60), NOW),
                      DecodeResult::OK);
    BOOST_CHECK_EQUAL(manager->Size(), 1U);
    BOOST_CHECK_EQUAL(Capability().nDropped, 1U);
    BOOST_CHECK_EQUAL(Capability().nAccepted, 1U);

    // A payload in a different format than the adapter carries is malformed
    CSighting mismatched = MakeSighting(MakeSignature(2), MakeFingerprint({0.4}, NOW), -60, WireFormat::STRUCTURED);
    BOOST_CHECK_EQUAL(manager->HandleSighting("test", WireFormat::COMPACT, mismatched, NOW), DecodeResult::MALFORMED_PAYLOAD);
}

BOOST_FIXTURE_TEST_CASE(unsigned_sighting_is_malformed, DiscoverySetup) {
    CSighting sighting = MakeSighting(CNodeSignature(), MakeFingerprint({0.4}, NOW), -60);
    BOOST_CHECK_EQUAL(manager->HandleSighting("test", WireFormat::COMPACT, sighting, NOW), DecodeResult::MALFORMED_PAYLOAD);
    BOOST_CHECK_EQUAL(manager->Size(), 0U);
}

BOOST_FIXTURE_TEST_CASE(own_advertisement_is_ignored, DiscoverySetup) {
    BOOST_CHECK_EQUAL(manager->HandleSighting("test", WireFormat::COMPACT, MakeSighting(local, MakeFingerprint({0.4}, NOW), -30), NOW),
                      DecodeResult::OK);
    BOOST_CHECK_EQUAL(manager->Size(), 0U);
    BOOST_CHECK_EQUAL(Capability().nAccepted, 0U);
}

BOOST_FIXTURE_TEST_CASE(candidates_ordered_by_proximity_then_recency, DiscoverySetup) {
    manager->HandleSighting("test", WireFormat::COMPACT, MakeSighting(MakeSignature(1), MakeFingerprint({0.1}, NOW), -80), NOW);
    manager->HandleSighting("test", WireFormat::COMPACT, MakeSighting(MakeSignature(2), MakeFingerprint({0.2}, NOW), -40), NOW);
    manager->HandleSighting("test", WireFormat::COMPACT, MakeSighting(MakeSignature(3), MakeFingerprint({0.3}, NOW), -80), NOW + 5);

    std::vector<CNodeDescriptor> candidates = manager->Candidates(NOW + 5);
    BOOST_REQUIRE_EQUAL(candidates.size(), 3U);
    BOOST_CHECK_EQUAL(candidates[0].signature, MakeSignature(2));
    BOOST_CHECK_EQUAL(candidates[1].signature, MakeSignature(3));
    BOOST_CHECK_EQUAL(candidates[2].signature, MakeSignature(1));
}

BOOST_FIXTURE_TEST_CASE(silent_nodes_are_evicted, DiscoverySetup) {
    manager->HandleSighting("test", WireFormat::COMPACT, MakeSighting(MakeSignature(1), MakeFingerprint({0.1}, NOW), -60), NOW);
    manager->HandleSighting("test", WireFormat::COMPACT, MakeSighting(MakeSignature(2), MakeFingerprint({0.2}, NOW), -60), NOW + 30);

    BOOST_CHECK_EQUAL(manager->Candidates(NOW + 59).size(), 2U);
    std::vector<CNodeDescriptor> candidates = manager->Candidates(NOW + 60);
    BOOST_REQUIRE_EQUAL(candidates.size(), 1U);
    BOOST_CHECK_EQUAL(candidates[0].signature, MakeSignature(2));
    BOOST_CHECK_EQUAL(manager->Prune(NOW + 90), 1U);
    BOOST_CHECK_EQUAL(manager->Size(), 0U);
}

BOOST_FIXTURE_TEST_CASE(expired_fingerprints_are_evicted, DiscoverySetup) {
    manager->HandleSighting("test", WireFormat::COMPACT, MakeSighting(MakeSignature(1), MakeFingerprint({0.1}, NOW, 20), -60), NOW);
    BOOST_CHECK_EQUAL(manager->Candidates(NOW + 19).size(), 1U);
    BOOST_CHECK(manager->Candidates(NOW + 20).empty());
}

BOOST_AUTO_TEST_CASE(unavailable_adapters_are_not_scanned) {
    CDiscoveryManager manager(DiscoveryOptions(), nullptr);
    manager.AddAdapter(std::make_shared<CNullTransport>("ble"), TransportStatus::UNSUPPORTED);
    BOOST_CHECK(!manager.Start());
    std::vector<AdapterCapability> caps = manager.GetCapabilities();
    BOOST_REQUIRE_EQUAL(caps.size(), 1U);
    BOOST_CHECK_EQUAL(caps[0].status, TransportStatus::UNSUPPORTED);
    BOOST_CHECK(!caps[0].scanning);
    manager.Stop();
}

BOOST_AUTO_TEST_CASE(scans_loopback_medium) {
    auto medium = std::make_shared<CLoopbackMedium>();
    auto remote = std::make_shared<CLoopbackTransport>(medium, "remote", -45);
    auto local = std::make_shared<CLoopbackTransport>(medium, "local");

    int64_t now = GetTime();
    AdvertHandle handle = 0;
    BOOST_REQUIRE(remote->Advertise(MakeSignature(9), EncodeFingerprint(MakeFingerprint({0.6}, now), WireFormat::STRUCTURED),
                                    600, handle));

    DiscoveryOptions options;
    options.scan_tick_ms = 50;
    CDiscoveryManager manager(options, nullptr);
    manager.AddAdapter(local, local->CheckAvailability());
    BOOST_REQUIRE(manager.Start());
    BOOST_CHECK(manager.IsRunning());

    std::vector<CNodeDescriptor> candidates;
    for (int i = 0; i < 100 && candidates.empty(); i++) {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        candidates = manager.Candidates();
    }
    BOOST_REQUIRE_EQUAL(candidates.size(), 1U);
    BOOST_CHECK_EQUAL(candidates[0].signature, MakeSignature(9));
    BOOST_CHECK_EQUAL(candidates[0].address, "remote");
    BOOST_CHECK_EQUAL(candidates[0].nRssi, -45);
    BOOST_CHECK(manager.GetCapabilities()[0].scanning);

    manager.Stop();
    BOOST_CHECK(!manager.IsRunning());
    BOOST_CHECK(!manager.GetCapabilities()[0].scanning);
}

BOOST_AUTO_TEST_CASE(advertiser_refresh_schedule) {
    auto store = std::make_shared<CMemoryProfileStore>(MakeProfile("alice", 0.6, NOW));
    CAdvertiser advertiser(store, MakeAnonymizer(600), 100);

    BOOST_CHECK(advertiser.NeedsRefresh(NOW));
    BOOST_CHECK(advertiser.GetLocalSignature().IsNull());
    BOOST_REQUIRE(advertiser.Refresh(NOW));

    CLocalAdvert advert;
    BOOST_REQUIRE(advertiser.GetLocal(advert));
    BOOST_CHECK_EQUAL(advert.fingerprint.nExpiresAt, static_cast<uint32_t>(NOW + 600));
    BOOST_CHECK_EQUAL(advert.nProfileRevision, 1U);
    BOOST_CHECK(!advert.signature.IsNull());

    BOOST_CHECK(!advertiser.NeedsRefresh(NOW + 99));
    BOOST_CHECK(!advertiser.RefreshIfNeeded(NOW + 50));
    BOOST_CHECK(advertiser.NeedsRefresh(NOW + 100));
    BOOST_CHECK(advertiser.RefreshIfNeeded(NOW + 100));
    BOOST_REQUIRE(advertiser.GetLocal(advert));
    BOOST_CHECK_EQUAL(advert.fingerprint.nIssuedAt, static_cast<uint32_t>(NOW + 100));
}

BOOST_AUTO_TEST_CASE(advertiser_refreshes_on_profile_change) {
    MockTimeSetup mock(NOW);
    auto store = std::make_shared<CMemoryProfileStore>(MakeProfile("alice", 0.6, NOW));
    CAdvertiser advertiser(store, MakeAnonymizer(600), 300);
    BOOST_REQUIRE(advertiser.Refresh(NOW));
    BOOST_CHECK(!advertiser.NeedsRefresh(NOW + 1));

    CLearningInsight insight;
    insight.dimension = FINGERPRINT_DIMENSION_NAMES[0];
    insight.delta = 0.05;
    insight.confidence = 1.0;
    BOOST_REQUIRE(store->ApplyInsights({insight}));
    BOOST_CHECK(advertiser.NeedsRefresh(NOW + 1));
    BOOST_REQUIRE(advertiser.Refresh(NOW + 1));

    CLocalAdvert advert;
    BOOST_REQUIRE(advertiser.GetLocal(advert));
    BOOST_CHECK_EQUAL(advert.nProfileRevision, 2U);
}

BOOST_AUTO_TEST_CASE(advertiser_refuses_invalid_profile) {
    auto store = std::make_shared<CMemoryProfileStore>(MakeProfile("", 0.6, NOW));
    CAdvertiser advertiser(store, MakeAnonymizer(600), 300);
    BOOST_CHECK(!advertiser.Refresh(NOW));
    CLocalAdvert advert;
    BOOST_CHECK(!advertiser.GetLocal(advert));
    BOOST_CHECK(advertiser.GetLocalSignature().IsNull());

    BOOST_CHECK_THROW(CAdvertiser(nullptr, MakeAnonymizer(600), 300), std::invalid_argument);
    BOOST_CHECK_THROW(CAdvertiser(store, MakeAnonymizer(600), 0), std::invalid_argument);
}

BOOST_AUTO_TEST_CASE(advertiser_publishes_on_adapters) {
    auto medium = std::make_shared<CLoopbackMedium>();
    auto alpha = std::make_shared<CLoopbackTransport>(medium, "alpha");
    CLoopbackTransport beta(medium, "beta");
    BOOST_REQUIRE(beta.StartScan());

    int64_t now = GetTime();
    auto store = std::make_shared<CMemoryProfileStore>(MakeProfile("alice", 0.6, now));
    CAdvertiser advertiser(store, MakeAnonymizer(600), 300);
    advertiser.AddAdapter(alpha);
    BOOST_REQUIRE(advertiser.Refresh(now));

    CSighting sighting;
    BOOST_REQUIRE(beta.NextSighting(sighting, 200));
    BOOST_CHECK_EQUAL(sighting.nodeSignature, advertiser.GetLocalSignature());

    CVibeFingerprint decoded;
    BOOST_REQUIRE_EQUAL(DecodeFingerprint(sighting.payload, WireFormat::STRUCTURED, now, decoded), DecodeResult::OK);
    CLocalAdvert advert;
    BOOST_REQUIRE(advertiser.GetLocal(advert));
    BOOST_CHECK(decoded == advert.fingerprint);
}

BOOST_AUTO_TEST_SUITE_END()
