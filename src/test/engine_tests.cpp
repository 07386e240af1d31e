// Copyright (c) 2025 The Proxima Core developers
// Distributed under the MIT software license

/**
 * Engine Tests
 *
 * Candidate ranking, engine bring-up and teardown, a full discovery to
 * exchange run between two engines, and the data directory guard.
 */

#include <boost/test/unit_test.hpp>

#include <core/engine_context.h>
#include <storage/profile_file.h>
#include <transport/loopback.h>
#include <test/test_proxima.h>
#include <util/pidfile.h>
#include <util/time.h>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include <unistd.h>

namespace {

/** Profile whose dimensions alternate between low and high */
CProfileSnapshot PatternedProfile(const std::string& user, int64_t updated_at) {
    CProfileSnapshot profile;
    profile.userId = user;
    for (size_t i = 0; i < FINGERPRINT_DIMENSIONS; i++) {
        profile.dimensions[FINGERPRINT_DIMENSION_NAMES[i]] = (i % 2 == 0) ? 0.2 : 0.8;
    }
    profile.nUpdatedAt = updated_at;
    profile.nRevision = 1;
    return profile;
}

CEngineConfig LoopbackConfig(const std::string& address) {
    CEngineConfig config;
    config.transports = {"loopback"};
    config.loopback_address = address;
    config.connect_interval = 3600;
    config.scan_tick_ms = 50;
    config.step_timeout_ms = 2000;
    config.max_duration = 10;
    return config;
}

CNodeDescriptor Candidate(uint8_t seed, const CVibeFingerprint& fp, int rssi) {
    CNodeDescriptor descriptor;
    descriptor.signature = MakeSignature(seed);
    descriptor.transport = "loopback";
    descriptor.address = "peer" + std::to_string(seed);
    descriptor.fingerprint = fp;
    descriptor.nRssi = rssi;
    return descriptor;
}

template <typename Pred>
bool WaitUntil(Pred pred, std::chrono::milliseconds timeout) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    return pred();
}

} // namespace

BOOST_AUTO_TEST_SUITE(engine_tests)

BOOST_AUTO_TEST_CASE(rank_by_score_and_proximity) {
    int64_t now = GetTime();
    CVibeFingerprint local = MakeFingerprint({0.2, 0.8, 0.2, 0.8, 0.2, 0.8, 0.2, 0.8}, now);
    CVibeFingerprint close_match = MakeFingerprint({0.2, 0.8, 0.2, 0.8, 0.2, 0.8, 0.2, 0.8}, now);
    CVibeFingerprint opposite = MakeFingerprint({0.8, 0.2, 0.8, 0.2, 0.8, 0.2, 0.8, 0.2}, now);

    std::vector<CNodeDescriptor> candidates;
    candidates.push_back(Candidate(1, close_match, -100));  // score 1, far away
    candidates.push_back(Candidate(2, close_match, -30));   // score 1, adjacent
    candidates.push_back(Candidate(3, opposite, -30));      // score 0, under the floor

    compatibility::CompatibilityParams params;
    std::vector<RankedCandidate> ranked = RankCandidates(local, candidates, 0.05, params);
    BOOST_REQUIRE_EQUAL(ranked.size(), 2U);
    BOOST_CHECK_EQUAL(ranked[0].descriptor.signature, MakeSignature(2));
    BOOST_CHECK_EQUAL(ranked[1].descriptor.signature, MakeSignature(1));
    BOOST_CHECK_CLOSE(ranked[0].priority, 1.0, 1e-6);
    BOOST_CHECK_CLOSE(ranked[1].priority, PRIORITY_SCORE_WEIGHT, 1e-6);
    BOOST_CHECK_CLOSE(ranked[0].score, 1.0, 1e-6);

    // Floor of zero keeps everyone
    ranked = RankCandidates(local, candidates, 0.0, params);
    BOOST_REQUIRE_EQUAL(ranked.size(), 3U);
    BOOST_CHECK_EQUAL(ranked[1].descriptor.signature, MakeSignature(1));
    BOOST_CHECK_EQUAL(ranked[2].descriptor.signature, MakeSignature(3));
    BOOST_CHECK_CLOSE(ranked[2].priority, PRIORITY_PROXIMITY_WEIGHT, 1e-6);
}

BOOST_AUTO_TEST_CASE(rank_ties_keep_discovery_order) {
    int64_t now = GetTime();
    CVibeFingerprint fp = MakeFingerprint({0.2, 0.8, 0.2, 0.8, 0.2, 0.8, 0.2, 0.8}, now);
    std::vector<CNodeDescriptor> candidates = {Candidate(5, fp, -60), Candidate(6, fp, -60), Candidate(7, fp, -60)};
    std::vector<RankedCandidate> ranked = RankCandidates(fp, candidates, 0.05, compatibility::CompatibilityParams());
    BOOST_REQUIRE_EQUAL(ranked.size(), 3U);
    BOOST_CHECK_EQUAL(ranked[0].descriptor.signature, MakeSignature(5));
    BOOST_CHECK_EQUAL(ranked[1].descriptor.signature, MakeSignature(6));
    BOOST_CHECK_EQUAL(ranked[2].descriptor.signature, MakeSignature(7));
}

BOOST_AUTO_TEST_CASE(init_and_shutdown_in_memory) {
    auto medium = std::make_shared<CLoopbackMedium>();
    auto store = std::make_shared<CMemoryProfileStore>(PatternedProfile("solo", GetTime()));

    EngineContext engine;
    BOOST_REQUIRE(engine.Init(LoopbackConfig("solo"), medium, store));
    BOOST_CHECK(engine.running);
    BOOST_CHECK(!engine.Init(LoopbackConfig("solo"), medium, store));

    std::vector<AdapterCapability> caps = engine.GetCapabilities();
    BOOST_REQUIRE_EQUAL(caps.size(), 1U);
    BOOST_CHECK_EQUAL(caps[0].name, "loopback");
    BOOST_CHECK_EQUAL(caps[0].status, TransportStatus::AVAILABLE);

    CLocalAdvert local;
    BOOST_CHECK(engine.advertiser->GetLocal(local));
    BOOST_CHECK(!local.signature.IsNull());

    BOOST_CHECK(!engine.IsDiscoveryEnabled());
    BOOST_CHECK(engine.EnableDiscovery());
    BOOST_CHECK(engine.IsDiscoveryEnabled());
    engine.DisableDiscovery();
    BOOST_CHECK(!engine.IsDiscoveryEnabled());

    // Nobody else on the medium
    BOOST_CHECK(engine.GetCandidates().empty());
    BOOST_CHECK_EQUAL(engine.RunConnectPass(GetTime()), 0U);

    engine.Shutdown();
    BOOST_CHECK(!engine.running);
    engine.Shutdown();
}

BOOST_AUTO_TEST_CASE(unavailable_transport_still_listed) {
    auto store = std::make_shared<CMemoryProfileStore>(PatternedProfile("ble-only", GetTime()));
    CEngineConfig config = LoopbackConfig("unused");
    config.transports = {"ble"};

    EngineContext engine;
    BOOST_REQUIRE(engine.Init(config, nullptr, store));
    std::vector<AdapterCapability> caps = engine.GetCapabilities();
    BOOST_REQUIRE_EQUAL(caps.size(), 1U);
    BOOST_CHECK_EQUAL(caps[0].name, "ble");
    BOOST_CHECK(caps[0].status != TransportStatus::AVAILABLE);
    BOOST_CHECK(!caps[0].scanning);
    engine.Shutdown();
}

BOOST_AUTO_TEST_CASE(two_engines_meet_over_loopback) {
    auto medium = std::make_shared<CLoopbackMedium>();
    auto store_a = std::make_shared<CMemoryProfileStore>(PatternedProfile("alice", GetTime()));
    auto store_b = std::make_shared<CMemoryProfileStore>(PatternedProfile("bob", GetTime()));

    EngineContext a;
    EngineContext b;
    BOOST_REQUIRE(a.Init(LoopbackConfig("node-a"), medium, store_a));
    BOOST_REQUIRE(b.Init(LoopbackConfig("node-b"), medium, store_b));
    BOOST_REQUIRE(a.EnableDiscovery());
    BOOST_REQUIRE(b.EnableDiscovery());

    BOOST_REQUIRE(WaitUntil([&a] { return !a.GetCandidates().empty(); }, std::chrono::seconds(5)));
    std::vector<CNodeDescriptor> seen = a.GetCandidates();
    BOOST_REQUIRE_EQUAL(seen.size(), 1U);
    BOOST_CHECK_EQUAL(seen[0].signature, b.advertiser->GetLocalSignature());
    BOOST_CHECK_EQUAL(seen[0].address, "node-b");

    BOOST_CHECK_EQUAL(a.RunConnectPass(GetTime()), 1U);
    BOOST_CHECK(a.lifecycle->WaitForIdle(std::chrono::seconds(15)));
    BOOST_CHECK(b.lifecycle->WaitForIdle(std::chrono::seconds(15)));

    std::vector<CConnectionSummary> history_a = a.GetHistory();
    std::vector<CConnectionSummary> history_b = b.GetHistory();
    BOOST_REQUIRE_EQUAL(history_a.size(), 1U);
    BOOST_REQUIRE_EQUAL(history_b.size(), 1U);
    BOOST_CHECK_EQUAL(history_a[0].state, ConnectionState::COMPLETED);
    BOOST_CHECK_EQUAL(history_b[0].state, ConnectionState::COMPLETED);
    BOOST_CHECK(history_a[0].direction == ConnectionDirection::OUTBOUND);
    BOOST_CHECK(history_b[0].direction == ConnectionDirection::INBOUND);
    BOOST_CHECK_EQUAL(history_a[0].remote, b.advertiser->GetLocalSignature());
    BOOST_CHECK_GT(history_a[0].localScore, 0.5);
    BOOST_CHECK(a.GetConnectionSummaries().empty());

    // The peer is now in cooldown, so the next pass starts nothing
    BOOST_CHECK_EQUAL(a.RunConnectPass(GetTime()), 0U);

    a.Shutdown();
    b.Shutdown();
}

BOOST_FIXTURE_TEST_CASE(install_secret_survives_restart, TempDirSetup) {
    MockTimeSetup clock;
    auto store = std::make_shared<CMemoryProfileStore>(PatternedProfile("carol", GetTime()));
    CEngineConfig config = LoopbackConfig("carol");
    config.datadir = path;

    CNodeSignature first;
    {
        EngineContext engine;
        BOOST_REQUIRE(engine.Init(config, std::make_shared<CLoopbackMedium>(), store));
        first = engine.advertiser->GetLocalSignature();
        engine.Shutdown();
    }
    BOOST_CHECK(!first.IsNull());

    EngineContext engine;
    BOOST_REQUIRE(engine.Init(config, std::make_shared<CLoopbackMedium>(), store));
    BOOST_CHECK_EQUAL(engine.advertiser->GetLocalSignature(), first);
    engine.Shutdown();
}

BOOST_FIXTURE_TEST_CASE(pidfile_single_instance, TempDirSetup) {
    CPidFile first(path);
    BOOST_REQUIRE(first.TryAcquire());
    BOOST_CHECK(first.IsAcquired());
    BOOST_CHECK_EQUAL(first.GetLockingPid(), static_cast<int>(getpid()));
    BOOST_CHECK(!CPidFile::IsStale(first.GetPath()));

    // Same live pid in the file: a second guard must back off
    CPidFile second(path);
    BOOST_CHECK(!second.TryAcquire());

    first.Release();
    BOOST_CHECK(!first.IsAcquired());
    BOOST_CHECK_EQUAL(first.GetLockingPid(), 0);
    BOOST_CHECK(second.TryAcquire());
}

BOOST_FIXTURE_TEST_CASE(pidfile_takes_over_stale_file, TempDirSetup) {
    std::filesystem::create_directories(path + "/engine");
    {
        std::ofstream pid(path + "/proximad.pid");
        pid << 0 << std::endl;
        std::ofstream lock(path + "/engine/LOCK");
        lock << "";
    }
    BOOST_CHECK(CPidFile::IsStale(path + "/proximad.pid"));

    CPidFile guard(path);
    BOOST_REQUIRE(guard.TryAcquire());
    BOOST_CHECK(!std::filesystem::exists(path + "/engine/LOCK"));
    BOOST_CHECK(!CPidFile::RemoveStaleLocks(path));
}

BOOST_AUTO_TEST_SUITE_END()
