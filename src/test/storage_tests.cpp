// Copyright (c) 2025 The Proxima Core developers
// Distributed under the MIT software license

#include <boost/test/unit_test.hpp>

#include <storage/leveldb_store.h>
#include <storage/memory_store.h>
#include <storage/profile_file.h>
#include <storage/store.h>
#include <test/test_proxima.h>

#include <fstream>
#include <map>
#include <string>
#include <vector>

namespace {

const int64_t NOW = 1700000000;

std::vector<uint8_t> Bytes(const std::string& s) {
    return std::vector<uint8_t>(s.begin(), s.end());
}

/** Shared behaviour every IPersistence must have */
void CheckPersistence(IPersistence& db) {
    std::vector<uint8_t> value;
    BOOST_CHECK(!db.Read("cd:missing", value));

    BOOST_REQUIRE(db.Write("cd:aa", Bytes("one")));
    BOOST_REQUIRE(db.Write("hist:01", Bytes("two")));
    BOOST_REQUIRE(db.Read("cd:aa", value));
    BOOST_CHECK(value == Bytes("one"));

    BOOST_REQUIRE(db.Write("cd:aa", Bytes("three")));
    BOOST_REQUIRE(db.Read("cd:aa", value));
    BOOST_CHECK(value == Bytes("three"));

    PersistBatch batch;
    batch.emplace_back("cd:bb", Bytes("b"));
    batch.emplace_back("cd:cc", Bytes("c"));
    BOOST_REQUIRE(db.WriteBatch(batch));

    std::map<std::string, std::vector<uint8_t>> prefixed;
    BOOST_REQUIRE(db.ReadPrefix("cd:", prefixed));
    BOOST_REQUIRE_EQUAL(prefixed.size(), 3U);
    BOOST_CHECK(prefixed.begin()->first == "cd:aa");
    BOOST_CHECK(prefixed.count("hist:01") == 0);

    BOOST_REQUIRE(db.Erase("cd:aa"));
    BOOST_CHECK(!db.Read("cd:aa", value));
    // Erasing a missing key is not an error
    BOOST_CHECK(db.Erase("cd:aa"));
}

}

BOOST_AUTO_TEST_SUITE(storage_tests)

BOOST_AUTO_TEST_CASE(persist_keys) {
    CNodeSignature sig = MakeSignature(3);
    std::string key = PersistKeys::Cooldown(sig);
    BOOST_CHECK_EQUAL(key.substr(0, 3), "cd:");
    CNodeSignature parsed;
    BOOST_REQUIRE(PersistKeys::ParseCooldown(key, parsed));
    BOOST_CHECK_EQUAL(parsed, sig);
    BOOST_CHECK(!PersistKeys::ParseCooldown("cd:zz", parsed));
    BOOST_CHECK(!PersistKeys::ParseCooldown(PersistKeys::History(1), parsed));

    BOOST_CHECK_EQUAL(PersistKeys::History(255), "hist:00000000000000ff");
    uint64_t id = 0;
    BOOST_REQUIRE(PersistKeys::ParseHistory(PersistKeys::History(0x1234), id));
    BOOST_CHECK_EQUAL(id, 0x1234U);
    BOOST_CHECK(!PersistKeys::ParseHistory("hist:12", id));
    BOOST_CHECK(!PersistKeys::ParseHistory("hist:zzzzzzzzzzzzzzzz", id));

    // Fixed width keeps key order equal to id order
    BOOST_CHECK(PersistKeys::History(9) < PersistKeys::History(10));
    BOOST_CHECK_EQUAL(PersistKeys::Setting("install_secret"), "set:install_secret");
}

BOOST_AUTO_TEST_CASE(memory_persistence) {
    CMemoryPersistence db;
    CheckPersistence(db);
    BOOST_CHECK_EQUAL(db.Size(), 3U);
}

BOOST_FIXTURE_TEST_CASE(leveldb_persistence, TempDirSetup) {
    CLevelDBPersistence db;
    BOOST_CHECK(!db.IsOpen());
    std::vector<uint8_t> value;
    BOOST_CHECK(!db.Write("cd:aa", Bytes("x")));

    BOOST_REQUIRE(db.Open(path + "/engine"));
    BOOST_CHECK(db.IsOpen());
    CheckPersistence(db);
    db.Close();
    BOOST_CHECK(!db.IsOpen());

    // Reopen and find the same records
    CLevelDBPersistence reopened;
    BOOST_REQUIRE(reopened.Open(path + "/engine"));
    BOOST_REQUIRE(reopened.Read("cd:bb", value));
    BOOST_CHECK(value == Bytes("b"));
    BOOST_REQUIRE(reopened.Read("hist:01", value));
    BOOST_CHECK(value == Bytes("two"));
}

BOOST_AUTO_TEST_CASE(apply_insights_to_snapshot) {
    CProfileSnapshot profile = MakeProfile("alice", 0.5, NOW);

    CLearningInsight up;
    up.dimension = FINGERPRINT_DIMENSION_NAMES[0];
    up.delta = 0.7;
    CLearningInsight down;
    down.dimension = FINGERPRINT_DIMENSION_NAMES[1];
    down.delta = -0.1;
    CLearningInsight unknown;
    unknown.dimension = "favourite_colour";
    unknown.delta = 0.1;

    BOOST_CHECK_EQUAL(ApplyInsightsToSnapshot(profile, {up, down, unknown}, NOW + 10), 2U);
    BOOST_CHECK_EQUAL(profile.dimensions[FINGERPRINT_DIMENSION_NAMES[0]], 1.0);
    BOOST_CHECK_CLOSE(profile.dimensions[FINGERPRINT_DIMENSION_NAMES[1]], 0.4, 1e-9);
    BOOST_CHECK(profile.dimensions.count("favourite_colour") == 0);
    BOOST_CHECK_EQUAL(profile.nRevision, 2U);
    BOOST_CHECK_EQUAL(profile.nUpdatedAt, NOW + 10);

    // Nothing applicable: revision untouched
    BOOST_CHECK_EQUAL(ApplyInsightsToSnapshot(profile, {unknown}, NOW + 20), 0U);
    BOOST_CHECK_EQUAL(profile.nRevision, 2U);
    BOOST_CHECK_EQUAL(profile.nUpdatedAt, NOW + 10);
}

BOOST_FIXTURE_TEST_CASE(memory_profile_store, MockTimeSetup) {
    CMemoryProfileStore store(MakeProfile("alice", 0.5, NOW - 100));
    BOOST_CHECK_EQUAL(store.GetRevision(), 1U);

    CLearningInsight insight;
    insight.dimension = FINGERPRINT_DIMENSION_NAMES[2];
    insight.delta = 0.05;
    BOOST_REQUIRE(store.ApplyInsights({insight}));

    CProfileSnapshot profile;
    BOOST_REQUIRE(store.GetCurrentProfile(profile));
    BOOST_CHECK_CLOSE(profile.dimensions[FINGERPRINT_DIMENSION_NAMES[2]], 0.55, 1e-9);
    BOOST_CHECK_EQUAL(profile.nUpdatedAt, NOW);
    BOOST_CHECK_EQUAL(store.GetRevision(), 2U);
    BOOST_CHECK_EQUAL(store.GetAppliedInsights().size(), 1U);
}

BOOST_AUTO_TEST_CASE(json_profile_document) {
    CProfileSnapshot profile = MakeProfile("alice", 0.25, NOW);
    profile.nRevision = 4;

    CProfileSnapshot parsed;
    std::string error;
    BOOST_REQUIRE(CJsonProfileStore::FromJson(CJsonProfileStore::ToJson(profile), parsed, error));
    BOOST_CHECK_EQUAL(parsed.userId, "alice");
    BOOST_CHECK_EQUAL(parsed.nUpdatedAt, NOW);
    BOOST_CHECK_EQUAL(parsed.nRevision, 4U);
    BOOST_CHECK(parsed.dimensions == profile.dimensions);

    BOOST_CHECK(!CJsonProfileStore::FromJson("[1,2]", parsed, error));
    BOOST_CHECK(!CJsonProfileStore::FromJson("{not json", parsed, error));
    BOOST_CHECK(!CJsonProfileStore::FromJson(R"({"updated_at": 1, "dimensions": {}})", parsed, error));
    BOOST_CHECK_EQUAL(error, "missing user_id");
    BOOST_CHECK(!CJsonProfileStore::FromJson(R"({"user_id": "a", "updated_at": 1, "dimensions": {"x": "high"}})",
                                             parsed, error));

    // Revision defaults to 1 when absent
    BOOST_REQUIRE(CJsonProfileStore::FromJson(R"({"user_id": "a", "updated_at": 5, "dimensions": {"x": 0.5}})",
                                              parsed, error));
    BOOST_CHECK_EQUAL(parsed.nRevision, 1U);
}

BOOST_FIXTURE_TEST_CASE(json_profile_store_file, TempDirSetup) {
    SetMockTime(NOW);
    std::string file = path + "/profile.json";

    CJsonProfileStore missing(file);
    BOOST_CHECK(!missing.Load());
    CProfileSnapshot profile;
    BOOST_CHECK(!missing.GetCurrentProfile(profile));
    BOOST_CHECK(!missing.ApplyInsights({}));

    {
        std::ofstream out(file);
        out << CJsonProfileStore::ToJson(MakeProfile("alice", 0.5, NOW - 60));
    }

    CJsonProfileStore store(file);
    BOOST_REQUIRE(store.Load());
    BOOST_REQUIRE(store.GetCurrentProfile(profile));
    BOOST_CHECK_EQUAL(profile.userId, "alice");
    BOOST_CHECK_EQUAL(store.GetRevision(), 1U);

    CLearningInsight insight;
    insight.dimension = FINGERPRINT_DIMENSION_NAMES[4];
    insight.delta = -0.05;
    BOOST_REQUIRE(store.ApplyInsights({insight}));
    BOOST_CHECK_EQUAL(store.GetRevision(), 2U);

    // The change reached the file
    CJsonProfileStore reloaded(file);
    BOOST_REQUIRE(reloaded.Load());
    BOOST_REQUIRE(reloaded.GetCurrentProfile(profile));
    BOOST_CHECK_CLOSE(profile.dimensions[FINGERPRINT_DIMENSION_NAMES[4]], 0.45, 1e-9);
    BOOST_CHECK_EQUAL(profile.nUpdatedAt, NOW);
    BOOST_CHECK_EQUAL(profile.nRevision, 2U);
    BOOST_CHECK(!std::filesystem::exists(file + ".tmp"));
    SetMockTime(0);
}

BOOST_AUTO_TEST_SUITE_END()
