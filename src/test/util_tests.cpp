// Copyright (c) 2025 The Proxima Core developers
// Distributed under the MIT software license

/**
 * Utility Tests
 *
 * Hex/base64 encoding, mock time, cancellation tokens, SHA3 and logging
 */

#include <boost/test/unit_test.hpp>

#include <core/version.h>
#include <crypto/random.h>
#include <crypto/sha3.h>
#include <test/test_proxima.h>
#include <util/logging.h>
#include <util/strencodings.h>
#include <util/threadinterrupt.h>
#include <util/time.h>

#include <chrono>
#include <filesystem>
#include <string>
#include <thread>
#include <vector>

BOOST_AUTO_TEST_SUITE(util_tests)

BOOST_AUTO_TEST_CASE(hex_roundtrip) {
    std::vector<uint8_t> data = {0x00, 0x01, 0xab, 0xff};
    BOOST_CHECK_EQUAL(HexStr(data), "0001abff");
    BOOST_CHECK(ParseHex("0001abff") == data);
    BOOST_CHECK(ParseHex("0001ABFF") == data);
    BOOST_CHECK(IsHex("0001abff"));
    BOOST_CHECK(!IsHex("0001abf"));
    BOOST_CHECK(!IsHex("zz"));
}

BOOST_AUTO_TEST_CASE(base64_known_vectors) {
    std::string text = "foobar";
    std::vector<uint8_t> raw(text.begin(), text.end());
    BOOST_CHECK_EQUAL(EncodeBase64(raw), "Zm9vYmFy");

    std::vector<uint8_t> decoded;
    BOOST_CHECK(DecodeBase64("Zm9vYg==", decoded));
    BOOST_CHECK_EQUAL(std::string(decoded.begin(), decoded.end()), "foob");
    BOOST_CHECK(DecodeBase64("Zm9vYmE=", decoded));
    BOOST_CHECK_EQUAL(std::string(decoded.begin(), decoded.end()), "fooba");
}

BOOST_AUTO_TEST_CASE(base64_rejects_garbage) {
    std::vector<uint8_t> decoded;
    BOOST_CHECK(!DecodeBase64("Zm9", decoded));        // bad length
    BOOST_CHECK(!DecodeBase64("Zm9v!mFy", decoded));   // bad alphabet
    BOOST_CHECK(!DecodeBase64("Z=9vYmFy", decoded));   // padding in the middle
}

BOOST_AUTO_TEST_CASE(strprintf_formats) {
    BOOST_CHECK_EQUAL(strprintf("%s=%d", "x", 42), "x=42");
    BOOST_CHECK_EQUAL(strprintf("%.2f", 0.126), "0.13");
    std::string wide(3000, 'w');
    BOOST_CHECK_EQUAL(strprintf("[%s]", wide.c_str()).size(), 3002U);
}

BOOST_AUTO_TEST_CASE(mock_time) {
    SetMockTime(1234567);
    BOOST_CHECK_EQUAL(GetTime(), 1234567);
    SetMockTime(0);
    BOOST_CHECK(GetTime() > 1600000000);
}

BOOST_AUTO_TEST_CASE(thread_interrupt_wakes_sleeper) {
    CThreadInterrupt interrupt;
    BOOST_CHECK(!interrupt);
    BOOST_CHECK(interrupt.SleepFor(std::chrono::milliseconds(1)));

    auto start = std::chrono::steady_clock::now();
    std::thread sleeper([&interrupt] {
        interrupt.SleepFor(std::chrono::seconds(30));
    });
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    interrupt.Interrupt();
    sleeper.join();
    BOOST_CHECK(std::chrono::steady_clock::now() - start < std::chrono::seconds(10));

    BOOST_CHECK(static_cast<bool>(interrupt));
    BOOST_CHECK(!interrupt.SleepFor(std::chrono::milliseconds(1)));
    interrupt.Reset();
    BOOST_CHECK(!interrupt);
}

BOOST_AUTO_TEST_CASE(sha3_256_vectors) {
    uint8_t hash[32];
    SHA3_256(nullptr, 0, hash);
    BOOST_CHECK_EQUAL(HexStr(hash, 32), "a7ffc6f8bf1ed76651c14756a061d662f580ff4de43b49fa82d80a4b80f8434a");

    const std::string abc = "abc";
    SHA3_256(reinterpret_cast<const uint8_t*>(abc.data()), abc.size(), hash);
    BOOST_CHECK_EQUAL(HexStr(hash, 32), "3a985da74fe225b2045c172d6bd390bd855f086e3e9d525b46bfe24511431532");

    // Incremental hashing matches one-shot
    uint8_t incremental[32];
    CSHA3_256 hasher;
    hasher.Write(reinterpret_cast<const uint8_t*>("a"), 1).Write(reinterpret_cast<const uint8_t*>("bc"), 2);
    hasher.Finalize(incremental);
    BOOST_CHECK_EQUAL(HexStr(incremental, 32), HexStr(hash, 32));
}

BOOST_AUTO_TEST_CASE(random_sources) {
    std::vector<uint8_t> a(32), b(32);
    BOOST_CHECK(GetStrongRandBytes(a.data(), a.size()));
    BOOST_CHECK(GetStrongRandBytes(b.data(), b.size()));
    BOOST_CHECK(a != b);

    CNoiseSource seeded_a(7), seeded_b(7);
    for (int i = 0; i < 16; i++) {
        double u = seeded_a.Uniform();
        BOOST_CHECK_EQUAL(u, seeded_b.Uniform());
        BOOST_CHECK(u > 0.0 && u < 1.0);
    }
}

namespace {

/** Routes log lines into a vector and restores the logger afterwards */
struct LogCapture {
    std::vector<std::string> lines;

    LogCapture() {
        CLogger::GetInstance().SetCaptureSink([this](const std::string& line) { lines.push_back(line); });
    }
    ~LogCapture() {
        CLogger& logger = CLogger::GetInstance();
        logger.SetCaptureSink(nullptr);
        logger.SetLevel(LogLevel::LVL_INFO);
        logger.SetCategories(static_cast<uint32_t>(LogCategory::ALL));
        logger.Close();
    }
};

} // namespace

BOOST_AUTO_TEST_CASE(log_line_layout) {
    BOOST_CHECK_EQUAL(CLogger::FormatLine(0, LogCategory::ENGINE, LogLevel::LVL_INFO, "up"),
                      "1970-01-01T00:00:00.000Z [INFO] [ENGINE] up");
    BOOST_CHECK_EQUAL(CLogger::FormatLine(1700000000123LL, LogCategory::NONE, LogLevel::LVL_WARN, "x"),
                      "2023-11-14T22:13:20.123Z [WARN] x");
}

BOOST_AUTO_TEST_CASE(log_category_names) {
    LogCategory category = LogCategory::NONE;
    BOOST_CHECK(ParseLogCategory("Connect", category));
    BOOST_CHECK(category == LogCategory::CONNECT);
    BOOST_CHECK(ParseLogCategory("all", category));
    BOOST_CHECK(category == LogCategory::ALL);
    BOOST_CHECK(!ParseLogCategory("mempool", category));
    BOOST_CHECK_EQUAL(LogCategoryName(LogCategory::PRIVACY), "PRIVACY");
    BOOST_CHECK_EQUAL(LogCategoryName(LogCategory::ALL), "");
}

BOOST_FIXTURE_TEST_CASE(log_filters_by_level_and_category, LogCapture) {
    CLogger& logger = CLogger::GetInstance();
    LogPrintf(STORAGE, DEBUG, "hidden at INFO");
    LogPrintf(STORAGE, INFO, "shown %d", 1);
    BOOST_REQUIRE_EQUAL(lines.size(), 1U);
    BOOST_CHECK(lines[0].find("[INFO] [STORAGE] shown 1") != std::string::npos);

    std::string unknown;
    BOOST_CHECK(!logger.SetDebugCategories({"connect", "nope"}, unknown));
    BOOST_CHECK_EQUAL(unknown, "nope");
    BOOST_CHECK(logger.GetLevel() == LogLevel::LVL_INFO);

    BOOST_CHECK(logger.SetDebugCategories({"connect"}, unknown));
    BOOST_CHECK(logger.GetLevel() == LogLevel::LVL_DEBUG);
    lines.clear();
    LogPrintf(CONNECT, DEBUG, "connect detail");
    LogPrintf(STORAGE, INFO, "storage muted");
    LogPrintf(STORAGE, ERROR, "errors always pass");
    BOOST_REQUIRE_EQUAL(lines.size(), 2U);
    BOOST_CHECK(lines[0].find("connect detail") != std::string::npos);
    BOOST_CHECK(lines[1].find("[ERROR] [STORAGE]") != std::string::npos);
}

BOOST_FIXTURE_TEST_CASE(log_file_rotates, TempDirSetup) {
    LogCapture capture;
    CLogger& logger = CLogger::GetInstance();
    BOOST_REQUIRE(logger.OpenFile(path, "debug.log", 256, 2));
    BOOST_CHECK_EQUAL(logger.GetFilePath(), (std::filesystem::path(path) / "debug.log").string());

    for (int i = 0; i < 40; i++) {
        LogPrintf(ENGINE, INFO, "rotation filler line %02d", i);
    }
    logger.Close();

    BOOST_CHECK(std::filesystem::exists(path + "/debug.log"));
    BOOST_CHECK(std::filesystem::exists(path + "/debug.log.1"));
    BOOST_CHECK(std::filesystem::exists(path + "/debug.log.2"));
    BOOST_CHECK(!std::filesystem::exists(path + "/debug.log.3"));
    BOOST_CHECK_LE(std::filesystem::file_size(path + "/debug.log"), 256U + 80U);
    BOOST_CHECK_EQUAL(capture.lines.size(), 40U);
}

BOOST_AUTO_TEST_CASE(version_names_protocol) {
    std::string full = GetFullVersionString();
    BOOST_CHECK_EQUAL(full.rfind("proximad ", 0), 0U);
    BOOST_CHECK(full.find("(protocol 1)") != std::string::npos);
}

BOOST_AUTO_TEST_SUITE_END()
