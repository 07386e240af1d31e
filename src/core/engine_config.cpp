// Copyright (c) 2025 The Proxima Core developers
// Distributed under the MIT software license

#include <core/engine_config.h>

#include <util/config.h>
#include <util/logging.h>

#include <filesystem>

bool CEngineConfig::Load(const CConfigParser& config, std::vector<ConfigValidationResult>& errors) {
    errors.clear();
    for (const auto& result : CConfigValidator::ValidateAll(config)) {
        if (!result.valid) {
            errors.push_back(result);
        }
    }
    if (!errors.empty()) {
        return false;
    }

    datadir = config.GetString("datadir", datadir.empty() ? GetDefaultDataDir() : datadir);
    profile_path = config.GetString("profile", profile_path);

    max_connections = static_cast<size_t>(config.GetInt64("maxconnections", static_cast<int64_t>(max_connections)));
    cooldown = config.GetInt64("cooldown", cooldown);
    silence_window = config.GetInt64("silencewindow", silence_window);
    fingerprint_ttl = config.GetInt64("fingerprintttl", fingerprint_ttl);
    advertise_refresh = config.GetInt64("advertiserefresh", advertise_refresh);
    scan_tick_ms = static_cast<int>(config.GetInt64("scantick", scan_tick_ms));
    step_timeout_ms = static_cast<int>(config.GetInt64("steptimeout", step_timeout_ms));
    max_duration = config.GetInt64("maxduration", max_duration);
    max_exchange_messages = static_cast<size_t>(
        config.GetInt64("maxexchangemessages", static_cast<int64_t>(max_exchange_messages)));
    connect_interval = config.GetInt64("connectinterval", connect_interval);
    compat_floor = config.GetDouble("compatfloor", compat_floor);
    band_min = config.GetDouble("learningbandmin", band_min);
    band_max = config.GetDouble("learningbandmax", band_max);
    noise_rotation = config.GetInt64("noiserotation", noise_rotation);
    lan_port = static_cast<uint16_t>(config.GetInt64("lanport", lan_port));
    insight_burst = config.GetDouble("insightburst", insight_burst);
    insight_refill = config.GetDouble("insightrefill", insight_refill);

    std::string level = config.GetString("privacylevel", "");
    if (!level.empty()) {
        ParsePrivacyLevel(level, privacy_level);  // already validated
    }

    std::vector<std::string> names = config.GetList("transports");
    if (!names.empty()) {
        transports = names;
    }

    if (advertise_refresh >= fingerprint_ttl) {
        LogPrintf(ENGINE, WARN, "advertiserefresh (%llu) is not below fingerprintttl (%llu); "
                  "fingerprints will be reissued every refresh check",
                  static_cast<unsigned long long>(advertise_refresh),
                  static_cast<unsigned long long>(fingerprint_ttl));
    }
    return true;
}

std::string CEngineConfig::GetProfilePath() const {
    if (!profile_path.empty()) {
        return profile_path;
    }
    return (std::filesystem::path(datadir) / "profile.json").string();
}

TransportOptions CEngineConfig::GetTransportOptions() const {
    TransportOptions options;
    options.names = transports;
    options.lan_port = lan_port;
    options.loopback_address = loopback_address;
    options.loopback_rssi = loopback_rssi;
    return options;
}

DiscoveryOptions CEngineConfig::GetDiscoveryOptions() const {
    DiscoveryOptions options;
    options.silence_window = silence_window;
    options.scan_tick_ms = scan_tick_ms;
    return options;
}

LifecycleOptions CEngineConfig::GetLifecycleOptions() const {
    LifecycleOptions options;
    options.max_connections = max_connections;
    options.cooldown = cooldown;
    options.session.step_timeout_ms = step_timeout_ms;
    options.session.max_duration_ms = max_duration * 1000;
    options.session.max_messages = max_exchange_messages;
    options.session.compat_floor = compat_floor;
    options.session.compat.band_min = band_min;
    options.session.compat.band_max = band_max;
    options.insight_burst = insight_burst;
    options.insight_refill_per_hour = insight_refill;
    return options;
}

AnonymizerOptions CEngineConfig::GetAnonymizerOptions() const {
    AnonymizerOptions options;
    options.level = privacy_level;
    options.fingerprint_ttl = fingerprint_ttl;
    options.signature_rotation = noise_rotation;
    return options;
}
