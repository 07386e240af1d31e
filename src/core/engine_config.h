// Copyright (c) 2025 The Proxima Core developers
// Distributed under the MIT software license

#ifndef PROXIMA_CORE_ENGINE_CONFIG_H
#define PROXIMA_CORE_ENGINE_CONFIG_H

#include <connection/lifecycle.h>
#include <discovery/discovery.h>
#include <net/protocol.h>
#include <privacy/anonymizer.h>
#include <transport/selector.h>
#include <util/config_validator.h>

#include <cstdint>
#include <string>
#include <vector>

class CConfigParser;

/**
 * CEngineConfig - every engine tunable, read once from CConfigParser
 *
 * Load() validates the raw values first; on any invalid field nothing is
 * applied and the failing results are returned to the caller for display.
 */
class CEngineConfig {
public:
    std::string datadir;
    std::string profile_path;           // empty: <datadir>/profile.json

    size_t max_connections{3};
    int64_t cooldown{300};
    int64_t silence_window{600};
    int64_t fingerprint_ttl{600};
    int64_t advertise_refresh{300};
    int scan_tick_ms{4000};
    int step_timeout_ms{5000};
    int64_t max_duration{60};
    size_t max_exchange_messages{8};
    int64_t connect_interval{10};
    double compat_floor{0.05};
    double band_min{0.3};
    double band_max{0.7};
    PrivacyLevel privacy_level{PrivacyLevel::STANDARD};
    int64_t noise_rotation{3600};
    std::vector<std::string> transports{"lan"};
    uint16_t lan_port{NetProtocol::DEFAULT_LAN_PORT};
    std::string loopback_address{"local"};  // in-process transport only, not a config key
    int loopback_rssi{-50};
    double insight_burst{6.0};
    double insight_refill{12.0};

    /**
     * Validate and apply every known key.
     * @param errors receives the failing validation results
     * @return false if any value was rejected
     */
    bool Load(const CConfigParser& config, std::vector<ConfigValidationResult>& errors);

    std::string GetProfilePath() const;

    TransportOptions GetTransportOptions() const;
    DiscoveryOptions GetDiscoveryOptions() const;
    LifecycleOptions GetLifecycleOptions() const;
    AnonymizerOptions GetAnonymizerOptions() const;
};

#endif // PROXIMA_CORE_ENGINE_CONFIG_H
