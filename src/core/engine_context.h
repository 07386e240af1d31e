// Copyright (c) 2025 The Proxima Core developers
// Distributed under the MIT software license

#ifndef PROXIMA_CORE_ENGINE_CONTEXT_H
#define PROXIMA_CORE_ENGINE_CONTEXT_H

#include <compatibility/analyzer.h>
#include <connection/lifecycle.h>
#include <core/engine_config.h>
#include <discovery/advertiser.h>
#include <discovery/discovery.h>
#include <privacy/anonymizer.h>
#include <storage/store.h>
#include <transport/selector.h>
#include <util/threadinterrupt.h>

#include <atomic>
#include <map>
#include <memory>
#include <string>
#include <thread>
#include <vector>

/** Weight of the local compatibility score in connect-loop priority */
static constexpr double PRIORITY_SCORE_WEIGHT = 0.6;
/** Weight of proximity in connect-loop priority */
static constexpr double PRIORITY_PROXIMITY_WEIGHT = 0.4;

struct RankedCandidate {
    CNodeDescriptor descriptor;
    double score{0.0};
    double priority{0.0};
};

/**
 * Score every candidate against the local fingerprint and order them by
 * connect priority, highest first. Candidates below the compatibility floor
 * are left out.
 */
std::vector<RankedCandidate> RankCandidates(const CVibeFingerprint& local,
                                            const std::vector<CNodeDescriptor>& candidates,
                                            double floor, const compatibility::CompatibilityParams& params);

/**
 * EngineContext - explicit owner of every engine component
 *
 * Init() builds the components in dependency order; Shutdown() tears them
 * down in reverse. There is no global instance: the daemon and the tests
 * each create their own.
 */
struct EngineContext {
    CEngineConfig config;

    std::shared_ptr<IPersistence> persistence;
    std::shared_ptr<IProfileStore> profile_store;
    std::shared_ptr<CPrivacyAnonymizer> anonymizer;
    std::vector<TransportSlot> transports;
    std::unique_ptr<CAdvertiser> advertiser;
    std::unique_ptr<CDiscoveryManager> discovery;
    std::unique_ptr<CConnectionLifecycle> lifecycle;

    std::atomic<bool> running{false};

    EngineContext() = default;
    ~EngineContext();

    EngineContext(const EngineContext&) = delete;
    EngineContext& operator=(const EngineContext&) = delete;

    /**
     * Build and start every component.
     *
     * @param medium  shared in-process medium for the loopback transport (may be null)
     * @param store   profile store to use instead of the JSON file (may be null)
     * @return false if a required component could not be created
     */
    bool Init(const CEngineConfig& cfg, std::shared_ptr<CLoopbackMedium> medium = nullptr,
              std::shared_ptr<IProfileStore> store = nullptr);

    /** Stop loops, force-complete connections, flush state. Safe to call twice. */
    void Shutdown();

    /** Presentation intents: scans and the connect loop follow this switch */
    bool EnableDiscovery();
    void DisableDiscovery();
    bool IsDiscoveryEnabled() const { return m_discoveryEnabled.load(); }

    std::vector<CNodeDescriptor> GetCandidates() const;
    std::vector<CConnectionSummary> GetConnectionSummaries() const;
    std::vector<CConnectionSummary> GetHistory() const;
    std::vector<AdapterCapability> GetCapabilities() const;

    /**
     * One connect-loop pass: rank the live candidates and start connections
     * until the cap is reached.
     * @return number of connections started
     */
    size_t RunConnectPass(int64_t now);

private:
    bool LoadInstallSecret(std::vector<uint8_t>& secret);
    void ConnectThread();

    std::map<std::string, std::shared_ptr<ITransportAdapter>> m_adapters;
    std::atomic<bool> m_discoveryEnabled{false};
    CThreadInterrupt m_interrupt;
    std::thread m_connectThread;
};

#endif // PROXIMA_CORE_ENGINE_CONTEXT_H
