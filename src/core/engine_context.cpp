// Copyright (c) 2025 The Proxima Core developers
// Distributed under the MIT software license

#include <core/engine_context.h>

#include <crypto/random.h>
#include <storage/leveldb_store.h>
#include <storage/memory_store.h>
#include <storage/profile_file.h>
#include <util/logging.h>
#include <util/time.h>

#include <algorithm>
#include <filesystem>

namespace {
const char* INSTALL_SECRET_SETTING = "install_secret";
}

std::vector<RankedCandidate> RankCandidates(const CVibeFingerprint& local,
                                            const std::vector<CNodeDescriptor>& candidates,
                                            double floor, const compatibility::CompatibilityParams& params) {
    std::vector<RankedCandidate> ranked;
    for (const CNodeDescriptor& descriptor : candidates) {
        compatibility::CompatibilityResult result = compatibility::score(local, descriptor.fingerprint, params);
        if (!compatibility::meets_floor(result.score, floor)) {
            continue;
        }
        RankedCandidate entry;
        entry.descriptor = descriptor;
        entry.score = result.score;
        entry.priority = result.score * PRIORITY_SCORE_WEIGHT + descriptor.Proximity() * PRIORITY_PROXIMITY_WEIGHT;
        ranked.push_back(entry);
    }
    std::stable_sort(ranked.begin(), ranked.end(), [](const RankedCandidate& a, const RankedCandidate& b) {
        return a.priority > b.priority;
    });
    return ranked;
}

EngineContext::~EngineContext() {
    Shutdown();
}

bool EngineContext::LoadInstallSecret(std::vector<uint8_t>& secret) {
    const std::string key = PersistKeys::Setting(INSTALL_SECRET_SETTING);
    if (persistence->Read(key, secret) && secret.size() == CPrivacyAnonymizer::SECRET_SIZE) {
        return true;
    }

    secret.assign(CPrivacyAnonymizer::SECRET_SIZE, 0);
    if (!GetStrongRandBytes(secret.data(), secret.size())) {
        LogPrintf(PRIVACY, ERROR, "Could not generate install secret");
        return false;
    }
    if (!persistence->Write(key, secret)) {
        LogPrintf(STORAGE, WARN, "Install secret not persisted; node signatures will change on restart");
    }
    LogPrintf(PRIVACY, INFO, "Generated new install secret");
    return true;
}

bool EngineContext::Init(const CEngineConfig& cfg, std::shared_ptr<CLoopbackMedium> medium,
                         std::shared_ptr<IProfileStore> store) {
    if (running) {
        LogPrintf(ENGINE, WARN, "EngineContext already initialized");
        return false;
    }
    config = cfg;

    // Persistence
    if (!config.datadir.empty()) {
        auto db = std::make_shared<CLevelDBPersistence>();
        std::string path = (std::filesystem::path(config.datadir) / "engine").string();
        if (db->Open(path)) {
            persistence = db;
        } else {
            LogPrintf(STORAGE, WARN, "Falling back to in-memory state; cooldowns will not survive a restart");
        }
    }
    if (!persistence) {
        persistence = std::make_shared<CMemoryPersistence>();
    }

    // Profile store
    if (store) {
        profile_store = store;
    } else {
        auto file_store = std::make_shared<CJsonProfileStore>(config.GetProfilePath());
        if (!file_store->Load()) {
            LogPrintf(STORAGE, WARN, "No usable profile at %s; advertising stays off until one exists",
                      config.GetProfilePath().c_str());
        }
        profile_store = file_store;
    }

    // Anonymizer
    std::vector<uint8_t> secret;
    if (!LoadInstallSecret(secret)) {
        return false;
    }
    try {
        anonymizer = std::make_shared<CPrivacyAnonymizer>(secret, config.GetAnonymizerOptions());
        advertiser = std::make_unique<CAdvertiser>(profile_store, anonymizer, config.advertise_refresh);
    } catch (const std::exception& e) {
        LogPrintf(ENGINE, ERROR, "Failed to initialize anonymizer: %s", e.what());
        return false;
    }

    // Transport availability is checked exactly once, here
    TransportOptions transport_options = config.GetTransportOptions();
    transport_options.medium = medium;
    transports = SelectTransports(transport_options);

    CAdvertiser* adv = advertiser.get();
    discovery = std::make_unique<CDiscoveryManager>(config.GetDiscoveryOptions(),
                                                    [adv]() { return adv->GetLocalSignature(); });
    lifecycle = std::make_unique<CConnectionLifecycle>(config.GetLifecycleOptions(), profile_store, persistence,
                                                       [adv](CLocalAdvert& out) { return adv->GetLocal(out); });
    if (!lifecycle->Start()) {
        LogPrintf(STORAGE, WARN, "Could not restore cooldowns and history");
    }

    InboundHandler inbound = lifecycle->GetInboundHandler();
    size_t available = 0;
    for (const TransportSlot& slot : transports) {
        discovery->AddAdapter(slot.adapter, slot.status);
        if (slot.status != TransportStatus::AVAILABLE) {
            continue;
        }
        slot.adapter->SetInboundHandler(inbound);
        advertiser->AddAdapter(slot.adapter);
        m_adapters[slot.adapter->GetName()] = slot.adapter;
        available++;
    }
    if (available == 0) {
        LogPrintf(ENGINE, WARN, "No transport available; no connections will form");
    }

    if (!advertiser->Start()) {
        LogPrintf(ENGINE, WARN, "Initial advertisement failed; will retry on the refresh schedule");
    }

    running = true;
    m_interrupt.Reset();
    m_connectThread = std::thread(&EngineContext::ConnectThread, this);

    LogPrintf(ENGINE, INFO, "Engine initialized (%zu of %zu transports available)", available, transports.size());
    return true;
}

bool EngineContext::EnableDiscovery() {
    if (!discovery) {
        return false;
    }
    m_discoveryEnabled = true;
    bool started = discovery->Start();
    LogPrintf(DISCOVERY, INFO, "Discovery enabled");
    return started;
}

void EngineContext::DisableDiscovery() {
    if (!discovery) {
        return;
    }
    // Connections already under way run to their natural end
    m_discoveryEnabled = false;
    discovery->Stop();
    LogPrintf(DISCOVERY, INFO, "Discovery disabled");
}

std::vector<CNodeDescriptor> EngineContext::GetCandidates() const {
    if (!discovery) {
        return {};
    }
    return discovery->Candidates();
}

std::vector<CConnectionSummary> EngineContext::GetConnectionSummaries() const {
    if (!lifecycle) {
        return {};
    }
    return lifecycle->GetSnapshots();
}

std::vector<CConnectionSummary> EngineContext::GetHistory() const {
    if (!lifecycle) {
        return {};
    }
    return lifecycle->GetHistory();
}

std::vector<AdapterCapability> EngineContext::GetCapabilities() const {
    if (!discovery) {
        return {};
    }
    return discovery->GetCapabilities();
}

size_t EngineContext::RunConnectPass(int64_t now) {
    CLocalAdvert local;
    if (!lifecycle || !advertiser->GetLocal(local)) {
        return 0;
    }

    const LifecycleOptions& options = lifecycle->GetOptions();
    std::vector<RankedCandidate> ranked = RankCandidates(local.fingerprint, discovery->Candidates(now),
                                                         options.session.compat_floor, options.session.compat);

    size_t started = 0;
    for (const RankedCandidate& candidate : ranked) {
        if (lifecycle->GetActiveCount() >= options.max_connections) {
            break;
        }
        if (lifecycle->IsInCooldown(candidate.descriptor.signature, now) ||
            lifecycle->HasConnectionTo(candidate.descriptor.signature)) {
            continue;
        }
        auto it = m_adapters.find(candidate.descriptor.transport);
        if (it == m_adapters.end()) {
            continue;
        }
        AttemptResult result = lifecycle->Connect(candidate.descriptor, it->second);
        if (result == AttemptResult::OK) {
            LogPrintf(ENGINE, DEBUG, "Connecting to %s (score %.3f, priority %.3f)",
                      candidate.descriptor.signature.GetHex().c_str(), candidate.score, candidate.priority);
            started++;
        } else if (result == AttemptResult::TOO_MANY_CONNECTIONS) {
            break;
        }
    }
    return started;
}

void EngineContext::ConnectThread() {
    const auto interval = std::chrono::seconds(config.connect_interval);
    while (m_interrupt.SleepFor(interval)) {
        if (!m_discoveryEnabled) {
            continue;
        }
        try {
            RunConnectPass(GetTime());
        } catch (const std::exception& e) {
            LogPrintf(ENGINE, ERROR, "Connect pass failed: %s", e.what());
        }
    }
}

void EngineContext::Shutdown() {
    if (!running.exchange(false)) {
        return;
    }
    LogPrintf(ENGINE, INFO, "Shutting down engine...");

    m_interrupt.Interrupt();
    if (m_connectThread.joinable()) {
        m_connectThread.join();
    }

    // Reverse order of Init
    if (advertiser) {
        advertiser->Stop();
    }
    if (discovery) {
        discovery->Stop();
    }
    m_discoveryEnabled = false;
    if (lifecycle) {
        lifecycle->Shutdown();
    }
    for (const TransportSlot& slot : transports) {
        slot.adapter->Shutdown();
    }
    m_adapters.clear();

    auto db = std::dynamic_pointer_cast<CLevelDBPersistence>(persistence);
    if (db) {
        db->Close();
    }

    LogPrintf(ENGINE, INFO, "Engine shutdown complete");
}
