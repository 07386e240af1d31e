// Copyright (c) 2025 The Proxima Core developers
// Distributed under the MIT software license

#ifndef PROXIMA_DISCOVERY_DISCOVERY_H
#define PROXIMA_DISCOVERY_DISCOVERY_H

#include <codec/fingerprint_codec.h>
#include <primitives/fingerprint.h>
#include <primitives/nodesig.h>
#include <transport/transport.h>
#include <util/threadinterrupt.h>

#include <atomic>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

/**
 * CNodeDescriptor - a discovered remote candidate
 */
struct CNodeDescriptor {
    CNodeSignature signature;
    std::string transport;          // adapter name
    std::string address;            // adapter-specific, for OpenChannel
    CVibeFingerprint fingerprint;
    int nRssi{-100};
    int64_t nFirstSeen{0};
    int64_t nLastSeen{0};

    /** RSSI mapped from [-100, -30] dBm onto [0, 1] */
    double Proximity() const;
};

/** Per-adapter capability flag surfaced to the presentation layer */
struct AdapterCapability {
    std::string name;
    TransportStatus status{TransportStatus::UNSUPPORTED};
    bool scanning{false};
    uint64_t nAccepted{0};
    uint64_t nDropped{0};
};

struct DiscoveryOptions {
    int64_t silence_window{600};   // seconds without a sighting before eviction
    int scan_tick_ms{4000};        // NextSighting timeout
};

/**
 * CDiscoveryManager - aggregates sightings from all available adapters
 *
 * Runs one scan thread per available adapter. Entries are keyed by node
 * signature; a re-sighting refreshes the descriptor in place. An adapter
 * that fails never affects the others.
 */
class CDiscoveryManager {
public:
    using LocalSignatureFn = std::function<CNodeSignature()>;

    CDiscoveryManager(const DiscoveryOptions& options, LocalSignatureFn local_signature);
    ~CDiscoveryManager();

    CDiscoveryManager(const CDiscoveryManager&) = delete;
    CDiscoveryManager& operator=(const CDiscoveryManager&) = delete;

    /** Register an adapter with the status its startup availability check returned */
    void AddAdapter(std::shared_ptr<ITransportAdapter> adapter, TransportStatus status);

    /** Start scanning on every available adapter; restartable after Stop() */
    bool Start();

    /** Cancel all pending scans and join the scan threads */
    void Stop();

    bool IsRunning() const { return m_running.load(); }

    /**
     * Process one sighting reported by an adapter.
     * Malformed or expired payloads are dropped and counted.
     */
    DecodeResult HandleSighting(const std::string& adapter_name, WireFormat format,
                                const CSighting& sighting, int64_t now);

    /**
     * Live candidates ordered by proximity (RSSI) then recency.
     * Silent or expired entries are evicted first.
     */
    std::vector<CNodeDescriptor> Candidates(int64_t now);
    std::vector<CNodeDescriptor> Candidates();

    bool GetCandidate(const CNodeSignature& signature, CNodeDescriptor& out) const;

    /** Remove entries past the silence window or with expired fingerprints */
    size_t Prune(int64_t now);

    std::vector<AdapterCapability> GetCapabilities() const;

    size_t Size() const;

private:
    struct AdapterSlot {
        std::shared_ptr<ITransportAdapter> adapter;
        AdapterCapability capability;
    };

    void ScanThread(size_t slot_index);
    void CountSighting(const std::string& adapter_name, bool accepted);

    const DiscoveryOptions m_options;
    LocalSignatureFn m_localSignature;

    mutable std::mutex m_mutex;
    std::map<CNodeSignature, CNodeDescriptor> m_nodes;
    std::vector<AdapterSlot> m_adapters;

    std::atomic<bool> m_running{false};
    CThreadInterrupt m_interrupt;
    std::vector<std::thread> m_threads;
};

#endif // PROXIMA_DISCOVERY_DISCOVERY_H
