// Copyright (c) 2025 The Proxima Core developers
// Distributed under the MIT software license

#include <discovery/discovery.h>

#include <util/logging.h>
#include <util/time.h>

#include <algorithm>
#include <chrono>

double CNodeDescriptor::Proximity() const {
    double p = (static_cast<double>(nRssi) + 100.0) / 70.0;
    return std::min(1.0, std::max(0.0, p));
}

CDiscoveryManager::CDiscoveryManager(const DiscoveryOptions& options, LocalSignatureFn local_signature)
    : m_options(options), m_localSignature(std::move(local_signature))
{
}

CDiscoveryManager::~CDiscoveryManager() {
    Stop();
}

void CDiscoveryManager::AddAdapter(std::shared_ptr<ITransportAdapter> adapter, TransportStatus status) {
    std::lock_guard<std::mutex> lock(m_mutex);
    AdapterSlot slot;
    slot.capability.name = adapter->GetName();
    slot.capability.status = status;
    slot.adapter = std::move(adapter);
    m_adapters.push_back(slot);
}

bool CDiscoveryManager::Start() {
    if (m_running.exchange(true)) {
        return true;  // Already running
    }

    m_interrupt.Reset();

    std::lock_guard<std::mutex> lock(m_mutex);
    size_t started = 0;
    for (size_t i = 0; i < m_adapters.size(); i++) {
        AdapterSlot& slot = m_adapters[i];
        if (slot.capability.status != TransportStatus::AVAILABLE) {
            continue;
        }
        if (!slot.adapter->StartScan()) {
            LogPrintf(DISCOVERY, WARN, "Adapter %s failed to start scanning", slot.capability.name.c_str());
            continue;
        }
        slot.capability.scanning = true;
        m_threads.emplace_back(&CDiscoveryManager::ScanThread, this, i);
        started++;
    }

    LogPrintf(DISCOVERY, INFO, "Discovery started on %zu of %zu adapters", started, m_adapters.size());
    return started > 0;
}

void CDiscoveryManager::Stop() {
    if (!m_running.exchange(false)) {
        return;
    }

    m_interrupt.Interrupt();

    std::vector<std::shared_ptr<ITransportAdapter>> adapters;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        for (AdapterSlot& slot : m_adapters) {
            if (slot.capability.scanning) {
                adapters.push_back(slot.adapter);
                slot.capability.scanning = false;
            }
        }
    }
    // Wakes threads blocked in NextSighting
    for (const auto& adapter : adapters) {
        adapter->StopScan();
    }

    for (std::thread& t : m_threads) {
        if (t.joinable()) {
            t.join();
        }
    }
    m_threads.clear();

    LogPrintf(DISCOVERY, INFO, "Discovery stopped");
}

void CDiscoveryManager::ScanThread(size_t slot_index) {
    std::shared_ptr<ITransportAdapter> adapter;
    std::string name;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        adapter = m_adapters[slot_index].adapter;
        name = m_adapters[slot_index].capability.name;
    }
    const WireFormat format = adapter->GetPreferredFormat();

    while (!m_interrupt) {
        try {
            CSighting sighting;
            if (adapter->NextSighting(sighting, m_options.scan_tick_ms)) {
                HandleSighting(name, format, sighting, GetTime());
            } else {
                // Empty tick; age out silent nodes and try again next tick
                Prune(GetTime());
                if (!m_interrupt) {
                    m_interrupt.SleepFor(std::chrono::milliseconds(50));
                }
            }
        } catch (const std::exception& e) {
            LogPrintf(DISCOVERY, ERROR, "Scan tick on %s failed: %s", name.c_str(), e.what());
            m_interrupt.SleepFor(std::chrono::milliseconds(m_options.scan_tick_ms));
        }
    }
}

void CDiscoveryManager::CountSighting(const std::string& adapter_name, bool accepted) {
    // Caller holds m_mutex
    for (AdapterSlot& slot : m_adapters) {
        if (slot.capability.name == adapter_name) {
            if (accepted) {
                slot.capability.nAccepted++;
            } else {
                slot.capability.nDropped++;
            }
            return;
        }
    }
}

DecodeResult CDiscoveryManager::HandleSighting(const std::string& adapter_name, WireFormat format,
                                               const CSighting& sighting, int64_t now) {
    CVibeFingerprint fingerprint;
    DecodeResult result = DecodeFingerprint(sighting.payload, format, now, fingerprint);
    if (result == DecodeResult::OK && sighting.nodeSignature.IsNull()) {
        result = DecodeResult::MALFORMED_PAYLOAD;
    }

    std::lock_guard<std::mutex> lock(m_mutex);

    if (result != DecodeResult::OK) {
        LogPrintf(DISCOVERY, DEBUG, "Dropped sighting on %s from %s: %s", adapter_name.c_str(),
                  sighting.address.c_str(), DecodeResultString(result));
        CountSighting(adapter_name, false);
        // An expired re-advertisement means the node's current fingerprint is gone
        if (result == DecodeResult::EXPIRED) {
            m_nodes.erase(sighting.nodeSignature);
        }
        return result;
    }

    if (m_localSignature && sighting.nodeSignature == m_localSignature()) {
        return result;  // Our own advertisement
    }

    CountSighting(adapter_name, true);

    auto it = m_nodes.find(sighting.nodeSignature);
    if (it == m_nodes.end()) {
        CNodeDescriptor node;
        node.signature = sighting.nodeSignature;
        node.nFirstSeen = now;
        it = m_nodes.emplace(sighting.nodeSignature, node).first;
        LogPrintf(DISCOVERY, INFO, "New node %s via %s (rssi %d)", sighting.nodeSignature.GetHex().c_str(),
                  adapter_name.c_str(), sighting.nRssi);
    }

    CNodeDescriptor& node = it->second;
    node.transport = adapter_name;
    node.address = sighting.address;
    node.fingerprint = fingerprint;
    node.nRssi = sighting.nRssi;
    node.nLastSeen = now;
    return result;
}

size_t CDiscoveryManager::Prune(int64_t now) {
    std::lock_guard<std::mutex> lock(m_mutex);
    size_t removed = 0;
    for (auto it = m_nodes.begin(); it != m_nodes.end();) {
        const CNodeDescriptor& node = it->second;
        if (node.nLastSeen + m_options.silence_window <= now || node.fingerprint.IsExpired(now)) {
            LogPrintf(DISCOVERY, DEBUG, "Evicting node %s", node.signature.GetHex().c_str());
            it = m_nodes.erase(it);
            removed++;
        } else {
            ++it;
        }
    }
    return removed;
}

std::vector<CNodeDescriptor> CDiscoveryManager::Candidates(int64_t now) {
    Prune(now);

    std::vector<CNodeDescriptor> result;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        result.reserve(m_nodes.size());
        for (const auto& entry : m_nodes) {
            result.push_back(entry.second);
        }
    }

    std::sort(result.begin(), result.end(), [](const CNodeDescriptor& a, const CNodeDescriptor& b) {
        if (a.nRssi != b.nRssi) {
            return a.nRssi > b.nRssi;
        }
        if (a.nLastSeen != b.nLastSeen) {
            return a.nLastSeen > b.nLastSeen;
        }
        return a.signature < b.signature;
    });
    return result;
}

std::vector<CNodeDescriptor> CDiscoveryManager::Candidates() {
    return Candidates(GetTime());
}

bool CDiscoveryManager::GetCandidate(const CNodeSignature& signature, CNodeDescriptor& out) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_nodes.find(signature);
    if (it == m_nodes.end()) {
        return false;
    }
    out = it->second;
    return true;
}

std::vector<AdapterCapability> CDiscoveryManager::GetCapabilities() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<AdapterCapability> result;
    for (const AdapterSlot& slot : m_adapters) {
        result.push_back(slot.capability);
    }
    return result;
}

size_t CDiscoveryManager::Size() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_nodes.size();
}
