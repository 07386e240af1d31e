// Copyright (c) 2025 The Proxima Core developers
// Distributed under the MIT software license

#include <discovery/advertiser.h>

#include <codec/fingerprint_codec.h>
#include <util/logging.h>
#include <util/time.h>

#include <algorithm>
#include <chrono>
#include <stdexcept>

namespace {
// Refresh loop wake-up; bounded so revision changes are picked up quickly
const int64_t REFRESH_POLL_MS = 1000;
}

CAdvertiser::CAdvertiser(std::shared_ptr<IProfileStore> profile_store,
                         std::shared_ptr<CPrivacyAnonymizer> anonymizer,
                         int64_t refresh_interval)
    : m_profileStore(std::move(profile_store)),
      m_anonymizer(std::move(anonymizer)),
      m_refreshInterval(refresh_interval)
{
    if (!m_profileStore || !m_anonymizer || m_refreshInterval <= 0) {
        throw std::invalid_argument("CAdvertiser: missing collaborator or bad refresh interval");
    }
}

CAdvertiser::~CAdvertiser() {
    Stop();
}

void CAdvertiser::AddAdapter(std::shared_ptr<ITransportAdapter> adapter) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_adapters.push_back(std::move(adapter));
}

bool CAdvertiser::Start() {
    if (m_running.exchange(true)) {
        return true;
    }
    m_interrupt.Reset();

    bool ok = Refresh(GetTime());
    m_thread = std::thread(&CAdvertiser::RefreshThread, this);
    return ok;
}

void CAdvertiser::Stop() {
    if (!m_running.exchange(false)) {
        return;
    }
    m_interrupt.Interrupt();
    if (m_thread.joinable()) {
        m_thread.join();
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    for (const auto& adapter : m_adapters) {
        auto it = m_handles.find(adapter.get());
        if (it != m_handles.end()) {
            adapter->StopAdvertising(it->second);
        }
    }
    m_handles.clear();
}

bool CAdvertiser::NeedsRefresh(int64_t now) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_hasLocal) {
        return true;
    }
    if (now - m_lastRefresh >= m_refreshInterval) {
        return true;
    }
    if (static_cast<int64_t>(m_local.fingerprint.nExpiresAt) - now <= m_refreshInterval) {
        return true;
    }
    return m_profileStore->GetRevision() != m_local.nProfileRevision;
}

bool CAdvertiser::RefreshIfNeeded(int64_t now) {
    if (!NeedsRefresh(now)) {
        return false;
    }
    return Refresh(now);
}

bool CAdvertiser::Refresh(int64_t now) {
    CProfileSnapshot profile;
    if (!m_profileStore->GetCurrentProfile(profile)) {
        LogPrintf(PRIVACY, WARN, "No profile available, not advertising");
        return false;
    }

    CLocalAdvert advert;
    try {
        advert.fingerprint = m_anonymizer->Derive(profile, now);
        advert.signature = m_anonymizer->DeriveNodeSignature(profile, now);
    } catch (const InvalidProfile& e) {
        LogPrintf(PRIVACY, WARN, "Cannot derive fingerprint: %s", e.what());
        return false;
    }
    advert.nProfileRevision = profile.nRevision;

    int64_t ttl = static_cast<int64_t>(advert.fingerprint.nExpiresAt) - now;

    std::lock_guard<std::mutex> lock(m_mutex);
    for (const auto& adapter : m_adapters) {
        std::vector<uint8_t> payload = EncodeFingerprint(advert.fingerprint, adapter->GetPreferredFormat());
        AdvertHandle handle = 0;
        if (!adapter->Advertise(advert.signature, payload, ttl, handle)) {
            LogPrintf(TRANSPORT, WARN, "Adapter %s refused advertisement", adapter->GetName().c_str());
            continue;
        }
        auto old = m_handles.find(adapter.get());
        if (old != m_handles.end() && old->second != handle) {
            adapter->StopAdvertising(old->second);
        }
        m_handles[adapter.get()] = handle;
    }

    m_local = advert;
    m_hasLocal = true;
    m_lastRefresh = now;

    LogPrintf(PRIVACY, DEBUG, "Issued fingerprint %s (node %s, expires %u)",
              advert.fingerprint.GetSignature().c_str(), advert.signature.GetHex().c_str(),
              advert.fingerprint.nExpiresAt);
    return true;
}

void CAdvertiser::RefreshThread() {
    while (m_interrupt.SleepFor(std::chrono::milliseconds(REFRESH_POLL_MS))) {
        try {
            RefreshIfNeeded(GetTime());
        } catch (const std::exception& e) {
            LogPrintf(PRIVACY, ERROR, "Advertisement refresh failed: %s", e.what());
        }
    }
}

bool CAdvertiser::GetLocal(CLocalAdvert& out) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_hasLocal) {
        return false;
    }
    out = m_local;
    return true;
}

CNodeSignature CAdvertiser::GetLocalSignature() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_hasLocal ? m_local.signature : CNodeSignature();
}
