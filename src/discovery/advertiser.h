// Copyright (c) 2025 The Proxima Core developers
// Distributed under the MIT software license

#ifndef PROXIMA_DISCOVERY_ADVERTISER_H
#define PROXIMA_DISCOVERY_ADVERTISER_H

#include <primitives/fingerprint.h>
#include <primitives/nodesig.h>
#include <privacy/anonymizer.h>
#include <storage/store.h>
#include <transport/transport.h>
#include <util/threadinterrupt.h>

#include <atomic>
#include <map>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

/** What this node currently advertises */
struct CLocalAdvert {
    CNodeSignature signature;
    CVibeFingerprint fingerprint;
    uint64_t nProfileRevision{0};
};

/**
 * CAdvertiser - keeps a fresh fingerprint on every available adapter
 *
 * A new fingerprint is derived when the refresh interval has elapsed, when
 * the profile revision changes, or when the current one is within one
 * refresh interval of expiry.
 */
class CAdvertiser {
public:
    CAdvertiser(std::shared_ptr<IProfileStore> profile_store,
                std::shared_ptr<CPrivacyAnonymizer> anonymizer,
                int64_t refresh_interval);
    ~CAdvertiser();

    CAdvertiser(const CAdvertiser&) = delete;
    CAdvertiser& operator=(const CAdvertiser&) = delete;

    void AddAdapter(std::shared_ptr<ITransportAdapter> adapter);

    /** Advertise immediately and start the refresh loop */
    bool Start();
    void Stop();

    /** True if a refresh is due at time now */
    bool NeedsRefresh(int64_t now) const;

    /** Refresh only when due. Returns true if a new fingerprint was issued. */
    bool RefreshIfNeeded(int64_t now);

    /**
     * Derive and advertise a new fingerprint.
     * @return false if the profile is unavailable or invalid
     */
    bool Refresh(int64_t now);

    /** Current local advert; false until the first successful refresh */
    bool GetLocal(CLocalAdvert& out) const;

    /** Null until the first successful refresh */
    CNodeSignature GetLocalSignature() const;

private:
    void RefreshThread();

    std::shared_ptr<IProfileStore> m_profileStore;
    std::shared_ptr<CPrivacyAnonymizer> m_anonymizer;
    const int64_t m_refreshInterval;

    mutable std::mutex m_mutex;
    std::vector<std::shared_ptr<ITransportAdapter>> m_adapters;
    std::map<ITransportAdapter*, AdvertHandle> m_handles;
    CLocalAdvert m_local;
    bool m_hasLocal{false};
    int64_t m_lastRefresh{0};

    std::atomic<bool> m_running{false};
    CThreadInterrupt m_interrupt;
    std::thread m_thread;
};

#endif // PROXIMA_DISCOVERY_ADVERTISER_H
