// Copyright (c) 2025 The Proxima Core developers
// Distributed under the MIT software license

#ifndef PROXIMA_TRANSPORT_LOOPBACK_H
#define PROXIMA_TRANSPORT_LOOPBACK_H

#include <transport/transport.h>

#include <condition_variable>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <utility>

/**
 * In-process channel pair. Each side reads what the other side sends.
 */
std::pair<std::unique_ptr<CMessageChannel>, std::unique_ptr<CMessageChannel>>
CreateChannelPair(const std::string& address_a, const std::string& address_b);

class CLoopbackTransport;

/**
 * CLoopbackMedium - shared in-process "air" that loopback transports
 * advertise into and scan from. Used for single-host simulation and tests.
 */
class CLoopbackMedium {
public:
    CLoopbackMedium() = default;

    CLoopbackMedium(const CLoopbackMedium&) = delete;
    CLoopbackMedium& operator=(const CLoopbackMedium&) = delete;

    /** Hand a sighting straight to the endpoint at address (raw bytes allowed) */
    bool InjectSighting(const std::string& address, const CSighting& sighting);

    size_t GetEndpointCount() const;

private:
    friend class CLoopbackTransport;

    struct Advert {
        CSighting sighting;
        int64_t nExpiresMillis;
    };

    bool Register(CLoopbackTransport* endpoint);
    void Unregister(CLoopbackTransport* endpoint);
    void Publish(CLoopbackTransport* from, const CSighting& sighting, int64_t ttl_seconds);
    void Withdraw(CLoopbackTransport* from);
    void ReplayAdverts(CLoopbackTransport* to);
    std::unique_ptr<CMessageChannel> Connect(CLoopbackTransport* from, const std::string& address);

    mutable std::mutex m_mutex;
    std::map<std::string, CLoopbackTransport*> m_endpoints;
    std::map<std::string, Advert> m_adverts;  // keyed by advertiser address
};

/**
 * CLoopbackTransport - adapter endpoint on a CLoopbackMedium.
 *
 * Carries the structured fingerprint format. Every sighting it produces
 * reports the advertiser's configured RSSI.
 */
class CLoopbackTransport : public ITransportAdapter {
public:
    CLoopbackTransport(std::shared_ptr<CLoopbackMedium> medium, const std::string& address,
                       int rssi = -50, WireFormat format = WireFormat::STRUCTURED);
    ~CLoopbackTransport() override;

    std::string GetName() const override { return "loopback"; }
    TransportStatus CheckAvailability() override;
    WireFormat GetPreferredFormat() const override { return m_format; }

    bool Advertise(const CNodeSignature& signature, const std::vector<uint8_t>& payload,
                   int64_t ttl_seconds, AdvertHandle& handle) override;
    void StopAdvertising(AdvertHandle handle) override;

    bool StartScan() override;
    void StopScan() override;
    bool NextSighting(CSighting& out, int timeout_ms) override;

    std::unique_ptr<CMessageChannel> OpenChannel(const std::string& address, int timeout_ms) override;
    void SetInboundHandler(InboundHandler handler) override;
    void Shutdown() override;

    const std::string& GetAddress() const { return m_address; }
    int GetRssi() const { return m_rssi; }

    /** Deny further availability checks (simulates a revoked permission) */
    void SetPermissionDenied(bool denied) { m_permissionDenied = denied; }

private:
    friend class CLoopbackMedium;

    void Deliver(const CSighting& sighting);
    bool AcceptInbound(std::unique_ptr<CMessageChannel> channel);

    std::shared_ptr<CLoopbackMedium> m_medium;
    const std::string m_address;
    const int m_rssi;
    const WireFormat m_format;
    bool m_permissionDenied{false};
    bool m_registered{false};

    std::mutex m_mutex;
    std::condition_variable m_cv;
    std::deque<CSighting> m_sightings;
    bool m_scanning{false};
    AdvertHandle m_nextHandle{1};
    AdvertHandle m_activeHandle{0};
    InboundHandler m_inboundHandler;
};

#endif // PROXIMA_TRANSPORT_LOOPBACK_H
