// Copyright (c) 2025 The Proxima Core developers
// Distributed under the MIT software license

#ifndef PROXIMA_TRANSPORT_LAN_H
#define PROXIMA_TRANSPORT_LAN_H

#include <net/socket.h>
#include <transport/transport.h>

#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

/**
 * CSocketChannel - framed CNetMessage channel over a connected TCP socket
 */
class CSocketChannel : public CMessageChannel {
public:
    explicit CSocketChannel(std::unique_ptr<CSocket> socket);
    ~CSocketChannel() override;

    bool Send(const CNetMessage& msg) override;
    bool Receive(CNetMessage& msg, int timeout_ms) override;
    void Close() override;
    bool IsOpen() const override;
    std::string GetPeerAddress() const override { return m_peer; }

private:
    std::unique_ptr<CSocket> m_socket;
    std::string m_peer;
    mutable std::mutex m_sendMutex;
    std::atomic<bool> m_open{true};
};

/**
 * CLanTransport - local network medium.
 *
 * Advertisements are UDP broadcast beacons, re-sent every
 * BEACON_INTERVAL_MS while the advert's TTL lasts. Exchange channels are
 * TCP connections to the port carried in the beacon.
 *
 * Beacon layout:
 *   "PXB1" | node signature (8) | tcp port (u16 LE) | CompactSize + compact fingerprint
 */
class CLanTransport : public ITransportAdapter {
public:
    static constexpr int BEACON_INTERVAL_MS = 2000;
    static constexpr int LAN_RSSI = -50;
    static constexpr size_t MAX_BEACON_SIZE = 512;

    explicit CLanTransport(uint16_t port, const std::string& broadcast_address = "255.255.255.255");
    ~CLanTransport() override;

    std::string GetName() const override { return "lan"; }
    TransportStatus CheckAvailability() override;
    WireFormat GetPreferredFormat() const override { return WireFormat::COMPACT; }

    bool Advertise(const CNodeSignature& signature, const std::vector<uint8_t>& payload,
                   int64_t ttl_seconds, AdvertHandle& handle) override;
    void StopAdvertising(AdvertHandle handle) override;

    bool StartScan() override;
    void StopScan() override;
    bool NextSighting(CSighting& out, int timeout_ms) override;

    std::unique_ptr<CMessageChannel> OpenChannel(const std::string& address, int timeout_ms) override;
    void SetInboundHandler(InboundHandler handler) override;
    void Shutdown() override;

    /** Build/parse a beacon datagram */
    static std::vector<uint8_t> BuildBeacon(const CNodeSignature& signature, uint16_t tcp_port,
                                            const std::vector<uint8_t>& payload);
    static bool ParseBeacon(const std::vector<uint8_t>& data, CNodeSignature& signature,
                            uint16_t& tcp_port, std::vector<uint8_t>& payload);

private:
    void BeaconThread();
    void ListenThread();

    const uint16_t m_port;
    const std::string m_broadcastAddress;

    CSocket m_udp;
    CSocket m_listener;
    bool m_checked{false};
    TransportStatus m_status{TransportStatus::UNSUPPORTED};

    std::atomic<bool> m_running{false};
    std::atomic<bool> m_scanning{false};
    std::thread m_beaconThread;
    std::thread m_listenThread;

    std::mutex m_mutex;
    std::condition_variable m_cv;
    std::vector<uint8_t> m_beacon;
    int64_t m_beaconExpiresMillis{0};
    AdvertHandle m_nextHandle{1};
    AdvertHandle m_activeHandle{0};
    InboundHandler m_inboundHandler;
};

#endif // PROXIMA_TRANSPORT_LAN_H
