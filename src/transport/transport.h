// Copyright (c) 2025 The Proxima Core developers
// Distributed under the MIT software license

#ifndef PROXIMA_TRANSPORT_TRANSPORT_H
#define PROXIMA_TRANSPORT_TRANSPORT_H

#include <codec/fingerprint_codec.h>
#include <net/serialize.h>
#include <primitives/nodesig.h>

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

/** Result of probing a medium once at startup */
enum class TransportStatus {
    AVAILABLE,
    UNSUPPORTED,
    PERMISSION_DENIED,
};

const char* TransportStatusName(TransportStatus status);

/** One report of a nearby node, as produced by a scan */
struct CSighting {
    CNodeSignature nodeSignature;
    std::string address;              // transport-specific handle for OpenChannel
    std::vector<uint8_t> payload;     // encoded fingerprint, adapter's preferred format
    int nRssi{-100};                  // dBm; higher is closer
};

/**
 * CMessageChannel - bidirectional framed message pipe to one peer.
 *
 * Messages are delivered in order. Receive() returns false on timeout,
 * on a closed channel, or on a frame that fails validation.
 */
class CMessageChannel {
public:
    virtual ~CMessageChannel() {}

    virtual bool Send(const CNetMessage& msg) = 0;
    virtual bool Receive(CNetMessage& msg, int timeout_ms) = 0;
    virtual void Close() = 0;
    virtual bool IsOpen() const = 0;
    virtual std::string GetPeerAddress() const = 0;
};

using AdvertHandle = uint64_t;
using InboundHandler = std::function<void(std::unique_ptr<CMessageChannel>)>;

/**
 * ITransportAdapter - uniform scan/advertise contract over one physical medium.
 *
 * Scanning is a lazy, infinite sequence read through NextSighting(); it can
 * be stopped and restarted. All methods are safe to call from the discovery,
 * advertiser and connection threads concurrently.
 */
class ITransportAdapter {
public:
    virtual ~ITransportAdapter() {}

    virtual std::string GetName() const = 0;

    /** Check the medium once; UNSUPPORTED/PERMISSION_DENIED disable the adapter */
    virtual TransportStatus CheckAvailability() = 0;

    /** Fingerprint wire format this medium carries */
    virtual WireFormat GetPreferredFormat() const = 0;

    /**
     * Start (or replace) an advertisement valid for ttl_seconds.
     * @return false if the medium cannot advertise
     */
    virtual bool Advertise(const CNodeSignature& signature, const std::vector<uint8_t>& payload,
                           int64_t ttl_seconds, AdvertHandle& handle) = 0;
    virtual void StopAdvertising(AdvertHandle handle) = 0;

    virtual bool StartScan() = 0;
    virtual void StopScan() = 0;

    /**
     * Next element of the scan sequence.
     * @return false if nothing arrived within timeout_ms or scanning is stopped
     */
    virtual bool NextSighting(CSighting& out, int timeout_ms) = 0;

    /** Open an exchange channel to a sighted address; nullptr on failure */
    virtual std::unique_ptr<CMessageChannel> OpenChannel(const std::string& address, int timeout_ms) = 0;

    /** Channels opened by remote nodes are handed to this callback */
    virtual void SetInboundHandler(InboundHandler handler) = 0;

    /** Release sockets/threads; the adapter is unusable afterwards */
    virtual void Shutdown() {}
};

#endif // PROXIMA_TRANSPORT_TRANSPORT_H
