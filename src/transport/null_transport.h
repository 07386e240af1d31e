// Copyright (c) 2025 The Proxima Core developers
// Distributed under the MIT software license

#ifndef PROXIMA_TRANSPORT_NULL_TRANSPORT_H
#define PROXIMA_TRANSPORT_NULL_TRANSPORT_H

#include <transport/transport.h>

#include <string>

/**
 * Placeholder for a medium this build cannot drive (ble, mdns).
 * Reports UNSUPPORTED so the engine keeps running on the others.
 */
class CNullTransport : public ITransportAdapter {
public:
    explicit CNullTransport(const std::string& name) : m_name(name) {}

    std::string GetName() const override { return m_name; }
    TransportStatus CheckAvailability() override { return TransportStatus::UNSUPPORTED; }
    WireFormat GetPreferredFormat() const override { return WireFormat::COMPACT; }

    bool Advertise(const CNodeSignature&, const std::vector<uint8_t>&, int64_t, AdvertHandle&) override {
        return false;
    }
    void StopAdvertising(AdvertHandle) override {}

    bool StartScan() override { return false; }
    void StopScan() override {}
    bool NextSighting(CSighting&, int) override { return false; }

    std::unique_ptr<CMessageChannel> OpenChannel(const std::string&, int) override { return nullptr; }
    void SetInboundHandler(InboundHandler) override {}

private:
    const std::string m_name;
};

#endif // PROXIMA_TRANSPORT_NULL_TRANSPORT_H
