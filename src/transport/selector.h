// Copyright (c) 2025 The Proxima Core developers
// Distributed under the MIT software license

#ifndef PROXIMA_TRANSPORT_SELECTOR_H
#define PROXIMA_TRANSPORT_SELECTOR_H

#include <transport/loopback.h>
#include <transport/transport.h>

#include <memory>
#include <string>
#include <vector>

struct TransportOptions {
    std::vector<std::string> names;             // "lan", "loopback", "ble", "mdns"
    uint16_t lan_port{0};
    std::shared_ptr<CLoopbackMedium> medium;    // created on demand when null
    std::string loopback_address{"local"};
    int loopback_rssi{-50};
};

/** One adapter and the status its single startup availability check returned */
struct TransportSlot {
    std::shared_ptr<ITransportAdapter> adapter;
    TransportStatus status{TransportStatus::UNSUPPORTED};
};

/**
 * Instantiate each named transport and check its availability once.
 *
 * Media this build cannot drive get a CNullTransport so they still show up
 * as an UNSUPPORTED capability instead of failing startup. Duplicate names
 * are ignored.
 */
std::vector<TransportSlot> SelectTransports(const TransportOptions& options);

/** Adapters from a selection whose availability check succeeded */
std::vector<std::shared_ptr<ITransportAdapter>> AvailableTransports(const std::vector<TransportSlot>& slots);

#endif // PROXIMA_TRANSPORT_SELECTOR_H
