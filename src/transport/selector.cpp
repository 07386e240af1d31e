// Copyright (c) 2025 The Proxima Core developers
// Distributed under the MIT software license

#include <transport/selector.h>

#include <net/protocol.h>
#include <transport/lan.h>
#include <transport/null_transport.h>
#include <util/logging.h>

#include <algorithm>
#include <cctype>
#include <set>

std::vector<TransportSlot> SelectTransports(const TransportOptions& options) {
    std::vector<TransportSlot> slots;
    std::set<std::string> seen;
    std::shared_ptr<CLoopbackMedium> medium = options.medium;

    for (std::string name : options.names) {
        std::transform(name.begin(), name.end(), name.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (!seen.insert(name).second) {
            continue;
        }

        TransportSlot slot;
        if (name == "lan") {
            uint16_t port = options.lan_port ? options.lan_port : NetProtocol::DEFAULT_LAN_PORT;
            slot.adapter = std::make_shared<CLanTransport>(port);
        } else if (name == "loopback") {
            if (!medium) {
                medium = std::make_shared<CLoopbackMedium>();
            }
            slot.adapter = std::make_shared<CLoopbackTransport>(medium, options.loopback_address,
                                                                options.loopback_rssi);
        } else {
            if (name != "ble" && name != "mdns") {
                LogPrintf(TRANSPORT, WARN, "Unknown transport '%s'", name.c_str());
            }
            slot.adapter = std::make_shared<CNullTransport>(name);
        }

        slot.status = slot.adapter->CheckAvailability();
        LogPrintf(TRANSPORT, INFO, "Transport %s: %s", name.c_str(), TransportStatusName(slot.status));
        slots.push_back(slot);
    }
    return slots;
}

std::vector<std::shared_ptr<ITransportAdapter>> AvailableTransports(const std::vector<TransportSlot>& slots) {
    std::vector<std::shared_ptr<ITransportAdapter>> result;
    for (const TransportSlot& slot : slots) {
        if (slot.status == TransportStatus::AVAILABLE) {
            result.push_back(slot.adapter);
        }
    }
    return result;
}
