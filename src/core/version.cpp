// Copyright (c) 2025 The Proxima Core developers
// Distributed under the MIT software license

#include <core/version.h>

#include <net/protocol.h>

#ifndef PROXIMA_VERSION
#define PROXIMA_VERSION "dev"
#endif

std::string GetVersionString() {
    return PROXIMA_VERSION;
}

std::string GetFullVersionString() {
    std::string release = GetVersionString();
    if (release == "dev") {
        release += " build " __DATE__;
    }
    return "proximad " + release + " (protocol " + std::to_string(NetProtocol::PROTOCOL_VERSION) + ")";
}
