// Copyright (c) 2025 The Proxima Core developers
// Distributed under the MIT software license

#include <transport/transport.h>

const char* TransportStatusName(TransportStatus status) {
    switch (status) {
        case TransportStatus::AVAILABLE: return "available";
        case TransportStatus::UNSUPPORTED: return "unsupported";
        case TransportStatus::PERMISSION_DENIED: return "permission-denied";
    }
    return "unknown";
}
