// Copyright (c) 2025 The Proxima Core developers
// Distributed under the MIT software license

#ifndef PROXIMA_NET_PROTOCOL_H
#define PROXIMA_NET_PROTOCOL_H

#include <cstdint>
#include <cstring>
#include <string>

namespace NetProtocol {

/** Frame magic - "PXMA" */
static const uint32_t PROXIMA_MAGIC = 0x50584D41;

/** Exchange protocol version */
static const uint32_t PROTOCOL_VERSION = 1;
static const uint32_t MIN_PEER_PROTO_VERSION = 1;

/** Default LAN beacon (UDP) and channel (TCP) port */
static const uint16_t DEFAULT_LAN_PORT = 47800;

/** Message size limits */
static const unsigned int MAX_MESSAGE_SIZE = 64 * 1024;  // 64 KiB
static const unsigned int MAX_INSIGHTS_PER_MESSAGE = 16;
static const unsigned int HEADER_SIZE = 24;

/** Exchange commands */
extern const char* HELLO;       // initiator fingerprint
extern const char* HELLOACK;    // responder fingerprint
extern const char* DEPTH;       // desired depth + local score
extern const char* INSIGHTS;    // bounded insight batch
extern const char* BYE;         // termination with reason

/** Message header (24 bytes) */
struct CMessageHeader {
    uint32_t magic;           // Protocol identifier
    char command[12];         // Command string (null-padded)
    uint32_t payload_size;    // Payload size in bytes
    uint32_t checksum;        // First 4 bytes of SHA3(SHA3(payload))

    CMessageHeader() : magic(0), payload_size(0), checksum(0) {
        memset(command, 0, sizeof(command));
    }

    bool IsValid(uint32_t expected_magic) const {
        return magic == expected_magic &&
               payload_size <= MAX_MESSAGE_SIZE &&
               command[11] == 0;  // Ensure null-terminated
    }

    std::string GetCommand() const {
        return std::string(command, strnlen(command, 12));
    }

    void SetCommand(const std::string& cmd) {
        memset(command, 0, sizeof(command));
        strncpy(command, cmd.c_str(), sizeof(command) - 1);
    }
};

} // namespace NetProtocol

#endif // PROXIMA_NET_PROTOCOL_H
