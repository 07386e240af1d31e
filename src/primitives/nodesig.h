// Copyright (c) 2025 The Proxima Core developers
// Distributed under the MIT software license

#ifndef PROXIMA_PRIMITIVES_NODESIG_H
#define PROXIMA_PRIMITIVES_NODESIG_H

#include <cstdint>
#include <cstring>
#include <string>

/**
 * CNodeSignature - ephemeral 8-byte identifier a node advertises under.
 *
 * Derived one-way from the owner identity, a per-install secret and the
 * current rotation epoch, so it changes every epoch and cannot be mapped
 * back to the user. Used as the key for de-duplication and cooldowns.
 */
class CNodeSignature {
public:
    static constexpr size_t SIZE = 8;

    uint8_t data[SIZE];

    CNodeSignature() { memset(data, 0, SIZE); }

    bool IsNull() const {
        for (size_t i = 0; i < SIZE; i++)
            if (data[i] != 0) return false;
        return true;
    }

    // Byte-wise ordering, for STL containers only
    bool operator<(const CNodeSignature& other) const {
        return memcmp(data, other.data, SIZE) < 0;
    }

    bool operator==(const CNodeSignature& other) const {
        return memcmp(data, other.data, SIZE) == 0;
    }

    bool operator!=(const CNodeSignature& other) const {
        return !(*this == other);
    }

    const uint8_t* begin() const { return data; }
    const uint8_t* end() const { return data + SIZE; }

    std::string GetHex() const;
    bool SetHex(const std::string& hex);
};

#endif // PROXIMA_PRIMITIVES_NODESIG_H
