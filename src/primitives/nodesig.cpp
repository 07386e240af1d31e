// Copyright (c) 2025 The Proxima Core developers
// Distributed under the MIT software license

#include <primitives/nodesig.h>

#include <util/strencodings.h>

#include <vector>

std::string CNodeSignature::GetHex() const {
    return HexStr(data, SIZE);
}

bool CNodeSignature::SetHex(const std::string& hex) {
    if (hex.size() != SIZE * 2 || !IsHex(hex)) {
        return false;
    }
    std::vector<uint8_t> bytes = ParseHex(hex);
    memcpy(data, bytes.data(), SIZE);
    return true;
}
