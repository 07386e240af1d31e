// Copyright (c) 2025 The Proxima Core developers
// Distributed under the MIT software license

#include <storage/store.h>

#include <util/strencodings.h>

#include <cstdio>

namespace PersistKeys {

const std::string COOLDOWN_PREFIX = "cd:";
const std::string HISTORY_PREFIX = "hist:";
const std::string SETTING_PREFIX = "set:";

std::string Cooldown(const CNodeSignature& signature) {
    return COOLDOWN_PREFIX + signature.GetHex();
}

std::string History(uint64_t id) {
    // Fixed width so that key order is id order
    return HISTORY_PREFIX + strprintf("%016llx", static_cast<unsigned long long>(id));
}

std::string Setting(const std::string& name) {
    return SETTING_PREFIX + name;
}

bool ParseCooldown(const std::string& key, CNodeSignature& signature) {
    if (key.size() != COOLDOWN_PREFIX.size() + CNodeSignature::SIZE * 2 ||
        key.compare(0, COOLDOWN_PREFIX.size(), COOLDOWN_PREFIX) != 0) {
        return false;
    }
    return signature.SetHex(key.substr(COOLDOWN_PREFIX.size()));
}

bool ParseHistory(const std::string& key, uint64_t& id) {
    if (key.size() != HISTORY_PREFIX.size() + 16 ||
        key.compare(0, HISTORY_PREFIX.size(), HISTORY_PREFIX) != 0) {
        return false;
    }
    std::string digits = key.substr(HISTORY_PREFIX.size());
    if (!IsHex(digits)) {
        return false;
    }
    id = std::stoull(digits, nullptr, 16);
    return true;
}

} // namespace PersistKeys
