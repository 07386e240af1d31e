// Copyright (c) 2025 The Proxima Core developers
// Distributed under the MIT software license

#ifndef PROXIMA_STORAGE_STORE_H
#define PROXIMA_STORAGE_STORE_H

/**
 * Collaborator interfaces owned by the host application.
 *
 * IPersistence is a flat key/value store for engine state. Keys:
 *   "cd:"   + node signature hex  -> int64 LE time the last connection ended
 *   "hist:" + 16 hex digit id     -> serialized CConnectionSummary
 *   "set:"  + setting name        -> raw bytes (e.g. the install secret)
 *
 * IProfileStore owns the private profile. The engine only ever reads a
 * snapshot and hands back bounded insight lists.
 */

#include <primitives/insight.h>
#include <primitives/nodesig.h>
#include <primitives/profile.h>

#include <cstdint>
#include <map>
#include <string>
#include <vector>

using PersistBatch = std::vector<std::pair<std::string, std::vector<uint8_t>>>;

class IPersistence {
public:
    virtual ~IPersistence() {}

    virtual bool Write(const std::string& key, const std::vector<uint8_t>& value) = 0;
    virtual bool Read(const std::string& key, std::vector<uint8_t>& value) const = 0;
    virtual bool Erase(const std::string& key) = 0;

    /** Atomically write every pair in the batch */
    virtual bool WriteBatch(const PersistBatch& batch) = 0;

    /** All entries whose key starts with prefix, in key order */
    virtual bool ReadPrefix(const std::string& prefix,
                            std::map<std::string, std::vector<uint8_t>>& out) const = 0;
};

namespace PersistKeys {
extern const std::string COOLDOWN_PREFIX;
extern const std::string HISTORY_PREFIX;
extern const std::string SETTING_PREFIX;

std::string Cooldown(const CNodeSignature& signature);
std::string History(uint64_t id);
std::string Setting(const std::string& name);

/** Recover the node signature from a cooldown key */
bool ParseCooldown(const std::string& key, CNodeSignature& signature);
bool ParseHistory(const std::string& key, uint64_t& id);
} // namespace PersistKeys

class IProfileStore {
public:
    virtual ~IProfileStore() {}

    /** Copy of the current profile; false if no profile is available */
    virtual bool GetCurrentProfile(CProfileSnapshot& out) const = 0;

    /**
     * Apply a bounded list of already-scaled insights.
     * Values are clamped to [0,1]; unknown dimensions are skipped.
     * @return false if the change could not be persisted
     */
    virtual bool ApplyInsights(const std::vector<CLearningInsight>& insights) = 0;

    virtual uint64_t GetRevision() const = 0;
};

#endif // PROXIMA_STORAGE_STORE_H
