// Copyright (c) 2025 The Proxima Core developers
// Distributed under the MIT software license

#ifndef PROXIMA_STORAGE_PROFILE_FILE_H
#define PROXIMA_STORAGE_PROFILE_FILE_H

#include <storage/store.h>

#include <mutex>
#include <string>
#include <vector>

/**
 * Apply insights to a snapshot in place: clamp to [0,1], bump the revision
 * and stamp nUpdatedAt. Returns the number of insights applied.
 */
size_t ApplyInsightsToSnapshot(CProfileSnapshot& profile, const std::vector<CLearningInsight>& insights,
                               int64_t now);

/**
 * Profile held in memory only (tests, simulations)
 */
class CMemoryProfileStore : public IProfileStore {
public:
    explicit CMemoryProfileStore(const CProfileSnapshot& profile);

    bool GetCurrentProfile(CProfileSnapshot& out) const override;
    bool ApplyInsights(const std::vector<CLearningInsight>& insights) override;
    uint64_t GetRevision() const override;

    /** Every insight ever applied, in order */
    std::vector<CLearningInsight> GetAppliedInsights() const;

private:
    mutable std::mutex m_mutex;
    CProfileSnapshot m_profile;
    std::vector<CLearningInsight> m_applied;
};

/**
 * CJsonProfileStore - profile kept in a JSON document
 *
 *   {
 *     "user_id": "...",
 *     "updated_at": 1760000000,
 *     "revision": 3,
 *     "dimensions": { "exploration_eagerness": 0.62, ... }
 *   }
 *
 * Writes go to "<path>.tmp" and are renamed over the original.
 */
class CJsonProfileStore : public IProfileStore {
public:
    explicit CJsonProfileStore(const std::string& path);

    /** Read the file; false if missing or malformed */
    bool Load();

    bool GetCurrentProfile(CProfileSnapshot& out) const override;
    bool ApplyInsights(const std::vector<CLearningInsight>& insights) override;
    uint64_t GetRevision() const override;

    const std::string& GetPath() const { return m_path; }

    /** Serialize/parse the document format */
    static std::string ToJson(const CProfileSnapshot& profile);
    static bool FromJson(const std::string& text, CProfileSnapshot& profile, std::string& error);

private:
    bool Save(const CProfileSnapshot& profile);

    const std::string m_path;
    mutable std::mutex m_mutex;
    CProfileSnapshot m_profile;
    bool m_loaded{false};
};

#endif // PROXIMA_STORAGE_PROFILE_FILE_H
