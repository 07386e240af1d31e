// Copyright (c) 2025 The Proxima Core developers
// Distributed under the MIT software license

#ifndef PROXIMA_STORAGE_MEMORY_STORE_H
#define PROXIMA_STORAGE_MEMORY_STORE_H

#include <storage/store.h>

#include <map>
#include <mutex>
#include <string>
#include <vector>

/**
 * Map-backed IPersistence. Used by tests and when no data directory is
 * writable.
 */
class CMemoryPersistence : public IPersistence {
public:
    bool Write(const std::string& key, const std::vector<uint8_t>& value) override;
    bool Read(const std::string& key, std::vector<uint8_t>& value) const override;
    bool Erase(const std::string& key) override;
    bool WriteBatch(const PersistBatch& batch) override;
    bool ReadPrefix(const std::string& prefix,
                    std::map<std::string, std::vector<uint8_t>>& out) const override;

    size_t Size() const;

private:
    mutable std::mutex m_mutex;
    std::map<std::string, std::vector<uint8_t>> m_data;
};

#endif // PROXIMA_STORAGE_MEMORY_STORE_H
