// Copyright (c) 2025 The Proxima Core developers
// Distributed under the MIT software license

#ifndef PROXIMA_STORAGE_LEVELDB_STORE_H
#define PROXIMA_STORAGE_LEVELDB_STORE_H

/**
 * Engine state database (<datadir>/engine)
 *
 * Holds cooldown records, connection history and install settings so that
 * cooldowns survive a restart. Thread-safe: protected by an internal mutex.
 */

#include <storage/store.h>

#include <leveldb/db.h>

#include <memory>
#include <mutex>
#include <string>

class CLevelDBPersistence : public IPersistence {
public:
    CLevelDBPersistence();
    ~CLevelDBPersistence() override;

    // Prevent copying
    CLevelDBPersistence(const CLevelDBPersistence&) = delete;
    CLevelDBPersistence& operator=(const CLevelDBPersistence&) = delete;

    /**
     * Open (or create) the database
     *
     * @param path Directory path for database files
     * @return true if opened successfully
     */
    bool Open(const std::string& path);

    void Close();
    bool IsOpen() const;

    bool Write(const std::string& key, const std::vector<uint8_t>& value) override;
    bool Read(const std::string& key, std::vector<uint8_t>& value) const override;
    bool Erase(const std::string& key) override;
    bool WriteBatch(const PersistBatch& batch) override;
    bool ReadPrefix(const std::string& prefix,
                    std::map<std::string, std::vector<uint8_t>>& out) const override;

    const std::string& GetPath() const { return m_path; }

private:
    std::unique_ptr<leveldb::DB> m_db;
    mutable std::mutex m_mutex;
    std::string m_path;
};

#endif // PROXIMA_STORAGE_LEVELDB_STORE_H
