// Copyright (c) 2025 The Proxima Core developers
// Distributed under the MIT software license

#include <storage/leveldb_store.h>

#include <util/logging.h>

#include <leveldb/iterator.h>
#include <leveldb/write_batch.h>

namespace {
leveldb::Slice ToSlice(const std::vector<uint8_t>& value) {
    return leveldb::Slice(reinterpret_cast<const char*>(value.data()), value.size());
}
}

CLevelDBPersistence::CLevelDBPersistence() : m_db(nullptr) {}

CLevelDBPersistence::~CLevelDBPersistence() {
    Close();
}

bool CLevelDBPersistence::Open(const std::string& path) {
    std::lock_guard<std::mutex> lock(m_mutex);

    if (m_db) {
        return true;  // Already open
    }

    m_path = path;

    leveldb::Options options;
    options.create_if_missing = true;
    options.write_buffer_size = 1 * 1024 * 1024;
    options.max_open_files = 64;

    leveldb::DB* db = nullptr;
    leveldb::Status status = leveldb::DB::Open(options, path, &db);

    if (!status.ok()) {
        LogPrintf(STORAGE, ERROR, "Failed to open engine database %s: %s",
                  path.c_str(), status.ToString().c_str());
        return false;
    }

    m_db.reset(db);
    LogPrintf(STORAGE, INFO, "Engine database opened: %s", path.c_str());
    return true;
}

void CLevelDBPersistence::Close() {
    std::lock_guard<std::mutex> lock(m_mutex);

    if (m_db) {
        m_db.reset();
        LogPrintf(STORAGE, INFO, "Engine database closed");
    }
}

bool CLevelDBPersistence::IsOpen() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_db != nullptr;
}

bool CLevelDBPersistence::Write(const std::string& key, const std::vector<uint8_t>& value) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_db) {
        return false;
    }

    leveldb::WriteOptions writeOpts;
    writeOpts.sync = true;  // Cooldowns must survive a crash

    leveldb::Status status = m_db->Put(writeOpts, key, ToSlice(value));
    if (!status.ok()) {
        LogPrintf(STORAGE, ERROR, "Failed to write %s: %s", key.c_str(), status.ToString().c_str());
        return false;
    }
    return true;
}

bool CLevelDBPersistence::Read(const std::string& key, std::vector<uint8_t>& value) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_db) {
        return false;
    }

    std::string raw;
    leveldb::Status status = m_db->Get(leveldb::ReadOptions(), key, &raw);
    if (!status.ok()) {
        if (!status.IsNotFound()) {
            LogPrintf(STORAGE, ERROR, "Failed to read %s: %s", key.c_str(), status.ToString().c_str());
        }
        return false;
    }
    value.assign(raw.begin(), raw.end());
    return true;
}

bool CLevelDBPersistence::Erase(const std::string& key) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_db) {
        return false;
    }

    leveldb::Status status = m_db->Delete(leveldb::WriteOptions(), key);
    if (!status.ok()) {
        LogPrintf(STORAGE, ERROR, "Failed to erase %s: %s", key.c_str(), status.ToString().c_str());
        return false;
    }
    return true;
}

bool CLevelDBPersistence::WriteBatch(const PersistBatch& batch) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_db) {
        return false;
    }

    leveldb::WriteBatch wb;
    for (const auto& entry : batch) {
        wb.Put(entry.first, ToSlice(entry.second));
    }

    leveldb::WriteOptions writeOpts;
    writeOpts.sync = true;
    leveldb::Status status = m_db->Write(writeOpts, &wb);
    if (!status.ok()) {
        LogPrintf(STORAGE, ERROR, "Batch write of %zu records failed: %s",
                  batch.size(), status.ToString().c_str());
        return false;
    }
    return true;
}

bool CLevelDBPersistence::ReadPrefix(const std::string& prefix,
                                     std::map<std::string, std::vector<uint8_t>>& out) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_db) {
        return false;
    }

    std::unique_ptr<leveldb::Iterator> it(m_db->NewIterator(leveldb::ReadOptions()));
    for (it->Seek(prefix); it->Valid(); it->Next()) {
        leveldb::Slice key = it->key();
        if (!key.starts_with(prefix)) {
            break;
        }
        leveldb::Slice value = it->value();
        out[key.ToString()] = std::vector<uint8_t>(value.data(), value.data() + value.size());
    }

    if (!it->status().ok()) {
        LogPrintf(STORAGE, ERROR, "Iteration over %s failed: %s",
                  prefix.c_str(), it->status().ToString().c_str());
        return false;
    }
    return true;
}
