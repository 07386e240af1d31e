// Copyright (c) 2025 The Proxima Core developers
// Distributed under the MIT software license

#include <storage/memory_store.h>

bool CMemoryPersistence::Write(const std::string& key, const std::vector<uint8_t>& value) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_data[key] = value;
    return true;
}

bool CMemoryPersistence::Read(const std::string& key, std::vector<uint8_t>& value) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_data.find(key);
    if (it == m_data.end()) {
        return false;
    }
    value = it->second;
    return true;
}

bool CMemoryPersistence::Erase(const std::string& key) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_data.erase(key);
    return true;
}

bool CMemoryPersistence::WriteBatch(const PersistBatch& batch) {
    std::lock_guard<std::mutex> lock(m_mutex);
    for (const auto& entry : batch) {
        m_data[entry.first] = entry.second;
    }
    return true;
}

bool CMemoryPersistence::ReadPrefix(const std::string& prefix,
                                    std::map<std::string, std::vector<uint8_t>>& out) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    for (auto it = m_data.lower_bound(prefix); it != m_data.end(); ++it) {
        if (it->first.compare(0, prefix.size(), prefix) != 0) {
            break;
        }
        out[it->first] = it->second;
    }
    return true;
}

size_t CMemoryPersistence::Size() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_data.size();
}
