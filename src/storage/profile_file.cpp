// Copyright (c) 2025 The Proxima Core developers
// Distributed under the MIT software license

#include <storage/profile_file.h>

#include <util/logging.h>
#include <util/time.h>

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <fstream>
#include <sstream>

using json = nlohmann::json;

size_t ApplyInsightsToSnapshot(CProfileSnapshot& profile, const std::vector<CLearningInsight>& insights,
                               int64_t now) {
    size_t applied = 0;
    for (const CLearningInsight& insight : insights) {
        auto it = profile.dimensions.find(insight.dimension);
        if (it == profile.dimensions.end() || !std::isfinite(insight.delta)) {
            LogPrintf(STORAGE, DEBUG, "Skipping insight for unknown dimension %s", insight.dimension.c_str());
            continue;
        }
        it->second = std::min(1.0, std::max(0.0, it->second + insight.delta));
        applied++;
    }
    if (applied > 0) {
        profile.nRevision++;
        profile.nUpdatedAt = now;
    }
    return applied;
}

// CMemoryProfileStore

CMemoryProfileStore::CMemoryProfileStore(const CProfileSnapshot& profile)
    : m_profile(profile)
{
}

bool CMemoryProfileStore::GetCurrentProfile(CProfileSnapshot& out) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    out = m_profile;
    return true;
}

bool CMemoryProfileStore::ApplyInsights(const std::vector<CLearningInsight>& insights) {
    std::lock_guard<std::mutex> lock(m_mutex);
    ApplyInsightsToSnapshot(m_profile, insights, GetTime());
    m_applied.insert(m_applied.end(), insights.begin(), insights.end());
    return true;
}

uint64_t CMemoryProfileStore::GetRevision() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_profile.nRevision;
}

std::vector<CLearningInsight> CMemoryProfileStore::GetAppliedInsights() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_applied;
}

// CJsonProfileStore

CJsonProfileStore::CJsonProfileStore(const std::string& path) : m_path(path) {}

std::string CJsonProfileStore::ToJson(const CProfileSnapshot& profile) {
    json doc;
    doc["user_id"] = profile.userId;
    doc["updated_at"] = profile.nUpdatedAt;
    doc["revision"] = profile.nRevision;
    json dims = json::object();
    for (const auto& entry : profile.dimensions) {
        dims[entry.first] = entry.second;
    }
    doc["dimensions"] = dims;
    return doc.dump(2);
}

bool CJsonProfileStore::FromJson(const std::string& text, CProfileSnapshot& profile, std::string& error) {
    json doc = json::parse(text, nullptr, false);
    if (doc.is_discarded() || !doc.is_object()) {
        error = "not a JSON object";
        return false;
    }

    auto user = doc.find("user_id");
    auto updated = doc.find("updated_at");
    auto dims = doc.find("dimensions");
    if (user == doc.end() || !user->is_string()) {
        error = "missing user_id";
        return false;
    }
    if (updated == doc.end() || !updated->is_number_integer()) {
        error = "missing updated_at";
        return false;
    }
    if (dims == doc.end() || !dims->is_object()) {
        error = "missing dimensions";
        return false;
    }

    CProfileSnapshot result;
    result.userId = user->get<std::string>();
    result.nUpdatedAt = updated->get<int64_t>();
    auto revision = doc.find("revision");
    result.nRevision = (revision != doc.end() && revision->is_number_unsigned())
                           ? revision->get<uint64_t>() : 1;

    for (auto it = dims->begin(); it != dims->end(); ++it) {
        if (!it.value().is_number()) {
            error = "dimension " + it.key() + " is not a number";
            return false;
        }
        result.dimensions[it.key()] = it.value().get<double>();
    }

    profile = result;
    return true;
}

bool CJsonProfileStore::Load() {
    std::ifstream file(m_path);
    if (!file.is_open()) {
        LogPrintf(STORAGE, ERROR, "Profile file not found: %s", m_path.c_str());
        return false;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    CProfileSnapshot profile;
    std::string error;
    if (!FromJson(buffer.str(), profile, error)) {
        LogPrintf(STORAGE, ERROR, "Malformed profile %s: %s", m_path.c_str(), error.c_str());
        return false;
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    m_profile = profile;
    m_loaded = true;
    LogPrintf(STORAGE, INFO, "Loaded profile (%zu dimensions, revision %llu)",
              m_profile.dimensions.size(), static_cast<unsigned long long>(m_profile.nRevision));
    return true;
}

bool CJsonProfileStore::GetCurrentProfile(CProfileSnapshot& out) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_loaded) {
        return false;
    }
    out = m_profile;
    return true;
}

bool CJsonProfileStore::ApplyInsights(const std::vector<CLearningInsight>& insights) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_loaded) {
        return false;
    }

    CProfileSnapshot updated = m_profile;
    if (ApplyInsightsToSnapshot(updated, insights, GetTime()) == 0) {
        return true;
    }
    if (!Save(updated)) {
        return false;
    }
    m_profile = updated;
    return true;
}

uint64_t CJsonProfileStore::GetRevision() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_profile.nRevision;
}

bool CJsonProfileStore::Save(const CProfileSnapshot& profile) {
    // Caller holds m_mutex
    std::string tmpPath = m_path + ".tmp";
    {
        std::ofstream file(tmpPath, std::ios::trunc);
        if (!file.is_open()) {
            LogPrintf(STORAGE, ERROR, "Cannot write profile to %s", tmpPath.c_str());
            return false;
        }
        file << ToJson(profile) << std::endl;
        if (!file.good()) {
            LogPrintf(STORAGE, ERROR, "Write error on %s", tmpPath.c_str());
            return false;
        }
    }

    if (std::rename(tmpPath.c_str(), m_path.c_str()) != 0) {
        LogPrintf(STORAGE, ERROR, "Cannot replace profile %s", m_path.c_str());
        std::remove(tmpPath.c_str());
        return false;
    }
    return true;
}
