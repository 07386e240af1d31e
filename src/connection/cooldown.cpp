// Copyright (c) 2025 The Proxima Core developers
// Distributed under the MIT software license

#include <connection/cooldown.h>

#include <algorithm>

CCooldownTracker::CCooldownTracker(int64_t window)
    : m_window(std::max<int64_t>(0, window))
{
}

bool CCooldownTracker::IsInCooldown(const CNodeSignature& node, int64_t now) const
{
    return GetRemaining(node, now) > 0;
}

int64_t CCooldownTracker::GetRemaining(const CNodeSignature& node, int64_t now) const
{
    std::lock_guard<std::mutex> lock(m_mutex);

    auto it = m_lastEnded.find(node);
    if (it == m_lastEnded.end())
        return 0;

    int64_t remaining = it->second + m_window - now;
    return std::max<int64_t>(0, remaining);
}

int64_t CCooldownTracker::GetLastEnded(const CNodeSignature& node) const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_lastEnded.find(node);
    return (it != m_lastEnded.end()) ? it->second : -1;
}

void CCooldownTracker::Record(const CNodeSignature& node, int64_t ended_at)
{
    std::lock_guard<std::mutex> lock(m_mutex);

    // Never move a cooldown backwards
    auto it = m_lastEnded.find(node);
    if (it == m_lastEnded.end() || it->second < ended_at) {
        m_lastEnded[node] = ended_at;
    }
}

size_t CCooldownTracker::Load(const std::map<CNodeSignature, int64_t>& entries, int64_t now)
{
    std::lock_guard<std::mutex> lock(m_mutex);

    size_t loaded = 0;
    for (const auto& entry : entries) {
        if (entry.second + m_window <= now)
            continue;
        int64_t& slot = m_lastEnded[entry.first];
        slot = std::max(slot, entry.second);
        loaded++;
    }
    return loaded;
}

size_t CCooldownTracker::Prune(int64_t now, std::vector<CNodeSignature>* removed)
{
    std::lock_guard<std::mutex> lock(m_mutex);

    size_t count = 0;
    auto it = m_lastEnded.begin();
    while (it != m_lastEnded.end()) {
        if (it->second + m_window <= now) {
            if (removed) {
                removed->push_back(it->first);
            }
            it = m_lastEnded.erase(it);
            count++;
        } else {
            ++it;
        }
    }
    return count;
}

std::map<CNodeSignature, int64_t> CCooldownTracker::GetEntries() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_lastEnded;
}

size_t CCooldownTracker::Size() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_lastEnded.size();
}

void CCooldownTracker::Clear()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_lastEnded.clear();
}
