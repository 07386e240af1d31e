// Copyright (c) 2025 The Proxima Core developers
// Distributed under the MIT software license

#ifndef PROXIMA_CONNECTION_COOLDOWN_H
#define PROXIMA_CONNECTION_COOLDOWN_H

#include <primitives/nodesig.h>

#include <cstdint>
#include <map>
#include <mutex>
#include <vector>

/**
 * CCooldownTracker - per-node refractory window.
 *
 * When a connection to a node reaches a terminal state the node enters
 * cooldown; new attempts to it are declined until `window` seconds have
 * passed since the connection ended.
 *
 * Thread-safe: all public methods acquire m_mutex.
 */
class CCooldownTracker {
public:
    explicit CCooldownTracker(int64_t window);

    // --- Query interface ---

    /** Is this node in cooldown at time now? */
    bool IsInCooldown(const CNodeSignature& node, int64_t now) const;

    /** Seconds of cooldown left (0 if none) */
    int64_t GetRemaining(const CNodeSignature& node, int64_t now) const;

    /** Time the last connection to this node ended (or -1 if never) */
    int64_t GetLastEnded(const CNodeSignature& node) const;

    int64_t GetWindow() const { return m_window; }

    // --- Mutation interface ---

    /** Record that a connection to `node` ended at `ended_at` */
    void Record(const CNodeSignature& node, int64_t ended_at);

    /** Restore entries loaded from persistence; expired ones are skipped */
    size_t Load(const std::map<CNodeSignature, int64_t>& entries, int64_t now);

    /** Drop entries whose window has passed, appending their nodes to `removed` if given. Returns the number removed. */
    size_t Prune(int64_t now, std::vector<CNodeSignature>* removed = nullptr);

    /** Copy of all live entries (node -> ended_at) */
    std::map<CNodeSignature, int64_t> GetEntries() const;

    size_t Size() const;

    void Clear();

private:
    const int64_t m_window;

    mutable std::mutex m_mutex;

    // node signature -> time its most recent connection ended
    std::map<CNodeSignature, int64_t> m_lastEnded;
};

#endif // PROXIMA_CONNECTION_COOLDOWN_H
