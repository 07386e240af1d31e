// Copyright (c) 2025 The Proxima Core developers
// Distributed under the MIT software license

#ifndef PROXIMA_CONNECTION_LIFECYCLE_H
#define PROXIMA_CONNECTION_LIFECYCLE_H

#include <connection/connection.h>
#include <connection/cooldown.h>
#include <discovery/advertiser.h>
#include <discovery/discovery.h>
#include <exchange/insight_gate.h>
#include <exchange/session.h>
#include <storage/store.h>
#include <transport/transport.h>
#include <util/threadinterrupt.h>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

/** Outcome of an attempt() call; rejections are ordinary results */
enum class AttemptResult {
    OK,
    TOO_MANY_CONNECTIONS,
    IN_COOLDOWN,
    ALREADY_CONNECTING,
};

const char* AttemptResultString(AttemptResult result);

struct LifecycleOptions {
    size_t max_connections{3};
    int64_t cooldown{300};              // seconds
    SessionParams session;
    double insight_burst{6.0};
    double insight_refill_per_hour{12.0};
    size_t history_in_memory{256};
    size_t history_on_disk{1024};       // older hist: records are erased
    size_t inbound_pending_slack{2};    // handshakes awaiting hello beyond max_connections
};

/**
 * CConnectionLifecycle - owns the active-connection table
 *
 * Every insert (Attempt) and removal (terminal state) goes through m_mutex,
 * so the concurrency cap, cooldown and in-flight checks are atomic with the
 * insert. Each admitted connection runs to completion on its own worker
 * thread; callers only ever see snapshot copies.
 *
 * Inbound channels that have not yet sent their hello are not in the table.
 * At most max_connections + inbound_pending_slack of them are read at
 * once; further channels are refused with too_many_connections.
 *
 * When a connection ends:
 *   - it leaves the table
 *   - the remote node enters cooldown (persisted) and expired cooldowns
 *     are pruned from memory and storage
 *   - a summary is appended to history (persisted)
 *   - on COMPLETED, received insights are scaled, rate limited and applied
 */
class CConnectionLifecycle {
public:
    using LocalAdvertFn = std::function<bool(CLocalAdvert&)>;

    /**
     * @param persistence may be null (nothing survives a restart)
     */
    CConnectionLifecycle(const LifecycleOptions& options,
                         std::shared_ptr<IProfileStore> profile_store,
                         std::shared_ptr<IPersistence> persistence,
                         LocalAdvertFn local_advert);
    ~CConnectionLifecycle();

    CConnectionLifecycle(const CConnectionLifecycle&) = delete;
    CConnectionLifecycle& operator=(const CConnectionLifecycle&) = delete;

    /** Reload cooldowns and history ids from persistence */
    bool Start();

    /**
     * Reserve a slot for a connection to `remote`.
     * On OK, `out` is a new connection in DISCOVERED state, already counted
     * against the cap. It must later be run or abandoned.
     */
    AttemptResult Attempt(const CNodeSignature& remote, ConnectionDirection direction,
                          std::shared_ptr<CConnection>& out);

    /** Attempt and, if admitted, run the initiator side on a worker thread */
    AttemptResult Connect(const CNodeDescriptor& candidate, std::shared_ptr<ITransportAdapter> adapter);

    /** Callback to install on every transport for inbound channels */
    InboundHandler GetInboundHandler();

    /** Handle one inbound channel: read hello, admit, run the responder side */
    void HandleInbound(std::unique_ptr<CMessageChannel> channel);

    /** End a connection that never ran (or could not continue) */
    void Abandon(const std::shared_ptr<CConnection>& connection, const std::string& reason);

    std::vector<CConnectionSummary> GetSnapshots() const;
    std::vector<CConnectionSummary> GetHistory() const;
    size_t GetActiveCount() const;
    size_t GetPendingInbound() const;
    size_t GetCooldownCount() const { return m_cooldowns.Size(); }
    bool HasConnectionTo(const CNodeSignature& remote) const;
    bool IsInCooldown(const CNodeSignature& remote, int64_t now) const;

    /** Wait until no connection is active and every worker has exited */
    bool WaitForIdle(std::chrono::milliseconds timeout);

    /**
     * Force-complete every open connection (reason system_shutdown), join
     * workers and flush cooldowns. Further attempts are declined.
     */
    void Shutdown();

    const LifecycleOptions& GetOptions() const { return m_options; }

private:
    void RunOutbound(std::shared_ptr<CConnection> connection, std::shared_ptr<ITransportAdapter> adapter,
                     std::string address);
    void RunInbound(std::shared_ptr<CMessageChannel> channel);

    /** Remove from the table, start cooldown, persist, apply insights */
    void Finish(const std::shared_ptr<CConnection>& connection, const SessionOutcome& outcome);

    /** Walk a live connection to its terminal state */
    static void EndConnection(const std::shared_ptr<CConnection>& connection, ConnectionState state,
                              const std::string& reason);

    void ReleasePendingInbound();
    void PruneCooldowns(int64_t now);
    void TrimHistoryOnDisk(uint64_t newest_id);

    /** @return false if shutdown has begun and fn will not run */
    bool SpawnWorker(std::function<void()> fn);
    void ReapWorkersLocked();

    bool PersistCooldown(const CNodeSignature& remote, int64_t ended_at);

    const LifecycleOptions m_options;
    std::shared_ptr<IProfileStore> m_profileStore;
    std::shared_ptr<IPersistence> m_persistence;
    LocalAdvertFn m_localAdvert;

    CCooldownTracker m_cooldowns;
    CInsightGate m_gate;
    CThreadInterrupt m_interrupt;

    mutable std::mutex m_mutex;
    std::condition_variable m_cv;
    std::map<uint64_t, std::shared_ptr<CConnection>> m_active;
    std::deque<CConnectionSummary> m_history;
    uint64_t m_nextId{1};
    size_t m_pendingInbound{0};
    bool m_shuttingDown{false};

    std::map<uint64_t, std::thread> m_workers;
    std::vector<uint64_t> m_finishedWorkers;
    uint64_t m_nextWorker{1};
};

#endif // PROXIMA_CONNECTION_LIFECYCLE_H
