// Copyright (c) 2025 The Proxima Core developers
// Distributed under the MIT software license

#include <connection/lifecycle.h>

#include <net/protocol.h>
#include <net/serialize.h>
#include <util/logging.h>
#include <util/time.h>

#include <algorithm>
#include <stdexcept>

namespace {
const int INBOUND_SLICE_MS = 100;

const char* RejectionReason(AttemptResult result) {
    switch (result) {
        case AttemptResult::TOO_MANY_CONNECTIONS: return Exchange::REASON_TOO_MANY_CONNECTIONS;
        case AttemptResult::IN_COOLDOWN: return Exchange::REASON_IN_COOLDOWN;
        case AttemptResult::ALREADY_CONNECTING: return Exchange::REASON_ALREADY_CONNECTING;
        case AttemptResult::OK: break;
    }
    return Exchange::REASON_PROTOCOL_ERROR;
}
}

const char* AttemptResultString(AttemptResult result) {
    switch (result) {
        case AttemptResult::OK: return "ok";
        case AttemptResult::TOO_MANY_CONNECTIONS: return "too-many-connections";
        case AttemptResult::IN_COOLDOWN: return "in-cooldown";
        case AttemptResult::ALREADY_CONNECTING: return "already-connecting";
    }
    return "unknown";
}

CConnectionLifecycle::CConnectionLifecycle(const LifecycleOptions& options,
                                           std::shared_ptr<IProfileStore> profile_store,
                                           std::shared_ptr<IPersistence> persistence,
                                           LocalAdvertFn local_advert)
    : m_options(options),
      m_profileStore(std::move(profile_store)),
      m_persistence(std::move(persistence)),
      m_localAdvert(std::move(local_advert)),
      m_cooldowns(options.cooldown),
      m_gate(options.insight_burst, options.insight_refill_per_hour)
{
    if (!m_profileStore || !m_localAdvert) {
        throw std::invalid_argument("CConnectionLifecycle: profile store and local advert are required");
    }
}

CConnectionLifecycle::~CConnectionLifecycle() {
    Shutdown();
}

bool CConnectionLifecycle::Start() {
    if (!m_persistence) {
        return true;
    }

    int64_t now = GetTime();
    bool ok = true;

    std::map<std::string, std::vector<uint8_t>> records;
    if (m_persistence->ReadPrefix(PersistKeys::COOLDOWN_PREFIX, records)) {
        std::map<CNodeSignature, int64_t> entries;
        for (const auto& record : records) {
            CNodeSignature node;
            if (!PersistKeys::ParseCooldown(record.first, node) || record.second.size() != 8) {
                LogPrintf(STORAGE, WARN, "Skipping corrupt cooldown record %s", record.first.c_str());
                continue;
            }
            CDataStream stream(record.second);
            int64_t ended_at = stream.ReadInt64();
            if (ended_at + m_options.cooldown <= now) {
                m_persistence->Erase(record.first);
                continue;
            }
            entries[node] = ended_at;
        }
        size_t loaded = m_cooldowns.Load(entries, now);
        LogPrintf(CONNECT, INFO, "Restored %zu cooldown entries", loaded);
    } else {
        ok = false;
    }

    records.clear();
    if (m_persistence->ReadPrefix(PersistKeys::HISTORY_PREFIX, records)) {
        uint64_t newest = 0;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            for (const auto& record : records) {
                uint64_t id = 0;
                CConnectionSummary summary;
                if (!PersistKeys::ParseHistory(record.first, id) ||
                    !CConnectionSummary::Deserialize(record.second, summary)) {
                    continue;
                }
                m_nextId = std::max(m_nextId, id + 1);
                newest = std::max(newest, id);
                m_history.push_back(summary);
                if (m_history.size() > m_options.history_in_memory) {
                    m_history.pop_front();
                }
            }
        }
        if (newest > m_options.history_on_disk) {
            for (const auto& record : records) {
                uint64_t id = 0;
                if (PersistKeys::ParseHistory(record.first, id) && id + m_options.history_on_disk <= newest) {
                    m_persistence->Erase(record.first);
                }
            }
        }
    } else {
        ok = false;
    }
    return ok;
}

AttemptResult CConnectionLifecycle::Attempt(const CNodeSignature& remote, ConnectionDirection direction,
                                            std::shared_ptr<CConnection>& out) {
    int64_t now = GetTime();

    std::lock_guard<std::mutex> lock(m_mutex);

    if (m_shuttingDown || m_active.size() >= m_options.max_connections) {
        return AttemptResult::TOO_MANY_CONNECTIONS;
    }
    if (m_cooldowns.IsInCooldown(remote, now)) {
        return AttemptResult::IN_COOLDOWN;
    }
    for (const auto& entry : m_active) {
        if (entry.second->GetRemote() == remote) {
            return AttemptResult::ALREADY_CONNECTING;
        }
    }

    uint64_t id = m_nextId++;
    out = std::make_shared<CConnection>(id, remote, direction, now);
    m_active.emplace(id, out);

    LogPrintf(CONNECT, INFO, "conn=%llu: %s connection to %s (%zu/%zu active)",
              static_cast<unsigned long long>(id), ConnectionDirectionName(direction),
              remote.GetHex().c_str(), m_active.size(), m_options.max_connections);
    return AttemptResult::OK;
}

AttemptResult CConnectionLifecycle::Connect(const CNodeDescriptor& candidate,
                                            std::shared_ptr<ITransportAdapter> adapter) {
    std::shared_ptr<CConnection> connection;
    AttemptResult result = Attempt(candidate.signature, ConnectionDirection::OUTBOUND, connection);
    if (result != AttemptResult::OK) {
        LogPrintf(CONNECT, DEBUG, "Attempt to %s declined: %s",
                  candidate.signature.GetHex().c_str(), AttemptResultString(result));
        return result;
    }

    std::string address = candidate.address;
    if (!SpawnWorker([this, connection, adapter, address]() {
            RunOutbound(connection, adapter, address);
        })) {
        Abandon(connection, Exchange::REASON_SYSTEM_SHUTDOWN);
    }
    return result;
}

InboundHandler CConnectionLifecycle::GetInboundHandler() {
    return [this](std::unique_ptr<CMessageChannel> channel) {
        HandleInbound(std::move(channel));
    };
}

void CConnectionLifecycle::HandleInbound(std::unique_ptr<CMessageChannel> channel) {
    std::shared_ptr<CMessageChannel> shared(std::move(channel));

    bool admitted = false;
    size_t pending = 0;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        pending = m_pendingInbound;
        if (!m_shuttingDown && pending < m_options.max_connections + m_options.inbound_pending_slack) {
            m_pendingInbound++;
            admitted = true;
        }
    }
    if (!admitted) {
        LogPrintf(CONNECT, DEBUG, "Refusing inbound from %s: %zu handshakes pending",
                  shared->GetPeerAddress().c_str(), pending);
        shared->Send(Exchange::CreateByeMessage(Exchange::REASON_TOO_MANY_CONNECTIONS));
        shared->Close();
        return;
    }

    if (!SpawnWorker([this, shared]() {
            RunInbound(shared);
        })) {
        ReleasePendingInbound();
        shared->Close();
    }
}

void CConnectionLifecycle::ReleasePendingInbound() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_pendingInbound > 0) {
            m_pendingInbound--;
        }
    }
    m_cv.notify_all();
}

void CConnectionLifecycle::RunOutbound(std::shared_ptr<CConnection> connection,
                                       std::shared_ptr<ITransportAdapter> adapter, std::string address) {
    connection->AdvanceTo(ConnectionState::HANDSHAKING, GetTime());

    CLocalAdvert local;
    if (!m_localAdvert(local)) {
        LogPrintf(CONNECT, WARN, "conn=%llu: no local fingerprint yet",
                  static_cast<unsigned long long>(connection->GetId()));
        Abandon(connection, Exchange::REASON_PROTOCOL_ERROR);
        return;
    }

    std::unique_ptr<CMessageChannel> channel = adapter->OpenChannel(address, m_options.session.step_timeout_ms);
    if (!channel) {
        Abandon(connection, Exchange::REASON_UNREACHABLE);
        return;
    }

    SessionOutcome outcome;
    bool ran = false;
    try {
        CExchangeSession session(connection, *channel, local, m_options.session, m_interrupt);
        outcome = session.RunInitiator();
        ran = true;
    } catch (const std::exception& e) {
        LogPrintf(CONNECT, ERROR, "conn=%llu: session failed: %s",
                  static_cast<unsigned long long>(connection->GetId()), e.what());
    }
    channel->Close();
    if (ran) {
        Finish(connection, outcome);
    } else {
        Abandon(connection, Exchange::REASON_PROTOCOL_ERROR);
    }
}

void CConnectionLifecycle::RunInbound(std::shared_ptr<CMessageChannel> channel) {
    // Admission needs the peer's node signature, so read its hello first
    CNetMessage msg;
    bool received = false;
    try {
        const int64_t step_end = GetTimeMillis() + m_options.session.step_timeout_ms;
        while (!m_interrupt && GetTimeMillis() < step_end) {
            if (channel->Receive(msg, INBOUND_SLICE_MS)) {
                received = true;
                break;
            }
            if (!channel->IsOpen()) {
                break;
            }
        }
    } catch (const std::exception& e) {
        LogPrintf(PROTOCOL, DEBUG, "Inbound from %s failed before hello: %s",
                  channel->GetPeerAddress().c_str(), e.what());
        received = false;
    }
    ReleasePendingInbound();
    if (!received) {
        channel->Close();
        return;
    }

    Exchange::CHelloMessage hello;
    if (msg.GetCommand() != NetProtocol::HELLO || !Exchange::ParseHelloMessage(msg, hello) ||
        hello.signature.IsNull()) {
        LogPrintf(PROTOCOL, DEBUG, "Inbound from %s did not open with a valid hello",
                  channel->GetPeerAddress().c_str());
        channel->Send(Exchange::CreateByeMessage(Exchange::REASON_PROTOCOL_ERROR));
        channel->Close();
        return;
    }

    std::shared_ptr<CConnection> connection;
    AttemptResult result = Attempt(hello.signature, ConnectionDirection::INBOUND, connection);
    if (result != AttemptResult::OK) {
        LogPrintf(CONNECT, DEBUG, "Inbound from %s declined: %s",
                  hello.signature.GetHex().c_str(), AttemptResultString(result));
        channel->Send(Exchange::CreateByeMessage(RejectionReason(result)));
        channel->Close();
        return;
    }
    connection->AdvanceTo(ConnectionState::HANDSHAKING, GetTime());

    CLocalAdvert local;
    if (!m_localAdvert(local)) {
        channel->Send(Exchange::CreateByeMessage(Exchange::REASON_PROTOCOL_ERROR));
        channel->Close();
        Abandon(connection, Exchange::REASON_PROTOCOL_ERROR);
        return;
    }

    SessionOutcome outcome;
    bool ran = false;
    try {
        connection->AddMessage();  // the hello read above
        CExchangeSession session(connection, *channel, local, m_options.session, m_interrupt);
        outcome = session.RunResponder(hello);
        ran = true;
    } catch (const std::exception& e) {
        LogPrintf(CONNECT, ERROR, "conn=%llu: session failed: %s",
                  static_cast<unsigned long long>(connection->GetId()), e.what());
    }
    channel->Close();
    if (ran) {
        Finish(connection, outcome);
    } else {
        Abandon(connection, Exchange::REASON_PROTOCOL_ERROR);
    }
}

void CConnectionLifecycle::Abandon(const std::shared_ptr<CConnection>& connection, const std::string& reason) {
    SessionOutcome outcome;
    outcome.reason = reason;
    outcome.state = connection->GetState() == ConnectionState::EXCHANGING ? ConnectionState::COMPLETED
                                                                          : ConnectionState::ABORTED;
    EndConnection(connection, outcome.state, reason);
    Finish(connection, outcome);
}

void CConnectionLifecycle::EndConnection(const std::shared_ptr<CConnection>& connection, ConnectionState state,
                                         const std::string& reason) {
    if (IsTerminalState(connection->GetState())) {
        return;
    }
    int64_t now = GetTime();
    if (connection->GetState() == ConnectionState::DISCOVERED) {
        connection->AdvanceTo(ConnectionState::HANDSHAKING, now);
    }
    connection->AdvanceTo(state, now);
    connection->SetReason(reason);
}

void CConnectionLifecycle::PruneCooldowns(int64_t now) {
    std::vector<CNodeSignature> expired;
    if (m_cooldowns.Prune(now, &expired) == 0 || !m_persistence) {
        return;
    }
    for (const CNodeSignature& node : expired) {
        if (!m_persistence->Erase(PersistKeys::Cooldown(node))) {
            LogPrintf(STORAGE, WARN, "Failed to erase expired cooldown for %s", node.GetHex().c_str());
        }
    }
    LogPrintf(CONNECT, DEBUG, "Pruned %zu expired cooldowns", expired.size());
}

void CConnectionLifecycle::TrimHistoryOnDisk(uint64_t newest_id) {
    if (newest_id <= m_options.history_on_disk) {
        return;
    }
    uint64_t oldest_kept = newest_id - m_options.history_on_disk + 1;
    // Ids finish out of order, so sweep the whole expired range rather than one key
    std::map<std::string, std::vector<uint8_t>> records;
    if (!m_persistence->ReadPrefix(PersistKeys::HISTORY_PREFIX, records)) {
        return;
    }
    for (const auto& record : records) {
        uint64_t id = 0;
        if (PersistKeys::ParseHistory(record.first, id) && id < oldest_kept) {
            m_persistence->Erase(record.first);
        }
    }
}

bool CConnectionLifecycle::PersistCooldown(const CNodeSignature& remote, int64_t ended_at) {
    if (!m_persistence) {
        return true;
    }
    CDataStream stream;
    stream.WriteInt64(ended_at);
    return m_persistence->Write(PersistKeys::Cooldown(remote), stream.GetData());
}

void CConnectionLifecycle::Finish(const std::shared_ptr<CConnection>& connection, const SessionOutcome& outcome) {
    if (!connection->MarkFinished()) {
        return;
    }
    // Sessions always end in a terminal state; keep the table consistent regardless
    EndConnection(connection, ConnectionState::ABORTED, outcome.reason);

    CConnectionSummary summary = connection->GetSummary();
    int64_t now = GetTime();

    PruneCooldowns(now);
    m_cooldowns.Record(summary.remote, now);
    if (!PersistCooldown(summary.remote, now)) {
        LogPrintf(STORAGE, ERROR, "Failed to persist cooldown for %s", summary.remote.GetHex().c_str());
    }
    if (m_persistence) {
        if (m_persistence->Write(PersistKeys::History(summary.nId), summary.Serialize())) {
            TrimHistoryOnDisk(summary.nId);
        } else {
            LogPrintf(STORAGE, ERROR, "Failed to persist history for conn=%llu",
                      static_cast<unsigned long long>(summary.nId));
        }
    }

    if (summary.state == ConnectionState::COMPLETED && !outcome.received.empty()) {
        try {
            std::vector<CLearningInsight> scaled = ScaleInsights(outcome.received, outcome.agreement.learning_rate);
            std::vector<CLearningInsight> accepted = m_gate.Filter(scaled, now);
            if (!accepted.empty() && !m_profileStore->ApplyInsights(accepted)) {
                LogPrintf(STORAGE, ERROR, "Profile store rejected %zu insights", accepted.size());
            }
            LogPrintf(CONNECT, DEBUG, "conn=%llu: applied %zu of %zu received insights",
                      static_cast<unsigned long long>(summary.nId), accepted.size(), outcome.received.size());
        } catch (const std::exception& e) {
            LogPrintf(STORAGE, ERROR, "conn=%llu: applying insights failed: %s",
                      static_cast<unsigned long long>(summary.nId), e.what());
        }
    }

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_active.erase(summary.nId);
        m_history.push_back(summary);
        if (m_history.size() > m_options.history_in_memory) {
            m_history.pop_front();
        }
    }
    m_cv.notify_all();

    LogPrintf(CONNECT, INFO, "%s", summary.ToString().c_str());
}

bool CConnectionLifecycle::SpawnWorker(std::function<void()> fn) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_shuttingDown) {
        return false;
    }
    ReapWorkersLocked();

    uint64_t worker = m_nextWorker++;
    m_workers.emplace(worker, std::thread([this, worker, fn]() {
        try {
            fn();
        } catch (const std::exception& e) {
            LogPrintf(CONNECT, ERROR, "Connection worker failed: %s", e.what());
        }
        std::lock_guard<std::mutex> lock(m_mutex);
        m_finishedWorkers.push_back(worker);
        m_cv.notify_all();
    }));
    return true;
}

void CConnectionLifecycle::ReapWorkersLocked() {
    // Finished workers no longer need m_mutex, so joining here cannot deadlock
    for (uint64_t worker : m_finishedWorkers) {
        auto it = m_workers.find(worker);
        if (it != m_workers.end()) {
            if (it->second.joinable()) {
                it->second.join();
            }
            m_workers.erase(it);
        }
    }
    m_finishedWorkers.clear();
}

std::vector<CConnectionSummary> CConnectionLifecycle::GetSnapshots() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<CConnectionSummary> result;
    for (const auto& entry : m_active) {
        result.push_back(entry.second->GetSummary());
    }
    return result;
}

std::vector<CConnectionSummary> CConnectionLifecycle::GetHistory() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return std::vector<CConnectionSummary>(m_history.begin(), m_history.end());
}

size_t CConnectionLifecycle::GetActiveCount() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_active.size();
}

size_t CConnectionLifecycle::GetPendingInbound() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_pendingInbound;
}

bool CConnectionLifecycle::HasConnectionTo(const CNodeSignature& remote) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    for (const auto& entry : m_active) {
        if (entry.second->GetRemote() == remote) {
            return true;
        }
    }
    return false;
}

bool CConnectionLifecycle::IsInCooldown(const CNodeSignature& remote, int64_t now) const {
    return m_cooldowns.IsInCooldown(remote, now);
}

bool CConnectionLifecycle::WaitForIdle(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(m_mutex);
    return m_cv.wait_for(lock, timeout, [this] {
        return m_active.empty() && m_finishedWorkers.size() == m_workers.size();
    });
}

void CConnectionLifecycle::Shutdown() {
    std::map<uint64_t, std::thread> workers;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_shuttingDown) {
            return;
        }
        m_shuttingDown = true;
        workers.swap(m_workers);
        m_finishedWorkers.clear();
    }

    // Sessions notice the interrupt within one receive slice and end with system_shutdown
    m_interrupt.Interrupt();
    for (auto& entry : workers) {
        if (entry.second.joinable()) {
            entry.second.join();
        }
    }

    std::vector<std::shared_ptr<CConnection>> leftover;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        for (const auto& entry : m_active) {
            leftover.push_back(entry.second);
        }
    }
    for (const auto& connection : leftover) {
        Abandon(connection, Exchange::REASON_SYSTEM_SHUTDOWN);
    }

    PruneCooldowns(GetTime());
    if (m_persistence) {
        PersistBatch batch;
        for (const auto& entry : m_cooldowns.GetEntries()) {
            CDataStream stream;
            stream.WriteInt64(entry.second);
            batch.emplace_back(PersistKeys::Cooldown(entry.first), stream.GetData());
        }
        if (!batch.empty() && !m_persistence->WriteBatch(batch)) {
            LogPrintf(STORAGE, ERROR, "Failed to flush %zu cooldown entries", batch.size());
        }
    }

    LogPrintf(CONNECT, INFO, "Connection lifecycle stopped");
}
