// Copyright (c) 2025 The Proxima Core developers
// Distributed under the MIT software license

#ifndef PROXIMA_CONNECTION_CONNECTION_H
#define PROXIMA_CONNECTION_CONNECTION_H

#include <compatibility/depth.h>
#include <primitives/nodesig.h>

#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

/**
 * Connection states. Transitions only move forward:
 *
 *   DISCOVERED -> HANDSHAKING -> ACTIVE -> EXCHANGING -> COMPLETED
 *
 * ABORTED can be entered from any non-terminal state after DISCOVERED; a
 * connection that fails before its handshake still passes HANDSHAKING.
 * COMPLETED is only reachable from EXCHANGING.
 */
enum class ConnectionState : uint8_t {
    DISCOVERED = 0,
    HANDSHAKING = 1,
    ACTIVE = 2,
    EXCHANGING = 3,
    COMPLETED = 4,
    ABORTED = 5,
};

const char* ConnectionStateName(ConnectionState state);
bool IsTerminalState(ConnectionState state);

enum class ConnectionDirection : uint8_t {
    OUTBOUND = 0,
    INBOUND = 1,
};

const char* ConnectionDirectionName(ConnectionDirection direction);

/**
 * CConnectionSummary - read-only snapshot of a connection, handed to the
 * presentation layer and appended to history when the connection ends.
 */
struct CConnectionSummary {
    uint64_t nId{0};
    CNodeSignature remote;
    ConnectionDirection direction{ConnectionDirection::OUTBOUND};
    ConnectionState state{ConnectionState::DISCOVERED};
    std::string reason;
    double localScore{0.0};
    double desiredLocal{0.0};
    double desiredRemote{0.0};
    double effectiveDepth{0.0};
    compatibility::DepthTier effectiveTier{compatibility::DepthTier::SURFACE};
    uint32_t nInsightsSent{0};
    uint32_t nInsightsReceived{0};
    uint32_t nMessages{0};
    int64_t nCreated{0};
    int64_t nEstablished{0};
    int64_t nCompleted{0};
    std::vector<ConnectionState> vStates;   // every state entered, in order

    int64_t GetDuration() const;
    std::string ToString() const;

    /** History record encoding */
    std::vector<uint8_t> Serialize() const;
    static bool Deserialize(const std::vector<uint8_t>& data, CConnectionSummary& out);
};

/**
 * CConnection - the unit of orchestration
 *
 * Only the lifecycle manager and the session it runs mutate a connection.
 * All accessors are thread-safe.
 */
class CConnection {
public:
    CConnection(uint64_t id, const CNodeSignature& remote, ConnectionDirection direction, int64_t now);

    CConnection(const CConnection&) = delete;
    CConnection& operator=(const CConnection&) = delete;

    uint64_t GetId() const { return m_id; }
    ConnectionDirection GetDirection() const { return m_direction; }
    CNodeSignature GetRemote() const;
    ConnectionState GetState() const;
    std::string GetReason() const;

    /**
     * Move to a later state.
     * @return false (state unchanged) if the move would go backwards,
     *         skip a step, leave a terminal state, or complete before exchanging
     */
    bool AdvanceTo(ConnectionState next, int64_t now);

    /** Every state this connection has been in, in order */
    std::vector<ConnectionState> GetStateHistory() const;

    void SetReason(const std::string& reason);
    void RecordCompatibility(double local_score, const compatibility::DepthAgreement& agreement);
    void AddInsightsSent(uint32_t count);
    void AddInsightsReceived(uint32_t count);
    void AddMessage();

    CConnectionSummary GetSummary() const;

    /** True exactly once; guards the end-of-connection bookkeeping */
    bool MarkFinished();

private:
    const uint64_t m_id;
    const ConnectionDirection m_direction;

    mutable std::mutex m_mutex;
    CConnectionSummary m_summary;
    std::vector<ConnectionState> m_history;
    bool m_finished{false};
};

#endif // PROXIMA_CONNECTION_CONNECTION_H
