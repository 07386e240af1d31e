// Copyright (c) 2025 The Proxima Core developers
// Distributed under the MIT software license

#ifndef PROXIMA_NET_SOCKET_H
#define PROXIMA_NET_SOCKET_H

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>

/** IPv4 host and port, as carried in LAN addresses */
struct CEndpoint {
    std::string host;
    uint16_t port{0};

    std::string ToString() const { return host + ":" + std::to_string(port); }
};

/**
 * CSocket - IPv4 socket used by the LAN transport
 *
 * A stream socket carries one exchange channel, a datagram socket carries
 * discovery beacons. Every blocking call takes a timeout so the caller's
 * step deadline holds. The errno of the last failed call is kept for
 * logging and for classifying bind failures.
 */
class CSocket {
public:
    CSocket() = default;
    ~CSocket();

    CSocket(const CSocket&) = delete;
    CSocket& operator=(const CSocket&) = delete;

    /** Stream socket connected to remote within timeout_ms */
    static std::unique_ptr<CSocket> ConnectStream(const CEndpoint& remote, int timeout_ms, int& error);

    /** Listening stream socket on every interface */
    bool ListenStream(uint16_t port, int backlog = 8);
    /** Broadcast-capable datagram socket on every interface */
    bool BindBeacon(uint16_t port);

    /** Next pending connection, null on timeout or error */
    std::unique_ptr<CSocket> AcceptFor(int timeout_ms);

    /** Write every byte or fail */
    bool WriteAll(const uint8_t* data, size_t len);
    /** Read exactly len bytes; fails if the deadline passes first */
    bool ReadExact(uint8_t* buffer, size_t len, int timeout_ms);

    bool SendDatagram(const CEndpoint& to, const uint8_t* data, size_t len);
    /** @return bytes received, 0 on timeout, -1 on error */
    int ReceiveDatagram(uint8_t* buffer, size_t len, CEndpoint& from, int timeout_ms);

    /**
     * Block until readable
     * @return 1 readable, 0 timeout, -1 error
     */
    int WaitReadable(int timeout_ms);

    void Close();

    bool IsOpen() const { return m_fd >= 0; }
    const CEndpoint& GetRemote() const { return m_remote; }
    /** Bound port, useful after binding port 0 */
    uint16_t GetLocalPort() const;
    int GetLastError() const { return m_lastError; }
    std::string GetLastErrorString() const;

private:
    explicit CSocket(int fd) : m_fd(fd) {}

    bool Open(int type, uint16_t port);
    bool Fail();

    int m_fd{-1};
    int m_lastError{0};
    CEndpoint m_remote;
};

/** Resolve and split "host:port"; false if malformed */
bool ParseEndpoint(const std::string& address, CEndpoint& out);

#endif // PROXIMA_NET_SOCKET_H
