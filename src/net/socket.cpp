// Copyright (c) 2025 The Proxima Core developers
// Distributed under the MIT software license

#include <net/socket.h>

#include <util/time.h>

#include <arpa/inet.h>
#include <errno.h>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cstring>

namespace {

bool ToSockaddr(const CEndpoint& endpoint, sockaddr_in& addr) {
    memset(&addr, 0, sizeof(addr));
    addr.sin_family = AF_INET;
    addr.sin_port = htons(endpoint.port);
    if (inet_pton(AF_INET, endpoint.host.c_str(), &addr.sin_addr) == 1) {
        return true;
    }

    addrinfo hints;
    memset(&hints, 0, sizeof(hints));
    hints.ai_family = AF_INET;
    addrinfo* found = nullptr;
    if (getaddrinfo(endpoint.host.c_str(), nullptr, &hints, &found) != 0 || found == nullptr) {
        return false;
    }
    addr.sin_addr = reinterpret_cast<sockaddr_in*>(found->ai_addr)->sin_addr;
    freeaddrinfo(found);
    return true;
}

CEndpoint FromSockaddr(const sockaddr_in& addr) {
    char text[INET_ADDRSTRLEN] = {0};
    inet_ntop(AF_INET, &addr.sin_addr, text, sizeof(text));
    CEndpoint endpoint;
    endpoint.host = text;
    endpoint.port = ntohs(addr.sin_port);
    return endpoint;
}

int PollOne(int fd, short events, int timeout_ms) {
    pollfd pfd;
    pfd.fd = fd;
    pfd.events = events;
    pfd.revents = 0;
    int result = poll(&pfd, 1, timeout_ms);
    if (result < 0) {
        return errno == EINTR ? 0 : -1;
    }
    if (result > 0 && (pfd.revents & (POLLERR | POLLNVAL))) {
        return -1;
    }
    return result > 0 ? 1 : 0;
}

bool SetFlag(int fd, int level, int option) {
    int on = 1;
    return setsockopt(fd, level, option, &on, sizeof(on)) == 0;
}

} // namespace

bool ParseEndpoint(const std::string& address, CEndpoint& out) {
    size_t colon = address.rfind(':');
    if (colon == std::string::npos || colon == 0 || colon + 1 >= address.size()) {
        return false;
    }
    std::string digits = address.substr(colon + 1);
    unsigned long value = 0;
    for (char c : digits) {
        if (c < '0' || c > '9') {
            return false;
        }
        value = value * 10 + static_cast<unsigned long>(c - '0');
        if (value > 65535) {
            return false;
        }
    }
    if (value == 0) {
        return false;
    }
    out.host = address.substr(0, colon);
    out.port = static_cast<uint16_t>(value);
    return true;
}

CSocket::~CSocket() {
    Close();
}

bool CSocket::Fail() {
    m_lastError = errno;
    return false;
}

std::unique_ptr<CSocket> CSocket::ConnectStream(const CEndpoint& remote, int timeout_ms, int& error) {
    error = 0;
    sockaddr_in addr;
    if (!ToSockaddr(remote, addr)) {
        error = EHOSTUNREACH;
        return nullptr;
    }

    int fd = socket(AF_INET, SOCK_STREAM | SOCK_NONBLOCK, IPPROTO_TCP);
    if (fd < 0) {
        error = errno;
        return nullptr;
    }
    std::unique_ptr<CSocket> sock(new CSocket(fd));
    sock->m_remote = remote;

    if (connect(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        if (errno != EINPROGRESS) {
            error = errno;
            return nullptr;
        }
        if (PollOne(fd, POLLOUT, timeout_ms) <= 0) {
            error = ETIMEDOUT;
            return nullptr;
        }
        int so_error = 0;
        socklen_t len = sizeof(so_error);
        if (getsockopt(fd, SOL_SOCKET, SO_ERROR, &so_error, &len) != 0 || so_error != 0) {
            error = so_error != 0 ? so_error : errno;
            return nullptr;
        }
    }
    SetFlag(fd, IPPROTO_TCP, TCP_NODELAY);
    return sock;
}

bool CSocket::Open(int type, uint16_t port) {
    Close();
    m_fd = socket(AF_INET, type | SOCK_NONBLOCK, 0);
    if (m_fd < 0) {
        return Fail();
    }
    SetFlag(m_fd, SOL_SOCKET, SO_REUSEADDR);

    sockaddr_in addr;
    memset(&addr, 0, sizeof(addr));
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_ANY);
    addr.sin_port = htons(port);
    if (bind(m_fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        Fail();
        Close();
        return false;
    }
    return true;
}

bool CSocket::ListenStream(uint16_t port, int backlog) {
    if (!Open(SOCK_STREAM, port)) {
        return false;
    }
    if (listen(m_fd, backlog) < 0) {
        Fail();
        Close();
        return false;
    }
    return true;
}

bool CSocket::BindBeacon(uint16_t port) {
    if (!Open(SOCK_DGRAM, port)) {
        return false;
    }
    if (!SetFlag(m_fd, SOL_SOCKET, SO_BROADCAST)) {
        Fail();
        Close();
        return false;
    }
    return true;
}

std::unique_ptr<CSocket> CSocket::AcceptFor(int timeout_ms) {
    if (WaitReadable(timeout_ms) <= 0) {
        return nullptr;
    }
    sockaddr_in addr;
    socklen_t len = sizeof(addr);
    int fd = accept4(m_fd, reinterpret_cast<sockaddr*>(&addr), &len, SOCK_NONBLOCK);
    if (fd < 0) {
        Fail();
        return nullptr;
    }
    std::unique_ptr<CSocket> client(new CSocket(fd));
    client->m_remote = FromSockaddr(addr);
    SetFlag(fd, IPPROTO_TCP, TCP_NODELAY);
    return client;
}

bool CSocket::WriteAll(const uint8_t* data, size_t len) {
    while (len > 0) {
        if (!IsOpen()) {
            return false;
        }
        ssize_t sent = send(m_fd, data, len, MSG_NOSIGNAL);
        if (sent < 0) {
            if (errno == EINTR) {
                continue;
            }
            if (errno == EAGAIN || errno == EWOULDBLOCK) {
                if (PollOne(m_fd, POLLOUT, 1000) < 0) {
                    return Fail();
                }
                continue;
            }
            return Fail();
        }
        data += sent;
        len -= static_cast<size_t>(sent);
    }
    return true;
}

bool CSocket::ReadExact(uint8_t* buffer, size_t len, int timeout_ms) {
    const int64_t deadline = GetTimeMillis() + timeout_ms;
    while (len > 0) {
        int64_t remaining = deadline - GetTimeMillis();
        if (remaining <= 0 || !IsOpen()) {
            m_lastError = ETIMEDOUT;
            return false;
        }
        int ready = PollOne(m_fd, POLLIN, static_cast<int>(remaining));
        if (ready < 0) {
            return Fail();
        }
        if (ready == 0) {
            continue;
        }
        ssize_t got = recv(m_fd, buffer, len, 0);
        if (got == 0) {
            m_lastError = ECONNRESET;
            return false;
        }
        if (got < 0) {
            if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK) {
                continue;
            }
            return Fail();
        }
        buffer += got;
        len -= static_cast<size_t>(got);
    }
    return true;
}

bool CSocket::SendDatagram(const CEndpoint& to, const uint8_t* data, size_t len) {
    sockaddr_in addr;
    if (!IsOpen() || !ToSockaddr(to, addr)) {
        m_lastError = EHOSTUNREACH;
        return false;
    }
    if (sendto(m_fd, data, len, 0, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        return Fail();
    }
    return true;
}

int CSocket::ReceiveDatagram(uint8_t* buffer, size_t len, CEndpoint& from, int timeout_ms) {
    int ready = WaitReadable(timeout_ms);
    if (ready <= 0) {
        return ready;
    }
    sockaddr_in addr;
    socklen_t addr_len = sizeof(addr);
    ssize_t got = recvfrom(m_fd, buffer, len, 0, reinterpret_cast<sockaddr*>(&addr), &addr_len);
    if (got < 0) {
        if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) {
            return 0;
        }
        Fail();
        return -1;
    }
    from = FromSockaddr(addr);
    return static_cast<int>(got);
}

int CSocket::WaitReadable(int timeout_ms) {
    if (!IsOpen()) {
        return -1;
    }
    int ready = PollOne(m_fd, POLLIN, timeout_ms);
    if (ready < 0) {
        Fail();
    }
    return ready;
}

void CSocket::Close() {
    if (m_fd >= 0) {
        shutdown(m_fd, SHUT_RDWR);
        close(m_fd);
        m_fd = -1;
    }
}

uint16_t CSocket::GetLocalPort() const {
    sockaddr_in addr;
    socklen_t len = sizeof(addr);
    if (!IsOpen() || getsockname(m_fd, reinterpret_cast<sockaddr*>(&addr), &len) < 0) {
        return 0;
    }
    return ntohs(addr.sin_port);
}

std::string CSocket::GetLastErrorString() const {
    return strerror(m_lastError);
}
