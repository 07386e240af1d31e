// Copyright (c) 2025 The Proxima Core developers
// Distributed under the MIT software license

#include <transport/lan.h>

#include <net/serialize.h>
#include <util/logging.h>
#include <util/time.h>

#include <cerrno>
#include <chrono>
#include <cstring>

namespace {
const uint8_t BEACON_MAGIC[4] = {'P', 'X', 'B', '1'};
// Listener wakes this often to notice Shutdown()
const int ACCEPT_POLL_MS = 500;
}

// CSocketChannel

CSocketChannel::CSocketChannel(std::unique_ptr<CSocket> socket)
    : m_socket(std::move(socket))
{
    if (m_socket) {
        m_peer = m_socket->GetRemote().ToString();
    } else {
        m_open = false;
    }
}

CSocketChannel::~CSocketChannel() {
    Close();
}

bool CSocketChannel::Send(const CNetMessage& msg) {
    if (!m_open) {
        return false;
    }
    std::vector<uint8_t> frame = msg.Serialize();
    std::lock_guard<std::mutex> lock(m_sendMutex);
    if (!m_socket->WriteAll(frame.data(), frame.size())) {
        LogPrintf(TRANSPORT, DEBUG, "Send to %s failed: %s", m_peer.c_str(),
                  m_socket->GetLastErrorString().c_str());
        m_open = false;
        return false;
    }
    return true;
}

bool CSocketChannel::Receive(CNetMessage& msg, int timeout_ms) {
    if (!m_open) {
        return false;
    }

    int ready = m_socket->WaitReadable(timeout_ms);
    if (ready <= 0) {
        if (ready < 0) {
            m_open = false;
        }
        return false;
    }

    // A frame that started arriving must complete within the step timeout
    const int frame_timeout = timeout_ms > 0 ? timeout_ms : 1000;

    std::vector<uint8_t> header_bytes(NetProtocol::HEADER_SIZE);
    if (!m_socket->ReadExact(header_bytes.data(), header_bytes.size(), frame_timeout)) {
        LogPrintf(TRANSPORT, DEBUG, "Channel %s closed: %s", m_peer.c_str(),
                  m_socket->GetLastErrorString().c_str());
        m_open = false;
        return false;
    }

    if (!CNetMessage::ParseHeader(header_bytes, msg.header) ||
        !msg.header.IsValid(NetProtocol::PROXIMA_MAGIC)) {
        LogPrintf(TRANSPORT, WARN, "Invalid frame header from %s (magic=0x%08x size=%u)",
                  m_peer.c_str(), msg.header.magic, msg.header.payload_size);
        m_open = false;
        return false;
    }

    msg.payload.assign(msg.header.payload_size, 0);
    if (msg.header.payload_size > 0 &&
        !m_socket->ReadExact(msg.payload.data(), msg.payload.size(), frame_timeout)) {
        m_open = false;
        return false;
    }

    if (!msg.IsValid()) {
        LogPrintf(TRANSPORT, WARN, "Checksum mismatch on '%s' from %s",
                  msg.GetCommand().c_str(), m_peer.c_str());
        return false;
    }
    return true;
}

void CSocketChannel::Close() {
    m_open = false;
    std::lock_guard<std::mutex> lock(m_sendMutex);
    if (m_socket) {
        m_socket->Close();
    }
}

bool CSocketChannel::IsOpen() const {
    return m_open;
}

// CLanTransport

CLanTransport::CLanTransport(uint16_t port, const std::string& broadcast_address)
    : m_port(port), m_broadcastAddress(broadcast_address)
{
}

CLanTransport::~CLanTransport() {
    Shutdown();
}

TransportStatus CLanTransport::CheckAvailability() {
    if (m_checked) {
        return m_status;
    }
    m_checked = true;

    if (!m_udp.BindBeacon(m_port)) {
        int err = m_udp.GetLastError();
        LogPrintf(TRANSPORT, WARN, "LAN: cannot bind UDP port %u: %s", m_port, strerror(err));
        m_status = (err == EACCES || err == EPERM) ? TransportStatus::PERMISSION_DENIED
                                                   : TransportStatus::UNSUPPORTED;
        m_udp.Close();
        return m_status;
    }

    if (!m_listener.ListenStream(m_port)) {
        int err = m_listener.GetLastError();
        LogPrintf(TRANSPORT, WARN, "LAN: cannot listen on TCP port %u: %s", m_port, strerror(err));
        m_status = (err == EACCES || err == EPERM) ? TransportStatus::PERMISSION_DENIED
                                                   : TransportStatus::UNSUPPORTED;
        m_udp.Close();
        m_listener.Close();
        return m_status;
    }

    m_status = TransportStatus::AVAILABLE;
    m_running = true;
    m_beaconThread = std::thread(&CLanTransport::BeaconThread, this);
    m_listenThread = std::thread(&CLanTransport::ListenThread, this);

    LogPrintf(TRANSPORT, INFO, "LAN transport listening on port %u", m_port);
    return m_status;
}

std::vector<uint8_t> CLanTransport::BuildBeacon(const CNodeSignature& signature, uint16_t tcp_port,
                                                const std::vector<uint8_t>& payload) {
    CDataStream stream;
    stream.write(BEACON_MAGIC, sizeof(BEACON_MAGIC));
    stream.write(signature.begin(), CNodeSignature::SIZE);
    stream.WriteUint16(tcp_port);
    stream.WriteBytes(payload);
    return stream.GetData();
}

bool CLanTransport::ParseBeacon(const std::vector<uint8_t>& data, CNodeSignature& signature,
                                uint16_t& tcp_port, std::vector<uint8_t>& payload) {
    try {
        CDataStream stream(data);
        uint8_t magic[4];
        stream.read(magic, sizeof(magic));
        if (memcmp(magic, BEACON_MAGIC, sizeof(magic)) != 0) {
            return false;
        }
        stream.read(signature.data, CNodeSignature::SIZE);
        tcp_port = stream.ReadUint16();
        payload = stream.ReadBytes(MAX_BEACON_SIZE);
        return stream.eof();
    } catch (const CSerializeError&) {
        return false;
    }
}

bool CLanTransport::Advertise(const CNodeSignature& signature, const std::vector<uint8_t>& payload,
                              int64_t ttl_seconds, AdvertHandle& handle) {
    if (m_status != TransportStatus::AVAILABLE || ttl_seconds <= 0) {
        return false;
    }
    std::vector<uint8_t> beacon = BuildBeacon(signature, m_port, payload);
    if (beacon.size() > MAX_BEACON_SIZE) {
        LogPrintf(TRANSPORT, ERROR, "LAN beacon too large (%zu bytes)", beacon.size());
        return false;
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    m_beacon = std::move(beacon);
    m_beaconExpiresMillis = GetTimeMillis() + ttl_seconds * 1000;
    handle = m_nextHandle++;
    m_activeHandle = handle;
    m_cv.notify_all();
    return true;
}

void CLanTransport::StopAdvertising(AdvertHandle handle) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (handle != m_activeHandle) {
        return;
    }
    m_activeHandle = 0;
    m_beacon.clear();
    m_beaconExpiresMillis = 0;
}

void CLanTransport::BeaconThread() {
    CEndpoint broadcast;
    broadcast.host = m_broadcastAddress;
    broadcast.port = m_port;

    std::unique_lock<std::mutex> lock(m_mutex);
    while (m_running) {
        if (!m_beacon.empty() && GetTimeMillis() < m_beaconExpiresMillis) {
            std::vector<uint8_t> beacon = m_beacon;
            lock.unlock();
            if (!m_udp.SendDatagram(broadcast, beacon.data(), beacon.size())) {
                LogPrintf(TRANSPORT, DEBUG, "LAN beacon send failed: %s",
                          m_udp.GetLastErrorString().c_str());
            }
            lock.lock();
        }
        m_cv.wait_for(lock, std::chrono::milliseconds(BEACON_INTERVAL_MS),
                      [this] { return !m_running; });
    }
}

bool CLanTransport::StartScan() {
    if (m_status != TransportStatus::AVAILABLE) {
        return false;
    }
    m_scanning = true;
    return true;
}

void CLanTransport::StopScan() {
    m_scanning = false;
}

bool CLanTransport::NextSighting(CSighting& out, int timeout_ms) {
    if (!m_scanning) {
        return false;
    }

    std::vector<uint8_t> buffer(MAX_BEACON_SIZE + 64);
    CEndpoint from;
    int received = m_udp.ReceiveDatagram(buffer.data(), buffer.size(), from, timeout_ms);
    if (received <= 0 || !m_scanning) {
        return false;
    }
    buffer.resize(static_cast<size_t>(received));

    uint16_t tcp_port = 0;
    if (!ParseBeacon(buffer, out.nodeSignature, tcp_port, out.payload)) {
        // Unknown datagram on our port; pass it through so discovery can count it
        out.nodeSignature = CNodeSignature();
        out.payload = buffer;
        tcp_port = from.port;
    }
    from.port = tcp_port;
    out.address = from.ToString();
    out.nRssi = LAN_RSSI;
    return true;
}

std::unique_ptr<CMessageChannel> CLanTransport::OpenChannel(const std::string& address, int timeout_ms) {
    CEndpoint remote;
    if (!ParseEndpoint(address, remote)) {
        LogPrintf(TRANSPORT, WARN, "LAN: bad address %s", address.c_str());
        return nullptr;
    }

    int error = 0;
    std::unique_ptr<CSocket> socket = CSocket::ConnectStream(remote, timeout_ms, error);
    if (!socket) {
        LogPrintf(TRANSPORT, INFO, "LAN: connect to %s failed: %s", address.c_str(), strerror(error));
        return nullptr;
    }
    return std::unique_ptr<CMessageChannel>(new CSocketChannel(std::move(socket)));
}

void CLanTransport::SetInboundHandler(InboundHandler handler) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_inboundHandler = std::move(handler);
}

void CLanTransport::ListenThread() {
    while (m_running) {
        std::unique_ptr<CSocket> client = m_listener.AcceptFor(ACCEPT_POLL_MS);
        if (!client) {
            continue;
        }

        InboundHandler handler;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            handler = m_inboundHandler;
        }
        if (!handler) {
            client->Close();
            continue;
        }
        LogPrintf(TRANSPORT, DEBUG, "LAN: inbound channel from %s", client->GetRemote().ToString().c_str());
        handler(std::unique_ptr<CMessageChannel>(new CSocketChannel(std::move(client))));
    }
}

void CLanTransport::Shutdown() {
    m_scanning = false;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_running = false;
        m_inboundHandler = nullptr;
        m_cv.notify_all();
    }
    if (m_beaconThread.joinable()) {
        m_beaconThread.join();
    }
    if (m_listenThread.joinable()) {
        m_listenThread.join();
    }
    m_listener.Close();
    m_udp.Close();
}
