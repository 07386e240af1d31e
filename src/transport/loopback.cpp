// Copyright (c) 2025 The Proxima Core developers
// Distributed under the MIT software license

#include <transport/loopback.h>

#include <util/logging.h>
#include <util/time.h>

#include <chrono>
#include <stdexcept>
#include <vector>

namespace {

// Upper bound on queued sightings per scanning endpoint
const size_t MAX_PENDING_SIGHTINGS = 256;

struct PipeState {
    std::mutex mutex;
    std::condition_variable cv;
    std::deque<CNetMessage> inbox[2];
    bool closed{false};
};

class CPipeChannel : public CMessageChannel {
public:
    CPipeChannel(std::shared_ptr<PipeState> state, int side, const std::string& peer)
        : m_state(std::move(state)), m_side(side), m_peer(peer) {}

    ~CPipeChannel() override { Close(); }

    bool Send(const CNetMessage& msg) override {
        std::lock_guard<std::mutex> lock(m_state->mutex);
        if (m_state->closed) {
            return false;
        }
        m_state->inbox[1 - m_side].push_back(msg);
        m_state->cv.notify_all();
        return true;
    }

    bool Receive(CNetMessage& msg, int timeout_ms) override {
        std::unique_lock<std::mutex> lock(m_state->mutex);
        std::deque<CNetMessage>& inbox = m_state->inbox[m_side];
        m_state->cv.wait_for(lock, std::chrono::milliseconds(timeout_ms),
                             [&] { return !inbox.empty() || m_state->closed; });
        // Messages sent before a close are still delivered
        if (inbox.empty()) {
            return false;
        }
        msg = std::move(inbox.front());
        inbox.pop_front();
        return msg.IsValid();
    }

    void Close() override {
        std::lock_guard<std::mutex> lock(m_state->mutex);
        m_state->closed = true;
        m_state->cv.notify_all();
    }

    bool IsOpen() const override {
        std::lock_guard<std::mutex> lock(m_state->mutex);
        return !m_state->closed;
    }

    std::string GetPeerAddress() const override { return m_peer; }

private:
    std::shared_ptr<PipeState> m_state;
    const int m_side;
    const std::string m_peer;
};

} // namespace

std::pair<std::unique_ptr<CMessageChannel>, std::unique_ptr<CMessageChannel>>
CreateChannelPair(const std::string& address_a, const std::string& address_b) {
    auto state = std::make_shared<PipeState>();
    // Side A talks to B and vice versa
    std::unique_ptr<CMessageChannel> a(new CPipeChannel(state, 0, address_b));
    std::unique_ptr<CMessageChannel> b(new CPipeChannel(state, 1, address_a));
    return std::make_pair(std::move(a), std::move(b));
}

// CLoopbackMedium

bool CLoopbackMedium::Register(CLoopbackTransport* endpoint) {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_endpoints.emplace(endpoint->GetAddress(), endpoint).second;
}

void CLoopbackMedium::Unregister(CLoopbackTransport* endpoint) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_endpoints.find(endpoint->GetAddress());
    if (it != m_endpoints.end() && it->second == endpoint) {
        m_endpoints.erase(it);
    }
    m_adverts.erase(endpoint->GetAddress());
}

size_t CLoopbackMedium::GetEndpointCount() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_endpoints.size();
}

void CLoopbackMedium::Publish(CLoopbackTransport* from, const CSighting& sighting, int64_t ttl_seconds) {
    std::lock_guard<std::mutex> lock(m_mutex);
    Advert advert;
    advert.sighting = sighting;
    advert.nExpiresMillis = GetTimeMillis() + ttl_seconds * 1000;
    m_adverts[from->GetAddress()] = advert;

    for (const auto& entry : m_endpoints) {
        if (entry.second != from) {
            entry.second->Deliver(sighting);
        }
    }
}

void CLoopbackMedium::Withdraw(CLoopbackTransport* from) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_adverts.erase(from->GetAddress());
}

void CLoopbackMedium::ReplayAdverts(CLoopbackTransport* to) {
    std::lock_guard<std::mutex> lock(m_mutex);
    int64_t now = GetTimeMillis();
    for (auto it = m_adverts.begin(); it != m_adverts.end();) {
        if (it->second.nExpiresMillis <= now) {
            it = m_adverts.erase(it);
            continue;
        }
        if (it->first != to->GetAddress()) {
            to->Deliver(it->second.sighting);
        }
        ++it;
    }
}

bool CLoopbackMedium::InjectSighting(const std::string& address, const CSighting& sighting) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_endpoints.find(address);
    if (it == m_endpoints.end()) {
        return false;
    }
    it->second->Deliver(sighting);
    return true;
}

std::unique_ptr<CMessageChannel> CLoopbackMedium::Connect(CLoopbackTransport* from, const std::string& address) {
    auto channels = CreateChannelPair(from->GetAddress(), address);

    CLoopbackTransport* target = nullptr;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_endpoints.find(address);
        if (it == m_endpoints.end()) {
            return nullptr;
        }
        target = it->second;
    }

    // The handler runs outside the medium lock; it may open channels itself
    if (!target->AcceptInbound(std::move(channels.second))) {
        return nullptr;
    }
    return std::move(channels.first);
}

// CLoopbackTransport

CLoopbackTransport::CLoopbackTransport(std::shared_ptr<CLoopbackMedium> medium, const std::string& address,
                                       int rssi, WireFormat format)
    : m_medium(std::move(medium)), m_address(address), m_rssi(rssi), m_format(format)
{
    if (!m_medium) {
        throw std::invalid_argument("CLoopbackTransport: null medium");
    }
    m_registered = m_medium->Register(this);
    if (!m_registered) {
        LogPrintf(TRANSPORT, WARN, "Loopback address %s already in use", m_address.c_str());
    }
}

CLoopbackTransport::~CLoopbackTransport() {
    Shutdown();
}

TransportStatus CLoopbackTransport::CheckAvailability() {
    if (m_permissionDenied) {
        return TransportStatus::PERMISSION_DENIED;
    }
    return m_registered ? TransportStatus::AVAILABLE : TransportStatus::UNSUPPORTED;
}

bool CLoopbackTransport::Advertise(const CNodeSignature& signature, const std::vector<uint8_t>& payload,
                                   int64_t ttl_seconds, AdvertHandle& handle) {
    if (!m_registered || ttl_seconds <= 0) {
        return false;
    }

    CSighting sighting;
    sighting.nodeSignature = signature;
    sighting.address = m_address;
    sighting.payload = payload;
    sighting.nRssi = m_rssi;

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        handle = m_nextHandle++;
        m_activeHandle = handle;
    }
    m_medium->Publish(this, sighting, ttl_seconds);
    return true;
}

void CLoopbackTransport::StopAdvertising(AdvertHandle handle) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (handle != m_activeHandle) {
            return;  // Superseded by a newer advertisement
        }
        m_activeHandle = 0;
    }
    m_medium->Withdraw(this);
}

bool CLoopbackTransport::StartScan() {
    if (!m_registered) {
        return false;
    }
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_scanning) {
            return true;
        }
        m_scanning = true;
        m_sightings.clear();
    }
    m_medium->ReplayAdverts(this);
    return true;
}

void CLoopbackTransport::StopScan() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_scanning = false;
    m_sightings.clear();
    m_cv.notify_all();
}

void CLoopbackTransport::Deliver(const CSighting& sighting) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_scanning) {
        return;
    }
    if (m_sightings.size() >= MAX_PENDING_SIGHTINGS) {
        m_sightings.pop_front();
    }
    m_sightings.push_back(sighting);
    m_cv.notify_all();
}

bool CLoopbackTransport::NextSighting(CSighting& out, int timeout_ms) {
    std::unique_lock<std::mutex> lock(m_mutex);
    m_cv.wait_for(lock, std::chrono::milliseconds(timeout_ms),
                  [this] { return !m_sightings.empty() || !m_scanning; });
    if (!m_scanning || m_sightings.empty()) {
        return false;
    }
    out = std::move(m_sightings.front());
    m_sightings.pop_front();
    return true;
}

std::unique_ptr<CMessageChannel> CLoopbackTransport::OpenChannel(const std::string& address, int) {
    if (!m_registered) {
        return nullptr;
    }
    return m_medium->Connect(this, address);
}

void CLoopbackTransport::SetInboundHandler(InboundHandler handler) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_inboundHandler = std::move(handler);
}

bool CLoopbackTransport::AcceptInbound(std::unique_ptr<CMessageChannel> channel) {
    InboundHandler handler;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        handler = m_inboundHandler;
    }
    if (!handler) {
        return false;
    }
    handler(std::move(channel));
    return true;
}

void CLoopbackTransport::Shutdown() {
    StopScan();
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_inboundHandler = nullptr;
    }
    if (m_registered) {
        m_medium->Unregister(this);
        m_registered = false;
    }
}
