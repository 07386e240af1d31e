// Copyright (c) 2025 The Proxima Core developers
// Distributed under the MIT software license

#ifndef PROXIMA_NET_SERIALIZE_H
#define PROXIMA_NET_SERIALIZE_H

#include <net/protocol.h>

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

/** Thrown by CDataStream when input is truncated or a length prefix is out of bounds */
class CSerializeError : public std::runtime_error {
public:
    explicit CSerializeError(const std::string& what) : std::runtime_error(what) {}
};

/**
 * CDataStream - little-endian binary buffer
 *
 * Used for the compact fingerprint form, exchange message payloads, LAN
 * beacons and persisted records. Decoders of untrusted bytes catch
 * CSerializeError and report a typed failure.
 */
class CDataStream {
public:
    CDataStream() = default;
    explicit CDataStream(std::vector<uint8_t> bytes) : m_data(std::move(bytes)) {}

    size_t size() const { return m_data.size(); }
    bool eof() const { return m_pos >= m_data.size(); }
    size_t remaining() const { return m_pos < m_data.size() ? m_data.size() - m_pos : 0; }
    const std::vector<uint8_t>& GetData() const { return m_data; }

    void write(const uint8_t* src, size_t len) { m_data.insert(m_data.end(), src, src + len); }
    void WriteUint8(uint8_t value) { m_data.push_back(value); }
    void WriteUint16(uint16_t value) { WriteLE(value, 2); }
    void WriteUint32(uint32_t value) { WriteLE(value, 4); }
    void WriteUint64(uint64_t value) { WriteLE(value, 8); }
    void WriteInt16(int16_t value) { WriteLE(static_cast<uint16_t>(value), 2); }
    void WriteInt64(int64_t value) { WriteLE(static_cast<uint64_t>(value), 8); }
    /** 1, 3, 5 or 9 bytes depending on magnitude */
    void WriteCompactSize(uint64_t value);
    void WriteString(const std::string& str);
    void WriteBytes(const std::vector<uint8_t>& bytes);

    void read(uint8_t* dst, size_t len);
    uint8_t ReadUint8();
    uint16_t ReadUint16() { return static_cast<uint16_t>(ReadLE(2)); }
    uint32_t ReadUint32() { return static_cast<uint32_t>(ReadLE(4)); }
    uint64_t ReadUint64() { return ReadLE(8); }
    int16_t ReadInt16() { return static_cast<int16_t>(ReadLE(2)); }
    int64_t ReadInt64() { return static_cast<int64_t>(ReadLE(8)); }
    uint64_t ReadCompactSize();
    std::string ReadString(size_t max_len = 1024);
    std::vector<uint8_t> ReadBytes(size_t max_len);

private:
    void WriteLE(uint64_t value, size_t width);
    uint64_t ReadLE(size_t width);
    void Require(size_t len) const;

    std::vector<uint8_t> m_data;
    size_t m_pos{0};
};

/** First 4 bytes of SHA3-256(SHA3-256(payload)), little-endian */
uint32_t FrameChecksum(const std::vector<uint8_t>& payload);

/**
 * CNetMessage - exchange message as framed on a channel
 *
 * Frame: magic (u32) | command (12, NUL padded) | payload size (u32) |
 * checksum (u32) | payload
 */
class CNetMessage {
public:
    NetProtocol::CMessageHeader header;
    std::vector<uint8_t> payload;

    CNetMessage() = default;
    CNetMessage(const std::string& command, std::vector<uint8_t> payload_in);

    std::string GetCommand() const { return header.GetCommand(); }

    std::vector<uint8_t> Serialize() const;

    /** Decode the fixed-size header; false if too short */
    static bool ParseHeader(const std::vector<uint8_t>& bytes, NetProtocol::CMessageHeader& out);

    /** Header is sane and the checksum matches the payload */
    bool IsValid() const;
};

#endif // PROXIMA_NET_SERIALIZE_H
