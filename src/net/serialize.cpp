// Copyright (c) 2025 The Proxima Core developers
// Distributed under the MIT software license

#include <net/serialize.h>

#include <crypto/sha3.h>

#include <cstring>

void CDataStream::Require(size_t len) const {
    if (len > remaining()) {
        throw CSerializeError("read past end (" + std::to_string(len) + " wanted, " +
                              std::to_string(remaining()) + " left)");
    }
}

void CDataStream::WriteLE(uint64_t value, size_t width) {
    for (size_t i = 0; i < width; i++) {
        m_data.push_back(static_cast<uint8_t>(value >> (8 * i)));
    }
}

uint64_t CDataStream::ReadLE(size_t width) {
    Require(width);
    uint64_t value = 0;
    for (size_t i = 0; i < width; i++) {
        value |= static_cast<uint64_t>(m_data[m_pos + i]) << (8 * i);
    }
    m_pos += width;
    return value;
}

void CDataStream::WriteCompactSize(uint64_t value) {
    if (value < 253) {
        WriteUint8(static_cast<uint8_t>(value));
    } else if (value <= 0xffff) {
        WriteUint8(253);
        WriteUint16(static_cast<uint16_t>(value));
    } else if (value <= 0xffffffff) {
        WriteUint8(254);
        WriteUint32(static_cast<uint32_t>(value));
    } else {
        WriteUint8(255);
        WriteUint64(value);
    }
}

void CDataStream::WriteString(const std::string& str) {
    WriteCompactSize(str.size());
    write(reinterpret_cast<const uint8_t*>(str.data()), str.size());
}

void CDataStream::WriteBytes(const std::vector<uint8_t>& bytes) {
    WriteCompactSize(bytes.size());
    write(bytes.data(), bytes.size());
}

void CDataStream::read(uint8_t* dst, size_t len) {
    Require(len);
    if (len > 0) {
        memcpy(dst, m_data.data() + m_pos, len);
    }
    m_pos += len;
}

uint8_t CDataStream::ReadUint8() {
    Require(1);
    return m_data[m_pos++];
}

uint64_t CDataStream::ReadCompactSize() {
    uint8_t marker = ReadUint8();
    switch (marker) {
    case 253: return ReadUint16();
    case 254: return ReadUint32();
    case 255: return ReadUint64();
    default: return marker;
    }
}

std::string CDataStream::ReadString(size_t max_len) {
    uint64_t len = ReadCompactSize();
    if (len > max_len) {
        throw CSerializeError("string length " + std::to_string(len) + " over limit");
    }
    Require(static_cast<size_t>(len));
    std::string result(reinterpret_cast<const char*>(m_data.data() + m_pos), static_cast<size_t>(len));
    m_pos += static_cast<size_t>(len);
    return result;
}

std::vector<uint8_t> CDataStream::ReadBytes(size_t max_len) {
    uint64_t len = ReadCompactSize();
    if (len > max_len) {
        throw CSerializeError("byte string length " + std::to_string(len) + " over limit");
    }
    std::vector<uint8_t> result(static_cast<size_t>(len));
    read(result.data(), result.size());
    return result;
}

uint32_t FrameChecksum(const std::vector<uint8_t>& payload) {
    uint8_t first[32];
    uint8_t second[32];
    SHA3_256(payload.data(), payload.size(), first);
    SHA3_256(first, sizeof(first), second);
    return static_cast<uint32_t>(second[0]) | (static_cast<uint32_t>(second[1]) << 8) |
           (static_cast<uint32_t>(second[2]) << 16) | (static_cast<uint32_t>(second[3]) << 24);
}

CNetMessage::CNetMessage(const std::string& command, std::vector<uint8_t> payload_in)
    : payload(std::move(payload_in))
{
    header.magic = NetProtocol::PROXIMA_MAGIC;
    header.SetCommand(command);
    header.payload_size = static_cast<uint32_t>(payload.size());
    header.checksum = FrameChecksum(payload);
}

std::vector<uint8_t> CNetMessage::Serialize() const {
    CDataStream stream;
    stream.WriteUint32(header.magic);
    stream.write(reinterpret_cast<const uint8_t*>(header.command), sizeof(header.command));
    stream.WriteUint32(header.payload_size);
    stream.WriteUint32(header.checksum);
    stream.write(payload.data(), payload.size());
    return stream.GetData();
}

bool CNetMessage::ParseHeader(const std::vector<uint8_t>& bytes, NetProtocol::CMessageHeader& out) {
    if (bytes.size() < NetProtocol::HEADER_SIZE) {
        return false;
    }
    CDataStream stream(bytes);
    out.magic = stream.ReadUint32();
    stream.read(reinterpret_cast<uint8_t*>(out.command), sizeof(out.command));
    out.payload_size = stream.ReadUint32();
    out.checksum = stream.ReadUint32();
    return true;
}

bool CNetMessage::IsValid() const {
    return header.IsValid(NetProtocol::PROXIMA_MAGIC) && payload.size() == header.payload_size &&
           FrameChecksum(payload) == header.checksum;
}
