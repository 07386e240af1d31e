// Copyright (c) 2025 The Proxima Core developers
// Distributed under the MIT software license

#ifndef PROXIMA_UTIL_STRENCODINGS_H
#define PROXIMA_UTIL_STRENCODINGS_H

#include <cstdint>
#include <string>
#include <vector>

/** printf into a std::string of whatever length the output needs */
std::string strprintf(const char* format, ...) __attribute__((format(printf, 1, 2)));

/** Lower-case hex, two digits per byte */
std::string HexStr(const uint8_t* data, size_t len);
std::string HexStr(const std::vector<uint8_t>& vch);

/** Even length, hex digits only, either case */
bool IsHex(const std::string& str);

/** Empty on invalid input */
std::vector<uint8_t> ParseHex(const std::string& str);

/** RFC 4648 Base64 with padding */
std::string EncodeBase64(const uint8_t* data, size_t len);
std::string EncodeBase64(const std::vector<uint8_t>& vch);

/**
 * Strict Base64 decode: no whitespace, padding only at the end, length a
 * multiple of four.
 */
bool DecodeBase64(const std::string& str, std::vector<uint8_t>& out);

#endif // PROXIMA_UTIL_STRENCODINGS_H
