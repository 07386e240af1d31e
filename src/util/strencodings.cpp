// Copyright (c) 2025 The Proxima Core developers
// Distributed under the MIT software license

#include <util/strencodings.h>

#include <openssl/evp.h>

#include <cstdarg>
#include <cstdio>

namespace {

const char HEX_DIGITS[] = "0123456789abcdef";

int DigitValue(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

bool InBase64Alphabet(char c) {
    return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '+' || c == '/';
}

} // namespace

std::string strprintf(const char* format, ...) {
    va_list args;
    va_start(args, format);
    va_list measure;
    va_copy(measure, args);
    int needed = vsnprintf(nullptr, 0, format, measure);
    va_end(measure);

    std::string result;
    if (needed > 0) {
        result.resize(static_cast<size_t>(needed) + 1);
        vsnprintf(&result[0], result.size(), format, args);
        result.resize(static_cast<size_t>(needed));
    }
    va_end(args);
    return result;
}

std::string HexStr(const uint8_t* data, size_t len) {
    std::string out(len * 2, '0');
    for (size_t i = 0; i < len; ++i) {
        out[2 * i] = HEX_DIGITS[data[i] >> 4];
        out[2 * i + 1] = HEX_DIGITS[data[i] & 0x0f];
    }
    return out;
}

std::string HexStr(const std::vector<uint8_t>& vch) {
    return HexStr(vch.data(), vch.size());
}

bool IsHex(const std::string& str) {
    if (str.size() % 2 != 0) {
        return false;
    }
    for (char c : str) {
        if (DigitValue(c) < 0) {
            return false;
        }
    }
    return true;
}

std::vector<uint8_t> ParseHex(const std::string& str) {
    std::vector<uint8_t> out;
    if (!IsHex(str)) {
        return out;
    }
    out.reserve(str.size() / 2);
    for (size_t i = 0; i + 1 < str.size(); i += 2) {
        out.push_back(static_cast<uint8_t>(DigitValue(str[i]) * 16 + DigitValue(str[i + 1])));
    }
    return out;
}

std::string EncodeBase64(const uint8_t* data, size_t len) {
    if (len == 0) {
        return std::string();
    }
    // EVP_EncodeBlock writes a trailing NUL
    std::string out(4 * ((len + 2) / 3) + 1, '\0');
    int written = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(&out[0]), data, static_cast<int>(len));
    out.resize(written > 0 ? static_cast<size_t>(written) : 0);
    return out;
}

std::string EncodeBase64(const std::vector<uint8_t>& vch) {
    return EncodeBase64(vch.data(), vch.size());
}

bool DecodeBase64(const std::string& str, std::vector<uint8_t>& out) {
    out.clear();
    if (str.empty()) {
        return true;
    }
    if (str.size() % 4 != 0) {
        return false;
    }

    // EVP_DecodeBlock tolerates whitespace and keeps pad bytes as zeros
    size_t pad = 0;
    for (size_t i = 0; i < str.size(); ++i) {
        if (str[i] == '=') {
            if (i + 2 < str.size()) {
                return false;
            }
            ++pad;
        } else if (pad != 0 || !InBase64Alphabet(str[i])) {
            return false;
        }
    }

    std::vector<uint8_t> decoded(3 * (str.size() / 4));
    int len = EVP_DecodeBlock(decoded.data(), reinterpret_cast<const unsigned char*>(str.data()),
                              static_cast<int>(str.size()));
    if (len < 0 || static_cast<size_t>(len) < pad) {
        return false;
    }
    decoded.resize(static_cast<size_t>(len) - pad);
    out.swap(decoded);
    return true;
}
