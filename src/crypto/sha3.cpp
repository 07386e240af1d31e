// Copyright (c) 2025 The Proxima Core developers
// Distributed under the MIT software license

#include <crypto/sha3.h>

#include <openssl/evp.h>

#include <stdexcept>

void SHA3_256(const uint8_t* data, size_t len, uint8_t hash[32]) {
    unsigned int out_len = 0;
    if (EVP_Digest(data, len, hash, &out_len, EVP_sha3_256(), nullptr) != 1 || out_len != 32) {
        throw std::runtime_error("SHA3_256: digest failed");
    }
}

CSHA3_256::CSHA3_256() : m_ctx(EVP_MD_CTX_new()) {
    if (m_ctx == nullptr ||
        EVP_DigestInit_ex(static_cast<EVP_MD_CTX*>(m_ctx), EVP_sha3_256(), nullptr) != 1) {
        EVP_MD_CTX_free(static_cast<EVP_MD_CTX*>(m_ctx));
        throw std::runtime_error("CSHA3_256: digest init failed");
    }
}

CSHA3_256::~CSHA3_256() {
    EVP_MD_CTX_free(static_cast<EVP_MD_CTX*>(m_ctx));
}

CSHA3_256& CSHA3_256::Write(const uint8_t* data, size_t len) {
    if (EVP_DigestUpdate(static_cast<EVP_MD_CTX*>(m_ctx), data, len) != 1) {
        throw std::runtime_error("CSHA3_256: digest update failed");
    }
    return *this;
}

void CSHA3_256::Finalize(uint8_t hash[OUTPUT_SIZE]) {
    unsigned int out_len = 0;
    if (EVP_DigestFinal_ex(static_cast<EVP_MD_CTX*>(m_ctx), hash, &out_len) != 1 ||
        out_len != OUTPUT_SIZE) {
        throw std::runtime_error("CSHA3_256: digest final failed");
    }
}
