// Copyright (c) 2025 The Proxima Core developers
// Distributed under the MIT software license

#ifndef PROXIMA_CRYPTO_SHA3_H
#define PROXIMA_CRYPTO_SHA3_H

#include <stdint.h>
#include <stdlib.h>

#include <vector>

/**
 * SHA-3 hashing (NIST FIPS 202) backed by OpenSSL EVP.
 *
 * Used for frame checksums, fingerprint content signatures and
 * ephemeral node signature derivation.
 */

/**
 * Compute SHA3-256 hash of data (one-shot function)
 *
 * @param data Input data to hash
 * @param len Length of input data in bytes
 * @param hash Output buffer for 32-byte hash
 * @throws std::runtime_error if the digest backend fails
 */
void SHA3_256(const uint8_t* data, size_t len, uint8_t hash[32]);

/**
 * Incremental SHA3-256 for hashing several fields without concatenating
 */
class CSHA3_256 {
public:
    static constexpr size_t OUTPUT_SIZE = 32;

    CSHA3_256();
    ~CSHA3_256();

    CSHA3_256(const CSHA3_256&) = delete;
    CSHA3_256& operator=(const CSHA3_256&) = delete;

    CSHA3_256& Write(const uint8_t* data, size_t len);
    CSHA3_256& Write(const std::vector<uint8_t>& data) { return Write(data.data(), data.size()); }
    void Finalize(uint8_t hash[OUTPUT_SIZE]);

private:
    void* m_ctx;  // EVP_MD_CTX
};

#endif // PROXIMA_CRYPTO_SHA3_H
