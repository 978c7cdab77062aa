// Copyright (c) 2025 The ProvChain Core developers
// Distributed under the MIT software license

#ifndef PROVCHAIN_CRYPTO_SHA256_H
#define PROVCHAIN_CRYPTO_SHA256_H

#include <uint256.h>

#include <stdint.h>
#include <stdlib.h>
#include <string>

typedef struct evp_md_ctx_st EVP_MD_CTX;

/**
 * SHA-256 hashing backed by the OpenSSL EVP interface.
 *
 * All canonical graph hashes, triple hashes and block hashes are SHA-256.
 * EVP failures are reported as std::runtime_error.
 */

/** Streaming SHA-256 hasher */
class CSHA256 {
public:
    static constexpr size_t OUTPUT_SIZE = 32;

    CSHA256();
    ~CSHA256();

    CSHA256(const CSHA256&) = delete;
    CSHA256& operator=(const CSHA256&) = delete;

    CSHA256& Write(const uint8_t* data, size_t len);
    CSHA256& Write(const std::string& str) {
        return Write(reinterpret_cast<const uint8_t*>(str.data()), str.size());
    }
    CSHA256& Write(const uint256& h) { return Write(h.begin(), uint256::size()); }

    /** Produce the digest. The hasher is reset afterwards and can be reused. */
    void Finalize(uint8_t hash[OUTPUT_SIZE]);
    uint256 Finalize();

    CSHA256& Reset();

private:
    EVP_MD_CTX* ctx;
};

/**
 * Compute SHA-256 of data (one-shot function)
 *
 * @param data Input data to hash
 * @param len Length of input data in bytes
 * @param hash Output buffer for 32-byte hash
 */
void SHA256Raw(const uint8_t* data, size_t len, uint8_t hash[32]);

uint256 HashSHA256(const std::string& str);

/** Lowercase hex SHA-256 of a string */
std::string SHA256Hex(const std::string& str);

#endif // PROVCHAIN_CRYPTO_SHA256_H
