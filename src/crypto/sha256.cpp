// Copyright (c) 2025 The ProvChain Core developers
// Distributed under the MIT software license

#include <crypto/sha256.h>

#include <openssl/evp.h>
#include <stdexcept>

CSHA256::CSHA256() : ctx(EVP_MD_CTX_new()) {
    if (!ctx) {
        throw std::runtime_error("CSHA256: EVP_MD_CTX_new failed");
    }
    Reset();
}

CSHA256::~CSHA256() {
    EVP_MD_CTX_free(ctx);
}

CSHA256& CSHA256::Reset() {
    if (EVP_DigestInit_ex(ctx, EVP_sha256(), nullptr) != 1) {
        throw std::runtime_error("CSHA256: EVP_DigestInit_ex failed");
    }
    return *this;
}

CSHA256& CSHA256::Write(const uint8_t* data, size_t len) {
    if (data == nullptr && len > 0) {
        throw std::invalid_argument("CSHA256: data is NULL but len > 0");
    }
    if (len > 0 && EVP_DigestUpdate(ctx, data, len) != 1) {
        throw std::runtime_error("CSHA256: EVP_DigestUpdate failed");
    }
    return *this;
}

void CSHA256::Finalize(uint8_t hash[OUTPUT_SIZE]) {
    unsigned int out_len = 0;
    if (EVP_DigestFinal_ex(ctx, hash, &out_len) != 1 || out_len != OUTPUT_SIZE) {
        throw std::runtime_error("CSHA256: EVP_DigestFinal_ex failed");
    }
    Reset();
}

uint256 CSHA256::Finalize() {
    uint256 result;
    Finalize(result.begin());
    return result;
}

void SHA256Raw(const uint8_t* data, size_t len, uint8_t hash[32]) {
    if (hash == nullptr) {
        throw std::invalid_argument("SHA256Raw: hash output buffer is NULL");
    }
    CSHA256().Write(data, len).Finalize(hash);
}

uint256 HashSHA256(const std::string& str) {
    return CSHA256().Write(str).Finalize();
}

std::string SHA256Hex(const std::string& str) {
    return HashSHA256(str).GetHex();
}
