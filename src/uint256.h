// Copyright (c) 2025 The ProvChain Core developers
// Distributed under the MIT software license

#ifndef PROVCHAIN_UINT256_H
#define PROVCHAIN_UINT256_H

#include <cstring>
#include <cstdint>
#include <string>
#include <iosfwd>

/** 256-bit hash (SHA-256 digest, stored in digest byte order) */
class uint256 {
public:
    static constexpr size_t WIDTH = 32;

    uint8_t data[WIDTH];

    uint256() { memset(data, 0, WIDTH); }

    bool IsNull() const {
        for (size_t i = 0; i < WIDTH; i++)
            if (data[i] != 0) return false;
        return true;
    }

    void SetNull() { memset(data, 0, WIDTH); }

    // Lexicographic over digest bytes, which matches ordering of GetHex()
    bool operator<(const uint256& other) const {
        return memcmp(data, other.data, WIDTH) < 0;
    }

    bool operator==(const uint256& other) const {
        return memcmp(data, other.data, WIDTH) == 0;
    }

    bool operator!=(const uint256& other) const {
        return memcmp(data, other.data, WIDTH) != 0;
    }

    uint8_t* begin() { return data; }
    const uint8_t* begin() const { return data; }
    uint8_t* end() { return data + WIDTH; }
    const uint8_t* end() const { return data + WIDTH; }
    static constexpr size_t size() { return WIDTH; }

    /** Lowercase hex, 64 characters, first digest byte first */
    std::string GetHex() const;

    /** Parse exactly 64 hex characters. Leaves the value untouched on failure. */
    bool SetHex(const std::string& str);

    static uint256 FromHex(const std::string& str, bool& ok);
};

// Stream output operator for Boost.Test
std::ostream& operator<<(std::ostream& os, const uint256& h);

#endif // PROVCHAIN_UINT256_H
