// Copyright (c) 2025 The ProvChain Core developers
// Distributed under the MIT software license

/**
 * Hashing Tests
 *
 * SHA-256 (OpenSSL EVP backend) and the uint256 digest type
 */

#include <boost/test/unit_test.hpp>

#include <crypto/sha256.h>
#include <uint256.h>

#include <cstring>
#include <sstream>
#include <string>

BOOST_AUTO_TEST_SUITE(crypto_tests)

/**
 * Test Suite 1: SHA-256
 */
BOOST_AUTO_TEST_SUITE(sha256_tests)

BOOST_AUTO_TEST_CASE(sha256_empty_input) {
    BOOST_CHECK_EQUAL(SHA256Hex(""),
                      "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
}

BOOST_AUTO_TEST_CASE(sha256_known_test_vector) {
    // FIPS 180-2 "abc"
    const uint8_t expected[32] = {
        0xba, 0x78, 0x16, 0xbf, 0x8f, 0x01, 0xcf, 0xea,
        0x41, 0x41, 0x40, 0xde, 0x5d, 0xae, 0x22, 0x23,
        0xb0, 0x03, 0x61, 0xa3, 0x96, 0x17, 0x7a, 0x9c,
        0xb4, 0x10, 0xff, 0x61, 0xf2, 0x00, 0x15, 0xad
    };

    uint8_t hash[32];
    const uint8_t input[] = {'a', 'b', 'c'};
    SHA256Raw(input, 3, hash);
    BOOST_CHECK_EQUAL_COLLECTIONS(hash, hash + 32, expected, expected + 32);

    uint256 digest = HashSHA256("abc");
    BOOST_CHECK_EQUAL_COLLECTIONS(digest.begin(), digest.end(), expected, expected + 32);
}

BOOST_AUTO_TEST_CASE(sha256_incremental_matches_oneshot) {
    CSHA256 hasher;
    hasher.Write("ProvChain ").Write("ledger");
    BOOST_CHECK(hasher.Finalize() == HashSHA256("ProvChain ledger"));

    // Finalize resets the context
    hasher.Write("abc");
    BOOST_CHECK(hasher.Finalize() == HashSHA256("abc"));
}

BOOST_AUTO_TEST_CASE(sha256_reset_discards_input) {
    CSHA256 hasher;
    hasher.Write("garbage");
    hasher.Reset();
    BOOST_CHECK(hasher.Finalize() == HashSHA256(""));
}

BOOST_AUTO_TEST_CASE(sha256_write_digest) {
    uint256 inner = HashSHA256("abc");
    CSHA256 hasher;
    hasher.Write(inner);
    BOOST_CHECK(hasher.Finalize() ==
                HashSHA256(std::string(reinterpret_cast<const char*>(inner.begin()), 32)));
}

BOOST_AUTO_TEST_SUITE_END()

/**
 * Test Suite 2: uint256
 */
BOOST_AUTO_TEST_SUITE(uint256_tests)

BOOST_AUTO_TEST_CASE(uint256_construction) {
    uint256 hash;
    BOOST_CHECK(hash.IsNull());
    for (size_t i = 0; i < uint256::WIDTH; i++) {
        BOOST_CHECK_EQUAL(hash.data[i], 0);
    }

    hash.data[31] = 0xff;
    BOOST_CHECK(!hash.IsNull());
    hash.SetNull();
    BOOST_CHECK(hash.IsNull());
}

BOOST_AUTO_TEST_CASE(uint256_hex_is_digest_order) {
    uint256 digest = HashSHA256("abc");
    BOOST_CHECK_EQUAL(digest.GetHex(),
                      "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");

    std::ostringstream os;
    os << digest;
    BOOST_CHECK_EQUAL(os.str(), digest.GetHex());
}

BOOST_AUTO_TEST_CASE(uint256_sethex_roundtrip) {
    uint256 digest = HashSHA256("provenance");
    uint256 parsed;
    BOOST_CHECK(parsed.SetHex(digest.GetHex()));
    BOOST_CHECK(parsed == digest);

    bool ok = false;
    uint256 upper = uint256::FromHex("BA7816BF8F01CFEA414140DE5DAE2223B00361A396177A9CB410FF61F20015AD", ok);
    BOOST_CHECK(ok);
    BOOST_CHECK(upper == HashSHA256("abc"));
}

BOOST_AUTO_TEST_CASE(uint256_sethex_rejects_malformed) {
    uint256 value = HashSHA256("abc");
    const uint256 before = value;

    BOOST_CHECK(!value.SetHex(""));
    BOOST_CHECK(!value.SetHex("abcd"));
    BOOST_CHECK(!value.SetHex(std::string(63, 'a')));
    BOOST_CHECK(!value.SetHex(std::string(65, 'a')));
    BOOST_CHECK(!value.SetHex(std::string(63, 'a') + "g"));
    BOOST_CHECK(value == before);
}

BOOST_AUTO_TEST_CASE(uint256_comparison) {
    uint256 a, b, c;
    memset(a.data, 0x41, 32);
    memset(b.data, 0x42, 32);
    memset(c.data, 0x42, 32);

    BOOST_CHECK(a < b);
    BOOST_CHECK(!(b < a));
    BOOST_CHECK(b == c);
    BOOST_CHECK(a != b);
    // Byte order and hex order agree
    BOOST_CHECK(a.GetHex() < b.GetHex());
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE_END()
