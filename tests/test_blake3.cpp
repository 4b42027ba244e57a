#include <gtest/gtest.h>
#include "hash/blake3.hpp"
#include <algorithm>
#include <string>
#include <utility>
#include <vector>

using namespace saorsa_logic;

namespace {

const uint8_t* as_bytes(const std::string& s) {
    return reinterpret_cast<const uint8_t*>(s.data());
}

// Input used by the official BLAKE3 test vectors: byte i is i % 251
std::vector<uint8_t> official_input(size_t len) {
    std::vector<uint8_t> out(len);
    for (size_t i = 0; i < len; ++i) {
        out[i] = static_cast<uint8_t>(i % 251);
    }
    return out;
}

} // namespace

// Test the official BLAKE3 vectors across chunk and tree boundaries
TEST(Blake3Test, OfficialVectors) {
    const std::vector<std::pair<size_t, std::string>> vectors = {
        {0, "af1349b9f5f9a1a6a0404dea36dcc9499bcb25c9adc112b7cc9a93cae41f3262"},
        {1, "2d3adedff11b61f14c886e35afa036736dcd87a74d27b5c1510225d0f592e213"},
        {1023, "10108970eeda3eb932baac1428c7a2163b0e924c9a9e25b35bba72b28f70bd11"},
        {1024, "42214739f095a406f3fc83deb889744ac00df831c10daa55189b5d121c855af7"},
        {1025, "d00278ae47eb27b34faecf67b4fe263f82d5412916c1ffd97c8cb7fb814b8444"},
        {2048, "e776b6028c7cd22a4d0ba182a8bf62205d2ef576467e838ed6f2529b85fba24a"},
        {2049, "5f4d72f40d7a5f82b15ca2b2e44b1de3c2ef86c426c95c1af0b6879522563030"},
        {3072, "b98cb0ff3623be03326b373de6b9095218513e64f1ee2edd2525c7ad1e5cffd2"},
        {8192, "aae792484c8efe4f19e2ca7d371d8c467ffb10748d8a5a1ae579948f718a2a63"},
    };

    for (const auto& [len, hex] : vectors) {
        std::vector<uint8_t> input = official_input(len);
        auto h = Blake3::hash(input.data(), input.size());
        ASSERT_TRUE(h.is_ok());
        EXPECT_EQ(h.value().to_hex(), hex) << "input length " << len;
    }
}

// Test a short ASCII input
TEST(Blake3Test, Abc) {
    std::string abc = "abc";
    auto h = Blake3::hash(as_bytes(abc), abc.size());
    ASSERT_TRUE(h.is_ok());
    EXPECT_EQ(h.value().to_hex(),
              "6437b3ac38465133ffb63b75273a8db548c558465d79db03fd359c6cd5bd9d85");
}

// Test incremental hashing matches one-shot across block and chunk boundaries
TEST(Blake3Test, IncrementalMatchesOneShot) {
    std::vector<uint8_t> data = official_input(3000);
    auto expected = Blake3::hash(data.data(), data.size());
    ASSERT_TRUE(expected.is_ok());

    for (size_t chunk : {1u, 63u, 64u, 65u, 1024u, 2999u}) {
        Blake3 hasher;
        for (size_t off = 0; off < data.size(); off += chunk) {
            size_t n = std::min(chunk, data.size() - off);
            hasher.update(data.data() + off, n);
        }
        auto actual = hasher.finalize();
        ASSERT_TRUE(actual.is_ok());
        EXPECT_EQ(actual.value(), expected.value()) << "chunk size " << chunk;
    }
}

// Test finalize leaves the state usable for further input
TEST(Blake3Test, FinalizeIsRepeatable) {
    Blake3 hasher;
    hasher.update_u8(0x61);
    hasher.update_u8(0x62);
    auto first = hasher.finalize();
    auto second = hasher.finalize();
    ASSERT_TRUE(first.is_ok());
    EXPECT_EQ(first.value(), second.value());

    hasher.update_u8(0x63);
    EXPECT_EQ(hasher.finalize().value().to_hex(),
              "6437b3ac38465133ffb63b75273a8db548c558465d79db03fd359c6cd5bd9d85");
}

// Test null data with a non-zero length is a length error
TEST(Blake3Test, NullDataIsInvalidLength) {
    auto r = Blake3::hash(nullptr, 4);
    ASSERT_TRUE(r.is_error());
    EXPECT_EQ(r.error(), LogicError::InvalidLength);

    Blake3 hasher;
    hasher.update(nullptr, 4);
    hasher.update_u8(0x01);
    auto latched = hasher.finalize();
    ASSERT_TRUE(latched.is_error());
    EXPECT_EQ(latched.error(), LogicError::InvalidLength);

    auto empty = Blake3::hash(nullptr, 0);
    ASSERT_TRUE(empty.is_ok());
    EXPECT_EQ(empty.value().to_hex(),
              "af1349b9f5f9a1a6a0404dea36dcc9499bcb25c9adc112b7cc9a93cae41f3262");
}

// Test tagged pair hashing equals hashing the concatenation
TEST(Blake3Test, TaggedPairIsConcatenation) {
    Digest left = Digest::filled(0x11);
    Digest right = Digest::filled(0x22);

    std::vector<uint8_t> buf;
    buf.push_back(0x01);
    buf.insert(buf.end(), left.bytes().begin(), left.bytes().end());
    buf.insert(buf.end(), right.bytes().begin(), right.bytes().end());

    auto expected = Blake3::hash(buf.data(), buf.size());
    ASSERT_TRUE(expected.is_ok());
    EXPECT_EQ(Blake3::hash_tagged_pair(0x01, left, right), expected.value());
    EXPECT_NE(Blake3::hash_tagged_pair(0x01, right, left), expected.value());
}

// Test single-value tagging equals hashing the concatenation and depends on the tag
TEST(Blake3Test, TaggedDiffersByTag) {
    Digest v = Digest::filled(0x33);

    std::vector<uint8_t> buf;
    buf.push_back(0x00);
    buf.insert(buf.end(), v.bytes().begin(), v.bytes().end());

    EXPECT_EQ(Blake3::hash_tagged(0x00, v), Blake3::hash(buf.data(), buf.size()).value());
    EXPECT_NE(Blake3::hash_tagged(0x00, v), Blake3::hash_tagged(0x01, v));
}

// Test constant-time comparison agrees with operator==
TEST(Blake3Test, ConstantTimeEqual) {
    Digest a = Digest::filled(0x5A);
    Digest b = a;
    EXPECT_TRUE(constant_time_equal(a, b));
    b[31] ^= 0x01;
    EXPECT_FALSE(constant_time_equal(a, b));
}

// Test little-endian nonce encoding
TEST(Blake3Test, EncodeU64LittleEndian) {
    auto le = encode_u64_le(0x0102030405060708ULL);
    EXPECT_EQ(le[0], 0x08);
    EXPECT_EQ(le[7], 0x01);

    auto n = encode_u64_le(12345);
    EXPECT_EQ(n[0], 0x39);
    EXPECT_EQ(n[1], 0x30);
    for (size_t i = 2; i < 8; ++i) {
        EXPECT_EQ(n[i], 0);
    }
}
