#pragma once

#include "common/error.hpp"
#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <ostream>
#include <string>

namespace saorsa_logic {

/**
 * Digest - 32-byte hash value
 *
 * Shared value type for every derived output of this library: content hashes,
 * entangled identities, binary digests and Merkle nodes.
 */
class Digest {
public:
    static constexpr size_t LEN = 32;

    // Constructors
    Digest() : bytes_{} {}

    explicit Digest(const std::array<uint8_t, LEN>& bytes)
        : bytes_(bytes) {}

    // Factory methods
    static Digest zero() { return Digest(); }
    static Digest filled(uint8_t byte);

    // Copies exactly LEN bytes; any other length is InvalidLength
    static LogicResult<Digest> from_bytes(const uint8_t* data, size_t len);

    // Accessors
    const std::array<uint8_t, LEN>& bytes() const { return bytes_; }
    const uint8_t* data() const { return bytes_.data(); }
    static constexpr size_t size() { return LEN; }
    uint8_t operator[](size_t i) const { return bytes_[i]; }
    uint8_t& operator[](size_t i) { return bytes_[i]; }

    bool is_zero() const;

    // Comparison (not constant-time, see constant_time_equal)
    bool operator==(const Digest& rhs) const;
    bool operator!=(const Digest& rhs) const;

    // Lower-case hex, 64 characters
    std::string to_hex() const;
    static std::optional<Digest> from_hex(const std::string& hex);

    friend std::ostream& operator<<(std::ostream& os, const Digest& digest);

private:
    std::array<uint8_t, LEN> bytes_;
};

using ContentHash = Digest;
using EntangledId = Digest;
using BinaryDigest = Digest;
using MerkleLeaf = Digest;
using MerkleRoot = Digest;

} // namespace saorsa_logic
