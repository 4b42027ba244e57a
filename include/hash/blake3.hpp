#pragma once

#include "common/error.hpp"
#include "types/digest.hpp"
#include <blake3.h>
#include <array>
#include <cstddef>
#include <cstdint>

namespace saorsa_logic {

static_assert(BLAKE3_OUT_LEN == Digest::LEN, "BLAKE3 output must fill a Digest");

/**
 * Blake3 - collision-resistant digest primitive
 *
 * Wraps the official BLAKE3 C hasher. Every hash in this library (content
 * addresses, entangled identities, Merkle nodes) goes through it. The hasher
 * state lives inline, so hashing never allocates.
 *
 * Incremental use: update() any number of times, then finalize(). finalize()
 * does not consume the state; further updates extend the same input.
 * Null data with a non-zero length is latched and reported by finalize() as
 * LogicError::InvalidLength.
 */
class Blake3 {
public:
    static constexpr size_t DIGEST_LEN = Digest::LEN;

    Blake3();

    void update(const uint8_t* data, size_t len);
    void update(const Digest& digest);
    void update_u8(uint8_t value);
    void update_u64_le(uint64_t value);

    LogicResult<Digest> finalize() const;

    // One-shot hashes
    static LogicResult<Digest> hash(const uint8_t* data, size_t len);
    static Digest hash_tagged(uint8_t tag, const Digest& value);
    static Digest hash_tagged_pair(uint8_t tag, const Digest& left, const Digest& right);

private:
    blake3_hasher hasher_;
    bool invalid_input_;
};

// Comparison whose running time does not depend on where the inputs differ
bool constant_time_equal(const Digest& a, const Digest& b);

std::array<uint8_t, 8> encode_u64_le(uint64_t value);

} // namespace saorsa_logic
