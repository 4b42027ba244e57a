#pragma once

#include "common/error.hpp"
#include "types/digest.hpp"
#include <array>
#include <cstddef>
#include <cstdint>
#include <vector>

namespace saorsa_logic {

// ML-DSA-65 public key size
constexpr size_t PUBLIC_KEY_LEN = 1952;

// Domain separation tag prefixed to every entangled identity preimage (no terminator)
constexpr char ENTANGLED_ID_DOMAIN[] = "saorsa-entangled-id-v1";
constexpr size_t ENTANGLED_ID_DOMAIN_LEN = sizeof(ENTANGLED_ID_DOMAIN) - 1;

using PublicKey = std::array<uint8_t, PUBLIC_KEY_LEN>;

/**
 * Entangled Attestation
 *
 * EntangledId = BLAKE3(ENTANGLED_ID_DOMAIN || public_key || binary_digest || le64(nonce))
 *
 * Binds a node's public key to the digest of the binary it runs. Distinct
 * nonces give distinct identities for the same (key, binary) pair.
 *
 * Raw-buffer overloads reject a public key that is not PUBLIC_KEY_LEN bytes or
 * a binary digest that is not Digest::LEN bytes with InvalidLength, before any
 * hashing. Verification compares in constant time; a mismatch is `false`.
 */
LogicResult<EntangledId> derive_entangled_id(
    const uint8_t* public_key, size_t public_key_len,
    const uint8_t* binary_digest, size_t binary_digest_len,
    uint64_t nonce
);

LogicResult<EntangledId> derive_entangled_id(
    const std::vector<uint8_t>& public_key,
    const std::vector<uint8_t>& binary_digest,
    uint64_t nonce
);

LogicResult<EntangledId> derive_entangled_id(
    const PublicKey& public_key,
    const BinaryDigest& binary_digest,
    uint64_t nonce
);

LogicResult<bool> verify_entangled_id(
    const EntangledId& id,
    const uint8_t* public_key, size_t public_key_len,
    const uint8_t* binary_digest, size_t binary_digest_len,
    uint64_t nonce
);

LogicResult<bool> verify_entangled_id(
    const EntangledId& id,
    const std::vector<uint8_t>& public_key,
    const std::vector<uint8_t>& binary_digest,
    uint64_t nonce
);

LogicResult<bool> verify_entangled_id(
    const EntangledId& id,
    const PublicKey& public_key,
    const BinaryDigest& binary_digest,
    uint64_t nonce
);

/**
 * EntangledIdComponents - the inputs of an entangled identity as one value
 *
 * Lengths are validated once by from_bytes(); derive() and verify() then always
 * succeed.
 */
struct EntangledIdComponents {
    PublicKey public_key;
    BinaryDigest binary_digest;
    uint64_t nonce;

    static LogicResult<EntangledIdComponents> from_bytes(
        const uint8_t* public_key, size_t public_key_len,
        const uint8_t* binary_digest, size_t binary_digest_len,
        uint64_t nonce
    );

    LogicResult<EntangledId> derive() const;
    LogicResult<bool> verify(const EntangledId& id) const;

    // Same key and binary under another nonce (e.g. the next epoch)
    EntangledIdComponents with_nonce(uint64_t next_nonce) const;
};

} // namespace saorsa_logic
