#include "attestation/entangled_id.hpp"
#include "common/debug_control.hpp"
#include "hash/blake3.hpp"
#include <algorithm>

namespace saorsa_logic {

namespace {

bool lengths_valid(size_t public_key_len, size_t binary_digest_len) {
    if (public_key_len != PUBLIC_KEY_LEN) {
        SAORSA_DEBUG_FPRINTF(stderr, "[saorsa_logic] public key is %zu bytes, expected %zu\n",
                             public_key_len, PUBLIC_KEY_LEN);
        return false;
    }
    if (binary_digest_len != Digest::LEN) {
        SAORSA_DEBUG_FPRINTF(stderr, "[saorsa_logic] binary digest is %zu bytes, expected %zu\n",
                             binary_digest_len, Digest::LEN);
        return false;
    }
    return true;
}

// Lengths already validated
LogicResult<EntangledId> derive_unchecked(
    const uint8_t* public_key,
    const uint8_t* binary_digest,
    uint64_t nonce
) {
    Blake3 hasher;
    hasher.update(reinterpret_cast<const uint8_t*>(ENTANGLED_ID_DOMAIN), ENTANGLED_ID_DOMAIN_LEN);
    hasher.update(public_key, PUBLIC_KEY_LEN);
    hasher.update(binary_digest, Digest::LEN);
    hasher.update_u64_le(nonce);
    return hasher.finalize();
}

LogicResult<bool> compare(const LogicResult<EntangledId>& derived, const EntangledId& id) {
    if (derived.is_error()) {
        return LogicResult<bool>::err(derived.error());
    }
    return LogicResult<bool>::ok(constant_time_equal(derived.value(), id));
}

} // namespace

LogicResult<EntangledId> derive_entangled_id(
    const uint8_t* public_key, size_t public_key_len,
    const uint8_t* binary_digest, size_t binary_digest_len,
    uint64_t nonce
) {
    if (public_key == nullptr || binary_digest == nullptr ||
        !lengths_valid(public_key_len, binary_digest_len)) {
        return LogicResult<EntangledId>::err(LogicError::InvalidLength);
    }
    return derive_unchecked(public_key, binary_digest, nonce);
}

LogicResult<EntangledId> derive_entangled_id(
    const std::vector<uint8_t>& public_key,
    const std::vector<uint8_t>& binary_digest,
    uint64_t nonce
) {
    return derive_entangled_id(public_key.data(), public_key.size(),
                               binary_digest.data(), binary_digest.size(), nonce);
}

LogicResult<EntangledId> derive_entangled_id(
    const PublicKey& public_key,
    const BinaryDigest& binary_digest,
    uint64_t nonce
) {
    return derive_unchecked(public_key.data(), binary_digest.data(), nonce);
}

LogicResult<bool> verify_entangled_id(
    const EntangledId& id,
    const uint8_t* public_key, size_t public_key_len,
    const uint8_t* binary_digest, size_t binary_digest_len,
    uint64_t nonce
) {
    return compare(derive_entangled_id(public_key, public_key_len,
                                       binary_digest, binary_digest_len, nonce), id);
}

LogicResult<bool> verify_entangled_id(
    const EntangledId& id,
    const std::vector<uint8_t>& public_key,
    const std::vector<uint8_t>& binary_digest,
    uint64_t nonce
) {
    return compare(derive_entangled_id(public_key, binary_digest, nonce), id);
}

LogicResult<bool> verify_entangled_id(
    const EntangledId& id,
    const PublicKey& public_key,
    const BinaryDigest& binary_digest,
    uint64_t nonce
) {
    return compare(derive_entangled_id(public_key, binary_digest, nonce), id);
}

LogicResult<EntangledIdComponents> EntangledIdComponents::from_bytes(
    const uint8_t* public_key, size_t public_key_len,
    const uint8_t* binary_digest, size_t binary_digest_len,
    uint64_t nonce
) {
    if (public_key == nullptr || binary_digest == nullptr ||
        !lengths_valid(public_key_len, binary_digest_len)) {
        return LogicResult<EntangledIdComponents>::err(LogicError::InvalidLength);
    }

    EntangledIdComponents components;
    std::copy(public_key, public_key + PUBLIC_KEY_LEN, components.public_key.begin());
    components.binary_digest = Digest::from_bytes(binary_digest, binary_digest_len).value();
    components.nonce = nonce;
    return LogicResult<EntangledIdComponents>::ok(components);
}

LogicResult<EntangledId> EntangledIdComponents::derive() const {
    return derive_entangled_id(public_key, binary_digest, nonce);
}

LogicResult<bool> EntangledIdComponents::verify(const EntangledId& id) const {
    return verify_entangled_id(id, public_key, binary_digest, nonce);
}

EntangledIdComponents EntangledIdComponents::with_nonce(uint64_t next_nonce) const {
    EntangledIdComponents next = *this;
    next.nonce = next_nonce;
    return next;
}

} // namespace saorsa_logic
