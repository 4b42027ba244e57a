#include "hash/blake3.hpp"
#include "common/debug_control.hpp"
#include <openssl/crypto.h>
#include <cstring>

namespace saorsa_logic {

namespace {

// Contiguous input, hashed with a stack hasher
template <size_t N>
Digest hash_buffer(const std::array<uint8_t, N>& buf) {
    blake3_hasher hasher;
    blake3_hasher_init(&hasher);
    blake3_hasher_update(&hasher, buf.data(), buf.size());

    std::array<uint8_t, Digest::LEN> out;
    blake3_hasher_finalize(&hasher, out.data(), out.size());
    return Digest(out);
}

} // namespace

Blake3::Blake3() : invalid_input_(false) {
    blake3_hasher_init(&hasher_);
}

void Blake3::update(const uint8_t* data, size_t len) {
    if (len == 0) {
        return;
    }
    if (data == nullptr) {
        SAORSA_DEBUG_FPRINTF(stderr, "[saorsa_logic] null input with length %zu\n", len);
        invalid_input_ = true;
        return;
    }
    blake3_hasher_update(&hasher_, data, len);
}

void Blake3::update(const Digest& digest) {
    update(digest.data(), Digest::LEN);
}

void Blake3::update_u8(uint8_t value) {
    update(&value, 1);
}

void Blake3::update_u64_le(uint64_t value) {
    std::array<uint8_t, 8> le = encode_u64_le(value);
    update(le.data(), le.size());
}

LogicResult<Digest> Blake3::finalize() const {
    if (invalid_input_) {
        return LogicResult<Digest>::err(LogicError::InvalidLength);
    }
    std::array<uint8_t, Digest::LEN> out;
    blake3_hasher_finalize(&hasher_, out.data(), out.size());
    return LogicResult<Digest>::ok(Digest(out));
}

LogicResult<Digest> Blake3::hash(const uint8_t* data, size_t len) {
    Blake3 hasher;
    hasher.update(data, len);
    return hasher.finalize();
}

Digest Blake3::hash_tagged(uint8_t tag, const Digest& value) {
    std::array<uint8_t, 1 + Digest::LEN> buf;
    buf[0] = tag;
    std::memcpy(buf.data() + 1, value.data(), Digest::LEN);
    return hash_buffer(buf);
}

Digest Blake3::hash_tagged_pair(uint8_t tag, const Digest& left, const Digest& right) {
    std::array<uint8_t, 1 + 2 * Digest::LEN> buf;
    buf[0] = tag;
    std::memcpy(buf.data() + 1, left.data(), Digest::LEN);
    std::memcpy(buf.data() + 1 + Digest::LEN, right.data(), Digest::LEN);
    return hash_buffer(buf);
}

bool constant_time_equal(const Digest& a, const Digest& b) {
    return CRYPTO_memcmp(a.data(), b.data(), Digest::LEN) == 0;
}

std::array<uint8_t, 8> encode_u64_le(uint64_t value) {
    std::array<uint8_t, 8> out;
    for (size_t i = 0; i < 8; ++i) {
        out[i] = static_cast<uint8_t>((value >> (i * 8)) & 0xFF);
    }
    return out;
}

} // namespace saorsa_logic
