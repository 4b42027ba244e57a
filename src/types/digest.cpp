#include "types/digest.hpp"
#include <algorithm>
#include <iomanip>
#include <sstream>

namespace saorsa_logic {

namespace {

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

} // namespace

Digest Digest::filled(uint8_t byte) {
    Digest d;
    d.bytes_.fill(byte);
    return d;
}

LogicResult<Digest> Digest::from_bytes(const uint8_t* data, size_t len) {
    if (len != LEN || data == nullptr) {
        return LogicResult<Digest>::err(LogicError::InvalidLength);
    }
    Digest d;
    std::copy(data, data + LEN, d.bytes_.begin());
    return LogicResult<Digest>::ok(d);
}

bool Digest::is_zero() const {
    for (uint8_t b : bytes_) {
        if (b != 0) {
            return false;
        }
    }
    return true;
}

bool Digest::operator==(const Digest& rhs) const {
    return bytes_ == rhs.bytes_;
}

bool Digest::operator!=(const Digest& rhs) const {
    return !(*this == rhs);
}

std::string Digest::to_hex() const {
    std::ostringstream oss;
    for (size_t i = 0; i < LEN; ++i) {
        oss << std::setfill('0') << std::setw(2) << std::hex << static_cast<int>(bytes_[i]);
    }
    return oss.str();
}

std::optional<Digest> Digest::from_hex(const std::string& hex) {
    if (hex.length() != LEN * 2) {
        return std::nullopt;
    }

    Digest d;
    for (size_t i = 0; i < LEN; ++i) {
        int hi = hex_value(hex[2 * i]);
        int lo = hex_value(hex[2 * i + 1]);
        if (hi < 0 || lo < 0) {
            return std::nullopt;
        }
        d.bytes_[i] = static_cast<uint8_t>((hi << 4) | lo);
    }
    return d;
}

std::ostream& operator<<(std::ostream& os, const Digest& digest) {
    return os << digest.to_hex();
}

} // namespace saorsa_logic
