#include "data/content_hash.hpp"
#include "common/debug_control.hpp"

namespace saorsa_logic {

LogicResult<ContentHash> compute_content_hash(const uint8_t* data, size_t len) {
    return Blake3::hash(data, len);
}

LogicResult<ContentHash> compute_content_hash(const std::vector<uint8_t>& data) {
    return Blake3::hash(data.data(), data.size());
}

LogicResult<ContentHash> compute_content_hash(const std::string& data) {
    return Blake3::hash(reinterpret_cast<const uint8_t*>(data.data()), data.size());
}

bool verify_content_hash(const uint8_t* data, size_t len, const ContentHash& expected) {
    LogicResult<ContentHash> actual = compute_content_hash(data, len);
    if (actual.is_error()) {
        SAORSA_DEBUG_FPRINTF(stderr, "[saorsa_logic] content hash rejected: %s\n",
                             to_string(actual.error()));
        return false;
    }
    return constant_time_equal(actual.value(), expected);
}

bool verify_content_hash(const std::vector<uint8_t>& data, const ContentHash& expected) {
    return verify_content_hash(data.data(), data.size(), expected);
}

bool verify_content_hash(const std::string& data, const ContentHash& expected) {
    return verify_content_hash(reinterpret_cast<const uint8_t*>(data.data()), data.size(), expected);
}

bool ContentHasher::verify(const ContentHash& expected) const {
    LogicResult<ContentHash> actual = finalize();
    return actual.is_ok() && constant_time_equal(actual.value(), expected);
}

} // namespace saorsa_logic
