#pragma once

#include "common/error.hpp"
#include "hash/blake3.hpp"
#include "types/digest.hpp"
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace saorsa_logic {

/**
 * Content addressing
 *
 * The content hash is the plain digest of the bytes, with no domain tag, so
 * that it matches any independent BLAKE3 hash of the same content.
 */

// Null data with a non-zero length is InvalidLength
LogicResult<ContentHash> compute_content_hash(const uint8_t* data, size_t len);
LogicResult<ContentHash> compute_content_hash(const std::vector<uint8_t>& data);
LogicResult<ContentHash> compute_content_hash(const std::string& data);

// false on any mismatch; never an error
bool verify_content_hash(const uint8_t* data, size_t len, const ContentHash& expected);
bool verify_content_hash(const std::vector<uint8_t>& data, const ContentHash& expected);
bool verify_content_hash(const std::string& data, const ContentHash& expected);

/**
 * ContentHasher - content hash over data delivered in chunks
 *
 * Feeding the same bytes in any chunking gives the same ContentHash as
 * compute_content_hash over their concatenation.
 */
class ContentHasher {
public:
    ContentHasher() = default;

    void update(const uint8_t* data, size_t len) { hasher_.update(data, len); }
    void update(const std::vector<uint8_t>& data) { hasher_.update(data.data(), data.size()); }

    LogicResult<ContentHash> finalize() const { return hasher_.finalize(); }

    bool verify(const ContentHash& expected) const;

private:
    Blake3 hasher_;
};

} // namespace saorsa_logic
