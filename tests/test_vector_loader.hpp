#pragma once

#include "merkle/merkle_tree.hpp"
#include "types/digest.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <string>
#include <vector>

namespace saorsa_logic {

/**
 * TestVectorLoader - reads tests/data/known_answers.json
 *
 * The file is produced by the compute_vectors tool and pins the exact bytes
 * of every derived value.
 */
class TestVectorLoader {
public:
    struct EntangledIdVector {
        uint8_t public_key_fill;
        uint8_t binary_digest_fill;
        uint64_t nonce;
        Digest id;
    };

    struct ContentHashVector {
        std::vector<uint8_t> data;
        Digest hash;
    };

    struct MerkleVector {
        size_t leaf_count;
        Digest root;
        // Empty unless the file lists proofs for this leaf count
        std::vector<MerkleProof> proofs;
    };

    explicit TestVectorLoader(const std::string& test_data_dir);

    std::vector<EntangledIdVector> load_entangled_ids() const;

    // Key bytes i % 256, binary digest bytes 0..31
    EntangledIdVector load_entangled_id_pattern() const;

    std::vector<ContentHashVector> load_content_hashes() const;
    std::vector<MerkleVector> load_merkle() const;

    // Leaf i of every Merkle vector is the content hash of i as 8 little-endian bytes
    static std::vector<MerkleLeaf> merkle_leaves(size_t count);

private:
    std::string test_data_dir_;

    std::string file_path(const std::string& filename) const;
    nlohmann::json load_json(const std::string& filename) const;
};

// Throws std::invalid_argument on malformed hex
std::vector<uint8_t> bytes_from_hex(const std::string& hex);
Digest digest_from_hex(const std::string& hex);

} // namespace saorsa_logic
