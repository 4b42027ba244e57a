#pragma once

#include "common/config.hpp"
#include "common/error.hpp"
#include "types/digest.hpp"
#include <array>
#include <cstddef>
#include <cstdint>
#include <vector>

namespace saorsa_logic {

// Domain tags keep leaf nodes and internal nodes from being reinterpreted as each other
constexpr uint8_t MERKLE_LEAF_TAG = 0x00;
constexpr uint8_t MERKLE_INTERNAL_TAG = 0x01;

// Side of the running hash on which a proof step's sibling sits
enum class Side : uint8_t {
    Left = 0,
    Right = 1,
};

struct ProofStep {
    Digest sibling;
    Side side;

    bool operator==(const ProofStep& rhs) const { return sibling == rhs.sibling && side == rhs.side; }
    bool operator!=(const ProofStep& rhs) const { return !(*this == rhs); }
};

/**
 * MerkleProof - inclusion proof from a leaf up to the root
 *
 * Steps are stored inline (no heap), bottom level first. The proof also
 * records the leaf count of the tree it was built from, which fixes the
 * expected number of steps.
 */
class MerkleProof {
public:
    // ceil(log2(leaf_count)) never exceeds 64 for a 64-bit leaf count
    static constexpr size_t MAX_DEPTH = 64;

    MerkleProof() : steps_{}, depth_(0), leaf_count_(0) {}
    explicit MerkleProof(uint64_t leaf_count) : steps_{}, depth_(0), leaf_count_(leaf_count) {}

    // Rebuild a proof received from a caller; more than MAX_DEPTH steps is MalformedProof
    static LogicResult<MerkleProof> from_steps(uint64_t leaf_count, const std::vector<ProofStep>& steps);

    uint64_t leaf_count() const { return leaf_count_; }
    size_t size() const { return depth_; }
    bool empty() const { return depth_ == 0; }

    const ProofStep& operator[](size_t i) const { return steps_[i]; }
    ProofStep& operator[](size_t i) { return steps_[i]; }

    const ProofStep* begin() const { return steps_.data(); }
    const ProofStep* end() const { return steps_.data() + depth_; }

    // Returns false when the proof is already MAX_DEPTH steps long
    bool push(const ProofStep& step);

    std::vector<ProofStep> to_steps() const { return std::vector<ProofStep>(begin(), end()); }

    bool operator==(const MerkleProof& rhs) const;
    bool operator!=(const MerkleProof& rhs) const { return !(*this == rhs); }

private:
    std::array<ProofStep, MAX_DEPTH> steps_;
    size_t depth_;
    uint64_t leaf_count_;
};

// ceil(log2(leaf_count)); 0 for zero or one leaf
size_t tree_height(uint64_t leaf_count);

// Width of `level` (0 = leaves) when each level pairs its last node with itself
uint64_t level_width(uint64_t leaf_count, size_t level);

Digest hash_leaf_node(const MerkleLeaf& leaf);
Digest hash_internal_node(const Digest& left, const Digest& right);

/**
 * Merkle operations over already-hashed leaves
 *
 * - compute_root: empty input is InvalidLength
 * - build_proof: index out of range (including no leaves) is MalformedProof
 * - verify_proof: MalformedProof when the leaf count is zero, the index is out
 *   of range for it, or the step count is not tree_height(leaf_count).
 *   A wrong root, leaf, sibling or side is a `false` result.
 *
 * Duplicating the last node of an odd level means [a, b, c] and [a, b, c, c]
 * share a root. The four-argument verify_proof takes the leaf count from the
 * proof itself, so a proof built over the padded list verifies index 3 against
 * the three-leaf root. Callers that know the committed leaf count pass it to
 * the five-argument overload, which rejects a proof recording any other count.
 *
 * Without dynamic allocation, root and proofs are recomputed recursively in
 * O(log n) stack. With it, they come from a cached MerkleTree. Both give the
 * same bytes.
 */
LogicResult<MerkleRoot> compute_root(const MerkleLeaf* leaves, size_t count);
LogicResult<MerkleRoot> compute_root(const std::vector<MerkleLeaf>& leaves);

LogicResult<MerkleProof> build_proof(const MerkleLeaf* leaves, size_t count, size_t index);
LogicResult<MerkleProof> build_proof(const std::vector<MerkleLeaf>& leaves, size_t index);

LogicResult<bool> verify_proof(
    const MerkleLeaf& leaf_hash,
    uint64_t index,
    const MerkleProof& proof,
    const MerkleRoot& expected_root
);

LogicResult<bool> verify_proof(
    const MerkleLeaf& leaf_hash,
    uint64_t index,
    uint64_t leaf_count,
    const MerkleProof& proof,
    const MerkleRoot& expected_root
);

namespace detail {

// Node `index` at `level`, recomputed from the leaves without heap allocation
Digest subtree_node(const MerkleLeaf* leaves, size_t count, size_t level, size_t index);

LogicResult<MerkleRoot> compute_root_recursive(const MerkleLeaf* leaves, size_t count);
LogicResult<MerkleProof> build_proof_recursive(const MerkleLeaf* leaves, size_t count, size_t index);

} // namespace detail

#if SAORSA_LOGIC_HAS_ALLOC

/**
 * MerkleTree - every level of the tree, cached
 *
 * levels_[0] holds the tagged leaf nodes and the last level holds the root.
 * Nodes of one level are independent, so native builds hash them in parallel.
 */
class MerkleTree {
public:
    static LogicResult<MerkleTree> from_leaves(const MerkleLeaf* leaves, size_t count);
    static LogicResult<MerkleTree> from_leaves(const std::vector<MerkleLeaf>& leaves);

    MerkleRoot root() const { return levels_.back()[0]; }

    size_t num_leaves() const { return leaves_.size(); }

    // Number of proof steps per leaf
    size_t height() const { return levels_.size() - 1; }

    // Original (untagged) leaf; out of range is MalformedProof
    LogicResult<MerkleLeaf> leaf(size_t index) const;

    // Out of range is MalformedProof
    LogicResult<MerkleProof> authentication_path(size_t leaf_index) const;

    const std::vector<Digest>& level(size_t level_index) const { return levels_[level_index]; }

    // Index of the sibling within the same level
    static size_t sibling_index(size_t node_index) { return node_index ^ 1; }

    // Index of the parent in the level above
    static size_t parent_index(size_t node_index) { return node_index / 2; }

private:
    MerkleTree() = default;

    void build_tree();

    std::vector<MerkleLeaf> leaves_;
    std::vector<std::vector<Digest>> levels_;
};

#endif

} // namespace saorsa_logic
