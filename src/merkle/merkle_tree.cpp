#include "merkle/merkle_tree.hpp"
#include "common/debug_control.hpp"
#include "hash/blake3.hpp"

#if SAORSA_LOGIC_PARALLEL
#include <omp.h>
#endif

namespace saorsa_logic {

namespace {

// Below this width a level is hashed sequentially
constexpr size_t PARALLEL_MIN_WIDTH = 64;

Side sibling_side(uint64_t node_index) {
    return (node_index % 2 == 0) ? Side::Right : Side::Left;
}

} // namespace

LogicResult<MerkleProof> MerkleProof::from_steps(uint64_t leaf_count, const std::vector<ProofStep>& steps) {
    if (steps.size() > MAX_DEPTH) {
        SAORSA_DEBUG_FPRINTF(stderr, "[saorsa_logic] proof has %zu steps, limit is %zu\n",
                             steps.size(), MAX_DEPTH);
        return LogicResult<MerkleProof>::err(LogicError::MalformedProof);
    }
    MerkleProof proof(leaf_count);
    for (const ProofStep& step : steps) {
        proof.push(step);
    }
    return LogicResult<MerkleProof>::ok(proof);
}

bool MerkleProof::push(const ProofStep& step) {
    if (depth_ >= MAX_DEPTH) {
        return false;
    }
    steps_[depth_++] = step;
    return true;
}

bool MerkleProof::operator==(const MerkleProof& rhs) const {
    if (leaf_count_ != rhs.leaf_count_ || depth_ != rhs.depth_) {
        return false;
    }
    for (size_t i = 0; i < depth_; ++i) {
        if (steps_[i] != rhs.steps_[i]) {
            return false;
        }
    }
    return true;
}

size_t tree_height(uint64_t leaf_count) {
    size_t height = 0;
    uint64_t width = leaf_count;
    while (width > 1) {
        width = width / 2 + (width % 2);
        ++height;
    }
    return height;
}

uint64_t level_width(uint64_t leaf_count, size_t level) {
    uint64_t width = leaf_count;
    for (size_t l = 0; l < level && width > 1; ++l) {
        width = width / 2 + (width % 2);
    }
    return width;
}

Digest hash_leaf_node(const MerkleLeaf& leaf) {
    return Blake3::hash_tagged(MERKLE_LEAF_TAG, leaf);
}

Digest hash_internal_node(const Digest& left, const Digest& right) {
    return Blake3::hash_tagged_pair(MERKLE_INTERNAL_TAG, left, right);
}

// ---------------------------------------------------------------------------
// Allocation-free strategy
// ---------------------------------------------------------------------------

namespace detail {

Digest subtree_node(const MerkleLeaf* leaves, size_t count, size_t level, size_t index) {
    if (level == 0) {
        return hash_leaf_node(leaves[index]);
    }

    uint64_t below_width = level_width(count, level - 1);
    Digest left = subtree_node(leaves, count, level - 1, 2 * index);
    if (2 * index + 1 >= below_width) {
        // Odd width: last node pairs with itself
        return hash_internal_node(left, left);
    }
    return hash_internal_node(left, subtree_node(leaves, count, level - 1, 2 * index + 1));
}

LogicResult<MerkleRoot> compute_root_recursive(const MerkleLeaf* leaves, size_t count) {
    if (leaves == nullptr || count == 0) {
        SAORSA_DEBUG_FPRINTF(stderr, "[saorsa_logic] cannot compute a Merkle root of no leaves\n");
        return LogicResult<MerkleRoot>::err(LogicError::InvalidLength);
    }
    return LogicResult<MerkleRoot>::ok(subtree_node(leaves, count, tree_height(count), 0));
}

LogicResult<MerkleProof> build_proof_recursive(const MerkleLeaf* leaves, size_t count, size_t index) {
    if (leaves == nullptr || index >= count) {
        SAORSA_DEBUG_FPRINTF(stderr, "[saorsa_logic] leaf index %zu out of range for %zu leaves\n",
                             index, count);
        return LogicResult<MerkleProof>::err(LogicError::MalformedProof);
    }

    MerkleProof proof(count);
    size_t height = tree_height(count);
    for (size_t level = 0; level < height; ++level) {
        uint64_t node = static_cast<uint64_t>(index) >> level;
        uint64_t sibling = node ^ 1;
        uint64_t width = level_width(count, level);

        ProofStep step;
        step.side = sibling_side(node);
        step.sibling = subtree_node(leaves, count, level, static_cast<size_t>(sibling < width ? sibling : node));
        proof.push(step);
    }
    return LogicResult<MerkleProof>::ok(proof);
}

} // namespace detail

// ---------------------------------------------------------------------------
// Cached tree
// ---------------------------------------------------------------------------

#if SAORSA_LOGIC_HAS_ALLOC

LogicResult<MerkleTree> MerkleTree::from_leaves(const MerkleLeaf* leaves, size_t count) {
    if (leaves == nullptr || count == 0) {
        SAORSA_DEBUG_FPRINTF(stderr, "[saorsa_logic] cannot build a Merkle tree with no leaves\n");
        return LogicResult<MerkleTree>::err(LogicError::InvalidLength);
    }

    MerkleTree tree;
    tree.leaves_.assign(leaves, leaves + count);
    tree.build_tree();
    return LogicResult<MerkleTree>::ok(std::move(tree));
}

LogicResult<MerkleTree> MerkleTree::from_leaves(const std::vector<MerkleLeaf>& leaves) {
    return from_leaves(leaves.data(), leaves.size());
}

void MerkleTree::build_tree() {
    const size_t count = leaves_.size();

    std::vector<Digest> leaf_nodes(count);
#if SAORSA_LOGIC_PARALLEL
    #pragma omp parallel for schedule(static) if(count >= PARALLEL_MIN_WIDTH)
#endif
    for (size_t i = 0; i < count; ++i) {
        leaf_nodes[i] = hash_leaf_node(leaves_[i]);
    }

    levels_.clear();
    levels_.reserve(tree_height(count) + 1);
    levels_.push_back(std::move(leaf_nodes));

    // Build level by level from leaves up to root
    while (levels_.back().size() > 1) {
        const std::vector<Digest>& below = levels_.back();
        const size_t below_width = below.size();
        const size_t width = below_width / 2 + (below_width % 2);
        std::vector<Digest> level(width);

#if SAORSA_LOGIC_PARALLEL
        #pragma omp parallel for schedule(static) if(width >= PARALLEL_MIN_WIDTH)
#endif
        for (size_t i = 0; i < width; ++i) {
            size_t left_child = 2 * i;
            size_t right_child = (2 * i + 1 < below_width) ? 2 * i + 1 : left_child;
            level[i] = hash_internal_node(below[left_child], below[right_child]);
        }

        levels_.push_back(std::move(level));
    }

    SAORSA_DEBUG_PRINT("[saorsa_logic] built Merkle tree: %zu leaves, height %zu\n", count, height());
}

LogicResult<MerkleLeaf> MerkleTree::leaf(size_t index) const {
    if (index >= leaves_.size()) {
        return LogicResult<MerkleLeaf>::err(LogicError::MalformedProof);
    }
    return LogicResult<MerkleLeaf>::ok(leaves_[index]);
}

LogicResult<MerkleProof> MerkleTree::authentication_path(size_t leaf_index) const {
    if (leaf_index >= leaves_.size()) {
        SAORSA_DEBUG_FPRINTF(stderr, "[saorsa_logic] leaf index %zu out of range for %zu leaves\n",
                             leaf_index, leaves_.size());
        return LogicResult<MerkleProof>::err(LogicError::MalformedProof);
    }

    MerkleProof proof(leaves_.size());
    size_t current_index = leaf_index;

    // Walk up to root
    for (size_t l = 0; l + 1 < levels_.size(); ++l) {
        const std::vector<Digest>& nodes = levels_[l];
        size_t sibling = sibling_index(current_index);
        if (sibling >= nodes.size()) {
            sibling = current_index;
        }
        proof.push(ProofStep{nodes[sibling], sibling_side(current_index)});
        current_index = parent_index(current_index);
    }

    return LogicResult<MerkleProof>::ok(proof);
}

#endif

// ---------------------------------------------------------------------------
// Public operations
// ---------------------------------------------------------------------------

LogicResult<MerkleRoot> compute_root(const MerkleLeaf* leaves, size_t count) {
#if SAORSA_LOGIC_HAS_ALLOC
    LogicResult<MerkleTree> tree = MerkleTree::from_leaves(leaves, count);
    if (tree.is_error()) {
        return LogicResult<MerkleRoot>::err(tree.error());
    }
    return LogicResult<MerkleRoot>::ok(tree.value().root());
#else
    return detail::compute_root_recursive(leaves, count);
#endif
}

LogicResult<MerkleRoot> compute_root(const std::vector<MerkleLeaf>& leaves) {
    return compute_root(leaves.data(), leaves.size());
}

LogicResult<MerkleProof> build_proof(const MerkleLeaf* leaves, size_t count, size_t index) {
#if SAORSA_LOGIC_HAS_ALLOC
    if (leaves == nullptr || index >= count) {
        SAORSA_DEBUG_FPRINTF(stderr, "[saorsa_logic] leaf index %zu out of range for %zu leaves\n",
                             index, count);
        return LogicResult<MerkleProof>::err(LogicError::MalformedProof);
    }
    LogicResult<MerkleTree> tree = MerkleTree::from_leaves(leaves, count);
    if (tree.is_error()) {
        return LogicResult<MerkleProof>::err(tree.error());
    }
    return tree.value().authentication_path(index);
#else
    return detail::build_proof_recursive(leaves, count, index);
#endif
}

LogicResult<MerkleProof> build_proof(const std::vector<MerkleLeaf>& leaves, size_t index) {
    return build_proof(leaves.data(), leaves.size(), index);
}

LogicResult<bool> verify_proof(
    const MerkleLeaf& leaf_hash,
    uint64_t index,
    const MerkleProof& proof,
    const MerkleRoot& expected_root
) {
    const uint64_t leaf_count = proof.leaf_count();
    if (leaf_count == 0 || index >= leaf_count) {
        SAORSA_DEBUG_FPRINTF(stderr, "[saorsa_logic] proof index %llu out of range for %llu leaves\n",
                             static_cast<unsigned long long>(index),
                             static_cast<unsigned long long>(leaf_count));
        return LogicResult<bool>::err(LogicError::MalformedProof);
    }
    if (proof.size() != tree_height(leaf_count)) {
        SAORSA_DEBUG_FPRINTF(stderr, "[saorsa_logic] proof has %zu steps, tree height is %zu\n",
                             proof.size(), tree_height(leaf_count));
        return LogicResult<bool>::err(LogicError::MalformedProof);
    }

    Digest current = hash_leaf_node(leaf_hash);
    bool sides_match = true;
    uint64_t node = index;
    for (const ProofStep& step : proof) {
        if (step.side != sibling_side(node)) {
            sides_match = false;
        }
        current = (step.side == Side::Left)
            ? hash_internal_node(step.sibling, current)
            : hash_internal_node(current, step.sibling);
        node /= 2;
    }

    return LogicResult<bool>::ok(sides_match && current == expected_root);
}

LogicResult<bool> verify_proof(
    const MerkleLeaf& leaf_hash,
    uint64_t index,
    uint64_t leaf_count,
    const MerkleProof& proof,
    const MerkleRoot& expected_root
) {
    if (proof.leaf_count() != leaf_count) {
        SAORSA_DEBUG_FPRINTF(stderr, "[saorsa_logic] proof built for %llu leaves, tree has %llu\n",
                             static_cast<unsigned long long>(proof.leaf_count()),
                             static_cast<unsigned long long>(leaf_count));
        return LogicResult<bool>::err(LogicError::MalformedProof);
    }
    return verify_proof(leaf_hash, index, proof, expected_root);
}

} // namespace saorsa_logic
