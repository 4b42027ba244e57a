#include "test_vector_loader.hpp"
#include "data/content_hash.hpp"
#include <array>
#include <fstream>
#include <stdexcept>

namespace saorsa_logic {

namespace {

const char* KNOWN_ANSWERS_FILE = "known_answers.json";

} // namespace

std::vector<uint8_t> bytes_from_hex(const std::string& hex) {
    if (hex.size() % 2 != 0) {
        throw std::invalid_argument("Odd-length hex string");
    }
    std::vector<uint8_t> out;
    out.reserve(hex.size() / 2);
    for (size_t i = 0; i < hex.size(); i += 2) {
        out.push_back(static_cast<uint8_t>(std::stoul(hex.substr(i, 2), nullptr, 16)));
    }
    return out;
}

Digest digest_from_hex(const std::string& hex) {
    std::optional<Digest> digest = Digest::from_hex(hex);
    if (!digest) {
        throw std::invalid_argument("Invalid digest hex: " + hex);
    }
    return *digest;
}

TestVectorLoader::TestVectorLoader(const std::string& test_data_dir)
    : test_data_dir_(test_data_dir) {}

std::string TestVectorLoader::file_path(const std::string& filename) const {
    return test_data_dir_ + "/" + filename;
}

nlohmann::json TestVectorLoader::load_json(const std::string& filename) const {
    std::ifstream file(file_path(filename));
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open file: " + file_path(filename));
    }
    return nlohmann::json::parse(file);
}

std::vector<TestVectorLoader::EntangledIdVector> TestVectorLoader::load_entangled_ids() const {
    auto json = load_json(KNOWN_ANSWERS_FILE);

    std::vector<EntangledIdVector> out;
    for (const auto& entry : json["entangled_id"]) {
        EntangledIdVector v;
        v.public_key_fill = entry["public_key_fill"].get<uint8_t>();
        v.binary_digest_fill = entry["binary_digest_fill"].get<uint8_t>();
        v.nonce = std::stoull(entry["nonce"].get<std::string>());
        v.id = digest_from_hex(entry["id"].get<std::string>());
        out.push_back(v);
    }
    return out;
}

TestVectorLoader::EntangledIdVector TestVectorLoader::load_entangled_id_pattern() const {
    auto json = load_json(KNOWN_ANSWERS_FILE);
    const auto& entry = json["entangled_id_pattern"];

    EntangledIdVector v;
    v.public_key_fill = 0;
    v.binary_digest_fill = 0;
    v.nonce = std::stoull(entry["nonce"].get<std::string>());
    v.id = digest_from_hex(entry["id"].get<std::string>());
    return v;
}

std::vector<TestVectorLoader::ContentHashVector> TestVectorLoader::load_content_hashes() const {
    auto json = load_json(KNOWN_ANSWERS_FILE);

    std::vector<ContentHashVector> out;
    for (const auto& entry : json["content_hash"]) {
        ContentHashVector v;
        v.data = bytes_from_hex(entry["data"].get<std::string>());
        v.hash = digest_from_hex(entry["hash"].get<std::string>());
        out.push_back(std::move(v));
    }
    return out;
}

std::vector<TestVectorLoader::MerkleVector> TestVectorLoader::load_merkle() const {
    auto json = load_json(KNOWN_ANSWERS_FILE);

    std::vector<MerkleVector> out;
    for (const auto& entry : json["merkle"]) {
        MerkleVector v;
        v.leaf_count = entry["leaf_count"].get<size_t>();
        v.root = digest_from_hex(entry["root"].get<std::string>());

        if (entry.contains("proofs")) {
            for (const auto& proof_json : entry["proofs"]) {
                std::vector<ProofStep> steps;
                for (const auto& step_json : proof_json) {
                    ProofStep step;
                    step.sibling = digest_from_hex(step_json["sibling"].get<std::string>());
                    step.side = step_json["side"].get<std::string>() == "left" ? Side::Left : Side::Right;
                    steps.push_back(step);
                }
                auto proof = MerkleProof::from_steps(v.leaf_count, steps);
                if (proof.is_error()) {
                    throw std::runtime_error("Known-answer proof exceeds maximum depth");
                }
                v.proofs.push_back(proof.value());
            }
        }
        out.push_back(std::move(v));
    }
    return out;
}

std::vector<MerkleLeaf> TestVectorLoader::merkle_leaves(size_t count) {
    std::vector<MerkleLeaf> leaves;
    leaves.reserve(count);
    for (size_t i = 0; i < count; ++i) {
        std::array<uint8_t, 8> index = encode_u64_le(static_cast<uint64_t>(i));
        leaves.push_back(compute_content_hash(index.data(), index.size()).value());
    }
    return leaves;
}

} // namespace saorsa_logic
