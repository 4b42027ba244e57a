/**
 * Known-Answer Vector Utility
 *
 * Reads a JSON request describing attestation inputs, content blobs and
 * Merkle leaf sets, and writes the derived EntangledIds, content hashes,
 * roots and proofs as JSON. Regenerates tests/data/known_answers.json from
 * tests/data/known_answers_request.json.
 *
 * Usage: compute_vectors <request.json> [output.json]
 */

#include <array>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

#include "saorsa_logic.hpp"

using namespace saorsa_logic;

namespace {

std::vector<uint8_t> parse_hex(const std::string& hex) {
    if (hex.size() % 2 != 0) {
        throw std::runtime_error("Odd-length hex string: " + hex);
    }
    std::vector<uint8_t> out;
    out.reserve(hex.size() / 2);
    for (size_t i = 0; i < hex.size(); i += 2) {
        out.push_back(static_cast<uint8_t>(std::stoul(hex.substr(i, 2), nullptr, 16)));
    }
    return out;
}

std::string to_hex(const std::vector<uint8_t>& bytes) {
    static const char* digits = "0123456789abcdef";
    std::string out;
    out.reserve(bytes.size() * 2);
    for (uint8_t b : bytes) {
        out.push_back(digits[b >> 4]);
        out.push_back(digits[b & 0x0F]);
    }
    return out;
}

template <typename T>
const T& expect_ok(const LogicResult<T>& result, const std::string& what) {
    if (result.is_error()) {
        throw std::runtime_error(what + ": " + to_string(result.error()));
    }
    return result.value();
}

// "<name>" hex, "<name>_fill" byte repeated `len` times, or "<name>_pattern" bytes i % 256
std::vector<uint8_t> bytes_field(const nlohmann::json& entry, const std::string& name, size_t len) {
    if (entry.contains(name)) {
        return parse_hex(entry[name].get<std::string>());
    }
    if (entry.contains(name + "_fill")) {
        return std::vector<uint8_t>(len, entry[name + "_fill"].get<uint8_t>());
    }
    if (entry.contains(name + "_pattern")) {
        std::vector<uint8_t> out(len);
        for (size_t i = 0; i < len; ++i) {
            out[i] = static_cast<uint8_t>(i % 256);
        }
        return out;
    }
    throw std::runtime_error("Missing field: " + name);
}

nlohmann::json entangled_id_entry(const nlohmann::json& entry) {
    std::vector<uint8_t> pk = bytes_field(entry, "public_key", PUBLIC_KEY_LEN);
    std::vector<uint8_t> bd = bytes_field(entry, "binary_digest", Digest::LEN);
    uint64_t nonce = std::stoull(entry["nonce"].get<std::string>());

    nlohmann::json out = entry;
    out["id"] = expect_ok(derive_entangled_id(pk, bd, nonce), "derive_entangled_id").to_hex();
    return out;
}

std::vector<MerkleLeaf> merkle_leaves(const nlohmann::json& entry) {
    std::vector<MerkleLeaf> leaves;
    if (entry.contains("leaves")) {
        for (const auto& hex : entry["leaves"]) {
            auto leaf = Digest::from_hex(hex.get<std::string>());
            if (!leaf) {
                throw std::runtime_error("Invalid leaf hex");
            }
            leaves.push_back(*leaf);
        }
        return leaves;
    }

    // Leaf i is the content hash of i as 8 little-endian bytes
    size_t count = entry["leaf_count"].get<size_t>();
    for (size_t i = 0; i < count; ++i) {
        std::array<uint8_t, 8> index = encode_u64_le(static_cast<uint64_t>(i));
        leaves.push_back(expect_ok(compute_content_hash(index.data(), index.size()), "compute_content_hash"));
    }
    return leaves;
}

nlohmann::json merkle_entry(const nlohmann::json& entry) {
    std::vector<MerkleLeaf> leaves = merkle_leaves(entry);

    nlohmann::json out;
    out["leaf_count"] = leaves.size();
    out["root"] = expect_ok(compute_root(leaves), "compute_root").to_hex();

    if (entry.value("with_proofs", false)) {
        nlohmann::json proofs = nlohmann::json::array();
        for (size_t i = 0; i < leaves.size(); ++i) {
            MerkleProof proof = expect_ok(build_proof(leaves, i), "build_proof");
            nlohmann::json steps = nlohmann::json::array();
            for (const ProofStep& step : proof) {
                steps.push_back({
                    {"sibling", step.sibling.to_hex()},
                    {"side", step.side == Side::Left ? "left" : "right"},
                });
            }
            proofs.push_back(steps);
        }
        out["proofs"] = proofs;
    }
    return out;
}

nlohmann::json compute_vectors(const nlohmann::json& request) {
    nlohmann::json doc;

    doc["entangled_id"] = nlohmann::json::array();
    for (const auto& entry : request.value("entangled_id", nlohmann::json::array())) {
        doc["entangled_id"].push_back(entangled_id_entry(entry));
    }

    if (request.contains("entangled_id_pattern")) {
        nlohmann::json entry = request["entangled_id_pattern"];
        entry["public_key_pattern"] = true;
        entry["binary_digest_pattern"] = true;
        nlohmann::json derived = entangled_id_entry(entry);
        doc["entangled_id_pattern"] = {{"nonce", derived["nonce"]}, {"id", derived["id"]}};
    }

    doc["content_hash"] = nlohmann::json::array();
    for (const auto& entry : request.value("content_hash", nlohmann::json::array())) {
        std::vector<uint8_t> data = parse_hex(entry["data"].get<std::string>());
        doc["content_hash"].push_back({
            {"data", to_hex(data)},
            {"hash", expect_ok(compute_content_hash(data), "compute_content_hash").to_hex()},
        });
    }

    doc["merkle"] = nlohmann::json::array();
    for (const auto& entry : request.value("merkle", nlohmann::json::array())) {
        doc["merkle"].push_back(merkle_entry(entry));
    }

    return doc;
}

} // namespace

int main(int argc, char** argv) {
    if (argc < 2 || argc > 3) {
        std::cerr << "Usage: " << argv[0] << " <request.json> [output.json]" << std::endl;
        return 2;
    }

    try {
        std::ifstream in(argv[1]);
        if (!in.is_open()) {
            throw std::runtime_error(std::string("Could not open request: ") + argv[1]);
        }
        nlohmann::json request = nlohmann::json::parse(in);
        nlohmann::json doc = compute_vectors(request);

        if (argc == 3) {
            std::ofstream out(argv[2]);
            if (!out.is_open()) {
                throw std::runtime_error(std::string("Could not open output: ") + argv[2]);
            }
            out << doc.dump(2) << "\n";
        } else {
            std::cout << doc.dump(2) << std::endl;
        }
    } catch (const std::exception& e) {
        std::cerr << "compute_vectors: " << e.what() << std::endl;
        return 1;
    }
    return 0;
}
