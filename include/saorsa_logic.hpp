#pragma once

/**
 * saorsa_logic - pure verification core
 *
 * Entangled attestation, content hashing and Merkle inclusion proofs over
 * byte buffers. Deterministic, free of I/O, clocks and randomness, so the same
 * computation can run natively or inside a zkVM guest.
 */

#include "common/config.hpp"
#include "common/error.hpp"
#include "types/digest.hpp"
#include "hash/blake3.hpp"
#include "data/content_hash.hpp"
#include "merkle/merkle_tree.hpp"
#include "attestation/entangled_id.hpp"
