#pragma once

#include <libssz/merkle/Chunk.h>

#include <vector>

namespace ssz {
namespace merkle {

/** Number of significant bits in value; 0 for 0. */
size_t bitLength(size_t value);

/** Smallest power of two >= value, with 1 for 0. */
size_t nextPowerOfTwo(size_t value);

/**
 * Hash adjacent pairs of a tree layer into its parent layer.
 * Throws std::invalid_argument for an odd-length layer.
 */
std::vector<uint256> hashLayer(const std::vector<uint256>& layer);

/**
 * Merkle root of chunks over a virtual tree of at least padFor leaves.
 *
 * Missing leaves and subtrees are filled in with zero hashes, so padding to
 * a large capacity costs one hash per extra level. An empty sequence with
 * padFor 1 yields the zero chunk, a single chunk yields itself.
 */
uint256 merkleize(const std::vector<uint256>& chunks, size_t padFor = 1);

/** hash(root || length as 32 little-endian bytes). */
uint256 mixInLength(const uint256& root, std::uint64_t length);

/**
 * Same digest for a length of up to 256 bits.
 *
 * uint256 keeps its most significant byte first in data(), so the bytes are
 * written reversed to form the little-endian encoding.
 */
uint256 mixInLength(const uint256& root, const uint256& length);

} // namespace merkle
} // namespace ssz
