#pragma once

#include <libssz/merkle/Chunk.h>

namespace ssz {
namespace merkle {

/**
 * The one hash function used for every tree node.
 *
 * SHA-256 over an arbitrary byte string. The zero-hash table, the
 * merkleizer and the length mixer all go through hashPair, so the table
 * always agrees with the roots it pads.
 */
uint256 hashBytes(Slice const& data);

/** Hash of left || right. */
uint256 hashPair(const uint256& left, const uint256& right);

} // namespace merkle
} // namespace ssz
