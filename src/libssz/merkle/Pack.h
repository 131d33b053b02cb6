#pragma once

#include <libssz/merkle/Chunk.h>

#include <vector>

namespace ssz {
namespace merkle {

/**
 * Number of items of the given size that share one chunk.
 *
 * Zero-size items count as one per chunk. Throws std::invalid_argument when
 * itemSize does not divide CHUNK_SIZE.
 */
size_t itemsPerChunk(size_t itemSize);

/**
 * Pack same-size serialized items into chunks.
 *
 * Items are laid out back to back and the last chunk is zero-padded on the
 * right. An empty input packs to a single EMPTY_CHUNK. Throws
 * std::invalid_argument if the items do not all share the first item's size.
 */
std::vector<uint256> pack(const std::vector<Slice>& items);

/** Split a byte string into chunks, zero-padding only the last partial one. */
std::vector<uint256> packBytes(Slice const& bytes);

} // namespace merkle
} // namespace ssz
