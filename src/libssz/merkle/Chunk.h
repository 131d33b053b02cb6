#pragma once

#include <xrpl/basics/Blob.h>
#include <xrpl/basics/Slice.h>
#include <xrpl/basics/base_uint.h>

#include <cstddef>
#include <cstdint>

namespace ssz {
namespace merkle {

using ripple::Blob;
using ripple::Slice;
using ripple::uint256;

/** Width of a Merkle leaf, in bytes. Fixed for the whole format. */
constexpr size_t CHUNK_SIZE = 32;

/** Width of a variable-size container offset, little-endian. */
constexpr size_t OFFSET_SIZE = 4;

/** Number of entries in the zero-hash table (depths 0..99). */
constexpr size_t ZERO_HASH_DEPTH = 100;

static_assert(uint256::bytes == CHUNK_SIZE, "A chunk is one uint256");

/** The all-zero chunk, also the packing of an empty input. */
inline const uint256 EMPTY_CHUNK{};

} // namespace merkle
} // namespace ssz
