#pragma once

#include <libssz/merkle/Chunk.h>

#include <array>

namespace ssz {
namespace merkle {

/**
 * Roots of all-zero subtrees, indexed by height.
 *
 * Entry 0 is the zero chunk and entry d is hashPair(entry[d-1], entry[d-1]).
 * The table is built on first use and is read-only afterwards, so any
 * number of threads may read it without locking.
 */
class ZeroHashes {
public:
    static const ZeroHashes& instance();

    // Throws std::out_of_range for depth >= ZERO_HASH_DEPTH.
    const uint256& at(size_t depth) const;

    static constexpr size_t size() { return ZERO_HASH_DEPTH; }

    ZeroHashes(const ZeroHashes&) = delete;
    ZeroHashes& operator=(const ZeroHashes&) = delete;

private:
    ZeroHashes();

    std::array<uint256, ZERO_HASH_DEPTH> hashes_;
};

/** Shorthand for ZeroHashes::instance().at(depth). */
const uint256& zeroHash(size_t depth);

} // namespace merkle
} // namespace ssz
