#pragma once

#include <libssz/merkle/Chunk.h>

#include <xrpl/beast/utility/Journal.h>

#include <array>
#include <limits>
#include <vector>

namespace ssz {
namespace merkle {

/**
 * Incremental Merkle accumulator
 *
 * Streams chunks into a binary Merkle tree one leaf at a time, keeping a
 * single pending node per tree level instead of the tree itself.
 * - O(1) amortized hashing per append
 * - O(log n) finalization, padded virtually with zero hashes
 * - root() does not consume the accumulator; more chunks may follow
 *
 * Appending cs and then calling root(padFor) gives the same digest as
 * merkleize(cs, padFor).
 */
class MerkleAccumulator {
public:
    // A size_t leaf index spans at most 64 levels below the root.
    static constexpr size_t MAX_LEVELS = std::numeric_limits<size_t>::digits + 1;
    static constexpr size_t UNLIMITED = std::numeric_limits<size_t>::max();

    explicit MerkleAccumulator(
        size_t limit = UNLIMITED,
        beast::Journal j = beast::Journal{beast::Journal::getNullSink()});

    // Returns the position of the new leaf. Throws std::overflow_error
    // once limit() leaves have been appended.
    size_t append(const uint256& chunk);

    // All-or-nothing: throws std::overflow_error without appending anything
    // if the batch does not fit under the limit.
    void appendBatch(const std::vector<uint256>& chunks);

    // Root of the tree padded to at least padFor leaves (0 counts as 1).
    uint256 root(size_t padFor = 1) const;

    size_t size() const { return count_; }
    bool empty() const { return count_ == 0; }
    size_t limit() const { return limit_; }
    void clear();

private:
    using Slots = std::array<uint256, MAX_LEVELS>;

    static void merge(Slots& slots, uint256 node, size_t index, size_t fillDepth);

    size_t limit_;
    size_t count_;

    // slots_[level] holds the completed left subtree still waiting for
    // its right sibling at that level.
    Slots slots_;

    beast::Journal j_;
};

} // namespace merkle
} // namespace ssz
