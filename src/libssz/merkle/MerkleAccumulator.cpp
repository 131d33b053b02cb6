#include "MerkleAccumulator.h"
#include "Hash.h"
#include "Merkleize.h"
#include "ZeroHashes.h"

#include <xrpl/basics/Log.h>

#include <algorithm>
#include <stdexcept>
#include <string>

namespace ssz {
namespace merkle {

namespace {

bool bitSet(size_t value, size_t bit) {
    return bit < std::numeric_limits<size_t>::digits && ((value >> bit) & 1) != 0;
}

bool isPowerOfTwo(size_t value) {
    return value != 0 && (value & (value - 1)) == 0;
}

} // namespace

MerkleAccumulator::MerkleAccumulator(size_t limit, beast::Journal j)
    : limit_(limit), count_(0), slots_{}, j_(j) {
}

void MerkleAccumulator::merge(Slots& slots, uint256 node, size_t index, size_t fillDepth) {
    size_t level = 0;
    for (;;) {
        if (!bitSet(index, level)) {
            // A left node only climbs further when it is the virtual leaf
            // closing the rightmost partial subtree below fillDepth.
            if (level >= fillDepth) {
                break;
            }
            node = hashPair(node, zeroHash(level));
        } else {
            node = hashPair(slots[level], node);
        }
        ++level;
    }
    slots[level] = node;
}

size_t MerkleAccumulator::append(const uint256& chunk) {
    if (count_ >= limit_) {
        JLOG(j_.warn()) << "Merkle accumulator full at " << count_ << " leaves";
        throw std::overflow_error("Merkle accumulator is full");
    }

    const size_t position = count_;
    merge(slots_, chunk, position, 0);
    ++count_;

    JLOG(j_.trace()) << "Appended leaf " << position << ": " << chunk;
    return position;
}

void MerkleAccumulator::appendBatch(const std::vector<uint256>& chunks) {
    if (chunks.size() > limit_ - count_) {
        JLOG(j_.warn()) << "Rejected batch of " << chunks.size() << " leaves, "
                        << (limit_ - count_) << " slots left";
        throw std::overflow_error(
            "Batch of " + std::to_string(chunks.size()) +
            " leaves exceeds the accumulator limit");
    }

    for (const auto& chunk : chunks) {
        merge(slots_, chunk, count_, 0);
        ++count_;
    }

    JLOG(j_.trace()) << "Appended batch of " << chunks.size() << " leaves";
}

uint256 MerkleAccumulator::root(size_t padFor) const {
    const size_t chunkDepth = bitLength(count_ == 0 ? 0 : count_ - 1);
    const size_t padDepth = bitLength(padFor == 0 ? 0 : padFor - 1);
    const size_t maxDepth = std::max(chunkDepth, padDepth);

    Slots slots = slots_;

    // Close the rightmost partial subtree, or stand in a zero leaf when
    // nothing has been appended.
    if (!isPowerOfTwo(count_)) {
        merge(slots, zeroHash(0), count_, chunkDepth);
    }

    // Grow past the next power of two up to the requested virtual size.
    for (size_t level = chunkDepth; level < maxDepth; ++level) {
        slots[level + 1] = hashPair(slots[level], zeroHash(level));
    }

    JLOG(j_.debug()) << "Root over " << count_ << " leaves at depth " << maxDepth
                     << ": " << slots[maxDepth];
    return slots[maxDepth];
}

void MerkleAccumulator::clear() {
    count_ = 0;
    slots_.fill(uint256{});
}

} // namespace merkle
} // namespace ssz
