#include "ZeroHashes.h"
#include "Hash.h"

#include <stdexcept>
#include <string>

namespace ssz {
namespace merkle {

ZeroHashes::ZeroHashes() {
    hashes_[0] = EMPTY_CHUNK;
    for (size_t depth = 1; depth < hashes_.size(); ++depth) {
        hashes_[depth] = hashPair(hashes_[depth - 1], hashes_[depth - 1]);
    }
}

const ZeroHashes& ZeroHashes::instance() {
    static const ZeroHashes table;
    return table;
}

const uint256& ZeroHashes::at(size_t depth) const {
    if (depth >= hashes_.size()) {
        throw std::out_of_range(
            "Zero hash depth " + std::to_string(depth) + " exceeds table size " +
            std::to_string(hashes_.size()));
    }
    return hashes_[depth];
}

const uint256& zeroHash(size_t depth) {
    return ZeroHashes::instance().at(depth);
}

} // namespace merkle
} // namespace ssz
