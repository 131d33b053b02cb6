#include "Merkleize.h"
#include "Hash.h"
#include "MerkleAccumulator.h"

#include <algorithm>
#include <array>
#include <cstring>
#include <limits>
#include <stdexcept>

namespace ssz {
namespace merkle {

size_t bitLength(size_t value) {
    size_t bits = 0;
    while (value != 0) {
        ++bits;
        value >>= 1;
    }
    return bits;
}

size_t nextPowerOfTwo(size_t value) {
    if (value <= 1) {
        return 1;
    }
    const size_t shift = bitLength(value - 1);
    if (shift >= std::numeric_limits<size_t>::digits) {
        throw std::overflow_error("Next power of two does not fit in size_t");
    }
    return size_t{1} << shift;
}

std::vector<uint256> hashLayer(const std::vector<uint256>& layer) {
    if (layer.size() % 2 != 0) {
        throw std::invalid_argument("Layer must have an even number of elements");
    }

    std::vector<uint256> parents;
    parents.reserve(layer.size() / 2);
    for (size_t i = 0; i < layer.size(); i += 2) {
        parents.push_back(hashPair(layer[i], layer[i + 1]));
    }
    return parents;
}

uint256 merkleize(const std::vector<uint256>& chunks, size_t padFor) {
    MerkleAccumulator accumulator;
    accumulator.appendBatch(chunks);
    return accumulator.root(padFor);
}

uint256 mixInLength(const uint256& root, std::uint64_t length) {
    std::array<std::uint8_t, 2 * CHUNK_SIZE> input{};
    std::memcpy(input.data(), root.data(), CHUNK_SIZE);
    for (size_t i = 0; i < sizeof(length); ++i) {
        input[CHUNK_SIZE + i] = static_cast<std::uint8_t>(length >> (8 * i));
    }
    return hashBytes(Slice{input.data(), input.size()});
}

uint256 mixInLength(const uint256& root, const uint256& length) {
    std::array<std::uint8_t, 2 * CHUNK_SIZE> input;
    std::memcpy(input.data(), root.data(), CHUNK_SIZE);
    std::reverse_copy(length.begin(), length.end(), input.begin() + CHUNK_SIZE);
    return hashBytes(Slice{input.data(), input.size()});
}

} // namespace merkle
} // namespace ssz
