#include "Pack.h"

#include <xrpl/basics/contract.h>

#include <algorithm>
#include <cstring>
#include <stdexcept>

namespace ssz {
namespace merkle {

size_t itemsPerChunk(size_t itemSize) {
    if (itemSize == 0) {
        return 1;
    }
    if (CHUNK_SIZE % itemSize != 0) {
        throw std::invalid_argument("Item size must be a divisor of chunk size");
    }
    if (itemSize <= CHUNK_SIZE) {
        return CHUNK_SIZE / itemSize;
    }
    ripple::LogicError("itemsPerChunk : item size exceeds chunk size");
}

std::vector<uint256> pack(const std::vector<Slice>& items) {
    if (items.empty()) {
        return {EMPTY_CHUNK};
    }

    const size_t itemSize = items.front().size();
    const size_t perChunk = itemsPerChunk(itemSize);
    const size_t chunkCount = (items.size() + perChunk - 1) / perChunk;

    for (const auto& item : items) {
        if (item.size() != itemSize) {
            throw std::invalid_argument("Packed items must all have the same size");
        }
    }

    // Value-initialized chunks are zero, which supplies the right padding.
    std::vector<uint256> chunks(chunkCount);
    for (size_t i = 0; i < items.size(); ++i) {
        const size_t chunkIndex = i / perChunk;
        if (chunkIndex >= chunks.size()) {
            ripple::LogicError("pack : more item groups than computed chunks");
        }
        if (itemSize != 0) {
            std::memcpy(
                chunks[chunkIndex].data() + (i % perChunk) * itemSize,
                items[i].data(),
                itemSize);
        }
    }

    return chunks;
}

std::vector<uint256> packBytes(Slice const& bytes) {
    if (bytes.empty()) {
        return {EMPTY_CHUNK};
    }

    const size_t chunkCount = (bytes.size() + CHUNK_SIZE - 1) / CHUNK_SIZE;
    std::vector<uint256> chunks(chunkCount);

    for (size_t i = 0; i < chunkCount; ++i) {
        const size_t begin = i * CHUNK_SIZE;
        const size_t length = std::min(CHUNK_SIZE, bytes.size() - begin);
        std::memcpy(chunks[i].data(), bytes.data() + begin, length);
    }

    return chunks;
}

} // namespace merkle
} // namespace ssz
