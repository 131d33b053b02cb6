#include "Hash.h"

#include <openssl/sha.h>

#include <array>
#include <cstring>

namespace ssz {
namespace merkle {

uint256 hashBytes(Slice const& data) {
    uint256 result;
    SHA256(data.data(), data.size(), result.data());
    return result;
}

uint256 hashPair(const uint256& left, const uint256& right) {
    std::array<std::uint8_t, 2 * CHUNK_SIZE> input;
    std::memcpy(input.data(), left.data(), CHUNK_SIZE);
    std::memcpy(input.data() + CHUNK_SIZE, right.data(), CHUNK_SIZE);

    uint256 result;
    SHA256(input.data(), input.size(), result.data());
    return result;
}

} // namespace merkle
} // namespace ssz
