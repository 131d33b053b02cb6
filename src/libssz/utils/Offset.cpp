#include "Offset.h"

namespace ssz {
namespace utils {

std::array<std::uint8_t, OFFSET_SIZE> encodeOffset(std::uint32_t offset) {
    std::array<std::uint8_t, OFFSET_SIZE> out;
    for (size_t i = 0; i < OFFSET_SIZE; ++i) {
        out[i] = static_cast<std::uint8_t>(offset >> (8 * i));
    }
    return out;
}

std::uint32_t decodeOffset(Slice const& data) {
    if (data.size() != OFFSET_SIZE) {
        throw DeserializationError(
            "Offset must be " + std::to_string(OFFSET_SIZE) + " bytes, got " +
                std::to_string(data.size()),
            OFFSET_SIZE,
            data.size());
    }

    std::uint32_t offset = 0;
    for (size_t i = 0; i < OFFSET_SIZE; ++i) {
        offset |= static_cast<std::uint32_t>(data[i]) << (8 * i);
    }
    return offset;
}

Blob readExact(size_t numBytes, ripple::SerialIter& sit) {
    const size_t available = sit.getBytesLeft();
    if (available < numBytes) {
        throw DeserializationError(
            "Tried to read " + std::to_string(numBytes) + ". Only got " +
                std::to_string(available) + " bytes",
            numBytes,
            available);
    }

    const Slice data = sit.getSlice(numBytes);
    return Blob(data.begin(), data.end());
}

std::uint32_t readOffset(ripple::SerialIter& sit) {
    const Blob data = readExact(OFFSET_SIZE, sit);
    return decodeOffset(Slice{data.data(), data.size()});
}

} // namespace utils
} // namespace ssz
