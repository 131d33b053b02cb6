#pragma once

#include <libssz/merkle/Chunk.h>

#include <xrpl/protocol/Serializer.h>

#include <array>
#include <stdexcept>
#include <string>

namespace ssz {
namespace utils {

using merkle::Blob;
using merkle::OFFSET_SIZE;
using merkle::Slice;

/** Raised when serialized input is shorter than a field requires. */
class DeserializationError : public std::runtime_error {
public:
    DeserializationError(const std::string& message, size_t requested, size_t available)
        : std::runtime_error(message), requested_(requested), available_(available) {}

    size_t requested() const { return requested_; }
    size_t available() const { return available_; }

private:
    size_t requested_;
    size_t available_;
};

std::array<std::uint8_t, OFFSET_SIZE> encodeOffset(std::uint32_t offset);

// Throws DeserializationError unless data is exactly OFFSET_SIZE bytes.
std::uint32_t decodeOffset(Slice const& data);

/**
 * Read exactly numBytes from the iterator.
 *
 * Throws DeserializationError, leaving the iterator untouched, if fewer
 * bytes remain.
 */
Blob readExact(size_t numBytes, ripple::SerialIter& sit);

std::uint32_t readOffset(ripple::SerialIter& sit);

} // namespace utils
} // namespace ssz
