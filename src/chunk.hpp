#pragma once

#include "chunk_type.hpp"

#include <cstdint>
#include <istream>
#include <ostream>
#include <string>
#include <vector>

namespace pngme {

/**
 * @brief One length/type/data/crc record
 *
 * Immutable once built. The crc always matches type and data: it is either
 * computed by the constructor or read from input and verified.
 */
class Chunk {
public:
    /**
     * @brief Build a chunk and compute its crc
     * @throws std::length_error if data does not fit the 32-bit length field
     */
    Chunk(ChunkType type, std::vector<uint8_t> data);

    /**
     * @brief Decode a buffer holding exactly one chunk
     *
     * Errors, in the order they are checked:
     * - TruncatedInput: fewer than 12 bytes, or length runs past the buffer
     * - InvalidTagByte: type bytes are not letters
     * - ChecksumMismatch: stored crc disagrees with type + data
     * - TrailingBytes: bytes remain after the crc
     */
    static Chunk parse(const std::vector<uint8_t>& bytes);

    /**
     * @brief Read the next chunk from a stream
     *
     * Same checks as parse() except TrailingBytes: the stream is left
     * positioned just after the crc.
     */
    static Chunk read(std::istream& in);

    uint32_t length() const noexcept { return length_; }
    const ChunkType& chunk_type() const noexcept { return type_; }
    const std::vector<uint8_t>& data() const noexcept { return data_; }
    uint32_t crc() const noexcept { return crc_; }

    /**
     * @throws PngmeError InvalidEncoding if data is not valid UTF-8
     */
    std::string data_as_string() const;

    std::vector<uint8_t> as_bytes() const;

    bool operator==(const Chunk&) const = default;

private:
    Chunk(ChunkType type, std::vector<uint8_t> data, uint32_t stored_crc);

    uint32_t length_;
    ChunkType type_;
    std::vector<uint8_t> data_;
    uint32_t crc_;
};

std::ostream& operator<<(std::ostream& os, const Chunk& chunk);

} // namespace pngme
