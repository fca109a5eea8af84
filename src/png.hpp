#pragma once

#include "chunk.hpp"

#include <array>
#include <cstdint>
#include <ostream>
#include <string_view>
#include <vector>

namespace pngme {

/**
 * @brief Signature followed by a sequence of chunks
 *
 * Only framing is handled here; image semantics of the chunks are not
 * interpreted.
 */
class Png {
public:
    explicit Png(std::vector<Chunk> chunks) : chunks_(std::move(chunks)) {}

    /**
     * @throws PngmeError InvalidSignature if the 8-byte signature is missing
     * @throws PngmeError from Chunk::read for any malformed chunk
     */
    static Png from_bytes(const std::vector<uint8_t>& bytes);

    static const std::array<uint8_t, 8>& header() noexcept;

    // Inserted before a trailing IEND chunk if there is one.
    void append_chunk(Chunk chunk);

    /**
     * @brief Remove and return the first chunk of the given type
     * @throws PngmeError ChunkNotFound
     */
    Chunk remove_first_chunk(std::string_view chunk_type);

    // nullptr when no chunk has that type
    const Chunk* chunk_by_type(std::string_view chunk_type) const;

    const std::vector<Chunk>& chunks() const noexcept { return chunks_; }

    std::vector<uint8_t> as_bytes() const;

private:
    std::vector<Chunk> chunks_;
};

std::ostream& operator<<(std::ostream& os, const Png& png);

} // namespace pngme
