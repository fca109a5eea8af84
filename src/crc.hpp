#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

namespace pngme {

class ChunkType;

/**
 * @brief CRC-32/ISO-HDLC of a plain byte range
 */
uint32_t crc32_of(const uint8_t* data, size_t len);

/**
 * @brief CRC stored in a chunk: computed over type bytes followed by data
 */
uint32_t chunk_crc(const ChunkType& type, const std::vector<uint8_t>& data);

} // namespace pngme
