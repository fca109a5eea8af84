#include "crc.hpp"
#include "chunk_type.hpp"

#include <zlib.h>

namespace pngme {

namespace {
// zlib treats a null buffer as a request for the seed, so empty input must
// not reach it or the running crc is lost.
uLong crc_update(uLong crc, const uint8_t* data, size_t len) {
    if (len == 0) return crc;
    return ::crc32_z(crc, reinterpret_cast<const Bytef*>(data), static_cast<z_size_t>(len));
}
} // namespace

uint32_t crc32_of(const uint8_t* data, size_t len) {
    uLong crc = ::crc32_z(0L, Z_NULL, 0);
    crc = crc_update(crc, data, len);
    return static_cast<uint32_t>(crc);
}

uint32_t chunk_crc(const ChunkType& type, const std::vector<uint8_t>& data) {
    uLong crc = ::crc32_z(0L, Z_NULL, 0);
    crc = crc_update(crc, type.bytes().data(), type.bytes().size());
    crc = crc_update(crc, data.data(), data.size());
    return static_cast<uint32_t>(crc);
}

} // namespace pngme
