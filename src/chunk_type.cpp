#include "chunk_type.hpp"
#include "errors.hpp"
#include "png_format.hpp"

namespace pngme {

namespace {
void check_type_byte(size_t index, uint8_t value) {
    if (!is_type_byte(value)) {
        throw PngmeError(ErrorKind::InvalidTagByte,
                         "chunk type byte " + std::to_string(index) +
                         " is not an ASCII letter: " + std::to_string(value));
    }
}
} // namespace

ChunkType ChunkType::from_bytes(const std::array<uint8_t, 4>& bytes) {
    for (size_t i = 0; i < bytes.size(); ++i) {
        check_type_byte(i, bytes[i]);
    }
    return ChunkType(bytes);
}

ChunkType ChunkType::from_string(std::string_view s) {
    if (s.size() != TYPE_FIELD_BYTES) {
        throw PngmeError(ErrorKind::InvalidTagLength,
                         "chunk type must be 4 bytes, got " + std::to_string(s.size()));
    }
    std::array<uint8_t, 4> bytes{};
    for (size_t i = 0; i < bytes.size(); ++i) {
        bytes[i] = static_cast<uint8_t>(s[i]);
    }
    return from_bytes(bytes);
}

bool ChunkType::is_critical() const noexcept {
    return (bytes_[ANCILLARY_BYTE] & TYPE_PROPERTY_BIT) == 0;
}

bool ChunkType::is_public() const noexcept {
    return (bytes_[PRIVATE_BYTE] & TYPE_PROPERTY_BIT) == 0;
}

bool ChunkType::is_reserved_bit_valid() const noexcept {
    return (bytes_[RESERVED_BYTE] & TYPE_PROPERTY_BIT) == 0;
}

bool ChunkType::is_safe_to_copy() const noexcept {
    return (bytes_[SAFE_TO_COPY_BYTE] & TYPE_PROPERTY_BIT) != 0;
}

std::string ChunkType::to_string() const {
    return std::string(bytes_.begin(), bytes_.end());
}

std::ostream& operator<<(std::ostream& os, const ChunkType& type) {
    return os << type.to_string();
}

} // namespace pngme
