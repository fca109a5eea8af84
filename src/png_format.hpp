/**
 * @file png_format.hpp
 * @brief Wire constants for the PNG chunk record format
 *
 * One record (a "chunk") is laid out as:
 *
 *   | offset     | size   | field    |
 *   |------------|--------|----------|
 *   | 0          | 4      | length   |
 *   | 4          | 4      | type     |
 *   | 8          | length | data     |
 *   | 8 + length | 4      | crc      |
 *
 * The CRC covers type and data only, never the length field.
 */

#ifndef PNGME_FORMAT_HPP
#define PNGME_FORMAT_HPP

#include <cstdint>
#include <cstddef>

// =============================================================================
// CRITICAL: BYTE ORDERING
// =============================================================================

/**
 * @brief BYTE ORDER: ALL MULTI-BYTE VALUES ARE BIG-ENDIAN
 *
 * This applies to the length field and the crc field.
 *
 * Example: The value 0x1234 is stored as bytes [0x00, 0x00, 0x12, 0x34]
 */

namespace pngme {

// =============================================================================
// RECORD LAYOUT
// =============================================================================

constexpr size_t LENGTH_FIELD_BYTES = 4;
constexpr size_t TYPE_FIELD_BYTES = 4;
constexpr size_t CRC_FIELD_BYTES = 4;

/**
 * @brief Size of a record with an empty data field
 *
 * Every record is exactly RECORD_OVERHEAD_BYTES + length bytes long.
 */
constexpr size_t RECORD_OVERHEAD_BYTES = LENGTH_FIELD_BYTES + TYPE_FIELD_BYTES + CRC_FIELD_BYTES; // 12

constexpr size_t TYPE_FIELD_OFFSET = LENGTH_FIELD_BYTES;
constexpr size_t DATA_FIELD_OFFSET = LENGTH_FIELD_BYTES + TYPE_FIELD_BYTES;

/**
 * @brief Largest data field the 32-bit length can describe
 */
constexpr uint64_t MAX_DATA_BYTES = 0xFFFFFFFFull;

// =============================================================================
// TYPE TAG
// =============================================================================

/**
 * @brief Property bit of every type byte (bit 5)
 *
 * Lowercase letters have it set, uppercase letters have it clear.
 *
 *   byte 0: ancillary bit     (clear = critical)
 *   byte 1: private bit       (clear = public)
 *   byte 2: reserved bit      (must be clear)
 *   byte 3: safe-to-copy bit  (set = safe to copy)
 */
constexpr uint8_t TYPE_PROPERTY_BIT = 0x20;

constexpr size_t ANCILLARY_BYTE = 0;
constexpr size_t PRIVATE_BYTE = 1;
constexpr size_t RESERVED_BYTE = 2;
constexpr size_t SAFE_TO_COPY_BYTE = 3;

constexpr uint8_t TYPE_UPPER_FIRST = 0x41; // 'A'
constexpr uint8_t TYPE_UPPER_LAST = 0x5A;  // 'Z'
constexpr uint8_t TYPE_LOWER_FIRST = 0x61; // 'a'
constexpr uint8_t TYPE_LOWER_LAST = 0x7A;  // 'z'

constexpr inline bool is_type_byte(uint8_t b) noexcept {
    return (b >= TYPE_UPPER_FIRST && b <= TYPE_UPPER_LAST) ||
           (b >= TYPE_LOWER_FIRST && b <= TYPE_LOWER_LAST);
}

// =============================================================================
// CHECKSUM
// =============================================================================

/**
 * @brief CRC-32/ISO-HDLC parameters
 *
 * Same algorithm as zlib, gzip and PNG: polynomial 0x04C11DB7 (reflected
 * 0xEDB88320), init 0xFFFFFFFF, reflected in/out, final xor 0xFFFFFFFF.
 * The check value of "123456789" is 0xCBF43926.
 */
constexpr uint32_t CRC32_CHECK_VALUE = 0xCBF43926;

// =============================================================================
// CONTAINER
// =============================================================================

constexpr size_t SIGNATURE_BYTES = 8;
constexpr uint8_t SIGNATURE[SIGNATURE_BYTES] = {0x89, 0x50, 0x4E, 0x47, 0x0D, 0x0A, 0x1A, 0x0A};

/**
 * @brief Type of the trailer record that closes a container
 */
constexpr char TRAILER_TYPE[] = "IEND";

// =============================================================================
// BIG-ENDIAN HELPERS
// =============================================================================

constexpr inline uint32_t load_u32_be(const uint8_t* p) noexcept {
    return (static_cast<uint32_t>(p[0]) << 24) |
           (static_cast<uint32_t>(p[1]) << 16) |
           (static_cast<uint32_t>(p[2]) << 8) |
           static_cast<uint32_t>(p[3]);
}

constexpr inline void store_u32_be(uint32_t v, uint8_t* p) noexcept {
    p[0] = static_cast<uint8_t>((v >> 24) & 0xFF);
    p[1] = static_cast<uint8_t>((v >> 16) & 0xFF);
    p[2] = static_cast<uint8_t>((v >> 8) & 0xFF);
    p[3] = static_cast<uint8_t>(v & 0xFF);
}

} // namespace pngme

#endif // PNGME_FORMAT_HPP
