#pragma once

#include <array>
#include <cstdint>
#include <ostream>
#include <string>
#include <string_view>

namespace pngme {

/**
 * @brief Four-letter chunk type tag
 *
 * Every byte is an ASCII letter; construction rejects anything else.
 * The case of each byte carries one property flag (see png_format.hpp).
 */
class ChunkType {
public:
    /**
     * @throws PngmeError InvalidTagByte if any byte is not a letter
     */
    static ChunkType from_bytes(const std::array<uint8_t, 4>& bytes);

    /**
     * @throws PngmeError InvalidTagLength unless s is exactly 4 bytes
     * @throws PngmeError InvalidTagByte if any byte is not a letter
     */
    static ChunkType from_string(std::string_view s);

    const std::array<uint8_t, 4>& bytes() const noexcept { return bytes_; }

    bool is_critical() const noexcept;
    bool is_public() const noexcept;
    bool is_reserved_bit_valid() const noexcept;
    bool is_safe_to_copy() const noexcept;

    // Only the reserved bit decides validity; letter legality is a
    // construction-time guarantee.
    bool is_valid() const noexcept { return is_reserved_bit_valid(); }

    std::string to_string() const;

    bool operator==(const ChunkType&) const = default;

private:
    explicit ChunkType(const std::array<uint8_t, 4>& bytes) : bytes_(bytes) {}

    std::array<uint8_t, 4> bytes_;
};

std::ostream& operator<<(std::ostream& os, const ChunkType& type);

} // namespace pngme
