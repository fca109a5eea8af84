#pragma once

#include <cstddef>
#include <cstdint>

namespace pngme {

// Strict check: rejects overlong forms, surrogates and code points past U+10FFFF.
bool is_valid_utf8(const uint8_t* data, size_t len) noexcept;

} // namespace pngme
