#pragma once

#include <stdexcept>
#include <string>

namespace pngme {

enum class ErrorKind {
    InvalidTagLength,
    InvalidTagByte,
    TruncatedInput,
    ChecksumMismatch,
    TrailingBytes,
    InvalidEncoding,
    // container / command layer
    InvalidSignature,
    ChunkNotFound,
    Io,
};

/**
 * @brief Failure raised by every fallible codec operation
 *
 * Malformed input is an ordinary outcome, so callers are expected to catch
 * this and branch on kind().
 */
class PngmeError : public std::runtime_error {
public:
    PngmeError(ErrorKind k, const std::string& msg);

    ErrorKind kind() const noexcept { return kind_; }

private:
    ErrorKind kind_;
};

const char* to_string(ErrorKind kind) noexcept;

// Process exit status used by the CLI, distinct per kind.
int exit_code(ErrorKind kind) noexcept;

} // namespace pngme
