#include "errors.hpp"

namespace pngme {

PngmeError::PngmeError(ErrorKind k, const std::string& msg)
    : std::runtime_error(msg), kind_(k) {}

const char* to_string(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::InvalidTagLength: return "invalid tag length";
        case ErrorKind::InvalidTagByte:   return "invalid tag byte";
        case ErrorKind::TruncatedInput:   return "truncated input";
        case ErrorKind::ChecksumMismatch: return "checksum mismatch";
        case ErrorKind::TrailingBytes:    return "trailing bytes";
        case ErrorKind::InvalidEncoding:  return "invalid encoding";
        case ErrorKind::InvalidSignature: return "invalid signature";
        case ErrorKind::ChunkNotFound:    return "chunk not found";
        case ErrorKind::Io:               return "i/o error";
    }
    return "unknown error";
}

int exit_code(ErrorKind kind) noexcept {
    // 1 is left to argument errors
    switch (kind) {
        case ErrorKind::InvalidTagLength: return 2;
        case ErrorKind::InvalidTagByte:   return 3;
        case ErrorKind::TruncatedInput:   return 4;
        case ErrorKind::ChecksumMismatch: return 5;
        case ErrorKind::TrailingBytes:    return 6;
        case ErrorKind::InvalidEncoding:  return 7;
        case ErrorKind::InvalidSignature: return 8;
        case ErrorKind::ChunkNotFound:    return 9;
        case ErrorKind::Io:               return 10;
    }
    return 1;
}

} // namespace pngme
