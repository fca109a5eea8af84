#include "chunk.hpp"
#include "crc.hpp"
#include "errors.hpp"
#include "png_format.hpp"
#include "utf8.hpp"

#include <algorithm>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace pngme {

namespace {

// Payload bytes pulled from a stream per read, so a forged length cannot
// make us allocate more than the stream actually holds.
constexpr size_t READ_BLOCK_BYTES = 64 * 1024;

std::string hex32(uint32_t v) {
    std::ostringstream oss;
    oss << "0x" << std::hex << std::setw(8) << std::setfill('0') << v;
    return oss.str();
}

uint32_t checked_length(const std::vector<uint8_t>& data) {
    if (data.size() > MAX_DATA_BYTES) {
        throw std::length_error("chunk data exceeds 32-bit length field: " +
                                std::to_string(data.size()) + " bytes");
    }
    return static_cast<uint32_t>(data.size());
}

ChunkType type_at(const uint8_t* p) {
    return ChunkType::from_bytes({p[0], p[1], p[2], p[3]});
}

void read_exact(std::istream& in, uint8_t* out, size_t n, const char* field) {
    in.read(reinterpret_cast<char*>(out), static_cast<std::streamsize>(n));
    if (static_cast<size_t>(in.gcount()) != n) {
        throw PngmeError(ErrorKind::TruncatedInput,
                         std::string("stream ended inside chunk ") + field + ": wanted " +
                         std::to_string(n) + " bytes, got " + std::to_string(in.gcount()));
    }
}

} // namespace

Chunk::Chunk(ChunkType type, std::vector<uint8_t> data)
    : length_(checked_length(data)),
      type_(type),
      data_(std::move(data)),
      crc_(chunk_crc(type_, data_)) {}

Chunk::Chunk(ChunkType type, std::vector<uint8_t> data, uint32_t stored_crc)
    : length_(checked_length(data)),
      type_(type),
      data_(std::move(data)),
      crc_(stored_crc) {
    const uint32_t computed = chunk_crc(type_, data_);
    if (computed != stored_crc) {
        throw PngmeError(ErrorKind::ChecksumMismatch,
                         "crc mismatch in " + type_.to_string() + " chunk: stored " +
                         hex32(stored_crc) + ", computed " + hex32(computed));
    }
}

Chunk Chunk::parse(const std::vector<uint8_t>& bytes) {
    if (bytes.size() < RECORD_OVERHEAD_BYTES) {
        throw PngmeError(ErrorKind::TruncatedInput,
                         "chunk needs at least 12 bytes, got " + std::to_string(bytes.size()));
    }

    const uint32_t length = load_u32_be(bytes.data());
    // 64-bit arithmetic, the sum cannot wrap
    const uint64_t total = static_cast<uint64_t>(RECORD_OVERHEAD_BYTES) + length;
    if (total > bytes.size()) {
        throw PngmeError(ErrorKind::TruncatedInput,
                         "chunk declares " + std::to_string(length) + " data bytes but only " +
                         std::to_string(bytes.size() - RECORD_OVERHEAD_BYTES) + " are available");
    }

    ChunkType type = type_at(bytes.data() + TYPE_FIELD_OFFSET);

    const auto data_begin = bytes.begin() + DATA_FIELD_OFFSET;
    std::vector<uint8_t> data(data_begin, data_begin + length);
    const uint32_t stored_crc = load_u32_be(bytes.data() + DATA_FIELD_OFFSET + length);

    Chunk chunk(type, std::move(data), stored_crc);

    if (total != bytes.size()) {
        throw PngmeError(ErrorKind::TrailingBytes,
                         std::to_string(bytes.size() - total) + " bytes follow the " +
                         chunk.chunk_type().to_string() + " chunk");
    }
    return chunk;
}

Chunk Chunk::read(std::istream& in) {
    uint8_t field[4];

    read_exact(in, field, LENGTH_FIELD_BYTES, "length");
    const uint32_t length = load_u32_be(field);

    read_exact(in, field, TYPE_FIELD_BYTES, "type");
    ChunkType type = type_at(field);

    std::vector<uint8_t> data;
    size_t remaining = length;
    while (remaining > 0) {
        const size_t block = std::min(remaining, READ_BLOCK_BYTES);
        const size_t offset = data.size();
        data.resize(offset + block);
        read_exact(in, data.data() + offset, block, "data");
        remaining -= block;
    }

    read_exact(in, field, CRC_FIELD_BYTES, "crc");
    const uint32_t stored_crc = load_u32_be(field);

    return Chunk(type, std::move(data), stored_crc);
}

std::string Chunk::data_as_string() const {
    if (!is_valid_utf8(data_.data(), data_.size())) {
        throw PngmeError(ErrorKind::InvalidEncoding,
                         type_.to_string() + " chunk data is not valid UTF-8");
    }
    return std::string(data_.begin(), data_.end());
}

std::vector<uint8_t> Chunk::as_bytes() const {
    std::vector<uint8_t> out(RECORD_OVERHEAD_BYTES + data_.size());
    store_u32_be(length_, out.data());
    std::copy(type_.bytes().begin(), type_.bytes().end(), out.begin() + TYPE_FIELD_OFFSET);
    std::copy(data_.begin(), data_.end(), out.begin() + DATA_FIELD_OFFSET);
    store_u32_be(crc_, out.data() + DATA_FIELD_OFFSET + data_.size());
    return out;
}

std::ostream& operator<<(std::ostream& os, const Chunk& chunk) {
    os << chunk.length() << " " << chunk.chunk_type() << " [";
    for (size_t i = 0; i < chunk.data().size(); ++i) {
        if (i > 0) os << ", ";
        os << static_cast<int>(chunk.data()[i]);
    }
    return os << "] " << chunk.crc();
}

} // namespace pngme
