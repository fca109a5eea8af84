#include "png.hpp"
#include "errors.hpp"
#include "png_format.hpp"

#include <algorithm>
#include <istream>
#include <streambuf>
#include <string>

namespace pngme {

namespace {
// Read-only stream over bytes owned by someone else.
class ByteViewBuf : public std::streambuf {
public:
    ByteViewBuf(const uint8_t* data, size_t len) {
        char* p = const_cast<char*>(reinterpret_cast<const char*>(data));
        setg(p, p, p + len);
    }
};

bool has_type(const Chunk& chunk, std::string_view chunk_type) {
    const auto& b = chunk.chunk_type().bytes();
    return chunk_type.size() == b.size() && std::equal(b.begin(), b.end(), chunk_type.begin(),
        [](uint8_t x, char y) { return x == static_cast<uint8_t>(y); });
}
} // namespace

const std::array<uint8_t, 8>& Png::header() noexcept {
    static const std::array<uint8_t, 8> signature = {
        SIGNATURE[0], SIGNATURE[1], SIGNATURE[2], SIGNATURE[3],
        SIGNATURE[4], SIGNATURE[5], SIGNATURE[6], SIGNATURE[7],
    };
    return signature;
}

Png Png::from_bytes(const std::vector<uint8_t>& bytes) {
    if (bytes.size() < SIGNATURE_BYTES ||
        !std::equal(header().begin(), header().end(), bytes.begin())) {
        throw PngmeError(ErrorKind::InvalidSignature, "missing PNG signature");
    }

    ByteViewBuf buf(bytes.data() + SIGNATURE_BYTES, bytes.size() - SIGNATURE_BYTES);
    std::istream in(&buf);
    std::vector<Chunk> chunks;
    while (in.peek() != std::istream::traits_type::eof()) {
        chunks.push_back(Chunk::read(in));
    }
    return Png(std::move(chunks));
}

void Png::append_chunk(Chunk chunk) {
    if (!chunks_.empty() && has_type(chunks_.back(), TRAILER_TYPE)) {
        chunks_.insert(chunks_.end() - 1, std::move(chunk));
    } else {
        chunks_.push_back(std::move(chunk));
    }
}

Chunk Png::remove_first_chunk(std::string_view chunk_type) {
    auto it = std::find_if(chunks_.begin(), chunks_.end(),
        [&](const Chunk& c) { return has_type(c, chunk_type); });
    if (it == chunks_.end()) {
        throw PngmeError(ErrorKind::ChunkNotFound,
                         "no " + std::string(chunk_type) + " chunk to remove");
    }
    Chunk removed = std::move(*it);
    chunks_.erase(it);
    return removed;
}

const Chunk* Png::chunk_by_type(std::string_view chunk_type) const {
    for (const auto& c : chunks_) {
        if (has_type(c, chunk_type)) return &c;
    }
    return nullptr;
}

std::vector<uint8_t> Png::as_bytes() const {
    std::vector<uint8_t> out(header().begin(), header().end());
    for (const auto& c : chunks_) {
        auto bytes = c.as_bytes();
        out.insert(out.end(), bytes.begin(), bytes.end());
    }
    return out;
}

std::ostream& operator<<(std::ostream& os, const Png& png) {
    for (const auto& c : png.chunks()) {
        os << c.chunk_type() << " length=" << c.length() << " crc=" << c.crc() << "\n";
    }
    return os;
}

} // namespace pngme
