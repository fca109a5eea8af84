#include "commands.hpp"
#include "chunk.hpp"
#include "errors.hpp"
#include "png.hpp"

#include <fstream>
#include <iterator>

namespace pngme {

std::vector<uint8_t> read_file(const std::string& filename) {
    std::ifstream file(filename, std::ios::binary);
    if (!file.is_open()) {
        throw PngmeError(ErrorKind::Io, "Could not open file: " + filename);
    }
    std::vector<uint8_t> bytes((std::istreambuf_iterator<char>(file)),
                               std::istreambuf_iterator<char>());
    if (file.bad()) {
        throw PngmeError(ErrorKind::Io, "Could not read file: " + filename);
    }
    return bytes;
}

void write_file(const std::string& filename, const std::vector<uint8_t>& bytes) {
    std::ofstream outfile(filename, std::ios::binary | std::ios::trunc);
    if (!outfile.is_open()) {
        throw PngmeError(ErrorKind::Io, "Could not open file for writing: " + filename);
    }
    outfile.write(reinterpret_cast<const char*>(bytes.data()),
                  static_cast<std::streamsize>(bytes.size()));
    if (!outfile) {
        throw PngmeError(ErrorKind::Io, "Could not write file: " + filename);
    }
}

void encode(const std::string& filename, const std::string& chunk_type,
            const std::string& message, const std::string& output) {
    ChunkType type = ChunkType::from_string(chunk_type);
    Png png = Png::from_bytes(read_file(filename));
    png.append_chunk(Chunk(type, std::vector<uint8_t>(message.begin(), message.end())));
    write_file(output.empty() ? filename : output, png.as_bytes());
}

std::string decode(const std::string& filename, const std::string& chunk_type) {
    ChunkType::from_string(chunk_type); // reject a bad type before touching the file
    Png png = Png::from_bytes(read_file(filename));
    const Chunk* chunk = png.chunk_by_type(chunk_type);
    if (chunk == nullptr) {
        throw PngmeError(ErrorKind::ChunkNotFound, "no " + chunk_type + " chunk in " + filename);
    }
    return chunk->data_as_string();
}

void remove(const std::string& filename, const std::string& chunk_type) {
    ChunkType::from_string(chunk_type); // reject a bad type before touching the file
    Png png = Png::from_bytes(read_file(filename));
    png.remove_first_chunk(chunk_type);
    write_file(filename, png.as_bytes());
}

void print_chunks(const std::string& filename, std::ostream& os) {
    os << Png::from_bytes(read_file(filename));
}

} // namespace pngme
