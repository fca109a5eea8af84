#pragma once

#include <cstdint>
#include <ostream>
#include <string>
#include <vector>

namespace pngme {

// File helpers; failures throw PngmeError with ErrorKind::Io.
std::vector<uint8_t> read_file(const std::string& filename);
void write_file(const std::string& filename, const std::vector<uint8_t>& bytes);

/**
 * @brief Append a chunk holding message to a PNG file
 * @param output destination, or empty to overwrite filename
 */
void encode(const std::string& filename, const std::string& chunk_type,
            const std::string& message, const std::string& output);

// Payload of the first matching chunk, as text.
std::string decode(const std::string& filename, const std::string& chunk_type);

void remove(const std::string& filename, const std::string& chunk_type);

void print_chunks(const std::string& filename, std::ostream& os);

} // namespace pngme
