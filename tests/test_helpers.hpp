#pragma once
#include <gtest/gtest.h>
#include "../src/chunk.hpp"
#include "../src/chunk_type.hpp"
#include "../src/errors.hpp"
#include "../src/png.hpp"
#include <vector>
#include <string>
#include <iomanip>
#include <sstream>
#include <functional>
#include <algorithm>

// ============================================================================
// UTILITY FUNCTIONS
// ============================================================================

/**
 * @brief Compare byte vectors with detailed error messages
 */
inline void expectBytes(const std::vector<uint8_t>& actual,
                        const std::vector<uint8_t>& expected,
                        const std::string& msg = "") {
    ASSERT_EQ(actual.size(), expected.size())
        << msg << " size mismatch: expected " << expected.size()
        << " bytes, got " << actual.size();
    for (size_t i = 0; i < expected.size(); ++i) {
        EXPECT_EQ(actual[i], expected[i])
            << msg << " byte mismatch at index " << i
            << ": expected 0x" << std::hex << static_cast<int>(expected[i])
            << ", got 0x" << static_cast<int>(actual[i]);
    }
}

/**
 * @brief Create a hex dump string for debugging
 */
inline std::string hexDump(const std::vector<uint8_t>& data, size_t maxBytes = 64) {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    size_t count = std::min(data.size(), maxBytes);
    for (size_t i = 0; i < count; ++i) {
        if (i > 0 && i % 16 == 0) oss << "\n";
        else if (i > 0) oss << " ";
        oss << std::setw(2) << static_cast<int>(data[i]);
    }
    if (data.size() > maxBytes) {
        oss << "... (" << (data.size() - maxBytes) << " more bytes)";
    }
    return oss.str();
}

inline std::vector<uint8_t> toBytes(const std::string& s) {
    return std::vector<uint8_t>(s.begin(), s.end());
}

inline void appendU32(std::vector<uint8_t>& out, uint32_t v) {
    out.push_back(static_cast<uint8_t>(v >> 24));
    out.push_back(static_cast<uint8_t>(v >> 16));
    out.push_back(static_cast<uint8_t>(v >> 8));
    out.push_back(static_cast<uint8_t>(v));
}

/**
 * @brief Hand-assemble a chunk without going through the codec
 */
inline std::vector<uint8_t> rawChunk(uint32_t length, const std::string& type,
                                     const std::vector<uint8_t>& data, uint32_t crc) {
    std::vector<uint8_t> out;
    appendU32(out, length);
    out.insert(out.end(), type.begin(), type.end());
    out.insert(out.end(), data.begin(), data.end());
    appendU32(out, crc);
    return out;
}

/**
 * @brief Run fn and check it throws PngmeError of the given kind
 */
inline void expectError(pngme::ErrorKind kind, const std::function<void()>& fn) {
    try {
        fn();
        ADD_FAILURE() << "expected PngmeError(" << pngme::to_string(kind) << "), nothing thrown";
    } catch (const pngme::PngmeError& e) {
        EXPECT_EQ(e.kind(), kind) << "got " << pngme::to_string(e.kind()) << ": " << e.what();
    }
}

// ============================================================================
// REFERENCE VALUES
// ============================================================================
namespace TestConstants {
    constexpr char MESSAGE[] = "This is where your secret message will be!";
    constexpr uint32_t MESSAGE_LENGTH = 42;
    constexpr uint32_t RUST_MESSAGE_CRC = 2882656334u; // crc32("RuSt" + MESSAGE)
    constexpr uint32_t IEND_CRC = 0xAE426082u;         // crc32("IEND")
}

inline std::vector<uint8_t> testingChunkBytes(uint32_t crc = TestConstants::RUST_MESSAGE_CRC) {
    return rawChunk(TestConstants::MESSAGE_LENGTH, "RuSt",
                    toBytes(TestConstants::MESSAGE), crc);
}

inline pngme::Chunk makeChunk(const std::string& type, const std::string& data) {
    return pngme::Chunk(pngme::ChunkType::from_string(type), toBytes(data));
}
