#include "test_helpers.hpp"
#include <gtest/gtest.h>

using pngme::ChunkType;
using pngme::ErrorKind;

// ============================================================================
// Construction
// ============================================================================

TEST(ChunkTypeTests, FromBytesKeepsOrder) {
    auto type = ChunkType::from_bytes({82, 117, 83, 116});
    std::array<uint8_t, 4> expected = {82, 117, 83, 116};
    EXPECT_EQ(type.bytes(), expected);
}

TEST(ChunkTypeTests, FromStringMatchesFromBytes) {
    EXPECT_EQ(ChunkType::from_string("RuSt"), ChunkType::from_bytes({82, 117, 83, 116}));
}

TEST(ChunkTypeTests, AcceptsEveryLetterMix) {
    for (const char* s : {"IHDR", "idat", "RuSt", "zzZZ", "AaZz", "gAMA", "tEXt"}) {
        EXPECT_NO_THROW(ChunkType::from_string(s)) << s;
    }
}

TEST(ChunkTypeTests, RejectsNonLetters) {
    for (const char* s : {"Ru1t", "Ru t", "Ru@t", "Ru[t", "Ru`t", "Ru{t", "1234", "Ru_t"}) {
        expectError(ErrorKind::InvalidTagByte, [&] { ChunkType::from_string(s); });
    }
}

TEST(ChunkTypeTests, RejectsRangeEdges) {
    // just outside 'A'..'Z' and 'a'..'z'
    for (uint8_t b : {0x40, 0x5B, 0x60, 0x7B, 0x00, 0xFF}) {
        expectError(ErrorKind::InvalidTagByte,
                    [&] { ChunkType::from_bytes({b, 'u', 'S', 't'}); });
    }
}

TEST(ChunkTypeTests, ReportsOffendingByte) {
    try {
        ChunkType::from_bytes({'R', 'u', 'S', '9'});
        FAIL() << "expected InvalidTagByte";
    } catch (const pngme::PngmeError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::InvalidTagByte);
        std::string what = e.what();
        EXPECT_NE(what.find("byte 3"), std::string::npos) << what;
        EXPECT_NE(what.find("57"), std::string::npos) << what;
    }
}

TEST(ChunkTypeTests, RejectsWrongLength) {
    for (const char* s : {"", "Rus", "RuStx", "RuSt "}) {
        expectError(ErrorKind::InvalidTagLength, [&] { ChunkType::from_string(s); });
    }
}

TEST(ChunkTypeTests, RejectsMultiByteCharacters) {
    // "Rußt" is 4 characters but 5 bytes
    expectError(ErrorKind::InvalidTagLength, [] { ChunkType::from_string("Ru\xc3\x9ft"); });
    // 4 bytes, two of them non-ASCII
    expectError(ErrorKind::InvalidTagByte, [] { ChunkType::from_string("R\xc3\x9ft"); });
}

// ============================================================================
// Property bits
// ============================================================================

TEST(ChunkTypeTests, Critical) {
    EXPECT_TRUE(ChunkType::from_string("RuSt").is_critical());
    EXPECT_FALSE(ChunkType::from_string("ruSt").is_critical());
}

TEST(ChunkTypeTests, Public) {
    EXPECT_TRUE(ChunkType::from_string("RUSt").is_public());
    EXPECT_FALSE(ChunkType::from_string("RuSt").is_public());
}

TEST(ChunkTypeTests, ReservedBit) {
    EXPECT_TRUE(ChunkType::from_string("RuSt").is_reserved_bit_valid());
    EXPECT_FALSE(ChunkType::from_string("Rust").is_reserved_bit_valid());
}

TEST(ChunkTypeTests, SafeToCopy) {
    EXPECT_TRUE(ChunkType::from_string("RuSt").is_safe_to_copy());
    EXPECT_FALSE(ChunkType::from_string("RuST").is_safe_to_copy());
}

TEST(ChunkTypeTests, ValidityIsReservedBitOnly) {
    // constructible, but non-conforming
    auto lowered = ChunkType::from_string("Rust");
    EXPECT_FALSE(lowered.is_valid());

    auto upper = ChunkType::from_string("RuSt");
    EXPECT_TRUE(upper.is_valid());

    // other bits do not matter
    EXPECT_TRUE(ChunkType::from_string("abCd").is_valid());
}

TEST(ChunkTypeTests, RustScenarioFlags) {
    auto type = ChunkType::from_string("RuSt");
    EXPECT_TRUE(type.is_critical());
    EXPECT_FALSE(type.is_public());
    EXPECT_TRUE(type.is_reserved_bit_valid());
    EXPECT_TRUE(type.is_safe_to_copy());
}

// ============================================================================
// Display / equality
// ============================================================================

TEST(ChunkTypeTests, ToString) {
    EXPECT_EQ(ChunkType::from_string("RuSt").to_string(), "RuSt");

    std::ostringstream oss;
    oss << ChunkType::from_bytes({'I', 'E', 'N', 'D'});
    EXPECT_EQ(oss.str(), "IEND");
}

TEST(ChunkTypeTests, EqualityIsCaseSensitive) {
    EXPECT_EQ(ChunkType::from_string("RuSt"), ChunkType::from_string("RuSt"));
    EXPECT_NE(ChunkType::from_string("RuSt"), ChunkType::from_string("Rust"));
}
