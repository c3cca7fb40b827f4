/**
 * @file test_input_validation.cpp
 * @brief Unit tests for request and input file validation
 */

#include "engine/input_validation.h"
#include "test_support.h"

#include <gtest/gtest.h>

using namespace audio_segmenter;

TEST(SplitRequestValidation, AcceptsLimits) {
    SegmenterConfig::LimitsConfig limits;

    EXPECT_TRUE(validateSplitRequest({SplitUnit::Seconds, 1}, limits).ok());
    EXPECT_TRUE(validateSplitRequest({SplitUnit::Seconds, 3600}, limits).ok());
    EXPECT_TRUE(validateSplitRequest({SplitUnit::Megabytes, 1}, limits).ok());
    EXPECT_TRUE(validateSplitRequest({SplitUnit::Megabytes, 100}, limits).ok());
}

TEST(SplitRequestValidation, RejectsOutOfRange) {
    SegmenterConfig::LimitsConfig limits;

    auto zero = validateSplitRequest({SplitUnit::Seconds, 0}, limits);
    EXPECT_EQ(zero.code, ErrorCode::INPUT_INVALID_PARAMETERS);
    EXPECT_FALSE(zero.message.empty());
    EXPECT_FALSE(validateSplitRequest({SplitUnit::Seconds, -5}, limits).ok());
    EXPECT_FALSE(validateSplitRequest({SplitUnit::Seconds, 3601}, limits).ok());
    EXPECT_FALSE(validateSplitRequest({SplitUnit::Megabytes, 101}, limits).ok());
}

TEST(SplitUnitParsing, Aliases) {
    EXPECT_EQ(parseSplitUnit("seconds"), SplitUnit::Seconds);
    EXPECT_EQ(parseSplitUnit("SEC"), SplitUnit::Seconds);
    EXPECT_EQ(parseSplitUnit("s"), SplitUnit::Seconds);
    EXPECT_EQ(parseSplitUnit("megabytes"), SplitUnit::Megabytes);
    EXPECT_EQ(parseSplitUnit("MB"), SplitUnit::Megabytes);
    EXPECT_FALSE(parseSplitUnit("minutes").has_value());
    EXPECT_FALSE(parseSplitUnit("").has_value());
    EXPECT_STREQ(splitUnitToString(SplitUnit::Megabytes), "megabytes");
}

class InputFileValidationTest : public audio_segmenter::test::TempDirTest {
   protected:
    SegmenterConfig::LimitsConfig limits;
};

TEST_F(InputFileValidationTest, AcceptsAllowedExtensionsCaseInsensitively) {
    for (const char* name : {"a.mp3", "b.WAV", "c.Ogg", "d.m4a", "e.flac", "f.aac", "g.wma"}) {
        const auto path = writeFile(name, "data");
        EXPECT_TRUE(validateInputFile(path, limits).ok()) << name;
    }
}

TEST_F(InputFileValidationTest, MissingFile) {
    EXPECT_EQ(validateInputFile(tempDir / "nope.mp3", limits).code,
              ErrorCode::INPUT_FILE_NOT_FOUND);
    EXPECT_EQ(validateInputFile(tempDir, limits).code, ErrorCode::INPUT_FILE_NOT_FOUND);
}

TEST_F(InputFileValidationTest, UnsupportedExtension) {
    EXPECT_EQ(validateInputFile(writeFile("doc.pdf", "x"), limits).code,
              ErrorCode::INPUT_UNSUPPORTED_FORMAT);
    EXPECT_EQ(validateInputFile(writeFile("noext", "x"), limits).code,
              ErrorCode::INPUT_UNSUPPORTED_FORMAT);
}

TEST_F(InputFileValidationTest, EmptyFile) {
    EXPECT_EQ(validateInputFile(writeFile("empty.mp3", ""), limits).code,
              ErrorCode::INPUT_EMPTY_FILE);
}

TEST_F(InputFileValidationTest, EmptyFileReportedBeforeExtension) {
    EXPECT_EQ(validateInputFile(writeFile("clip.txt", ""), limits).code,
              ErrorCode::INPUT_EMPTY_FILE);
    EXPECT_EQ(validateInputFile(writeFile("noext", ""), limits).code,
              ErrorCode::INPUT_EMPTY_FILE);
}

TEST_F(InputFileValidationTest, TooLarge) {
    limits.maxInputBytes = 8;
    EXPECT_EQ(validateInputFile(writeFile("big.mp3", "0123456789"), limits).code,
              ErrorCode::INPUT_FILE_TOO_LARGE);
    limits.maxInputBytes = 0;
    EXPECT_TRUE(validateInputFile(writeFile("big.mp3", "0123456789"), limits).ok());
}

TEST(FileExtension, Lowercased) {
    EXPECT_EQ(fileExtensionLower("/x/Talk.MP3"), "mp3");
    EXPECT_EQ(fileExtensionLower("/x/archive.tar.GZ"), "gz");
    EXPECT_EQ(fileExtensionLower("/x/README"), "");
}
