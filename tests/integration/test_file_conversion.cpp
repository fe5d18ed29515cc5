/**
 * @file test_file_conversion.cpp
 * @brief Integration tests for converting files end to end
 */

#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <iterator>
#include <string>
#include <textconv/textconv.h>
#include <vector>

using namespace textconv;
namespace fs = std::filesystem;

class FileConversionTest : public ::testing::Test {
protected:
  fs::path test_dir;

  void SetUp() override {
    // Output names cut at the first '.', so the root must not contain one
    test_dir = "/tmp/textconv_conversion_test";
    ASSERT_EQ(test_dir.string().find('.'), std::string::npos);
    fs::remove_all(test_dir);
    fs::create_directories(test_dir);
  }

  void TearDown() override { fs::remove_all(test_dir); }

  fs::path create_test_file(const std::string &name,
                            const std::string &contents) {
    fs::path path = test_dir / name;
    std::ofstream file(path, std::ios::binary);
    file << contents;
    return path;
  }

  static std::string read_back(const fs::path &path) {
    std::ifstream file(path, std::ios::binary);
    return std::string(std::istreambuf_iterator<char>(file),
                       std::istreambuf_iterator<char>());
  }
};

// ============================================================================
// Round Trip
// ============================================================================

TEST_F(FileConversionTest, ReverseFileWritesConvertedCopy) {
  auto input = create_test_file("notes.txt", "Hello World!");
  ReverseText reverse;

  std::string output = reverse.from_file(input);

  EXPECT_EQ(output, "!dlroW olleH");
  EXPECT_EQ(output, reverse.convert("Hello World!"));

  fs::path written = derive_output_path(input);
  EXPECT_EQ(written.filename().string(), "notes_converted.md");
  ASSERT_TRUE(fs::exists(written));
  EXPECT_EQ(read_back(written), output);

  // The input is left alone
  EXPECT_EQ(read_back(input), "Hello World!");
}

TEST_F(FileConversionTest, EveryStockConverterRoundTrips) {
  const std::string contents = "Line one\nLigne deux: caf\xC3\xA9\n";
  auto input = create_test_file("sample.txt", contents);

  ReverseText reverse;
  UppercaseText upper;
  LowercaseText lower;
  Base64Text base64;
  HexText hex;
  const std::vector<const TextConverter *> converters = {
      &reverse, &upper, &lower, &base64, &hex};

  for (const auto *converter : converters) {
    auto result = converter->try_from_file(input);
    ASSERT_TRUE(result.is_ok()) << result.error().to_string();

    EXPECT_EQ(result.value(), converter->convert(contents));
    EXPECT_EQ(read_back(derive_output_path(input)), result.value());
  }
}

TEST_F(FileConversionTest, MultiDotNameKeepsFirstSegment) {
  auto input = create_test_file("archive.tar.gz", "payload");

  ReverseText().from_file(input);

  EXPECT_TRUE(fs::exists(test_dir / "archive_converted.md"));
  EXPECT_EQ(read_back(test_dir / "archive_converted.md"), "daolyap");
}

TEST_F(FileConversionTest, NameWithoutDot) {
  auto input = create_test_file("README", "abc");

  ReverseText().from_file(input);

  EXPECT_EQ(read_back(test_dir / "README_converted.md"), "cba");
}

TEST_F(FileConversionTest, ExistingOutputIsReplaced) {
  create_test_file("notes_converted.md",
                   "stale output that is longer than the new one");
  auto input = create_test_file("notes.txt", "new");

  UppercaseText().from_file(input);

  EXPECT_EQ(read_back(test_dir / "notes_converted.md"), "NEW");
}

TEST_F(FileConversionTest, EmptyFile) {
  auto input = create_test_file("empty.txt", "");

  auto result = ReverseText().try_from_file(input);
  ASSERT_TRUE(result.is_ok());
  EXPECT_EQ(result.value(), "");
  EXPECT_TRUE(fs::exists(test_dir / "empty_converted.md"));
  EXPECT_EQ(fs::file_size(test_dir / "empty_converted.md"), 0u);
}

// ============================================================================
// Failures
// ============================================================================

TEST_F(FileConversionTest, TryMissingFileWritesNothing) {
  auto result = ReverseText().try_from_file(test_dir / "missing.txt");

  ASSERT_TRUE(result.is_error());
  EXPECT_EQ(result.error().code, ErrorCode::FileNotFound);
  EXPECT_FALSE(fs::exists(test_dir / "missing_converted.md"));
}

TEST_F(FileConversionTest, TryBinaryFileWritesNothing) {
  auto input =
      create_test_file("photo.jpg", std::string("\xFF\xD8\xFF\xE0", 4));

  auto result = ReverseText().try_from_file(input);

  ASSERT_TRUE(result.is_error());
  EXPECT_EQ(result.error().category(), ErrorCategory::FileUnreadable);
  EXPECT_FALSE(fs::exists(test_dir / "photo_converted.md"));
}

TEST_F(FileConversionTest, TryUnwritableOutput) {
  auto input = create_test_file("blocked.txt", "text");
  // A directory where the output file should go
  fs::create_directories(test_dir / "blocked_converted.md");

  auto result = ReverseText().try_from_file(input);

  ASSERT_TRUE(result.is_error());
  EXPECT_EQ(result.error().category(), ErrorCategory::OutputWriteFailed);
}

using FileConversionDeathTest = FileConversionTest;

TEST_F(FileConversionDeathTest, MissingFileAborts) {
  const fs::path missing = test_dir / "missing.txt";

  EXPECT_DEATH(ReverseText().from_file(missing),
               "Failed to read file contents");
  EXPECT_FALSE(fs::exists(test_dir / "missing_converted.md"));
}

TEST_F(FileConversionDeathTest, UnwritableOutputAborts) {
  auto input = create_test_file("blocked.txt", "text");
  fs::create_directories(test_dir / "blocked_converted.md");

  EXPECT_DEATH(ReverseText().from_file(input),
               "Failed to create the output file");
}
