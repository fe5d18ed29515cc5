/**
 * @file test_converter.cpp
 * @brief Unit tests for the TextConverter entry points
 */

#include "fake_clipboard.h"
#include "scoped_env.h"

#include <gtest/gtest.h>
#include <textconv/textconv.h>

#include <stdexcept>
#include <string>
#include <vector>

using namespace textconv;
using textconv::test::FakeClipboard;
using textconv::test::ScopedEnv;

namespace {

/// Byte-wise reversal
class MirrorText : public TextConverter {
public:
  std::string convert(std::string_view input) const override {
    return std::string(input.rbegin(), input.rend());
  }
};

/// Marks its input so tests can see exactly what was converted
class BracketText : public TextConverter {
public:
  std::string convert(std::string_view input) const override {
    return "[" + std::string(input) + "]";
  }
};

} // namespace

// ============================================================================
// Text
// ============================================================================

TEST(ConverterTest, FromTextMatchesConvert) {
  MirrorText mirror;
  BracketText bracket;

  const std::vector<std::string> samples = {"", "a", "Hello World!",
                                            "line one\nline two"};
  for (const auto &sample : samples) {
    EXPECT_EQ(mirror.from_text(sample), mirror.convert(sample));
    EXPECT_EQ(bracket.from_text(sample), bracket.convert(sample));
  }
}

TEST(ConverterTest, AcceptsOwnedAndBorrowedText) {
  BracketText bracket;

  std::string owned = "owned";
  std::string_view borrowed = owned;

  EXPECT_EQ(bracket.from_text(owned), "[owned]");
  EXPECT_EQ(bracket.from_text(borrowed), "[owned]");
  EXPECT_EQ(bracket.from_text("literal"), "[literal]");
}

TEST(ConverterTest, ResultDoesNotAliasInput) {
  BracketText bracket;

  std::string input = "mutable";
  std::string output = bracket.from_text(input);
  input.assign("changed");

  EXPECT_EQ(output, "[mutable]");
}

// ============================================================================
// Clipboard
// ============================================================================

TEST(ConverterTest, FromClipboardConvertsText) {
  FakeClipboard clipboard;
  clipboard.text = "copied";

  BracketText bracket;
  EXPECT_EQ(bracket.from_clipboard(clipboard), "[copied]");
  EXPECT_EQ(clipboard.open_count, 1);
}

TEST(ConverterTest, EmptyClipboardConvertsEmptyString) {
  FakeClipboard clipboard;
  clipboard.text = std::nullopt;

  BracketText bracket;
  EXPECT_EQ(bracket.from_clipboard(clipboard), bracket.convert(""));
  EXPECT_EQ(bracket.from_clipboard(clipboard), "[]");
}

TEST(ConverterTest, TryFromClipboardReportsOpenFailure) {
  FakeClipboard clipboard;
  clipboard.open_error =
      Error(ErrorCode::ClipboardToolNotFound, "xclip or xsel not found");

  auto result = MirrorText().try_from_clipboard(clipboard);
  ASSERT_TRUE(result.is_error());
  EXPECT_EQ(result.error().code, ErrorCode::ClipboardToolNotFound);
  EXPECT_EQ(result.error().category(), ErrorCategory::ClipboardUnavailable);
}

TEST(ConverterTest, TryFromClipboardReportsReadFailure) {
  FakeClipboard clipboard;
  clipboard.read_error =
      Error(ErrorCode::ClipboardUnavailable, "Failed to execute command");

  auto result = MirrorText().try_from_clipboard(clipboard);
  ASSERT_TRUE(result.is_error());
  EXPECT_EQ(result.error().code, ErrorCode::ClipboardUnavailable);
}

TEST(ConverterTest, TryFromSystemClipboardHeadless) {
  ScopedEnv backend(ENV_CLIPBOARD_BACKEND, nullptr);
  ScopedEnv wayland("WAYLAND_DISPLAY", nullptr);
  ScopedEnv x11("DISPLAY", nullptr);

  auto result = MirrorText().try_from_clipboard();
  ASSERT_TRUE(result.is_error());
  EXPECT_EQ(result.error().category(), ErrorCategory::ClipboardUnavailable);
}

TEST(ConverterTest, SystemClipboardHonoursBackendOverride) {
  ScopedEnv backend(ENV_CLIPBOARD_BACKEND, "none");
  ScopedEnv wayland("WAYLAND_DISPLAY", nullptr);
  ScopedEnv x11("DISPLAY", ":0");

  auto result = MirrorText().try_from_clipboard();
  ASSERT_TRUE(result.is_error());
  EXPECT_EQ(result.error().code, ErrorCode::NoDisplayServer);
}

TEST(ConverterTest, SystemClipboardRejectsUnknownBackend) {
  ScopedEnv backend(ENV_CLIPBOARD_BACKEND, "carbon");

  auto result = MirrorText().try_from_clipboard();
  ASSERT_TRUE(result.is_error());
  EXPECT_EQ(result.error().code, ErrorCode::InvalidArgument);
  EXPECT_EQ(result.error().location, ENV_CLIPBOARD_BACKEND);
}

TEST(ConverterDeathTest, FromClipboardAbortsWhenUnavailable) {
  FakeClipboard clipboard;
  clipboard.open_error = Error(ErrorCode::NoDisplayServer, "headless");

  BracketText bracket;
  EXPECT_DEATH(bracket.from_clipboard(clipboard),
               "Could not fetch the clipboard contents");
}

TEST(ConverterDeathTest, FromSystemClipboardAbortsHeadless) {
  ScopedEnv backend(ENV_CLIPBOARD_BACKEND, nullptr);
  ScopedEnv wayland("WAYLAND_DISPLAY", nullptr);
  ScopedEnv x11("DISPLAY", nullptr);

  BracketText bracket;
  EXPECT_DEATH(bracket.from_clipboard(),
               "Could not fetch the clipboard contents");
}

// ============================================================================
// Function Adapter
// ============================================================================

TEST(ConverterTest, MakeConverterWrapsFunction) {
  auto shout = make_converter([](std::string_view input) {
    return std::string(input) + "!";
  });

  EXPECT_EQ(shout.from_text("hey"), "hey!");

  FakeClipboard clipboard;
  clipboard.text = "copied";
  EXPECT_EQ(shout.from_clipboard(clipboard), "copied!");
}

TEST(ConverterTest, MakeConverterRejectsEmptyFunction) {
  EXPECT_THROW(make_converter(nullptr), std::invalid_argument);
  EXPECT_THROW(FunctionConverter{ConvertFunction{}}, std::invalid_argument);
}
