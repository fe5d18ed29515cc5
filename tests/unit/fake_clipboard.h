/**
 * @file fake_clipboard.h
 * @brief In-memory ClipboardService for tests
 */

#ifndef TEXTCONV_TESTS_FAKE_CLIPBOARD_H
#define TEXTCONV_TESTS_FAKE_CLIPBOARD_H

#include <textconv/clipboard.h>

#include <memory>
#include <optional>
#include <string>

namespace textconv {
namespace test {

/**
 * @brief Clipboard whose contents and failures are set by the test
 */
class FakeClipboard : public ClipboardService {
public:
  /// Text returned by read_text(); nullopt means "no text"
  std::optional<std::string> text;

  /// Error returned by open(), if set
  std::optional<Error> open_error;

  /// Error returned by read_text(), if set
  std::optional<Error> read_error;

  int open_count = 0;

  Result<std::unique_ptr<ClipboardSession>> open() override {
    ++open_count;
    if (open_error) {
      return *open_error;
    }
    return std::unique_ptr<ClipboardSession>(std::make_unique<Session>(*this));
  }

private:
  class Session : public ClipboardSession {
  public:
    explicit Session(const FakeClipboard &owner) : owner_(owner) {}

    Result<std::optional<std::string>> read_text() override {
      if (owner_.read_error) {
        return *owner_.read_error;
      }
      return owner_.text;
    }

  private:
    const FakeClipboard &owner_;
  };
};

} // namespace test
} // namespace textconv

#endif // TEXTCONV_TESTS_FAKE_CLIPBOARD_H
