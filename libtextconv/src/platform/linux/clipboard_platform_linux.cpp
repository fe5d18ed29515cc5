/**
 * @file clipboard_platform_linux.cpp
 * @brief Clipboard platform hooks for Linux
 *
 * Implements the platform hooks declared in clipboard_platform.h using
 * X11/Wayland clipboard access.
 */

#include "../../clipboard_platform.h"
#include "clipboard_linux.h"
#include <memory>
#include <plog/Log.h>

namespace textconv {

namespace {

class LinuxClipboardSession : public ClipboardSession {
public:
  explicit LinuxClipboardSession(platform::ClipboardCommand command)
      : command_(std::move(command)) {}

  Result<std::optional<std::string>> read_text() override {
    return platform::read_clipboard_text(command_);
  }

private:
  platform::ClipboardCommand command_;
};

class LinuxClipboardService : public ClipboardService {
public:
  explicit LinuxClipboardService(const ClipboardConfig &config)
      : config_(config) {}

  Result<std::unique_ptr<ClipboardSession>> open() override {
    auto command =
        platform::resolve_clipboard_command(config_.preferred_backend);
    if (command.is_error()) {
      PLOG_ERROR << "Clipboard unavailable: " << command.error().to_string();
      return command.error();
    }

    auto reachable = platform::check_display_reachable(command.value().backend);
    if (reachable.is_error()) {
      PLOG_ERROR << "Clipboard unavailable: " << reachable.error().to_string();
      return reachable.error();
    }

    PLOG_DEBUG << "Opened "
               << clipboard_backend_name(command.value().backend)
               << " clipboard session";
    return std::unique_ptr<ClipboardSession>(
        std::make_unique<LinuxClipboardSession>(std::move(command).value()));
  }

private:
  ClipboardConfig config_;
};

} // namespace

// ============================================================================
// Platform Hook Implementations
// ============================================================================

std::unique_ptr<ClipboardService>
platform_make_clipboard(const ClipboardConfig &config) {
  return std::make_unique<LinuxClipboardService>(config);
}

} // namespace textconv
