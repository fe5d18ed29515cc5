/**
 * @file clipboard.cpp
 * @brief Clipboard backend selection
 */

#include "textconv/clipboard.h"
#include "clipboard_platform.h"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <plog/Log.h>

namespace textconv {

// ============================================================================
// Clipboard Backend Names
// ============================================================================

const char *clipboard_backend_name(ClipboardBackend backend) {
  switch (backend) {
  case ClipboardBackend::Auto:
    return "Auto";
  case ClipboardBackend::Wayland:
    return "Wayland";
  case ClipboardBackend::X11:
    return "X11";
  case ClipboardBackend::None:
    return "None";
  default:
    return "Invalid";
  }
}

std::optional<ClipboardBackend>
parse_clipboard_backend(const std::string &name) {
  std::string lower = name;
  std::transform(lower.begin(), lower.end(), lower.begin(),
                 [](unsigned char c) { return std::tolower(c); });

  if (lower == "auto") {
    return ClipboardBackend::Auto;
  }
  if (lower == "wayland") {
    return ClipboardBackend::Wayland;
  }
  if (lower == "x11") {
    return ClipboardBackend::X11;
  }
  if (lower == "none") {
    return ClipboardBackend::None;
  }
  return std::nullopt;
}

// ============================================================================
// Display Server Detection
// ============================================================================

ClipboardBackend detect_display_server() {
  const char *wayland = std::getenv("WAYLAND_DISPLAY");
  if (wayland && wayland[0] != '\0') {
    return ClipboardBackend::Wayland;
  }

  const char *display = std::getenv("DISPLAY");
  if (display && display[0] != '\0') {
    return ClipboardBackend::X11;
  }

  return ClipboardBackend::None;
}

// ============================================================================
// Service Factory
// ============================================================================

std::unique_ptr<ClipboardService>
make_system_clipboard(const ClipboardConfig &config) {
  PLOG_DEBUG << "Creating " TEXTCONV_PLATFORM_NAME
             << " system clipboard (preferred backend: "
             << clipboard_backend_name(config.preferred_backend) << ")";
  return platform_make_clipboard(config);
}

bool is_clipboard_available(const ClipboardConfig &config) {
  auto service = make_system_clipboard(config);
  return service->open().is_ok();
}

} // namespace textconv
