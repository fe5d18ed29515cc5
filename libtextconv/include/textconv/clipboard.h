/**
 * @file clipboard.h
 * @brief Clipboard access for textconv
 *
 * The clipboard is a boundary collaborator: converters only ever need
 * "open a session" and "read the current text snapshot, or none".
 * ClipboardService is the seam; make_system_clipboard() returns the
 * desktop implementation and tests or embedding applications can
 * supply their own.
 */

#ifndef TEXTCONV_CLIPBOARD_H
#define TEXTCONV_CLIPBOARD_H

#include "error.h"
#include "platform.h"
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace textconv {

// ============================================================================
// Clipboard Backends
// ============================================================================

/**
 * @brief Display server whose clipboard is read
 */
enum class ClipboardBackend : uint8_t {
  /// Detect from the environment
  Auto = 0,

  /// Wayland, read with wl-paste
  Wayland = 1,

  /// X11, read with xclip or xsel
  X11 = 2,

  /// No display server (headless)
  None = 3
};

/**
 * @brief Get human-readable name for clipboard backend
 */
TEXTCONV_API const char *clipboard_backend_name(ClipboardBackend backend);

/**
 * @brief Parse "auto", "wayland", "x11" or "none" (case-insensitive)
 */
TEXTCONV_API std::optional<ClipboardBackend>
parse_clipboard_backend(const std::string &name);

/**
 * @brief Detect the current display server from WAYLAND_DISPLAY / DISPLAY
 *
 * Never returns ClipboardBackend::Auto.
 */
TEXTCONV_API ClipboardBackend detect_display_server();

// ============================================================================
// Clipboard Configuration
// ============================================================================

/**
 * @brief Configuration for clipboard access
 */
struct ClipboardConfig {
  /// Backend to use; Auto detects the running display server
  ClipboardBackend preferred_backend = ClipboardBackend::Auto;
};

// ============================================================================
// Clipboard Service
// ============================================================================

/**
 * @brief An open clipboard session
 *
 * Released when the owning unique_ptr goes out of scope.
 */
class TEXTCONV_API ClipboardSession {
public:
  virtual ~ClipboardSession() = default;

  /**
   * @brief Read the current text snapshot
   * @return The text, std::nullopt if the clipboard holds no text, or an
   *         error if the clipboard could not be queried
   */
  virtual Result<std::optional<std::string>> read_text() = 0;
};

/**
 * @brief Source of clipboard sessions
 */
class TEXTCONV_API ClipboardService {
public:
  virtual ~ClipboardService() = default;

  /**
   * @brief Open a session on the clipboard
   * @return Session or error (ErrorCategory::ClipboardUnavailable)
   */
  virtual Result<std::unique_ptr<ClipboardSession>> open() = 0;
};

/**
 * @brief Create the desktop clipboard service
 *
 * On Linux this shells out to wl-paste (Wayland) or xclip/xsel (X11).
 */
TEXTCONV_API std::unique_ptr<ClipboardService>
make_system_clipboard(const ClipboardConfig &config = {});

/**
 * @brief Check if a clipboard session can be opened, without reading
 */
TEXTCONV_API bool is_clipboard_available(const ClipboardConfig &config = {});

} // namespace textconv

#endif // TEXTCONV_CLIPBOARD_H
