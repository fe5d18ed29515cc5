/**
 * @file clipboard_linux.h
 * @brief Linux clipboard types and internal declarations
 *
 * Internal helpers for X11/Wayland clipboard access through the
 * wl-clipboard, xclip and xsel command-line tools.
 */

#ifndef TEXTCONV_PLATFORM_LINUX_CLIPBOARD_LINUX_H
#define TEXTCONV_PLATFORM_LINUX_CLIPBOARD_LINUX_H

#include "textconv/clipboard.h"
#include "textconv/error.h"
#include <optional>
#include <string>

namespace textconv {
namespace platform {

/**
 * @brief Shell command that prints the clipboard text
 */
struct ClipboardCommand {
  ClipboardBackend backend = ClipboardBackend::None;
  std::string read_command;
};

/**
 * @brief Captured output of a shell command
 */
struct CommandOutput {
  std::string output;
  int exit_status = -1; // -1 if the command did not exit normally
};

/**
 * @brief X11 display address parsed from DISPLAY
 */
struct X11Display {
  std::string host; // empty for a local display
  int number = -1;
};

/**
 * @brief Check if a command exists on PATH
 */
TEXTCONV_API bool command_exists(const char *cmd);

/**
 * @brief Execute a command and capture its standard output
 */
TEXTCONV_API Result<CommandOutput> execute_command(const std::string &cmd);

/**
 * @brief Parse a DISPLAY value such as ":0", "unix:1.0" or "host:10.0"
 */
TEXTCONV_API std::optional<X11Display>
parse_x11_display(const std::string &display);

/**
 * @brief Socket path of the Wayland compositor
 *
 * WAYLAND_DISPLAY defaults to "wayland-0" and is resolved against
 * XDG_RUNTIME_DIR unless it is absolute.
 *
 * @return Path, or empty if XDG_RUNTIME_DIR is needed but unset
 */
TEXTCONV_API std::string wayland_socket_path();

/**
 * @brief Connect to the display server of @p backend and hang up
 *
 * The clipboard tools exit non-zero both when the clipboard has no text
 * and when the display cannot be opened, so reachability is settled here
 * before any tool runs.
 *
 * @return ClipboardUnavailable if the display cannot be reached
 */
TEXTCONV_API Result<void> check_display_reachable(ClipboardBackend backend);

/**
 * @brief Pick the read command for a backend
 * @param preferred Backend to use, Auto to detect
 * @return Command or NoDisplayServer / ClipboardToolNotFound
 */
TEXTCONV_API Result<ClipboardCommand>
resolve_clipboard_command(ClipboardBackend preferred);

/**
 * @brief Read text from the clipboard with a resolved command
 * @return Text, std::nullopt if the tool exits non-zero, or
 *         ClipboardUnavailable if the tool could not be launched or did
 *         not exit normally
 */
TEXTCONV_API Result<std::optional<std::string>>
read_clipboard_text(const ClipboardCommand &command);

} // namespace platform
} // namespace textconv

#endif // TEXTCONV_PLATFORM_LINUX_CLIPBOARD_LINUX_H
