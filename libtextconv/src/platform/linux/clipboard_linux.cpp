/**
 * @file clipboard_linux.cpp
 * @brief Linux clipboard implementation
 *
 * Implements clipboard access using command-line tools (wl-paste, xclip,
 * xsel) for maximum compatibility across different Linux environments.
 */

#include "clipboard_linux.h"
#include <array>
#include <cctype>
#include <cerrno>
#include <cstddef>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <memory>
#include <netdb.h>
#include <plog/Log.h>
#include <sys/socket.h>
#include <sys/un.h>
#include <sys/wait.h>
#include <unistd.h>

namespace textconv {
namespace platform {

// ============================================================================
// Command Execution Helpers
// ============================================================================

bool command_exists(const char *cmd) {
  std::string check = "command -v ";
  check += cmd;
  check += " >/dev/null 2>&1";
  return std::system(check.c_str()) == 0;
}

Result<CommandOutput> execute_command(const std::string &cmd) {
  std::array<char, 4096> buffer;
  CommandOutput result;

  std::unique_ptr<FILE, decltype(&pclose)> pipe(popen(cmd.c_str(), "r"),
                                                pclose);
  if (!pipe) {
    return Error(ErrorCode::ClipboardUnavailable, "Failed to execute command",
                 cmd);
  }

  size_t count = 0;
  while ((count = std::fread(buffer.data(), 1, buffer.size(), pipe.get())) >
         0) {
    result.output.append(buffer.data(), count);
  }

  if (std::ferror(pipe.get())) {
    return Error(ErrorCode::ClipboardUnavailable,
                 "Failed to read command output", cmd);
  }

  const int status = pclose(pipe.release());
  if (status != -1 && WIFEXITED(status)) {
    result.exit_status = WEXITSTATUS(status);
  }

  return result;
}

// ============================================================================
// Display Reachability
// ============================================================================

namespace {

constexpr int X11_TCP_PORT_BASE = 6000;
constexpr const char *X11_SOCKET_DIR = "/tmp/.X11-unix/X";

/// @return 0 on success, errno otherwise
int connect_unix_socket(const std::string &path, bool abstract) {
  sockaddr_un addr;
  std::memset(&addr, 0, sizeof(addr));
  addr.sun_family = AF_UNIX;

  // Abstract names start with a NUL byte and are not NUL-terminated
  const size_t offset = abstract ? 1 : 0;
  if (path.size() + offset >= sizeof(addr.sun_path)) {
    return ENAMETOOLONG;
  }
  std::memcpy(addr.sun_path + offset, path.data(), path.size());
  const socklen_t length = static_cast<socklen_t>(
      offsetof(sockaddr_un, sun_path) + offset + path.size() +
      (abstract ? 0 : 1));

  int sock = socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
  if (sock < 0) {
    return errno;
  }

  int error = 0;
  if (::connect(sock, reinterpret_cast<const sockaddr *>(&addr), length) !=
      0) {
    error = errno;
  }
  close(sock);
  return error;
}

bool connect_tcp(const std::string &host, int port) {
  addrinfo hints;
  std::memset(&hints, 0, sizeof(hints));
  hints.ai_family = AF_UNSPEC;
  hints.ai_socktype = SOCK_STREAM;

  addrinfo *res = nullptr;
  const std::string service = std::to_string(port);
  if (getaddrinfo(host.c_str(), service.c_str(), &hints, &res) != 0) {
    return false;
  }

  bool connected = false;
  for (addrinfo *p = res; p != nullptr && !connected; p = p->ai_next) {
    int sock = socket(p->ai_family, p->ai_socktype | SOCK_CLOEXEC,
                      p->ai_protocol);
    if (sock < 0) {
      continue;
    }
    connected = ::connect(sock, p->ai_addr, p->ai_addrlen) == 0;
    close(sock);
  }

  freeaddrinfo(res);
  return connected;
}

Result<void> check_x11_reachable() {
  const char *display = std::getenv("DISPLAY");
  if (!display || display[0] == '\0') {
    return Error(ErrorCode::ClipboardUnavailable, "DISPLAY is not set");
  }

  auto parsed = parse_x11_display(display);
  if (!parsed) {
    return Error(ErrorCode::ClipboardUnavailable, "Malformed DISPLAY",
                 display);
  }

  if (!parsed->host.empty()) {
    if (!connect_tcp(parsed->host, X11_TCP_PORT_BASE + parsed->number)) {
      return Error(ErrorCode::ClipboardUnavailable,
                   "Cannot connect to X display", display);
    }
    return Result<void>::ok();
  }

  // Xlib tries the abstract socket before the filesystem one
  const std::string path = X11_SOCKET_DIR + std::to_string(parsed->number);
  if (connect_unix_socket(path, true) == 0) {
    return Result<void>::ok();
  }
  const int error = connect_unix_socket(path, false);
  if (error != 0) {
    return Error(ErrorCode::ClipboardUnavailable,
                 "Cannot connect to X display",
                 std::string(display) + " (" + path +
                     "): " + std::strerror(error));
  }
  return Result<void>::ok();
}

Result<void> check_wayland_reachable() {
  const std::string path = wayland_socket_path();
  if (path.empty()) {
    return Error(ErrorCode::ClipboardUnavailable,
                 "XDG_RUNTIME_DIR is not set");
  }

  const int error = connect_unix_socket(path, false);
  if (error != 0) {
    return Error(ErrorCode::ClipboardUnavailable,
                 "Cannot connect to Wayland compositor",
                 path + ": " + std::strerror(error));
  }
  return Result<void>::ok();
}

} // namespace

std::optional<X11Display> parse_x11_display(const std::string &display) {
  const size_t colon = display.rfind(':');
  if (colon == std::string::npos) {
    return std::nullopt;
  }

  X11Display result;
  result.host = display.substr(0, colon);
  if (result.host == "unix") {
    result.host.clear();
  }
  if (!result.host.empty() && result.host[0] == '/') {
    return std::nullopt;
  }

  const std::string rest = display.substr(colon + 1);
  const size_t digits = rest.find_first_not_of("0123456789");
  const std::string number = rest.substr(0, digits);
  if (number.empty() || number.size() > 5) {
    return std::nullopt;
  }
  if (digits != std::string::npos && rest[digits] != '.') {
    return std::nullopt;
  }

  result.number = std::stoi(number);
  return result;
}

std::string wayland_socket_path() {
  const char *name = std::getenv("WAYLAND_DISPLAY");
  const std::string display = (name && name[0] != '\0') ? name : "wayland-0";
  if (display[0] == '/') {
    return display;
  }

  const char *runtime_dir = std::getenv("XDG_RUNTIME_DIR");
  if (!runtime_dir || runtime_dir[0] == '\0') {
    return std::string();
  }
  return std::string(runtime_dir) + "/" + display;
}

Result<void> check_display_reachable(ClipboardBackend backend) {
  switch (backend) {
  case ClipboardBackend::Wayland:
    return check_wayland_reachable();
  case ClipboardBackend::X11:
    return check_x11_reachable();
  default:
    return Error(ErrorCode::NoDisplayServer,
                 "No display server detected (headless mode?)");
  }
}

// ============================================================================
// Clipboard Operations
// ============================================================================

Result<ClipboardCommand> resolve_clipboard_command(ClipboardBackend preferred) {
  ClipboardCommand command;
  command.backend = preferred == ClipboardBackend::Auto
                        ? detect_display_server()
                        : preferred;

  if (command.backend == ClipboardBackend::Wayland) {
    if (!command_exists("wl-paste")) {
      return Error(ErrorCode::ClipboardToolNotFound,
                   "wl-paste not found. Install wl-clipboard package.");
    }
    command.read_command = "wl-paste --no-newline --type text 2>/dev/null";
  } else if (command.backend == ClipboardBackend::X11) {
    if (command_exists("xclip")) {
      command.read_command = "xclip -selection clipboard -o 2>/dev/null";
    } else if (command_exists("xsel")) {
      command.read_command = "xsel --clipboard --output 2>/dev/null";
    } else {
      return Error(ErrorCode::ClipboardToolNotFound,
                   "xclip or xsel not found. Install one of them.");
    }
  } else {
    return Error(ErrorCode::NoDisplayServer,
                 "No display server detected (headless mode?)");
  }

  return command;
}

Result<std::optional<std::string>>
read_clipboard_text(const ClipboardCommand &command) {
  auto result = execute_command(command.read_command);
  if (result.is_error()) {
    return result.error();
  }

  auto &out = result.value();
  if (out.exit_status == -1) {
    return Error(ErrorCode::ClipboardUnavailable,
                 "Clipboard tool terminated abnormally",
                 command.read_command);
  }
  if (out.exit_status != 0) {
    // The display was reachable, so the selection has no text target
    PLOG_DEBUG << "Clipboard tool exited with status " << out.exit_status
               << "; treating clipboard as holding no text";
    return std::optional<std::string>();
  }

  return std::optional<std::string>(std::move(out.output));
}

} // namespace platform
} // namespace textconv
