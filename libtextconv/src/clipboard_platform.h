#ifndef TEXTCONV_CLIPBOARD_PLATFORM_H
#define TEXTCONV_CLIPBOARD_PLATFORM_H

#include "textconv/clipboard.h"
#include <memory>

namespace textconv {

// Platform hooks
std::unique_ptr<ClipboardService>
platform_make_clipboard(const ClipboardConfig &config);

} // namespace textconv

#endif // TEXTCONV_CLIPBOARD_PLATFORM_H
