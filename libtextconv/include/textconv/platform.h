/**
 * @file platform.h
 * @brief Platform detection and abstraction macros for textconv
 *
 * Compile-time platform detection plus the export macro shared by every
 * textconv header. The clipboard backend is only implemented for Linux
 * desktops.
 */

#ifndef TEXTCONV_PLATFORM_H
#define TEXTCONV_PLATFORM_H

// ============================================================================
// Platform Detection
// ============================================================================

#if defined(__linux__)
#define TEXTCONV_PLATFORM_LINUX 1
#define TEXTCONV_PLATFORM_NAME "Linux"
#else
#error "Unsupported platform. textconv only supports Linux."
#endif

// ============================================================================
// Export/Import Macros
// ============================================================================

#ifdef TEXTCONV_BUILDING_SHARED
#define TEXTCONV_API __attribute__((visibility("default")))
#else
#define TEXTCONV_API
#endif

#endif // TEXTCONV_PLATFORM_H
