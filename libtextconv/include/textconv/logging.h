/**
 * @file logging.h
 * @brief plog setup for applications embedding textconv
 *
 * The library logs through the default plog instance. Nothing is
 * written until the application calls init_logging() or initialises
 * plog itself.
 */

#ifndef TEXTCONV_LOGGING_H
#define TEXTCONV_LOGGING_H

#include "config.h"
#include "error.h"
#include "platform.h"

namespace textconv {

/**
 * @brief Register the appenders described by @p config
 *
 * Adds a rolling file appender when config.file is set and a console
 * appender when config.console is set. Calling it again only updates
 * the severity.
 */
TEXTCONV_API Result<void> init_logging(const LogConfig &config);

/// Whether init_logging() has registered the appenders
TEXTCONV_API bool is_logging_initialized();

/// Silence the logger (severity plog::none)
TEXTCONV_API void shutdown_logging();

} // namespace textconv

#endif // TEXTCONV_LOGGING_H
