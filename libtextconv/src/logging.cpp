/**
 * @file logging.cpp
 * @brief plog setup implementation
 */

#include "textconv/logging.h"

#include <exception>
#include <memory>
#include <mutex>
#include <vector>

#include <plog/Appenders/ConsoleAppender.h>
#include <plog/Appenders/RollingFileAppender.h>
#include <plog/Formatters/TxtFormatter.h>
#include <plog/Init.h>
#include <plog/Log.h>

namespace fs = std::filesystem;

namespace textconv {

namespace {

std::mutex g_mutex;
bool g_initialized = false;

// plog keeps raw pointers to its appenders
std::vector<std::unique_ptr<plog::IAppender>> g_appenders;

} // namespace

Result<void> init_logging(const LogConfig &config) {
  std::lock_guard<std::mutex> lock(g_mutex);

  if (g_initialized) {
    if (auto logger = plog::get()) {
      logger->setMaxSeverity(config.severity);
    }
    return Result<void>::ok();
  }

  try {
    auto &logger = plog::init(config.severity);

    if (!config.file.empty()) {
      std::error_code ec;
      const auto dir = config.file.parent_path();
      if (!dir.empty()) {
        fs::create_directories(dir, ec);
        if (ec) {
          return Error(ErrorCode::FileCreateError,
                       "Unable to prepare log directory", ec.message())
              .at(dir.string());
        }
      }

      auto file_appender =
          std::make_unique<plog::RollingFileAppender<plog::TxtFormatter>>(
              config.file.c_str(), config.max_file_size, config.backup_count);
      logger.addAppender(file_appender.get());
      g_appenders.push_back(std::move(file_appender));
    }

    if (config.console) {
      auto console_appender =
          std::make_unique<plog::ConsoleAppender<plog::TxtFormatter>>();
      logger.addAppender(console_appender.get());
      g_appenders.push_back(std::move(console_appender));
    }
  } catch (const std::exception &ex) {
    return Error(ErrorCode::PlatformError, "Failed to initialise logging",
                 ex.what());
  }

  g_initialized = true;
  PLOG_DEBUG << "textconv logging initialised";
  return Result<void>::ok();
}

bool is_logging_initialized() {
  std::lock_guard<std::mutex> lock(g_mutex);
  return g_initialized;
}

void shutdown_logging() {
  std::lock_guard<std::mutex> lock(g_mutex);
  if (auto logger = plog::get()) {
    logger->setMaxSeverity(plog::none);
  }
}

} // namespace textconv
