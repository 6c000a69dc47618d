/* @file Logger.cpp
 * @brief leveled console/file logging used by the engine and the apps
 *
 * © 2025 Stepwise — MIT-licensed.
 */

// STL headers
#include <algorithm>
#include <cctype>
#include <iostream>
#include <string>

// Stepwise headers
#include "core/Logger.hpp"
#include "io/FileLogger.hpp"

namespace stepwise {
  namespace core {

    std::optional<LogLevel> parseLogLevel(std::string_view name) {
      std::string lower(name);
      std::transform(lower.begin(), lower.end(), lower.begin(),
                     [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

      for (auto level :
           { LogLevel::Debug, LogLevel::Info, LogLevel::Warn, LogLevel::Error, LogLevel::Off }) {
        if (lower == toString(level))
          return level;
      }
      if (lower == "warning")
        return LogLevel::Warn;
      return std::nullopt;
    }

    Logger::Logger(LogLevel level, std::ostream* console)
        : level_(level), console_(console) {}

    Logger::~Logger() { flush(); }

    bool Logger::attachFile(const std::string& path) {
      auto file = std::make_unique<io::FileLogger>();
      if (!file->open(path))
        return false;
      file_ = std::move(file);
      return true;
    }

    void Logger::flush() {
      if (console_)
        console_->flush();
      if (file_)
        file_->flush();
    }

    bool Logger::enabled(LogLevel level) const {
      return level != LogLevel::Off && level >= level_;
    }

    void Logger::log(LogLevel level, std::string_view message) {
      if (!enabled(level))
        return;

      std::string line;
      line.reserve(message.size() + 10);
      line += '[';
      line += toString(level);
      line += "] ";
      line += message;
      line += '\n';

      if (console_)
        *console_ << line;
      if (file_)
        file_->write(line);
    }

  } // namespace core
} // namespace stepwise
