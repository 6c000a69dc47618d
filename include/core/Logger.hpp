#pragma once
/** @file  Logger.hpp
 *  @brief Synchronous leveled logger (console + optional run-log file).
 *
 *  © 2025 Stepwise — MIT-licensed.
 */

#include <cstdint>
#include <iosfwd>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace stepwise {
  namespace io {
    class FileLogger; // forward decl, only the .cpp needs the full type
  } // namespace io

  namespace core {

    enum class LogLevel : std::uint8_t { Debug, Info, Warn, Error, Off };

    inline const char* toString(LogLevel level) {
      switch (level) {
      case LogLevel::Debug:
        return "debug";
      case LogLevel::Info:
        return "info";
      case LogLevel::Warn:
        return "warn";
      case LogLevel::Error:
        return "error";
      case LogLevel::Off:
        return "off";
      default:
        return "unknown";
      }
    }

    /// Case-insensitive inverse of toString(); std::nullopt for unknown names.
    std::optional<LogLevel> parseLogLevel(std::string_view name);

    /**
 * @class Logger
 * @brief Writes `[level] message` lines to a console stream and, when a file
 *        is attached, to a FileLogger.
 *
 *  * Messages below the configured level are dropped before formatting.
 *  * Single-threaded, like the engine that owns it.
 */
    class Logger {

    public:
      /// @param console  Stream for console output; nullptr silences the console.
      explicit Logger(LogLevel level = LogLevel::Info, std::ostream* console = nullptr);
      ~Logger();

      Logger(const Logger&) = delete;
      Logger& operator=(const Logger&) = delete;

      // --- public API ---
      /** Appends to \p path from now on.  @returns false if it cannot be opened. */
      bool attachFile(const std::string& path);
      void flush();

      void setLevel(LogLevel level) { level_ = level; }
      LogLevel level() const { return level_; }
      bool enabled(LogLevel level) const;

      void log(LogLevel level, std::string_view message);
      void debug(std::string_view message) { log(LogLevel::Debug, message); }
      void info(std::string_view message) { log(LogLevel::Info, message); }
      void warn(std::string_view message) { log(LogLevel::Warn, message); }
      void error(std::string_view message) { log(LogLevel::Error, message); }

    private:
      LogLevel level_;
      std::ostream* console_;
      std::unique_ptr<io::FileLogger> file_;
    };

  } // namespace core
} // namespace stepwise
