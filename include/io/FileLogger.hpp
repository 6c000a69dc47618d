#pragma once
/** @file  FileLogger.hpp
 *  @brief Buffered append-only text writer for run logs.
 *
 *  © 2025 Stepwise — MIT-licensed.
 */

#include <cstdio>
#include <string>
#include <vector>

namespace stepwise {
  namespace io {

    /**
 * @class FileLogger
 * @brief RAII wrapper that opens a file in append mode, buffers writes, and
 *        flushes on demand.
 *
 *  * Buffer is pushed to disk once it grows past 4 kB, on `flush()` and on close.
 *  * Lines from earlier runs are kept, so one file holds the whole history of a
 *    machine instance.
 */
    class FileLogger {
    public:
      FileLogger() = default;
      ~FileLogger(); ///< flush + fclose

      //---public API------------------------------------------------------
      /** @returns false if path cannot be opened writable. */
      bool open(const std::string& path);

      /** Queues one line (caller includes trailing '\n'). No-op while closed. */
      void write(const std::string& line);

      /** Force-flush buffer to disk; returns true on success. */
      bool flush();

      void close();

      bool isOpen() const { return fp_ != nullptr; }

      //---non-copyable, move-enabled---------------------------------------
      FileLogger(const FileLogger&) = delete;
      FileLogger& operator=(const FileLogger&) = delete;
      FileLogger(FileLogger&& other) noexcept;
      FileLogger& operator=(FileLogger&& other) noexcept;

    private:
      static constexpr std::size_t kFlushThreshold = 4096;

      FILE* fp_{ nullptr };
      std::vector<char> buffer_;
    };

  } // namespace io
} // namespace stepwise
