/* @file FileLogger.cpp
 * @brief buffered FILE* writer behind the file sink of core::Logger
 *
 * © 2025 Stepwise — MIT-licensed.
 */

// STL headers
#include <cerrno>
#include <cstring> // for strerror
#include <iostream>
#include <utility>

// Stepwise headers
#include "io/FileLogger.hpp"

using namespace stepwise::io;

FileLogger::~FileLogger() { close(); }

FileLogger::FileLogger(FileLogger&& other) noexcept
    : fp_(std::exchange(other.fp_, nullptr)), buffer_(std::move(other.buffer_)) {}

FileLogger& FileLogger::operator=(FileLogger&& other) noexcept {
  if (this != &other) {
    close();
    fp_ = std::exchange(other.fp_, nullptr);
    buffer_ = std::move(other.buffer_);
  }
  return *this;
}

bool FileLogger::open(const std::string& path) {
  close();
  fp_ = std::fopen(path.c_str(), "a");
  if (fp_ == nullptr) {
    std::cerr << "Error " << errno << " from fopen(" << path << "): " << strerror(errno) << "\n";
    return false;
  }
  return true;
}

void FileLogger::write(const std::string& line) {
  if (fp_ == nullptr)
    return;
  buffer_.insert(buffer_.end(), line.begin(), line.end());
  if (buffer_.size() >= kFlushThreshold)
    flush();
}

bool FileLogger::flush() {
  if (fp_ == nullptr)
    return false;

  std::size_t total = 0;
  while (total < buffer_.size()) {
    std::size_t written = std::fwrite(buffer_.data() + total, 1, buffer_.size() - total, fp_);
    if (written == 0) {
      std::cerr << "Error " << errno << " from fwrite: " << strerror(errno) << "\n";
      buffer_.erase(buffer_.begin(), buffer_.begin() + static_cast<std::ptrdiff_t>(total));
      return false;
    }
    total += written;
  }
  buffer_.clear();
  return std::fflush(fp_) == 0;
}

void FileLogger::close() {
  if (fp_ == nullptr)
    return;
  flush();
  std::fclose(fp_);
  fp_ = nullptr;
}
