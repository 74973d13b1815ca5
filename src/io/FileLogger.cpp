/* @file FileLogger.cpp
 * @brief buffered fwrite sink used by core::Logger
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

#include "io/FileLogger.hpp"

using namespace cuebridge::io;

FileLogger::~FileLogger() { close(); }

bool FileLogger::open(const std::string& path) {
  close();
  fp_ = std::fopen(path.c_str(), "a");
  owned_ = fp_ != nullptr;
  return fp_ != nullptr;
}

bool FileLogger::attach(FILE* stream) {
  close();
  fp_ = stream;
  owned_ = false;
  return fp_ != nullptr;
}

void FileLogger::write(const std::string& line) {
  if (!fp_)
    return;
  buffer_.insert(buffer_.end(), line.begin(), line.end());
  if (buffer_.size() >= kFlushThreshold)
    flush();
}

bool FileLogger::flush() {
  if (!fp_)
    return false;
  bool ok = true;
  if (!buffer_.empty()) {
    ok = std::fwrite(buffer_.data(), 1, buffer_.size(), fp_) == buffer_.size();
    buffer_.clear();
  }
  return std::fflush(fp_) == 0 && ok;
}

void FileLogger::close() {
  if (!fp_)
    return;
  flush();
  if (owned_)
    std::fclose(fp_);
  fp_ = nullptr;
  owned_ = false;
}
