#include "canal/logging/log_sink.h"

#include <cstdio>
#include <stdexcept>

namespace canal {
namespace logging {

void StdioSink::log(const LogMessage& msg) {
  std::string line = formatter_->format(msg);
  line.push_back('\n');

  std::lock_guard<std::mutex> lock(mutex_);
  std::fwrite(line.data(), 1, line.size(), use_stderr_ ? stderr : stdout);
}

void StdioSink::flush() {
  std::lock_guard<std::mutex> lock(mutex_);
  std::fflush(use_stderr_ ? stderr : stdout);
}

FileSink::FileSink(const std::string& path)
    : path_(path), file_(path, std::ios::out | std::ios::app) {
  if (!file_.is_open()) {
    throw std::runtime_error("Cannot open log file: " + path);
  }
}

void FileSink::log(const LogMessage& msg) {
  std::string line = formatter_->format(msg);

  std::lock_guard<std::mutex> lock(mutex_);
  file_ << line << '\n';
  // Warnings and above reach the disk even if the process dies next
  if (msg.level >= LogLevel::Warning) {
    file_.flush();
  }
}

void FileSink::flush() {
  std::lock_guard<std::mutex> lock(mutex_);
  file_.flush();
}

std::unique_ptr<LogSink> SinkFactory::createStdioSink(bool use_stderr) {
  return std::make_unique<StdioSink>(use_stderr);
}

std::unique_ptr<LogSink> SinkFactory::createFileSink(const std::string& path) {
  return std::make_unique<FileSink>(path);
}

std::unique_ptr<LogSink> SinkFactory::createNullSink() {
  return std::make_unique<NullSink>();
}

}  // namespace logging
}  // namespace canal
