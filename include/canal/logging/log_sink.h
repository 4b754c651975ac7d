#pragma once

#include <fstream>
#include <memory>
#include <mutex>
#include <string>

#include "canal/logging/log_formatter.h"
#include "canal/logging/log_message.h"

namespace canal {
namespace logging {

class LogSink {
 public:
  virtual ~LogSink() = default;

  virtual void log(const LogMessage& msg) = 0;
  virtual void flush() = 0;

  void setFormatter(std::unique_ptr<Formatter> formatter) {
    formatter_ = std::move(formatter);
  }

 protected:
  std::unique_ptr<Formatter> formatter_{std::make_unique<DefaultFormatter>()};
};

// Writes to stderr (default) or stdout
class StdioSink : public LogSink {
 public:
  explicit StdioSink(bool use_stderr = true) : use_stderr_(use_stderr) {}

  void log(const LogMessage& msg) override;
  void flush() override;

 private:
  const bool use_stderr_;
  std::mutex mutex_;
};

// Appends to a file, created if missing
class FileSink : public LogSink {
 public:
  // Throws std::runtime_error when the file cannot be opened
  explicit FileSink(const std::string& path);

  void log(const LogMessage& msg) override;
  void flush() override;

  const std::string& path() const { return path_; }

 private:
  const std::string path_;
  std::ofstream file_;
  std::mutex mutex_;
};

class NullSink : public LogSink {
 public:
  void log(const LogMessage&) override {}
  void flush() override {}
};

class SinkFactory {
 public:
  static std::unique_ptr<LogSink> createStdioSink(bool use_stderr = true);
  static std::unique_ptr<LogSink> createFileSink(const std::string& path);
  static std::unique_ptr<LogSink> createNullSink();
};

}  // namespace logging
}  // namespace canal
