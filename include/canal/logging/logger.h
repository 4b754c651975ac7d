#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>

#include <fmt/format.h>

#include "canal/logging/log_level.h"
#include "canal/logging/log_message.h"
#include "canal/logging/log_sink.h"

namespace canal {
namespace logging {

/**
 * Named logger. Loggers are normally obtained from the LoggerRegistry,
 * which keeps their level in line with the global, component and pattern
 * settings and points them all at the default sink.
 */
class Logger {
 public:
  explicit Logger(std::string name, LogMode mode = LogMode::Sync)
      : name_(std::move(name)), mode_(mode) {}

  /**
   * Format and write a message. A non-zero connection id tags the line
   * with the client connection it concerns.
   */
  template <typename... Args>
  void log(LogLevel level,
           uint64_t connection_id,
           const char* file,
           int line,
           const char* function,
           const char* format,
           Args&&... args) {
    if (!shouldLog(level)) {
      return;
    }
    LogMessage msg;
    msg.level = level;
    msg.logger_name = name_;
    msg.message =
        fmt::format(fmt::runtime(format), std::forward<Args>(args)...);
    msg.connection_id = connection_id;
    msg.file = file;
    msg.line = line;
    msg.function = function;
    write(msg);
  }

  bool shouldLog(LogLevel level) const {
    return mode_ != LogMode::NoOp && level != LogLevel::Off &&
           level >= level_.load(std::memory_order_relaxed);
  }

  void setLevel(LogLevel level) {
    level_.store(level, std::memory_order_relaxed);
  }
  LogLevel getLevel() const { return level_.load(std::memory_order_relaxed); }

  void setSink(std::shared_ptr<LogSink> sink);
  std::shared_ptr<LogSink> getSink() const;

  LogMode getMode() const { return mode_; }
  const std::string& getName() const { return name_; }

  void flush();

 private:
  void write(const LogMessage& msg);

  const std::string name_;
  const LogMode mode_;
  std::atomic<LogLevel> level_{LogLevel::Info};

  mutable std::mutex sink_mutex_;
  std::shared_ptr<LogSink> sink_;
};

using LoggerSharedPtr = std::shared_ptr<Logger>;

}  // namespace logging
}  // namespace canal
