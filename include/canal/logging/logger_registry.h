#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "canal/logging/logger.h"

namespace canal {
namespace logging {

/**
 * Process-wide table of named loggers ("client.http", "event.libevent").
 *
 * A logger's level is resolved, most specific first, from the glob
 * patterns (latest first), the level of its component and the global
 * level. Every logger writes to the default sink, stderr unless replaced.
 */
class LoggerRegistry {
 public:
  static LoggerRegistry& instance();

  LoggerSharedPtr getOrCreateLogger(const std::string& name);

  void setGlobalLevel(LogLevel level);
  LogLevel getGlobalLevel() const;

  void setComponentLevel(Component component, LogLevel level);

  // Glob with '*' and '?', e.g. setPattern("client.*", LogLevel::Debug)
  void setPattern(const std::string& pattern, LogLevel level);

  // Drops patterns and component levels
  void clearPatterns();

  LogLevel getEffectiveLevel(const std::string& name) const;

  void setDefaultSink(std::shared_ptr<LogSink> sink);
  std::shared_ptr<LogSink> getDefaultSink() const;

  std::vector<std::string> getLoggerNames() const;

 private:
  LoggerRegistry();

  LogLevel resolveLevelLocked(const std::string& name) const;
  void refreshLevelsLocked();

  mutable std::mutex mutex_;
  std::unordered_map<std::string, LoggerSharedPtr> loggers_;
  LogLevel global_level_{LogLevel::Info};
  std::map<Component, LogLevel> component_levels_;
  std::vector<std::pair<std::string, LogLevel>> patterns_;
  std::shared_ptr<LogSink> default_sink_;
};

// Glob match supporting '*' and '?'
bool globMatch(const std::string& pattern, const std::string& name);

}  // namespace logging
}  // namespace canal
