#include "canal/logging/logger_registry.h"

namespace canal {
namespace logging {

bool globMatch(const std::string& pattern, const std::string& name) {
  size_t p = 0;
  size_t n = 0;
  size_t star = std::string::npos;
  size_t resume = 0;

  while (n < name.size()) {
    if (p < pattern.size() && (pattern[p] == '?' || pattern[p] == name[n])) {
      ++p;
      ++n;
    } else if (p < pattern.size() && pattern[p] == '*') {
      star = p++;
      resume = n;
    } else if (star != std::string::npos) {
      p = star + 1;
      n = ++resume;
    } else {
      return false;
    }
  }
  while (p < pattern.size() && pattern[p] == '*') {
    ++p;
  }
  return p == pattern.size();
}

LoggerRegistry& LoggerRegistry::instance() {
  static LoggerRegistry registry;
  return registry;
}

LoggerRegistry::LoggerRegistry()
    : default_sink_(std::make_shared<StdioSink>()) {}

LoggerSharedPtr LoggerRegistry::getOrCreateLogger(const std::string& name) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = loggers_.find(name);
  if (it != loggers_.end()) {
    return it->second;
  }

  auto logger = std::make_shared<Logger>(name);
  logger->setLevel(resolveLevelLocked(name));
  logger->setSink(default_sink_);
  loggers_.emplace(name, logger);
  return logger;
}

void LoggerRegistry::setGlobalLevel(LogLevel level) {
  std::lock_guard<std::mutex> lock(mutex_);
  global_level_ = level;
  refreshLevelsLocked();
}

LogLevel LoggerRegistry::getGlobalLevel() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return global_level_;
}

void LoggerRegistry::setComponentLevel(Component component, LogLevel level) {
  std::lock_guard<std::mutex> lock(mutex_);
  component_levels_[component] = level;
  refreshLevelsLocked();
}

void LoggerRegistry::setPattern(const std::string& pattern, LogLevel level) {
  std::lock_guard<std::mutex> lock(mutex_);
  patterns_.emplace_back(pattern, level);
  refreshLevelsLocked();
}

void LoggerRegistry::clearPatterns() {
  std::lock_guard<std::mutex> lock(mutex_);
  patterns_.clear();
  component_levels_.clear();
  refreshLevelsLocked();
}

LogLevel LoggerRegistry::getEffectiveLevel(const std::string& name) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return resolveLevelLocked(name);
}

LogLevel LoggerRegistry::resolveLevelLocked(const std::string& name) const {
  for (auto it = patterns_.rbegin(); it != patterns_.rend(); ++it) {
    if (globMatch(it->first, name)) {
      return it->second;
    }
  }
  auto component = component_levels_.find(componentOf(name));
  if (component != component_levels_.end()) {
    return component->second;
  }
  return global_level_;
}

void LoggerRegistry::refreshLevelsLocked() {
  for (auto& entry : loggers_) {
    entry.second->setLevel(resolveLevelLocked(entry.first));
  }
}

void LoggerRegistry::setDefaultSink(std::shared_ptr<LogSink> sink) {
  std::lock_guard<std::mutex> lock(mutex_);
  default_sink_ = sink ? std::move(sink) : std::make_shared<StdioSink>();
  for (auto& entry : loggers_) {
    entry.second->setSink(default_sink_);
  }
}

std::shared_ptr<LogSink> LoggerRegistry::getDefaultSink() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return default_sink_;
}

std::vector<std::string> LoggerRegistry::getLoggerNames() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<std::string> names;
  names.reserve(loggers_.size());
  for (const auto& entry : loggers_) {
    names.push_back(entry.first);
  }
  return names;
}

}  // namespace logging
}  // namespace canal
