#include "canal/logging/log_level.h"

#include <algorithm>
#include <cctype>

namespace canal {
namespace logging {

namespace {

struct LevelName {
  LogLevel level;
  const char* name;
};

constexpr LevelName kLevelNames[] = {
    {LogLevel::Debug, "DEBUG"},       {LogLevel::Info, "INFO"},
    {LogLevel::Notice, "NOTICE"},     {LogLevel::Warning, "WARNING"},
    {LogLevel::Error, "ERROR"},       {LogLevel::Critical, "CRITICAL"},
    {LogLevel::Alert, "ALERT"},       {LogLevel::Emergency, "EMERGENCY"},
    {LogLevel::Off, "OFF"},
};

struct ComponentName {
  Component component;
  const char* name;
};

constexpr ComponentName kComponentNames[] = {
    {Component::Root, "root"},       {Component::Client, "client"},
    {Component::Network, "network"}, {Component::Event, "event"},
    {Component::Http, "http"},       {Component::Config, "config"},
};

}  // namespace

const char* logLevelName(LogLevel level) {
  for (const auto& entry : kLevelNames) {
    if (entry.level == level) {
      return entry.name;
    }
  }
  return "UNKNOWN";
}

optional<LogLevel> parseLogLevel(const std::string& name) {
  std::string upper(name);
  std::transform(upper.begin(), upper.end(), upper.begin(),
                 [](unsigned char c) { return std::toupper(c); });
  if (upper == "WARN") {
    return LogLevel::Warning;
  }
  for (const auto& entry : kLevelNames) {
    if (upper == entry.name) {
      return entry.level;
    }
  }
  return nullopt;
}

const char* componentName(Component component) {
  for (const auto& entry : kComponentNames) {
    if (entry.component == component) {
      return entry.name;
    }
  }
  return "root";
}

Component componentOf(const std::string& logger_name) {
  std::string prefix = logger_name.substr(0, logger_name.find('.'));
  for (const auto& entry : kComponentNames) {
    if (prefix == entry.name) {
      return entry.component;
    }
  }
  return Component::Root;
}

}  // namespace logging
}  // namespace canal
