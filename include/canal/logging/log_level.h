#pragma once

#include <cstdint>
#include <string>

#include "canal/core/compat.h"

namespace canal {
namespace logging {

// RFC-5424 severities, lowest first
enum class LogLevel : uint8_t {
  Debug = 0,
  Info,
  Notice,
  Warning,
  Error,
  Critical,
  Alert,
  Emergency,
  Off
};

enum class LogMode {
  Sync,  // Write to the sink on the calling thread
  NoOp   // Drop everything
};

// Subsystems; the first segment of a logger name selects one, so
// "client.http" belongs to Component::Client
enum class Component { Root, Client, Network, Event, Http, Config };

const char* logLevelName(LogLevel level);

// Case-insensitive; "warn" is accepted for Warning
optional<LogLevel> parseLogLevel(const std::string& name);

const char* componentName(Component component);

Component componentOf(const std::string& logger_name);

}  // namespace logging
}  // namespace canal
