#include "canal/logging/log_formatter.h"

#include <cstring>
#include <ctime>
#include <iterator>

#include <fmt/chrono.h>
#include <fmt/format.h>
#include <fmt/std.h>

namespace canal {
namespace logging {

namespace {

const char* baseName(const char* path) {
  const char* slash = std::strrchr(path, '/');
  return slash ? slash + 1 : path;
}

}  // namespace

std::string DefaultFormatter::format(const LogMessage& msg) const {
  using namespace std::chrono;

  std::time_t seconds = system_clock::to_time_t(msg.timestamp);
  std::tm local{};
  localtime_r(&seconds, &local);
  auto millis =
      duration_cast<milliseconds>(msg.timestamp.time_since_epoch()).count() %
      1000;

  fmt::memory_buffer out;
  fmt::format_to(std::back_inserter(out),
                 "[{:%Y-%m-%d %H:%M:%S}.{:03}] [{}] [T:{}] [{}] ", local,
                 millis, logLevelName(msg.level), msg.thread_id,
                 msg.logger_name);
  if (msg.connection_id != 0) {
    fmt::format_to(std::back_inserter(out), "[conn:{}] ", msg.connection_id);
  }
  fmt::format_to(std::back_inserter(out), "{}", msg.message);
  if (msg.file != nullptr && msg.line > 0) {
    fmt::format_to(std::back_inserter(out), " ({}:{})", baseName(msg.file),
                   msg.line);
  }
  return fmt::to_string(out);
}

}  // namespace logging
}  // namespace canal
