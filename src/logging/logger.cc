#include "canal/logging/logger.h"

namespace canal {
namespace logging {

void Logger::setSink(std::shared_ptr<LogSink> sink) {
  std::lock_guard<std::mutex> lock(sink_mutex_);
  sink_ = std::move(sink);
}

std::shared_ptr<LogSink> Logger::getSink() const {
  std::lock_guard<std::mutex> lock(sink_mutex_);
  return sink_;
}

void Logger::flush() {
  std::shared_ptr<LogSink> sink = getSink();
  if (sink) {
    sink->flush();
  }
}

void Logger::write(const LogMessage& msg) {
  // Sinks lock themselves; holding a reference keeps a replaced sink alive
  // until this write is done
  std::shared_ptr<LogSink> sink = getSink();
  if (sink) {
    sink->log(msg);
  }
}

}  // namespace logging
}  // namespace canal
