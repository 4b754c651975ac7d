#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <thread>

#include "canal/logging/log_level.h"

namespace canal {
namespace logging {

struct LogMessage {
  LogLevel level{LogLevel::Info};
  std::string logger_name;
  std::string message;

  std::chrono::system_clock::time_point timestamp;
  std::thread::id thread_id;

  // Client connection the message is about, 0 for none
  uint64_t connection_id{0};

  const char* file{nullptr};
  int line{0};
  const char* function{nullptr};

  LogMessage()
      : timestamp(std::chrono::system_clock::now()),
        thread_id(std::this_thread::get_id()) {}
};

}  // namespace logging
}  // namespace canal
