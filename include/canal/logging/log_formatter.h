#pragma once

#include <string>

#include "canal/logging/log_message.h"

namespace canal {
namespace logging {

class Formatter {
 public:
  virtual ~Formatter() = default;
  virtual std::string format(const LogMessage& msg) const = 0;
};

/**
 * Single-line text format:
 *
 *   [2024-05-01 12:00:00.042] [WARNING] [T:140213] [client.http] [conn:3]
 *   Request to '/slow' timed out (http_client.cc:311)
 *
 * The connection tag is left out for messages not tied to a connection.
 */
class DefaultFormatter : public Formatter {
 public:
  std::string format(const LogMessage& msg) const override;
};

}  // namespace logging
}  // namespace canal
