#define CANAL_LOG_COMPONENT "config.units"

#include "canal/config/units.h"

#include <limits>
#include <regex>

#include "canal/logging/log_macros.h"

namespace canal {
namespace config {

namespace {

const int64_t kMsPerSecond = 1000;
const int64_t kMsPerMinute = 60 * kMsPerSecond;
const int64_t kMsPerHour = 60 * kMsPerMinute;

}  // namespace

// Duration implementation
std::pair<bool, std::chrono::milliseconds> Duration::parse(
    const std::string& str) {
  std::string error;
  return parseWithError(str, error);
}

std::pair<bool, std::chrono::milliseconds> Duration::parse(
    const nlohmann::json& value) {
  if (value.is_string()) {
    return parse(value.get<std::string>());
  }

  if (value.is_number()) {
    // Assume milliseconds if no unit specified
    int64_t ms = value.is_number_float()
                     ? static_cast<int64_t>(value.get<double>())
                     : value.get<int64_t>();
    if (ms < 0) {
      CANAL_LOG(Error, "Duration values must be non-negative: {}", ms);
      return {false, std::chrono::milliseconds(0)};
    }
    return {true, std::chrono::milliseconds(ms)};
  }

  CANAL_LOG(Error, "Invalid duration value type: expected string or number");
  return {false, std::chrono::milliseconds(0)};
}

std::string Duration::toString(std::chrono::milliseconds duration) {
  auto ms = duration.count();

  if (ms == 0)
    return "0ms";
  if (ms % kMsPerHour == 0)
    return std::to_string(ms / kMsPerHour) + "h";
  if (ms % kMsPerMinute == 0)
    return std::to_string(ms / kMsPerMinute) + "m";
  if (ms % kMsPerSecond == 0)
    return std::to_string(ms / kMsPerSecond) + "s";
  return std::to_string(ms) + "ms";
}

bool Duration::isValid(const std::string& str) {
  static const std::regex pattern("^[0-9]+(ms|s|m|h)$");
  return std::regex_match(str, pattern);
}

std::pair<bool, std::chrono::milliseconds> Duration::parseWithError(
    const std::string& str, std::string& error_message) {
  static const std::regex pattern("^([0-9]+)(ms|s|m|h)$");
  std::smatch match;

  if (!std::regex_match(str, match, pattern)) {
    error_message = "Invalid duration format '" + str +
                    "'. Expected format: <number><unit> where unit is ms, s, "
                    "m, or h (e.g., '30s', '5m', '1h')";
    return {false, std::chrono::milliseconds(0)};
  }

  try {
    int64_t value = std::stoll(match[1].str());
    std::string unit = match[2].str();

    int64_t multiplier = 1;
    if (unit == "s") {
      multiplier = kMsPerSecond;
    } else if (unit == "m") {
      multiplier = kMsPerMinute;
    } else if (unit == "h") {
      multiplier = kMsPerHour;
    }

    if (value > std::numeric_limits<int64_t>::max() / multiplier) {
      error_message = "Duration value too large (overflow): " + str;
      return {false, std::chrono::milliseconds(0)};
    }

    return {true, std::chrono::milliseconds(value * multiplier)};
  } catch (const std::exception& e) {
    error_message = "Failed to parse duration value: " + std::string(e.what());
    return {false, std::chrono::milliseconds(0)};
  }
}

// Size implementation
std::pair<bool, size_t> Size::parse(const std::string& str) {
  std::string error;
  return parseWithError(str, error);
}

std::pair<bool, size_t> Size::parse(const nlohmann::json& value) {
  if (value.is_string()) {
    return parse(value.get<std::string>());
  }

  if (value.is_number_unsigned()) {
    return {true, value.get<size_t>()};
  }

  if (value.is_number_integer()) {
    int64_t raw = value.get<int64_t>();
    if (raw < 0) {
      CANAL_LOG(Error, "Size values must be non-negative: {}", raw);
      return {false, 0};
    }
    return {true, static_cast<size_t>(raw)};
  }

  CANAL_LOG(Error, "Invalid size value type: expected string or integer");
  return {false, 0};
}

std::string Size::toString(size_t bytes) {
  if (bytes == 0)
    return "0B";

  if (bytes % UnitConversion::GIGABYTE == 0) {
    return std::to_string(bytes / UnitConversion::GIGABYTE) + "GB";
  }
  if (bytes % UnitConversion::MEGABYTE == 0) {
    return std::to_string(bytes / UnitConversion::MEGABYTE) + "MB";
  }
  if (bytes % UnitConversion::KILOBYTE == 0) {
    return std::to_string(bytes / UnitConversion::KILOBYTE) + "KB";
  }
  return std::to_string(bytes) + "B";
}

bool Size::isValid(const std::string& str) {
  static const std::regex pattern("^[0-9]+(B|KB|MB|GB)$");
  return std::regex_match(str, pattern);
}

std::pair<bool, size_t> Size::parseWithError(const std::string& str,
                                             std::string& error_message) {
  static const std::regex pattern("^([0-9]+)(B|KB|MB|GB)$");
  std::smatch match;

  if (!std::regex_match(str, match, pattern)) {
    error_message = "Invalid size format '" + str +
                    "'. Expected format: <number><unit> where unit is B, KB, "
                    "MB, or GB (e.g., '1024B', '10MB', '2GB')";
    return {false, 0};
  }

  try {
    uint64_t value = std::stoull(match[1].str());
    std::string unit = match[2].str();

    uint64_t multiplier = 1;
    if (unit == "KB") {
      multiplier = UnitConversion::KILOBYTE;
    } else if (unit == "MB") {
      multiplier = UnitConversion::MEGABYTE;
    } else if (unit == "GB") {
      multiplier = UnitConversion::GIGABYTE;
    }

    const uint64_t max_size =
        static_cast<uint64_t>(std::numeric_limits<size_t>::max());
    if (value > max_size / multiplier) {
      error_message = "Size value too large (overflow): " + str;
      return {false, 0};
    }

    return {true, static_cast<size_t>(value * multiplier)};
  } catch (const std::exception& e) {
    error_message = "Failed to parse size value: " + std::string(e.what());
    return {false, 0};
  }
}

}  // namespace config
}  // namespace canal
