#pragma once

#include <chrono>
#include <string>
#include <utility>

#include <nlohmann/json.hpp>

namespace canal {
namespace config {

// Duration parsing and validation
// Supports formats: 10ms, 5s, 2m, 1h
class Duration {
 public:
  // Parse from string (e.g., "10ms", "5s", "2m", "1h")
  static std::pair<bool, std::chrono::milliseconds> parse(
      const std::string& str);

  // Parse from JSON (string, or number of milliseconds)
  static std::pair<bool, std::chrono::milliseconds> parse(
      const nlohmann::json& value);

  static std::string toString(std::chrono::milliseconds duration);

  static bool isValid(const std::string& str);

  // Parse with detailed error message
  static std::pair<bool, std::chrono::milliseconds> parseWithError(
      const std::string& str, std::string& error_message);
};

// Size/memory parsing and validation
// Supports formats: 1024B, 10KB, 5MB, 2GB (binary multiples)
class Size {
 public:
  static std::pair<bool, size_t> parse(const std::string& str);

  // Parse from JSON (string, or number of bytes)
  static std::pair<bool, size_t> parse(const nlohmann::json& value);

  static std::string toString(size_t bytes);

  static bool isValid(const std::string& str);

  static std::pair<bool, size_t> parseWithError(const std::string& str,
                                                std::string& error_message);
};

struct UnitConversion {
  static constexpr size_t KILOBYTE = 1024;
  static constexpr size_t MEGABYTE = KILOBYTE * 1024;
  static constexpr size_t GIGABYTE = MEGABYTE * 1024;
};

}  // namespace config
}  // namespace canal
