#pragma once

#include <string>

#include <nlohmann/json.hpp>

namespace canal {
namespace config {

enum class ConfigFormat { Json, Yaml };

// .yaml and .yml are YAML, everything else is JSON
ConfigFormat detectConfigFormat(const std::string& path);

/**
 * Expand ${VAR} and ${VAR:-default} references.
 * @throws std::runtime_error for an unset variable without default
 */
std::string substituteEnvironmentVariables(const std::string& content);

/**
 * Parse configuration text into a JSON document. YAML documents are
 * converted so that both formats share one reader.
 * @throws std::runtime_error with the parser position on syntax errors
 */
nlohmann::json parseConfigContent(const std::string& content,
                                  ConfigFormat format);

/**
 * Read, expand and parse a configuration file.
 * @throws std::runtime_error if the file cannot be read or parsed
 */
nlohmann::json loadConfigFile(const std::string& path);

}  // namespace config
}  // namespace canal
