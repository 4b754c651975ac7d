#define CANAL_LOG_COMPONENT "config.file"

#include "canal/config/file_config_source.h"

#include <cstdlib>
#include <fstream>
#include <regex>
#include <sstream>
#include <stdexcept>

#include <yaml-cpp/yaml.h>

#include "canal/logging/log_macros.h"

namespace canal {
namespace config {

namespace {

constexpr size_t MAX_FILE_SIZE_BYTES = 20 * 1024 * 1024;  // 20 MB

nlohmann::json yamlToJson(const YAML::Node& node) {
  switch (node.Type()) {
    case YAML::NodeType::Null:
      return nullptr;
    case YAML::NodeType::Scalar: {
      const std::string& scalar = node.Scalar();
      // Quoted scalars stay strings
      if (node.Tag() == "!") {
        return scalar;
      }
      if (scalar == "true" || scalar == "false") {
        return scalar == "true";
      }
      int64_t integer = 0;
      if (YAML::convert<int64_t>::decode(node, integer)) {
        return integer;
      }
      double number = 0;
      if (scalar.find('.') != std::string::npos &&
          YAML::convert<double>::decode(node, number)) {
        return number;
      }
      return scalar;
    }
    case YAML::NodeType::Sequence: {
      auto result = nlohmann::json::array();
      for (const auto& item : node) {
        result.push_back(yamlToJson(item));
      }
      return result;
    }
    case YAML::NodeType::Map: {
      auto result = nlohmann::json::object();
      for (const auto& pair : node) {
        result[pair.first.as<std::string>()] = yamlToJson(pair.second);
      }
      return result;
    }
    default:
      break;
  }

  return nullptr;
}

}  // namespace

ConfigFormat detectConfigFormat(const std::string& path) {
  auto dot = path.rfind('.');
  if (dot != std::string::npos) {
    std::string ext = path.substr(dot);
    if (ext == ".yaml" || ext == ".yml") {
      return ConfigFormat::Yaml;
    }
  }
  return ConfigFormat::Json;
}

std::string substituteEnvironmentVariables(const std::string& content) {
  static const std::regex env_regex(
      R"(\$\{([A-Za-z_][A-Za-z0-9_]*)(:-([^}]*))?\})");

  std::string result;
  size_t vars_expanded = 0;
  auto search_start = content.cbegin();
  std::smatch match;

  while (std::regex_search(search_start, content.cend(), match, env_regex)) {
    std::string var_name = match[1].str();
    bool has_default = match[2].matched;

    const char* env_value = std::getenv(var_name.c_str());
    if (!env_value && !has_default) {
      CANAL_LOG(Error, "Undefined environment variable without default: {}",
                var_name);
      throw std::runtime_error("Undefined environment variable: " + var_name);
    }

    result.append(search_start, match[0].first);
    result.append(env_value ? std::string(env_value) : match[3].str());
    ++vars_expanded;

    search_start = match[0].second;
  }
  result.append(search_start, content.cend());

  if (vars_expanded > 0) {
    CANAL_LOG(Debug, "Expanded {} environment variables", vars_expanded);
  }
  return result;
}

nlohmann::json parseConfigContent(const std::string& content,
                                  ConfigFormat format) {
  if (format == ConfigFormat::Yaml) {
    try {
      return yamlToJson(YAML::Load(content));
    } catch (const YAML::ParserException& e) {
      std::ostringstream error;
      error << "YAML parse error at line " << e.mark.line + 1 << ", column "
            << e.mark.column + 1;
      throw std::runtime_error(error.str());
    }
  }

  try {
    return nlohmann::json::parse(content);
  } catch (const nlohmann::json::parse_error& e) {
    throw std::runtime_error(std::string("JSON parse error: ") + e.what());
  }
}

nlohmann::json loadConfigFile(const std::string& path) {
  std::ifstream file(path, std::ios::binary);
  if (!file) {
    throw std::runtime_error("Cannot open configuration file: " + path);
  }

  std::ostringstream buffer;
  buffer << file.rdbuf();
  std::string content = buffer.str();
  if (content.size() > MAX_FILE_SIZE_BYTES) {
    throw std::runtime_error("Configuration file too large: " + path);
  }

  CANAL_LOG(Debug, "Loading configuration from {} ({} bytes)", path,
            content.size());
  return parseConfigContent(substituteEnvironmentVariables(content),
                            detectConfigFormat(path));
}

}  // namespace config
}  // namespace canal
