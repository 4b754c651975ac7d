#define CANAL_LOG_COMPONENT "config.client"

#include "canal/client/client_config.h"

#include <cstdlib>

#include "canal/config/file_config_source.h"
#include "canal/config/types.h"
#include "canal/config/units.h"
#include "canal/logging/log_macros.h"

namespace canal {
namespace client {

namespace {

using config::ConfigValidationError;

std::chrono::milliseconds readDuration(const nlohmann::json& json,
                                       const std::string& field,
                                       std::chrono::milliseconds fallback) {
  auto it = json.find(field);
  if (it == json.end()) {
    return fallback;
  }
  auto parsed = config::Duration::parse(*it);
  if (!parsed.first) {
    throw ConfigValidationError(field,
                                "expected a duration such as 500ms or 5s");
  }
  return parsed.second;
}

size_t readSize(const nlohmann::json& json,
                const std::string& field,
                const std::string& path,
                size_t fallback) {
  auto it = json.find(field);
  if (it == json.end()) {
    return fallback;
  }
  auto parsed = config::Size::parse(*it);
  if (!parsed.first) {
    throw ConfigValidationError(path, "expected a size such as 8KB or 1MB");
  }
  return parsed.second;
}

size_t readCount(const nlohmann::json& json,
                 const std::string& field,
                 const std::string& path,
                 size_t fallback) {
  auto it = json.find(field);
  if (it == json.end()) {
    return fallback;
  }
  if (it->is_number_unsigned()) {
    return it->get<size_t>();
  }
  if (it->is_number_integer() && it->get<int64_t>() >= 0) {
    return static_cast<size_t>(it->get<int64_t>());
  }
  throw ConfigValidationError(path, "expected a non-negative integer");
}

std::string readString(const nlohmann::json& json,
                       const std::string& field,
                       const std::string& fallback) {
  auto it = json.find(field);
  if (it == json.end()) {
    return fallback;
  }
  if (!it->is_string()) {
    throw ConfigValidationError(field, "expected a string");
  }
  return it->get<std::string>();
}

}  // namespace

ClientConfig ClientConfig::fromJson(const nlohmann::json& json) {
  ClientConfig config;
  if (json.is_null()) {
    return config;
  }
  if (!json.is_object()) {
    throw ConfigValidationError("<root>", "expected an object");
  }

  static const char* const known_keys[] = {
      "client_id",    "user_agent_header", "request_timeout",
      "timeout_cycle", "idle_timeout",     "reaping_cycle",
      "read_buffer_size", "parser"};
  for (auto it = json.begin(); it != json.end(); ++it) {
    bool known = false;
    for (const char* key : known_keys) {
      known = known || it.key() == key;
    }
    if (!known) {
      CANAL_LOG(Warning, "Ignoring unknown configuration key '{}'", it.key());
    }
  }

  config.client_id = readString(json, "client_id", config.client_id);
  config.user_agent_header =
      readString(json, "user_agent_header", config.user_agent_header);
  config.request_timeout =
      readDuration(json, "request_timeout", config.request_timeout);
  config.timeout_cycle =
      readDuration(json, "timeout_cycle", config.timeout_cycle);
  config.idle_timeout = readDuration(json, "idle_timeout", config.idle_timeout);
  config.reaping_cycle =
      readDuration(json, "reaping_cycle", config.reaping_cycle);
  config.read_buffer_size = readSize(json, "read_buffer_size",
                                     "read_buffer_size",
                                     config.read_buffer_size);

  auto parser = json.find("parser");
  if (parser != json.end()) {
    if (!parser->is_object()) {
      throw ConfigValidationError("parser", "expected an object");
    }
    http::ParserLimits& limits = config.parser_limits;
    limits.max_header_count =
        readCount(*parser, "max_header_count", "parser.max_header_count",
                  limits.max_header_count);
    limits.max_header_name_length = readCount(
        *parser, "max_header_name_length", "parser.max_header_name_length",
        limits.max_header_name_length);
    limits.max_header_value_length = readCount(
        *parser, "max_header_value_length", "parser.max_header_value_length",
        limits.max_header_value_length);
    limits.max_content_length =
        readSize(*parser, "max_content_length", "parser.max_content_length",
                 limits.max_content_length);
    limits.max_chunk_size = readSize(*parser, "max_chunk_size",
                                     "parser.max_chunk_size",
                                     limits.max_chunk_size);
  }

  config.validate();
  return config;
}

nlohmann::json ClientConfig::toJson() const {
  using config::Duration;
  using config::Size;

  nlohmann::json json;
  json["client_id"] = client_id;
  json["user_agent_header"] = user_agent_header;
  json["request_timeout"] = Duration::toString(request_timeout);
  json["timeout_cycle"] = Duration::toString(timeout_cycle);
  json["idle_timeout"] = Duration::toString(idle_timeout);
  json["reaping_cycle"] = Duration::toString(reaping_cycle);
  json["read_buffer_size"] = Size::toString(read_buffer_size);
  json["parser"] = {
      {"max_header_count", parser_limits.max_header_count},
      {"max_header_name_length", parser_limits.max_header_name_length},
      {"max_header_value_length", parser_limits.max_header_value_length},
      {"max_content_length", Size::toString(parser_limits.max_content_length)},
      {"max_chunk_size", Size::toString(parser_limits.max_chunk_size)}};
  return json;
}

void ClientConfig::validate() const {
  if (user_agent_header.find_first_of("\r\n") != std::string::npos) {
    throw ConfigValidationError("user_agent_header",
                                "must not contain line breaks");
  }
  if (request_timeout.count() > 0 && timeout_cycle.count() <= 0) {
    throw ConfigValidationError(
        "timeout_cycle", "must be positive while request_timeout is enabled");
  }
  if (idle_timeout.count() > 0 && reaping_cycle.count() <= 0) {
    throw ConfigValidationError(
        "reaping_cycle", "must be positive while idle_timeout is enabled");
  }
  if (read_buffer_size == 0) {
    throw ConfigValidationError("read_buffer_size", "must be positive");
  }
  if (parser_limits.max_header_count == 0) {
    throw ConfigValidationError("parser.max_header_count", "must be positive");
  }
  if (parser_limits.max_header_name_length == 0) {
    throw ConfigValidationError("parser.max_header_name_length",
                                "must be positive");
  }
  if (parser_limits.max_header_value_length == 0) {
    throw ConfigValidationError("parser.max_header_value_length",
                                "must be positive");
  }
  if (parser_limits.max_chunk_size == 0) {
    throw ConfigValidationError("parser.max_chunk_size", "must be positive");
  }
}

ClientConfig loadClientConfig(const std::string& path) {
  std::string source = path;
  if (source.empty()) {
    const char* env_path = std::getenv("CANAL_CONFIG");
    if (env_path && *env_path) {
      source = env_path;
    }
  }

  if (source.empty()) {
    CANAL_LOG(Debug, "No configuration file given, using defaults");
    return ClientConfig();
  }

  CANAL_LOG(Info, "Loading client configuration from {}", source);
  return ClientConfig::fromJson(config::loadConfigFile(source));
}

}  // namespace client
}  // namespace canal
