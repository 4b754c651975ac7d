#ifndef CANAL_CLIENT_CLIENT_CONFIG_H
#define CANAL_CLIENT_CLIENT_CONFIG_H

#include <chrono>
#include <string>

#include <nlohmann/json.hpp>

#include "canal/http/response_parser.h"

namespace canal {
namespace client {

/**
 * Settings of an HttpClient.
 *
 * A request_timeout or idle_timeout of zero disables the corresponding
 * sweep.
 */
struct ClientConfig {
  std::string client_id{"canal-client"};
  std::string user_agent_header{"canal/1.0"};

  std::chrono::milliseconds request_timeout{5000};
  std::chrono::milliseconds timeout_cycle{200};
  std::chrono::milliseconds idle_timeout{10000};
  std::chrono::milliseconds reaping_cycle{500};

  size_t read_buffer_size{8 * 1024};
  http::ParserLimits parser_limits;

  /**
   * Overlay the keys present in a JSON document on the defaults.
   * @throws config::ConfigValidationError for unusable values
   */
  static ClientConfig fromJson(const nlohmann::json& json);

  nlohmann::json toJson() const;

  // @throws config::ConfigValidationError
  void validate() const;
};

/**
 * Load the configuration from path, or from the file named by CANAL_CONFIG
 * when path is empty. Without either the defaults are returned.
 */
ClientConfig loadClientConfig(const std::string& path = std::string());

}  // namespace client
}  // namespace canal

#endif  // CANAL_CLIENT_CLIENT_CONFIG_H
