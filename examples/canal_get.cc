/**
 * Pipelined GET client
 *
 * Opens one connection and sends every URI given on the command line
 * without waiting for the previous response. Responses are printed in
 * request order as they arrive; chunked responses are streamed.
 *
 * Usage: canal_get [--config file] [--host host] [--port port]
 *                  [--log-level level] [--log-file file] uri...
 */

#include <condition_variable>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "canal/client/client_config.h"
#include "canal/client/http_client.h"
#include "canal/logging/log_sink.h"
#include "canal/logging/logger_registry.h"

using namespace canal;

namespace {

class PrintingReceiver : public client::ResponseReceiver {
 public:
  explicit PrintingReceiver(size_t expected) : remaining_(expected) {}

  void onResponseEvent(client::ResponseEvent&& event,
                       const optional<client::RequestContext>& context)
      override {
    std::string uri = context ? any_cast<std::string>(*context) : "?";

    if (holds_alternative<http::HttpResponse>(event)) {
      auto& response = get<http::HttpResponse>(event);
      std::cout << uri << ": " << response.statusCode() << " "
                << response.reason << " (" << response.body.size()
                << " bytes)\n";
    } else if (holds_alternative<http::ChunkedResponseStart>(event)) {
      auto& start = get<http::ChunkedResponseStart>(event);
      std::cout << uri << ": " << start.statusCode() << " " << start.reason
                << " (chunked)\n";
    } else if (holds_alternative<http::MessageChunk>(event)) {
      std::cout << uri << ":   chunk of "
                << get<http::MessageChunk>(event).body.size() << " bytes\n";
    } else if (holds_alternative<http::ChunkedResponseEnd>(event)) {
      std::cout << uri << ":   end of chunked response\n";
    } else {
      std::cout << uri << ": failed: "
                << get<client::HttpClientException>(event).what() << "\n";
      ++failures_;
    }

    if (client::isTerminal(event)) {
      std::lock_guard<std::mutex> lock(mutex_);
      if (--remaining_ == 0) {
        done_.notify_all();
      }
    }
  }

  void wait() {
    std::unique_lock<std::mutex> lock(mutex_);
    done_.wait(lock, [this]() { return remaining_ == 0; });
  }

  int failures() const { return failures_; }

 private:
  std::mutex mutex_;
  std::condition_variable done_;
  size_t remaining_;
  int failures_{0};
};

void printUsage(const char* program) {
  std::cerr << "Usage: " << program
            << " [--config file] [--host host] [--port port]"
            << " [--log-level level] [--log-file file] uri...\n"
            << "  --config file   YAML or JSON client configuration\n"
            << "  --host host     server to connect to (default: localhost)\n"
            << "  --port port     server port (default: 80)\n"
            << "  --log-level l   debug, info, warning, error or off\n"
            << "  --log-file file append log lines to file (default: stderr)\n";
}

}  // namespace

int main(int argc, char* argv[]) {
  std::string config_path;
  std::string host = "localhost";
  int port = 80;
  std::string log_level;
  std::string log_file;
  std::vector<std::string> uris;

  for (int i = 1; i < argc; i++) {
    std::string arg = argv[i];
    if (arg == "--config" && i + 1 < argc) {
      config_path = argv[++i];
    } else if (arg == "--host" && i + 1 < argc) {
      host = argv[++i];
    } else if (arg == "--port" && i + 1 < argc) {
      port = std::atoi(argv[++i]);
    } else if (arg == "--log-level" && i + 1 < argc) {
      log_level = argv[++i];
    } else if (arg == "--log-file" && i + 1 < argc) {
      log_file = argv[++i];
    } else if (arg == "--help" || arg == "-h") {
      printUsage(argv[0]);
      return 0;
    } else {
      uris.push_back(arg);
    }
  }

  if (uris.empty() || port <= 0 || port > 65535) {
    printUsage(argv[0]);
    return 1;
  }

  auto& loggers = logging::LoggerRegistry::instance();
  if (!log_level.empty()) {
    auto level = logging::parseLogLevel(log_level);
    if (!level) {
      std::cerr << "Unknown log level: " << log_level << "\n";
      return 1;
    }
    loggers.setGlobalLevel(*level);
  }
  if (!log_file.empty()) {
    try {
      loggers.setDefaultSink(logging::SinkFactory::createFileSink(log_file));
    } catch (const std::exception& e) {
      std::cerr << e.what() << "\n";
      return 1;
    }
  }

  client::ClientConfig config;
  try {
    config = client::loadClientConfig(config_path);
  } catch (const std::exception& e) {
    std::cerr << "Configuration error: " << e.what() << "\n";
    return 1;
  }

  client::HttpClient http_client(config);
  http_client.start();

  client::HttpConnectionSharedPtr connection;
  try {
    connection =
        http_client.connect(host, static_cast<uint16_t>(port)).get();
  } catch (const client::HttpClientException& e) {
    std::cerr << e.what() << "\n";
    return 1;
  }

  auto receiver = std::make_shared<PrintingReceiver>(uris.size());
  for (const auto& uri : uris) {
    http::HttpRequest request(http::HttpMethod::GET, uri);
    connection->send(request, receiver, client::RequestContext(uri));
  }

  receiver->wait();
  connection->close();
  http_client.stop();

  return receiver->failures() == 0 ? 0 : 2;
}
