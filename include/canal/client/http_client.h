#ifndef CANAL_CLIENT_HTTP_CLIENT_H
#define CANAL_CLIENT_HTTP_CLIENT_H

#include <atomic>
#include <cstdint>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

#include "canal/client/client_config.h"
#include "canal/client/client_connection.h"
#include "canal/client/delivery_executor.h"
#include "canal/client/http_connection.h"
#include "canal/client/open_request_registry.h"
#include "canal/event/worker.h"
#include "canal/http/request_renderer.h"
#include "canal/network/socket_interface.h"

namespace canal {
namespace client {

// Client statistics
struct ClientStats {
  std::atomic<uint64_t> requests_dispatched{0};
  std::atomic<uint64_t> open_requests{0};
  std::atomic<uint64_t> connections_opened{0};
  std::atomic<uint64_t> connections_open{0};
  std::atomic<uint64_t> connect_failures{0};
  std::atomic<uint64_t> requests_timed_out{0};
  std::atomic<uint64_t> connections_reaped{0};
  std::atomic<uint64_t> parse_errors{0};
};

using ConnectResult = variant<HttpConnectionSharedPtr, HttpClientException>;
using ConnectCallback = std::function<void(ConnectResult&& result)>;

// Control messages handled on the dispatcher thread
struct ConnectEvent {
  std::string host;
  uint16_t port;
  ConnectCallback callback;
};

struct SendEvent {
  uint64_t connection_id;
  QueuedSend send;
  // Non-empty when the request was rejected before rendering
  std::string rejection;
};

struct CloseEvent {
  uint64_t connection_id;
};

/**
 * Non-blocking pipelining HTTP/1.1 client.
 *
 * One dispatcher thread owns every connection, the pending queues and the
 * open-request registry. Callers talk to it by posting events, so all
 * public methods are thread-safe. Connect callbacks and response receivers
 * run on a separate delivery thread and may block, send, or stop the
 * client; the client must not be destroyed from them.
 */
class HttpClient : public ClientConnectionCallbacks {
 public:
  explicit HttpClient(
      ClientConfig config = ClientConfig(),
      network::SocketInterface& socket_interface = network::socketInterface());
  ~HttpClient() override;

  HttpClient(const HttpClient&) = delete;
  HttpClient& operator=(const HttpClient&) = delete;

  // Start the dispatcher thread and the timeout and reaping timers
  void start();

  /**
   * Fail all outstanding work with "HTTP client stopped", close every
   * connection and join the client threads. Called from a connect callback
   * or receiver it returns before that callback's thread is joined.
   */
  void stop();

  bool isRunning() const { return running_; }

  /**
   * Open a connection. The callback runs on the delivery thread once the
   * connect completes or fails.
   */
  void connect(const std::string& host, uint16_t port,
               ConnectCallback callback);

  std::future<HttpConnectionSharedPtr> connect(const std::string& host,
                                               uint16_t port);

  const ClientConfig& config() const { return config_; }
  const ClientStats& stats() const { return stats_; }
  const http::RequestRenderer& renderer() const { return renderer_; }
  event::Dispatcher& dispatcher() { return core_.dispatcher(); }
  DeliveryExecutor& delivery() { return delivery_; }

  // ClientConnectionCallbacks
  void onConnected(ClientConnection& connection) override;
  void onConnectFailed(ClientConnection& connection,
                       const std::string& reason) override;
  void onClosed(ClientConnection& connection,
                const std::string& reason) override;
  void onIllegalResponse(ClientConnection& connection,
                         const std::string& message) override;

 private:
  friend class HttpConnection;

  // Thread-safe entry points used by HttpConnection
  void postSend(std::unique_ptr<SendEvent> event);
  void postClose(uint64_t connection_id);

  // Post to the dispatcher; false once the client is stopped
  bool postEvent(event::PostCb callback);

  void handleConnect(ConnectEvent& event);
  void handleSend(SendEvent& event);
  void handleClose(const CloseEvent& event);
  void handleStop();

  void deliverConnectResult(ConnectCallback callback, ConnectResult result);
  void establish(ClientConnection& connection, ConnectCallback& callback);
  void failConnect(const std::string& host, uint16_t port,
                   const std::string& reason, ConnectCallback& callback);

  void onTimeoutTick();
  void onReapTick();
  void updateOpenRequests();

  // Declared first: destroyed after everything registered with it
  event::Worker core_;

  const ClientConfig config_;
  network::SocketInterface& socket_interface_;
  const http::RequestRenderer renderer_;

  std::mutex lifecycle_mutex_;
  std::atomic<bool> running_{false};

  // Outlives the connections, whose sinks refer to it
  DeliveryExecutor delivery_;

  // Dispatcher-thread state
  OpenRequestRegistry registry_;
  std::unordered_map<uint64_t, ClientConnectionPtr> connections_;
  std::unordered_map<uint64_t, ConnectCallback> pending_connects_;
  uint64_t next_connection_id_{1};
  bool stopping_{false};
  event::TimerPtr timeout_timer_;
  event::TimerPtr reaping_timer_;

  ClientStats stats_;
};

}  // namespace client
}  // namespace canal

#endif  // CANAL_CLIENT_HTTP_CLIENT_H
