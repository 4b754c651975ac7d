#define CANAL_LOG_COMPONENT "client.http"

#include "canal/client/http_client.h"

#include <vector>

#include "canal/client/connection_io.h"
#include "canal/logging/log_macros.h"

namespace canal {
namespace client {

namespace {

MonotonicTime monotonicNow() { return std::chrono::steady_clock::now(); }

}  // namespace

HttpClient::HttpClient(ClientConfig config,
                       network::SocketInterface& socket_interface)
    : core_(event::createLibeventDispatcher(config.client_id)),
      config_(std::move(config)),
      socket_interface_(socket_interface),
      renderer_(config_.user_agent_header),
      delivery_(config_.client_id + ".delivery") {
  config_.validate();

  timeout_timer_ = dispatcher().createTimer([this]() { onTimeoutTick(); });
  reaping_timer_ = dispatcher().createTimer([this]() { onReapTick(); });
}

HttpClient::~HttpClient() {
  stop();
  // Closed connections still wait in the deferred delete list
  dispatcher().clearDeferredDeleteList();
}

void HttpClient::start() {
  std::lock_guard<std::mutex> lock(lifecycle_mutex_);
  if (running_) {
    return;
  }

  CANAL_LOG(Info, "Starting HTTP client '{}'", config_.client_id);
  delivery_.start();

  dispatcher().post([this]() {
    stopping_ = false;
    if (config_.request_timeout.count() > 0) {
      timeout_timer_->enableTimer(config_.timeout_cycle);
    }
    if (config_.idle_timeout.count() > 0) {
      reaping_timer_->enableTimer(config_.reaping_cycle);
    }
  });
  core_.start();
  running_ = true;
}

void HttpClient::stop() {
  {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    if (running_) {
      running_ = false;
      // Every event posted before this one is still handled
      dispatcher().post([this]() { handleStop(); });
    }
  }

  // Neither worker joins when stop() runs on its own thread; a later stop()
  // or the destructor does
  core_.stop();
  // Deliveries queued by handleStop() run before the delivery thread exits
  delivery_.stop();
}

bool HttpClient::postEvent(event::PostCb callback) {
  std::lock_guard<std::mutex> lock(lifecycle_mutex_);
  if (!running_) {
    return false;
  }
  dispatcher().post(std::move(callback));
  return true;
}

void HttpClient::deliverConnectResult(ConnectCallback callback,
                                      ConnectResult result) {
  delivery_.execute(
      [callback = std::move(callback), result = std::move(result)]() mutable {
        callback(std::move(result));
      });
}

void HttpClient::connect(const std::string& host,
                         uint16_t port,
                         ConnectCallback callback) {
  auto event = std::make_shared<ConnectEvent>();
  event->host = host;
  event->port = port;
  event->callback = std::move(callback);

  if (!postEvent([this, event]() { handleConnect(*event); })) {
    deliverConnectResult(std::move(event->callback),
                         HttpClientException(errors::kClientStopped));
  }
}

std::future<HttpConnectionSharedPtr> HttpClient::connect(
    const std::string& host, uint16_t port) {
  auto promise = std::make_shared<std::promise<HttpConnectionSharedPtr>>();
  auto future = promise->get_future();

  connect(host, port, [promise](ConnectResult&& result) {
    if (auto* connection = get_if<HttpConnectionSharedPtr>(&result)) {
      promise->set_value(*connection);
    } else {
      promise->set_exception(
          std::make_exception_ptr(get<HttpClientException>(result)));
    }
  });
  return future;
}

void HttpClient::postSend(std::unique_ptr<SendEvent> event) {
  std::shared_ptr<SendEvent> shared(std::move(event));
  if (!postEvent([this, shared]() { handleSend(*shared); })) {
    deliverSafely(*shared->send.sink,
                  HttpClientException(errors::kClientStopped));
  }
}

void HttpClient::postClose(uint64_t connection_id) {
  CloseEvent event{connection_id};
  postEvent([this, event]() { handleClose(event); });
}

void HttpClient::handleConnect(ConnectEvent& event) {
  const std::string& host = event.host;
  uint16_t port = event.port;

  if (stopping_) {
    failConnect(host, port, errors::kClientStopped, event.callback);
    return;
  }

  auto address = socket_interface_.resolve(host, port);
  if (!address.ok()) {
    failConnect(host, port, address.error_message(), event.callback);
    return;
  }

  auto socket = socket_interface_.socket(**address);
  if (!socket.ok()) {
    failConnect(host, port, socket.error_message(), event.callback);
    return;
  }
  network::IoHandlePtr io_handle = std::move(*socket);

  auto connected = io_handle->connect(*address);
  bool in_progress = false;
  if (!connected.ok()) {
    if (!connected.inProgress()) {
      failConnect(host, port, connected.error_message(), event.callback);
      return;
    }
    in_progress = true;
  }

  uint64_t id = next_connection_id_++;
  auto connection = std::make_unique<ClientConnection>(
      id, host, port,
      std::make_unique<SocketConnectionIo>(dispatcher(), std::move(io_handle)),
      *this, registry_, config_.parser_limits, config_.read_buffer_size,
      &monotonicNow);
  ClientConnection& ref = *connection;
  connections_.emplace(id, std::move(connection));

  ref.initialize(in_progress);
  if (in_progress) {
    CANAL_LOG(Debug, "Connecting to {}:{} ({})", host, port,
              (*address)->asString());
    pending_connects_.emplace(id, std::move(event.callback));
    return;
  }

  establish(ref, event.callback);
}

void HttpClient::establish(ClientConnection& connection,
                           ConnectCallback& callback) {
  ++stats_.connections_opened;
  ++stats_.connections_open;
  CANAL_CONN_LOG(Debug, connection.id(), "Connected to {}:{}",
                 connection.host(), connection.port());

  auto handle = std::make_shared<HttpConnection>(
      *this, connection.id(), connection.host(), connection.port());
  deliverConnectResult(std::move(callback), std::move(handle));
}

void HttpClient::failConnect(const std::string& host,
                             uint16_t port,
                             const std::string& reason,
                             ConnectCallback& callback) {
  ++stats_.connect_failures;
  std::string message = "Could not connect to " + host + ":" +
                        std::to_string(port) + ": " + reason;
  CANAL_LOG(Warning, "{}", message);
  deliverConnectResult(std::move(callback), HttpClientException(message));
}

void HttpClient::handleSend(SendEvent& event) {
  if (!event.rejection.empty()) {
    deliverSafely(*event.send.sink, HttpClientException(event.rejection));
    return;
  }

  auto it = connections_.find(event.connection_id);
  if (it == connections_.end() || it->second->closed()) {
    deliverSafely(*event.send.sink,
                  HttpClientException(errors::kClosedConnection));
    return;
  }

  ++stats_.requests_dispatched;
  it->second->acceptSend(std::move(event.send));
  updateOpenRequests();
}

void HttpClient::handleClose(const CloseEvent& event) {
  auto it = connections_.find(event.connection_id);
  if (it == connections_.end()) {
    return;
  }
  CANAL_CONN_LOG(Debug, event.connection_id, "Closing on request");
  it->second->closeWithError(errors::kConnectionClosed);
}

void HttpClient::handleStop() {
  stopping_ = true;
  timeout_timer_->disableTimer();
  reaping_timer_->disableTimer();

  std::vector<ClientConnection*> connections;
  connections.reserve(connections_.size());
  for (auto& entry : connections_) {
    connections.push_back(entry.second.get());
  }
  for (ClientConnection* connection : connections) {
    connection->closeWithError(errors::kClientStopped);
  }
  CANAL_LOG(Info, "Stopped HTTP client '{}'", config_.client_id);
}

void HttpClient::onConnected(ClientConnection& connection) {
  auto it = pending_connects_.find(connection.id());
  if (it == pending_connects_.end()) {
    return;
  }
  ConnectCallback callback = std::move(it->second);
  pending_connects_.erase(it);
  establish(connection, callback);
}

void HttpClient::onConnectFailed(ClientConnection& connection,
                                 const std::string& reason) {
  auto it = pending_connects_.find(connection.id());
  if (it == pending_connects_.end()) {
    return;
  }
  ConnectCallback callback = std::move(it->second);
  pending_connects_.erase(it);
  failConnect(connection.host(), connection.port(), reason, callback);
}

void HttpClient::onClosed(ClientConnection& connection,
                          const std::string& reason) {
  auto pending = pending_connects_.find(connection.id());
  if (pending != pending_connects_.end()) {
    // Closed before the connect completed
    ConnectCallback callback = std::move(pending->second);
    pending_connects_.erase(pending);
    failConnect(connection.host(), connection.port(), reason, callback);
  } else if (connection.established()) {
    --stats_.connections_open;
  }

  auto it = connections_.find(connection.id());
  if (it != connections_.end()) {
    event::DeferredDeletablePtr doomed = std::move(it->second);
    connections_.erase(it);
    dispatcher().deferredDelete(std::move(doomed));
  }
  updateOpenRequests();
}

void HttpClient::onIllegalResponse(ClientConnection& connection,
                                   const std::string& message) {
  ++stats_.parse_errors;
  CANAL_CONN_LOG(Warning, connection.id(),
                 "Received illegal response from {}:{}: {}", connection.host(),
                 connection.port(), message);
}

void HttpClient::onTimeoutTick() {
  registry_.forAllTimedOut(
      config_.request_timeout, monotonicNow(),
      [this](const OpenRequestRecord& record) {
        ClientConnection* connection = record.connection;
        CANAL_CONN_LOG(Warning, connection->id(),
                       "Request to '{}' timed out, closing the connection",
                       record.request->uri);
        stats_.requests_timed_out += connection->pendingCount();
        connection->closeWithError(errors::kRequestTimedOut);
      });
  updateOpenRequests();

  if (!stopping_) {
    timeout_timer_->enableTimer(config_.timeout_cycle);
  }
}

void HttpClient::onReapTick() {
  MonotonicTime now = monotonicNow();

  std::vector<ClientConnection*> idle;
  for (auto& entry : connections_) {
    if (now - entry.second->lastActivity() > config_.idle_timeout) {
      idle.push_back(entry.second.get());
    }
  }

  for (ClientConnection* connection : idle) {
    CANAL_CONN_LOG(Info, connection->id(), "Reaping idle connection to {}:{}",
                   connection->host(), connection->port());
    ++stats_.connections_reaped;
    connection->closeWithError(errors::kIdleTimeout);
  }

  if (!stopping_) {
    reaping_timer_->enableTimer(config_.reaping_cycle);
  }
}

void HttpClient::updateOpenRequests() {
  stats_.open_requests = registry_.size();
}

}  // namespace client
}  // namespace canal
