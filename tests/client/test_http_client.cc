#include <chrono>
#include <functional>
#include <future>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include <fcntl.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "canal/client/http_client.h"
#include "canal/network/io_socket_handle_impl.h"
#include "../mocks/client_mocks.h"

namespace canal {
namespace client {
namespace {

using ::testing::HasSubstr;
using test::errorMessage;
using test::RecordingReceiver;

/**
 * Socket handle over one end of a socket pair. connect() pretends the
 * peer accepted the connection, immediately or after EINPROGRESS.
 */
class PairedSocketHandle : public network::IoSocketHandleImpl {
 public:
  PairedSocketHandle(network::os_fd_t fd, bool connect_in_progress)
      : IoSocketHandleImpl(fd), connect_in_progress_(connect_in_progress) {}

  IoVoidResult connect(
      const network::Address::InstanceConstSharedPtr&) override {
    if (connect_in_progress_) {
      return IoVoidResult::error(EINPROGRESS, "Operation now in progress");
    }
    return IoVoidResult::success();
  }

 private:
  const bool connect_in_progress_;
};

/**
 * Hands out socket pairs; the test plays the server on the peer ends.
 */
class SocketPairInterface : public network::SocketInterface {
 public:
  ~SocketPairInterface() override {
    for (int fd : server_fds_) {
      ::close(fd);
    }
  }

  IoResult<network::IoHandlePtr> socket(
      const network::Address::Instance&) override {
    int fds[2];
    if (::socketpair(AF_UNIX, SOCK_STREAM | SOCK_NONBLOCK | SOCK_CLOEXEC, 0,
                     fds) != 0) {
      return IoResult<network::IoHandlePtr>::from_errno(errno);
    }
    {
      std::lock_guard<std::mutex> lock(mutex_);
      server_fds_.push_back(fds[1]);
    }
    return IoResult<network::IoHandlePtr>::success(
        std::make_unique<PairedSocketHandle>(fds[0], connect_in_progress));
  }

  network::IoHandlePtr ioHandleForFd(network::os_fd_t fd) override {
    return std::make_unique<network::IoSocketHandleImpl>(fd);
  }

  IoResult<network::Address::InstanceConstSharedPtr> resolve(
      const std::string& host, uint16_t port) override {
    if (host == "unreachable.test") {
      return IoResult<network::Address::InstanceConstSharedPtr>::error(
          EHOSTUNREACH, "No route to host");
    }
    return IoResult<network::Address::InstanceConstSharedPtr>::success(
        network::Address::parseInternetAddress("127.0.0.1", port));
  }

  int serverFd(size_t index) {
    std::lock_guard<std::mutex> lock(mutex_);
    return index < server_fds_.size() ? server_fds_[index] : -1;
  }

  bool connect_in_progress{false};

 private:
  std::mutex mutex_;
  std::vector<int> server_fds_;
};

class HttpClientTest : public ::testing::Test {
 protected:
  void TearDown() override {
    if (client_) {
      client_->stop();
    }
  }

  void startClient(ClientConfig config = ClientConfig()) {
    client_ = std::make_unique<HttpClient>(std::move(config), sockets_);
    client_->start();
  }

  HttpConnectionSharedPtr connect(uint16_t port = 8080) {
    auto future = client_->connect("example.test", port);
    EXPECT_EQ(std::future_status::ready,
              future.wait_for(std::chrono::seconds(5)));
    return future.get();
  }

  bool waitFor(std::function<bool()> condition,
               std::chrono::milliseconds timeout = std::chrono::seconds(5)) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
      if (condition()) {
        return true;
      }
      std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return condition();
  }

  // Read from the server end until count request heads have arrived
  std::string readRequests(int fd, size_t count) {
    std::string data;
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (countHeads(data) < count &&
           std::chrono::steady_clock::now() < deadline) {
      pollfd pfd{fd, POLLIN, 0};
      if (::poll(&pfd, 1, 50) <= 0) {
        continue;
      }
      char buffer[4096];
      ssize_t n = ::read(fd, buffer, sizeof(buffer));
      if (n <= 0) {
        break;
      }
      data.append(buffer, static_cast<size_t>(n));
    }
    return data;
  }

  static size_t countHeads(const std::string& data) {
    size_t count = 0;
    for (size_t pos = data.find("\r\n\r\n"); pos != std::string::npos;
         pos = data.find("\r\n\r\n", pos + 4)) {
      ++count;
    }
    return count;
  }

  void writeAll(int fd, const std::string& data) {
    size_t offset = 0;
    while (offset < data.size()) {
      ssize_t n = ::write(fd, data.data() + offset, data.size() - offset);
      if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
        pollfd pfd{fd, POLLOUT, 0};
        ::poll(&pfd, 1, 50);
        continue;
      }
      ASSERT_GT(n, 0);
      offset += static_cast<size_t>(n);
    }
  }

  static std::string okResponse(const std::string& body) {
    return "HTTP/1.1 200 OK\r\nContent-Length: " +
           std::to_string(body.size()) + "\r\n\r\n" + body;
  }

  template <typename T>
  static std::string failureOf(std::future<T>& future) {
    if (future.wait_for(std::chrono::seconds(5)) !=
        std::future_status::ready) {
      return "<not ready>";
    }
    try {
      future.get();
    } catch (const HttpClientException& e) {
      return e.what();
    }
    return "<no error>";
  }

  SocketPairInterface sockets_;
  std::unique_ptr<HttpClient> client_;
};

TEST_F(HttpClientTest, SendsRequestAndReceivesResponse) {
  startClient();
  auto connection = connect();
  EXPECT_EQ("example.test", connection->host());
  EXPECT_EQ(8080, connection->port());
  EXPECT_EQ(1u, client_->stats().connections_open.load());

  http::HttpRequest request(http::HttpMethod::GET, "/hello");
  auto future = connection->send(request);

  int server = sockets_.serverFd(0);
  std::string received = readRequests(server, 1);
  EXPECT_EQ(0u, received.find("GET /hello HTTP/1.1\r\n"));
  EXPECT_THAT(received, HasSubstr("Host: example.test:8080\r\n"));
  EXPECT_THAT(received, HasSubstr("User-Agent: canal/1.0\r\n"));

  writeAll(server, okResponse("world"));
  ASSERT_EQ(std::future_status::ready,
            future.wait_for(std::chrono::seconds(5)));
  http::HttpResponse response = future.get();
  EXPECT_EQ(200, response.statusCode());
  EXPECT_EQ("world", response.body);
  EXPECT_EQ(1u, client_->stats().requests_dispatched.load());
}

TEST_F(HttpClientTest, CompletesInProgressConnect) {
  sockets_.connect_in_progress = true;
  startClient();

  auto connection = connect();
  ASSERT_NE(nullptr, connection);
  EXPECT_TRUE(waitFor(
      [this]() { return client_->stats().connections_open.load() == 1; }));
}

TEST_F(HttpClientTest, MatchesPipelinedResponsesArrivingInOneBurst) {
  startClient();
  auto connection = connect();

  std::vector<std::future<http::HttpResponse>> futures;
  for (int i = 0; i < 3; ++i) {
    futures.push_back(connection->send(
        http::HttpRequest(http::HttpMethod::GET, "/r" + std::to_string(i))));
  }

  int server = sockets_.serverFd(0);
  std::string received = readRequests(server, 3);
  EXPECT_LT(received.find("GET /r0 "), received.find("GET /r1 "));
  EXPECT_LT(received.find("GET /r1 "), received.find("GET /r2 "));

  writeAll(server, okResponse("zero") + okResponse("one") + okResponse("two"));

  EXPECT_EQ("zero", futures[0].get().body);
  EXPECT_EQ("one", futures[1].get().body);
  EXPECT_EQ("two", futures[2].get().body);
  EXPECT_TRUE(
      waitFor([this]() { return client_->stats().open_requests == 0; }));
}

TEST_F(HttpClientTest, TimedOutRequestClosesConnection) {
  ClientConfig config;
  config.request_timeout = std::chrono::milliseconds(100);
  config.timeout_cycle = std::chrono::milliseconds(20);
  startClient(config);
  auto connection = connect();

  auto first = connection->send(http::HttpRequest(http::HttpMethod::GET, "/1"));
  auto second =
      connection->send(http::HttpRequest(http::HttpMethod::GET, "/2"));

  EXPECT_EQ(errors::kRequestTimedOut, failureOf(first));
  EXPECT_EQ(errors::kRequestTimedOut, failureOf(second));
  EXPECT_EQ(2u, client_->stats().requests_timed_out.load());

  // The handle now refers to a closed connection
  auto late = connection->send(http::HttpRequest(http::HttpMethod::GET, "/3"));
  EXPECT_EQ(errors::kClosedConnection, failureOf(late));
}

TEST_F(HttpClientTest, ReapsIdleConnectionFailingPendingInOrder) {
  ClientConfig config;
  config.request_timeout = std::chrono::milliseconds(0);
  config.idle_timeout = std::chrono::milliseconds(100);
  config.reaping_cycle = std::chrono::milliseconds(20);
  startClient(config);
  auto connection = connect();

  auto receiver = std::make_shared<RecordingReceiver>();
  for (int i = 0; i < 3; ++i) {
    connection->send(http::HttpRequest(http::HttpMethod::GET, "/idle"),
                     receiver, RequestContext(i));
  }

  ASSERT_TRUE(waitFor([&]() { return receiver->size() == 3; }));
  auto entries = receiver->entries();
  for (int i = 0; i < 3; ++i) {
    EXPECT_EQ(errors::kIdleTimeout, errorMessage(entries[i].event));
    ASSERT_TRUE(entries[i].context.has_value());
    EXPECT_EQ(i, any_cast<int>(*entries[i].context));
  }
  EXPECT_EQ(1u, client_->stats().connections_reaped.load());
  EXPECT_TRUE(waitFor(
      [this]() { return client_->stats().connections_open.load() == 0; }));
}

TEST_F(HttpClientTest, ServerCloseFailsPendingRequests) {
  startClient();
  auto connection = connect();

  auto future = connection->send(http::HttpRequest(http::HttpMethod::GET, "/"));
  int server = sockets_.serverFd(0);
  readRequests(server, 1);
  ::shutdown(server, SHUT_RDWR);

  EXPECT_EQ(errors::kServerClosed, failureOf(future));
}

TEST_F(HttpClientTest, DeliversChunkedResponseToReceiver) {
  startClient();
  auto connection = connect();

  auto receiver = std::make_shared<RecordingReceiver>();
  connection->send(http::HttpRequest(http::HttpMethod::GET, "/chunks"),
                   receiver);

  int server = sockets_.serverFd(0);
  readRequests(server, 1);
  writeAll(server,
           "HTTP/1.1 200 OK\r\nTransfer-Encoding: chunked\r\n\r\n"
           "4\r\ndata\r\n0\r\n\r\n");

  ASSERT_TRUE(waitFor([&]() { return receiver->size() == 3; }));
  auto entries = receiver->entries();
  EXPECT_TRUE(
      holds_alternative<http::ChunkedResponseStart>(entries[0].event));
  EXPECT_EQ("data", get<http::MessageChunk>(entries[1].event).body);
  EXPECT_TRUE(holds_alternative<http::ChunkedResponseEnd>(entries[2].event));
  EXPECT_FALSE(entries[2].context.has_value());
}

TEST_F(HttpClientTest, FutureSendRejectsChunkedResponse) {
  startClient();
  auto connection = connect();

  auto future =
      connection->send(http::HttpRequest(http::HttpMethod::GET, "/chunks"));
  int server = sockets_.serverFd(0);
  readRequests(server, 1);
  writeAll(server,
           "HTTP/1.1 200 OK\r\nTransfer-Encoding: chunked\r\n\r\n"
           "4\r\ndata\r\n0\r\n\r\n");

  EXPECT_EQ(errors::kChunkedNotSupported, failureOf(future));
}

TEST_F(HttpClientTest, RejectsInvalidRequestWithoutTouchingConnection) {
  startClient();
  auto connection = connect();

  auto invalid = connection->send(http::HttpRequest(http::HttpMethod::GET, ""));
  EXPECT_EQ("Invalid request: request URI must not be empty",
            failureOf(invalid));

  // The connection is still usable
  auto valid = connection->send(http::HttpRequest(http::HttpMethod::GET, "/"));
  int server = sockets_.serverFd(0);
  readRequests(server, 1);
  writeAll(server, okResponse("fine"));
  EXPECT_EQ("fine", valid.get().body);
}

TEST_F(HttpClientTest, ReportsConnectFailure) {
  startClient();

  auto future = client_->connect("unreachable.test", 80);
  EXPECT_EQ("Could not connect to unreachable.test:80: No route to host",
            failureOf(future));
  EXPECT_EQ(1u, client_->stats().connect_failures.load());
}

TEST_F(HttpClientTest, CloseFailsPendingRequests) {
  startClient();
  auto connection = connect();

  auto pending =
      connection->send(http::HttpRequest(http::HttpMethod::GET, "/slow"));
  readRequests(sockets_.serverFd(0), 1);
  connection->close();

  EXPECT_EQ(errors::kConnectionClosed, failureOf(pending));
  auto late = connection->send(http::HttpRequest(http::HttpMethod::GET, "/"));
  EXPECT_EQ(errors::kClosedConnection, failureOf(late));
}

TEST_F(HttpClientTest, StopFailsOutstandingWork) {
  startClient();
  auto connection = connect();

  auto pending =
      connection->send(http::HttpRequest(http::HttpMethod::GET, "/never"));
  readRequests(sockets_.serverFd(0), 1);

  client_->stop();
  EXPECT_FALSE(client_->isRunning());
  EXPECT_EQ(errors::kClientStopped, failureOf(pending));

  auto after = connection->send(http::HttpRequest(http::HttpMethod::GET, "/"));
  EXPECT_EQ(errors::kClientStopped, failureOf(after));

  auto connect_after = client_->connect("example.test", 80);
  EXPECT_EQ(errors::kClientStopped, failureOf(connect_after));
}

TEST_F(HttpClientTest, StopFromConnectCallbackIsSafe) {
  startClient();

  std::promise<bool> called;
  client_->connect("unreachable.test", 80, [&](ConnectResult&& result) {
    client_->stop();
    called.set_value(holds_alternative<HttpClientException>(result));
  });

  auto future = called.get_future();
  ASSERT_EQ(std::future_status::ready,
            future.wait_for(std::chrono::seconds(5)));
  EXPECT_TRUE(future.get());
  EXPECT_FALSE(client_->isRunning());

  // Joins the delivery thread the callback ran on
  client_.reset();
}

TEST_F(HttpClientTest, StopFromReceiverFailsTheRest) {
  startClient();
  auto connection = connect();

  class StoppingReceiver : public ResponseReceiver {
   public:
    explicit StoppingReceiver(HttpClient& client) : client_(client) {}
    void onResponseEvent(ResponseEvent&& event,
                         const optional<RequestContext>&) override {
      if (holds_alternative<http::HttpResponse>(event)) {
        client_.stop();
      }
    }
    HttpClient& client_;
  };

  connection->send(http::HttpRequest(http::HttpMethod::GET, "/first"),
                   std::make_shared<StoppingReceiver>(*client_));
  auto second =
      connection->send(http::HttpRequest(http::HttpMethod::GET, "/second"));

  int server = sockets_.serverFd(0);
  readRequests(server, 2);
  writeAll(server, okResponse("one"));

  EXPECT_EQ(errors::kClientStopped, failureOf(second));
  EXPECT_FALSE(client_->isRunning());
  client_.reset();
}

TEST_F(HttpClientTest, ReceiverMayWaitForAnotherResponse) {
  startClient();
  auto connection = connect();

  // Sends a second request from inside the first delivery and blocks on it
  class ChainingReceiver : public ResponseReceiver {
   public:
    explicit ChainingReceiver(HttpConnectionSharedPtr connection)
        : connection_(std::move(connection)) {}
    void onResponseEvent(ResponseEvent&& event,
                         const optional<RequestContext>&) override {
      auto* first = get_if<http::HttpResponse>(&event);
      if (first == nullptr) {
        result.set_value("<error>");
        return;
      }
      auto next = connection_->send(
          http::HttpRequest(http::HttpMethod::GET, "/" + first->body));
      try {
        result.set_value(next.get().body);
      } catch (const HttpClientException& e) {
        result.set_value(e.what());
      }
    }
    HttpConnectionSharedPtr connection_;
    std::promise<std::string> result;
  };

  auto receiver = std::make_shared<ChainingReceiver>(connection);
  auto chained = receiver->result.get_future();
  connection->send(http::HttpRequest(http::HttpMethod::GET, "/start"),
                   receiver);

  int server = sockets_.serverFd(0);
  readRequests(server, 1);
  writeAll(server, okResponse("next"));

  std::string second = readRequests(server, 1);
  EXPECT_EQ(0u, second.find("GET /next HTTP/1.1\r\n"));
  writeAll(server, okResponse("done"));

  ASSERT_EQ(std::future_status::ready,
            chained.wait_for(std::chrono::seconds(5)));
  EXPECT_EQ("done", chained.get());
}

TEST_F(HttpClientTest, ConnectCallbackMayWaitForResponse) {
  startClient();

  std::promise<std::string> body;
  client_->connect("example.test", 8080, [&](ConnectResult&& result) {
    auto connection = get<HttpConnectionSharedPtr>(result);
    auto response =
        connection->send(http::HttpRequest(http::HttpMethod::GET, "/ready"));
    body.set_value(response.get().body);
  });

  ASSERT_TRUE(waitFor([this]() { return sockets_.serverFd(0) >= 0; }));
  int server = sockets_.serverFd(0);
  readRequests(server, 1);
  writeAll(server, okResponse("yes"));

  auto future = body.get_future();
  ASSERT_EQ(std::future_status::ready,
            future.wait_for(std::chrono::seconds(5)));
  EXPECT_EQ("yes", future.get());
}

TEST_F(HttpClientTest, SlowReceiverDoesNotHoldUpOtherConnections) {
  startClient();
  auto slow_connection = connect(8080);
  auto fast_connection = connect(8081);

  std::promise<void> release;
  std::shared_future<void> released = release.get_future().share();
  class BlockingReceiver : public ResponseReceiver {
   public:
    explicit BlockingReceiver(std::shared_future<void> released)
        : released_(std::move(released)) {}
    void onResponseEvent(ResponseEvent&&,
                         const optional<RequestContext>&) override {
      released_.wait();
    }
    std::shared_future<void> released_;
  };

  slow_connection->send(http::HttpRequest(http::HttpMethod::GET, "/slow"),
                        std::make_shared<BlockingReceiver>(released));
  readRequests(sockets_.serverFd(0), 1);
  writeAll(sockets_.serverFd(0), okResponse("held"));

  auto fast =
      fast_connection->send(http::HttpRequest(http::HttpMethod::GET, "/fast"));
  readRequests(sockets_.serverFd(1), 1);
  writeAll(sockets_.serverFd(1), okResponse("quick"));

  auto status = fast.wait_for(std::chrono::seconds(5));
  release.set_value();
  ASSERT_EQ(std::future_status::ready, status);
  EXPECT_EQ("quick", fast.get().body);
}

TEST_F(HttpClientTest, StartRequestStreamIsNotImplemented) {
  startClient();
  auto connection = connect();
  EXPECT_THROW(connection->startRequestStream(http::ChunkedRequestStart()),
               HttpClientException);
}

}  // namespace
}  // namespace client
}  // namespace canal
