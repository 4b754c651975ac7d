#include <atomic>
#include <chrono>
#include <string>
#include <thread>
#include <vector>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <gtest/gtest.h>

#include "canal/client/http_client.h"

namespace canal {
namespace client {
namespace {

/**
 * A blocking TCP server on the loopback interface. It accepts a single
 * connection, waits for the given number of request heads and answers
 * them all in one write.
 */
class LoopbackServer {
 public:
  LoopbackServer() {
    listen_fd_ = ::socket(AF_INET, SOCK_STREAM, 0);
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    ::bind(listen_fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr));
    socklen_t len = sizeof(addr);
    ::getsockname(listen_fd_, reinterpret_cast<sockaddr*>(&addr), &len);
    port_ = ntohs(addr.sin_port);
    ::listen(listen_fd_, 4);
  }

  ~LoopbackServer() {
    if (thread_.joinable()) {
      thread_.join();
    }
    ::close(listen_fd_);
  }

  uint16_t port() const { return port_; }

  void serve(size_t requests, std::string responses) {
    thread_ = std::thread([this, requests, responses]() {
      pollfd pfd{listen_fd_, POLLIN, 0};
      if (::poll(&pfd, 1, 5000) <= 0) {
        return;
      }
      int fd = ::accept(listen_fd_, nullptr, nullptr);
      if (fd < 0) {
        return;
      }

      std::string data;
      char buffer[4096];
      while (countHeads(data) < requests) {
        pollfd conn{fd, POLLIN, 0};
        if (::poll(&conn, 1, 5000) <= 0) {
          break;
        }
        ssize_t n = ::read(fd, buffer, sizeof(buffer));
        if (n <= 0) {
          break;
        }
        data.append(buffer, static_cast<size_t>(n));
      }
      received_ = data;
      received_heads_ = countHeads(data);

      size_t offset = 0;
      while (offset < responses.size()) {
        ssize_t n = ::write(fd, responses.data() + offset,
                            responses.size() - offset);
        if (n <= 0) {
          break;
        }
        offset += static_cast<size_t>(n);
      }

      // Hold the connection until the client has read everything
      ::shutdown(fd, SHUT_WR);
      pollfd drain{fd, POLLIN, 0};
      ::poll(&drain, 1, 1000);
      ::close(fd);
    });
  }

  void join() {
    if (thread_.joinable()) {
      thread_.join();
    }
  }

  std::string received() const { return received_; }
  size_t receivedHeads() const { return received_heads_; }

 private:
  static size_t countHeads(const std::string& data) {
    size_t count = 0;
    for (size_t pos = data.find("\r\n\r\n"); pos != std::string::npos;
         pos = data.find("\r\n\r\n", pos + 4)) {
      ++count;
    }
    return count;
  }

  int listen_fd_{-1};
  uint16_t port_{0};
  std::thread thread_;
  std::string received_;
  std::atomic<size_t> received_heads_{0};
};

std::string response(const std::string& body) {
  return "HTTP/1.1 200 OK\r\nContent-Length: " + std::to_string(body.size()) +
         "\r\n\r\n" + body;
}

TEST(LoopbackPipeliningTest, PipelinedRequestsOverRealSocket) {
  LoopbackServer server;
  server.serve(3, response("one") + response("two") + response("three"));

  HttpClient client;
  client.start();

  auto connecting = client.connect("127.0.0.1", server.port());
  ASSERT_EQ(std::future_status::ready,
            connecting.wait_for(std::chrono::seconds(5)));
  auto connection = connecting.get();

  std::vector<std::future<http::HttpResponse>> futures;
  for (const char* uri : {"/one", "/two", "/three"}) {
    futures.push_back(
        connection->send(http::HttpRequest(http::HttpMethod::GET, uri)));
  }

  std::vector<std::string> bodies;
  for (auto& future : futures) {
    ASSERT_EQ(std::future_status::ready,
              future.wait_for(std::chrono::seconds(5)));
    bodies.push_back(future.get().body);
  }
  EXPECT_EQ((std::vector<std::string>{"one", "two", "three"}), bodies);

  server.join();
  EXPECT_EQ(3u, server.receivedHeads());
  std::string received = server.received();
  EXPECT_LT(received.find("GET /one "), received.find("GET /two "));
  EXPECT_LT(received.find("GET /two "), received.find("GET /three "));

  connection->close();
  client.stop();
  EXPECT_EQ(3u, client.stats().requests_dispatched.load());
}

TEST(LoopbackPipeliningTest, RefusedConnectionFailsConnectFuture) {
  uint16_t port = 0;
  {
    LoopbackServer closed;
    port = closed.port();
  }

  HttpClient client;
  client.start();

  auto connecting = client.connect("127.0.0.1", port);
  ASSERT_EQ(std::future_status::ready,
            connecting.wait_for(std::chrono::seconds(5)));
  EXPECT_THROW(connecting.get(), HttpClientException);

  client.stop();
}

}  // namespace
}  // namespace client
}  // namespace canal
