#ifndef CANAL_CLIENT_OPEN_REQUEST_REGISTRY_H
#define CANAL_CLIENT_OPEN_REQUEST_REGISTRY_H

#include <chrono>
#include <cstdint>
#include <functional>
#include <list>
#include <memory>

#include "canal/http/http_types.h"

namespace canal {
namespace client {

class ClientConnection;

using MonotonicTime = std::chrono::steady_clock::time_point;
using TimeSource = std::function<MonotonicTime()>;

// One request that was accepted for sending and is not yet answered
struct OpenRequestRecord {
  std::shared_ptr<const http::HttpRequest> request;
  ClientConnection* connection{nullptr};
  MonotonicTime timestamp;
  uint64_t sequence{0};
};

/**
 * All in-flight requests of a client across its connections, oldest first.
 *
 * Records are only appended at the tail, so list order is age order.
 * Owned and used by the dispatcher thread only.
 */
class OpenRequestRegistry {
 public:
  using Handle = std::list<OpenRequestRecord>::iterator;
  using TimedOutCb = std::function<void(const OpenRequestRecord& record)>;

  Handle append(std::shared_ptr<const http::HttpRequest> request,
                ClientConnection* connection,
                MonotonicTime now);

  // The handle must come from append() and not have been removed yet
  void remove(Handle handle);

  size_t size() const { return records_.size(); }
  bool empty() const { return records_.empty(); }

  /**
   * Invoke cb for every record older than timeout, oldest first. The
   * callback may remove any records, including ones not visited yet, but
   * must not append or start another scan.
   * The scan stops at the first record that has not expired and visits
   * each record at most once.
   *
   * @return number of callbacks made
   */
  size_t forAllTimedOut(std::chrono::milliseconds timeout,
                        MonotonicTime now,
                        const TimedOutCb& cb);

 private:
  std::list<OpenRequestRecord> records_;
  uint64_t next_sequence_{0};

  // Next record of the forAllTimedOut() in progress
  bool scanning_{false};
  Handle scan_next_;
};

}  // namespace client
}  // namespace canal

#endif  // CANAL_CLIENT_OPEN_REQUEST_REGISTRY_H
