#include "canal/client/open_request_registry.h"

namespace canal {
namespace client {

OpenRequestRegistry::Handle OpenRequestRegistry::append(
    std::shared_ptr<const http::HttpRequest> request,
    ClientConnection* connection,
    MonotonicTime now) {
  OpenRequestRecord record;
  record.request = std::move(request);
  record.connection = connection;
  record.timestamp = now;
  record.sequence = next_sequence_++;
  return records_.insert(records_.end(), std::move(record));
}

void OpenRequestRegistry::remove(Handle handle) {
  // Keep a running scan pointed at a live record
  if (scanning_ && handle == scan_next_) {
    ++scan_next_;
  }
  records_.erase(handle);
}

size_t OpenRequestRegistry::forAllTimedOut(std::chrono::milliseconds timeout,
                                           MonotonicTime now,
                                           const TimedOutCb& cb) {
  struct ScanGuard {
    explicit ScanGuard(bool& flag) : flag_(flag) { flag_ = true; }
    ~ScanGuard() { flag_ = false; }
    bool& flag_;
  };

  size_t visited = 0;
  ScanGuard guard(scanning_);
  scan_next_ = records_.begin();
  while (scan_next_ != records_.end() &&
         scan_next_->timestamp + timeout < now) {
    // The callback may remove the record itself, so hand it a copy
    OpenRequestRecord expired = *scan_next_;
    ++scan_next_;
    ++visited;
    cb(expired);
  }

  return visited;
}

}  // namespace client
}  // namespace canal
