#ifndef CANAL_EVENT_LIBEVENT_DISPATCHER_H
#define CANAL_EVENT_LIBEVENT_DISPATCHER_H

#include <atomic>
#include <deque>
#include <mutex>
#include <thread>
#include <vector>

#include "canal/event/event_loop.h"

struct event_base;
struct event;

namespace canal {
namespace event {

/**
 * Dispatcher on a libevent event base. Requires libevent built with
 * pthreads support: posts from other threads wake the loop through
 * event_active() on an internal event.
 */
class LibeventDispatcher : public Dispatcher {
 public:
  explicit LibeventDispatcher(const std::string& name);
  ~LibeventDispatcher() override;

  const std::string& name() const override { return name_; }
  void post(PostCb callback) override;
  bool isThreadSafe() const override;
  FileEventPtr createFileEvent(int fd,
                               FileReadyCb cb,
                               uint32_t events) override;
  TimerPtr createTimer(TimerCb cb) override;
  void deferredDelete(DeferredDeletablePtr&& to_delete) override;
  void clearDeferredDeleteList() override;
  void run() override;
  void exit() override;

  event_base* base() { return base_; }

 private:
  class SocketEvent;
  class OneShotTimer;

  static void onPostReady(int, short, void* arg);
  void drainPosted();

  const std::string name_;
  event_base* base_{nullptr};
  std::atomic<std::thread::id> loop_thread_{};
  std::atomic<bool> exit_requested_{false};

  std::mutex post_mutex_;
  std::deque<PostCb> posted_;
  struct event* post_event_{nullptr};

  std::vector<DeferredDeletablePtr> deferred_;
  TimerPtr deferred_timer_;
};

}  // namespace event
}  // namespace canal

#endif  // CANAL_EVENT_LIBEVENT_DISPATCHER_H
