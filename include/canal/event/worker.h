#ifndef CANAL_EVENT_WORKER_H
#define CANAL_EVENT_WORKER_H

#include <mutex>
#include <string>
#include <thread>

#include "canal/event/event_loop.h"

namespace canal {
namespace event {

/**
 * A dispatcher running on a thread of its own.
 *
 * stop() may be called from any thread, including from a callback running
 * on the worker itself. In that case it only queues the exit; the thread is
 * joined by a later stop() from another thread or by the destructor, which
 * must not itself run on the worker thread.
 */
class Worker {
 public:
  explicit Worker(DispatcherPtr dispatcher);
  ~Worker();

  Worker(const Worker&) = delete;
  Worker& operator=(const Worker&) = delete;

  Dispatcher& dispatcher() { return *dispatcher_; }

  void start();

  // Exit once every callback posted so far has run
  void stop();

  bool isRunning() const;

  // True when called from the worker thread
  bool onWorkerThread() const { return dispatcher_->isThreadSafe(); }

 private:
  void threadRoutine();

  DispatcherPtr dispatcher_;

  mutable std::mutex state_mutex_;
  bool running_{false};

  // Held while joining or replacing thread_
  std::mutex thread_mutex_;
  std::thread thread_;
};

}  // namespace event
}  // namespace canal

#endif  // CANAL_EVENT_WORKER_H
