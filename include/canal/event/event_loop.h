#ifndef CANAL_EVENT_EVENT_LOOP_H
#define CANAL_EVENT_EVENT_LOOP_H

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>

namespace canal {
namespace event {

class Dispatcher;
class FileEvent;
class Timer;
class DeferredDeletable;

using DispatcherPtr = std::unique_ptr<Dispatcher>;
using FileEventPtr = std::unique_ptr<FileEvent>;
using TimerPtr = std::unique_ptr<Timer>;
using DeferredDeletablePtr = std::unique_ptr<DeferredDeletable>;

using PostCb = std::function<void()>;
using FileReadyCb = std::function<void(uint32_t events)>;
using TimerCb = std::function<void()>;

enum class FileReadyType : uint32_t { Read = 0x01, Write = 0x02 };

inline uint32_t operator|(FileReadyType a, FileReadyType b) {
  return static_cast<uint32_t>(a) | static_cast<uint32_t>(b);
}

/**
 * Objects handed to Dispatcher::deferredDelete(). A connection may submit
 * itself from inside one of its own callbacks.
 */
class DeferredDeletable {
 public:
  virtual ~DeferredDeletable() = default;
};

/**
 * Edge-triggered readiness watch on a socket. Each reported event means the
 * handler must read or write until EAGAIN before it is reported again.
 */
class FileEvent {
 public:
  virtual ~FileEvent() = default;

  /**
   * Replace the watched FileReadyType mask; 0 stops watching. Re-arming
   * reports a socket that is already ready straight away.
   */
  virtual void setEnabled(uint32_t events) = 0;
};

// One-shot timer
class Timer {
 public:
  virtual ~Timer() = default;

  virtual void enableTimer(std::chrono::milliseconds delay) = 0;
  virtual void disableTimer() = 0;
  virtual bool enabled() const = 0;
};

/**
 * Single-threaded event loop. Everything except post() and exit() must be
 * called on the thread running run().
 */
class Dispatcher {
 public:
  virtual ~Dispatcher() = default;

  virtual const std::string& name() const = 0;

  /**
   * Queue a callback for the loop thread. Thread-safe; callbacks run in
   * the order they were posted.
   */
  virtual void post(PostCb callback) = 0;

  // True on the thread currently inside run()
  virtual bool isThreadSafe() const = 0;

  virtual FileEventPtr createFileEvent(int fd,
                                       FileReadyCb cb,
                                       uint32_t events) = 0;

  virtual TimerPtr createTimer(TimerCb cb) = 0;

  // Destroy the object on a later loop iteration
  virtual void deferredDelete(DeferredDeletablePtr&& to_delete) = 0;

  virtual void clearDeferredDeleteList() = 0;

  /**
   * Run until exit(). Callbacks still queued when the loop stops run
   * before run() returns.
   */
  virtual void run() = 0;

  // Thread-safe
  virtual void exit() = 0;
};

DispatcherPtr createLibeventDispatcher(const std::string& name);

}  // namespace event
}  // namespace canal

#endif  // CANAL_EVENT_EVENT_LOOP_H
