#define CANAL_LOG_COMPONENT "event.worker"

#include "canal/event/worker.h"

#include <stdexcept>

#include <pthread.h>

#include "canal/logging/log_macros.h"

namespace canal {
namespace event {

Worker::Worker(DispatcherPtr dispatcher) : dispatcher_(std::move(dispatcher)) {}

Worker::~Worker() { stop(); }

void Worker::start() {
  std::lock_guard<std::mutex> thread_lock(thread_mutex_);
  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (running_) {
      return;
    }
  }

  if (thread_.joinable()) {
    // Left behind by a stop() issued on the worker thread
    if (onWorkerThread()) {
      throw std::logic_error("Worker '" + dispatcher_->name() +
                             "' cannot restart from its own thread");
    }
    thread_.join();
  }

  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    running_ = true;
  }
  thread_ = std::thread([this]() { threadRoutine(); });
  CANAL_LOG(Debug, "Worker '{}' started", dispatcher_->name());
}

void Worker::stop() {
  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (running_) {
      running_ = false;
      dispatcher_->post([this]() { dispatcher_->exit(); });
    }
  }

  if (onWorkerThread()) {
    return;
  }
  std::lock_guard<std::mutex> thread_lock(thread_mutex_);
  if (thread_.joinable()) {
    thread_.join();
  }
}

bool Worker::isRunning() const {
  std::lock_guard<std::mutex> lock(state_mutex_);
  return running_;
}

void Worker::threadRoutine() {
#ifdef __linux__
  // Thread names are limited to 15 characters
  pthread_setname_np(pthread_self(), dispatcher_->name().substr(0, 15).c_str());
#endif
  dispatcher_->run();
}

}  // namespace event
}  // namespace canal
