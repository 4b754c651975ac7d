#define CANAL_LOG_COMPONENT "event.libevent"

#include "canal/event/libevent_dispatcher.h"

#include <stdexcept>

#include <event2/event.h>
#include <event2/thread.h>

#include "canal/logging/log_macros.h"

namespace canal {
namespace event {

namespace {

// Process-wide, and only effective for bases created afterwards
void useLibeventPthreads() {
  static std::once_flag once;
  std::call_once(once, []() {
    if (evthread_use_pthreads() != 0) {
      throw std::runtime_error("libevent was built without pthreads support");
    }
  });
}

timeval toTimeval(std::chrono::milliseconds delay) {
  timeval tv;
  tv.tv_sec = static_cast<time_t>(delay.count() / 1000);
  tv.tv_usec = static_cast<suseconds_t>((delay.count() % 1000) * 1000);
  return tv;
}

}  // namespace

class LibeventDispatcher::SocketEvent : public FileEvent {
 public:
  SocketEvent(LibeventDispatcher& dispatcher, int fd, FileReadyCb cb)
      : dispatcher_(dispatcher), fd_(fd), cb_(std::move(cb)) {
    event_ = event_new(dispatcher_.base(), fd_, 0, &SocketEvent::onReady, this);
    if (event_ == nullptr) {
      throw std::runtime_error("Failed to create socket event for fd " +
                               std::to_string(fd_));
    }
  }

  ~SocketEvent() override { event_free(event_); }

  void setEnabled(uint32_t events) override {
    event_del(event_);
    if (events == 0) {
      return;
    }

    short flags = EV_PERSIST | EV_ET;
    if (events & static_cast<uint32_t>(FileReadyType::Read)) {
      flags |= EV_READ;
    }
    if (events & static_cast<uint32_t>(FileReadyType::Write)) {
      flags |= EV_WRITE;
    }
    event_assign(event_, dispatcher_.base(), fd_, flags, &SocketEvent::onReady,
                 this);
    event_add(event_, nullptr);
  }

 private:
  static void onReady(int, short what, void* arg) {
    auto* self = static_cast<SocketEvent*>(arg);
    uint32_t ready = 0;
    if (what & EV_READ) {
      ready |= static_cast<uint32_t>(FileReadyType::Read);
    }
    if (what & EV_WRITE) {
      ready |= static_cast<uint32_t>(FileReadyType::Write);
    }
    if (ready != 0) {
      self->cb_(ready);
    }
  }

  LibeventDispatcher& dispatcher_;
  const int fd_;
  FileReadyCb cb_;
  struct event* event_;
};

class LibeventDispatcher::OneShotTimer : public Timer {
 public:
  OneShotTimer(LibeventDispatcher& dispatcher, TimerCb cb)
      : cb_(std::move(cb)) {
    event_ = evtimer_new(dispatcher.base(), &OneShotTimer::onFire, this);
    if (event_ == nullptr) {
      throw std::runtime_error("Failed to create timer");
    }
  }

  ~OneShotTimer() override { event_free(event_); }

  void enableTimer(std::chrono::milliseconds delay) override {
    timeval tv = toTimeval(delay);
    evtimer_add(event_, &tv);
    enabled_ = true;
  }

  void disableTimer() override {
    evtimer_del(event_);
    enabled_ = false;
  }

  bool enabled() const override { return enabled_; }

 private:
  static void onFire(int, short, void* arg) {
    auto* self = static_cast<OneShotTimer*>(arg);
    self->enabled_ = false;
    self->cb_();
  }

  TimerCb cb_;
  struct event* event_;
  bool enabled_{false};
};

LibeventDispatcher::LibeventDispatcher(const std::string& name) : name_(name) {
  useLibeventPthreads();

  event_config* config = event_config_new();
  if (config != nullptr) {
    event_config_set_flag(config, EVENT_BASE_FLAG_PRECISE_TIMER);
    base_ = event_base_new_with_config(config);
    event_config_free(config);
  }
  if (base_ == nullptr) {
    throw std::runtime_error("Failed to create event base for dispatcher '" +
                             name_ + "'");
  }

  // Never added; event_active() from post() and exit() wakes the loop
  post_event_ = event_new(base_, -1, 0, &LibeventDispatcher::onPostReady, this);
  if (post_event_ == nullptr) {
    event_base_free(base_);
    throw std::runtime_error("Failed to create post event");
  }

  deferred_timer_ = createTimer([this]() {
    std::vector<DeferredDeletablePtr> batch;
    batch.swap(deferred_);
  });

  CANAL_LOG(Debug, "Dispatcher '{}' uses the {} backend", name_,
            event_base_get_method(base_));
}

LibeventDispatcher::~LibeventDispatcher() {
  // Deferred objects may still own events of this base
  deferred_.clear();
  deferred_timer_.reset();
  posted_.clear();
  event_free(post_event_);
  event_base_free(base_);
}

void LibeventDispatcher::post(PostCb callback) {
  bool wake;
  {
    std::lock_guard<std::mutex> lock(post_mutex_);
    wake = posted_.empty();
    posted_.push_back(std::move(callback));
  }
  if (wake) {
    event_active(post_event_, EV_READ, 0);
  }
}

bool LibeventDispatcher::isThreadSafe() const {
  return loop_thread_.load() == std::this_thread::get_id();
}

FileEventPtr LibeventDispatcher::createFileEvent(int fd,
                                                 FileReadyCb cb,
                                                 uint32_t events) {
  auto file_event = std::make_unique<SocketEvent>(*this, fd, std::move(cb));
  file_event->setEnabled(events);
  return file_event;
}

TimerPtr LibeventDispatcher::createTimer(TimerCb cb) {
  return std::make_unique<OneShotTimer>(*this, std::move(cb));
}

void LibeventDispatcher::deferredDelete(DeferredDeletablePtr&& to_delete) {
  if (!to_delete) {
    return;
  }
  deferred_.push_back(std::move(to_delete));
  if (!deferred_timer_->enabled()) {
    deferred_timer_->enableTimer(std::chrono::milliseconds(0));
  }
}

void LibeventDispatcher::clearDeferredDeleteList() {
  deferred_timer_->disableTimer();
  std::vector<DeferredDeletablePtr> batch;
  batch.swap(deferred_);
}

void LibeventDispatcher::run() {
  loop_thread_ = std::this_thread::get_id();
  CANAL_LOG(Debug, "Dispatcher '{}' running", name_);

  drainPosted();
  while (!exit_requested_) {
    event_base_loop(base_, EVLOOP_ONCE | EVLOOP_NO_EXIT_ON_EMPTY);
  }
  drainPosted();

  exit_requested_ = false;
  loop_thread_ = std::thread::id();
  CANAL_LOG(Debug, "Dispatcher '{}' stopped", name_);
}

void LibeventDispatcher::exit() {
  exit_requested_ = true;
  event_active(post_event_, EV_READ, 0);
}

void LibeventDispatcher::onPostReady(int, short, void* arg) {
  static_cast<LibeventDispatcher*>(arg)->drainPosted();
}

void LibeventDispatcher::drainPosted() {
  std::deque<PostCb> batch;
  {
    std::lock_guard<std::mutex> lock(post_mutex_);
    batch.swap(posted_);
  }
  for (auto& callback : batch) {
    callback();
  }
}

DispatcherPtr createLibeventDispatcher(const std::string& name) {
  return std::make_unique<LibeventDispatcher>(name);
}

}  // namespace event
}  // namespace canal
