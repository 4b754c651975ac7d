#define CANAL_LOG_COMPONENT "client.delivery"

#include "canal/client/delivery_executor.h"

#include <exception>

#include "canal/logging/log_macros.h"

namespace canal {
namespace client {

DeliveryExecutor::DeliveryExecutor(const std::string& name)
    : worker_(event::createLibeventDispatcher(name)) {}

void DeliveryExecutor::start() {
  worker_.start();
  std::lock_guard<std::mutex> lock(mutex_);
  running_ = true;
}

void DeliveryExecutor::stop() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    running_ = false;
  }
  // The worker's exit is posted behind every task accepted above
  worker_.stop();
}

void DeliveryExecutor::execute(std::function<void()> task) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (running_) {
      worker_.dispatcher().post(
          [task = std::move(task)]() { runTask(task); });
      return;
    }
  }
  runTask(task);
}

void DeliveryExecutor::runTask(const std::function<void()>& task) {
  try {
    task();
  } catch (const std::exception& e) {
    CANAL_LOG(Error, "Delivery callback threw: {}", e.what());
  }
}

}  // namespace client
}  // namespace canal
