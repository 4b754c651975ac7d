#ifndef CANAL_CLIENT_DELIVERY_EXECUTOR_H
#define CANAL_CLIENT_DELIVERY_EXECUTOR_H

#include <functional>
#include <mutex>
#include <string>

#include "canal/event/worker.h"

namespace canal {
namespace client {

/**
 * Runs caller code (response receivers and connect callbacks) on a thread
 * of its own so the client's dispatcher never waits for it.
 *
 * Tasks run one at a time in submission order, which keeps the events of
 * one request in order. While stopped, execute() runs the task on the
 * calling thread, so nothing submitted is ever dropped.
 */
class DeliveryExecutor {
 public:
  explicit DeliveryExecutor(const std::string& name);

  void start();

  // Tasks submitted before stop() still run; joins unless called by a task
  void stop();

  // Exceptions escaping the task are logged
  void execute(std::function<void()> task);

  bool onDeliveryThread() const { return worker_.onWorkerThread(); }

 private:
  static void runTask(const std::function<void()>& task);

  event::Worker worker_;
  std::mutex mutex_;
  bool running_{false};
};

}  // namespace client
}  // namespace canal

#endif  // CANAL_CLIENT_DELIVERY_EXECUTOR_H
