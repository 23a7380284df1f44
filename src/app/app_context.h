#pragma once

#include <functional>
#include <memory>
#include <mutex>
#include <trantor/utils/ConcurrentTaskQueue.h>

#include "db/connection_registry.h"
#include "service/message_dispatcher.h"

namespace sqlscope::app {

// Process-wide state shared by the HTTP/WebSocket handlers.
class app_context {
public:
  static app_context& instance();

  db::ConnectionRegistry& registry();

  // Dispatcher bound to the configured database and row limit.
  service::message_dispatcher dispatcher();

  // Runs `task` on the database worker pool so blocking sqlite calls stay off the
  // network event loops.
  void post(std::function<void()> task);

  // Closes every connection and stops the worker pool.
  void shutdown();

private:
  app_context() = default;
  app_context(const app_context&) = delete;
  app_context& operator=(const app_context&) = delete;

  db::ConnectionRegistry registry_state;
  std::unique_ptr<trantor::ConcurrentTaskQueue> worker_queue;
  std::mutex queue_mutex;
};

}  // namespace sqlscope::app
