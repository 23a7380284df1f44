#include "app/app_context.h"

#include <algorithm>
#include <thread>

#include "utils/options.h"

namespace sqlscope::app {

app_context& app_context::instance() {
  static app_context context_state;
  return context_state;
}

db::ConnectionRegistry& app_context::registry() {
  return registry_state;
}

service::message_dispatcher app_context::dispatcher() {
  auto& options_state = options::runtime_options::instance();
  return service::message_dispatcher(registry_state,
                                     db::QueryExecutor(options_state.row_limit()),
                                     options_state.db_path());
}

void app_context::post(std::function<void()> task) {
  trantor::ConcurrentTaskQueue* queue = nullptr;
  {
    std::lock_guard<std::mutex> guard(queue_mutex);
    if (!worker_queue) {
      size_t threads = std::max<size_t>(2, std::min<size_t>(8, std::thread::hardware_concurrency()));
      worker_queue = std::make_unique<trantor::ConcurrentTaskQueue>(threads, "sqlscope-db");
    }
    queue = worker_queue.get();
  }
  queue->runTaskInQueue(std::move(task));
}

void app_context::shutdown() {
  std::unique_ptr<trantor::ConcurrentTaskQueue> queue;
  {
    std::lock_guard<std::mutex> guard(queue_mutex);
    queue = std::move(worker_queue);
  }
  if (queue) queue->stop();
  registry_state.close_all();
}

}  // namespace sqlscope::app
