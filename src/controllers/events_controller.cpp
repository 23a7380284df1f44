#include "events_controller.h"
#include <drogon/drogon.h>
#include <memory>
#include <mutex>
#include <set>
#include <vector>
#include "app/app_context.h"
#include "service/message_dispatcher.h"

namespace sqlscope::controllers {

namespace {

std::mutex subscribers_mutex;
std::set<drogon::WebSocketConnectionPtr> subscribers;

std::string to_wire(const Json::Value& v) {
  Json::StreamWriterBuilder builder;
  builder["indentation"] = "";
  return Json::writeString(builder, v);
}

std::vector<drogon::WebSocketConnectionPtr> snapshot() {
  std::lock_guard<std::mutex> guard(subscribers_mutex);
  return std::vector<drogon::WebSocketConnectionPtr>(subscribers.begin(), subscribers.end());
}

}  // namespace

void events_controller::handleNewConnection(const drogon::HttpRequestPtr& req,
                                            const drogon::WebSocketConnectionPtr& conn) {
  LOG_DEBUG << "websocket subscriber connected from " << req->getPeerAddr().toIpPort();
  std::lock_guard<std::mutex> guard(subscribers_mutex);
  subscribers.insert(conn);
}

void events_controller::handleConnectionClosed(const drogon::WebSocketConnectionPtr& conn) {
  std::lock_guard<std::mutex> guard(subscribers_mutex);
  subscribers.erase(conn);
}

void events_controller::handleNewMessage(const drogon::WebSocketConnectionPtr& conn,
                                         std::string&& message,
                                         const drogon::WebSocketMessageType& type) {
  if (type != drogon::WebSocketMessageType::Text) return;
  Json::Value request;
  {
    Json::CharReaderBuilder b;
    std::string errs;
    std::unique_ptr<Json::CharReader> reader(b.newCharReader());
    if (!reader->parse(message.data(), message.data() + message.size(), &request, &errs)) {
      conn->send(to_wire(service::error_message("E_BAD_REQUEST", "Malformed JSON: " + errs, Json::Value())));
      return;
    }
  }
  sqlscope::app::app_context::instance().post([conn, request = std::move(request)]() {
    auto reply = sqlscope::app::app_context::instance().dispatcher().handle(request);
    if (conn->connected()) conn->send(to_wire(reply));
  });
}

size_t events_controller::broadcast_refresh() {
  auto targets = snapshot();
  if (targets.empty()) return 0;
  auto dispatcher = sqlscope::app::app_context::instance().dispatcher();
  // Same handling as a request so failures are reported as error messages.
  Json::Value tables_request(Json::objectValue);
  tables_request["command"] = "getTables";
  Json::Value info_request(Json::objectValue);
  info_request["command"] = "getDatabaseInfo";
  const std::string tables = to_wire(dispatcher.handle(tables_request));
  const std::string info = to_wire(dispatcher.handle(info_request));
  size_t reached = 0;
  for (const auto& conn : targets) {
    if (!conn->connected()) continue;
    conn->send(tables);
    conn->send(info);
    ++reached;
  }
  return reached;
}

}
