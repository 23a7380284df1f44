#pragma once
#include <cstddef>
#include <drogon/WebSocketController.h>

namespace sqlscope::controllers {

// Message protocol over a WebSocket. Besides request/response pairs, subscribers get
// unsolicited tablesLoaded/databaseInfoLoaded messages when the database changes.
class events_controller : public drogon::WebSocketController<events_controller> {
 public:
  void handleNewMessage(const drogon::WebSocketConnectionPtr& conn,
                        std::string&& message,
                        const drogon::WebSocketMessageType& type) override;
  void handleNewConnection(const drogon::HttpRequestPtr& req,
                           const drogon::WebSocketConnectionPtr& conn) override;
  void handleConnectionClosed(const drogon::WebSocketConnectionPtr& conn) override;

  WS_PATH_LIST_BEGIN
  WS_PATH_ADD("/ws", "sqlscope::filters::token_filter");
  WS_PATH_LIST_END

  // Pushes fresh table list and database info to every subscriber. Returns the number
  // of subscribers reached. Blocks on sqlite; call it from the worker pool.
  static size_t broadcast_refresh();
};

}
