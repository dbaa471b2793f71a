#pragma once
#include "gambler/EventBus.hpp"
#include "gambler/JsonCodec.hpp"
#include <memory>
#include <thread>
#include <vector>
#include <mutex>
#include <atomic>
#include <deque>
#include <set>
#include <string>
#include <nlohmann/json.hpp>
#include <websocketpp/config/asio_no_tls.hpp>
#include <websocketpp/server.hpp>

/*
FrontendBridge:
  Subscribes to the run topics (Bar, OrderStatus, RunStart, RunEnd) and
  broadcasts them as {"type", "data"} JSON via WebSocket to connected
  frontend clients. The most recent messages are kept so a client can ask
  for them again with {"command":"replay"}.
*/

namespace server {

using json = nlohmann::json;
typedef websocketpp::server<websocketpp::config::asio> WebSocketServerType;
typedef WebSocketServerType::connection_ptr connection_ptr;

class FrontendBridge {
public:
  explicit FrontendBridge(gambler::EventBus& bus, int port = 3000);
  ~FrontendBridge();

  FrontendBridge(const FrontendBridge&) = delete;
  FrontendBridge& operator=(const FrontendBridge&) = delete;

  // Subscribe to the bus and start the WebSocket server thread
  void start();

  // Stop the server and unsubscribe
  void stop();

  // Subscribe to the bus only; start() does this too
  void subscribe_events();

  // Most recent messages, oldest first (thread-safe)
  std::vector<json> get_recent_messages(size_t limit = MAX_MESSAGES) const;

  // Convert a bus event to its frontend message; null for unknown topics
  static json to_message(const gambler::Event& ev);

  // Handle a text frame from a client; returns the messages to send back to it
  std::vector<json> handle_command(const std::string& payload) const;

  static constexpr size_t MAX_MESSAGES = 200;

private:
  gambler::EventBus& bus_;
  int port_;
  std::atomic<bool> running_{false};
  std::vector<std::pair<std::string, gambler::EventBus::HandlerId>> subs_;

  mutable std::mutex messages_mutex_;
  std::deque<json> recent_messages_;
  std::unique_ptr<std::thread> ws_thread_;

  // WebSocket server state
  mutable std::mutex ws_mutex_;
  std::unique_ptr<WebSocketServerType> ws_server_;
  std::set<connection_ptr> ws_connections_;

  void on_event(const gambler::Event& ev);
  void broadcast_to_clients(const json& msg);

  // WebSocket server thread function
  void run_ws_server();
};

} // namespace server
