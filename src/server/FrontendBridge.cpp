#include "server/FrontendBridge.hpp"
#include "gambler/Engine.hpp"
#include "gambler/Types.hpp"
#include <iostream>
#include <algorithm>
#include <chrono>
#include <cstddef>

namespace server {

FrontendBridge::FrontendBridge(gambler::EventBus& bus, int port)
    : bus_(bus), port_(port) {}

FrontendBridge::~FrontendBridge() {
  stop();
  for (const auto& [topic, id] : subs_) {
    bus_.unsubscribe(topic, id);
  }
}

void FrontendBridge::subscribe_events() {
  if (!subs_.empty()) return;

  for (const char* topic : {gambler::topics::kRunStart, gambler::topics::kBar,
                            gambler::topics::kOrderStatus, gambler::topics::kRunEnd}) {
    auto id = bus_.subscribe(topic, [this](const gambler::Event& ev) { on_event(ev); });
    subs_.emplace_back(topic, id);
  }
}

void FrontendBridge::start() {
  if (running_.exchange(true)) return;

  subscribe_events();

  // Start WebSocket server in a separate thread
  ws_thread_ = std::make_unique<std::thread>([this]() {
    run_ws_server();
  });

  std::cout << "[FrontendBridge] WebSocket server starting on port " << port_ << "\n";

  // Give the WebSocket server a moment to start
  std::this_thread::sleep_for(std::chrono::milliseconds(100));
}

void FrontendBridge::stop() {
  if (!running_.exchange(false)) return;

  // Stop the WebSocket server
  {
    std::lock_guard<std::mutex> lock(ws_mutex_);
    if (ws_server_) {
      try {
        ws_server_->stop_listening();
        ws_server_->stop();  // Explicitly stop the ASIO service
      } catch (const std::exception& e) {
        std::cerr << "[FrontendBridge] Error stopping server: " << e.what() << "\n";
      }
      ws_connections_.clear();
    }
  }

  if (ws_thread_ && ws_thread_->joinable()) {
    ws_thread_->join();
  }
  ws_thread_.reset();

  for (const auto& [topic, id] : subs_) {
    bus_.unsubscribe(topic, id);
  }
  subs_.clear();

  std::cout << "[FrontendBridge] Server stopped\n";
}

std::vector<json> FrontendBridge::get_recent_messages(size_t limit) const {
  std::lock_guard<std::mutex> lock(messages_mutex_);
  size_t count = std::min(limit, recent_messages_.size());
  return std::vector<json>(recent_messages_.end() - static_cast<std::ptrdiff_t>(count),
                           recent_messages_.end());
}

json FrontendBridge::to_message(const gambler::Event& ev) {
  using namespace gambler;
  if (ev.type == topics::kBar) {
    return make_message(ev.type, json(std::any_cast<const Bar&>(ev.data)));
  }
  if (ev.type == topics::kOrderStatus) {
    return make_message(ev.type, json(std::any_cast<const OrderStatusEvent&>(ev.data)));
  }
  if (ev.type == topics::kRunStart) {
    return make_message(ev.type, json(std::any_cast<const RunInfo&>(ev.data)));
  }
  if (ev.type == topics::kRunEnd) {
    return make_message(ev.type, json(std::any_cast<const RunStats&>(ev.data)));
  }
  return json();
}

void FrontendBridge::on_event(const gambler::Event& ev) {
  json msg;
  try {
    msg = to_message(ev);
  } catch (const std::bad_any_cast&) {
    std::cerr << "[FrontendBridge] Failed to cast " << ev.type << " event\n";
    return;
  }
  if (msg.is_null()) return;

  // A new run starts with an empty buffer
  if (ev.type == gambler::topics::kRunStart) {
    std::lock_guard<std::mutex> lock(messages_mutex_);
    recent_messages_.clear();
  }

  broadcast_to_clients(msg);
}

std::vector<json> FrontendBridge::handle_command(const std::string& payload) const {
  json command = json::parse(payload);

  if (command.is_object() && command.value("command", std::string{}) == "replay") {
    return get_recent_messages();
  }

  std::cerr << "[FrontendBridge] Ignoring unknown command: " << payload << "\n";
  return {};
}

void FrontendBridge::broadcast_to_clients(const json& msg) {
  // Store message in memory queue
  {
    std::lock_guard<std::mutex> lock(messages_mutex_);
    recent_messages_.push_back(msg);
    if (recent_messages_.size() > MAX_MESSAGES) {
      recent_messages_.pop_front();
    }
  }

  // Broadcast to all connected WebSocket clients
  {
    std::lock_guard<std::mutex> lock(ws_mutex_);
    if (ws_server_) {
      std::string payload = msg.dump();
      for (auto& conn : ws_connections_) {
        try {
          ws_server_->send(conn, payload, websocketpp::frame::opcode::text);
        } catch (const std::exception& e) {
          std::cerr << "[FrontendBridge] Failed to send to client: " << e.what() << "\n";
        }
      }
    }
  }

#ifdef GAMBLER_DEBUG
  std::cout << "[debug] [WS] " << msg.dump() << "\n";
#endif
}

void FrontendBridge::run_ws_server() {
  try {
    auto server = std::make_unique<WebSocketServerType>();

    server->clear_access_channels(websocketpp::log::alevel::all);
    server->set_access_channels(websocketpp::log::alevel::connect | websocketpp::log::alevel::disconnect);

    // Initialize ASIO
    server->init_asio();
    server->set_reuse_addr(true);

    // Handle new connections
    server->set_open_handler([this](websocketpp::connection_hdl hdl) {
      std::lock_guard<std::mutex> lock(ws_mutex_);
      auto conn = ws_server_->get_con_from_hdl(hdl);
      ws_connections_.insert(conn);
      std::cout << "[FrontendBridge] Client connected. Total clients: " << ws_connections_.size() << "\n";
    });

    // Handle client disconnect
    server->set_close_handler([this](websocketpp::connection_hdl hdl) {
      std::lock_guard<std::mutex> lock(ws_mutex_);
      auto it = ws_connections_.begin();
      while (it != ws_connections_.end()) {
        if ((*it)->get_handle().lock() == hdl.lock()) {
          it = ws_connections_.erase(it);
        } else {
          ++it;
        }
      }
      std::cout << "[FrontendBridge] Client disconnected. Total clients: " << ws_connections_.size() << "\n";
    });

    // Handle incoming messages ("replay" command)
    server->set_message_handler([this](websocketpp::connection_hdl hdl, WebSocketServerType::message_ptr msg) {
      std::vector<json> replies;
      try {
        replies = handle_command(msg->get_payload());
      } catch (const std::exception& e) {
        std::cerr << "[FrontendBridge] Failed to parse incoming message: " << e.what() << "\n";
        return;
      }

      std::lock_guard<std::mutex> lock(ws_mutex_);
      if (!ws_server_) return;
      for (const auto& reply : replies) {
        try {
          ws_server_->send(hdl, reply.dump(), websocketpp::frame::opcode::text);
        } catch (const std::exception& e) {
          std::cerr << "[FrontendBridge] Failed to replay to client: " << e.what() << "\n";
          break;
        }
      }
    });

    // Listen on the specified port
    server->listen(websocketpp::lib::asio::ip::tcp::v4(), static_cast<uint16_t>(port_));
    server->start_accept();

    // Store server instance
    {
      std::lock_guard<std::mutex> lock(ws_mutex_);
      if (!running_) return;
      ws_server_ = std::move(server);
    }

    std::cout << "[FrontendBridge] WebSocket listening on ws://localhost:" << port_ << "\n";

    // Run the server (blocks until stop() is called)
    ws_server_->run();

    // Cleanup
    {
      std::lock_guard<std::mutex> lock(ws_mutex_);
      ws_server_ = nullptr;
      ws_connections_.clear();
    }

  } catch (const std::exception& e) {
    std::cerr << "[FrontendBridge] WebSocket server error: " << e.what() << "\n";
  }
}

} // namespace server
