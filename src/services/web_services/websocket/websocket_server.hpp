#pragma once

#include <cstddef>
#include <functional>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "mongoose.h"
#include "core/common/logger/logger.hpp"
#include "services/web_services/api/rest_api.hpp"

namespace lanscan::services::web_services::websocket {

// HTTP API plus a WebSocket feed. Only the thread calling Poll may touch it.
class MongooseServer {
public:
  struct Options {
    std::string listen_addr = "http://0.0.0.0:8000";
    std::string ws_path = "/ws";
  };

  using WsOpenHandler = std::function<void(struct mg_connection* c)>;

  MongooseServer(Options opt, std::shared_ptr<lanscan::core::common::log::Logger> logger)
      : opt_(std::move(opt)), log_(std::move(logger), "web") {
    mg_mgr_init(&mgr_);
  }

  ~MongooseServer() {
    mg_mgr_free(&mgr_);
  }

  MongooseServer(const MongooseServer&) = delete;
  MongooseServer& operator=(const MongooseServer&) = delete;

  bool Start() {
    if (mg_http_listen(&mgr_, opt_.listen_addr.c_str(), EventHandler, this) == nullptr) {
      log_.Error("Failed to listen on " + opt_.listen_addr);
      return false;
    }
    log_.Info("Mongoose listening on " + opt_.listen_addr);
    return true;
  }

  void Poll(int timeout_ms) {
    mg_mgr_poll(&mgr_, timeout_ms);
  }

  void SetApiContext(const api::ApiContext* ctx) { api_ctx_ = ctx; }

  // Called for each new feed client, e.g. to send it the current snapshot.
  void SetWsOpenHandler(WsOpenHandler handler) { on_ws_open_ = std::move(handler); }

  void SendText(struct mg_connection* c, const std::string& text) {
    if (c != nullptr && c->is_websocket) mg_ws_send(c, text.data(), text.size(), WEBSOCKET_OP_TEXT);
  }

  void BroadcastText(const std::string& text) {
    for (auto* c : ws_conns_) SendText(c, text);
  }

  std::size_t ClientCount() const { return ws_conns_.size(); }

private:
  static void EventHandler(struct mg_connection* c, int ev, void* ev_data) {
    auto* self = static_cast<MongooseServer*>(c->fn_data);
    self->HandleEvent(c, ev, ev_data);
  }

  void HandleEvent(struct mg_connection* c, int ev, void* ev_data) {
    if (ev == MG_EV_HTTP_MSG) {
      struct mg_http_message* hm = (struct mg_http_message*)ev_data;
      const std::string uri(hm->uri.buf, hm->uri.len);

      log_.Debug("HTTP request: " + uri);

      if (mg_match(hm->uri, mg_str(opt_.ws_path.c_str()), NULL)) {
        mg_ws_upgrade(c, hm, nullptr);
      } else if (api_ctx_ != nullptr && api::HandleHttpRequest(c, hm, *api_ctx_)) {
        // handled
      } else {
        mg_http_reply(c, 404, "Content-Type: application/json\r\n", "{\"error\":\"not_found\"}\n");
      }
    } else if (ev == MG_EV_WS_OPEN) {
      ws_conns_.push_back(c);
      log_.Debug("feed client connected, clients=" + std::to_string(ws_conns_.size()));
      if (on_ws_open_) on_ws_open_(c);
    } else if (ev == MG_EV_WS_MSG) {
      // The feed is one-way; client frames are ignored.
      struct mg_ws_message* wm = (struct mg_ws_message*)ev_data;
      log_.Trace("WS message ignored, bytes=" + std::to_string(wm->data.len));
    } else if (ev == MG_EV_CLOSE) {
      for (std::size_t i = 0; i < ws_conns_.size(); ++i) {
        if (ws_conns_[i] == c) {
          ws_conns_.erase(ws_conns_.begin() + static_cast<long>(i));
          break;
        }
      }
    }
  }

private:
  Options opt_;
  lanscan::core::common::log::TaggedLogger log_;
  struct mg_mgr mgr_;
  const api::ApiContext* api_ctx_ = nullptr;
  WsOpenHandler on_ws_open_;
  std::vector<struct mg_connection*> ws_conns_;
};

}  // namespace lanscan::services::web_services::websocket
