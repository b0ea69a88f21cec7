// ============================================================================
// ws_server.cpp: implementation for ws_server.hpp
// ============================================================================

#include "serialhub/ws_server.hpp"
#include "serialhub/broadcaster.hpp"
#include "serialhub/log.hpp"

#include <uwebsockets/App.h>

#include <unordered_map>
#include <vector>

namespace serialhub {

namespace {

// ---------------------------------------------------------------------------
// WsClient
// --------
// Broadcast-side view of one socket. deliver() runs on the broadcaster thread
// and only schedules the send; the socket itself is touched on the loop.
// ---------------------------------------------------------------------------
class WsClient : public Broadcaster::Client {
public:
    WsClient(WsServer& server, uint64_t socket_id, std::string peer)
        : server_(server), socket_id_(socket_id), peer_(std::move(peer)) {}

    bool deliver(const std::string& text) override {
        if (closed_.load()) return false;
        server_.post_send(socket_id_, text);
        return true;
    }

    std::string describe() const override { return peer_; }

    void mark_closed() { closed_.store(true); }

private:
    WsServer&         server_;
    const uint64_t    socket_id_;
    const std::string peer_;
    std::atomic<bool> closed_{false};
};

struct ClientData {
    uint64_t                  socket_id{0};
    Broadcaster::ClientId     client_id{0};
    std::string               peer;
    std::shared_ptr<WsClient> client;
};

using WsSocket = uWS::WebSocket<false, true, ClientData>;

bool is_normal_close(int code) {
    return code == 1000 || code == 1001 || code == 1005;
}

} // namespace

struct WsServer::SocketTable {
    std::unordered_map<uint64_t, WsSocket*> live;   // loop thread only
};


WsServer::WsServer(Relay& relay, const RelayConfig& cfg)
    : relay_(relay), cfg_(cfg), sockets_(std::make_unique<SocketTable>()) {}

WsServer::~WsServer() = default;

void WsServer::post_send(uint64_t socket_id, std::string text) {
    uWS::Loop* loop = loop_.load();
    if (!loop) return;
    loop->defer([this, socket_id, text = std::move(text)]() { send_now(socket_id, text); });
}

void WsServer::send_now(uint64_t socket_id, const std::string& text) {
    auto it = sockets_->live.find(socket_id);
    if (it == sockets_->live.end()) return;          // closed after the line was queued

    WsSocket* ws = it->second;
    if (ws->send(text, uWS::OpCode::TEXT) == WsSocket::SendStatus::DROPPED) {
        ClientData* ud = ws->getUserData();
        log::warn("ws", "client ", ud->peer, " is not keeping up, closing");
        if (ud->client) ud->client->mark_closed();
        ws->end(1013, "backpressure limit exceeded");   // close handler erases it from live
    }
}

void WsServer::close_all() {
    if (listen_socket_) {
        us_listen_socket_close(0, listen_socket_);
        listen_socket_ = nullptr;
    }
    std::vector<WsSocket*> open;
    open.reserve(sockets_->live.size());
    for (auto& kv : sockets_->live) open.push_back(kv.second);
    for (WsSocket* ws : open) ws->end(1001, "server shutting down");
}

void WsServer::stop() {
    stop_requested_.store(true);
    uWS::Loop* loop = loop_.load();
    if (!loop) return;
    loop->defer([this]() { close_all(); });
}

int WsServer::run() {
    ListenAddress addr;
    std::string   err;
    if (!parse_listen_address(cfg_.listen_address, addr, err)) {
        log::error("ws", "bad listen address '", cfg_.listen_address, "': ", err);
        return 1;
    }

    uWS::App app;

    uWS::App::WebSocketBehavior<ClientData> behavior;
    behavior.maxPayloadLength = 64 * 1024;
    behavior.maxBackpressure  = cfg_.max_backpressure;
    behavior.closeOnBackpressureLimit = false;

    behavior.upgrade = [this](auto* res, auto* req, auto* context) {
        ClientData init;
        init.socket_id = next_socket_id_++;
        auto sv = res->getRemoteAddressAsText();
        init.peer.assign(sv.data(), sv.size());

        // Any origin is accepted.
        res->template upgrade<ClientData>(
            std::move(init),
            req->getHeader("sec-websocket-key"),
            req->getHeader("sec-websocket-protocol"),
            req->getHeader("sec-websocket-extensions"),
            context);
    };

    behavior.open = [this](WsSocket* ws) {
        ClientData* ud = ws->getUserData();
        sockets_->live[ud->socket_id] = ws;
        ud->client    = std::make_shared<WsClient>(*this, ud->socket_id, ud->peer);
        ud->client_id = relay_.broadcaster().add_client(ud->client);
        log::info("ws", "client ", ud->peer, " connected");
        relay_.client_connected();
    };

    behavior.message = [this](WsSocket* ws, std::string_view msg, uWS::OpCode op) {
        if (op != uWS::OpCode::TEXT) {
            log::debug("ws", "binary frame from ", ws->getUserData()->peer, " ignored");
            return;
        }
        if (!relay_.submit_payload(std::string(msg))) {
            log::debug("ws", "relay stopping, message from ", ws->getUserData()->peer, " dropped");
        }
    };

    behavior.close = [this](WsSocket* ws, int code, std::string_view reason) {
        ClientData* ud = ws->getUserData();
        if (ud->client) ud->client->mark_closed();
        relay_.broadcaster().remove_client(ud->client_id);
        sockets_->live.erase(ud->socket_id);

        if (is_normal_close(code)) {
            log::info("ws", "client ", ud->peer, " disconnected");
        } else {
            log::warn("ws", "client ", ud->peer, " connection lost (code ", code,
                      reason.empty() ? "" : ": ", std::string(reason), ")");
        }
    };

    app.ws<ClientData>(cfg_.ws_path, std::move(behavior));
    app.any("/*", [](auto* res, auto* /*req*/) {
        res->writeStatus("404 Not Found")->end("Not found");
    });

    auto on_listen = [this](us_listen_socket_t* token) { listen_socket_ = token; };
    if (addr.host.empty()) app.listen(addr.port, on_listen);
    else                   app.listen(addr.host, addr.port, on_listen);

    if (!listen_socket_) {
        log::error("ws", "cannot listen on ", cfg_.listen_address);
        return 1;
    }
    log::info("ws", "listening on ", cfg_.listen_address, " path ", cfg_.ws_path);

    loop_.store(uWS::Loop::get());
    if (stop_requested_.load()) stop();   // stop() raced ahead of the loop

    app.run();

    loop_.store(nullptr);
    log::info("ws", "event loop finished");
    return 0;
}

} // namespace serialhub
