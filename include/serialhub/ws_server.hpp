#pragma once
/**
 * @file ws_server.hpp
 * @brief WebSocket front door: one uWebSockets event loop serving every client.
 *
 * @details
 * The loop thread only does socket work. Inbound text frames are handed to
 * Relay::submit_payload() and routed elsewhere; outbound lines arrive from the
 * broadcaster thread through post_send(), which defers the actual send onto the
 * loop (uWS sockets are single-threaded).
 *
 * Per-client isolation comes from uWS buffering: send() never blocks, it queues.
 * A client whose queue passes `max_backpressure` bytes is closed, and its close
 * handler takes it out of the broadcast set.
 *
 * Origins are not checked; any page that can reach the address may connect.
 * Put the relay behind a reverse proxy if that matters.
 */

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>

#include "serialhub/relay.hpp"
#include "serialhub/relay_config.hpp"

namespace uWS { struct Loop; }
struct us_listen_socket_t;

namespace serialhub {

class WsServer {
public:
  WsServer(Relay& relay, const RelayConfig& cfg);
  ~WsServer();

  WsServer(const WsServer&) = delete;
  WsServer& operator=(const WsServer&) = delete;

  /**
   * @brief Bind and serve until stop().
   * @return 0 after a clean shutdown, 1 when the address cannot be bound.
   */
  int run();

  /// Close the listen socket and every client; safe from any thread.
  void stop();

  /// Queue @p text for one socket; safe from any thread. Dropped if the socket is gone.
  void post_send(uint64_t socket_id, std::string text);

private:
  struct SocketTable;

  void send_now(uint64_t socket_id, const std::string& text);
  void close_all();

  Relay&                       relay_;
  RelayConfig                  cfg_;
  std::unique_ptr<SocketTable> sockets_;
  std::atomic<uWS::Loop*>      loop_{nullptr};
  us_listen_socket_t*          listen_socket_{nullptr};   // loop thread only
  std::atomic<bool>            stop_requested_{false};
  uint64_t                     next_socket_id_{1};        // loop thread only
};

} // namespace serialhub
