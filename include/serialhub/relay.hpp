#pragma once
/**
 * @file relay.hpp
 * @brief Wires the relay tasks together; transport-agnostic on the client side.
 *
 * @details
 * ```
 *   client text ─► submit_payload() ─► ingress queue ─► Router ─┬─► ConnectionManager.configure()
 *                                                                └─► OutboundWriter ─► device
 *   device bytes ─► InboundReader ─► LineFramer ─┐
 *   status lines (manager, writer, router, ports)┴─► Broadcaster ─► every Client
 * ```
 * Tasks owned here: broadcaster worker, outbound writer, connection supervisor
 * (plus one reader per open connection), port watcher, ingress worker.
 *
 * The ingress worker keeps the client transport's event loop from ever blocking
 * on a reconfiguration (which pauses for the OS to release the tty), and routes
 * every frame in arrival order.
 */

#include <string>
#include <thread>

#include "serialhub/broadcaster.hpp"
#include "serialhub/connection_manager.hpp"
#include "serialhub/outbound_writer.hpp"
#include "serialhub/port_registry.hpp"
#include "serialhub/relay_config.hpp"
#include "serialhub/router.hpp"
#include "serialhub/work_queue.hpp"

namespace serialhub {

class Relay {
public:
  Relay(const RelayConfig& cfg, ConnectionManager::Opener opener, PortLister lister);
  ~Relay();

  Relay(const Relay&) = delete;
  Relay& operator=(const Relay&) = delete;

  /// Start every task, then apply the configured initial settings (if any).
  void start();
  /// Stop intake first, then the device side, then drain the broadcaster. Idempotent.
  void stop();

  /// Queue one client text frame for routing; false after stop().
  bool submit_payload(std::string text);

  /// A client joined: everyone gets the current port list.
  void client_connected();

  Broadcaster&       broadcaster() { return broadcaster_; }
  ConnectionManager& connection()  { return connection_; }
  OutboundWriter&    writer()      { return writer_; }
  PortWatcher&       ports()       { return watcher_; }

private:
  void run_ingress();

  RelayConfig       cfg_;
  Broadcaster       broadcaster_;
  ConnectionManager connection_;
  OutboundWriter    writer_;
  Router            router_;
  PortWatcher       watcher_;

  WorkQueue<std::string> ingress_;
  std::thread            ingress_worker_;
  bool                   started_{false};
  bool                   stopped_{false};
};

} // namespace serialhub
