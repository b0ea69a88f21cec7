#pragma once
/**
 * @page sh-port-registry serialhub Port Registry
 * @file port_registry.hpp
 * @brief Discovery of candidate serial devices and change tracking for clients.
 *
 * @details
 * PURPOSE
 * -------
 * Clients pick the port to relay from a list. This header provides that list and
 * keeps it current: a watcher re-scans on a fixed interval and tells every client
 * when devices come and go. The relay core only consumes the result (a set of
 * names); how the names are found stays in here.
 *
 * WHAT THIS DOES
 * --------------
 * - list_ports() scans the host:
 *   - prefers stable symlinks under `/dev/serial/by-id`, resolved to the canonical
 *     device (the same tty never shows up twice);
 *   - falls back to `/dev/ttyACM*` and `/dev/ttyUSB*` when by-id is absent.
 *   The result is sorted, so two scans of an unchanged system compare equal.
 * - PortWatcher polls a lister every `interval_ms` and, when the list changes:
 *   - broadcasts "Port list updated: [a b]" and the JSON array of names;
 *   - if the selected port disappeared and the list shrank, resets the settings
 *     and broadcasts "Current port is no longer available. Settings reset.";
 *   - if the selected port is missing, asks the connection manager to reconnect.
 * - PortWatcher::announce() broadcasts the current list on demand (new client).
 *
 * RELIABILITY AND TRADE-OFFS
 * --------------------------
 * - No libudev dependency: plain filesystem inspection and glob(3).
 * - No probing. A listed port is a tty that exists, not a device known to answer.
 * - Polling, not hotplug events: a 2 s cadence is plenty for a human plugging cables.
 *
 * EXAMPLE
 * -------
 * @code
 *   for (const auto& p : serialhub::list_ports()) std::cout << p << "\n";
 * @endcode
 */

#include <atomic>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "serialhub/status_sink.hpp"

namespace serialhub {

class ConnectionManager;

using PortLister = std::function<std::vector<std::string>()>;

/// Candidate serial devices on this Linux host, sorted and de-duplicated.
std::vector<std::string> list_ports();

/// Human-readable list, e.g. "[/dev/ttyACM0 /dev/ttyUSB0]".
std::string format_port_list(const std::vector<std::string>& ports);

/// JSON array of port names, e.g. ["/dev/ttyACM0","/dev/ttyUSB0"].
std::string port_list_json(const std::vector<std::string>& ports);

class PortWatcher {
public:
  PortWatcher(ConnectionManager& connection, StatusSink& status, PortLister lister, int interval_ms);
  ~PortWatcher();

  PortWatcher(const PortWatcher&) = delete;
  PortWatcher& operator=(const PortWatcher&) = delete;

  void start();
  void stop();

  /// Broadcast the current list (two frames: summary line, JSON array).
  void announce();

  /**
   * @brief One scan-and-react step.
   *
   * The very first scan (when start() has not run) only records the baseline.
   * @return true when the list differed from the previous scan.
   */
  bool poll_once();

private:
  void run();
  void publish_list(const std::vector<std::string>& ports);

  ConnectionManager& connection_;
  StatusSink&        status_;
  PortLister         lister_;
  int                interval_ms_;

  std::vector<std::string> last_;   // touched by the watcher thread only (or poll_once in tests)
  bool                     primed_{false};

  std::mutex              mtx_;
  std::condition_variable cv_;
  bool                    stopping_{false};
  std::thread             thread_;
};

} // namespace serialhub
