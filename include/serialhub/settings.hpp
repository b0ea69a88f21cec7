#pragma once
/**
 * @file settings.hpp
 * @brief Value types shared by the relay components.
 *
 * - `ConnectionSettings`: which device, at what speed. Replaced wholesale,
 *   never patched field by field. An empty port means "unconfigured".
 * - `ConnectionTiming`: the delays the connection lifecycle runs on. All of
 *   them are tunables, none is a protocol constant.
 * - `OutboundRequest`: one command on its way to the device, already
 *   newline-terminated.
 */

#include <cstddef>
#include <string>

namespace serialhub {

struct ConnectionSettings {
  std::string port;      ///< device path, e.g. "/dev/ttyACM0" or "COM3"; empty = unconfigured
  int         baud_rate{0};

  bool configured() const { return !port.empty(); }
};

inline bool operator==(const ConnectionSettings& a, const ConnectionSettings& b) {
  return a.port == b.port && a.baud_rate == b.baud_rate;
}
inline bool operator!=(const ConnectionSettings& a, const ConnectionSettings& b) { return !(a == b); }

struct ConnectionTiming {
  int         reconnect_pause_ms{1000}; ///< pause between close and re-open, lets the OS release the tty
  int         backoff_ms{5000};         ///< fixed delay between automatic open attempts
  int         read_poll_ms{100};        ///< longest a single read attempt may hold the connection guard
  int         read_idle_ms{10};         ///< reader sleep after an empty read, outside the guard
  std::size_t read_buffer{128};         ///< bytes per read attempt
};

struct OutboundRequest {
  std::string payload;   ///< bytes for the device, delimiter included
};

} // namespace serialhub
