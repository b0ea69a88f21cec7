#pragma once
/**
 * @file relay_config.hpp
 * @brief Process configuration: listen address, endpoint, initial port, timings.
 *
 * Sources, lowest precedence first:
 *   1. built-in defaults (below),
 *   2. a JSON file given with `--config` (keys listed in apply_config_json()),
 *   3. explicit command-line options.
 *
 * Nothing is persisted. Settings changed by clients at runtime live in the
 * connection manager and are gone on restart.
 *
 * Example file:
 * @code
 *   {
 *     "address": "127.0.0.1:8080",
 *     "path": "/serialmonitor",
 *     "port": "/dev/ttyACM0",
 *     "baudRate": 115200,
 *     "backoff_ms": 5000,
 *     "log_level": "info"
 *   }
 * @endcode
 */

#include <cstddef>
#include <string>

#include "nlohmann/json.hpp"

#include "serialhub/log.hpp"
#include "serialhub/settings.hpp"

namespace serialhub {

/// Largest accepted bytes-per-read; the reader allocates this much per connection.
constexpr std::size_t MAX_READ_BUFFER = 65536;

struct ListenAddress {
  std::string host;      ///< empty = all interfaces
  int         port{8080};
};

struct RelayConfig {
  std::string        listen_address{":8080"};
  std::string        ws_path{"/serialmonitor"};
  ConnectionSettings initial;                    ///< applied at startup when a port is given
  ConnectionTiming   timing;
  int                scan_interval_ms{2000};
  unsigned           max_backpressure{1u << 20}; ///< bytes queued per client before sends are dropped
  log::Level         log_level{log::Level::Info};
};

/// Parse "host:port", ":port" or "[v6]:port". Port must be 1..65535.
bool parse_listen_address(const std::string& text, ListenAddress& out, std::string& err);

/// "debug" | "info" | "warn" | "error".
bool parse_log_level(const std::string& text, log::Level& out);

/// Overlay the keys present in @p j onto @p cfg. Unknown keys are ignored with a warning.
bool apply_config_json(const nlohmann::json& j, RelayConfig& cfg, std::string& err);

/// Read and apply a JSON config file.
bool load_config_file(const std::string& path, RelayConfig& cfg, std::string& err);

/// Range checks across the whole configuration.
bool validate_config(const RelayConfig& cfg, std::string& err);

} // namespace serialhub
