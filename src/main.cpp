/**
 * @file main.cpp
 * @brief serialhub daemon: relay one serial device to any number of WebSocket clients.
 *
 * Responsibilities:
 *  - Parse options (CLI11), overlaying them on an optional `--config` JSON file.
 *  - Build the Relay with the real serial opener and port lister.
 *  - Serve WebSocket clients until SIGINT/SIGTERM, then shut down in order.
 *
 * Exit codes:
 *  - 0  clean shutdown (or `--list-ports` done)
 *  - 1  runtime failure (cannot bind the listen address)
 *  - 2  bad usage or configuration
 *
 * Errors on the way in are reported as a single `status=error reason=...` line on stderr.
 */

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>

#include "CLI/CLI.hpp"

#include "serialhub/log.hpp"
#include "serialhub/port_registry.hpp"
#include "serialhub/relay.hpp"
#include "serialhub/relay_config.hpp"
#include "serialhub/serial_io.hpp"
#include "serialhub/ws_server.hpp"

using namespace serialhub;

static std::atomic<bool> g_shutdown{false};

extern "C" void on_signal(int) { g_shutdown.store(true); }

int main(int argc, char** argv) {
  CLI::App app{"serialhub: serial device to WebSocket relay"};

  RelayConfig defaults;
  std::string address   = defaults.listen_address;
  std::string path      = defaults.ws_path;
  std::string port;
  int         baud      = 115200;
  int         backoff_ms         = defaults.timing.backoff_ms;
  int         reconnect_pause_ms = defaults.timing.reconnect_pause_ms;
  int         scan_interval_ms   = defaults.scan_interval_ms;
  int         read_poll_ms       = defaults.timing.read_poll_ms;
  int         read_idle_ms       = defaults.timing.read_idle_ms;
  std::size_t read_buffer        = defaults.timing.read_buffer;
  unsigned    max_backpressure   = defaults.max_backpressure;
  std::string config_path;
  bool list_only = false, verbose = false, quiet = false;

  // ---- endpoint ----
  CLI::Option* opt_address = app.add_option("--address", address, "Listen address (host:port, :port, [v6]:port)");
  CLI::Option* opt_path    = app.add_option("--path", path, "WebSocket endpoint path");

  // ---- device ----
  CLI::Option* opt_port = app.add_option("--port", port, "Serial device to open at startup (e.g. /dev/ttyACM0)");
  CLI::Option* opt_baud = app.add_option("--baud", baud, "Baud rate for --port");

  // ---- tuning ----
  CLI::Option* opt_backoff = app.add_option("--backoff-ms", backoff_ms, "Pause before retrying a failed port");
  CLI::Option* opt_pause   = app.add_option("--reconnect-pause-ms", reconnect_pause_ms,
                                            "Pause between closing and reopening on reconfigure");
  CLI::Option* opt_scan    = app.add_option("--scan-interval-ms", scan_interval_ms, "Port list poll interval");
  CLI::Option* opt_poll    = app.add_option("--read-poll-ms", read_poll_ms, "Max wait per serial read attempt");
  CLI::Option* opt_idle    = app.add_option("--read-idle-ms", read_idle_ms, "Reader sleep when the device is quiet");
  CLI::Option* opt_rbuf    = app.add_option("--read-buffer", read_buffer, "Bytes per serial read");
  CLI::Option* opt_bp      = app.add_option("--max-backpressure", max_backpressure,
                                            "Bytes buffered per client before it is dropped");

  // ---- misc ----
  app.add_option("--config", config_path, "JSON config file (options on the command line win)")
      ->check(CLI::ExistingFile);
  app.add_flag("--list-ports", list_only, "Print the candidate serial ports and exit");
  auto* opt_verbose = app.add_flag("--verbose,-v", verbose, "Debug logging (every device line)");
  app.add_flag("--quiet,-q", quiet, "Warnings and errors only")->excludes(opt_verbose);

  CLI11_PARSE(app, argc, argv);

  if (list_only) {
    for (const auto& p : list_ports()) std::cout << p << "\n";
    return 0;
  }

  RelayConfig cfg;
  std::string err;
  if (!config_path.empty() && !load_config_file(config_path, cfg, err)) {
    std::cerr << "status=error reason=" << err << " file=" << config_path << "\n";
    return 2;
  }

  if (opt_address->count()) cfg.listen_address = address;
  if (opt_path->count())    cfg.ws_path = path;
  if (opt_port->count())    cfg.initial.port = port;
  if (opt_baud->count() || cfg.initial.baud_rate == 0) cfg.initial.baud_rate = baud;
  if (opt_backoff->count()) cfg.timing.backoff_ms = backoff_ms;
  if (opt_pause->count())   cfg.timing.reconnect_pause_ms = reconnect_pause_ms;
  if (opt_scan->count())    cfg.scan_interval_ms = scan_interval_ms;
  if (opt_poll->count())    cfg.timing.read_poll_ms = read_poll_ms;
  if (opt_idle->count())    cfg.timing.read_idle_ms = read_idle_ms;
  if (opt_rbuf->count())    cfg.timing.read_buffer = read_buffer;
  if (opt_bp->count())      cfg.max_backpressure = max_backpressure;
  if (verbose) cfg.log_level = log::Level::Debug;
  if (quiet)   cfg.log_level = log::Level::Warn;

  if (!validate_config(cfg, err)) {
    std::cerr << "status=error reason=" << err << "\n";
    return 2;
  }

  log::set_level(cfg.log_level);

  std::signal(SIGINT, on_signal);
  std::signal(SIGTERM, on_signal);
  std::signal(SIGPIPE, SIG_IGN);

  Relay relay(cfg, &open_serial, &list_ports);
  relay.start();

  WsServer server(relay, cfg);

  // Signal handlers only set the flag; this thread turns it into a loop shutdown.
  std::atomic<bool> serving{true};
  std::thread shutdown_watch([&] {
    while (serving.load() && !g_shutdown.load()) {
      std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }
    if (g_shutdown.load()) {
      log::info("main", "signal received, shutting down");
      server.stop();
    }
  });

  const int rc = server.run();

  serving.store(false);
  shutdown_watch.join();

  relay.stop();
  log::info("main", "stopped");
  return rc;
}
