#pragma once
/**
 * @file connection_manager.hpp
 * @brief Owner of the one physical serial connection: open, close, reconnect, supervise.
 *
 * @details
 * ## Field Brief
 * There is exactly one device per relay and exactly one handle to it. Clients can
 * swap the port or baud rate at any time, the cable can be yanked at any time, and
 * several threads want to read or write in between. The ConnectionManager is the
 * single place where the handle lives; everybody else borrows it through
 * read_some()/write_all(), which run under the same guard as every replacement.
 *
 * ---
 *
 * @par State machine
 * ```
 *   Unconfigured ──open()──► Opening ──ok──► Open ──close──► Closing ──► Unconfigured
 *        ▲                      │                                            │
 *        └──────── failed ──────┘           configure()/reconnect() from any state
 * ```
 * `Unconfigured` doubles as "no connection right now"; settings() tells whether a
 * port is selected at all.
 *
 * ---
 *
 * @par Invariants
 * - At most one port exists. open() closes the previous port before creating the next.
 * - Settings replacement and port replacement happen inside one guarded section, so no
 *   reader or writer ever sees a port built from stale settings.
 * - Each installed port gets a new generation number. A reader bound to an older
 *   generation is answered Stale and leaves without touching the handle.
 *
 * ---
 *
 * @par Recovery
 * The supervising loop (start()) is the only source of automatic recovery:
 * - no connection and a port is configured → wait `backoff_ms`, try open();
 * - connection open → wait for its reader to report a terminal read error, wait
 *   `backoff_ms`, reconnect() (skipped when a newer connection already replaced it).
 * Delays are fixed; there is no exponential growth.
 *
 * ---
 *
 * @par Example
 * @code
 *   serialhub::Broadcaster bus;
 *   serialhub::ConnectionManager conn(bus, &serialhub::open_serial);
 *   conn.start();
 *   conn.configure({"/dev/ttyACM0", 115200});   // close, pause, open, start reader
 *   std::string err;
 *   conn.write_all("PING\n", err);
 *   conn.stop();
 * @endcode
 */

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "serialhub/inbound_reader.hpp"
#include "serialhub/outbound_writer.hpp"
#include "serialhub/settings.hpp"
#include "serialhub/status_sink.hpp"
#include "serialhub/transport/transport_base.hpp"

namespace serialhub {

class ConnectionManager : public ByteSource, public ByteSink {
public:
  /// Creates a port for the given settings, or returns nullptr with a reason in err.
  using Opener = std::function<std::unique_ptr<transport::ISerialPort>(const ConnectionSettings&, std::string& err)>;

  enum class State : uint8_t { Unconfigured = 0, Opening = 1, Open = 2, Closing = 3 };
  enum class ConfigureResult : uint8_t { Changed = 0, Unchanged = 1 };

  ConnectionManager(StatusSink& status, Opener opener, ConnectionTiming timing = {});
  ~ConnectionManager() override;

  ConnectionManager(const ConnectionManager&) = delete;
  ConnectionManager& operator=(const ConnectionManager&) = delete;

  /// Launch the supervising loop.
  void start();
  /// Stop supervising, close the port, join every reader. Idempotent.
  void stop();

  /**
   * @brief Replace the settings; reconnect when they differ.
   *
   * Identical settings are a no-op reported as "unchanged". Different settings are
   * stored, announced, and followed by a reconnect, all under the connection guard.
   * Blocks for the reconnect pause.
   */
  ConfigureResult configure(const ConnectionSettings& settings);

  /// Close whatever is open, pause, open again with the current settings.
  void reconnect();

  /// Open with the current settings if nothing is open. Returns true when a port is open afterwards.
  bool open();

  /**
   * @brief React to a fresh port list in one guarded step.
   *
   * Nothing happens when no port is selected or the selected port is still in
   * @p ports. Otherwise, when @p shrank, the selection is forgotten and
   * "Current port is no longer available. Settings reset." is reported; then
   * the connection is rebuilt, which reports its own outcome.
   *
   * @return true when the selected port was missing and a reconnect ran.
   */
  bool drop_if_missing(const std::vector<std::string>& ports, bool shrank);

  ConnectionSettings settings() const;
  bool               is_open() const;
  State              state() const;
  uint64_t           generation() const;

  // ByteSource: one guarded read attempt for a reader of @p generation.
  ReadStatus read_some(uint64_t generation, uint8_t* out, std::size_t cap,
                       std::size_t& out_len, std::string& err) override;

  // ByteSink: liveness check and full write under the guard.
  WriteStatus write_all(const std::string& data, std::string& err) override;

private:
  bool open_locked();
  void close_locked();
  void reconnect_locked();
  void start_reader_locked();
  void set_state_locked(State next);
  void mark_open(bool open);

  void on_reader_error(uint64_t generation, const std::string& reason);
  void supervise();
  /// Sleep that ends early on stop(); false when stopping.
  bool pause_for(int ms);
  void reap_readers();

  StatusSink&      status_;
  Opener           opener_;
  ConnectionTiming timing_;

  // ---- connection guard: settings, port, generation, readers ----
  mutable std::mutex                          guard_;
  ConnectionSettings                          settings_;
  std::unique_ptr<transport::ISerialPort>     port_;
  uint64_t                                    generation_{0};
  State                                       state_{State::Unconfigured};
  std::unique_ptr<InboundReader>              reader_;
  std::vector<std::unique_ptr<InboundReader>> retired_;

  // ---- supervisor signalling (lock order: guard_ before signal_mtx_) ----
  std::mutex              signal_mtx_;
  std::condition_variable signal_cv_;
  bool                    stopping_{false};
  bool                    reader_failed_{false};
  uint64_t                failed_generation_{0};
  std::atomic<bool>       open_flag_{false};

  std::atomic<bool> stopped_{false};
  std::thread       supervisor_;
};

const char* to_string(ConnectionManager::State s);

} // namespace serialhub
