#pragma once
/**
 * @file inbound_reader.hpp
 * @brief Drains the open device through the LineFramer into the broadcast sink.
 *
 * @details
 * One reader runs per opened connection. It never holds the port itself: every
 * read goes through a ByteSource (the connection manager), which checks under
 * its guard that the generation the reader was started for is still the live
 * one. Once a newer connection has been installed the source answers Stale and
 * the reader simply ends, so a closed or replaced handle is never touched.
 *
 * Lifecycle:
 * @code
 *   start() ──► loop: read_some(gen) ─┬─ Data  → framer → publish(line, Device)
 *                                     ├─ Idle  → sleep idle_ms (guard released)
 *                                     ├─ Stale → exit quietly
 *                                     └─ Error → publish status, on_error(gen, why), exit
 * @endcode
 *
 * The reader does not reconnect. Recovery belongs to the manager's supervising loop.
 */

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <thread>

#include "serialhub/framer.hpp"
#include "serialhub/status_sink.hpp"

namespace serialhub {

enum class ReadStatus : uint8_t { Data = 0, Idle = 1, Stale = 2, Error = 3 };

/// Read side lent to a reader for exactly one connection generation.
class ByteSource {
public:
  virtual ~ByteSource() = default;
  virtual ReadStatus read_some(uint64_t generation, uint8_t* out, std::size_t cap,
                               std::size_t& out_len, std::string& err) = 0;
};

class InboundReader {
public:
  using ErrorFn = std::function<void(uint64_t generation, const std::string& reason)>;

  struct Options {
    std::size_t buffer_size{128};
    int         idle_ms{10};
  };

  InboundReader(ByteSource& source, StatusSink& sink, uint64_t generation,
                Options opts, ErrorFn on_error);
  ~InboundReader();

  InboundReader(const InboundReader&) = delete;
  InboundReader& operator=(const InboundReader&) = delete;

  void start();
  void request_stop() { stop_.store(true); }
  void join();

  /// Read loop on the calling thread; returns when stopped, stale, or failed.
  void run();

private:
  ByteSource&       source_;
  StatusSink&       sink_;
  const uint64_t    generation_;
  Options           opts_;
  ErrorFn           on_error_;
  LineFramer        framer_;
  std::atomic<bool> stop_{false};
  std::thread       thread_;
};

} // namespace serialhub
