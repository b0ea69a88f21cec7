#pragma once
/**
 * @file outbound_writer.hpp
 * @brief Single consumer that pushes client commands into the device, in order.
 *
 * Requests are taken from a FIFO one at a time; there is no batching and no
 * reordering. Each request produces exactly one status line:
 *  - no connection:  "Error: port is not open. Message not sent." (request dropped)
 *  - write failed:   "Error writing to serial port: <reason>"
 *  - written:        "Sent to serial port: <command>"
 *
 * Nothing is held back across a disconnect. The liveness check and the write
 * itself happen inside ByteSink::write_all, under the connection guard, so a
 * concurrent reconnect can never slip in between them.
 */

#include <atomic>
#include <cstdint>
#include <string>
#include <thread>

#include "serialhub/settings.hpp"
#include "serialhub/status_sink.hpp"
#include "serialhub/work_queue.hpp"

namespace serialhub {

enum class WriteStatus : uint8_t { Ok = 0, NotConnected = 1, Failed = 2 };

/// Write side of the physical connection.
class ByteSink {
public:
  virtual ~ByteSink() = default;
  virtual WriteStatus write_all(const std::string& data, std::string& err) = 0;
};

class OutboundWriter {
public:
  OutboundWriter(ByteSink& sink, StatusSink& status);
  ~OutboundWriter();

  OutboundWriter(const OutboundWriter&) = delete;
  OutboundWriter& operator=(const OutboundWriter&) = delete;

  void start();
  void stop();

  /// Queue a request; false once the writer is stopped.
  bool submit(OutboundRequest req);

  /// Perform one request synchronously and report it.
  WriteStatus process(const OutboundRequest& req);

  std::size_t pending() const { return queue_.size(); }

private:
  void run();

  ByteSink&                  sink_;
  StatusSink&                status_;
  WorkQueue<OutboundRequest> queue_;
  std::thread                worker_;
};

} // namespace serialhub
