#pragma once
/**
 * @file status_sink.hpp
 * @brief Where components drop text meant for every connected client.
 *
 * The Broadcaster is the production sink. Components only see this interface,
 * which keeps them testable with a recording sink and keeps the include graph
 * flat (reader/writer/manager never need the client set).
 */

#include <cstdint>
#include <string>

namespace serialhub {

/// Origin of a broadcast line. Clients receive plain text either way.
enum class Source : uint8_t { Status = 0, Device = 1 };

class StatusSink {
public:
  virtual ~StatusSink() = default;

  /// Queue @p text for fan-out. Must not block on client I/O.
  virtual void publish(std::string text, Source source) = 0;
};

} // namespace serialhub
