#pragma once
/**
 * @file transport_base.hpp
 * @brief Minimal device-port interface the connection manager drives.
 *
 * Header-only on purpose. The relay core never touches file descriptors;
 * it holds an ISerialPort and calls these few verbs. Production uses
 * LinuxSerial, tests plug in a scripted fake.
 */

#include <cstddef>
#include <cstdint>
#include <string>

namespace serialhub::transport {

// Return codes kept simple; the detail lives in last_error().
enum class TxResult : uint8_t { Ok=0, Error=1 };
enum class RxResult : uint8_t { None=0, Ok=1, Error=2 };

/**
 * @brief Port trait the relay relies on.
 *
 * Contract:
 *  - recv(buf,cap,len,timeout) waits at most timeout_ms for data. None means
 *    "nothing yet, try again"; Error is terminal for this port (unplug, EOF).
 *  - send(buf,len) writes all bytes or reports Error.
 *  - close() is idempotent; after it every call reports Error.
 *  - last_error() describes the most recent Error in plain words.
 *  - name() is a short identifier for logs.
 *
 * Not thread-safe. The connection manager serializes every call under its guard.
 */
class ISerialPort {
public:
  virtual ~ISerialPort() = default;
  virtual RxResult    recv(uint8_t* out, std::size_t cap, std::size_t& out_len, int timeout_ms) = 0;
  virtual TxResult    send(const uint8_t* data, std::size_t len) = 0;
  virtual void        close() = 0;
  virtual std::string last_error() const = 0;
  virtual const char* name() const = 0;
};

} // namespace serialhub::transport
