#pragma once
/**
 * @file transport_linux_serial.hpp
 * @brief Linux tty port (header-only, termios already applied; non-blocking fd).
 *
 * Depends on: unistd.h, poll.h. The descriptor is opened and configured by
 * serialhub::open_serial() (serial_io.cpp); this class only moves bytes and
 * owns the fd from then on.
 */

#if !defined(__linux__)
#  error "transport_linux_serial.hpp is Linux-only."
#endif

#include "serialhub/transport/transport_base.hpp"
#include <string>
#include <unistd.h>
#include <poll.h>
#include <cerrno>
#include <cstring>

namespace serialhub::transport {

class LinuxSerial : public ISerialPort {
public:
  static constexpr int WRITE_STALL_MS = 2000;  // give up when the driver takes nothing for this long

  explicit LinuxSerial(int fd) : fd_(fd) {}

  ~LinuxSerial() override { close(); }

  LinuxSerial(const LinuxSerial&) = delete;
  LinuxSerial& operator=(const LinuxSerial&) = delete;

  RxResult recv(uint8_t* out, std::size_t cap, std::size_t& out_len, int timeout_ms) override {
    out_len = 0;
    if (fd_ < 0) { err_ = "port is closed"; return RxResult::Error; }
    if (cap == 0) return RxResult::None;

    pollfd pfd{fd_, POLLIN, 0};
    int pr = ::poll(&pfd, 1, timeout_ms);
    if (pr == 0) return RxResult::None;
    if (pr < 0) {
      if (errno == EINTR) return RxResult::None;
      err_ = std::strerror(errno);
      return RxResult::Error;
    }
    if (pfd.revents & (POLLERR | POLLNVAL)) { err_ = "device reported an error"; return RxResult::Error; }

    ssize_t r = ::read(fd_, out, cap);
    if (r > 0) { out_len = static_cast<std::size_t>(r); return RxResult::Ok; }
    if (r < 0 && (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR)) return RxResult::None;
    // poll said readable but read gave 0: hangup, the device went away
    err_ = (r == 0) ? std::string("device disconnected (EOF)") : std::string(std::strerror(errno));
    return RxResult::Error;
  }

  TxResult send(const uint8_t* data, std::size_t len) override {
    if (fd_ < 0) { err_ = "port is closed"; return TxResult::Error; }
    std::size_t done = 0;
    while (done < len) {
      ssize_t w = ::write(fd_, data + done, len - done);
      if (w > 0) { done += static_cast<std::size_t>(w); continue; }
      if (w < 0 && errno == EINTR) continue;
      if (w < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
        pollfd pfd{fd_, POLLOUT, 0};
        int pr = ::poll(&pfd, 1, WRITE_STALL_MS);
        if (pr > 0 && !(pfd.revents & (POLLERR | POLLHUP | POLLNVAL))) continue;
        err_ = (pr == 0) ? std::string("write timed out") : std::string("device not writable");
        return TxResult::Error;
      }
      err_ = (w == 0) ? std::string("device accepted no data") : std::string(std::strerror(errno));
      return TxResult::Error;
    }
    return TxResult::Ok;
  }

  void close() override {
    if (fd_ >= 0) { ::close(fd_); fd_ = -1; }
  }

  std::string last_error() const override { return err_; }
  const char* name() const override { return "linux-serial"; }

private:
  int         fd_{-1};
  std::string err_;
};

} // namespace serialhub::transport
