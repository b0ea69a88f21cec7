// ============================================================================
// serial_io.cpp: implementation for serial_io.hpp
// For API/overview see the matching .hpp.
// ============================================================================

/**
 * @file serial_io.cpp
 */

#include "serialhub/serial_io.hpp"
#include "serialhub/transport/transport_linux_serial.hpp"
#include "serialhub/log.hpp"

// POSIX / termios headers for low-level serial port handling
#include <fcntl.h>         // ::open flags (O_RDWR, O_NOCTTY, etc.)
#include <unistd.h>        // ::close
#include <termios.h>       // termios struct + raw mode helpers
#include <sys/ioctl.h>     // TIOCEXCL
#include <cerrno>
#include <cstring>         // strerror

namespace serialhub {

// ---------------------------------------------------------------------------
// baud_to_speed()
// ---------------
// Map an integer baud rate to its termios constant. Only rates the C library
// defines are accepted; the higher ones are guarded because not every libc
// or architecture carries them.
// ---------------------------------------------------------------------------
static bool baud_to_speed(int baud, speed_t& out) {
    switch (baud) {
        case 50:      out = B50;      return true;
        case 75:      out = B75;      return true;
        case 110:     out = B110;     return true;
        case 134:     out = B134;     return true;
        case 150:     out = B150;     return true;
        case 200:     out = B200;     return true;
        case 300:     out = B300;     return true;
        case 600:     out = B600;     return true;
        case 1200:    out = B1200;    return true;
        case 1800:    out = B1800;    return true;
        case 2400:    out = B2400;    return true;
        case 4800:    out = B4800;    return true;
        case 9600:    out = B9600;    return true;
        case 19200:   out = B19200;   return true;
        case 38400:   out = B38400;   return true;
        case 57600:   out = B57600;   return true;
        case 115200:  out = B115200;  return true;
#ifdef B230400
        case 230400:  out = B230400;  return true;
#endif
#ifdef B460800
        case 460800:  out = B460800;  return true;
#endif
#ifdef B500000
        case 500000:  out = B500000;  return true;
#endif
#ifdef B921600
        case 921600:  out = B921600;  return true;
#endif
#ifdef B1000000
        case 1000000: out = B1000000; return true;
#endif
#ifdef B2000000
        case 2000000: out = B2000000; return true;
#endif
        default: return false;
    }
}


// ---------------------------------------------------------------------------
// set_raw()
// ----------
// Configure a file descriptor for raw serial I/O at the given speed.
// - Disables echo, line buffering, and flow control (8N1 raw mode).
// - Sets VMIN=0, VTIME=0 (non-blocking reads; poll() handles timing).
// - Flushes both input/output buffers after applying settings.
//
// Returns: true on success, false if tcgetattr/tcsetattr fails.
// ---------------------------------------------------------------------------
static bool set_raw(int fd, speed_t speed) {
    termios tio{};
    if (tcgetattr(fd, &tio) != 0) return false;   // fetch current settings

    cfmakeraw(&tio);                              // wipe into raw 8N1 mode
    if (cfsetispeed(&tio, speed) != 0) return false;
    if (cfsetospeed(&tio, speed) != 0) return false;

    tio.c_cflag |= (CLOCAL | CREAD);              // ignore modem ctrl, enable read
    tio.c_cflag &= ~CRTSCTS;                      // disable hardware flow control
    tio.c_cc[VMIN]  = 0;                          // no minimum chars per read
    tio.c_cc[VTIME] = 0;                          // no interbyte timer (we use poll)

    if (tcsetattr(fd, TCSANOW, &tio) != 0) return false;  // apply immediately
    tcflush(fd, TCIOFLUSH);                       // drop whatever was queued before us
    return true;
}


bool is_supported_baud(int baud) {
    speed_t sp = 0;
    return baud_to_speed(baud, sp);
}


// ---------------------------------------------------------------------------
// open_serial()
// -------------
// Open and initialize a serial port from a settings snapshot.
// - O_NOCTTY (don't steal controlling terminal) and O_NONBLOCK (poll drives reads).
// - TIOCEXCL so nobody else opens the tty while we hold it.
// - set_raw() for 8N1 raw mode at the requested speed.
//
// Returns: open port or nullptr with err filled in.
// ---------------------------------------------------------------------------
std::unique_ptr<transport::ISerialPort> open_serial(const ConnectionSettings& settings, std::string& err) {
    if (!settings.configured()) { err = "no port selected"; return nullptr; }

    speed_t sp = 0;
    if (!baud_to_speed(settings.baud_rate, sp)) {
        err = "unsupported baud rate " + std::to_string(settings.baud_rate);
        return nullptr;
    }

    int fd = ::open(settings.port.c_str(), O_RDWR | O_NOCTTY | O_NONBLOCK);
    if (fd < 0) { err = std::strerror(errno); return nullptr; }

    if (::ioctl(fd, TIOCEXCL) != 0) {
        // EBUSY here means another process already holds the line exclusively
        const int e = errno;
        ::close(fd);
        err = (e == EBUSY) ? std::string("port is busy") : std::string(std::strerror(e));
        return nullptr;
    }

    if (!set_raw(fd, sp)) {
        const int e = errno;
        ::close(fd);
        err = std::string("cannot configure port: ") + std::strerror(e);
        return nullptr;
    }

    log::debug("serial", "opened ", settings.port, " fd=", fd, " baud=", settings.baud_rate);
    return std::make_unique<transport::LinuxSerial>(fd);
}

} // namespace serialhub
