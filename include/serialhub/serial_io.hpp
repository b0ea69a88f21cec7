#pragma once
/**
 * @page sh-serial-io serialhub Serial I/O
 * @file serial_io.hpp
 * @brief Open a Linux TTY in raw mode and hand it over as a transport::ISerialPort.
 *
 * @details
 * PURPOSE
 * -------
 * This is the production opener the connection manager is built with. It owns
 * the termios work (raw 8N1, no flow control, speed table) and nothing else; once
 * the descriptor is configured it is wrapped in transport::LinuxSerial and the
 * caller never sees a raw fd.
 *
 * FAILURE REPORTING
 * -----------------
 * open_serial() never throws. A null return comes with a short reason in @p err
 * ("No such file or directory", "Permission denied", "unsupported baud rate 12345",
 * "port is busy"). The connection manager folds that reason into the status line
 * clients see, so keep it human-readable.
 *
 * OPERATIONAL NOTES
 * -----------------
 * - Permissions: the service user needs the dialout group (or a udev rule).
 * - Exclusive access: the port is put in TIOCEXCL mode after opening, so a second
 *   relay or a terminal program cannot open it behind our back.
 * - Unlike a fixed fallback table, an unknown baud rate is an open failure. A
 *   silently wrong speed produces garbage that is much harder to diagnose.
 *
 * EXAMPLE
 * -------
 * @code
 *   std::string err;
 *   auto port = serialhub::open_serial({"/dev/ttyACM0", 115200}, err);
 *   if (!port) { std::cerr << "open failed: " << err << "\n"; }
 * @endcode
 */

#include <memory>
#include <string>

#include "serialhub/settings.hpp"
#include "serialhub/transport/transport_base.hpp"

namespace serialhub {

/// True when @p baud maps to a termios speed on this host.
bool is_supported_baud(int baud);

/**
 * @brief Open and configure the device named by @p settings.
 *
 * @param settings  Port path and baud rate. An unconfigured (empty) port fails.
 * @param err       Receives the reason on failure; untouched on success.
 * @return Open port, or nullptr on failure.
 */
std::unique_ptr<transport::ISerialPort> open_serial(const ConnectionSettings& settings, std::string& err);

} // namespace serialhub
