#pragma once
/**
 * @file log.hpp
 * @brief One-line diagnostics for the relay daemon, safe to call from any task.
 *
 * @details
 * Every component of the relay runs on its own thread (event loop, supervisor,
 * reader, writer, broadcaster, ingress, port watcher). Plain `std::cerr <<`
 * chains from several threads interleave mid-line, so all diagnostics go
 * through here: the line is assembled first, then written under one mutex.
 *
 * Output shape (stderr):
 * @code
 *   [serial] Connected to serial port /dev/ttyACM0 at 115200 baud.
 *   [ws] warning: client 10.0.0.7 removed after failed delivery
 * @endcode
 *
 * Levels are coarse on purpose. `--verbose` turns on debug lines (every device
 * frame), `--quiet` keeps warnings and errors only.
 */

#include <sstream>
#include <string>

namespace serialhub::log {

enum class Level : int { Debug = 0, Info = 1, Warn = 2, Error = 3 };

void  set_level(Level lvl);
Level level();
bool  enabled(Level lvl);

/// Write one already-formatted line for @p component.
void write(Level lvl, const char* component, const std::string& text);

template <typename... Parts>
void emit(Level lvl, const char* component, const Parts&... parts) {
  if (!enabled(lvl)) return;
  std::ostringstream os;
  (os << ... << parts);
  write(lvl, component, os.str());
}

template <typename... Parts>
void debug(const char* component, const Parts&... parts) { emit(Level::Debug, component, parts...); }

template <typename... Parts>
void info(const char* component, const Parts&... parts) { emit(Level::Info, component, parts...); }

template <typename... Parts>
void warn(const char* component, const Parts&... parts) { emit(Level::Warn, component, parts...); }

template <typename... Parts>
void error(const char* component, const Parts&... parts) { emit(Level::Error, component, parts...); }

} // namespace serialhub::log
