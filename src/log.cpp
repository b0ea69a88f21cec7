// ============================================================================
// log.cpp: implementation for log.hpp
// ============================================================================

#include "serialhub/log.hpp"

#include <atomic>
#include <iostream>
#include <mutex>

namespace serialhub::log {

static std::atomic<int> g_level{static_cast<int>(Level::Info)};
static std::mutex       g_write_mtx;   // one line at a time on stderr

void set_level(Level lvl) { g_level.store(static_cast<int>(lvl)); }

Level level() { return static_cast<Level>(g_level.load()); }

bool enabled(Level lvl) { return static_cast<int>(lvl) >= g_level.load(); }

void write(Level lvl, const char* component, const std::string& text) {
    const char* tag = "";
    switch (lvl) {
        case Level::Debug: tag = "debug: ";   break;
        case Level::Warn:  tag = "warning: "; break;
        case Level::Error: tag = "error: ";   break;
        case Level::Info:  break;
    }
    std::lock_guard<std::mutex> lk(g_write_mtx);
    std::cerr << "[" << (component ? component : "-") << "] " << tag << text << "\n";
}

} // namespace serialhub::log
