// ============================================================================
// port_registry.cpp: implementation for port_registry.hpp
// For API/overview see the matching .hpp. For usage examples, check tests/.
// ============================================================================

/**
 * @file port_registry.cpp
 */

#include "serialhub/port_registry.hpp"
#include "serialhub/connection_manager.hpp"  // drop_if_missing()
#include "serialhub/log.hpp"

#include "nlohmann/json.hpp"

#include <algorithm>          // std::sort, std::unique
#include <chrono>
#include <filesystem>         // std::filesystem for walking /dev/serial/by-id
#include <glob.h>             // glob(3) for tty fallbacks when /dev/serial/by-id is absent
#include <system_error>       // std::error_code for non-throwing filesystem ops

namespace fs = std::filesystem;
namespace serialhub {

// -------- helpers --------

/*
 * append_glob()
 * -------------
 * Append results of a glob() pattern to a vector of strings.
 *
 * Pitfall:
 * - glob() allocates; always globfree() to avoid leaks.
 */
static void append_glob(std::vector<std::string>& out, const char* pattern) {
    glob_t g{};
    if (glob(pattern, 0, nullptr, &g) == 0) {
        for (size_t i = 0; i < g.gl_pathc; ++i)
            out.emplace_back(g.gl_pathv[i]);
    }
    globfree(&g);  // release resources even on partial success
}


// -------- public API --------

/*
 * list_ports()
 * ------------
 * Strategy:
 * - Prefer /dev/serial/by-id symlinks for stability across reboots/ports,
 *   resolved to the canonical /dev/tty* path that open_serial() receives.
 * - If that directory is absent, glob the classic USB-serial names.
 *
 * Failure handling:
 * - Never throws; a filesystem error just yields fewer entries.
 */
std::vector<std::string> list_ports() {
    std::vector<std::string> ports;

    std::error_code ec;
    const fs::path by_id("/dev/serial/by-id");
    if (fs::exists(by_id, ec)) {
        for (fs::directory_iterator it(by_id, ec), end; !ec && it != end; it.increment(ec)) {
            if (!it->is_symlink(ec)) continue;
            std::error_code cec;
            auto canon = fs::canonical(it->path(), cec);
            if (!cec) ports.push_back(canon.string());
        }
        if (ec) log::debug("ports", "scan of ", by_id.string(), " stopped: ", ec.message());
    } else {
        append_glob(ports, "/dev/ttyACM*");
        append_glob(ports, "/dev/ttyUSB*");
    }

    std::sort(ports.begin(), ports.end());
    ports.erase(std::unique(ports.begin(), ports.end()), ports.end());
    return ports;
}

std::string format_port_list(const std::vector<std::string>& ports) {
    std::string s = "[";
    for (size_t i = 0; i < ports.size(); ++i) {
        if (i) s += ' ';
        s += ports[i];
    }
    s += ']';
    return s;
}

std::string port_list_json(const std::vector<std::string>& ports) {
    return nlohmann::json(ports).dump();
}


// -------- PortWatcher --------

PortWatcher::PortWatcher(ConnectionManager& connection, StatusSink& status,
                         PortLister lister, int interval_ms)
    : connection_(connection), status_(status),
      lister_(lister ? std::move(lister) : PortLister(&list_ports)),
      interval_ms_(interval_ms > 0 ? interval_ms : 1) {}

PortWatcher::~PortWatcher() { stop(); }

void PortWatcher::start() {
    if (thread_.joinable()) return;
    last_   = lister_();     // baseline; clients get it through announce()
    primed_ = true;
    thread_ = std::thread([this] { run(); });
}

void PortWatcher::stop() {
    {
        std::lock_guard<std::mutex> lk(mtx_);
        stopping_ = true;
    }
    cv_.notify_all();
    if (thread_.joinable()) thread_.join();
}

void PortWatcher::announce() {
    publish_list(lister_());
}

void PortWatcher::publish_list(const std::vector<std::string>& ports) {
    status_.publish("Port list updated: " + format_port_list(ports), Source::Status);
    status_.publish(port_list_json(ports), Source::Status);
}

// ---------------------------------------------------------------------------
// poll_once()
// -----------
// The selected port missing from a fresh list means the device went away (or
// was never there). A shrinking list is read as "unplugged": the selection is
// forgotten so the supervisor stops retrying a port that is gone. Either way the
// manager reconnects, which reports the outcome to clients. Check, reset and
// reconnect happen in one guarded call so a concurrent configure() is either
// seen whole or not at all.
// ---------------------------------------------------------------------------
bool PortWatcher::poll_once() {
    std::vector<std::string> now = lister_();
    if (!primed_) {
        last_   = std::move(now);
        primed_ = true;
        return false;
    }
    if (now == last_) return false;

    log::info("ports", "port list changed: ", format_port_list(last_), " -> ", format_port_list(now));
    publish_list(now);

    connection_.drop_if_missing(now, now.size() < last_.size());

    last_ = std::move(now);
    return true;
}

void PortWatcher::run() {
    for (;;) {
        {
            std::unique_lock<std::mutex> lk(mtx_);
            if (cv_.wait_for(lk, std::chrono::milliseconds(interval_ms_), [this] { return stopping_; }))
                return;
        }
        poll_once();
    }
}

} // namespace serialhub
