// ============================================================================
// relay_config.cpp: implementation for relay_config.hpp
// ============================================================================

#include "serialhub/relay_config.hpp"

#include <cerrno>
#include <climits>
#include <cstdint>
#include <cstdlib>
#include <fstream>

namespace serialhub {

using nlohmann::json;

// Digits only, 1..65535.
static bool parse_port_number(const std::string& s, int& out) {
    if (s.empty() || s.size() > 5) return false;
    for (char c : s) if (c < '0' || c > '9') return false;
    long v = std::strtol(s.c_str(), nullptr, 10);
    if (v < 1 || v > 65535) return false;
    out = static_cast<int>(v);
    return true;
}

bool parse_listen_address(const std::string& text, ListenAddress& out, std::string& err) {
    std::string host, port;

    if (!text.empty() && text.front() == '[') {           // [::1]:8080
        const auto close = text.find(']');
        if (close == std::string::npos || close + 1 >= text.size() || text[close + 1] != ':') {
            err = "bad_value:address";
            return false;
        }
        host = text.substr(1, close - 1);
        port = text.substr(close + 2);
    } else {
        const auto colon = text.rfind(':');
        if (colon == std::string::npos) { err = "bad_value:address(need host:port or :port)"; return false; }
        host = text.substr(0, colon);
        port = text.substr(colon + 1);
        if (host.find(':') != std::string::npos) { err = "bad_value:address(bracket IPv6 hosts)"; return false; }
    }

    int p = 0;
    if (!parse_port_number(port, p)) { err = "bad_value:address(port 1..65535)"; return false; }

    out.host = host;
    out.port = p;
    return true;
}

bool parse_log_level(const std::string& text, log::Level& out) {
    if (text == "debug") { out = log::Level::Debug; return true; }
    if (text == "info")  { out = log::Level::Info;  return true; }
    if (text == "warn" || text == "warning") { out = log::Level::Warn; return true; }
    if (text == "error") { out = log::Level::Error; return true; }
    return false;
}

// ---------------------------------------------------------------------------
// read_bounded()
// --------------
// Integer key within [lo, hi]. nlohmann stores non-negative literals as
// unsigned and negative ones as signed, so both are compared in 64 bits
// before narrowing; a value that would wrap is reported, never truncated.
// Absent keys leave @p dst alone.
// ---------------------------------------------------------------------------
template <typename T>
static bool read_bounded(const json& j, const char* key, int64_t lo, int64_t hi,
                         T& dst, std::string& err) {
    auto it = j.find(key);
    if (it == j.end()) return true;
    if (!it->is_number_integer()) { err = std::string("bad_type:") + key; return false; }

    bool in_range = false;
    int64_t v = 0;
    if (it->is_number_unsigned()) {
        const uint64_t u = it->get<uint64_t>();
        in_range = u <= static_cast<uint64_t>(hi);
        v = in_range ? static_cast<int64_t>(u) : 0;
        in_range = in_range && v >= lo;
    } else {
        v = it->get<int64_t>();
        in_range = v >= lo && v <= hi;
    }
    if (!in_range) { err = std::string("bad_value:") + key; return false; }

    dst = static_cast<T>(v);
    return true;
}

// ---------------------------------------------------------------------------
// apply_config_json()
// -------------------
// Each key is checked on its own; the first bad one aborts with
// "bad_type:<key>" (wrong JSON type) or "bad_value:<key>" (out of range).
// "baudRate" takes a number or a digit string, matching what clients send
// over the socket.
// ---------------------------------------------------------------------------
bool apply_config_json(const json& j, RelayConfig& cfg, std::string& err) {
    if (!j.is_object()) { err = "bad_type:config(expected object)"; return false; }

    auto get_str = [&](const char* key, std::string& dst) -> bool {
        auto it = j.find(key);
        if (it == j.end()) return true;
        if (!it->is_string()) { err = std::string("bad_type:") + key; return false; }
        dst = it->get<std::string>();
        return true;
    };
    auto get_ms = [&](const char* key, int& dst) -> bool {
        return read_bounded(j, key, 0, INT_MAX, dst, err);
    };

    if (!get_str("address", cfg.listen_address)) return false;
    if (!get_str("path", cfg.ws_path)) return false;
    if (!get_str("port", cfg.initial.port)) return false;

    if (auto it = j.find("baudRate"); it != j.end()) {
        if (it->is_number_integer()) {
            if (!read_bounded(j, "baudRate", 1, INT_MAX, cfg.initial.baud_rate, err)) return false;
        } else if (it->is_string()) {
            const std::string s = it->get<std::string>();
            bool digits = !s.empty();
            for (char c : s) if (c < '0' || c > '9') digits = false;
            errno = 0;
            const long v = digits ? std::strtol(s.c_str(), nullptr, 10) : 0;
            if (!digits || errno == ERANGE || v <= 0 || v > INT_MAX) { err = "bad_value:baudRate"; return false; }
            cfg.initial.baud_rate = static_cast<int>(v);
        } else {
            err = "bad_type:baudRate";
            return false;
        }
    }

    if (!get_ms("backoff_ms", cfg.timing.backoff_ms)) return false;
    if (!get_ms("reconnect_pause_ms", cfg.timing.reconnect_pause_ms)) return false;
    if (!get_ms("read_poll_ms", cfg.timing.read_poll_ms)) return false;
    if (!get_ms("read_idle_ms", cfg.timing.read_idle_ms)) return false;
    if (!read_bounded(j, "scan_interval_ms", 1, INT_MAX, cfg.scan_interval_ms, err)) return false;

    if (!read_bounded(j, "read_buffer", 1, static_cast<int64_t>(MAX_READ_BUFFER),
                      cfg.timing.read_buffer, err)) return false;
    if (!read_bounded(j, "max_backpressure", 1, static_cast<int64_t>(UINT_MAX),
                      cfg.max_backpressure, err)) return false;

    if (auto it = j.find("log_level"); it != j.end()) {
        if (!it->is_string() || !parse_log_level(it->get<std::string>(), cfg.log_level)) {
            err = "bad_value:log_level";
            return false;
        }
    }

    static const char* known[] = {
        "address", "path", "port", "baudRate", "backoff_ms", "reconnect_pause_ms",
        "read_poll_ms", "read_idle_ms", "scan_interval_ms", "read_buffer",
        "max_backpressure", "log_level"};
    for (auto it = j.begin(); it != j.end(); ++it) {
        bool found = false;
        for (const char* k : known) if (it.key() == k) { found = true; break; }
        if (!found) log::warn("config", "unknown key '", it.key(), "' ignored");
    }
    return true;
}

bool load_config_file(const std::string& path, RelayConfig& cfg, std::string& err) {
    std::ifstream in(path);
    if (!in) { err = "config_unreadable:" + path; return false; }

    json j;
    try {
        in >> j;
    } catch (const json::parse_error& ex) {
        err = std::string("config_parse:") + ex.what();
        return false;
    }
    return apply_config_json(j, cfg, err);
}

bool validate_config(const RelayConfig& cfg, std::string& err) {
    ListenAddress addr;
    if (!parse_listen_address(cfg.listen_address, addr, err)) return false;

    if (cfg.ws_path.empty() || cfg.ws_path.front() != '/') { err = "bad_value:path(must start with /)"; return false; }
    if (cfg.initial.configured() && cfg.initial.baud_rate <= 0) { err = "bad_value:baudRate(>0)"; return false; }

    const ConnectionTiming& t = cfg.timing;
    if (t.backoff_ms < 0)         { err = "bad_value:backoff_ms(>=0)"; return false; }
    if (t.reconnect_pause_ms < 0) { err = "bad_value:reconnect_pause_ms(>=0)"; return false; }
    if (t.read_poll_ms < 0)       { err = "bad_value:read_poll_ms(>=0)"; return false; }
    if (t.read_idle_ms < 0)       { err = "bad_value:read_idle_ms(>=0)"; return false; }
    if (t.read_buffer < 1)        { err = "bad_value:read_buffer(>=1)"; return false; }
    if (t.read_buffer > MAX_READ_BUFFER) { err = "bad_value:read_buffer(<=65536)"; return false; }
    if (cfg.scan_interval_ms < 1) { err = "bad_value:scan_interval_ms(>=1)"; return false; }
    if (cfg.max_backpressure < 1) { err = "bad_value:max_backpressure(>=1)"; return false; }
    return true;
}

} // namespace serialhub
