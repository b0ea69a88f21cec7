// ============================================================================
// connection_manager.cpp: implementation for connection_manager.hpp
// For the state machine and invariants see the matching .hpp.
// ============================================================================

/**
 * @file connection_manager.cpp
 */

#include "serialhub/connection_manager.hpp"
#include "serialhub/log.hpp"

#include <algorithm>
#include <chrono>

namespace serialhub {

const char* to_string(ConnectionManager::State s) {
    switch (s) {
        case ConnectionManager::State::Unconfigured: return "unconfigured";
        case ConnectionManager::State::Opening:      return "opening";
        case ConnectionManager::State::Open:         return "open";
        case ConnectionManager::State::Closing:      return "closing";
    }
    return "?";
}

ConnectionManager::ConnectionManager(StatusSink& status, Opener opener, ConnectionTiming timing)
    : status_(status), opener_(std::move(opener)), timing_(timing) {}

ConnectionManager::~ConnectionManager() { stop(); }


// -------- lifecycle --------

void ConnectionManager::start() {
    if (supervisor_.joinable() || stopped_.load()) return;
    supervisor_ = std::thread([this] { supervise(); });
}

void ConnectionManager::stop() {
    if (stopped_.exchange(true)) return;

    {
        std::lock_guard<std::mutex> lk(signal_mtx_);
        stopping_ = true;
    }
    signal_cv_.notify_all();
    if (supervisor_.joinable()) supervisor_.join();

    {
        std::lock_guard<std::mutex> g(guard_);
        close_locked();
    }
    reap_readers();
}


// -------- public operations --------

ConnectionManager::ConfigureResult ConnectionManager::configure(const ConnectionSettings& settings) {
    {
        std::lock_guard<std::mutex> g(guard_);
        if (settings == settings_) {
            status_.publish("Port and baud rate settings unchanged.", Source::Status);
            return ConfigureResult::Unchanged;
        }
        settings_ = settings;
        status_.publish("Settings changed: port " + settings_.port + ", baud rate " +
                        std::to_string(settings_.baud_rate), Source::Status);
        reconnect_locked();
    }
    reap_readers();
    return ConfigureResult::Changed;
}

void ConnectionManager::reconnect() {
    {
        std::lock_guard<std::mutex> g(guard_);
        reconnect_locked();
    }
    reap_readers();
}

bool ConnectionManager::open() {
    bool ok = false;
    {
        std::lock_guard<std::mutex> g(guard_);
        ok = port_ ? true : open_locked();
    }
    reap_readers();
    return ok;
}

bool ConnectionManager::drop_if_missing(const std::vector<std::string>& ports, bool shrank) {
    {
        std::lock_guard<std::mutex> g(guard_);
        if (!settings_.configured()) return false;
        if (std::find(ports.begin(), ports.end(), settings_.port) != ports.end()) return false;

        log::info("serial", settings_.port, " is no longer listed");
        if (shrank) {
            settings_ = ConnectionSettings{};
            status_.publish("Current port is no longer available. Settings reset.", Source::Status);
        }
        reconnect_locked();
    }
    reap_readers();
    return true;
}

ConnectionSettings ConnectionManager::settings() const {
    std::lock_guard<std::mutex> g(guard_);
    return settings_;
}

bool ConnectionManager::is_open() const {
    std::lock_guard<std::mutex> g(guard_);
    return port_ != nullptr;
}

ConnectionManager::State ConnectionManager::state() const {
    std::lock_guard<std::mutex> g(guard_);
    return state_;
}

uint64_t ConnectionManager::generation() const {
    std::lock_guard<std::mutex> g(guard_);
    return generation_;
}


// -------- borrowed I/O --------

ReadStatus ConnectionManager::read_some(uint64_t generation, uint8_t* out, std::size_t cap,
                                        std::size_t& out_len, std::string& err) {
    out_len = 0;
    std::lock_guard<std::mutex> g(guard_);
    if (generation != generation_ || !port_) return ReadStatus::Stale;

    switch (port_->recv(out, cap, out_len, timing_.read_poll_ms)) {
        case transport::RxResult::Ok:   return out_len > 0 ? ReadStatus::Data : ReadStatus::Idle;
        case transport::RxResult::None: return ReadStatus::Idle;
        case transport::RxResult::Error: break;
    }
    err = port_->last_error();
    if (err.empty()) err = "unknown read error";
    return ReadStatus::Error;
}

WriteStatus ConnectionManager::write_all(const std::string& data, std::string& err) {
    std::lock_guard<std::mutex> g(guard_);
    if (!port_) return WriteStatus::NotConnected;

    if (port_->send(reinterpret_cast<const uint8_t*>(data.data()), data.size()) != transport::TxResult::Ok) {
        err = port_->last_error();
        if (err.empty()) err = "unknown write error";
        return WriteStatus::Failed;
    }
    return WriteStatus::Ok;
}


// -------- guarded internals (guard_ held by caller) --------

// ---------------------------------------------------------------------------
// open_locked()
// -------------
// Install a new port built from the current settings.
// - Any previous port is closed first: there is never more than one.
// - Failure leaves no port behind; retrying is the supervisor's business.
// - On success the reader for the new generation starts before the success
//   line is queued. It cannot read until the guard is released, so the
//   "Connected" status still goes out ahead of the first device line.
// ---------------------------------------------------------------------------
bool ConnectionManager::open_locked() {
    if (port_) close_locked();

    if (!settings_.configured()) {
        set_state_locked(State::Unconfigured);
        status_.publish("No port selected.", Source::Status);
        return false;
    }

    set_state_locked(State::Opening);
    std::string err;
    std::unique_ptr<transport::ISerialPort> port = opener_ ? opener_(settings_, err) : nullptr;

    if (!port) {
        if (err.empty()) err = "unknown error";
        log::warn("serial", "open ", settings_.port, " @", settings_.baud_rate, " failed: ", err);
        set_state_locked(State::Unconfigured);
        mark_open(false);
        status_.publish("Error: unable to open serial port " + settings_.port + " (" + err +
                        "). Check the settings and reconnect to the port.", Source::Status);
        return false;
    }

    port_ = std::move(port);
    ++generation_;
    set_state_locked(State::Open);
    log::debug("serial", "connection #", generation_, " uses ", port_->name());
    start_reader_locked();
    mark_open(true);

    status_.publish("Connected to serial port " + settings_.port + " at " +
                    std::to_string(settings_.baud_rate) + " baud.", Source::Status);
    return true;
}

void ConnectionManager::close_locked() {
    if (reader_) {
        reader_->request_stop();
        retired_.push_back(std::move(reader_));
    }
    if (port_) {
        set_state_locked(State::Closing);
        port_->close();
        port_.reset();
        log::debug("serial", "connection #", generation_, " closed");
    }
    ++generation_;               // anything still bound to the old handle is now stale
    set_state_locked(State::Unconfigured);
    mark_open(false);
}

void ConnectionManager::reconnect_locked() {
    close_locked();
    if (!pause_for(timing_.reconnect_pause_ms)) return;   // stopping: stay closed
    open_locked();
}

void ConnectionManager::start_reader_locked() {
    InboundReader::Options opts;
    opts.buffer_size = timing_.read_buffer;
    opts.idle_ms     = timing_.read_idle_ms;

    reader_ = std::make_unique<InboundReader>(
        *this, status_, generation_, opts,
        [this](uint64_t gen, const std::string& why) { on_reader_error(gen, why); });
    reader_->start();
}

void ConnectionManager::set_state_locked(State next) {
    if (next == state_) return;
    log::debug("serial", "state ", to_string(state_), " -> ", to_string(next));
    state_ = next;
}

void ConnectionManager::mark_open(bool open) {
    open_flag_.store(open);
    {
        std::lock_guard<std::mutex> lk(signal_mtx_);   // pairs with the supervisor's predicate check
    }
    signal_cv_.notify_all();
}


// -------- supervision --------

void ConnectionManager::on_reader_error(uint64_t generation, const std::string& reason) {
    {
        std::lock_guard<std::mutex> lk(signal_mtx_);
        reader_failed_     = true;
        failed_generation_ = generation;
    }
    log::debug("supervisor", "reader #", generation, " reported: ", reason);
    signal_cv_.notify_all();
}

bool ConnectionManager::pause_for(int ms) {
    std::unique_lock<std::mutex> lk(signal_mtx_);
    if (ms <= 0) return !stopping_;
    return !signal_cv_.wait_for(lk, std::chrono::milliseconds(ms), [this] { return stopping_; });
}

// ---------------------------------------------------------------------------
// supervise()
// -----------
// Two waits, one loop:
//  - nothing open: sleep the backoff, then try open() if a port is selected;
//  - something open: block until its reader fails (or the connection drops
//    for another reason), sleep the backoff, then reconnect, unless a newer
//    connection replaced the failed one in the meantime.
// ---------------------------------------------------------------------------
void ConnectionManager::supervise() {
    log::debug("supervisor", "started, backoff ", timing_.backoff_ms, " ms");

    for (;;) {
        if (!open_flag_.load()) {
            if (!pause_for(timing_.backoff_ms)) break;
            {
                std::lock_guard<std::mutex> g(guard_);
                if (!port_ && settings_.configured()) {
                    log::info("supervisor", "retrying ", settings_.port, " @", settings_.baud_rate);
                    open_locked();
                }
            }
            reap_readers();
            continue;
        }

        uint64_t failed = 0;
        {
            std::unique_lock<std::mutex> lk(signal_mtx_);
            signal_cv_.wait(lk, [this] { return stopping_ || reader_failed_ || !open_flag_.load(); });
            if (stopping_) break;
            if (!reader_failed_) continue;
            reader_failed_ = false;
            failed = failed_generation_;
        }

        if (!pause_for(timing_.backoff_ms)) break;
        {
            std::lock_guard<std::mutex> g(guard_);
            if (port_ && generation_ == failed) {
                log::info("supervisor", "reconnecting after read failure on connection #", failed);
                reconnect_locked();
            }
        }
        reap_readers();
    }

    log::debug("supervisor", "stopped");
}

void ConnectionManager::reap_readers() {
    std::vector<std::unique_ptr<InboundReader>> done;
    {
        std::lock_guard<std::mutex> g(guard_);
        done.swap(retired_);
    }
    for (auto& r : done) r->join();
}

} // namespace serialhub
