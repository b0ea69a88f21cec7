// ============================================================================
// outbound_writer.cpp: implementation for outbound_writer.hpp
// ============================================================================

#include "serialhub/outbound_writer.hpp"
#include "serialhub/log.hpp"

namespace serialhub {

// The request carries its delimiter; the echo back to clients does not.
static std::string without_delimiter(const std::string& s) {
    std::size_t end = s.size();
    while (end > 0 && (s[end - 1] == '\n' || s[end - 1] == '\r')) --end;
    return s.substr(0, end);
}

OutboundWriter::OutboundWriter(ByteSink& sink, StatusSink& status)
    : sink_(sink), status_(status) {}

OutboundWriter::~OutboundWriter() { stop(); }

void OutboundWriter::start() {
    if (worker_.joinable()) return;
    worker_ = std::thread([this] { run(); });
}

void OutboundWriter::stop() {
    queue_.close();
    if (worker_.joinable()) worker_.join();
}

bool OutboundWriter::submit(OutboundRequest req) {
    if (!queue_.push(std::move(req))) {
        log::warn("writer", "writer stopped, command discarded");
        return false;
    }
    return true;
}

WriteStatus OutboundWriter::process(const OutboundRequest& req) {
    std::string err;
    const WriteStatus st = sink_.write_all(req.payload, err);

    switch (st) {
        case WriteStatus::NotConnected:
            status_.publish("Error: port is not open. Message not sent.", Source::Status);
            break;
        case WriteStatus::Failed:
            log::warn("writer", "write failed: ", err);
            status_.publish("Error writing to serial port: " + err, Source::Status);
            break;
        case WriteStatus::Ok:
            status_.publish("Sent to serial port: " + without_delimiter(req.payload), Source::Status);
            break;
    }
    return st;
}

void OutboundWriter::run() {
    OutboundRequest req;
    while (queue_.pop(req)) {
        process(req);
    }
}

} // namespace serialhub
