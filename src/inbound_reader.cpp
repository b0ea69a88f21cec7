// ============================================================================
// inbound_reader.cpp: implementation for inbound_reader.hpp
// ============================================================================

#include "serialhub/inbound_reader.hpp"
#include "serialhub/log.hpp"

#include <chrono>
#include <vector>

namespace serialhub {

InboundReader::InboundReader(ByteSource& source, StatusSink& sink, uint64_t generation,
                             Options opts, ErrorFn on_error)
    : source_(source), sink_(sink), generation_(generation),
      opts_(opts), on_error_(std::move(on_error)) {
    if (opts_.buffer_size == 0) opts_.buffer_size = 1;
}

InboundReader::~InboundReader() {
    request_stop();
    join();
}

void InboundReader::start() {
    thread_ = std::thread([this] { run(); });
}

void InboundReader::join() {
    if (thread_.joinable() && thread_.get_id() != std::this_thread::get_id()) thread_.join();
}

void InboundReader::run() {
    std::vector<uint8_t>     buf(opts_.buffer_size);
    std::vector<std::string> lines;

    log::debug("reader", "started for connection #", generation_);

    while (!stop_.load()) {
        std::size_t n = 0;
        std::string err;
        const ReadStatus st = source_.read_some(generation_, buf.data(), buf.size(), n, err);

        if (st == ReadStatus::Data) {
            lines.clear();
            if (framer_.feed(buf.data(), n, lines) == LineFramer::FeedResult::InvalidUtf8) {
                log::warn("reader", "dropped ", n, " bytes of invalid UTF-8 from the device");
            }
            for (auto& line : lines) {
                log::debug("device", line);
                sink_.publish(std::move(line), Source::Device);
            }
            continue;
        }

        if (st == ReadStatus::Idle) {
            std::this_thread::sleep_for(std::chrono::milliseconds(opts_.idle_ms));
            continue;
        }

        if (st == ReadStatus::Stale) {
            log::debug("reader", "connection #", generation_, " superseded, reader exits");
            break;
        }

        // ReadStatus::Error: terminal for this connection
        log::warn("reader", "read failed on connection #", generation_, ": ", err);
        sink_.publish("Error reading from serial port: " + err, Source::Status);
        if (on_error_) on_error_(generation_, err);
        return;
    }
}

} // namespace serialhub
