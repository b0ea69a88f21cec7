// ============================================================================
// relay.cpp: implementation for relay.hpp
// ============================================================================

#include "serialhub/relay.hpp"
#include "serialhub/log.hpp"

namespace serialhub {

Relay::Relay(const RelayConfig& cfg, ConnectionManager::Opener opener, PortLister lister)
    : cfg_(cfg),
      connection_(broadcaster_, std::move(opener), cfg.timing),
      writer_(connection_, broadcaster_),
      router_(connection_, writer_, broadcaster_),
      watcher_(connection_, broadcaster_, std::move(lister), cfg.scan_interval_ms) {}

Relay::~Relay() { stop(); }

void Relay::start() {
    if (started_) return;
    started_ = true;

    broadcaster_.start();
    writer_.start();
    connection_.start();
    watcher_.start();
    ingress_worker_ = std::thread([this] { run_ingress(); });

    if (cfg_.initial.configured()) {
        log::info("relay", "initial port ", cfg_.initial.port, " @", cfg_.initial.baud_rate);
        connection_.configure(cfg_.initial);
    }
}

void Relay::stop() {
    if (stopped_) return;
    stopped_ = true;

    ingress_.close();
    if (ingress_worker_.joinable()) ingress_worker_.join();

    watcher_.stop();
    connection_.stop();
    writer_.stop();
    broadcaster_.stop();
}

bool Relay::submit_payload(std::string text) {
    return ingress_.push(std::move(text));
}

void Relay::client_connected() {
    watcher_.announce();
}

void Relay::run_ingress() {
    std::string text;
    while (ingress_.pop(text)) {
        const Router::Outcome o = router_.handle_text(text);
        log::debug("router", "client message -> ", to_string(o));
    }
}

} // namespace serialhub
