// ============================================================================
// broadcaster.cpp: implementation for broadcaster.hpp
// ============================================================================

#include "serialhub/broadcaster.hpp"
#include "serialhub/log.hpp"

#include <vector>

namespace serialhub {

Broadcaster::~Broadcaster() { stop(); }

Broadcaster::ClientId Broadcaster::add_client(std::shared_ptr<Client> client) {
    std::lock_guard<std::mutex> lk(clients_mtx_);
    const ClientId id = next_id_++;
    clients_.emplace(id, std::move(client));
    log::info("clients", "client #", id, " joined (", clients_.size(), " connected)");
    return id;
}

bool Broadcaster::remove_client(ClientId id) {
    std::lock_guard<std::mutex> lk(clients_mtx_);
    if (clients_.erase(id) == 0) return false;
    log::info("clients", "client #", id, " left (", clients_.size(), " connected)");
    return true;
}

bool Broadcaster::has_client(ClientId id) const {
    std::lock_guard<std::mutex> lk(clients_mtx_);
    return clients_.count(id) != 0;
}

std::size_t Broadcaster::client_count() const {
    std::lock_guard<std::mutex> lk(clients_mtx_);
    return clients_.size();
}

void Broadcaster::publish(std::string text, Source source) {
    if (source == Source::Status) log::info("relay", text);
    if (!queue_.push(Message{std::move(text), source})) {
        log::debug("relay", "broadcaster stopped, line discarded");
    }
}

// ---------------------------------------------------------------------------
// dispatch()
// ----------
// Deliver under the client-set guard so membership cannot change mid-fan-out.
// Failed clients are collected and erased after the pass; erasing inside the
// loop would invalidate the iterator.
// ---------------------------------------------------------------------------
std::size_t Broadcaster::dispatch(const Message& msg) {
    std::lock_guard<std::mutex> lk(clients_mtx_);

    std::size_t           delivered = 0;
    std::vector<ClientId> failed;

    for (const auto& entry : clients_) {
        if (entry.second->deliver(msg.text)) {
            ++delivered;
        } else {
            failed.push_back(entry.first);
        }
    }

    for (ClientId id : failed) {
        auto it = clients_.find(id);
        if (it == clients_.end()) continue;
        log::warn("clients", "delivery to client #", id, " (", it->second->describe(),
                  ") failed, client removed");
        clients_.erase(it);
    }
    return delivered;
}

void Broadcaster::start() {
    if (worker_.joinable()) return;
    worker_ = std::thread([this] { run(); });
}

void Broadcaster::stop() {
    queue_.close();
    if (worker_.joinable()) worker_.join();
}

void Broadcaster::run() {
    Message msg;
    while (queue_.pop(msg)) {
        dispatch(msg);
    }
}

} // namespace serialhub
