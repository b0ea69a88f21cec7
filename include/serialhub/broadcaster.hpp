#pragma once
/**
 * @file broadcaster.hpp
 * @brief Fan-out of status and device lines to every connected client.
 *
 * @details
 * ## Field Brief
 * Any component may publish() at any time from any thread; the line is queued
 * and a single worker hands it to each member of the client set, strictly in
 * publication order.
 *
 * ## Delivery rules
 * - Membership is checked at dispatch time. Delivery runs under the client-set
 *   guard, so a client removed before the dispatch never sees the line, and a
 *   client added after it is not owed the line either.
 * - A client whose deliver() returns false is dropped from the set and logged.
 *   The remaining clients still get the line.
 * - deliver() must hand the text to the client's own outgoing queue and return.
 *   That is what keeps one slow socket from stalling the others.
 *
 * The client-set guard is independent of the connection guard, so client churn
 * never waits on a reconnect and the other way round.
 */

#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include "serialhub/status_sink.hpp"
#include "serialhub/work_queue.hpp"

namespace serialhub {

class Broadcaster : public StatusSink {
public:
  using ClientId = std::uint64_t;

  /// One subscriber. Implementations must not block in deliver().
  class Client {
  public:
    virtual ~Client() = default;
    /// Hand @p text over for sending; false means the client is gone.
    virtual bool        deliver(const std::string& text) = 0;
    virtual std::string describe() const = 0;
  };

  struct Message {
    std::string text;
    Source      source{Source::Status};
  };

  Broadcaster() = default;
  ~Broadcaster() override;

  Broadcaster(const Broadcaster&) = delete;
  Broadcaster& operator=(const Broadcaster&) = delete;

  ClientId    add_client(std::shared_ptr<Client> client);
  bool        remove_client(ClientId id);
  bool        has_client(ClientId id) const;
  std::size_t client_count() const;

  void publish(std::string text, Source source) override;

  /// Deliver one message to the current client set; returns successful deliveries.
  std::size_t dispatch(const Message& msg);

  void start();
  /// Stop accepting, deliver what is already queued, join the worker.
  void stop();

  std::size_t pending() const { return queue_.size(); }

private:
  void run();

  mutable std::mutex                          clients_mtx_;
  std::map<ClientId, std::shared_ptr<Client>> clients_;
  ClientId                                    next_id_{1};

  WorkQueue<Message> queue_;
  std::thread        worker_;
};

} // namespace serialhub
