#include <doctest/doctest.h>
#include "serialhub/broadcaster.hpp"
#include "fakes.hpp"

#include <memory>

using namespace serialhub;
using fakes::RecordingClient;

TEST_CASE("Every client receives every message") {
    Broadcaster b;
    auto a = std::make_shared<RecordingClient>("a");
    auto c = std::make_shared<RecordingClient>("c");
    b.add_client(a);
    b.add_client(c);

    CHECK(b.dispatch({"hello", Source::Device}) == 2);
    CHECK(a->texts() == std::vector<std::string>{"hello"});
    CHECK(c->texts() == std::vector<std::string>{"hello"});
}

TEST_CASE("Client ids are unique and start at one") {
    Broadcaster b;
    auto id1 = b.add_client(std::make_shared<RecordingClient>());
    auto id2 = b.add_client(std::make_shared<RecordingClient>());
    CHECK(id1 == 1);
    CHECK(id2 == 2);
    CHECK(b.client_count() == 2);
}

TEST_CASE("A failing client is removed and the others still get the message") {
    Broadcaster b;
    auto good1 = std::make_shared<RecordingClient>("good1");
    auto bad   = std::make_shared<RecordingClient>("bad");
    auto good2 = std::make_shared<RecordingClient>("good2");
    b.add_client(good1);
    auto bad_id = b.add_client(bad);
    b.add_client(good2);

    bad->set_failing(true);
    CHECK(b.dispatch({"line", Source::Device}) == 2);
    CHECK_FALSE(b.has_client(bad_id));
    CHECK(b.client_count() == 2);
    CHECK(good1->contains("line"));
    CHECK(good2->contains("line"));

    // gone for good, even if it recovers
    bad->set_failing(false);
    b.dispatch({"next", Source::Device});
    CHECK_FALSE(bad->contains("next"));
}

TEST_CASE("A removed client gets nothing further") {
    Broadcaster b;
    auto c = std::make_shared<RecordingClient>();
    auto id = b.add_client(c);
    CHECK(b.remove_client(id));
    CHECK_FALSE(b.remove_client(id));
    CHECK(b.dispatch({"x", Source::Status}) == 0);
    CHECK(c->size() == 0);
}

TEST_CASE("Published messages are delivered in publish order by the worker") {
    Broadcaster b;
    auto c = std::make_shared<RecordingClient>();
    b.add_client(c);
    b.start();

    for (int i = 0; i < 50; ++i) b.publish("m" + std::to_string(i), Source::Device);
    REQUIRE(c->wait_for("m49"));

    auto got = c->texts();
    REQUIRE(got.size() == 50);
    for (int i = 0; i < 50; ++i) CHECK(got[i] == "m" + std::to_string(i));
    b.stop();
}

TEST_CASE("stop() drains what was already published") {
    auto c = std::make_shared<RecordingClient>();
    {
        Broadcaster b;
        b.add_client(c);
        b.publish("first", Source::Status);
        b.publish("second", Source::Status);
        b.start();
        b.stop();
        CHECK(b.pending() == 0);
    }
    CHECK(c->texts() == std::vector<std::string>{"first", "second"});
}

TEST_CASE("Publishing with no clients is harmless") {
    Broadcaster b;
    b.start();
    b.publish("nobody listens", Source::Status);
    b.stop();
    CHECK(b.client_count() == 0);
}
