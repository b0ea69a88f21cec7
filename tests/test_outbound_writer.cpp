#include <doctest/doctest.h>
#include "serialhub/outbound_writer.hpp"
#include "fakes.hpp"

using namespace serialhub;
using fakes::RecordingSink;
using fakes::ScriptedSink;

static OutboundRequest req(const std::string& s) {
    OutboundRequest r;
    r.payload = s;
    return r;
}

TEST_CASE("A command with no open port is reported and not sent") {
    ScriptedSink port;
    RecordingSink status;
    OutboundWriter w(port, status);

    port.set_result(WriteStatus::NotConnected);
    CHECK(w.process(req("hello\n")) == WriteStatus::NotConnected);
    CHECK(status.texts() == std::vector<std::string>{"Error: port is not open. Message not sent."});
    CHECK(port.written().empty());
}

TEST_CASE("A successful write is echoed without its delimiter") {
    ScriptedSink port;
    RecordingSink status;
    OutboundWriter w(port, status);

    CHECK(w.process(req("ATZ\n")) == WriteStatus::Ok);
    CHECK(port.written() == "ATZ\n");
    CHECK(status.texts() == std::vector<std::string>{"Sent to serial port: ATZ"});
}

TEST_CASE("A failed write carries the reason") {
    ScriptedSink port;
    RecordingSink status;
    OutboundWriter w(port, status);

    port.set_result(WriteStatus::Failed);
    CHECK(w.process(req("x\n")) == WriteStatus::Failed);
    CHECK(status.texts() == std::vector<std::string>{"Error writing to serial port: broken pipe"});
}

TEST_CASE("Queued commands reach the device in submission order") {
    ScriptedSink port;
    RecordingSink status;
    OutboundWriter w(port, status);
    w.start();

    CHECK(w.submit(req("a\n")));
    CHECK(w.submit(req("b\n")));
    CHECK(w.submit(req("c\n")));
    REQUIRE(status.wait_count("Sent to serial port:", 3));

    CHECK(port.written() == "a\nb\nc\n");
    CHECK(status.texts() == std::vector<std::string>{
        "Sent to serial port: a", "Sent to serial port: b", "Sent to serial port: c"});
    w.stop();
}

TEST_CASE("submit() after stop() is refused") {
    ScriptedSink port;
    RecordingSink status;
    OutboundWriter w(port, status);
    w.start();
    w.stop();

    CHECK_FALSE(w.submit(req("late\n")));
    CHECK(port.written().empty());
}
