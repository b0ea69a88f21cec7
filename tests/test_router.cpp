#include <doctest/doctest.h>
#include "serialhub/router.hpp"
#include "serialhub/connection_manager.hpp"
#include "serialhub/outbound_writer.hpp"
#include "fakes.hpp"

using namespace serialhub;
using fakes::FakeOpener;
using fakes::RecordingSink;
using fakes::ScriptedSink;

namespace {

// Router wired to a real connection manager (fake ports) and a writer that
// writes into a scripted sink.
struct Harness {
    FakeOpener        opener;
    RecordingSink     status;
    ScriptedSink      port;
    ConnectionManager manager{status, opener.opener(), fakes::fast_timing()};
    OutboundWriter    writer{port, status};
    Router            router{manager, writer, status};
};

} // namespace

TEST_CASE("A settings payload reconfigures and connects") {
    Harness h;
    auto o = h.router.handle_text(R"({"port":"/dev/ttyFAKE0","baudRate":"115200"})");

    CHECK(o == Router::Outcome::Reconfigured);
    CHECK(h.status.contains("Settings changed: port /dev/ttyFAKE0, baud rate 115200"));
    CHECK(h.status.contains("Connected to serial port /dev/ttyFAKE0 at 115200 baud."));
    CHECK(h.manager.settings() == fakes::settings("/dev/ttyFAKE0", 115200));
}

TEST_CASE("Sending the same settings again is reported unchanged") {
    Harness h;
    h.router.handle_text(R"({"port":"/dev/ttyFAKE0","baudRate":"9600"})");
    CHECK(h.router.handle_text(R"({"port":"/dev/ttyFAKE0","baudRate":"9600"})") == Router::Outcome::Unchanged);
    CHECK(h.status.texts().back() == "Port and baud rate settings unchanged.");
    CHECK(h.opener.open_calls() == 1);
}

TEST_CASE("A numeric baud rate is a type error") {
    Harness h;
    CHECK(h.router.handle_text(R"({"port":"/dev/ttyFAKE0","baudRate":9600})") == Router::Outcome::Rejected);
    CHECK(h.status.texts() == std::vector<std::string>{"Error: invalid data type for baud rate."});
    CHECK(h.opener.open_calls() == 0);
}

TEST_CASE("Each mistyped settings field gets its own error") {
    Harness h;
    CHECK(h.router.handle_text(R"({"port":7,"baudRate":true})") == Router::Outcome::Rejected);
    CHECK(h.status.texts() == std::vector<std::string>{
        "Error: invalid data type for port.", "Error: invalid data type for baud rate."});
}

TEST_CASE("An unconvertible baud rate is reported and the settings kept") {
    Harness h;
    for (const char* bad : {"fast", "", "-9600", "0", "96 00", "99999999999"}) {
        h.status.clear();
        nlohmann::json j = {{"port", "/dev/ttyFAKE0"}, {"baudRate", bad}};
        CHECK(h.router.handle(j) == Router::Outcome::Rejected);
        CHECK(h.status.texts() == std::vector<std::string>{"Error: unable to convert baud rate."});
    }
    CHECK(h.manager.settings() == ConnectionSettings{});
}

TEST_CASE("A command is sent with a newline appended") {
    Harness h;
    h.writer.start();
    CHECK(h.router.handle_text(R"({"command":"hello"})") == Router::Outcome::CommandQueued);
    REQUIRE(h.status.wait_for("Sent to serial port: hello"));
    CHECK(h.port.written() == "hello\n");
    h.writer.stop();
}

TEST_CASE("A non-string command is a type error") {
    Harness h;
    CHECK(h.router.handle_text(R"({"command":42})") == Router::Outcome::Rejected);
    CHECK(h.status.texts() == std::vector<std::string>{"Error: invalid data type for command."});
    CHECK(h.writer.pending() == 0);
}

TEST_CASE("Settings win when a payload carries both shapes") {
    Harness h;
    auto o = h.router.handle_text(R"({"port":"/dev/ttyFAKE0","baudRate":"9600","command":"x"})");
    CHECK(o == Router::Outcome::Reconfigured);
    CHECK(h.writer.pending() == 0);
}

TEST_CASE("A lone port key does not count as a settings payload") {
    Harness h;
    CHECK(h.router.handle_text(R"({"port":"/dev/ttyFAKE0","command":"x"})") == Router::Outcome::CommandQueued);
    CHECK(h.router.handle_text(R"({"port":"/dev/ttyFAKE0"})") == Router::Outcome::Unrecognized);
    CHECK(h.opener.open_calls() == 0);
}

TEST_CASE("Malformed and unrecognized payloads are dropped silently") {
    Harness h;
    CHECK(h.router.handle_text("{not json") == Router::Outcome::Malformed);
    CHECK(h.router.handle_text("[1,2,3]") == Router::Outcome::Malformed);
    CHECK(h.router.handle_text(R"("just a string")") == Router::Outcome::Malformed);
    CHECK(h.router.handle_text(R"({"hello":"world"})") == Router::Outcome::Unrecognized);
    CHECK(h.status.size() == 0);
}

TEST_CASE("A stopped writer drops commands") {
    Harness h;
    h.writer.stop();
    CHECK(h.router.handle_text(R"({"command":"late"})") == Router::Outcome::Dropped);
}

TEST_CASE("parse_baud accepts plain positive decimals only") {
    int v = 0;
    CHECK(parse_baud("9600", v));
    CHECK(v == 9600);
    CHECK(parse_baud("2147483647", v));
    CHECK_FALSE(parse_baud("2147483648", v));
    CHECK_FALSE(parse_baud("0", v));
    CHECK_FALSE(parse_baud("+9600", v));
    CHECK_FALSE(parse_baud("0x2580", v));
    CHECK_FALSE(parse_baud(" 9600", v));
    CHECK_FALSE(parse_baud("", v));
}
