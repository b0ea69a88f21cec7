#include <doctest/doctest.h>
#include "serialhub/port_registry.hpp"
#include "serialhub/connection_manager.hpp"
#include "fakes.hpp"

#include <mutex>

using namespace serialhub;
using fakes::FakeOpener;
using fakes::RecordingSink;

namespace {

// Port list the test can change between polls.
struct ScriptedPorts {
    std::mutex               mtx;
    std::vector<std::string> ports;

    void set(std::vector<std::string> p) {
        std::lock_guard<std::mutex> lk(mtx);
        ports = std::move(p);
    }
    PortLister lister() {
        return [this] {
            std::lock_guard<std::mutex> lk(mtx);
            return ports;
        };
    }
};

} // namespace

TEST_CASE("Port lists are formatted for people and for programs") {
    CHECK(format_port_list({}) == "[]");
    CHECK(format_port_list({"/dev/ttyACM0", "/dev/ttyUSB0"}) == "[/dev/ttyACM0 /dev/ttyUSB0]");
    CHECK(port_list_json({}) == "[]");
    CHECK(port_list_json({"/dev/ttyACM0", "/dev/ttyUSB0"}) == R"(["/dev/ttyACM0","/dev/ttyUSB0"])");
}

TEST_CASE("list_ports() returns a sorted list without duplicates") {
    auto ports = list_ports();
    CHECK(std::is_sorted(ports.begin(), ports.end()));
    CHECK(std::adjacent_find(ports.begin(), ports.end()) == ports.end());
}

TEST_CASE("announce() publishes the readable line and the JSON array") {
    FakeOpener opener;
    RecordingSink sink;
    ScriptedPorts ports;
    ports.set({"/dev/ttyACM0"});
    ConnectionManager mgr(sink, opener.opener(), fakes::fast_timing());
    PortWatcher watcher(mgr, sink, ports.lister(), 1000);

    watcher.announce();
    CHECK(sink.texts() == std::vector<std::string>{"Port list updated: [/dev/ttyACM0]", R"(["/dev/ttyACM0"])"});
}

TEST_CASE("The first poll only records a baseline; later changes are announced") {
    FakeOpener opener;
    RecordingSink sink;
    ScriptedPorts ports;
    ConnectionManager mgr(sink, opener.opener(), fakes::fast_timing());
    PortWatcher watcher(mgr, sink, ports.lister(), 1000);

    ports.set({"/dev/ttyACM0"});
    CHECK_FALSE(watcher.poll_once());
    CHECK_FALSE(watcher.poll_once());
    CHECK(sink.size() == 0);

    ports.set({"/dev/ttyACM0", "/dev/ttyUSB0"});
    CHECK(watcher.poll_once());
    CHECK(sink.texts() == std::vector<std::string>{
        "Port list updated: [/dev/ttyACM0 /dev/ttyUSB0]", R"(["/dev/ttyACM0","/dev/ttyUSB0"])"});
}

TEST_CASE("Unplugging the selected port resets the settings") {
    FakeOpener opener;
    RecordingSink sink;
    ScriptedPorts ports;
    ConnectionManager mgr(sink, opener.opener(), fakes::fast_timing());
    PortWatcher watcher(mgr, sink, ports.lister(), 1000);

    ports.set({"/dev/ttyACM0", "/dev/ttyUSB0"});
    watcher.poll_once();
    mgr.configure(fakes::settings("/dev/ttyUSB0", 9600));
    REQUIRE(mgr.is_open());
    sink.clear();

    ports.set({"/dev/ttyACM0"});
    CHECK(watcher.poll_once());

    CHECK(sink.contains("Port list updated: [/dev/ttyACM0]"));
    CHECK(sink.contains("Current port is no longer available. Settings reset."));
    CHECK(sink.contains("No port selected."));
    CHECK_FALSE(mgr.is_open());
    CHECK_FALSE(mgr.settings().configured());
    CHECK(opener.last_device()->path() == "/dev/ttyUSB0");
    CHECK(opener.last_device()->closed());
}

TEST_CASE("Removing some other port leaves the connection alone") {
    FakeOpener opener;
    RecordingSink sink;
    ScriptedPorts ports;
    ConnectionManager mgr(sink, opener.opener(), fakes::fast_timing());
    PortWatcher watcher(mgr, sink, ports.lister(), 1000);

    ports.set({"/dev/ttyACM0", "/dev/ttyUSB0"});
    watcher.poll_once();
    mgr.configure(fakes::settings("/dev/ttyACM0", 9600));
    const int opens = opener.open_calls();

    ports.set({"/dev/ttyACM0"});
    CHECK(watcher.poll_once());
    CHECK(mgr.is_open());
    CHECK(opener.open_calls() == opens);
    CHECK_FALSE(sink.contains("Settings reset"));
}

TEST_CASE("The watcher thread notices changes on its own") {
    FakeOpener opener;
    RecordingSink sink;
    ScriptedPorts ports;
    ConnectionManager mgr(sink, opener.opener(), fakes::fast_timing());
    PortWatcher watcher(mgr, sink, ports.lister(), 10);

    watcher.start();
    ports.set({"/dev/ttyUSB3"});
    CHECK(sink.wait_for("Port list updated: [/dev/ttyUSB3]"));
    watcher.stop();
}
