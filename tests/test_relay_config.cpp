#include <doctest/doctest.h>
#include "serialhub/relay_config.hpp"

#include <cstdio>
#include <fstream>

using namespace serialhub;
using nlohmann::json;

TEST_CASE("Listen addresses: host:port, :port and bracketed IPv6") {
    ListenAddress a;
    std::string err;

    REQUIRE(parse_listen_address(":8080", a, err));
    CHECK(a.host.empty());
    CHECK(a.port == 8080);

    REQUIRE(parse_listen_address("127.0.0.1:9000", a, err));
    CHECK(a.host == "127.0.0.1");
    CHECK(a.port == 9000);

    REQUIRE(parse_listen_address("[::1]:7000", a, err));
    CHECK(a.host == "::1");
    CHECK(a.port == 7000);
}

TEST_CASE("Bad listen addresses are refused with a reason") {
    ListenAddress a;
    std::string err;
    for (const char* bad : {"8080", "host:", ":0", ":65536", ":http", "::1:80", "[::1]8080"}) {
        err.clear();
        CHECK_FALSE(parse_listen_address(bad, a, err));
        CHECK(err.rfind("bad_value:address", 0) == 0);
    }
}

TEST_CASE("Config JSON overlays only the keys it names") {
    RelayConfig cfg;
    std::string err;
    json j = {{"port", "/dev/ttyACM0"}, {"baudRate", "57600"}, {"backoff_ms", 250}, {"log_level", "debug"}};

    REQUIRE(apply_config_json(j, cfg, err));
    CHECK(cfg.initial.port == "/dev/ttyACM0");
    CHECK(cfg.initial.baud_rate == 57600);
    CHECK(cfg.timing.backoff_ms == 250);
    CHECK(cfg.log_level == log::Level::Debug);
    CHECK(cfg.listen_address == ":8080");
    CHECK(cfg.ws_path == "/serialmonitor");
    CHECK(cfg.timing.read_poll_ms == 100);
}

TEST_CASE("Config JSON type errors name the key") {
    RelayConfig cfg;
    std::string err;

    CHECK_FALSE(apply_config_json(json{{"backoff_ms", "fast"}}, cfg, err));
    CHECK(err == "bad_type:backoff_ms");
    CHECK_FALSE(apply_config_json(json{{"baudRate", true}}, cfg, err));
    CHECK(err == "bad_type:baudRate");
    CHECK_FALSE(apply_config_json(json{{"baudRate", "9k6"}}, cfg, err));
    CHECK(err == "bad_value:baudRate");
    CHECK_FALSE(apply_config_json(json{{"read_buffer", 1.5}}, cfg, err));
    CHECK(err == "bad_type:read_buffer");
    CHECK_FALSE(apply_config_json(json::array(), cfg, err));
}

TEST_CASE("Config integers that do not fit their setting are refused, not wrapped") {
    const RelayConfig defaults;
    std::string err;

    struct Case { const char* key; json value; };
    const Case cases[] = {
        {"backoff_ms",         json(4294967296ULL)},        // would wrap to 0 as int
        {"backoff_ms",         json(-5)},
        {"reconnect_pause_ms", json(2147483648LL)},
        {"read_poll_ms",       json(-1)},
        {"read_idle_ms",       json(9223372036854775807LL)},
        {"scan_interval_ms",   json(0)},
        {"baudRate",           json(4294976896ULL)},        // would wrap to 9600 as int
        {"baudRate",           json(0)},
        {"baudRate",           json("99999999999999999999")},
        {"read_buffer",        json(1000000000000ULL)},
        {"read_buffer",        json(0)},
        {"read_buffer",        json(-1)},
        {"read_buffer",        json(MAX_READ_BUFFER + 1)},
        {"max_backpressure",   json(4294967296ULL)},        // would wrap to 0 as unsigned
        {"max_backpressure",   json(0)},
    };

    for (const auto& c : cases) {
        RelayConfig cfg;
        err.clear();
        CAPTURE(c.key);
        CHECK_FALSE(apply_config_json(json{{c.key, c.value}}, cfg, err));
        CHECK(err == std::string("bad_value:") + c.key);
        CHECK(cfg.timing.backoff_ms == defaults.timing.backoff_ms);
        CHECK(cfg.timing.read_buffer == defaults.timing.read_buffer);
        CHECK(cfg.max_backpressure == defaults.max_backpressure);
    }
}

TEST_CASE("Config integers at the edges of their range are accepted") {
    RelayConfig cfg;
    std::string err;
    json j = {{"backoff_ms", 0}, {"read_poll_ms", 2147483647}, {"baudRate", 2147483647},
              {"read_buffer", MAX_READ_BUFFER}, {"max_backpressure", 4294967295ULL}};

    REQUIRE(apply_config_json(j, cfg, err));
    CHECK(cfg.timing.backoff_ms == 0);
    CHECK(cfg.timing.read_poll_ms == 2147483647);
    CHECK(cfg.initial.baud_rate == 2147483647);
    CHECK(cfg.timing.read_buffer == MAX_READ_BUFFER);
    CHECK(cfg.max_backpressure == 4294967295u);
}

TEST_CASE("Unknown config keys are tolerated") {
    RelayConfig cfg;
    std::string err;
    CHECK(apply_config_json(json{{"colour", "blue"}, {"path", "/ws"}}, cfg, err));
    CHECK(cfg.ws_path == "/ws");
}

TEST_CASE("Config files are read and parse errors reported") {
    const std::string good = "serialhub-test-config-good.json";
    const std::string bad  = "serialhub-test-config-bad.json";
    { std::ofstream(good) << R"({"address": "127.0.0.1:8181", "scan_interval_ms": 500})"; }
    { std::ofstream(bad) << "{ nope"; }

    RelayConfig cfg;
    std::string err;
    CHECK(load_config_file(good, cfg, err));
    CHECK(cfg.listen_address == "127.0.0.1:8181");
    CHECK(cfg.scan_interval_ms == 500);

    CHECK_FALSE(load_config_file(bad, cfg, err));
    CHECK(err.rfind("config_parse:", 0) == 0);

    CHECK_FALSE(load_config_file("does-not-exist.json", cfg, err));
    CHECK(err.rfind("config_unreadable:", 0) == 0);

    std::remove(good.c_str());
    std::remove(bad.c_str());
}

TEST_CASE("validate_config checks ranges across the whole configuration") {
    std::string err;
    RelayConfig cfg;
    CHECK(validate_config(cfg, err));

    RelayConfig p = cfg;
    p.ws_path = "serialmonitor";
    CHECK_FALSE(validate_config(p, err));

    RelayConfig b = cfg;
    b.initial.port = "/dev/ttyACM0";
    b.initial.baud_rate = 0;
    CHECK_FALSE(validate_config(b, err));

    RelayConfig t = cfg;
    t.timing.read_buffer = 0;
    CHECK_FALSE(validate_config(t, err));
    CHECK(err == "bad_value:read_buffer(>=1)");
    t.timing.read_buffer = MAX_READ_BUFFER + 1;
    CHECK_FALSE(validate_config(t, err));
    CHECK(err == "bad_value:read_buffer(<=65536)");

    RelayConfig m = cfg;
    m.max_backpressure = 0;
    CHECK_FALSE(validate_config(m, err));
}

TEST_CASE("Log level names") {
    log::Level l = log::Level::Info;
    CHECK(parse_log_level("warn", l));
    CHECK(l == log::Level::Warn);
    CHECK(parse_log_level("error", l));
    CHECK(l == log::Level::Error);
    CHECK_FALSE(parse_log_level("loud", l));
}
