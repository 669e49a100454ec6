#include <doctest/doctest.h>
#include "p100link/config.hpp"
#include "p100link/log.hpp"

#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <string>
#include <vector>

using namespace p100link;

TEST_CASE("Defaults") {
    Config c;
    CHECK(c.port == 84);
    CHECK(c.transport == TransportKind::Tcp);
    CHECK(c.baud == 115200);
    CHECK(c.command_timeout_ms == 5000);
    CHECK(c.connect_timeout_ms == 10000);
    CHECK(c.reconnect_base_ms == 1000);
    CHECK(c.reconnect_max_ms == 30000);
    CHECK(c.reconnect_stable_ms == 60000);
    CHECK(c.feedback_level == FeedbackLevel::StatusUpdates);
}

TEST_CASE("JSON keys overlay the defaults; unknown keys are ignored") {
    Config c;
    Error err;
    REQUIRE(parse_config_json(R"({
        "host": "10.0.0.5", "port": 8484, "feedback_level": 2,
        "reconnect_max_ms": 5000, "comment": "living room"
    })", c, err));
    CHECK(c.host == "10.0.0.5");
    CHECK(c.port == 8484);
    CHECK(c.feedback_level == FeedbackLevel::EchoAndStatus);
    CHECK(c.reconnect_max_ms == 5000);
    CHECK(c.command_timeout_ms == 5000);
}

TEST_CASE("Serial transport from JSON") {
    Config c;
    Error err;
    REQUIRE(parse_config_json(R"({"transport":"serial","serial_device":"/dev/ttyUSB0","baud":57600})", c, err));
    CHECK(c.transport == TransportKind::Serial);
    CHECK(c.serial_device == "/dev/ttyUSB0");
    CHECK(c.baud == 57600);
    CHECK(validate_config(c, err));
}

TEST_CASE("Bad values reject the whole file and leave the config untouched") {
    Config c;
    Error err;
    CHECK_FALSE(parse_config_json(R"({"host":"a","port":"84"})", c, err));
    CHECK(err.code == ErrorCode::Config);
    CHECK(c.host.empty());

    Error e2;
    CHECK_FALSE(parse_config_json(R"({"feedback_level":3})", c, e2));
    CHECK(e2.code == ErrorCode::Config);

    Error e3;
    CHECK_FALSE(parse_config_json(R"({"transport":"udp"})", c, e3));
    CHECK(e3.code == ErrorCode::Config);

    Error e4;
    CHECK_FALSE(parse_config_json("{not json", c, e4));
    CHECK(e4.code == ErrorCode::Config);

    Error e5;
    CHECK_FALSE(parse_config_json("[1,2]", c, e5));
    CHECK(e5.code == ErrorCode::Config);
}

TEST_CASE("validate_config cross checks") {
    Config c;
    Error err;
    CHECK_FALSE(validate_config(c, err));          // tcp without host
    c.host = "p100.local";
    CHECK(validate_config(c, err));
    c.reconnect_base_ms = 40000;
    Error e2;
    CHECK_FALSE(validate_config(c, e2));
    CHECK(e2.reason() == std::string("config"));
}

TEST_CASE("Serial config rejects a baud rate the port cannot be set to") {
    Config c;
    c.transport = TransportKind::Serial;
    c.serial_device = "/dev/ttyUSB0";
    c.baud = 12345;
    Error err;
    CHECK_FALSE(validate_config(c, err));
    CHECK(err.code == ErrorCode::Config);
    CHECK(err.detail.find("12345") != std::string::npos);

    c.baud = 57600;
    Error ok;
    CHECK(validate_config(c, ok));
}

TEST_CASE("load_config_file reads from disk") {
    const std::string path = "p100link_test_config.json";
    {
        std::ofstream out(path);
        out << R"({"host":"192.168.1.40","command_timeout_ms":2500})";
    }
    Config c;
    Error err;
    REQUIRE(load_config_file(path, c, err));
    CHECK(c.host == "192.168.1.40");
    CHECK(c.command_timeout_ms == 2500);
    std::remove(path.c_str());

    Error missing;
    CHECK_FALSE(load_config_file(path, c, missing));
    CHECK(missing.code == ErrorCode::Config);
}

TEST_CASE("default_config_path honours XDG_CONFIG_HOME") {
    const char* old = std::getenv("XDG_CONFIG_HOME");
    const std::string saved = old ? old : "";
    ::setenv("XDG_CONFIG_HOME", "/tmp/xdg", 1);
    CHECK(default_config_path() == "/tmp/xdg/p100link/config.json");
    if (old) ::setenv("XDG_CONFIG_HOME", saved.c_str(), 1);
    else     ::unsetenv("XDG_CONFIG_HOME");
}

TEST_CASE("Log lines respect the threshold and go to the installed sink") {
    std::vector<std::string> lines;
    log::set_sink([&](log::Level, const std::string& l) { lines.push_back(l); });
    log::set_level(log::Level::Info);

    log::debug("test", "msg=hidden");
    log::info("test", "msg=shown n=1");
    REQUIRE(lines.size() == 1);
    CHECK(lines[0] == "level=info component=test msg=shown n=1");

    log::Level lvl;
    CHECK(log::parse_level("error", lvl));
    CHECK(lvl == log::Level::Error);
    CHECK_FALSE(log::parse_level("loud", lvl));

    log::set_sink(nullptr);
    log::set_level(log::Level::Warn);
}

TEST_CASE("Error reasons are stable tokens") {
    Error e;
    CHECK(e.ok());
    e.set(ErrorCode::NotConnected, "VOL?");
    CHECK(std::string(e.reason()) == "not_connected");
    CHECK(e.to_string() == "not_connected VOL?");
    CHECK(std::string(to_reason(ErrorCode::MalformedFrame)) == "malformed_frame");
}
