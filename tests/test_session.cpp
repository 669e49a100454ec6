#include <doctest/doctest.h>
#include "p100link/session.hpp"
#include "fake_transport.hpp"

#include <atomic>
#include <chrono>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

using namespace p100link;
using namespace std::chrono_literals;
using p100test::FakeDevice;
using p100test::fake_factory;

namespace {

Config fast_config() {
    Config cfg;
    cfg.host = "fake";
    cfg.command_timeout_ms = 500;
    cfg.reconnect_base_ms = 100;
    cfg.reconnect_max_ms = 400;
    cfg.reconnect_stable_ms = 60000;
    return cfg;
}

std::shared_ptr<FakeDevice> answering_device() {
    auto dev = std::make_shared<FakeDevice>();
    dev->reply("VERB(0)", "!VERB(0)\r");
    dev->reply("VERB(1)", "!VERB(1)\r");
    dev->reply("VERB(2)", "!VERB(2)\r");
    dev->reply("VOL?", "!VOL(-350)\r");
    return dev;
}

template <typename Pred>
bool eventually(Pred p, std::chrono::milliseconds limit = 2000ms) {
    const auto end = std::chrono::steady_clock::now() + limit;
    while (std::chrono::steady_clock::now() < end) {
        if (p()) return true;
        std::this_thread::sleep_for(5ms);
    }
    return p();
}

} // namespace

TEST_CASE("connect negotiates the feedback level and opens the link") {
    auto dev = answering_device();
    Session s(fast_config(), fake_factory(dev));
    Error err;
    REQUIRE(s.connect(err));
    CHECK(s.connection_state() == ConnectionState::Connected);
    CHECK(s.connection_epoch() == 1);
    REQUIRE_FALSE(dev->written().empty());
    CHECK(dev->written()[0] == "VERB(1)");

    Response resp;
    REQUIRE(s.execute(make_volume_query(Zone::Main, s.command_timeout()), resp, err));
    CHECK(resp.lines.at(0).value == -350);
}

TEST_CASE("A device that ignores VERB(n) is still connected") {
    auto dev = std::make_shared<FakeDevice>();
    Config cfg = fast_config();
    cfg.command_timeout_ms = 150;
    Session s(cfg, fake_factory(dev));
    Error err;
    REQUIRE(s.connect(err));
    CHECK(s.connection_state() == ConnectionState::Connected);
}

TEST_CASE("A failed first attempt is reported and leaves the session stopped") {
    auto dev = std::make_shared<FakeDevice>();
    dev->refuse_connects(true);
    Session s(fast_config(), fake_factory(dev));
    Error err;
    CHECK_FALSE(s.connect(err));
    CHECK(err.code == ErrorCode::ConnectionLost);
    CHECK(s.connection_state() == ConnectionState::Disconnected);
    CHECK(s.connection_epoch() == 0);

    // Nothing keeps retrying in the background.
    std::this_thread::sleep_for(300ms);
    dev->refuse_connects(false);
    std::this_thread::sleep_for(300ms);
    CHECK(dev->connects() == 0);
}

TEST_CASE("Link loss fails the pending command, then NotConnected until reconnected") {
    auto dev = answering_device();
    Session s(fast_config(), fake_factory(dev));
    Error err;
    REQUIRE(s.connect(err));

    Error pending_err;
    std::thread caller([&] {
        Response resp;
        s.execute(make_mute_query(Zone::Main, 5000ms), resp, pending_err);
    });
    REQUIRE(dev->wait_written("MUTE?", 1, 1000ms));

    dev->refuse_connects(true);
    dev->drop();
    caller.join();
    CHECK(pending_err.code == ErrorCode::ConnectionLost);

    Response resp;
    Error gap_err;
    CHECK_FALSE(s.execute(make_volume_query(Zone::Main), resp, gap_err));
    CHECK(gap_err.code == ErrorCode::NotConnected);
    CHECK(s.wait_for_state(ConnectionState::Reconnecting, 1000ms));

    dev->refuse_connects(false);
    REQUIRE(s.wait_for_state(ConnectionState::Connected, 2000ms));
    CHECK(s.connection_epoch() == 2);
    CHECK(dev->count_written("VERB(1)") == 2);

    REQUIRE(s.execute(make_volume_query(Zone::Main, s.command_timeout()), resp, err));
    CHECK(resp.lines.at(0).value == -350);
}

TEST_CASE("Unsolicited pushes reach the cache and subscribers") {
    auto dev = answering_device();
    Session s(fast_config(), fake_factory(dev));
    Error err;
    REQUIRE(s.connect(err));

    std::atomic<int> last{0};
    int id = s.subscribe([&](const DeviceState& st) {
        last = st.main.volume_tenths.value_or(0);
    });
    dev->push("!VOL -300\r");
    CHECK(eventually([&] { return last.load() == -300; }));
    CHECK(s.state_snapshot().main.volume_tenths == -300);
    s.unsubscribe(id);
}

TEST_CASE("disconnect stops the session and rejects further commands") {
    auto dev = answering_device();
    Session s(fast_config(), fake_factory(dev));
    Error err;
    REQUIRE(s.connect(err));
    s.disconnect();
    CHECK(s.connection_state() == ConnectionState::Disconnected);

    Response resp;
    CHECK_FALSE(s.execute(make_volume_query(Zone::Main), resp, err));
    CHECK(err.code == ErrorCode::NotConnected);

    // and it can be connected again
    Error err2;
    REQUIRE(s.connect(err2));
    CHECK(s.connection_epoch() == 2);
}

TEST_CASE("Monitor tap sees both directions") {
    auto dev = answering_device();
    Session s(fast_config(), fake_factory(dev));
    std::mutex mu;
    std::vector<std::string> seen;
    s.set_monitor([&](Direction d, const std::string& line) {
        std::lock_guard<std::mutex> lk(mu);
        seen.push_back(std::string(d == Direction::Tx ? "tx " : "rx ") + line);
    });
    Error err;
    REQUIRE(s.connect(err));
    Response resp;
    REQUIRE(s.execute(make_volume_query(Zone::Main, s.command_timeout()), resp, err));
    s.set_monitor(nullptr);

    std::lock_guard<std::mutex> lk(mu);
    auto has = [&](const std::string& x) {
        for (const auto& l : seen) if (l == x) return true;
        return false;
    };
    CHECK(has("tx !VERB(1)"));
    CHECK(has("tx !VOL?"));
    CHECK(has("rx !VOL(-350)"));
}

TEST_CASE("A feedback level change waits for the next physical connection") {
    auto dev = answering_device();
    Session s(fast_config(), fake_factory(dev));
    Error err;
    REQUIRE(s.connect(err));
    s.set_feedback_level(FeedbackLevel::EchoAndStatus);
    CHECK(s.feedback_level() == FeedbackLevel::EchoAndStatus);

    // Same connection: nothing renegotiated.
    Response resp;
    REQUIRE(s.execute(make_volume_query(Zone::Main, s.command_timeout()), resp, err));
    CHECK(s.connection_epoch() == 1);
    CHECK(dev->count_written("VERB(1)") == 1);
    CHECK(dev->count_written("VERB(2)") == 0);

    dev->drop();
    REQUIRE(s.wait_for_state(ConnectionState::Reconnecting, 1000ms));
    REQUIRE(s.wait_for_state(ConnectionState::Connected, 2000ms));
    CHECK(s.connection_epoch() == 2);
    CHECK(dev->count_written("VERB(2)") == 1);
    CHECK(dev->count_written("VERB(1)") == 1);
}

TEST_CASE("Echo frames at level 2 do not disturb correlation") {
    auto dev = answering_device();
    dev->reply("VOL?", "#VOL?\r!VOL(-120)\r");
    Config cfg = fast_config();
    cfg.feedback_level = FeedbackLevel::EchoAndStatus;
    Session s(cfg, fake_factory(dev));
    Error err;
    REQUIRE(s.connect(err));
    Response resp;
    REQUIRE(s.execute(make_volume_query(Zone::Main, s.command_timeout()), resp, err));
    CHECK(resp.lines.at(0).value == -120);
    CHECK(s.counters().echoes >= 1);
}

TEST_CASE("Backoff doubles up to the ceiling while the device stays away") {
    auto dev = answering_device();
    DeviceStateCache cache;
    Correlator corr(cache);
    SupervisorOptions o;
    o.reconnect_base_ms = 100;
    o.reconnect_max_ms = 400;
    o.command_timeout_ms = 500;
    ReconnectSupervisor sup(corr, fake_factory(dev), o);

    Error err;
    REQUIRE(sup.start(err));
    CHECK(sup.backoff() == 100ms);

    dev->refuse_connects(true);
    dev->drop();
    // sleeps 100, 200, 400, 400 ... with every attempt refused
    std::this_thread::sleep_for(1000ms);
    CHECK(sup.backoff() == 400ms);
    CHECK(sup.state() == ConnectionState::Reconnecting);

    sup.stop();
    CHECK(sup.state() == ConnectionState::Disconnected);
}

TEST_CASE("A link that stays up past the stable period resets the backoff") {
    auto dev = answering_device();
    DeviceStateCache cache;
    Correlator corr(cache);
    SupervisorOptions o;
    o.reconnect_base_ms = 100;
    o.reconnect_max_ms = 400;
    o.reconnect_stable_ms = 300;
    o.command_timeout_ms = 500;
    ReconnectSupervisor sup(corr, fake_factory(dev), o);

    Error err;
    REQUIRE(sup.start(err));

    // Grow the backoff to the ceiling with refused attempts.
    dev->refuse_connects(true);
    dev->drop();
    REQUIRE(eventually([&] { return sup.backoff() == 400ms; }));

    dev->refuse_connects(false);
    REQUIRE(eventually([&] { return sup.state() == ConnectionState::Connected; }));
    CHECK(sup.epoch() == 2);
    CHECK(sup.backoff() == 400ms);

    // Up longer than the stable period: the drop starts again from the base,
    // which is doubled once after its sleep.
    std::this_thread::sleep_for(450ms);
    dev->drop();
    REQUIRE(sup.wait_for_state(ConnectionState::Reconnecting, 1000ms));
    REQUIRE(sup.wait_for_state(ConnectionState::Connected, 2000ms));
    CHECK(sup.epoch() == 3);
    CHECK(sup.backoff() == 200ms);

    // A short-lived link keeps growing it.
    dev->drop();
    REQUIRE(sup.wait_for_state(ConnectionState::Reconnecting, 1000ms));
    REQUIRE(sup.wait_for_state(ConnectionState::Connected, 2000ms));
    CHECK(sup.epoch() == 4);
    CHECK(sup.backoff() == 400ms);

    sup.stop();
}
