#include <doctest/doctest.h>
#include "p100link/command_queue.hpp"

#include <chrono>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

using namespace p100link;
using namespace std::chrono_literals;

namespace {

// The "device" answers every query inline from the writer, except HOLD?,
// which stays unanswered until the test releases it.
struct QueueRig {
    DeviceStateCache cache;
    Correlator corr{cache};
    CommandQueue queue{corr};
    std::mutex mu;
    std::vector<std::string> order;

    QueueRig() {
        corr.set_writer([this](const std::string& w, Error&) {
            const std::string text = w.substr(1, w.size() - 2);
            {
                std::lock_guard<std::mutex> lk(mu);
                order.push_back(text);
            }
            if (text == "VOL?") corr.on_frame(Frame{FrameKind::Status, "VOL(-350)"});
            return true;
        });
        corr.set_gate(Correlator::Gate::Open);
    }

    std::vector<std::string> written() {
        std::lock_guard<std::mutex> lk(mu);
        return order;
    }
};

Command hold() { return Command("HOLD?", ResponseMatcher::verb("HOLD"), 3000ms); }

void wait_depth(CommandQueue& q, std::size_t n) {
    for (int i = 0; i < 200 && q.depth() < n; ++i) std::this_thread::sleep_for(5ms);
    REQUIRE(q.depth() >= n);
}

} // namespace

TEST_CASE("execute runs a query end to end") {
    QueueRig r;
    Response resp;
    Error err;
    REQUIRE(r.queue.execute(make_volume_query(Zone::Main), resp, err));
    CHECK(resp.lines.at(0).value == -350);
    CHECK(r.queue.depth() == 0);
}

TEST_CASE("Callers are served in arrival order") {
    QueueRig r;
    Error e0, e1, e2;
    Response r0, r1, r2;

    std::thread t0([&] { r.queue.execute(hold(), r0, e0); });
    wait_depth(r.queue, 1);
    std::thread t1([&] { r.queue.execute(make_power_on(Zone::Main), r1, e1); });
    wait_depth(r.queue, 2);
    std::thread t2([&] { r.queue.execute(make_volume_query(Zone::Main), r2, e2); });
    wait_depth(r.queue, 3);

    r.corr.on_frame(Frame{FrameKind::Status, "HOLD(1)"});
    t0.join();
    t1.join();
    t2.join();

    auto w = r.written();
    REQUIRE(w.size() == 3);
    CHECK(w[0] == "HOLD?");
    CHECK(w[1] == "POWERONMAIN");
    CHECK(w[2] == "VOL?");
    CHECK(e0.ok());
    CHECK(e1.ok());
    CHECK(e2.ok());
}

TEST_CASE("A queued caller that cancels gives up its turn without blocking others") {
    QueueRig r;
    Error e0, e1, e2;
    Response r0, r1, r2;
    CancelToken cancel;

    std::thread t0([&] { r.queue.execute(hold(), r0, e0); });
    wait_depth(r.queue, 1);
    std::thread t1([&] { r.queue.execute(make_power_off(Zone::Main), r1, e1, &cancel); });
    wait_depth(r.queue, 2);
    std::thread t2([&] { r.queue.execute(make_volume_query(Zone::Main), r2, e2); });
    wait_depth(r.queue, 3);

    cancel.cancel();
    t1.join();
    CHECK(e1.code == ErrorCode::Cancelled);

    r.corr.on_frame(Frame{FrameKind::Status, "HOLD(1)"});
    t0.join();
    t2.join();

    auto w = r.written();
    REQUIRE(w.size() == 2);
    CHECK(w[0] == "HOLD?");
    CHECK(w[1] == "VOL?");
    CHECK(e2.ok());
}

TEST_CASE("Cancelling while awaiting returns at once; the next caller waits for the slot") {
    QueueRig r;
    CancelToken cancel;
    Error e0;
    Response r0;

    std::thread t0([&] { r.queue.execute(Command("HOLD?", ResponseMatcher::verb("HOLD"), 300ms),
                                         r0, e0, &cancel); });
    for (int i = 0; i < 200 && r.corr.idle(); ++i) std::this_thread::sleep_for(5ms);
    REQUIRE_FALSE(r.corr.idle());
    cancel.cancel();
    t0.join();
    CHECK(e0.code == ErrorCode::Cancelled);
    CHECK_FALSE(r.corr.idle());

    // The abandoned HOLD? times out on its own, then VOL? goes through.
    Response resp;
    Error err;
    CHECK(r.queue.execute(make_volume_query(Zone::Main), resp, err));
    CHECK(r.corr.counters().timeouts == 1);
}

TEST_CASE("Submits fail with NotConnected while the gate is closed") {
    QueueRig r;
    r.corr.abort(ErrorCode::ConnectionLost, "down");
    Response resp;
    Error err;
    CHECK_FALSE(r.queue.execute(make_volume_query(Zone::Main), resp, err));
    CHECK(err.code == ErrorCode::NotConnected);
    CHECK(r.queue.depth() == 0);
}
