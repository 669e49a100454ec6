#include <doctest/doctest.h>
#include "p100link/device_state.hpp"

#include <vector>

using namespace p100link;

static bool apply(DeviceStateCache& c, const char* payload) {
    StatusLine l;
    REQUIRE(parse_status_line(payload, l));
    return c.apply(l);
}

TEST_CASE("Fresh state has nothing observed") {
    DeviceStateCache c;
    auto s = c.snapshot();
    CHECK_FALSE(s.main.power.has_value());
    CHECK_FALSE(s.main.volume_tenths.has_value());
    CHECK_FALSE(s.zone2.muted.has_value());
    CHECK_FALSE(s.audio_mode_index.has_value());
    CHECK(s.updates == 0);
}

TEST_CASE("Power in all its spellings") {
    DeviceStateCache c;
    CHECK(apply(c, "POWERONMAIN"));
    CHECK(c.snapshot().main.power == PowerState::On);
    CHECK(apply(c, "POWER(0)"));
    CHECK(c.snapshot().main.power == PowerState::Off);
    CHECK(apply(c, "POWERZONE2(1)"));
    CHECK(c.snapshot().zone2.power == PowerState::On);
    CHECK(apply(c, "POWEROFFZONE2"));
    CHECK(c.snapshot().zone2.power == PowerState::Off);
}

TEST_CASE("Volume and mute per zone") {
    DeviceStateCache c;
    CHECK(apply(c, "VOL -350"));
    CHECK(apply(c, "ZVOL(-200)"));
    CHECK(apply(c, "MUTEON"));
    CHECK(apply(c, "ZMUTE(0)"));
    auto s = c.snapshot();
    CHECK(s.main.volume_tenths == -350);
    CHECK(s.zone2.volume_tenths == -200);
    CHECK(s.main.muted == true);
    CHECK(s.zone2.muted == false);
}

TEST_CASE("Most recent frame wins") {
    DeviceStateCache c;
    apply(c, "VOL(-350)");
    apply(c, "VOL(-300)");
    apply(c, "VOL -250");
    CHECK(c.snapshot().main.volume_tenths == -250);
    CHECK(c.snapshot().updates == 3);
}

TEST_CASE("Source name is dropped when the index changes without one") {
    DeviceStateCache c;
    apply(c, "SRC(1)\"DVD Player\"");
    CHECK(c.snapshot().main.source_name == "DVD Player");
    apply(c, "SRC(1)");
    CHECK(c.snapshot().main.source_name == "DVD Player");
    apply(c, "SRC(2)");
    CHECK(c.snapshot().main.source_index == 2);
    CHECK(c.snapshot().main.source_name.empty());
    apply(c, "ZSRC(0)\"Tuner\"");
    CHECK(c.snapshot().zone2.source_name == "Tuner");
}

TEST_CASE("Audio mode and audio type") {
    DeviceStateCache c;
    CHECK(apply(c, "AUDMODE(3)\"Lyngdorf\""));
    CHECK(apply(c, "AUDTYPE \"Dolby Atmos\""));
    auto s = c.snapshot();
    CHECK(s.audio_mode_index == 3);
    CHECK(s.audio_mode_name == "Lyngdorf");
    CHECK(s.audio_type == "Dolby Atmos");
}

TEST_CASE("Unknown verbs and missing fields leave state alone") {
    DeviceStateCache c;
    CHECK_FALSE(apply(c, "VERB(1)"));
    CHECK_FALSE(apply(c, "SRCCOUNT(4)"));
    CHECK_FALSE(apply(c, "VOL"));
    CHECK_FALSE(apply(c, "AUDTYPE"));
    CHECK(c.snapshot().updates == 0);
}

TEST_CASE("Subscribers receive the new snapshot and can unsubscribe") {
    DeviceStateCache c;
    std::vector<int> seen;
    int id = c.subscribe([&](const DeviceState& s) {
        seen.push_back(s.main.volume_tenths.value_or(0));
    });
    apply(c, "VOL(-100)");
    c.publish();
    c.unsubscribe(id);
    apply(c, "VOL(-90)");
    c.publish();
    REQUIRE(seen.size() == 1);
    CHECK(seen[0] == -100);
}
