#include <doctest/doctest.h>
#include "p100link/controls/name_match.hpp"

#include <string>
#include <vector>

using namespace p100link;

static const std::vector<NamedEntry> SOURCES = {
    {0, "Blu-ray"}, {1, "DVD Player"}, {2, "Tuner"}
};

TEST_CASE("Unique substring match selects the entry") {
    NamedEntry e;
    Error err;
    REQUIRE(select_by_name(SOURCES, "DVD", e, err));
    CHECK(e.index == 1);
}

TEST_CASE("Several substring matches are ambiguous") {
    NamedEntry e;
    Error err;
    CHECK_FALSE(select_by_name(SOURCES, "er", e, err));
    CHECK(err.code == ErrorCode::Ambiguous);
    CHECK(err.detail.find("DVD Player") != std::string::npos);
    CHECK(err.detail.find("Tuner") != std::string::npos);
}

TEST_CASE("A single letter contained in one name is not ambiguous") {
    NamedEntry e;
    Error err;
    REQUIRE(select_by_name(SOURCES, "d", e, err));
    CHECK(e.index == 1);
}

TEST_CASE("Exact match wins over substring matches, ignoring case") {
    const std::vector<NamedEntry> entries = {{0, "TV"}, {1, "TV Box"}};
    NamedEntry e;
    Error err;
    REQUIRE(select_by_name(entries, "tv", e, err));
    CHECK(e.index == 0);
}

TEST_CASE("No match and empty selector") {
    NamedEntry e;
    Error err;
    CHECK_FALSE(select_by_name(SOURCES, "Phono", e, err));
    CHECK(err.code == ErrorCode::NotFound);
    Error err2;
    CHECK_FALSE(select_by_name(SOURCES, "", e, err2));
    CHECK(err2.code == ErrorCode::InvalidArgument);
}

TEST_CASE("Numeric selectors are indices") {
    NamedEntry e;
    Error err;
    REQUIRE(select_by_name(SOURCES, "2", e, err));
    CHECK(e.name == "Tuner");
    CHECK_FALSE(select_by_name(SOURCES, "7", e, err));
    CHECK(err.code == ErrorCode::NotFound);
}

TEST_CASE("Neighbours wrap around in list order") {
    NamedEntry e;
    Error err;
    REQUIRE(neighbour_entry(SOURCES, 2, true, e, err));
    CHECK(e.index == 0);
    REQUIRE(neighbour_entry(SOURCES, 0, false, e, err));
    CHECK(e.index == 2);
    REQUIRE(neighbour_entry(SOURCES, 9, true, e, err));
    CHECK(e.index == 0);
    CHECK_FALSE(neighbour_entry({}, 0, true, e, err));
}
