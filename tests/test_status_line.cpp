#include <doctest/doctest.h>
#include "p100link/status_line.hpp"

using namespace p100link;

TEST_CASE("Bare verb") {
    StatusLine l;
    REQUIRE(parse_status_line("POWERONMAIN", l));
    CHECK(l.verb == "POWERONMAIN");
    CHECK_FALSE(l.has_value);
    CHECK_FALSE(l.has_text);
}

TEST_CASE("Integer field in parentheses or after a space") {
    StatusLine a, b;
    REQUIRE(parse_status_line("VOL(-350)", a));
    REQUIRE(parse_status_line("VOL -350", b));
    CHECK(a.verb == "VOL");
    CHECK(b.verb == "VOL");
    CHECK(a.has_value);
    CHECK(b.has_value);
    CHECK(a.value == -350);
    CHECK(b.value == -350);
}

TEST_CASE("Index with quoted name") {
    StatusLine l;
    REQUIRE(parse_status_line("SRC(2)\"DVD Player\"", l));
    CHECK(l.verb == "SRC");
    CHECK(l.value == 2);
    CHECK(l.has_text);
    CHECK(l.text == "DVD Player");
}

TEST_CASE("Quoted text alone, with or without parentheses") {
    StatusLine a, b;
    REQUIRE(parse_status_line("AUDTYPE(\"Dolby Atmos\")", a));
    REQUIRE(parse_status_line("AUDTYPE \"PCM 2.0\"", b));
    CHECK(a.text == "Dolby Atmos");
    CHECK(b.text == "PCM 2.0");
    CHECK_FALSE(a.has_value);
}

TEST_CASE("Verbs with digits") {
    StatusLine l;
    REQUIRE(parse_status_line("POWERZONE2(1)", l));
    CHECK(l.verb == "POWERZONE2");
    CHECK(l.value == 1);
}

TEST_CASE("Malformed payloads are rejected") {
    StatusLine l;
    CHECK_FALSE(parse_status_line("", l));
    CHECK_FALSE(parse_status_line("vol(1)", l));
    CHECK_FALSE(parse_status_line("VOL(", l));
    CHECK_FALSE(parse_status_line("VOL(abc)", l));
    CHECK_FALSE(parse_status_line("SRC(1)\"unterminated", l));
    CHECK_FALSE(parse_status_line("VOL(1) trailing", l));
}

TEST_CASE("parse_int is strict") {
    int v = 0;
    CHECK(parse_int("-999", v));
    CHECK(v == -999);
    CHECK(parse_int("+24", v));
    CHECK(v == 24);
    CHECK_FALSE(parse_int("", v));
    CHECK_FALSE(parse_int("12x", v));
    CHECK_FALSE(parse_int(" 1", v));
    CHECK_FALSE(parse_int("99999999999", v));
}
