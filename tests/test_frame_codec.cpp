#include <doctest/doctest.h>
#include "p100link/frame_codec.hpp"

#include <string>

using namespace p100link;

TEST_CASE("encode_command wraps text in sentinel and terminator") {
    CHECK(encode_command("POWERONMAIN") == "!POWERONMAIN\r");
    CHECK(encode_command("VOL(-350)") == "!VOL(-350)\r");
}

TEST_CASE("Decoder buffers a frame split across reads") {
    FrameDecoder dec;
    auto f1 = dec.feed(std::string("!VOL(-3"));
    CHECK(f1.empty());
    CHECK(dec.buffered() == 7);

    auto f2 = dec.feed(std::string("50)\r#MU"));
    REQUIRE(f2.size() == 1);
    CHECK(f2[0].kind == FrameKind::Status);
    CHECK(f2[0].payload == "VOL(-350)");

    auto f3 = dec.feed(std::string("TEON\r"));
    REQUIRE(f3.size() == 1);
    CHECK(f3[0].kind == FrameKind::Echo);
    CHECK(f3[0].payload == "MUTEON");
    CHECK(dec.buffered() == 0);
}

TEST_CASE("Decoder returns several frames from one read, in order") {
    FrameDecoder dec;
    auto frames = dec.feed(std::string("!POWERONMAIN\r!VOL -350\r#VOL?\r"));
    REQUIRE(frames.size() == 3);
    CHECK(frames[0].payload == "POWERONMAIN");
    CHECK(frames[1].payload == "VOL -350");
    CHECK(frames[2].kind == FrameKind::Echo);
}

TEST_CASE("CRLF line endings and blank lines are tolerated") {
    FrameDecoder dec;
    auto frames = dec.feed(std::string("!MUTEOFF\r\n\r\n!SRC(2)\r\n"));
    REQUIRE(frames.size() == 2);
    CHECK(frames[0].payload == "MUTEOFF");
    CHECK(frames[1].payload == "SRC(2)");
}

TEST_CASE("Lines without a known sentinel are unrecognized") {
    FrameDecoder dec;
    auto frames = dec.feed(std::string("garbage\r"));
    REQUIRE(frames.size() == 1);
    CHECK(frames[0].kind == FrameKind::Unrecognized);
    CHECK(frames[0].payload == "garbage");
}

TEST_CASE("An oversized line is dropped and the decoder resyncs at the next terminator") {
    FrameDecoder dec;
    std::string junk(FrameDecoder::MAX_LINE + 10, 'A');
    CHECK(dec.feed(junk).empty());
    CHECK(dec.overflow_count() == 1);

    auto frames = dec.feed(std::string("tail\r!VOL(10)\r"));
    REQUIRE(frames.size() == 1);
    CHECK(frames[0].payload == "VOL(10)");
}

TEST_CASE("Command echoed at feedback level 2 decodes as an Echo with the same text") {
    const std::string wire = encode_command("POWERONMAIN");
    std::string echoed = wire;
    echoed[0] = '#';

    FrameDecoder dec;
    auto frames = dec.feed(echoed);
    REQUIRE(frames.size() == 1);
    CHECK(frames[0].kind == FrameKind::Echo);
    CHECK(frames[0].payload == "POWERONMAIN");
    CHECK(frame_line(frames[0]) == "#POWERONMAIN");
}
