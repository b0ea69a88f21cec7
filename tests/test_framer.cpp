#include <doctest/doctest.h>
#include "serialhub/framer.hpp"

#include <string>
#include <vector>

using namespace serialhub;

static std::vector<std::string> frame_whole(const std::string& stream) {
    LineFramer f;
    std::vector<std::string> out;
    f.feed(stream, out);
    return out;
}

TEST_CASE("A line split across two reads comes out once") {
    LineFramer f;
    std::vector<std::string> out;

    REQUIRE(f.feed("O", out) == LineFramer::FeedResult::Ok);
    CHECK(out.empty());
    CHECK(f.buffered() == 1);

    REQUIRE(f.feed("K\n", out) == LineFramer::FeedResult::Ok);
    REQUIRE(out.size() == 1);
    CHECK(out[0] == "OK");
    CHECK(f.buffered() == 0);
}

TEST_CASE("Several lines in one read are emitted in order") {
    auto out = frame_whole("one\ntwo\nthree\npart");
    REQUIRE(out.size() == 3);
    CHECK(out[0] == "one");
    CHECK(out[1] == "two");
    CHECK(out[2] == "three");
}

TEST_CASE("Framing does not depend on where the reads split the stream") {
    // Two-, three- and four-byte code points so splits land inside sequences.
    const std::string stream = "temp=21.5\xC2\xB0" "C\r\n"
                               "\xE2\x9C\x93 ok\n"
                               "\n"
                               "  \xF0\x9F\x98\x80 smile  \n"
                               "tail";
    const auto expected = frame_whole(stream);
    REQUIRE(expected.size() == 3);

    for (std::size_t a = 0; a <= stream.size(); ++a) {
        for (std::size_t b = a; b <= stream.size(); ++b) {
            LineFramer f;
            std::vector<std::string> out;
            REQUIRE(f.feed(stream.substr(0, a), out) == LineFramer::FeedResult::Ok);
            REQUIRE(f.feed(stream.substr(a, b - a), out) == LineFramer::FeedResult::Ok);
            REQUIRE(f.feed(stream.substr(b), out) == LineFramer::FeedResult::Ok);
            CHECK(out == expected);
        }
    }
}

TEST_CASE("Surrounding whitespace is trimmed and blank lines are skipped") {
    auto out = frame_whole("  hello \r\n\r\n\t\nworld\r\n");
    REQUIRE(out.size() == 2);
    CHECK(out[0] == "hello");
    CHECK(out[1] == "world");
}

TEST_CASE("A chunk with invalid UTF-8 is dropped without poisoning the buffer") {
    LineFramer f;
    std::vector<std::string> out;

    REQUIRE(f.feed("ab", out) == LineFramer::FeedResult::Ok);
    CHECK(f.feed(std::string("\xFF" "zz\n"), out) == LineFramer::FeedResult::InvalidUtf8);
    CHECK(out.empty());

    REQUIRE(f.feed("c\n", out) == LineFramer::FeedResult::Ok);
    REQUIRE(out.size() == 1);
    CHECK(out[0] == "abc");
}

TEST_CASE("A truncated sequence followed by a bad chunk is discarded with it") {
    LineFramer f;
    std::vector<std::string> out;

    REQUIRE(f.feed(std::string("x\xE2\x9C"), out) == LineFramer::FeedResult::Ok);   // carry E2 9C
    CHECK(f.feed(std::string("A\n"), out) == LineFramer::FeedResult::InvalidUtf8);   // E2 9C 41
    REQUIRE(f.feed("y\n", out) == LineFramer::FeedResult::Ok);
    REQUIRE(out.size() == 1);
    CHECK(out[0] == "xy");
}

TEST_CASE("scan_utf8 rejects overlongs and surrogates, reports a cut-off tail") {
    std::size_t complete = 0;
    CHECK_FALSE(scan_utf8(std::string("\xC0\xAF"), complete));          // overlong '/'
    CHECK_FALSE(scan_utf8(std::string("\xED\xA0\x80"), complete));      // U+D800
    CHECK_FALSE(scan_utf8(std::string("\xF4\x90\x80\x80"), complete));  // > U+10FFFF

    REQUIRE(scan_utf8(std::string("ab\xF0\x9F"), complete));
    CHECK(complete == 2);
    REQUIRE(scan_utf8(std::string("ab\xC3\xA9"), complete));
    CHECK(complete == 4);
}

TEST_CASE("reset() forgets a partial line") {
    LineFramer f;
    std::vector<std::string> out;
    f.feed("stale", out);
    f.reset();
    CHECK(f.buffered() == 0);
    f.feed("fresh\n", out);
    REQUIRE(out.size() == 1);
    CHECK(out[0] == "fresh");
}
