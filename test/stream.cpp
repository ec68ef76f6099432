#include "catch2/catch.hpp"
#include "runerip/error.h"
#include "runerip/stream.h"
#include "runerip/utf8.h"

#include <string_view>

using namespace runerip;
using namespace std::literals;

extern const char* sample_text;

TEST_CASE("streams split sequences anywhere", "[stream]")
{
    SECTION("one sequence over two chunks")
    {
        StreamCounter<> counter;
        counter.feed("\xE2"sv);
        REQUIRE(counter.runes() == 0);
        counter.feed("\x82\xAC"sv);

        REQUIRE(counter.finish() == 1);
        REQUIRE(counter.bytes() == 3);
        REQUIRE(counter.sum() == 0x20AC);
    }

    SECTION("every chunk size")
    {
        std::string_view v{sample_text};
        auto expected = count(v);

        uint64_t expected_sum = 0;
        for (std::size_t cursor = 0; cursor < v.size();)
            expected_sum += *decode_rune(v, cursor);

        for (std::size_t size = 1; size <= 9; size++) {
            INFO("chunk size " << size);
            StreamCounter<tables::text> counter;
            for (std::size_t pos = 0; pos < v.size(); pos += size)
                counter.feed(v.substr(pos, size));

            REQUIRE(counter.finish() == expected);
            REQUIRE(counter.bytes() == v.size());
            REQUIRE(counter.sum() == expected_sum);
        }
    }

    SECTION("empty stream")
    {
        StreamCounter<> counter;
        counter.feed(""sv);
        REQUIRE(counter.finish() == 0);
    }
}

TEST_CASE("stream offsets count from the start", "[stream]")
{
    SECTION("bad byte in a later chunk")
    {
        StreamCounter<> counter;
        counter.feed("ab"sv);
        try {
            counter.feed("c\xFF"sv);
            FAIL("expected MalformedEncoding");
        } catch (const MalformedEncoding& e) {
            REQUIRE(e.offset() == 3);
        }
    }

    SECTION("stream ends mid sequence")
    {
        StreamCounter<> counter;
        counter.feed("a\xF0\x9F"sv);
        counter.feed("\x98"sv);
        try {
            counter.finish();
            FAIL("expected MalformedEncoding");
        } catch (const MalformedEncoding& e) {
            REQUIRE(e.offset() == 1);
        }
    }

    SECTION("surrogates under wtf8")
    {
        StreamCounter<tables::wtf8> loose;
        loose.feed("\xED\xA0"sv);
        loose.feed("\x80"sv);
        REQUIRE(loose.finish() == 1);

        StreamCounter<tables::utf8> strict;
        strict.feed("\xED"sv);
        REQUIRE_THROWS_AS(strict.feed("\xA0\x80"sv), MalformedEncoding);
    }
}
