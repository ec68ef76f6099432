#include "catch2/catch.hpp"
#include "runerip/decoder.h"

#include <string_view>
#include <tuple>
#include <vector>

using namespace runerip;
using namespace std::literals;

TEST_CASE("decode_step builds the code point a byte at a time", "[decoder]")
{
    using T = tables::utf8;

    SECTION("ascii accepts at once")
    {
        auto [state, cp] = decode_step<T>(T::accept, 0, 'A');
        REQUIRE(state == T::accept);
        REQUIRE(cp == U'A');
    }

    SECTION("three byte sequence")
    {
        auto [state, cp] = decode_step<T>(T::accept, 0, 0xE2);
        REQUIRE(state != T::accept);
        REQUIRE(state != T::reject);

        std::tie(state, cp) = decode_step<T>(state, cp, 0x82);
        REQUIRE(state != T::accept);
        REQUIRE(state != T::reject);

        std::tie(state, cp) = decode_step<T>(state, cp, 0xAC);
        REQUIRE(state == T::accept);
        REQUIRE(cp == 0x20AC);
    }

    SECTION("stray continuation rejects")
    {
        auto [state, cp] = decode_step<T>(T::accept, 0, 0x80);
        REQUIRE(state == T::reject);
        (void)cp;
    }

    SECTION("code point restarts after accept")
    {
        auto [state, cp] = decode_step<T>(T::accept, 0x20AC, 'z');
        REQUIRE(state == T::accept);
        REQUIRE(cp == U'z');
    }
}

TEST_CASE("Decoder carries state between bytes", "[decoder]")
{
    Decoder<> dec;
    REQUIRE(dec.complete());

    SECTION("four byte sequence")
    {
        auto bytes = "\xF0\x90\x8D\x88"sv;
        std::vector<step_result> results;
        char32_t last = 0;
        for (auto c : bytes) {
            auto [res, cp] = dec.feed(static_cast<unsigned char>(c));
            results.push_back(res);
            last = cp;
        }

        REQUIRE(results == std::vector<step_result>{step_result::pending,
                                   step_result::pending, step_result::pending,
                                   step_result::accepted});
        REQUIRE(last == 0x10348);
        REQUIRE(dec.complete());
    }

    SECTION("stays rejected until reset")
    {
        REQUIRE(dec.feed(0xE0).first == step_result::pending);
        REQUIRE(dec.feed(0x80).first == step_result::rejected);
        REQUIRE(dec.rejected());
        REQUIRE_FALSE(dec.complete());

        REQUIRE(dec.feed('a').first == step_result::rejected);

        dec.reset();
        REQUIRE(dec.complete());
        auto [res, cp] = dec.feed('a');
        REQUIRE(res == step_result::accepted);
        REQUIRE(cp == U'a');
    }

    SECTION("mid sequence is not complete")
    {
        REQUIRE(dec.feed(0xC3).first == step_result::pending);
        REQUIRE_FALSE(dec.complete());
        REQUIRE_FALSE(dec.rejected());
        REQUIRE(dec.state() != tables::utf8::accept);
    }
}

TEST_CASE("Decoder honours its table set", "[decoder]")
{
    SECTION("surrogate half")
    {
        Decoder<tables::utf8> strict;
        Decoder<tables::wtf8> loose;
        for (unsigned char b : {0xED, 0xA0}) {
            strict.feed(b);
            loose.feed(b);
        }
        REQUIRE(strict.rejected());
        REQUIRE_FALSE(loose.rejected());

        auto [res, cp] = loose.feed(0x80);
        REQUIRE(res == step_result::accepted);
        REQUIRE(cp == 0xD800);
    }

    SECTION("controls")
    {
        Decoder<tables::text> dec;
        REQUIRE(dec.feed('\t').first == step_result::accepted);
        REQUIRE(dec.feed(0x1B).first == step_result::rejected);
    }
}
