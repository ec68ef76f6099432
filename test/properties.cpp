#include "catch2/catch.hpp"
#include "fmt/format.h"
#include "runerip/decoder.h"
#include "runerip/error.h"
#include "runerip/stream.h"
#include "runerip/utf8.h"
#include "runerip/view.h"

#include <array>
#include <iterator>
#include <optional>
#include <random>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

using namespace runerip;

namespace {

// (offset after the code point, code point)
using decoded = std::vector<std::pair<std::size_t, char32_t>>;

std::string hex(std::string_view b)
{
    std::string out;
    for (auto c : b)
        fmt::format_to(std::back_inserter(out), "{:02x} ", static_cast<unsigned char>(c));
    return out;
}

// runs every whole-buffer operation over b and returns a description of
// the first disagreement, or an empty string if they all agree
template <typename T>
std::string cross_check(std::string_view b)
{
    std::size_t cursor = 0;
    bool valid = validate<T>(b, cursor);
    if (valid != validate<T>(b))
        return "validate forms disagree";

    std::optional<std::size_t> counted;
    try {
        counted = count<T>(b);
    } catch (const MalformedEncoding&) {
    }
    if (counted.has_value() != valid)
        return "count and validate disagree";

    bool transcoded = true;
    std::vector<char16_t> dest(utf16_capacity(b.size()) + 1);
    try {
        transcode_utf16<T>(dest.data(), b);
    } catch (const MalformedEncoding& e) {
        transcoded = false;
        if (e.offset() != cursor)
            return "transcode and validate report different offsets";
    }
    if (transcoded != valid)
        return "transcode and validate disagree";

    bool viewed = true;
    try {
        View<T>::fromValidated(b);
    } catch (const MalformedEncoding& e) {
        viewed = false;
        if (e.offset() != cursor)
            return "view and validate report different offsets";
    }
    if (viewed != valid)
        return "view and validate disagree";

    StreamCounter<T> stream;
    bool streamed = true;
    try {
        stream.feed(b);
        stream.finish();
    } catch (const MalformedEncoding& e) {
        streamed = false;
        if (e.offset() != cursor)
            return "stream and validate report different offsets";
    }
    if (streamed != valid)
        return "stream and validate disagree";

    if (!valid)
        return {};

    decoded by_cursor;
    for (std::size_t c = 0; c < b.size();) {
        auto cp = decode_rune<T>(b, c);
        if (!cp)
            return "decode_rune failed on valid input";
        by_cursor.emplace_back(c, *cp);
    }

    decoded by_iterator;
    auto it = View<T>::fromTrusted(b).iterator();
    while (auto cp = it.next())
        by_iterator.emplace_back(it.position(), *cp);

    decoded by_decoder;
    Decoder<T> dec;
    for (std::size_t i = 0; i < b.size(); i++) {
        auto [res, cp] = dec.feed(static_cast<unsigned char>(b[i]));
        if (res == step_result::accepted)
            by_decoder.emplace_back(i + 1, cp);
    }

    if (by_cursor.size() != *counted || stream.runes() != *counted)
        return "count differs from the decoded code points";
    if (by_iterator != by_cursor)
        return "iterator and decode_rune disagree";
    if (by_decoder != by_cursor)
        return "Decoder and decode_rune disagree";

    return {};
}

void check_all(std::string_view b)
{
    for (auto msg : {cross_check<tables::utf8>(b),
                 cross_check<tables::wtf8>(b),
                 cross_check<tables::text>(b)}) {
        if (!msg.empty())
            FAIL(msg << " for " << hex(b));
    }
}

// one byte from each side of every class boundary; the automaton only
// sees classes, so these stand in for all 256 bytes
constexpr std::array<unsigned char, 34> class_edges = {
        0x00, 0x01, 0x09, 0x0A, 0x0D, 0x1F, 0x20, 0x41, 0x7E, 0x7F,
        0x80, 0x8F, 0x90, 0x9F, 0xA0, 0xBF, 0xC0, 0xC1, 0xC2, 0xC3,
        0xDF, 0xE0, 0xE1, 0xEC, 0xED, 0xEE, 0xEF, 0xF0, 0xF1, 0xF3,
        0xF4, 0xF5, 0xFE, 0xFF};

} // namespace

TEST_CASE("operations agree on every short buffer", "[utf8][properties]")
{
    SECTION("empty buffer")
    {
        check_all({});
    }

    SECTION("every one and two byte buffer")
    {
        std::string b(2, '\0');
        for (int i = 0; i < 256; i++) {
            b[0] = static_cast<char>(i);
            check_all(std::string_view(b).substr(0, 1));
            for (int j = 0; j < 256; j++) {
                b[1] = static_cast<char>(j);
                check_all(b);
            }
        }
    }

    SECTION("every three byte buffer over the class edges")
    {
        std::string b(3, '\0');
        for (auto x : class_edges) {
            b[0] = static_cast<char>(x);
            for (auto y : class_edges) {
                b[1] = static_cast<char>(y);
                for (auto z : class_edges) {
                    b[2] = static_cast<char>(z);
                    check_all(b);
                }
            }
        }
    }

    SECTION("every lead followed by the class edges")
    {
        std::string b(3, '\0');
        for (int x = 0x80; x < 256; x++) {
            b[0] = static_cast<char>(x);
            for (auto y : class_edges) {
                b[1] = static_cast<char>(y);
                for (auto z : class_edges) {
                    b[2] = static_cast<char>(z);
                    check_all(b);
                }
            }
        }
    }
}

TEST_CASE("operations agree on random buffers", "[utf8][properties]")
{
    // mostly boundary bytes, with some ascii so sequences line up
    constexpr std::array<unsigned char, 16> pool = {
            0x7F, 0x80, 0x8F, 0x90, 0x9F, 0xA0, 0xBF, 0xC0,
            0xC2, 0xE0, 0xED, 0xF0, 0xF4, 0xF5, 'a', '\n'};

    std::mt19937 rng(20240611);
    std::uniform_int_distribution<std::size_t> length(1, 7);
    std::uniform_int_distribution<std::size_t> pick(0, pool.size() - 1);

    std::string b;
    for (int n = 0; n < 50000; n++) {
        b.resize(length(rng));
        for (auto& c : b)
            c = static_cast<char>(pool[pick(rng)]);
        check_all(b);
    }
}

TEST_CASE("operations agree on valid text split anywhere", "[utf8][properties]")
{
    std::string b = "a\xC3\xA9\xE2\x82\xAC\xF0\x9F\x98\x80\xED\x9F\xBF\xF4\x8F\xBF\xBF";
    for (std::size_t start = 0; start < b.size(); start++) {
        for (std::size_t len = 0; start + len <= b.size(); len++)
            check_all(std::string_view(b).substr(start, len));
    }
}
