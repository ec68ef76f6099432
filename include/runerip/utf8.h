#ifndef RUNERIP_UTF8_H
#define RUNERIP_UTF8_H

#include "runerip/decoder.h"
#include "runerip/error.h"
#include "runerip/tables.h"

#include <array>
#include <bit>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <tuple>

namespace runerip {

constexpr int utf_size = 4;
constexpr char32_t utf_max = 0x10FFFF;

namespace detail {

inline const unsigned char* bytes(std::string_view buf)
{
    return reinterpret_cast<const unsigned char*>(buf.data());
}

// utf-16 units are written little endian whatever the host order
constexpr char16_t to_little_endian(char32_t unit)
{
    auto u = static_cast<uint16_t>(unit);
    if constexpr (std::endian::native == std::endian::big)
        u = static_cast<uint16_t>((u << 8) | (u >> 8));
    return static_cast<char16_t>(u);
}

// writes cp as 1-4 bytes, surrogates included. returns the byte count,
// or zero if cp is past the last code point.
constexpr std::size_t encode_bytes(char32_t cp, std::array<unsigned char, utf_size>& c)
{
    if (cp <= 0x0000007F) {
        // 0xxxxxxx
        c[0] = cp & 0b01111111;

        return 1;
    } else if (cp <= 0x000007FF) {
        // 110xxxxx
        c[0] = 0b11000000 | (cp >> 6 & 0b00011111);
        // 10xxxxxx
        c[1] = 0b10000000 | (cp & 0b00111111);

        return 2;
    } else if (cp <= 0x0000FFFF) {
        // 1110xxxx
        c[0] = 0b11100000 | (cp >> 12 & 0b00001111);
        // 10xxxxxx
        c[1] = 0b10000000 | (cp >> 6 & 0b00111111);
        // 10xxxxxx
        c[2] = 0b10000000 | (cp & 0b00111111);

        return 3;
    } else if (cp <= utf_max) {
        // 11110xxx
        c[0] = 0b11110000 | (cp >> 18 & 0b00000111);
        // 10xxxxxx
        c[1] = 0b10000000 | (cp >> 12 & 0b00111111);
        // 10xxxxxx
        c[2] = 0b10000000 | (cp >> 6 & 0b00111111);
        // 10xxxxxx
        c[3] = 0b10000000 | (cp & 0b00111111);

        return 4;
    }

    return 0;
}

} // namespace detail

/// Decodes the code point starting at cursor.
///
/// On success the cursor is moved past the sequence. On failure it is
/// left at the byte that was rejected, or at the lead byte if the buffer
/// ends before the sequence does; nothing past the end is read.
/// cursor must be less than buf.size(); otherwise nothing is decoded and
/// the cursor is not moved.
template <typename T = tables::utf8>
inline std::optional<char32_t> decode_rune(std::string_view buf, std::size_t& cursor)
{
    if (cursor >= buf.size())
        return std::nullopt;

    auto p = detail::bytes(buf);

    // the lead says how long the sequence is, make sure all of it is here
    if (buf.size() - cursor < T::lengths[T::classes[p[cursor]]])
        return std::nullopt;

    // lengths[] bounds this walk; the automaton accepts or rejects by
    // the last byte of the sequence
    uint32_t state = T::accept;
    char32_t cp = 0;
    for (;;) {
        std::tie(state, cp) = decode_step<T>(state, cp, p[cursor]);
        if (state == T::reject)
            return std::nullopt;

        cursor++;
        if (state == T::accept)
            return cp;
    }
}

/// Decodes the code point starting at cursor, which must start a well
/// formed sequence with all of its bytes inside buf. Nothing is checked;
/// meant for buffers that already passed validate().
template <typename T = tables::utf8>
inline char32_t decode_rune_assume_valid(std::string_view buf, std::size_t& cursor)
{
    auto p = detail::bytes(buf) + cursor;
    auto cls = T::classes[p[0]];
    char32_t cp = p[0] & T::masks[cls];

    switch (T::lengths[cls]) {
        case 4:
            cp = (cp << 6) | (p[1] & 0b00111111);
            cp = (cp << 6) | (p[2] & 0b00111111);
            cp = (cp << 6) | (p[3] & 0b00111111);
            cursor += 4;
            break;
        case 3:
            cp = (cp << 6) | (p[1] & 0b00111111);
            cp = (cp << 6) | (p[2] & 0b00111111);
            cursor += 3;
            break;
        case 2:
            cp = (cp << 6) | (p[1] & 0b00111111);
            cursor += 2;
            break;
        default:
            cursor++;
            break;
    }

    return cp;
}

/// Checks that buf, from cursor on, is well formed.
///
/// On success the cursor ends at buf.size(). On failure it points at the
/// rejected byte, or at the lead byte of a sequence the buffer cuts off.
template <typename T = tables::utf8>
bool validate(std::string_view buf, std::size_t& cursor)
{
    auto p = detail::bytes(buf);
    uint32_t state = T::accept;
    std::size_t start = cursor;

    for (std::size_t i = cursor; i < buf.size(); i++) {
        auto b = p[i];
        if (state == T::accept) {
            // ascii never leaves the accept state
            if (T::ascii_passthrough && b < 0x80)
                continue;
            start = i;
        }

        state = T::transitions[state + T::classes[b]];
        if (state == T::reject) {
            cursor = i;
            return false;
        }
    }

    if (state != T::accept) {
        cursor = start;
        return false;
    }

    cursor = buf.size();
    return true;
}

/// Checks that all of buf is well formed.
template <typename T = tables::utf8>
bool validate(std::string_view buf)
{
    std::size_t cursor = 0;
    return validate<T>(buf, cursor);
}

/// Counts the code points in buf. Throws MalformedEncoding if it is not
/// well formed.
template <typename T = tables::utf8>
std::size_t count(std::string_view buf)
{
    std::size_t n = 0;
    std::size_t cursor = 0;
    while (cursor < buf.size()) {
        if (!decode_rune<T>(buf, cursor))
            throw MalformedEncoding(cursor);
        n++;
    }

    return n;
}

// utf-16 units needed to transcode len bytes; no sequence produces more
// units than it has bytes
constexpr std::size_t utf16_capacity(std::size_t len)
{
    return len;
}

/// Transcodes src to little endian UTF-16 in dest, which must have room
/// for utf16_capacity(src.size()) units. Returns the number of units
/// written. Code points past U+FFFF become surrogate pairs; surrogate
/// halves accepted by the table set are written as single units.
///
/// Throws MalformedEncoding if src is not well formed; its written()
/// tells how many units were stored before the bad byte.
template <typename T = tables::utf8>
std::size_t transcode_utf16(char16_t* dest, std::string_view src)
{
    auto p = detail::bytes(src);
    uint32_t state = T::accept;
    char32_t cp = 0;
    std::size_t out = 0;
    std::size_t start = 0;

    for (std::size_t i = 0; i < src.size(); i++) {
        auto b = p[i];
        if (state == T::accept) {
            if (T::ascii_passthrough && b < 0x80) {
                dest[out++] = detail::to_little_endian(b);
                continue;
            }
            start = i;
        }

        std::tie(state, cp) = decode_step<T>(state, cp, b);
        if (state == T::accept) {
            if (cp <= 0xFFFF) {
                dest[out++] = detail::to_little_endian(cp);
            } else {
                dest[out++] = detail::to_little_endian(((cp - 0x10000) >> 10) + 0xD800);
                dest[out++] = detail::to_little_endian((cp & 0x3FF) + 0xDC00);
            }
        } else if (state == T::reject) {
            throw MalformedEncoding(i, out);
        }
    }

    if (state != T::accept)
        throw MalformedEncoding(start, out);

    return out;
}

/// Transcodes src to a little endian UTF-16 string.
template <typename T = tables::utf8>
std::u16string to_utf16(std::string_view src)
{
    std::u16string out(utf16_capacity(src.size()), u'\0');
    out.resize(transcode_utf16<T>(out.data(), src));
    return out;
}

/// Encodes cp to dest, writing nothing if the table set would not
/// decode the result (past U+10FFFF, surrogates outside WTF-8, controls
/// refused by the text tables).
template <typename T = tables::utf8, typename OutputIt, typename OutType = char>
constexpr OutputIt encode(char32_t cp, OutputIt dest)
{
    std::array<unsigned char, utf_size> buf{};
    auto len = detail::encode_bytes(cp, buf);
    if (!len)
        return dest;

    uint32_t state = T::accept;
    for (std::size_t i = 0; i < len; i++)
        state = T::transitions[state + T::classes[buf[i]]];
    if (state != T::accept)
        return dest;

    for (std::size_t i = 0; i < len; i++)
        *dest++ = static_cast<OutType>(buf[i]);

    return dest;
}

/// Number of bytes encode() writes for cp; zero if it writes none.
template <typename T = tables::utf8>
constexpr std::size_t encoded_size(char32_t cp)
{
    std::array<char, utf_size> buf{};
    return encode<T>(cp, buf.begin()) - buf.begin();
}

// the bulk operations are compiled once per table set in the library
#define RUNERIP_ENGINE(ext, T)                                                 \
    ext template bool validate<T>(std::string_view, std::size_t&);             \
    ext template bool validate<T>(std::string_view);                           \
    ext template std::size_t count<T>(std::string_view);                       \
    ext template std::size_t transcode_utf16<T>(char16_t*, std::string_view);  \
    ext template std::u16string to_utf16<T>(std::string_view);

RUNERIP_ENGINE(extern, tables::utf8)
RUNERIP_ENGINE(extern, tables::wtf8)
RUNERIP_ENGINE(extern, tables::text)

} // namespace runerip

#endif // RUNERIP_UTF8_H
