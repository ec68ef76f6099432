#ifndef RUNERIP_VIEW_H
#define RUNERIP_VIEW_H

#include "runerip/error.h"
#include "runerip/tables.h"
#include "runerip/utf8.h"

#include <optional>
#include <string_view>

namespace runerip {

/// A borrowed buffer known to be well formed for table set T.
///
/// Views never own their bytes; the buffer must outlive the view and any
/// iterator made from it.
template <typename T = tables::utf8>
class View
{
public:
    class Iterator
    {
    public:
        explicit Iterator(std::string_view bytes) :
            m_bytes(bytes)
        {}

        // next code point, or nullopt once the view is used up
        std::optional<char32_t> next()
        {
            if (m_pos >= m_bytes.size())
                return std::nullopt;
            return decode_rune_assume_valid<T>(m_bytes, m_pos);
        }

        // bytes of the next code point, or nullopt once the view is used up
        std::optional<std::string_view> nextBytes()
        {
            if (m_pos >= m_bytes.size())
                return std::nullopt;

            auto start = m_pos;
            m_pos += sequence_length(m_pos);
            return m_bytes.substr(start, m_pos - start);
        }

        // bytes of the next n code points (fewer if the view runs out),
        // without moving the iterator
        std::string_view peek(std::size_t n) const
        {
            auto end = m_pos;
            for (; n > 0 && end < m_bytes.size(); n--)
                end += sequence_length(end);
            return m_bytes.substr(m_pos, end - m_pos);
        }

        std::size_t position() const { return m_pos; }

    private:
        std::size_t sequence_length(std::size_t pos) const
        {
            auto b = static_cast<unsigned char>(m_bytes[pos]);
            auto len = T::lengths[T::classes[b]];
            return len ? len : 1;
        }

        std::string_view m_bytes;
        std::size_t m_pos = 0;
    };

    // validates buf first; throws MalformedEncoding if it is not well formed
    static View fromValidated(std::string_view buf)
    {
        std::size_t cursor = 0;
        if (!validate<T>(buf, cursor))
            throw MalformedEncoding(cursor);
        return View(buf);
    }

    // caller promises buf is well formed; iterating anything else is
    // undefined
    static View fromTrusted(std::string_view buf) { return View(buf); }

    Iterator iterator() const { return Iterator(m_bytes); }
    std::string_view bytes() const { return m_bytes; }

private:
    explicit View(std::string_view bytes) :
        m_bytes(bytes)
    {}

    std::string_view m_bytes;
};

using Utf8View = View<tables::utf8>;
using Wtf8View = View<tables::wtf8>;
using TextView = View<tables::text>;

} // namespace runerip

#endif // RUNERIP_VIEW_H
