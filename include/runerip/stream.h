#ifndef RUNERIP_STREAM_H
#define RUNERIP_STREAM_H

#include "runerip/decoder.h"
#include "runerip/error.h"
#include "runerip/tables.h"

#include <cstdint>
#include <string_view>

namespace runerip {

/// Validates and counts input that arrives in pieces. Sequences may be
/// split across pieces anywhere; the decoder state carries over.
template <typename T = tables::utf8>
class StreamCounter
{
public:
    // feeds the next piece of input. throws MalformedEncoding with the
    // offset counted from the start of the stream.
    void feed(std::string_view chunk)
    {
        for (auto c : chunk) {
            if (m_decoder.complete())
                m_start = m_bytes;

            auto [res, cp] = m_decoder.feed(static_cast<unsigned char>(c));
            if (res == step_result::rejected)
                throw MalformedEncoding(m_bytes);

            m_bytes++;
            if (res == step_result::accepted) {
                m_runes++;
                m_sum += cp;
            }
        }
    }

    // ends the stream. throws MalformedEncoding (at the sequence's lead
    // byte) if it ended in the middle of a sequence.
    std::size_t finish() const
    {
        if (!m_decoder.complete())
            throw MalformedEncoding(m_start);
        return m_runes;
    }

    std::size_t runes() const { return m_runes; }
    std::size_t bytes() const { return m_bytes; }
    uint64_t sum() const { return m_sum; }

private:
    Decoder<T> m_decoder;
    std::size_t m_runes = 0;
    std::size_t m_bytes = 0;
    std::size_t m_start = 0;
    uint64_t m_sum = 0;
};

} // namespace runerip

#endif // RUNERIP_STREAM_H
