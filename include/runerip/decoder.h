#ifndef RUNERIP_DECODER_H
#define RUNERIP_DECODER_H

#include "runerip/tables.h"

#include <cstdint>
#include <utility>

namespace runerip {

enum class step_result
{
    pending,
    accepted,
    rejected
};

/// Advances the automaton by one byte.
///
/// Returns the next state and the updated partial codepoint. On a lead
/// byte (state is accept) the codepoint restarts from the lead's value
/// bits, otherwise six more bits are shifted in. The codepoint is only
/// meaningful once the returned state is accept.
template <typename T = tables::utf8>
constexpr std::pair<uint32_t, char32_t> decode_step(uint32_t state,
        char32_t codepoint, unsigned char b)
{
    uint32_t cls = T::classes[b];
    if (state != T::accept)
        codepoint = (codepoint << 6) | (b & 0b00111111);
    else
        codepoint = b & T::masks[cls];

    return {T::transitions[state + cls], codepoint};
}

/// Resumable decoder; holds the automaton state between bytes, so input
/// can arrive in pieces of any size.
template <typename T = tables::utf8>
class Decoder
{
public:
    constexpr std::pair<step_result, char32_t> feed(unsigned char b);

    // true when not in the middle of a sequence
    constexpr bool complete() const { return m_state == T::accept; }
    constexpr bool rejected() const { return m_state == T::reject; }
    constexpr uint32_t state() const { return m_state; }

    constexpr void reset()
    {
        m_state = T::accept;
        m_codepoint = 0;
    }

private:
    uint32_t m_state = T::accept;
    char32_t m_codepoint = 0;
};

template <typename T>
constexpr std::pair<step_result, char32_t> Decoder<T>::feed(unsigned char b)
{
    // stays rejected until reset
    if (m_state == T::reject)
        return {step_result::rejected, 0};

    auto [state, cp] = decode_step<T>(m_state, m_codepoint, b);
    m_state = state;
    m_codepoint = cp;

    if (state == T::accept)
        return {step_result::accepted, cp};
    if (state == T::reject)
        return {step_result::rejected, 0};
    return {step_result::pending, 0};
}

} // namespace runerip

#endif // RUNERIP_DECODER_H
