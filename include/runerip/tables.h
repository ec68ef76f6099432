#ifndef RUNERIP_TABLES_H
#define RUNERIP_TABLES_H

#include <array>
#include <cstdint>
#include <string_view>

namespace runerip {
namespace tables {

// byte classes, numbered the same in every table set
enum byte_class : uint8_t
{
    CLASS_ASCII = 0,    // 0x00..0x7F
    CLASS_CONT_80 = 1,  // 0x80..0x8F
    CLASS_LEAD2 = 2,    // 0xC2..0xDF
    CLASS_LEAD3 = 3,    // 0xE1..0xEC, 0xEE..0xEF
    CLASS_LEAD_ED = 4,  // 0xED
    CLASS_LEAD_F4 = 5,  // 0xF4
    CLASS_LEAD4 = 6,    // 0xF1..0xF3
    CLASS_CONT_A0 = 7,  // 0xA0..0xBF
    CLASS_INVALID = 8,  // 0xC0, 0xC1, 0xF5..0xFF
    CLASS_CONT_90 = 9,  // 0x90..0x9F
    CLASS_LEAD_E0 = 10, // 0xE0
    CLASS_LEAD_F0 = 11, // 0xF0
    CLASS_LEAD_C2 = 12  // 0xC2, text tables only
};

// automaton rows; a state is a row multiplied by the table's stride
enum dfa_row : uint8_t
{
    ROW_ACCEPT,
    ROW_REJECT,
    ROW_TAIL1,
    ROW_TAIL2,
    ROW_U3_E0,
    ROW_U3_ED,
    ROW_U4_F0,
    ROW_TAIL3,
    ROW_U4_F4,
    ROW_U2_C2
};

namespace detail {

// returns cls if i is within the given range (inclusive),
// and returns the provided default if not.
constexpr uint8_t class_entry(int low, int high, uint8_t cls, int i,
        uint8_t defval)
{
    return (low <= i && i <= high) ? cls : defval;
}

constexpr uint8_t utf8_class(int i)
{
    return
        class_entry(0x00, 0x7F, CLASS_ASCII, i,
        class_entry(0x80, 0x8F, CLASS_CONT_80, i,
        class_entry(0x90, 0x9F, CLASS_CONT_90, i,
        class_entry(0xA0, 0xBF, CLASS_CONT_A0, i,
        class_entry(0xC2, 0xDF, CLASS_LEAD2, i,
        class_entry(0xE0, 0xE0, CLASS_LEAD_E0, i,
        class_entry(0xE1, 0xEC, CLASS_LEAD3, i,
        class_entry(0xED, 0xED, CLASS_LEAD_ED, i,
        class_entry(0xEE, 0xEF, CLASS_LEAD3, i,
        class_entry(0xF0, 0xF0, CLASS_LEAD_F0, i,
        class_entry(0xF1, 0xF3, CLASS_LEAD4, i,
        class_entry(0xF4, 0xF4, CLASS_LEAD_F4, i,
        CLASS_INVALID))))))))))));
}

// source-like text: tab, newline and carriage return are the only
// controls allowed, and 0xC2 gets its own class so C1 controls can be
// refused at their second byte
constexpr uint8_t text_class(int i)
{
    if (i == '\t' || i == '\n' || i == '\r')
        return CLASS_ASCII;
    if (i < 0x20 || i == 0x7F)
        return CLASS_INVALID;
    if (i == 0xC2)
        return CLASS_LEAD_C2;
    return utf8_class(i);
}

constexpr std::array<uint8_t, 256> make_classes(uint8_t (*classify)(int))
{
    std::array<uint8_t, 256> arr{};
    for (int i = 0; i < 256; i++)
        arr[i] = classify(i);
    return arr;
}

// value bits kept from a lead byte of the given class
constexpr uint8_t class_mask(int cls)
{
    switch (cls) {
        case CLASS_ASCII:
            return 0b01111111;
        case CLASS_LEAD2:
        case CLASS_LEAD_C2:
            return 0b00011111;
        case CLASS_LEAD3:
        case CLASS_LEAD_ED:
        case CLASS_LEAD_E0:
            return 0b00001111;
        case CLASS_LEAD4:
        case CLASS_LEAD_F4:
        case CLASS_LEAD_F0:
            return 0b00000111;
        default:
            return 0;
    }
}

// total length of a sequence started by a byte of the given class;
// zero for bytes that never start one
constexpr uint8_t class_length(int cls)
{
    switch (cls) {
        case CLASS_ASCII:
            return 1;
        case CLASS_LEAD2:
        case CLASS_LEAD_C2:
            return 2;
        case CLASS_LEAD3:
        case CLASS_LEAD_ED:
        case CLASS_LEAD_E0:
            return 3;
        case CLASS_LEAD4:
        case CLASS_LEAD_F4:
        case CLASS_LEAD_F0:
            return 4;
        default:
            return 0;
    }
}

template <std::size_t Stride>
constexpr std::array<uint8_t, Stride> make_masks()
{
    std::array<uint8_t, Stride> arr{};
    for (std::size_t i = 0; i < Stride; i++)
        arr[i] = class_mask(static_cast<int>(i));
    return arr;
}

template <std::size_t Stride>
constexpr std::array<uint8_t, Stride> make_lengths()
{
    std::array<uint8_t, Stride> arr{};
    for (std::size_t i = 0; i < Stride; i++)
        arr[i] = class_length(static_cast<int>(i));
    return arr;
}

constexpr bool is_continuation(int cls)
{
    return cls == CLASS_CONT_80 || cls == CLASS_CONT_90 || cls == CLASS_CONT_A0;
}

// returns the row reached from a row on a byte of class cls. anything
// not explicitly allowed goes to the reject row.
constexpr uint8_t next_row(int from, int cls, bool surrogates)
{
    switch (from) {
        case ROW_ACCEPT:
            switch (cls) {
                case CLASS_ASCII:
                    return ROW_ACCEPT;
                case CLASS_LEAD2:
                    return ROW_TAIL1;
                case CLASS_LEAD_C2:
                    return ROW_U2_C2;
                case CLASS_LEAD3:
                    return ROW_TAIL2;
                case CLASS_LEAD_E0:
                    return ROW_U3_E0;
                case CLASS_LEAD_ED:
                    return ROW_U3_ED;
                case CLASS_LEAD4:
                    return ROW_TAIL3;
                case CLASS_LEAD_F0:
                    return ROW_U4_F0;
                case CLASS_LEAD_F4:
                    return ROW_U4_F4;
                default:
                    return ROW_REJECT;
            }
        case ROW_TAIL1:
            return is_continuation(cls) ? ROW_ACCEPT : ROW_REJECT;
        case ROW_TAIL2:
            return is_continuation(cls) ? ROW_TAIL1 : ROW_REJECT;
        case ROW_TAIL3:
            return is_continuation(cls) ? ROW_TAIL2 : ROW_REJECT;
        case ROW_U3_E0:
            // no overlong 3 byte sequences
            return cls == CLASS_CONT_A0 ? ROW_TAIL1 : ROW_REJECT;
        case ROW_U3_ED:
            // 0xED 0xA0..0xBF starts a surrogate half
            if (surrogates)
                return is_continuation(cls) ? ROW_TAIL1 : ROW_REJECT;
            return (cls == CLASS_CONT_80 || cls == CLASS_CONT_90) ? ROW_TAIL1 : ROW_REJECT;
        case ROW_U4_F0:
            // no overlong 4 byte sequences
            return (cls == CLASS_CONT_90 || cls == CLASS_CONT_A0) ? ROW_TAIL2 : ROW_REJECT;
        case ROW_U4_F4:
            // nothing past U+10FFFF
            return cls == CLASS_CONT_80 ? ROW_TAIL2 : ROW_REJECT;
        case ROW_U2_C2:
            // no C1 controls
            return cls == CLASS_CONT_A0 ? ROW_ACCEPT : ROW_REJECT;
        default:
            return ROW_REJECT;
    }
}

template <std::size_t Stride, std::size_t Rows>
constexpr std::array<uint8_t, Stride * Rows> make_transitions(bool surrogates)
{
    std::array<uint8_t, Stride * Rows> arr{};
    for (std::size_t r = 0; r < Rows; r++) {
        for (std::size_t cls = 0; cls < Stride; cls++) {
            auto to = next_row(static_cast<int>(r), static_cast<int>(cls), surrogates);
            arr[r * Stride + cls] = static_cast<uint8_t>(to * Stride);
        }
    }
    return arr;
}

} // namespace detail

/// Strict UTF-8 (RFC 3629): no overlongs, no surrogates, nothing past
/// U+10FFFF.
struct utf8
{
    static constexpr std::string_view name = "utf8";
    static constexpr uint32_t stride = 12;
    static constexpr uint32_t accept = ROW_ACCEPT * stride;
    static constexpr uint32_t reject = ROW_REJECT * stride;
    static constexpr bool ascii_passthrough = true;

    static constexpr std::array<uint8_t, 256> classes =
            detail::make_classes(detail::utf8_class);
    static constexpr std::array<uint8_t, stride> masks =
            detail::make_masks<stride>();
    static constexpr std::array<uint8_t, stride> lengths =
            detail::make_lengths<stride>();
    static constexpr std::array<uint8_t, stride * 9> transitions =
            detail::make_transitions<stride, 9>(false);
};

/// WTF-8: UTF-8 that also carries encoded surrogate halves.
struct wtf8
{
    static constexpr std::string_view name = "wtf8";
    static constexpr uint32_t stride = 12;
    static constexpr uint32_t accept = ROW_ACCEPT * stride;
    static constexpr uint32_t reject = ROW_REJECT * stride;
    static constexpr bool ascii_passthrough = true;

    static constexpr std::array<uint8_t, 256> classes =
            detail::make_classes(detail::utf8_class);
    static constexpr std::array<uint8_t, stride> masks =
            detail::make_masks<stride>();
    static constexpr std::array<uint8_t, stride> lengths =
            detail::make_lengths<stride>();
    static constexpr std::array<uint8_t, stride * 9> transitions =
            detail::make_transitions<stride, 9>(true);
};

/// Strict UTF-8 restricted to source-like text: no C0 controls other
/// than tab, newline and carriage return, no DEL, no C1 controls.
struct text
{
    static constexpr std::string_view name = "text";
    static constexpr uint32_t stride = 13;
    static constexpr uint32_t accept = ROW_ACCEPT * stride;
    static constexpr uint32_t reject = ROW_REJECT * stride;
    static constexpr bool ascii_passthrough = false;

    static constexpr std::array<uint8_t, 256> classes =
            detail::make_classes(detail::text_class);
    static constexpr std::array<uint8_t, stride> masks =
            detail::make_masks<stride>();
    static constexpr std::array<uint8_t, stride> lengths =
            detail::make_lengths<stride>();
    static constexpr std::array<uint8_t, stride * 10> transitions =
            detail::make_transitions<stride, 10>(false);
};

} // namespace tables
} // namespace runerip

#endif // RUNERIP_TABLES_H
