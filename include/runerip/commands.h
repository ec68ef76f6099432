#ifndef RUNERIP_COMMANDS_H
#define RUNERIP_COMMANDS_H

#include "runerip/tables.h"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace runerip {

enum class encoding
{
    utf8,
    wtf8,
    text
};

std::optional<encoding> parse_encoding(std::string_view name);
std::string_view encoding_name(encoding enc);

// true for the command names the tool accepts
bool is_command(std::string_view name);

// calls f with an instance of the table set for enc
template <typename F>
decltype(auto) with_tables(encoding enc, F&& f)
{
    switch (enc) {
        case encoding::wtf8:
            return f(tables::wtf8{});
        case encoding::text:
            return f(tables::text{});
        case encoding::utf8:
        default:
            return f(tables::utf8{});
    }
}

struct StreamTotals
{
    std::size_t runes = 0;
    std::size_t bytes = 0;
    uint64_t sum = 0;
};

// the operations behind the command line tool. each throws
// MalformedEncoding if the input is not well formed for enc.

std::size_t count_runes(encoding enc, std::string_view buf);
uint64_t sum_runes(encoding enc, std::string_view buf);
std::u16string transcode(encoding enc, std::string_view buf);

// offset of the first bad byte, nullopt if buf is well formed
std::optional<std::size_t> find_malformed(encoding enc, std::string_view buf);

// reads path (stdin for "" or "-") chunk_size bytes at a time through a
// StreamCounter. also throws IoError.
StreamTotals stream_count(encoding enc, const std::string& path,
        std::size_t chunk_size);

// file helpers; "" or "-" mean stdin/stdout. throw IoError.
std::string read_input(const std::string& path);
void write_output(const std::string& path, std::string_view data);

} // namespace runerip

#endif // RUNERIP_COMMANDS_H
