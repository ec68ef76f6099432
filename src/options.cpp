#include "lua/config.h"
#include "lua/state.h"
#include "runerip/logging.h"
#include "runerip/options.h"

#define LOGGER() (runerip::logging::get("options"))

namespace runerip {

void load_config(lua::State* L, Options* options)
{
    if (auto name = lua::config::get_string(L, "encoding")) {
        if (auto enc = parse_encoding(*name))
            options->enc = *enc;
        else
            LOGGER()->warn("ignoring unknown encoding '{}'", *name);
    }

    int level = lua::config::get_int(L, "log_level", options->log_level);
    if (logging::trace <= level && level <= logging::off)
        options->log_level = static_cast<logging::level_enum>(level);
    else
        LOGGER()->warn("ignoring invalid log_level {}", level);

    int chunk = lua::config::get_int(L, "chunk_size",
            static_cast<int>(options->chunk_size));
    if (chunk > 0)
        options->chunk_size = static_cast<std::size_t>(chunk);
    else
        LOGGER()->warn("ignoring invalid chunk_size {}", chunk);

    int repeat = lua::config::get_int(L, "repeat_count", options->repeat_count);
    if (repeat > 0)
        options->repeat_count = repeat;
    else
        LOGGER()->warn("ignoring invalid repeat_count {}", repeat);
}

} // namespace runerip
