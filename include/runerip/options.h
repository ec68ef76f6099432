#ifndef RUNERIP_OPTIONS_H
#define RUNERIP_OPTIONS_H

#include "runerip/commands.h"
#include "runerip/logging.h"

#include <cstddef>
#include <string>

namespace lua {
class State;
} // namespace lua

namespace runerip {

#define CONFIG_FILE "~/.runerip.lua"

struct Options
{
    encoding enc = encoding::utf8;
    std::size_t chunk_size = 64 * 1024;
    int repeat_count = 1;
    std::string out;
    logging::level_enum log_level = logging::warn;
};

// copies settings from the global config table into options, leaving
// anything missing or unusable as it was
void load_config(lua::State* L, Options* options);

} // namespace runerip

#endif // RUNERIP_OPTIONS_H
