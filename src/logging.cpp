#include "fmt/chrono.h"
#include "runerip/logging.h"

#include <array>
#include <cstdio>
#include <ctime>
#include <mutex>
#include <string_view>
#include <unordered_map>

using namespace std::literals;

namespace runerip {
namespace logging {

namespace {

// global logger map
struct Registry
{
    std::mutex mutex;
    std::unordered_map<std::string, std::shared_ptr<Logger>> loggers;
    level_enum level = logging::trace;
};

Registry& registry()
{
    static Registry reg;
    return reg;
}

constexpr std::array level_names{
        "TRACE"sv,
        "DEBUG"sv,
        " INFO"sv,
        " WARN"sv,
        "ERROR"sv,
        "FATAL"sv,
        "OTHER"sv};

} // namespace

std::shared_ptr<Logger> get(std::string_view name)
{
    auto& reg = registry();
    std::lock_guard<std::mutex> lock(reg.mutex);

    // todo: heterogeneous lookup would avoid this allocation
    std::string sname{name};
    auto found = reg.loggers.find(sname);
    if (found != reg.loggers.end())
        return found->second;

    auto logger = std::make_shared<Logger>(name, reg.level);
    reg.loggers.emplace(std::move(sname), logger);
    return logger;
}

void set_level(level_enum lvl)
{
    auto& reg = registry();
    std::lock_guard<std::mutex> lock(reg.mutex);

    reg.level = lvl;
    for (auto& entry : reg.loggers)
        entry.second->level(lvl);
}

level_enum default_level()
{
    auto& reg = registry();
    std::lock_guard<std::mutex> lock(reg.mutex);
    return reg.level;
}

void details::log_message(const details::Message& msg)
{
    auto ts = std::chrono::system_clock::to_time_t(msg.ts);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            msg.ts.time_since_epoch())
                      .count();

    std::tm ltm = {};
    localtime_r(&ts, &ltm);

    int level = msg.level;
    if (level < logging::trace || logging::off < level)
        level = logging::off; // OTHER
    auto levelstr = level_names[level];

    // stderr, so log lines never mix with command output
    fmt::print(stderr, "{:%Y-%m-%dT%H:%M:%S}.{:03d} {} {} - {}\n",
            ltm, ms % 1000, levelstr, msg.logname, msg.msg);
}

} // namespace logging
} // namespace runerip
