#ifndef RUNERIP_LOGGING_H
#define RUNERIP_LOGGING_H

#include "fmt/format.h"

#include <chrono>
#include <cstdlib>
#include <memory>
#include <string>
#include <string_view>

namespace runerip {
namespace logging {

enum level_enum
{
    trace = 0,
    debug = 1,
    info = 2,
    warn = 3,
    err = 4,
    fatal = 5,
    off = 6
};

class Logger
{
public:
    Logger(std::string_view name, logging::level_enum lvl = logging::trace) :
        m_name(name),
        m_level(lvl)
    {}

    virtual ~Logger();
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    std::string_view name() const { return m_name; }

    logging::level_enum level() const { return m_level; }
    void level(logging::level_enum val) { m_level = val; }

    template <typename... Args>
    void log(level_enum lvl, std::string_view fmt, const Args&... args);
    void log(level_enum lvl, std::string_view msg);

    template <typename Arg1, typename... Args>
    void trace(std::string_view fmt, const Arg1&, const Args&... args);
    template <typename Arg1, typename... Args>
    void debug(std::string_view fmt, const Arg1&, const Args&... args);
    template <typename Arg1, typename... Args>
    void info(std::string_view fmt, const Arg1&, const Args&... args);
    template <typename Arg1, typename... Args>
    void warn(std::string_view fmt, const Arg1&, const Args&... args);
    template <typename Arg1, typename... Args>
    void error(std::string_view fmt, const Arg1&, const Args&... args);
    template <typename Arg1, typename... Args>
    void fatal(std::string_view fmt, const Arg1&, const Args&... args);

    void trace(std::string_view msg) { log(logging::trace, msg); }
    void debug(std::string_view msg) { log(logging::debug, msg); }
    void info(std::string_view msg) { log(logging::info, msg); }
    void warn(std::string_view msg) { log(logging::warn, msg); }
    void error(std::string_view msg) { log(logging::err, msg); }
    void fatal(std::string_view msg) { log(logging::fatal, msg); }

private:
    const std::string m_name;
    logging::level_enum m_level;
};

// get/create a logger
std::shared_ptr<Logger> get(std::string_view name);

// sets the level of every existing logger, and of loggers made later
void set_level(logging::level_enum lvl);

// level given to new loggers
logging::level_enum default_level();

namespace details {
struct Message
{
    Message() = default;
    Message(std::string_view logname, logging::level_enum lvl) :
        logname(logname),
        level(lvl),
        ts(std::chrono::system_clock::now())
    {}

    Message(const Message& other) = delete;
    Message& operator=(Message&& other) = delete;
    Message(Message&& other) = delete;

    std::string_view logname;
    logging::level_enum level = logging::trace;
    std::chrono::system_clock::time_point ts;

    std::string msg;
};

void log_message(const Message& msg);

} // namespace details
} // namespace logging
} // namespace runerip

// impl bits:

inline runerip::logging::Logger::~Logger() = default;

template <typename... Args>
inline void runerip::logging::Logger::log(logging::level_enum lvl,
        std::string_view fmt, const Args&... args)
{
    if (lvl < m_level)
        return;

    details::Message message(m_name, lvl);
    message.msg = fmt::vformat(fmt, fmt::make_format_args(args...));
    details::log_message(message);

    if (lvl == logging::fatal)
        std::exit(EXIT_FAILURE);
}

inline void runerip::logging::Logger::log(logging::level_enum lvl, std::string_view msg)
{
    if (lvl < m_level)
        return;

    details::Message message(m_name, lvl);
    message.msg = msg;
    details::log_message(message);

    if (lvl == logging::fatal)
        std::exit(EXIT_FAILURE);
}

template <typename Arg1, typename... Args>
inline void runerip::logging::Logger::trace(std::string_view fmt, const Arg1& arg1, const Args&... args)
{
    log(logging::trace, fmt, arg1, args...);
}

template <typename Arg1, typename... Args>
inline void runerip::logging::Logger::debug(std::string_view fmt, const Arg1& arg1, const Args&... args)
{
    log(logging::debug, fmt, arg1, args...);
}

template <typename Arg1, typename... Args>
inline void runerip::logging::Logger::info(std::string_view fmt, const Arg1& arg1, const Args&... args)
{
    log(logging::info, fmt, arg1, args...);
}

template <typename Arg1, typename... Args>
inline void runerip::logging::Logger::warn(std::string_view fmt, const Arg1& arg1, const Args&... args)
{
    log(logging::warn, fmt, arg1, args...);
}

template <typename Arg1, typename... Args>
inline void runerip::logging::Logger::error(std::string_view fmt, const Arg1& arg1, const Args&... args)
{
    log(logging::err, fmt, arg1, args...);
}

template <typename Arg1, typename... Args>
inline void runerip::logging::Logger::fatal(std::string_view fmt, const Arg1& arg1, const Args&... args)
{
    log(logging::fatal, fmt, arg1, args...);
}

#endif // RUNERIP_LOGGING_H
