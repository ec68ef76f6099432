#include "lua/logging.h"
#include "lua/state.h"
#include "runerip/logging.h"

#include <cstring>
#include <string>

/// Logging module; lets config scripts write to the runerip log.
// @module logging

/// Logger class.
// @type Logger

#define LUALOG "LUALOG*"

namespace logging = runerip::logging;

struct LuaLogStruct
{
    std::shared_ptr<logging::Logger> logger;
};

static inline std::shared_ptr<logging::Logger> tologger(lua::State& L)
{
    auto p = L.checkobj<LuaLogStruct>(1, LUALOG);
    return p->logger;
}

static logging::level_enum tolevel(lua::State& L, int arg)
{
    auto level = L.checkinteger(arg);
    if (level < logging::trace || logging::off < level)
        luaL_argerror(L.state(), arg, "not a log level");
    return static_cast<logging::level_enum>(level);
}

/// Writes log entry with specified level.
// @function log
// @int level Log level
// @param ... Values to include in the entry, separated by tabs
// (`tostring` is called for each)
static int logger_log(lua_State *l)
{
    lua::State L(l);
    auto logger = tologger(L);

    auto level = tolevel(L, 2);
    if (level < logger->level())
        return 0;

    int nargs = L.gettop();

    L.getglobal("tostring");

    std::string msg;
    size_t len;
    for (int i = 3; i <= nargs; i++)
    {
        L.pushvalue(-1); // push tostring
        L.pushvalue(i); // push next arg
        L.call(1, 1);

        const char *s = L.tolstring(-1, &len);
        if (!s)
            return luaL_error(l, "tostring must return a string to log");

        if (i > 3)
            msg += '\t';
        msg.append(s, len);

        L.pop();
    }

    L.pop(); // pop tostring

    logger->log(level, msg);
    return 0;
}

static int call_log(lua_State *l, logging::level_enum level)
{
    lua::State L(l);
    auto logger = tologger(L);

    if (level < logger->level())
        return 0;

    int nargs = L.gettop();

    // get the log func, push self and level
    L.getfield(1, "log");
    L.pushvalue(1);
    L.pushinteger(level);

    // push non-self args
    for (int i = 2; i <= nargs; i++)
        L.pushvalue(i);

    // call, with one more arg (level)
    L.call(1 + nargs, 0);
    return 0;
}

#define LOGGER_FUNC(levelname) \
    static int logger_##levelname(lua_State *L) \
    { return call_log(L, logging::levelname); }

/// Writes trace level log entry.
// @function trace
LOGGER_FUNC(trace)
/// Writes debug level log entry.
// @function debug
LOGGER_FUNC(debug)
/// Writes info level log entry.
// @function info
LOGGER_FUNC(info)
/// Writes warn level log entry.
// @function warn
LOGGER_FUNC(warn)
/// Writes error level log entry.
// @function err
LOGGER_FUNC(err)

/// Log level for this logger.
//
// (implemented via `__index` / `__newindex`)
//
// @class field
// @name level

static int logger_index(lua_State *l)
{
    lua::State L(l);
    auto logger = tologger(L);

    const char *key = L.checkstring(2);

    if (std::strcmp(key, "level") == 0)
        L.pushinteger(logger->level());
    else if (std::strcmp(key, "name") == 0)
        L.pushstring(logger->name());
    else if (luaL_getmetafield(l, 1, key) == LUA_TNIL)
        L.pushnil(); // not a method either

    return 1;
}

static int logger_newindex(lua_State *l)
{
    lua::State L(l);
    auto logger = tologger(L);

    const char *key = L.checkstring(2);

    if (std::strcmp(key, "level") == 0)
        logger->level(tolevel(L, 3));
    else
        return luaL_error(l, "cannot set '%s' on a logger", key);

    return 0;
}

static int logger_gc(lua_State *l)
{
    lua::State(l).delobj<LuaLogStruct>(1, LUALOG);
    return 0;
}

// methods for logger object
static const luaL_Reg logger_funcs[] = {
    {"log", logger_log},
    {"trace", logger_trace},
    {"debug", logger_debug},
    {"info", logger_info},
    {"warn", logger_warn},
    {"err", logger_err},
    {"__index", logger_index},
    {"__newindex", logger_newindex},
    {"__gc", logger_gc},
    {nullptr, nullptr},
};

/// Functions
// @section functions

/// Retrieves a named @{Logger} instance.
//
// @function logging.get
// @string nm Name of the logger to create/retrieve.
// @usage logger = logging.get("config")
static int logging_get(lua_State *l)
{
    // get the name before doing any allocation
    lua::State L(l);
    const char *name = L.checkstring(1);

    // alloc and init
    auto p = L.newobj<LuaLogStruct>(LUALOG);
    p->logger = logging::get(name);
    return 1;
}

/// Sets the level of every logger.
//
// @function logging.set_level
// @int level Log level
static int logging_set_level(lua_State *l)
{
    lua::State L(l);
    logging::set_level(tolevel(L, 1));
    return 0;
}

// functions for logging library
static const luaL_Reg logging_funcs[] = {
    {"get", logging_get},
    {"set_level", logging_set_level},
    {nullptr, nullptr}
};

static int logging_openf(lua_State *l)
{
    lua::State L(l);

    // make the lib (2 funcs, 7 values)
    L.newlib(logging_funcs, 9);

    /// Fields
    // @section fields

    L.pushinteger(logging::trace);
    L.setfield(-2, "trace");
    L.pushinteger(logging::debug);
    L.setfield(-2, "debug");
    L.pushinteger(logging::info);
    L.setfield(-2, "info");
    L.pushinteger(logging::warn);
    L.setfield(-2, "warn");
    L.pushinteger(logging::err);
    L.setfield(-2, "err");
    L.pushinteger(logging::fatal);
    L.setfield(-2, "fatal");
    L.pushinteger(logging::off);
    L.setfield(-2, "off");

    // add LUALOG object
    L.setobjfuncs(LUALOG, logger_funcs);

    return 1;
}

void lua::register_lualogging(lua::State *L)
{
    L->requiref("logging", logging_openf, true);
    L->pop();
}
