#ifndef LUA_LOGGING_H
#define LUA_LOGGING_H

// lua logging integration

namespace lua {

class State;

// registers the logging module as a global named "logging"
void register_lualogging(State* L);

} // namespace lua

#endif // LUA_LOGGING_H
