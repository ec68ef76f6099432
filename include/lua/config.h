#ifndef LUA_CONFIG_H
#define LUA_CONFIG_H

#include <optional>
#include <string>

namespace lua {

class State;

namespace config {

// helper functions for the global config table.
// if multiple values are needed, or if anything
// fancy is needed, prefer directly accessing
// config over calling these helpers

int get_int(State* L, const char* name, int def);
std::optional<std::string> get_string(State* L, const char* name);

} // namespace config
} // namespace lua

#endif // LUA_CONFIG_H
