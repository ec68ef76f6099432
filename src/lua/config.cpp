#include "lua/config.h"
#include "lua/state.h"

namespace lua {
namespace config {

// pushes config[name], or nil if config is not a table. always leaves
// two values to pop.
static void push_field(State* L, const char* name)
{
    L->getglobal("config");
    if (L->istable(-1))
        L->getfield(-1, name);
    else
        L->pushnil();
}

int get_int(State* L, const char* name, int def)
{
    push_field(L, name);
    int val = static_cast<int>(L->tointegerdef(-1, def));
    L->pop(2);

    return val;
}

std::optional<std::string> get_string(State* L, const char* name)
{
    std::optional<std::string> val;

    push_field(L, name);
    if (L->type(-1) == LUA_TSTRING)
    {
        size_t len = 0;
        const char* s = L->tolstring(-1, &len);
        val.emplace(s, len);
    }
    L->pop(2);

    return val;
}

} // namespace config
} // namespace lua
