#include "lua/state.h"

namespace lua
{

State::State() :
    m_L(luaL_newstate()),
    m_owns(true)
{ }

State::State(lua_State *L) :
    m_L(L),
    m_owns(false)
{ }

State::~State()
{
    if (m_owns)
        lua_close(m_L);
}

void State::openlibs()
{ luaL_openlibs(m_L); }

int State::loadfile(const char *filename)
{ return luaL_loadfile(m_L, filename); }

int State::loadstring(const char *s)
{ return luaL_loadstring(m_L, s); }

void State::call(int nargs, int nresults)
{ lua_call(m_L, nargs, nresults); }

int State::pcall(int nargs, int nresults, int msgh)
{ return lua_pcall(m_L, nargs, nresults, msgh); }

void State::pop(int n /* = 1 */)
{ lua_pop(m_L, n); }

void State::pushvalue(int index)
{ lua_pushvalue(m_L, index); }

int State::gettop()
{ return lua_gettop(m_L); }

void State::newlib(const luaL_Reg *l, int entries /* = 0 */)
{
    // if entries was not specified, assume the library
    // is nothing but functions, and they're all in l
    if (!entries)
    {
        // count to sentinel
        while (l[entries].name)
            entries++;
    }

    lua_createtable(m_L, 0, entries);
    luaL_setfuncs(m_L, l, 0);
}

void State::setfuncs(const luaL_Reg *l, int nup /* = 0 */)
{ luaL_setfuncs(m_L, l, nup); }

void State::requiref(const char *modname, lua_CFunction openf, bool glb)
{ luaL_requiref(m_L, modname, openf, glb? 1 : 0); }

void State::pushnil()
{ lua_pushnil(m_L); }

bool State::newmetatable(const char *tname)
{ return luaL_newmetatable(m_L, tname) != 0; }

void State::setmetatable(const char *tname)
{ luaL_setmetatable(m_L, tname); }

int State::getglobal(const char *name)
{ return lua_getglobal(m_L, name); }

int State::type(int index)
{ return lua_type(m_L, index); }

bool State::istable(int index)
{ return lua_istable(m_L, index) != 0; }

int State::getfield(int index, const char *k)
{ return lua_getfield(m_L, index, k); }

void State::setfield(int index, const char *k)
{ lua_setfield(m_L, index, k); }

const char *State::tostring(int index)
{ return lua_tostring(m_L, index); }

const char *State::tolstring(int index, size_t *len)
{ return lua_tolstring(m_L, index, len); }

const char *State::checkstring(int arg)
{ return luaL_checkstring(m_L, arg); }

void State::pushstring(const char *s)
{ lua_pushstring(m_L, s); }

void State::pushstring(std::string_view s)
{ lua_pushlstring(m_L, s.data(), s.size()); }

lua_Integer State::tointegerx(int index, int *isnum)
{ return lua_tointegerx(m_L, index, isnum); }

lua_Integer State::tointegerdef(int index, lua_Integer def)
{
    int isnum = 0;
    lua_Integer val = tointegerx(index, &isnum);
    if (isnum)
        return val;
    else
        return def;
}

lua_Integer State::checkinteger(int arg)
{ return luaL_checkinteger(m_L, arg); }

void State::pushinteger(lua_Integer n)
{ lua_pushinteger(m_L, n); }

void State::setobjfuncs(const char *tname, const luaL_Reg *funcs)
{
    newmetatable(tname); // create metatable for obj
    pushvalue(-1); // push metatable
    setfield(-2, "__index");  // metatable.__index = metatable
    setfuncs(funcs); // add methods to new metatable
    pop(); // pop new metatable
}

} // namespace lua
