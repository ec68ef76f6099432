#ifndef LUA_STATE_H
#define LUA_STATE_H

#include <lua.hpp>
#include <string>
#include <string_view>

namespace lua {

/// Thin wrapper over a lua_State; closes it on destruction if it was
/// created here.
class State
{
public:
    State();
    State(lua_State* L);
    ~State();

    State(const State&) = delete;
    State& operator=(const State&) = delete;

    lua_State* state() const { return m_L; }

    void openlibs();
    int loadfile(const char* filename);
    int loadstring(const char* s);
    void call(int nargs, int nresults);
    int pcall(int nargs, int nresults, int msgh);
    void pop(int n = 1);
    void pushvalue(int index);
    int gettop();

    void newlib(const luaL_Reg* l, int entries = 0);
    void setfuncs(const luaL_Reg* l, int nup = 0);
    void requiref(const char* modname, lua_CFunction openf, bool glb);

    void pushnil();

    bool newmetatable(const char* tname);
    void setmetatable(const char* tname);

    int getglobal(const char* name);

    int type(int index);
    bool istable(int index);
    int getfield(int index, const char* k);
    void setfield(int index, const char* k);

    const char* tostring(int index);
    const char* tolstring(int index, size_t* len);
    const char* checkstring(int arg);
    void pushstring(const char* s);
    void pushstring(std::string_view s);

    lua_Integer tointegerx(int index, int* isnum);
    lua_Integer tointegerdef(int index, lua_Integer def);
    lua_Integer checkinteger(int arg);
    void pushinteger(lua_Integer n);


    void setobjfuncs(const char* tname, const luaL_Reg* funcs);

    template <typename T>
    T* newobj(const char* tname = nullptr)
    {
        auto buf = lua_newuserdata(m_L, sizeof(T));
        auto p = new (buf) T();
        if (tname)
            setmetatable(tname);
        return p;
    }

    template <typename T>
    T* checkobj(int arg, const char* tname)
    {
        return static_cast<T*>(
                luaL_checkudata(m_L, arg, tname));
    }

    template <typename T>
    void delobj(int arg, const char* tname)
    {
        checkobj<T>(arg, tname)->~T();
    }

private:
    lua_State* m_L = nullptr;
    bool m_owns = false;
};

} // namespace lua

#endif // LUA_STATE_H
