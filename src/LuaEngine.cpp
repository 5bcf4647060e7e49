#include "LuaEngine.hpp"
#include "LuaBindingDocsUtil.hpp"
#include "LuaCryptoBindings.hpp"
#include "LuaDataBindings.hpp"
#include "LuaHttpBindings.hpp"
#include "LuaLdapBindings.hpp"
#include "LuaSystemBindings.hpp"
#include <plog/Log.h>
#include <iostream>
#include <stdexcept>

namespace CapBridge {

LuaEngine::LuaEngine(const BridgeConfig &config, HostServices services)
    : m_config(config), m_services(std::move(services))
{
    if (!m_services.http || !m_services.ldap || !m_services.mysql)
        throw std::invalid_argument("LuaEngine: every host service must be provided");

    m_L = luaL_newstate();
    if (!m_L)
        throw std::runtime_error("Lua: failed to create state");
    luaL_openlibs(m_L);
    if (m_config.sandbox)
        setupSandbox();

    m_store = std::make_unique<HttpStore>(*m_services.http, SessionOptions::fromSettings(m_config.http));
    m_registry = std::make_unique<CapabilityRegistry>(m_L, m_errors);
    try
    {
        registerCapabilities();
    }
    catch (const std::exception &)
    {
        lua_close(m_L);
        m_L = nullptr;
        throw;
    }
    PLOGD << "LuaEngine: context created with " << m_registry->names().size() << " capabilities";
}

LuaEngine::~LuaEngine()
{
    if (m_L)
        lua_close(m_L);
    PLOGD << "LuaEngine: context closed (" << m_store->sessionCount() << " session(s), "
          << m_store->pendingCount() << " unsent request(s) released)";
}

void LuaEngine::captureLuaError(const char *msg)
{
    if (msg)
        m_error = msg;
    else
        m_error = "unknown lua error";
    PLOGW << "Lua error: " << m_error;
}

void LuaEngine::setupSandbox()
{
    // Remove dangerous globals: io, os, loadfile, dofile, load
    for (const char *name : {"io", "os", "loadfile", "dofile", "load"})
    {
        lua_pushnil(m_L);
        lua_setglobal(m_L, name);
    }
}

void LuaEngine::appendStdout(const std::string &line)
{
    m_stdout += line;
    m_stdout.push_back('\n');
    if (m_config.echoPrint)
        std::cout << line << std::endl;
}

void LuaEngine::registerCapabilities()
{
    CapabilityRegistry &reg = *m_registry;
    registerLuaCryptoBindings(reg);
    registerLuaHttpBindings(reg, *m_store, *m_services.http, SessionOptions::fromSettings(m_config.http));
    registerLuaLdapBindings(reg, *m_services.ldap);
    registerLuaDataBindings(reg);
    registerLuaSystemBindings(reg, m_services.mysql, m_config.mysql,
                              [this](const std::string &line) { appendStdout(line); });

    LuaBindingDocsUtil::enforceGlobalsHaveDocs(m_L, reg.names());
}

bool LuaEngine::loadScript(const std::string &code, const std::string &chunkName)
{
    m_error.clear();
    int r = luaL_loadbuffer(m_L, code.c_str(), code.size(), chunkName.c_str());
    if (r != LUA_OK)
    {
        captureLuaError(lua_tostring(m_L, -1));
        lua_pop(m_L, 1);
        return false;
    }
    // run chunk
    r = lua_pcall(m_L, 0, 0, 0);
    if (r != LUA_OK)
    {
        captureLuaError(lua_tostring(m_L, -1));
        lua_pop(m_L, 1);
        return false;
    }
    return true;
}

std::string LuaEngine::descr()
{
    std::string out;
    lua_getglobal(m_L, "descr");
    if (lua_type(m_L, -1) == LUA_TSTRING)
    {
        size_t len = 0;
        const char *s = lua_tolstring(m_L, -1, &len);
        out.assign(s, len);
    }
    lua_pop(m_L, 1);
    return out;
}

std::optional<bool> LuaEngine::verify(const std::string &user, const std::string &password)
{
    m_error.clear();
    lua_getglobal(m_L, "verify");
    if (!lua_isfunction(m_L, -1))
    {
        lua_pop(m_L, 1);
        captureLuaError("script does not define verify(user, password)");
        return std::nullopt;
    }
    lua_pushlstring(m_L, user.data(), user.size());
    lua_pushlstring(m_L, password.data(), password.size());
    if (lua_pcall(m_L, 2, 1, 0) != LUA_OK)
    {
        captureLuaError(lua_tostring(m_L, -1));
        lua_pop(m_L, 1);
        return std::nullopt;
    }

    std::optional<bool> result;
    int t = lua_type(m_L, -1);
    if (t == LUA_TBOOLEAN)
        result = lua_toboolean(m_L, -1) != 0;
    else if (t == LUA_TNIL)
        result = false;
    else
        captureLuaError((std::string("verify returned ") + lua_typename(m_L, t) + ", expected boolean").c_str());
    lua_pop(m_L, 1);
    return result;
}

DynamicValue LuaEngine::global(const std::string &name)
{
    lua_getglobal(m_L, name.c_str());
    try
    {
        DynamicValue v = readLuaValue(m_L, -1);
        lua_pop(m_L, 1);
        return v;
    }
    catch (const ConversionError &)
    {
        lua_pop(m_L, 1);
        throw;
    }
}

std::string LuaEngine::takeStdout()
{
    std::string s = m_stdout;
    m_stdout.clear();
    return s;
}

} // namespace CapBridge
