#pragma once

#include "BridgeConfig.hpp"
#include "CapabilityRegistry.hpp"
#include "ErrorSlot.hpp"
#include "HostServices.hpp"
#include "Http/HttpStore.hpp"
#include <memory>
#include <optional>
#include <string>

extern "C" {
#include <lua.h>
#include <lauxlib.h>
#include <lualib.h>
}

namespace CapBridge {

// One script execution context: a lua_State with the whole capability
// catalog bound, plus the error slot and session/request store it owns.
// Contexts share nothing; run several by creating several engines.
class LuaEngine {
public:
    // Throws std::runtime_error if the state cannot be created or a
    // registered global lacks documentation.
    LuaEngine(const BridgeConfig &config, HostServices services);
    ~LuaEngine();

    LuaEngine(const LuaEngine &) = delete;
    LuaEngine &operator=(const LuaEngine &) = delete;

    // Load and run lua source (returns false on error, see lastError())
    bool loadScript(const std::string &code, const std::string &chunkName = "=script");

    // Global `descr` string, empty if the script does not set one
    std::string descr();

    // Call the script's verify(user, password). nil counts as false; a lua
    // error or a non-boolean result yields nullopt.
    std::optional<bool> verify(const std::string &user, const std::string &password);

    // Snapshot of a global. Throws ConversionError for functions and userdata.
    DynamicValue global(const std::string &name);

    // Last error message captured from Lua calls
    const std::string &lastError() const { return m_error; }

    // Take captured stdout from the Lua 'print' binding. Returns and clears the buffer.
    std::string takeStdout();

    lua_State *L() { return m_L; }
    ErrorSlot &errors() { return m_errors; }
    HttpStore &store() { return *m_store; }
    CapabilityRegistry &registry() { return *m_registry; }

private:
    BridgeConfig m_config;
    HostServices m_services;
    lua_State *m_L = nullptr;
    std::string m_error;

    // captured output from print() calls
    std::string m_stdout;

    ErrorSlot m_errors;
    std::unique_ptr<HttpStore> m_store;
    std::unique_ptr<CapabilityRegistry> m_registry;

    void setupSandbox();
    void registerCapabilities();
    void captureLuaError(const char *msg);
    void appendStdout(const std::string &line);
};

} // namespace CapBridge
