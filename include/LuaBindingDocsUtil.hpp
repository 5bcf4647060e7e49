#pragma once

extern "C" {
#include <lua.h>
}

#include <string>
#include <vector>

namespace CapBridge {
namespace LuaBindingDocsUtil {
    // Names from `globals` that are not a lua function global or have no docs entry
    std::vector<std::string> listMissingDocs(lua_State *L, const std::vector<std::string> &globals);
    bool verifyGlobalsHaveDocs(lua_State *L, const std::vector<std::string> &globals);
    // Throws std::runtime_error listing every undocumented global
    void enforceGlobalsHaveDocs(lua_State *L, const std::vector<std::string> &globals);
}
} // namespace CapBridge
