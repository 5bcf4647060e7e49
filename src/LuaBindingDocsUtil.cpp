#include "LuaBindingDocsUtil.hpp"
#include "LuaBindingDocs.hpp"
#include <plog/Log.h>
#include <sstream>
#include <stdexcept>

namespace CapBridge {
namespace LuaBindingDocsUtil {

std::vector<std::string> listMissingDocs(lua_State *L, const std::vector<std::string> &globals)
{
    std::vector<std::string> missing;
    if (!L) return missing;
    for (const auto &name : globals)
    {
        lua_getglobal(L, name.c_str());
        bool isFunc = lua_isfunction(L, -1);
        lua_pop(L, 1);
        if (!isFunc || !LuaBindingDocs::get().hasDoc(name))
            missing.push_back(name);
    }
    return missing;
}

bool verifyGlobalsHaveDocs(lua_State *L, const std::vector<std::string> &globals)
{
    auto missing = listMissingDocs(L, globals);
    if (missing.empty()) return true;
    for (const auto &m : missing) PLOGE << "Lua capability missing documentation: " << m;
    return false;
}

void enforceGlobalsHaveDocs(lua_State *L, const std::vector<std::string> &globals)
{
    auto missing = listMissingDocs(L, globals);
    if (missing.empty()) return;
    std::ostringstream ss;
    ss << "Missing Lua docs for capabilities: ";
    for (size_t i = 0; i < missing.size(); ++i) { if (i) ss << ", "; ss << missing[i]; }
    throw std::runtime_error(ss.str());
}

} // namespace LuaBindingDocsUtil
} // namespace CapBridge
