#include "LuaBindingDocs.hpp"
#include <sstream>

namespace CapBridge {

LuaBindingDocs &LuaBindingDocs::get()
{
    static LuaBindingDocs inst;
    return inst;
}

void LuaBindingDocs::registerDoc(const std::string &name, const std::string &signature, const std::string &summary, const std::string &example, const std::string &sourceFile)
{
    std::lock_guard<std::mutex> l(m_mutex);
    m_docs[name] = LuaBindingDocEntry{ name, signature, summary, example, sourceFile };
}

bool LuaBindingDocs::hasDoc(const std::string &name) const
{
    std::lock_guard<std::mutex> l(m_mutex);
    auto it = m_docs.find(name);
    return it != m_docs.end() && !it->second.signature.empty();
}

std::optional<LuaBindingDocEntry> LuaBindingDocs::getDoc(const std::string &name) const
{
    std::lock_guard<std::mutex> l(m_mutex);
    auto it = m_docs.find(name);
    if (it == m_docs.end()) return std::nullopt;
    return it->second;
}

std::vector<LuaBindingDocEntry> LuaBindingDocs::listAll() const
{
    std::vector<LuaBindingDocEntry> out;
    std::lock_guard<std::mutex> l(m_mutex);
    out.reserve(m_docs.size());
    for (const auto &kv : m_docs) out.push_back(kv.second);
    return out;
}

std::string LuaBindingDocs::renderReference() const
{
    std::ostringstream ss;
    for (const auto &e : listAll())
    {
        ss << e.signature << "\n    " << e.summary << "\n";
        if (!e.example.empty())
            ss << e.example << "\n";
        ss << "\n";
    }
    return ss.str();
}

} // namespace CapBridge
