#pragma once
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace CapBridge {

struct LuaBindingDocEntry {
    std::string name;        // global name, e.g. "sha2_256"
    std::string signature;   // e.g. "sha2_256(bytes) -> bytes"
    std::string summary;     // short description
    std::string example;     // optional example snippet
    std::string sourceFile;  // binding source file, if known
};

// Process-wide catalog of capability documentation. Entries are metadata
// only; every execution context files the same docs for the same names.
class LuaBindingDocs {
public:
    static LuaBindingDocs &get();

    void registerDoc(const std::string &name, const std::string &signature, const std::string &summary, const std::string &example = "", const std::string &sourceFile = "");

    bool hasDoc(const std::string &name) const;
    std::optional<LuaBindingDocEntry> getDoc(const std::string &name) const;
    // Sorted by name
    std::vector<LuaBindingDocEntry> listAll() const;

    // Plain-text reference of every documented capability
    std::string renderReference() const;

private:
    mutable std::mutex m_mutex;
    std::map<std::string, LuaBindingDocEntry> m_docs;
};

} // namespace CapBridge
