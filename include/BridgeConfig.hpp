#pragma once

#include <nlohmann/json.hpp>
#include <string>

namespace CapBridge {

// Upper bound for every timeout, configured or per request.
constexpr long kMaxTimeoutSeconds = 24 * 60 * 60;

struct HttpSettings {
    long timeoutSeconds = 30;
    std::string userAgent = "capbridge/1.0";
    bool verifyTls = true;
    std::string proxy;
    bool followRedirects = true;
    long maxRedirects = 10;
};

struct LdapSettings {
    long timeoutSeconds = 10;
    bool verifyTls = true;
};

struct MySQLSettings {
    long timeoutSeconds = 10;
    bool useSSL = false;
};

// Host configuration for every execution context. Loaded from JSON; absent
// keys keep their defaults.
struct BridgeConfig {
    std::string logLevel = "info";
    bool echoPrint = true;
    bool sandbox = true;
    HttpSettings http;
    LdapSettings ldap;
    MySQLSettings mysql;

    nlohmann::json toJSON() const;
    // Returns false and fills outError on a type mismatch or malformed document.
    static bool fromJSON(const nlohmann::json &j, BridgeConfig &out, std::string *outError = nullptr);
    static bool loadFile(const std::string &path, BridgeConfig &out, std::string *outError = nullptr);
};

} // namespace CapBridge
