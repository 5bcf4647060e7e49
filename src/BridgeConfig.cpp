#include "BridgeConfig.hpp"
#include <plog/Log.h>
#include <fstream>
#include <initializer_list>
#include <set>
#include <sstream>

namespace CapBridge {

nlohmann::json BridgeConfig::toJSON() const {
    return nlohmann::json{
        {"log_level", logLevel},
        {"echo_print", echoPrint},
        {"sandbox", sandbox},
        {"http", {
            {"timeout_seconds", http.timeoutSeconds},
            {"user_agent", http.userAgent},
            {"verify_tls", http.verifyTls},
            {"proxy", http.proxy},
            {"follow_redirects", http.followRedirects},
            {"max_redirects", http.maxRedirects}
        }},
        {"ldap", {
            {"timeout_seconds", ldap.timeoutSeconds},
            {"verify_tls", ldap.verifyTls}
        }},
        {"mysql", {
            {"timeout_seconds", mysql.timeoutSeconds},
            {"use_ssl", mysql.useSSL}
        }}
    };
}

static void warnUnknownKeys(const nlohmann::json &j, const std::set<std::string> &known, const std::string &where) {
    for (auto it = j.begin(); it != j.end(); ++it) {
        if (!known.count(it.key()))
            PLOGW << "BridgeConfig: ignoring unknown key '" << where << it.key() << "'";
    }
}

bool BridgeConfig::fromJSON(const nlohmann::json &j, BridgeConfig &out, std::string *outError) {
    if (!j.is_object()) {
        if (outError) *outError = "config root must be an object";
        return false;
    }
    BridgeConfig cfg;
    try {
        warnUnknownKeys(j, {"log_level", "echo_print", "sandbox", "http", "ldap", "mysql"}, "");
        cfg.logLevel = j.value("log_level", cfg.logLevel);
        cfg.echoPrint = j.value("echo_print", cfg.echoPrint);
        cfg.sandbox = j.value("sandbox", cfg.sandbox);

        if (j.contains("http")) {
            const auto &h = j.at("http");
            warnUnknownKeys(h, {"timeout_seconds", "user_agent", "verify_tls", "proxy", "follow_redirects", "max_redirects"}, "http.");
            cfg.http.timeoutSeconds = h.value("timeout_seconds", cfg.http.timeoutSeconds);
            cfg.http.userAgent = h.value("user_agent", cfg.http.userAgent);
            cfg.http.verifyTls = h.value("verify_tls", cfg.http.verifyTls);
            cfg.http.proxy = h.value("proxy", cfg.http.proxy);
            cfg.http.followRedirects = h.value("follow_redirects", cfg.http.followRedirects);
            cfg.http.maxRedirects = h.value("max_redirects", cfg.http.maxRedirects);
        }
        if (j.contains("ldap")) {
            const auto &l = j.at("ldap");
            warnUnknownKeys(l, {"timeout_seconds", "verify_tls"}, "ldap.");
            cfg.ldap.timeoutSeconds = l.value("timeout_seconds", cfg.ldap.timeoutSeconds);
            cfg.ldap.verifyTls = l.value("verify_tls", cfg.ldap.verifyTls);
        }
        if (j.contains("mysql")) {
            const auto &m = j.at("mysql");
            warnUnknownKeys(m, {"timeout_seconds", "use_ssl"}, "mysql.");
            cfg.mysql.timeoutSeconds = m.value("timeout_seconds", cfg.mysql.timeoutSeconds);
            cfg.mysql.useSSL = m.value("use_ssl", cfg.mysql.useSSL);
        }
    } catch (const nlohmann::json::exception &e) {
        if (outError) *outError = std::string("invalid config: ") + e.what();
        return false;
    }
    for (long t : {cfg.http.timeoutSeconds, cfg.ldap.timeoutSeconds, cfg.mysql.timeoutSeconds}) {
        if (t <= 0 || t > kMaxTimeoutSeconds) {
            if (outError) *outError = "invalid config: timeouts must be between 1 and " + std::to_string(kMaxTimeoutSeconds) + " seconds";
            return false;
        }
    }
    out = std::move(cfg);
    return true;
}

bool BridgeConfig::loadFile(const std::string &path, BridgeConfig &out, std::string *outError) {
    std::ifstream in(path);
    if (!in) {
        if (outError) *outError = "cannot open config file: " + path;
        return false;
    }
    std::stringstream buf;
    buf << in.rdbuf();
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(buf.str());
    } catch (const nlohmann::json::parse_error &e) {
        if (outError) *outError = "config parse error in " + path + ": " + e.what();
        return false;
    }
    return fromJSON(j, out, outError);
}

} // namespace CapBridge
