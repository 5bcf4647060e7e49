#pragma once
#include <string>

// Minimal DB backend abstraction used by the mysql_connect probe
namespace CapBridge {

struct DBConnectionInfo {
    std::string mysql_host;
    int mysql_port = 33060;
    std::string mysql_user;
    std::string mysql_password;
    bool mysql_use_ssl = false;
    long connect_timeout_seconds = 10;
};

struct IDBBackend {
    virtual ~IDBBackend() = default;
    virtual bool open(const DBConnectionInfo &info, std::string *outError = nullptr) = 0;
    virtual void close() = 0;
};

} // namespace CapBridge
