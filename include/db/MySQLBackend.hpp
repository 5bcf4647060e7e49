#pragma once

#include "../DBBackend.hpp"
#include <memory>
#include <string>

namespace CapBridge {

struct MySQLImpl;

// MySQL / MariaDB over the X DevAPI (mysqlx). open() runs a health query so a
// successful return means the server accepted the credentials.
class MySQLBackend : public IDBBackend {
public:
    MySQLBackend();
    ~MySQLBackend() override;

    bool open(const DBConnectionInfo &info, std::string *outError) override;
    void close() override;

    // True when the last open() failed because the server refused the login
    bool lastFailureWasAuth() const { return authRejected; }

private:
    bool authRejected = false;
    std::unique_ptr<MySQLImpl> impl;
};

} // namespace CapBridge
