#pragma once
#include "DBBackend.hpp"
#include <functional>
#include <string>

namespace CapBridge {

enum class MySQLProbeResult { Connected, Rejected, Unreachable };

// Opens and closes one connection. outError is filled for Rejected and Unreachable.
MySQLProbeResult TestMySQLConnection(const DBConnectionInfo &info, std::string &outError);

using MySQLProbe = std::function<MySQLProbeResult(const DBConnectionInfo &, std::string &)>;

} // namespace CapBridge
