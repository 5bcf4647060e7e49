#pragma once

#include "BridgeConfig.hpp"
#include "MySQLTest.hpp"
#include <functional>
#include <string>

namespace CapBridge {

class CapabilityRegistry;

// Receives every line written by the print capability
using PrintSink = std::function<void(const std::string &line)>;

// Host capabilities:
//   execve(program, {args...})               -> exit code|nil
//   rand(min, max)                           -> integer in [min, max)
//   sleep(seconds)
//   print(value)                             -- debug rendering, logged
//   last_err()                               -> text|nil
//   mysql_connect(host, port, user, password) -> bool|nil
void registerLuaSystemBindings(CapabilityRegistry &reg, MySQLProbe probe, const MySQLSettings &mysql, PrintSink sink);

} // namespace CapBridge
