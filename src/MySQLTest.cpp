#include "MySQLTest.hpp"
#include "db/MySQLBackend.hpp"
#include <string>

namespace CapBridge {

MySQLProbeResult TestMySQLConnection(const DBConnectionInfo &info, std::string &outError){
    MySQLBackend mb;
    if(mb.open(info, &outError)){
        mb.close();
        return MySQLProbeResult::Connected;
    }
    return mb.lastFailureWasAuth() ? MySQLProbeResult::Rejected : MySQLProbeResult::Unreachable;
}

} // namespace CapBridge
