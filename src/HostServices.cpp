#include "HostServices.hpp"
#include "Http/CurlTransport.hpp"

namespace CapBridge {

HostServices HostServices::defaults(const BridgeConfig &config)
{
    HostServices s;
    s.http = std::make_shared<CurlTransport>();
    s.ldap = std::make_shared<OpenLdapConnector>(config.ldap);
    s.mysql = &TestMySQLConnection;
    return s;
}

} // namespace CapBridge
