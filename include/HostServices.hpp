#pragma once

#include "BridgeConfig.hpp"
#include "Http/HttpTypes.hpp"
#include "Ldap/LdapClient.hpp"
#include "MySQLTest.hpp"
#include <memory>

namespace CapBridge {

// External services an execution context talks to. Tests swap in fakes.
struct HostServices {
    std::shared_ptr<IHttpTransport> http;
    std::shared_ptr<ILdapConnector> ldap;
    MySQLProbe mysql;

    // libcurl, OpenLDAP and MySQL X DevAPI backed services
    static HostServices defaults(const BridgeConfig &config);
};

} // namespace CapBridge
