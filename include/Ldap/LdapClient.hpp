#pragma once

#include "BridgeConfig.hpp"
#include <memory>
#include <string>
#include <vector>

namespace CapBridge {

// One open directory connection. Methods return false only for connection or
// protocol faults; a bind the server rejects is reported through outSuccess.
class ILdapConnection {
public:
    virtual ~ILdapConnection() = default;
    virtual bool simpleBind(const std::string &dn, const std::string &password, bool &outSuccess, std::string *outError) = 0;
    // Subtree search; fills the DNs of all matching entries in server order
    virtual bool searchSubtree(const std::string &baseDn, const std::string &filter, std::vector<std::string> &outDns, std::string *outError) = 0;
};

class ILdapConnector {
public:
    virtual ~ILdapConnector() = default;
    virtual std::unique_ptr<ILdapConnection> connect(const std::string &url, std::string *outError) = 0;
};

// OpenLDAP (libldap) implementation
class OpenLdapConnector : public ILdapConnector {
public:
    explicit OpenLdapConnector(LdapSettings settings);
    std::unique_ptr<ILdapConnection> connect(const std::string &url, std::string *outError) override;

private:
    LdapSettings m_settings;
};

namespace LdapClient {
    // Connect and bind once. Returns false on a connection/protocol fault.
    bool bind(ILdapConnector &connector, const std::string &url, const std::string &dn, const std::string &password,
              bool &outSuccess, std::string *outError);

    // Bind as the search user, look up uid=<user> below baseDn, then bind as
    // the first entry found. No entry means outSuccess=false without a further bind.
    bool searchBind(ILdapConnector &connector, const std::string &url, const std::string &searchUser,
                    const std::string &searchPassword, const std::string &baseDn, const std::string &user,
                    const std::string &password, bool &outSuccess, std::string *outError);

    // RFC 4514 attribute value escaping for use inside a DN
    std::string escapeDnValue(const std::string &value);
    // RFC 4515 assertion value escaping for use inside a search filter
    std::string escapeFilterValue(const std::string &value);
}

} // namespace CapBridge
