#include "Ldap/LdapClient.hpp"
#include <plog/Log.h>
#include <ldap.h>
#include <sys/time.h>

namespace CapBridge {

struct LdapMessageDeleter { void operator()(LDAPMessage *m) const { if (m) ldap_msgfree(m); } };

class OpenLdapConnection : public ILdapConnection {
public:
    OpenLdapConnection(LDAP *ld, long timeoutSeconds) : m_ld(ld), m_timeoutSeconds(timeoutSeconds) {}
    ~OpenLdapConnection() override
    {
        if (m_ld) ldap_unbind_ext_s(m_ld, nullptr, nullptr);
    }

    bool simpleBind(const std::string &dn, const std::string &password, bool &outSuccess, std::string *outError) override
    {
        berval cred;
        cred.bv_val = const_cast<char *>(password.data());
        cred.bv_len = password.size();
        int rc = ldap_sasl_bind_s(m_ld, dn.c_str(), LDAP_SASL_SIMPLE, &cred, nullptr, nullptr, nullptr);
        if (rc == LDAP_SUCCESS)
        {
            outSuccess = true;
            return true;
        }
        // negative codes are client side: server down, timeout, encoding ...
        if (rc < 0)
        {
            if (outError) *outError = ldap_err2string(rc);
            return false;
        }
        PLOGD << "ldap bind as '" << dn << "' rejected: " << ldap_err2string(rc);
        outSuccess = false;
        return true;
    }

    bool searchSubtree(const std::string &baseDn, const std::string &filter, std::vector<std::string> &outDns, std::string *outError) override
    {
        // only the DN is needed
        char noAttrs[] = LDAP_NO_ATTRS;
        char *attrs[] = { noAttrs, nullptr };
        timeval tv{ m_timeoutSeconds, 0 };
        LDAPMessage *raw = nullptr;
        int rc = ldap_search_ext_s(m_ld, baseDn.c_str(), LDAP_SCOPE_SUBTREE, filter.c_str(), attrs, 0,
                                   nullptr, nullptr, &tv, LDAP_NO_LIMIT, &raw);
        std::unique_ptr<LDAPMessage, LdapMessageDeleter> res(raw);
        if (rc != LDAP_SUCCESS)
        {
            if (outError) *outError = ldap_err2string(rc);
            return false;
        }
        for (LDAPMessage *e = ldap_first_entry(m_ld, res.get()); e; e = ldap_next_entry(m_ld, e))
        {
            char *dn = ldap_get_dn(m_ld, e);
            if (dn)
            {
                outDns.emplace_back(dn);
                ldap_memfree(dn);
            }
        }
        return true;
    }

private:
    LDAP *m_ld;
    long m_timeoutSeconds;
};

OpenLdapConnector::OpenLdapConnector(LdapSettings settings) : m_settings(settings)
{
}

std::unique_ptr<ILdapConnection> OpenLdapConnector::connect(const std::string &url, std::string *outError)
{
    LDAP *ld = nullptr;
    int rc = ldap_initialize(&ld, url.c_str());
    if (rc != LDAP_SUCCESS || !ld)
    {
        if (outError) *outError = ldap_err2string(rc);
        return nullptr;
    }
    auto conn = std::make_unique<OpenLdapConnection>(ld, m_settings.timeoutSeconds);

    int version = LDAP_VERSION3;
    ldap_set_option(ld, LDAP_OPT_PROTOCOL_VERSION, &version);
    ldap_set_option(ld, LDAP_OPT_REFERRALS, LDAP_OPT_OFF);
    timeval tv{ m_settings.timeoutSeconds, 0 };
    ldap_set_option(ld, LDAP_OPT_NETWORK_TIMEOUT, &tv);
    ldap_set_option(ld, LDAP_OPT_TIMEOUT, &tv);
    if (!m_settings.verifyTls)
    {
        int never = LDAP_OPT_X_TLS_NEVER;
        ldap_set_option(ld, LDAP_OPT_X_TLS_REQUIRE_CERT, &never);
        int newCtx = 0;
        ldap_set_option(ld, LDAP_OPT_X_TLS_NEWCTX, &newCtx);
    }
    PLOGD << "ldap: initialized " << url;
    return conn;
}

} // namespace CapBridge
