#include "Ldap/LdapClient.hpp"
#include <plog/Log.h>
#include <cstdio>

namespace CapBridge {
namespace LdapClient {

bool bind(ILdapConnector &connector, const std::string &url, const std::string &dn, const std::string &password,
          bool &outSuccess, std::string *outError)
{
    std::string err;
    auto conn = connector.connect(url, &err);
    if (!conn)
    {
        if (outError) *outError = "ldap connection failed: " + err;
        return false;
    }
    if (!conn->simpleBind(dn, password, outSuccess, &err))
    {
        if (outError) *outError = "fatal error during simple_bind: " + err;
        return false;
    }
    return true;
}

bool searchBind(ILdapConnector &connector, const std::string &url, const std::string &searchUser,
                const std::string &searchPassword, const std::string &baseDn, const std::string &user,
                const std::string &password, bool &outSuccess, std::string *outError)
{
    std::string err;
    auto conn = connector.connect(url, &err);
    if (!conn)
    {
        if (outError) *outError = "ldap connection failed: " + err;
        return false;
    }

    bool searchBound = false;
    if (!conn->simpleBind(searchUser, searchPassword, searchBound, &err))
    {
        if (outError) *outError = "fatal error during simple_bind with search user: " + err;
        return false;
    }
    if (!searchBound)
    {
        if (outError) *outError = "login with search user failed";
        return false;
    }

    std::vector<std::string> dns;
    std::string filter = "(uid=" + escapeFilterValue(user) + ")";
    if (!conn->searchSubtree(baseDn, filter, dns, &err))
    {
        if (outError) *outError = "ldap search failed: " + err;
        return false;
    }
    if (dns.empty())
    {
        PLOGD << "ldap: no entry for " << filter << " below " << baseDn;
        outSuccess = false;
        return true;
    }

    // take the first result
    if (!conn->simpleBind(dns.front(), password, outSuccess, &err))
    {
        if (outError) *outError = "fatal error during simple_bind: " + err;
        return false;
    }
    return true;
}

static void appendHexEscape(std::string &out, unsigned char c)
{
    char buf[4];
    std::snprintf(buf, sizeof(buf), "\\%02x", c);
    out += buf;
}

std::string escapeDnValue(const std::string &value)
{
    std::string out;
    out.reserve(value.size());
    for (size_t i = 0; i < value.size(); ++i)
    {
        unsigned char c = static_cast<unsigned char>(value[i]);
        bool leading = i == 0 && (c == ' ' || c == '#');
        bool trailing = i + 1 == value.size() && c == ' ';
        if (c == 0)
            appendHexEscape(out, c);
        else if (leading || trailing || c == '"' || c == '+' || c == ',' || c == ';' || c == '<' || c == '>'
                 || c == '\\' || c == '=')
        {
            out.push_back('\\');
            out.push_back(static_cast<char>(c));
        }
        else
            out.push_back(static_cast<char>(c));
    }
    return out;
}

std::string escapeFilterValue(const std::string &value)
{
    std::string out;
    out.reserve(value.size());
    for (char ch : value)
    {
        unsigned char c = static_cast<unsigned char>(ch);
        if (c == '*' || c == '(' || c == ')' || c == '\\' || c == 0)
            appendHexEscape(out, c);
        else
            out.push_back(ch);
    }
    return out;
}

} // namespace LdapClient
} // namespace CapBridge
