#include "LuaLdapBindings.hpp"
#include "CapabilityRegistry.hpp"
#include "Ldap/LdapClient.hpp"

namespace CapBridge {

void registerLuaLdapBindings(CapabilityRegistry &reg, ILdapConnector &connector)
{
    ErrorSlot &errors = reg.errors();

    CapabilityDescriptor bind;
    bind.name = "ldap_bind";
    bind.params = {{"url", ParamType::Text}, {"dn", ParamType::Text}, {"password", ParamType::Text}};
    bind.handler = [&connector, &errors](const CallArgs &args) -> CapabilityResult {
        bool success = false;
        std::string err;
        if (!LdapClient::bind(connector, args.text(0), args.text(1), args.text(2), success, &err))
            return errors.set(BridgeError(BridgeError::Kind::Protocol, err));
        return DynamicValue::boolean(success);
    };
    bind.signature = "ldap_bind(url, dn, password) -> bool|nil";
    bind.summary = "Simple bind; false when the server rejects the credentials.";
    bind.example = "return ldap_bind(\"ldap://127.0.0.1\", \"uid=\" .. ldap_escape(user) .. \",ou=people,dc=example,dc=com\", password)";
    bind.sourceFile = __FILE__;
    reg.add(std::move(bind));

    CapabilityDescriptor search;
    search.name = "ldap_search_bind";
    search.params = {{"url", ParamType::Text}, {"search_user", ParamType::Text}, {"search_pw", ParamType::Text},
                     {"base_dn", ParamType::Text}, {"user", ParamType::Text}, {"password", ParamType::Text}};
    search.handler = [&connector, &errors](const CallArgs &args) -> CapabilityResult {
        bool success = false;
        std::string err;
        if (!LdapClient::searchBind(connector, args.text(0), args.text(1), args.text(2), args.text(3), args.text(4),
                                    args.text(5), success, &err))
            return errors.set(BridgeError(BridgeError::Kind::Protocol, err));
        return DynamicValue::boolean(success);
    };
    search.signature = "ldap_search_bind(url, search_user, search_pw, base_dn, user, password) -> bool|nil";
    search.summary = "Bind as the search user, find uid=<user> below base_dn and bind as the first match.";
    search.example = "return ldap_search_bind(url, \"cn=search,dc=example,dc=com\", \"secret\", \"ou=people,dc=example,dc=com\", user, password)";
    search.sourceFile = __FILE__;
    reg.add(std::move(search));

    CapabilityDescriptor esc;
    esc.name = "ldap_escape";
    esc.params = {{"text", ParamType::Text}};
    esc.handler = [](const CallArgs &args) -> CapabilityResult {
        return DynamicValue::text(LdapClient::escapeDnValue(args.text(0)));
    };
    esc.signature = "ldap_escape(text) -> text";
    esc.summary = "Escape a value for use inside a DN.";
    esc.example = "ldap_escape(\"a,b\") -- \"a\\\\,b\"";
    esc.sourceFile = __FILE__;
    reg.add(std::move(esc));
}

} // namespace CapBridge
