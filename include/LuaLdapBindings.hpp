#pragma once

namespace CapBridge {

class CapabilityRegistry;
class ILdapConnector;

// Directory capabilities:
//   ldap_bind(url, dn, password)                                        -> bool|nil
//   ldap_search_bind(url, search_user, search_pw, base_dn, user, pw)    -> bool|nil
//   ldap_escape(text)                                                   -> text
void registerLuaLdapBindings(CapabilityRegistry &reg, ILdapConnector &connector);

} // namespace CapBridge
