#pragma once

#include "Http/HttpTypes.hpp"

namespace CapBridge {

class CapabilityRegistry;
class HttpStore;

// HTTP capabilities backed by the context's session/request store:
//   http_mksession()                              -> session id
//   http_request(session, method, url, options)   -> request id|nil
//   http_send(request)                            -> response|nil
//   http_basic_auth(url, user, password)          -> bool|nil
// `transport` and `defaults` serve the throwaway session of http_basic_auth.
void registerLuaHttpBindings(CapabilityRegistry &reg, HttpStore &store, IHttpTransport &transport, const SessionOptions &defaults);

} // namespace CapBridge
