#pragma once

#include "ErrorSlot.hpp"
#include "Http/HttpTypes.hpp"
#include <string>
#include <unordered_map>

namespace CapBridge {

// Sessions and built-but-unsent requests of one execution context, addressed
// by opaque tokens. A pending request is removed before it is dispatched, so
// each token is sent at most once. Not thread-safe; one store per context.
class HttpStore {
public:
    HttpStore(IHttpTransport &transport, SessionOptions defaults);
    ~HttpStore();

    HttpStore(const HttpStore &) = delete;
    HttpStore &operator=(const HttpStore &) = delete;

    std::string openSession();

    // Fails with UnknownSession or InvalidOptions
    bool buildRequest(const std::string &sessionId, const std::string &method, const std::string &url,
                      const DynamicValue &options, std::string &outRequestId, BridgeError *outError);

    // Fails with UnknownRequest or TransportError
    bool sendRequest(const std::string &requestId, HttpResponse &out, BridgeError *outError);

    bool hasSession(const std::string &id) const { return m_sessions.count(id) != 0; }
    bool hasPending(const std::string &id) const { return m_pending.count(id) != 0; }
    size_t sessionCount() const { return m_sessions.size(); }
    size_t pendingCount() const { return m_pending.size(); }
    const HttpSession *session(const std::string &id) const;

private:
    std::string freshToken() const;

    IHttpTransport &m_transport;
    SessionOptions m_defaults;
    std::unordered_map<std::string, HttpSession> m_sessions;
    std::unordered_map<std::string, HttpRequest> m_pending;
};

} // namespace CapBridge
