#include "Http/HttpStore.hpp"
#include <plog/Log.h>
#include <iomanip>
#include <random>
#include <sstream>

namespace CapBridge {

// Random version-4 UUID string
static std::string generateUUID()
{
    static std::random_device rd;
    static std::mt19937_64 gen(rd());
    static std::uniform_int_distribution<uint64_t> dis;

    uint64_t a = dis(gen);
    uint64_t b = dis(gen);

    a = (a & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;
    b = (b & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;

    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    oss << std::setw(8) << ((a >> 32) & 0xFFFFFFFF) << '-';
    oss << std::setw(4) << ((a >> 16) & 0xFFFF) << '-';
    oss << std::setw(4) << (a & 0xFFFF) << '-';
    oss << std::setw(4) << ((b >> 48) & 0xFFFF) << '-';
    oss << std::setw(12) << (b & 0xFFFFFFFFFFFFULL);
    return oss.str();
}

static bool isValidMethod(const std::string &m)
{
    if (m.empty()) return false;
    for (char c : m)
    {
        if (c < 'A' || c > 'Z') return false;
    }
    return true;
}

HttpStore::HttpStore(IHttpTransport &transport, SessionOptions defaults)
    : m_transport(transport), m_defaults(std::move(defaults))
{
}

HttpStore::~HttpStore()
{
    if (!m_pending.empty())
        PLOGD << "HttpStore: dropping " << m_pending.size() << " unsent request(s)";
}

std::string HttpStore::freshToken() const
{
    std::string id;
    do { id = generateUUID(); } while (m_sessions.count(id) || m_pending.count(id));
    return id;
}

std::string HttpStore::openSession()
{
    HttpSession s;
    s.id = freshToken();
    s.options = m_defaults;
    std::string id = s.id;
    m_sessions.emplace(id, std::move(s));
    PLOGD << "HttpStore: opened session " << id;
    return id;
}

const HttpSession *HttpStore::session(const std::string &id) const
{
    auto it = m_sessions.find(id);
    if (it == m_sessions.end()) return nullptr;
    return &it->second;
}

bool HttpStore::buildRequest(const std::string &sessionId, const std::string &method, const std::string &url,
                             const DynamicValue &options, std::string &outRequestId, BridgeError *outError)
{
    if (!m_sessions.count(sessionId))
    {
        if (outError) *outError = BridgeError(BridgeError::Kind::UnknownSession, "no session with id '" + sessionId + "'");
        return false;
    }
    if (!isValidMethod(method))
    {
        if (outError) *outError = BridgeError(BridgeError::Kind::InvalidOptions, "invalid http method '" + method + "'");
        return false;
    }
    if (url.empty())
    {
        if (outError) *outError = BridgeError(BridgeError::Kind::InvalidOptions, "url must not be empty");
        return false;
    }

    HttpRequest req;
    std::string err;
    if (!RequestOptions::parse(options, req.options, &err))
    {
        if (outError) *outError = BridgeError(BridgeError::Kind::InvalidOptions, err);
        return false;
    }
    req.sessionId = sessionId;
    req.method = method;
    req.url = url;

    outRequestId = freshToken();
    m_pending.emplace(outRequestId, std::move(req));
    return true;
}

bool HttpStore::sendRequest(const std::string &requestId, HttpResponse &out, BridgeError *outError)
{
    auto it = m_pending.find(requestId);
    if (it == m_pending.end())
    {
        if (outError) *outError = BridgeError(BridgeError::Kind::UnknownRequest, "no pending request with id '" + requestId + "'");
        return false;
    }
    // consume before dispatch so a failed send cannot be replayed
    HttpRequest req = std::move(it->second);
    m_pending.erase(it);

    auto sit = m_sessions.find(req.sessionId);
    if (sit == m_sessions.end())
    {
        if (outError) *outError = BridgeError(BridgeError::Kind::UnknownSession, "session of request is gone");
        return false;
    }

    PLOGD << "http " << req.method << " " << req.url;
    std::string err;
    HttpResponse resp;
    if (!m_transport.perform(sit->second, req, resp, &err))
    {
        if (outError) *outError = BridgeError(BridgeError::Kind::TransportError, err);
        return false;
    }
    PLOGD << "http " << req.method << " " << req.url << " -> " << resp.status;
    out = std::move(resp);
    return true;
}

} // namespace CapBridge
