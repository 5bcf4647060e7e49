#pragma once

#include "BridgeConfig.hpp"
#include "Http/RequestOptions.hpp"
#include "LuaValue.hpp"
#include <string>
#include <vector>

namespace CapBridge {

// Transport defaults owned by a session. Copied from the bridge config when
// the session is opened.
struct SessionOptions {
    std::string userAgent;
    bool verifyTls = true;
    std::string proxy;
    long timeoutSeconds = 30;
    bool followRedirects = true;
    long maxRedirects = 10;

    static SessionOptions fromSettings(const HttpSettings &s);
};

struct HttpSession {
    std::string id;
    SessionOptions options;
    // Netscape cookie-file lines, replayed on every request of this session
    std::vector<std::string> cookies;
};

struct HttpRequest {
    std::string sessionId;
    std::string method;
    std::string url;
    RequestOptions options;
};

struct HttpResponse {
    long status = 0;
    HeaderList headers; // wire order, duplicates kept
    Bytes body;

    // Case-insensitive lookup of the first header with this name
    const std::string *header(const std::string &name) const;

    // {status=, headers={{name=, value=}, ...}, body=, text=}
    DynamicValue toValue() const;
};

// Performs one request on behalf of a session. Implementations update the
// session's cookie jar from the response.
class IHttpTransport {
public:
    virtual ~IHttpTransport() = default;
    virtual bool perform(HttpSession &session, const HttpRequest &request, HttpResponse &out, std::string *outError) = 0;
};

} // namespace CapBridge
