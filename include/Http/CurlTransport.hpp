#pragma once

#include "Http/HttpTypes.hpp"
#include <string>

namespace CapBridge {

// libcurl-backed transport. Every perform() uses a fresh easy handle; the
// session's cookie jar is loaded before and saved after the transfer.
class CurlTransport : public IHttpTransport {
public:
    CurlTransport();
    ~CurlTransport() override;

    bool perform(HttpSession &session, const HttpRequest &request, HttpResponse &out, std::string *outError) override;

private:
    // libcurl global init flag
    static bool curlInitialized_;
};

} // namespace CapBridge
