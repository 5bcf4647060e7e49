#pragma once

#include "LuaValue.hpp"
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace CapBridge {

using HeaderList = std::vector<std::pair<std::string, std::string>>;

// Parsed form of the options table passed to http_request. Every field is
// optional; unset fields fall back to the session defaults at send time.
struct RequestOptions {
    HeaderList query;
    HeaderList headers;
    std::optional<std::pair<std::string, std::string>> basicAuth;
    std::optional<std::string> userAgent;
    std::optional<std::string> proxy;
    std::optional<double> timeoutSeconds;
    std::optional<bool> verifyTls;
    std::optional<bool> followRedirects;

    // Request payload; at most one of json/form/body may be given
    enum class BodyKind { None, Raw, Json, Form };
    BodyKind bodyKind = BodyKind::None;
    Bytes body;          // Raw and Json
    HeaderList form;     // Form, encoded by the transport

    // Rejects unknown keys and wrongly shaped values.
    static bool parse(const DynamicValue &value, RequestOptions &out, std::string *outError);
};

} // namespace CapBridge
