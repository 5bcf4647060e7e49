#include "Http/HttpTypes.hpp"
#include <algorithm>
#include <cctype>

namespace CapBridge {

SessionOptions SessionOptions::fromSettings(const HttpSettings &s)
{
    SessionOptions o;
    o.userAgent = s.userAgent;
    o.verifyTls = s.verifyTls;
    o.proxy = s.proxy;
    o.timeoutSeconds = s.timeoutSeconds;
    o.followRedirects = s.followRedirects;
    o.maxRedirects = s.maxRedirects;
    return o;
}

static bool iequals(const std::string &a, const std::string &b)
{
    return a.size() == b.size() && std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
        return std::tolower(static_cast<unsigned char>(x)) == std::tolower(static_cast<unsigned char>(y));
    });
}

const std::string *HttpResponse::header(const std::string &name) const
{
    for (const auto &h : headers)
    {
        if (iequals(h.first, name)) return &h.second;
    }
    return nullptr;
}

DynamicValue HttpResponse::toValue() const
{
    DynamicValue::Entries hdrs;
    hdrs.reserve(headers.size());
    for (const auto &h : headers)
    {
        DynamicValue pair = DynamicValue::table();
        pair.set("name", DynamicValue::text(h.first));
        pair.set("value", isValidUtf8(h.second) ? DynamicValue::text(h.second)
                                                 : DynamicValue::bytes(Bytes(h.second.begin(), h.second.end())));
        hdrs.emplace_back(DynamicValue::number(static_cast<double>(hdrs.size() + 1)), std::move(pair));
    }

    DynamicValue out = DynamicValue::table();
    out.set("status", DynamicValue::number(static_cast<double>(status)));
    out.set("headers", DynamicValue::table(std::move(hdrs)));
    out.set("body", fromNativeBytes(body));
    std::string text(body.begin(), body.end());
    out.set("text", isValidUtf8(text) ? DynamicValue::text(std::move(text)) : fromNativeBytes(body));
    return out;
}

} // namespace CapBridge
