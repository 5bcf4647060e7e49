#include "Http/RequestOptions.hpp"
#include "BridgeConfig.hpp"
#include "JsonCodec.hpp"
#include <cmath>

namespace CapBridge {

static bool readStringMap(const DynamicValue &v, const char *key, HeaderList &out, std::string *outError)
{
    if (!v.isTable())
    {
        if (outError) *outError = std::string("'") + key + "' must be a table";
        return false;
    }
    for (const auto &e : v.asTable())
    {
        if (!e.first.isText() || !e.second.isText())
        {
            if (outError) *outError = std::string("'") + key + "' must map strings to strings, found "
                                      + formatDebug(e.first) + ": " + formatDebug(e.second);
            return false;
        }
        out.emplace_back(e.first.asText(), e.second.asText());
    }
    return true;
}

static bool readText(const DynamicValue &v, const char *key, std::optional<std::string> &out, std::string *outError)
{
    if (!v.isText())
    {
        if (outError) *outError = std::string("'") + key + "' must be a string";
        return false;
    }
    out = v.asText();
    return true;
}

static bool readBool(const DynamicValue &v, const char *key, std::optional<bool> &out, std::string *outError)
{
    if (!v.isBoolean())
    {
        if (outError) *outError = std::string("'") + key + "' must be a boolean";
        return false;
    }
    out = v.asBoolean();
    return true;
}

static bool setBodyKind(RequestOptions &o, RequestOptions::BodyKind kind, std::string *outError)
{
    if (o.bodyKind != RequestOptions::BodyKind::None)
    {
        if (outError) *outError = "only one of 'body', 'json' and 'form' may be given";
        return false;
    }
    o.bodyKind = kind;
    return true;
}

bool RequestOptions::parse(const DynamicValue &value, RequestOptions &out, std::string *outError)
{
    RequestOptions o;
    if (value.isNil())
    {
        out = std::move(o);
        return true;
    }
    if (!value.isTable())
    {
        if (outError) *outError = "options must be a table";
        return false;
    }

    for (const auto &[k, v] : value.asTable())
    {
        if (!k.isText())
        {
            if (outError) *outError = "unexpected option key " + formatDebug(k);
            return false;
        }
        const std::string &key = k.asText();
        if (key == "query")
        {
            if (!readStringMap(v, "query", o.query, outError)) return false;
        }
        else if (key == "headers")
        {
            if (!readStringMap(v, "headers", o.headers, outError)) return false;
        }
        else if (key == "basic_auth")
        {
            if (!v.isSequence() || v.asTable().size() != 2 || !v.asTable()[0].second.isText() || !v.asTable()[1].second.isText())
            {
                if (outError) *outError = "'basic_auth' must be {user, password}";
                return false;
            }
            o.basicAuth = std::make_pair(v.asTable()[0].second.asText(), v.asTable()[1].second.asText());
        }
        else if (key == "user_agent")
        {
            if (!readText(v, "user_agent", o.userAgent, outError)) return false;
        }
        else if (key == "proxy")
        {
            if (!readText(v, "proxy", o.proxy, outError)) return false;
        }
        else if (key == "timeout")
        {
            if (!v.isNumber() || !std::isfinite(v.asNumber()) || v.asNumber() <= 0)
            {
                if (outError) *outError = "'timeout' must be a positive number of seconds";
                return false;
            }
            if (v.asNumber() > static_cast<double>(kMaxTimeoutSeconds))
            {
                if (outError) *outError = "'timeout' must not exceed " + std::to_string(kMaxTimeoutSeconds) + " seconds";
                return false;
            }
            o.timeoutSeconds = v.asNumber();
        }
        else if (key == "verify_tls")
        {
            if (!readBool(v, "verify_tls", o.verifyTls, outError)) return false;
        }
        else if (key == "follow_redirects")
        {
            if (!readBool(v, "follow_redirects", o.followRedirects, outError)) return false;
        }
        else if (key == "body")
        {
            if (!setBodyKind(o, BodyKind::Raw, outError)) return false;
            try
            {
                o.body = toNativeBytes(v);
            }
            catch (const ConversionError &e)
            {
                if (outError) *outError = std::string("'body': ") + e.what();
                return false;
            }
        }
        else if (key == "json")
        {
            if (!setBodyKind(o, BodyKind::Json, outError)) return false;
            std::string encoded, err;
            if (!JsonCodec::encode(v, encoded, &err))
            {
                if (outError) *outError = "'json': " + err;
                return false;
            }
            o.body.assign(encoded.begin(), encoded.end());
        }
        else if (key == "form")
        {
            if (!setBodyKind(o, BodyKind::Form, outError)) return false;
            if (!readStringMap(v, "form", o.form, outError)) return false;
        }
        else
        {
            if (outError) *outError = "unknown option '" + key + "'";
            return false;
        }
    }
    out = std::move(o);
    return true;
}

} // namespace CapBridge
