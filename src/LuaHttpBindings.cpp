#include "LuaHttpBindings.hpp"
#include "CapabilityRegistry.hpp"
#include "Http/HttpStore.hpp"
#include <plog/Log.h>

namespace CapBridge {

void registerLuaHttpBindings(CapabilityRegistry &reg, HttpStore &store, IHttpTransport &transport, const SessionOptions &defaults)
{
    ErrorSlot &errors = reg.errors();

    CapabilityDescriptor mk;
    mk.name = "http_mksession";
    mk.handler = [&store](const CallArgs &) -> CapabilityResult {
        return DynamicValue::text(store.openSession());
    };
    mk.signature = "http_mksession() -> session";
    mk.summary = "Open a session with its own cookie jar and transport defaults.";
    mk.example = "local s = http_mksession()";
    mk.sourceFile = __FILE__;
    reg.add(std::move(mk));

    CapabilityDescriptor req;
    req.name = "http_request";
    req.params = {{"session", ParamType::Text}, {"method", ParamType::Text}, {"url", ParamType::Text}, {"options", ParamType::Any}};
    req.handler = [&store, &errors](const CallArgs &args) -> CapabilityResult {
        std::string id;
        BridgeError err;
        if (!store.buildRequest(args.text(0), args.text(1), args.text(2), args.value(3), id, &err))
            return errors.set(err);
        return DynamicValue::text(id);
    };
    req.signature = "http_request(session, method, url, options) -> request|nil";
    req.summary = "Prepare a request on a session. Options: query, headers, basic_auth, user_agent, json, form, body, timeout, proxy, verify_tls, follow_redirects.";
    req.example = "local r = http_request(s, \"POST\", url, {json={user=user}})";
    req.sourceFile = __FILE__;
    reg.add(std::move(req));

    CapabilityDescriptor send;
    send.name = "http_send";
    send.params = {{"request", ParamType::Text}};
    send.handler = [&store, &errors](const CallArgs &args) -> CapabilityResult {
        HttpResponse resp;
        BridgeError err;
        if (!store.sendRequest(args.text(0), resp, &err))
            return errors.set(err);
        return resp.toValue();
    };
    send.signature = "http_send(request) -> {status, headers, body, text}|nil";
    send.summary = "Send a prepared request. Each request can be sent once.";
    send.example = "local resp = http_send(r)\nif resp.status == 200 then ... end";
    send.sourceFile = __FILE__;
    reg.add(std::move(send));

    CapabilityDescriptor basic;
    basic.name = "http_basic_auth";
    basic.params = {{"url", ParamType::Text}, {"user", ParamType::Text}, {"password", ParamType::Text}};
    basic.handler = [&transport, defaults, &errors](const CallArgs &args) -> CapabilityResult {
        // throwaway store; nothing leaks into the script's sessions
        HttpStore oneShot(transport, defaults);
        std::string session = oneShot.openSession();

        DynamicValue auth = DynamicValue::table();
        auth.push(DynamicValue::text(args.text(1)));
        auth.push(DynamicValue::text(args.text(2)));
        DynamicValue options = DynamicValue::table();
        options.set("basic_auth", std::move(auth));

        std::string id;
        BridgeError err;
        if (!oneShot.buildRequest(session, "GET", args.text(0), options, id, &err))
            return errors.set(err);
        HttpResponse resp;
        if (!oneShot.sendRequest(id, resp, &err))
            return errors.set(err);

        bool ok = resp.status != 401 && resp.header("WWW-Authenticate") == nullptr;
        PLOGD << "http_basic_auth " << args.text(0) << " -> " << resp.status;
        return DynamicValue::boolean(ok);
    };
    basic.signature = "http_basic_auth(url, user, password) -> bool|nil";
    basic.summary = "GET with basic credentials; true unless the server answers 401 or asks for authentication.";
    basic.example = "return http_basic_auth(\"https://example.com/private\", user, password)";
    basic.sourceFile = __FILE__;
    reg.add(std::move(basic));
}

} // namespace CapBridge
