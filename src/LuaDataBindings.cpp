#include "LuaDataBindings.hpp"
#include "CapabilityRegistry.hpp"
#include "HtmlQuery.hpp"
#include "JsonCodec.hpp"

namespace CapBridge {

void registerLuaDataBindings(CapabilityRegistry &reg)
{
    ErrorSlot &errors = reg.errors();

    CapabilityDescriptor dec;
    dec.name = "json_decode";
    dec.params = {{"text", ParamType::Text}};
    dec.handler = [&errors](const CallArgs &args) -> CapabilityResult {
        DynamicValue v;
        std::string err;
        if (!JsonCodec::decode(args.text(0), v, &err))
            return errors.set(BridgeError(BridgeError::Kind::Json, err));
        return v;
    };
    dec.signature = "json_decode(text) -> value|nil";
    dec.summary = "Parse JSON. Objects become tables, arrays become sequences, null becomes nil.";
    dec.example = "local data = json_decode(resp.text)";
    dec.sourceFile = __FILE__;
    reg.add(std::move(dec));

    CapabilityDescriptor enc;
    enc.name = "json_encode";
    enc.params = {{"value", ParamType::Any}};
    enc.handler = [&errors](const CallArgs &args) -> CapabilityResult {
        std::string out, err;
        if (!JsonCodec::encode(args.value(0), out, &err))
            return errors.set(BridgeError(BridgeError::Kind::Json, err));
        return DynamicValue::text(out);
    };
    enc.signature = "json_encode(value) -> text|nil";
    enc.summary = "Serialize to JSON. Sequences (and {}) become arrays, string-keyed tables objects.";
    enc.example = "json_encode({user=user, roles={\"a\", \"b\"}})";
    enc.sourceFile = __FILE__;
    reg.add(std::move(enc));

    CapabilityDescriptor one;
    one.name = "html_select";
    one.params = {{"html", ParamType::Text}, {"selector", ParamType::Text}};
    one.handler = [&errors](const CallArgs &args) -> CapabilityResult {
        HtmlElement el;
        std::string err;
        if (!HtmlQuery::selectFirst(args.text(0), args.text(1), el, &err))
            return errors.set(BridgeError(BridgeError::Kind::Html, err));
        return el.toValue();
    };
    one.signature = "html_select(html, selector) -> {text, attrs}|nil";
    one.summary = "First element matching a CSS selector.";
    one.example = "local csrf = html_select(resp.text, 'input[name=\"csrf\"]').attrs.value";
    one.sourceFile = __FILE__;
    reg.add(std::move(one));

    CapabilityDescriptor list;
    list.name = "html_select_list";
    list.params = {{"html", ParamType::Text}, {"selector", ParamType::Text}};
    list.handler = [&errors](const CallArgs &args) -> CapabilityResult {
        std::vector<HtmlElement> els;
        std::string err;
        if (!HtmlQuery::selectAll(args.text(0), args.text(1), els, &err))
            return errors.set(BridgeError(BridgeError::Kind::Html, err));
        DynamicValue::Entries out;
        out.reserve(els.size());
        for (const auto &el : els)
            out.emplace_back(DynamicValue::number(static_cast<double>(out.size() + 1)), el.toValue());
        return DynamicValue::table(std::move(out));
    };
    list.signature = "html_select_list(html, selector) -> {{text, attrs}, ...}|nil";
    list.summary = "Every element matching a CSS selector, in document order.";
    list.example = "for _, a in ipairs(html_select_list(resp.text, \"a.nav\")) do print(a.attrs.href) end";
    list.sourceFile = __FILE__;
    reg.add(std::move(list));
}

} // namespace CapBridge
