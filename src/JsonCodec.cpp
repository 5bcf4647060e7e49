#include "JsonCodec.hpp"
#include <cmath>

namespace CapBridge {
namespace JsonCodec {

namespace {

std::string nestingError()
{
    return "nesting exceeds " + std::to_string(kMaxTableDepth) + " levels";
}

bool convert(const nlohmann::json &j, DynamicValue &out, int depth, std::string *outError)
{
    switch (j.type())
    {
    case nlohmann::json::value_t::null:
    case nlohmann::json::value_t::discarded:
        out = DynamicValue();
        return true;
    case nlohmann::json::value_t::boolean:
        out = DynamicValue::boolean(j.get<bool>());
        return true;
    case nlohmann::json::value_t::number_integer:
    case nlohmann::json::value_t::number_unsigned:
    case nlohmann::json::value_t::number_float:
        out = DynamicValue::number(j.get<double>());
        return true;
    case nlohmann::json::value_t::string:
        out = DynamicValue::text(j.get<std::string>());
        return true;
    case nlohmann::json::value_t::binary:
        out = DynamicValue::bytes(Bytes(j.get_binary().begin(), j.get_binary().end()));
        return true;
    case nlohmann::json::value_t::array:
    case nlohmann::json::value_t::object:
        break;
    }

    if (depth > kMaxTableDepth)
    {
        if (outError) *outError = nestingError();
        return false;
    }

    DynamicValue::Entries entries;
    entries.reserve(j.size());
    double index = 1;
    for (auto it = j.begin(); it != j.end(); ++it)
    {
        DynamicValue el;
        if (!convert(it.value(), el, depth + 1, outError)) return false;
        if (j.is_array())
            entries.emplace_back(DynamicValue::number(index++), std::move(el));
        else
            entries.emplace_back(DynamicValue::text(it.key()), std::move(el));
    }
    out = DynamicValue::table(std::move(entries));
    return true;
}

} // namespace

bool fromJson(const nlohmann::json &j, DynamicValue &out, std::string *outError)
{
    return convert(j, out, 0, outError);
}

bool toJson(const DynamicValue &value, nlohmann::json &out, std::string *outError)
{
    switch (value.type())
    {
    case DynamicValue::Type::Nil:
        out = nullptr;
        return true;
    case DynamicValue::Type::Boolean:
        out = value.asBoolean();
        return true;
    case DynamicValue::Type::Number:
    {
        double n = value.asNumber();
        if (!std::isfinite(n))
        {
            if (outError) *outError = "cannot encode non-finite number";
            return false;
        }
        if (std::floor(n) == n && std::fabs(n) <= 9007199254740992.0)
            out = static_cast<int64_t>(n);
        else
            out = n;
        return true;
    }
    case DynamicValue::Type::Text:
        out = value.asText();
        return true;
    case DynamicValue::Type::Bytes:
        if (!isValidUtf8(value.asBytes()))
        {
            if (outError) *outError = "cannot encode string that is not valid UTF-8";
            return false;
        }
        out = std::string(value.asBytes().begin(), value.asBytes().end());
        return true;
    case DynamicValue::Type::Table:
        break;
    }

    if (value.isSequence())
    {
        out = nlohmann::json::array();
        for (const auto &e : value.asTable())
        {
            nlohmann::json el;
            if (!toJson(e.second, el, outError)) return false;
            out.push_back(std::move(el));
        }
        return true;
    }

    out = nlohmann::json::object();
    for (const auto &e : value.asTable())
    {
        if (!e.first.isText())
        {
            if (outError) *outError = "table keys must be all strings or a sequence 1..n, found key " + formatDebug(e.first);
            return false;
        }
        nlohmann::json el;
        if (!toJson(e.second, el, outError)) return false;
        out[e.first.asText()] = std::move(el);
    }
    return true;
}

bool decode(const std::string &text, DynamicValue &out, std::string *outError)
{
    // drop containers past the limit while parsing so no deep tree is ever built
    bool tooDeep = false;
    auto limitDepth = [&tooDeep](int depth, nlohmann::json::parse_event_t event, nlohmann::json &) {
        if (tooDeep) return false;
        if ((event == nlohmann::json::parse_event_t::object_start || event == nlohmann::json::parse_event_t::array_start)
            && depth > kMaxTableDepth)
        {
            tooDeep = true;
            return false;
        }
        return true;
    };

    nlohmann::json j;
    try
    {
        j = nlohmann::json::parse(text, limitDepth);
    }
    catch (const nlohmann::json::parse_error &e)
    {
        if (outError) *outError = e.what();
        return false;
    }
    if (tooDeep)
    {
        if (outError) *outError = nestingError();
        return false;
    }
    return fromJson(j, out, outError);
}

bool encode(const DynamicValue &value, std::string &out, std::string *outError)
{
    nlohmann::json j;
    if (!toJson(value, j, outError)) return false;
    try
    {
        out = j.dump();
        return true;
    }
    catch (const nlohmann::json::type_error &e)
    {
        if (outError) *outError = e.what();
        return false;
    }
}

} // namespace JsonCodec
} // namespace CapBridge
