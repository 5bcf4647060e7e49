#include "CapabilityRegistry.hpp"
#include "LuaBindingDocs.hpp"
#include <plog/Log.h>
#include <cmath>
#include <cstdio>

extern "C" {
#include <lauxlib.h>
}

namespace CapBridge {

static const char *paramTypeName(ParamType t)
{
    switch (t)
    {
    case ParamType::Any: return "any";
    case ParamType::Text: return "text";
    case ParamType::Integer: return "integer";
    case ParamType::Number: return "number";
    case ParamType::Boolean: return "boolean";
    case ParamType::Bytes: return "bytes";
    case ParamType::Table: return "table";
    }
    return "any";
}

// ── CallArgs ─────────────────────────────────────────────────────────────

const std::string &CallArgs::text(size_t i) const { return m_values.at(i).asText(); }

int64_t CallArgs::integer(size_t i) const { return static_cast<int64_t>(m_values.at(i).asNumber()); }

double CallArgs::number(size_t i) const { return m_values.at(i).asNumber(); }

bool CallArgs::boolean(size_t i) const { return m_values.at(i).asBoolean(); }

const Bytes &CallArgs::bytes(size_t i) const { return m_bytes.at(i); }

const DynamicValue &CallArgs::table(size_t i) const
{
    const DynamicValue &v = m_values.at(i);
    if (!v.isTable()) throw std::logic_error("argument is not a table");
    return v;
}

// ── CapabilityRegistry ───────────────────────────────────────────────────

CapabilityRegistry::CapabilityRegistry(lua_State *L, ErrorSlot &errors) : m_L(L), m_errors(errors)
{
}

CapabilityRegistry::~CapabilityRegistry()
{
}

void CapabilityRegistry::add(CapabilityDescriptor desc)
{
    if (desc.name.empty())
        throw std::runtime_error("capability name must not be empty");
    if (m_caps.count(desc.name))
        throw std::runtime_error("capability already registered: " + desc.name);
    if (!desc.handler)
        throw std::runtime_error("capability has no handler: " + desc.name);

    auto owned = std::make_unique<CapabilityDescriptor>(std::move(desc));
    CapabilityDescriptor *d = owned.get();
    m_caps.emplace(d->name, std::move(owned));

    LuaBindingDocs::get().registerDoc(d->name, d->signature, d->summary, d->example, d->sourceFile);

    if (m_L)
    {
        lua_pushlightuserdata(m_L, this);
        lua_pushlightuserdata(m_L, d);
        lua_pushcclosure(m_L, &CapabilityRegistry::trampoline, 2);
        lua_setglobal(m_L, d->name.c_str());
    }
    PLOGD << "capability registered: " << d->name;
}

bool CapabilityRegistry::has(const std::string &name) const
{
    return m_caps.count(name) != 0;
}

const CapabilityDescriptor *CapabilityRegistry::find(const std::string &name) const
{
    auto it = m_caps.find(name);
    if (it == m_caps.end()) return nullptr;
    return it->second.get();
}

std::vector<std::string> CapabilityRegistry::names() const
{
    std::vector<std::string> out;
    out.reserve(m_caps.size());
    for (const auto &kv : m_caps) out.push_back(kv.first);
    return out;
}

CallArgs CapabilityRegistry::bindArgs(const CapabilityDescriptor &desc, std::vector<DynamicValue> values) const
{
    if (values.size() != desc.params.size())
    {
        throw ArgumentError("expected " + std::to_string(desc.params.size()) + " argument(s), got "
                            + std::to_string(values.size()));
    }

    CallArgs args;
    args.m_bytes.resize(values.size());
    for (size_t i = 0; i < values.size(); ++i)
    {
        const ParamSpec &p = desc.params[i];
        const DynamicValue &v = values[i];
        auto mismatch = [&]() {
            return ArgumentError("bad argument #" + std::to_string(i + 1) + " '" + p.name + "' (" + paramTypeName(p.type)
                                 + " expected, got " + DynamicValue::typeName(v.type()) + ")");
        };
        switch (p.type)
        {
        case ParamType::Any:
            break;
        case ParamType::Text:
            if (!v.isText()) throw mismatch();
            break;
        case ParamType::Integer:
        {
            if (!v.isNumber()) throw mismatch();
            double n = v.asNumber();
            if (std::floor(n) != n || n < -9007199254740992.0 || n > 9007199254740992.0)
                throw ArgumentError("bad argument #" + std::to_string(i + 1) + " '" + p.name
                                    + "' (number has no integer representation)");
            break;
        }
        case ParamType::Number:
            if (!v.isNumber()) throw mismatch();
            break;
        case ParamType::Boolean:
            if (!v.isBoolean()) throw mismatch();
            break;
        case ParamType::Bytes:
            try
            {
                args.m_bytes[i] = toNativeBytes(v);
            }
            catch (const ConversionError &e)
            {
                throw ConversionError("bad argument #" + std::to_string(i + 1) + " '" + p.name + "' (" + e.what() + ")");
            }
            break;
        case ParamType::Table:
            if (!v.isTable()) throw mismatch();
            break;
        }
    }
    args.m_values = std::move(values);
    return args;
}

CapabilityResult CapabilityRegistry::dispatch(const CapabilityDescriptor &desc, const CallArgs &args)
{
    CapabilityResult result;
    try
    {
        result = desc.handler(args);
    }
    catch (const ArgumentError &)
    {
        throw;
    }
    catch (const ConversionError &)
    {
        throw;
    }
    catch (const std::exception &e)
    {
        // a service threw instead of reporting; still an operational failure
        result = m_errors.set(BridgeError(BridgeError::Kind::Internal, e.what()));
    }

    if (result.failed())
    {
        auto msg = m_errors.last();
        PLOGW << "capability " << desc.name << " failed: " << (msg ? *msg : std::string("(no diagnostic)"));
    }
    return result;
}

CapabilityResult CapabilityRegistry::invoke(const std::string &name, const std::vector<DynamicValue> &args)
{
    const CapabilityDescriptor *desc = find(name);
    if (!desc)
        throw ArgumentError("unknown capability: " + name);
    return dispatch(*desc, bindArgs(*desc, args));
}

int CapabilityRegistry::trampoline(lua_State *L)
{
    auto *reg = static_cast<CapabilityRegistry *>(lua_touserdata(L, lua_upvalueindex(1)));
    auto *desc = static_cast<const CapabilityDescriptor *>(lua_touserdata(L, lua_upvalueindex(2)));

    // lua_error and a failing lua_push* longjmp; every C++ object must be gone
    // before either can happen, so the message waits in a plain buffer
    char message[1024];
    bool raise = false;
    int nresults = 0;
    {
        try
        {
            int nargs = lua_gettop(L);
            std::vector<DynamicValue> values;
            values.reserve(static_cast<size_t>(nargs));
            for (int i = 1; i <= nargs; ++i)
                values.push_back(readLuaValue(L, i));

            CapabilityResult r = reg->dispatch(*desc, reg->bindArgs(*desc, std::move(values)));
            if (r.failed())
            {
                lua_pushnil(L);
                nresults = 1;
            }
            else if (desc->returnsValue)
            {
                pushLuaValue(L, r.value());
                nresults = 1;
            }
        }
        catch (const std::exception &e)
        {
            PLOGW << "capability " << desc->name << ": " << e.what();
            std::snprintf(message, sizeof(message), "%s: %s", desc->name.c_str(), e.what());
            raise = true;
        }
    }
    if (raise)
    {
        lua_pushstring(L, message);
        // prefix with the caller's position the way luaL_error does
        luaL_where(L, 1);
        lua_insert(L, -2);
        lua_concat(L, 2);
        return lua_error(L);
    }
    return nresults;
}

} // namespace CapBridge
