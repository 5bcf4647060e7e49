#include "LuaValue.hpp"
#include <algorithm>
#include <cmath>
#include <cstdio>
#include <sstream>

extern "C" {
#include <lauxlib.h>
}

namespace CapBridge {

namespace {

std::string formatNumber(double n)
{
    // same rendering Lua uses for floats (LUAI_NUMFFORMAT)
    if (std::isnan(n)) return "nan";
    if (std::isinf(n)) return n > 0 ? "inf" : "-inf";
    char buf[64];
    std::snprintf(buf, sizeof(buf), "%.14g", n);
    return buf;
}

void appendEscaped(std::string &out, unsigned char c)
{
    switch (c)
    {
    case '"': out += "\\\""; return;
    case '\\': out += "\\\\"; return;
    case '\n': out += "\\n"; return;
    case '\r': out += "\\r"; return;
    case '\t': out += "\\t"; return;
    default: break;
    }
    if (c < 0x20 || c == 0x7f)
    {
        char buf[8];
        std::snprintf(buf, sizeof(buf), "\\x%02x", c);
        out += buf;
        return;
    }
    out.push_back(static_cast<char>(c));
}

void formatInto(std::string &out, const DynamicValue &v)
{
    switch (v.type())
    {
    case DynamicValue::Type::Nil:
        out += "nil";
        break;
    case DynamicValue::Type::Boolean:
        out += v.asBoolean() ? "true" : "false";
        break;
    case DynamicValue::Type::Number:
        out += formatNumber(v.asNumber());
        break;
    case DynamicValue::Type::Text:
        // UTF-8 sequences stay readable, only ASCII controls are escaped
        out.push_back('"');
        for (unsigned char c : v.asText()) appendEscaped(out, c);
        out.push_back('"');
        break;
    case DynamicValue::Type::Bytes:
        out += "b\"";
        for (unsigned char c : v.asBytes())
        {
            if (c >= 0x80)
            {
                char buf[8];
                std::snprintf(buf, sizeof(buf), "\\x%02x", c);
                out += buf;
            }
            else
                appendEscaped(out, c);
        }
        out.push_back('"');
        break;
    case DynamicValue::Type::Table:
    {
        out.push_back('{');
        bool first = true;
        for (const auto &[k, val] : v.asTable())
        {
            if (!first) out += ", ";
            formatInto(out, k);
            out += ": ";
            formatInto(out, val);
            first = false;
        }
        out.push_back('}');
        break;
    }
    }
}

// Ordering for non-sequence table keys: booleans, numbers, text, bytes, tables.
bool keyLess(const DynamicValue &a, const DynamicValue &b)
{
    if (a.type() != b.type()) return static_cast<int>(a.type()) < static_cast<int>(b.type());
    switch (a.type())
    {
    case DynamicValue::Type::Boolean: return a.asBoolean() < b.asBoolean();
    case DynamicValue::Type::Number: return a.asNumber() < b.asNumber();
    case DynamicValue::Type::Text: return a.asText() < b.asText();
    case DynamicValue::Type::Bytes: return a.asBytes() < b.asBytes();
    default: return formatDebug(a) < formatDebug(b);
    }
}

DynamicValue readString(lua_State *L, int idx)
{
    size_t len = 0;
    const char *s = lua_tolstring(L, idx, &len);
    std::string str(s, len);
    if (isValidUtf8(str)) return DynamicValue::text(std::move(str));
    return DynamicValue::bytes(Bytes(str.begin(), str.end()));
}

DynamicValue readValue(lua_State *L, int idx, int depth);

DynamicValue readTable(lua_State *L, int idx, int depth)
{
    if (depth > kMaxTableDepth)
        throw ConversionError("table nesting exceeds " + std::to_string(kMaxTableDepth) + " levels");
    if (!lua_checkstack(L, 4))
        throw ConversionError("lua stack exhausted while reading table");

    DynamicValue::Entries seq;
    lua_Integer n = static_cast<lua_Integer>(lua_rawlen(L, idx));
    for (lua_Integer i = 1; i <= n; ++i)
    {
        lua_rawgeti(L, idx, i);
        if (lua_isnil(L, -1))
        {
            // border hit a hole; the rest is picked up by the lua_next pass
            lua_pop(L, 1);
            n = i - 1;
            break;
        }
        DynamicValue val = readValue(L, lua_gettop(L), depth + 1);
        lua_pop(L, 1);
        seq.emplace_back(DynamicValue::number(static_cast<double>(i)), std::move(val));
    }

    DynamicValue::Entries rest;
    lua_pushnil(L);
    while (lua_next(L, idx) != 0)
    {
        // key at -2, value at -1
        if (lua_isinteger(L, -2))
        {
            lua_Integer k = lua_tointeger(L, -2);
            if (k >= 1 && k <= n) { lua_pop(L, 1); continue; }
        }
        int top = lua_gettop(L);
        DynamicValue key = readValue(L, top - 1, depth + 1);
        DynamicValue val = readValue(L, top, depth + 1);
        rest.emplace_back(std::move(key), std::move(val));
        lua_pop(L, 1);
    }
    std::sort(rest.begin(), rest.end(), [](const DynamicValue::Entry &a, const DynamicValue::Entry &b) {
        return keyLess(a.first, b.first);
    });
    for (auto &e : rest) seq.push_back(std::move(e));
    return DynamicValue::table(std::move(seq));
}

DynamicValue readValue(lua_State *L, int idx, int depth)
{
    switch (lua_type(L, idx))
    {
    case LUA_TNONE:
    case LUA_TNIL:
        return DynamicValue();
    case LUA_TBOOLEAN:
        return DynamicValue::boolean(lua_toboolean(L, idx) != 0);
    case LUA_TNUMBER:
        return DynamicValue::number(static_cast<double>(lua_tonumber(L, idx)));
    case LUA_TSTRING:
        return readString(L, idx);
    case LUA_TTABLE:
        return readTable(L, lua_absindex(L, idx), depth);
    default:
        throw ConversionError(std::string("unsupported lua type: ") + luaL_typename(L, idx));
    }
}

} // namespace

DynamicValue DynamicValue::boolean(bool b)
{
    DynamicValue v;
    v.m_value.emplace<bool>(b);
    return v;
}

DynamicValue DynamicValue::number(double n)
{
    DynamicValue v;
    v.m_value.emplace<double>(n);
    return v;
}

DynamicValue DynamicValue::text(std::string s)
{
    DynamicValue v;
    v.m_value.emplace<std::string>(std::move(s));
    return v;
}

DynamicValue DynamicValue::bytes(Bytes b)
{
    DynamicValue v;
    v.m_value.emplace<Bytes>(std::move(b));
    return v;
}

DynamicValue DynamicValue::table(Entries entries)
{
    DynamicValue v;
    v.m_value.emplace<Entries>(std::move(entries));
    return v;
}

const DynamicValue *DynamicValue::get(const std::string &key) const
{
    if (!isTable()) return nullptr;
    for (const auto &e : asTable())
    {
        if (e.first.isText() && e.first.asText() == key)
            return &e.second;
    }
    return nullptr;
}

void DynamicValue::set(const std::string &key, DynamicValue value)
{
    if (!isTable()) m_value.emplace<Entries>();
    for (auto &e : asTable())
    {
        if (e.first.isText() && e.first.asText() == key)
        {
            e.second = std::move(value);
            return;
        }
    }
    asTable().emplace_back(DynamicValue::text(key), std::move(value));
}

void DynamicValue::push(DynamicValue value)
{
    if (!isTable()) m_value.emplace<Entries>();
    double next = 1;
    for (const auto &e : asTable())
    {
        if (e.first.isNumber() && e.first.asNumber() >= next)
            next = e.first.asNumber() + 1;
    }
    asTable().emplace_back(DynamicValue::number(next), std::move(value));
}

bool DynamicValue::isSequence() const
{
    if (!isTable()) return false;
    double expected = 1;
    for (const auto &e : asTable())
    {
        if (!e.first.isNumber() || e.first.asNumber() != expected) return false;
        expected += 1;
    }
    return true;
}

const char *DynamicValue::typeName(Type t)
{
    switch (t)
    {
    case Type::Nil: return "nil";
    case Type::Boolean: return "boolean";
    case Type::Number: return "number";
    case Type::Text: return "text";
    case Type::Bytes: return "bytes";
    case Type::Table: return "table";
    }
    return "unknown";
}

Bytes toNativeBytes(const DynamicValue &value)
{
    switch (value.type())
    {
    case DynamicValue::Type::Bytes:
        return value.asBytes();
    case DynamicValue::Type::Text:
        return Bytes(value.asText().begin(), value.asText().end());
    case DynamicValue::Type::Table:
    {
        Bytes out;
        out.reserve(value.asTable().size());
        for (const auto &e : value.asTable())
        {
            const DynamicValue &num = e.second;
            if (!num.isNumber())
                throw ConversionError("unexpected type: " + formatDebug(num));
            double n = num.asNumber();
            if (!(n >= 0.0 && n <= 255.0) || std::floor(n) != n)
                throw ConversionError("number is out of range: " + formatDebug(num));
            out.push_back(static_cast<uint8_t>(n));
        }
        return out;
    }
    default:
        throw ConversionError("invalid type: " + formatDebug(value));
    }
}

DynamicValue fromNativeBytes(const Bytes &bytes)
{
    return DynamicValue::bytes(bytes);
}

std::string formatDebug(const DynamicValue &value)
{
    std::string out;
    formatInto(out, value);
    return out;
}

bool isValidUtf8(const std::string &s)
{
    const auto *p = reinterpret_cast<const unsigned char *>(s.data());
    size_t i = 0, n = s.size();
    while (i < n)
    {
        unsigned char c = p[i];
        size_t extra;
        uint32_t cp;
        if (c < 0x80) { ++i; continue; }
        else if ((c & 0xE0) == 0xC0) { extra = 1; cp = c & 0x1F; }
        else if ((c & 0xF0) == 0xE0) { extra = 2; cp = c & 0x0F; }
        else if ((c & 0xF8) == 0xF0) { extra = 3; cp = c & 0x07; }
        else return false;
        if (i + extra >= n) return false;
        for (size_t k = 1; k <= extra; ++k)
        {
            if ((p[i + k] & 0xC0) != 0x80) return false;
            cp = (cp << 6) | (p[i + k] & 0x3F);
        }
        // overlong forms, surrogates, out of range
        if ((extra == 1 && cp < 0x80) || (extra == 2 && cp < 0x800) || (extra == 3 && cp < 0x10000))
            return false;
        if (cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF))
            return false;
        i += extra + 1;
    }
    return true;
}

bool isValidUtf8(const Bytes &b)
{
    return isValidUtf8(std::string(b.begin(), b.end()));
}

DynamicValue readLuaValue(lua_State *L, int idx)
{
    return readValue(L, lua_absindex(L, idx), 0);
}

namespace {

void pushValue(lua_State *L, const DynamicValue &value, int depth)
{
    if (!lua_checkstack(L, 3))
        throw ConversionError("lua stack exhausted while pushing value");
    switch (value.type())
    {
    case DynamicValue::Type::Nil:
        lua_pushnil(L);
        break;
    case DynamicValue::Type::Boolean:
        lua_pushboolean(L, value.asBoolean() ? 1 : 0);
        break;
    case DynamicValue::Type::Number:
    {
        double n = value.asNumber();
        // integral values in range become lua integers so math.type() and %d work
        if (std::floor(n) == n && n >= -9007199254740992.0 && n <= 9007199254740992.0)
            lua_pushinteger(L, static_cast<lua_Integer>(n));
        else
            lua_pushnumber(L, static_cast<lua_Number>(n));
        break;
    }
    case DynamicValue::Type::Text:
        lua_pushlstring(L, value.asText().data(), value.asText().size());
        break;
    case DynamicValue::Type::Bytes:
        lua_pushlstring(L, reinterpret_cast<const char *>(value.asBytes().data()), value.asBytes().size());
        break;
    case DynamicValue::Type::Table:
        if (depth > kMaxTableDepth)
            throw ConversionError("table nesting exceeds " + std::to_string(kMaxTableDepth) + " levels");
        lua_createtable(L, 0, static_cast<int>(value.asTable().size()));
        for (const auto &[k, v] : value.asTable())
        {
            // lua_rawset raises on nil and NaN keys
            if (k.isNil() || (k.isNumber() && std::isnan(k.asNumber()))) continue;
            pushValue(L, k, depth + 1);
            pushValue(L, v, depth + 1);
            lua_rawset(L, -3);
        }
        break;
    }
}

} // namespace

void pushLuaValue(lua_State *L, const DynamicValue &value)
{
    pushValue(L, value, 0);
}

} // namespace CapBridge
