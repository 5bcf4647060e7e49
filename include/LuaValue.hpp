#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>
#include <vector>

extern "C" {
#include <lua.h>
}

namespace CapBridge {

using Bytes = std::vector<uint8_t>;

// Deepest table nesting accepted when converting values (outermost table is 0).
constexpr int kMaxTableDepth = 32;

// Raised when a script value cannot be turned into the native shape a
// capability asked for. Always a programmer error on the script side.
class ConversionError : public std::runtime_error {
public:
    explicit ConversionError(const std::string &msg) : std::runtime_error(msg) {}
};

// Value crossing the Lua/host boundary. Text is always valid UTF-8; any Lua
// string that is not valid UTF-8 arrives as Bytes. Tables keep their entries
// in a deterministic order: the sequence part 1..n first, then the remaining
// keys sorted.
class DynamicValue {
public:
    enum class Type { Nil, Boolean, Number, Text, Bytes, Table };

    using Entry = std::pair<DynamicValue, DynamicValue>;
    using Entries = std::vector<Entry>;

    DynamicValue() = default;

    static DynamicValue boolean(bool b);
    static DynamicValue number(double n);
    static DynamicValue text(std::string s);
    static DynamicValue bytes(Bytes b);
    static DynamicValue table(Entries entries = {});

    Type type() const { return static_cast<Type>(m_value.index()); }
    bool isNil() const { return type() == Type::Nil; }
    bool isBoolean() const { return type() == Type::Boolean; }
    bool isNumber() const { return type() == Type::Number; }
    bool isText() const { return type() == Type::Text; }
    bool isBytes() const { return type() == Type::Bytes; }
    bool isTable() const { return type() == Type::Table; }

    bool asBoolean() const { return std::get<bool>(m_value); }
    double asNumber() const { return std::get<double>(m_value); }
    const std::string &asText() const { return std::get<std::string>(m_value); }
    const Bytes &asBytes() const { return std::get<Bytes>(m_value); }
    const Entries &asTable() const { return std::get<Entries>(m_value); }
    Entries &asTable() { return std::get<Entries>(m_value); }

    // Table helpers. get() returns nullptr when the key is absent or this is not a table.
    const DynamicValue *get(const std::string &key) const;
    void set(const std::string &key, DynamicValue value);
    // Append with the next sequence key (n + 1). Scans the table; large
    // sequences are built with table(Entries) instead.
    void push(DynamicValue value);

    // True when the table keys are exactly 1..n (an empty table counts).
    bool isSequence() const;

    bool operator==(const DynamicValue &o) const { return m_value == o.m_value; }
    bool operator!=(const DynamicValue &o) const { return !(*this == o); }

    static const char *typeName(Type t);

private:
    std::variant<std::monostate, bool, double, std::string, Bytes, Entries> m_value;
};

// Byte marshalling. toNativeBytes accepts Bytes, Text and tables of integral
// numbers in [0,255]; everything else throws ConversionError naming the value.
Bytes toNativeBytes(const DynamicValue &value);
DynamicValue fromNativeBytes(const Bytes &bytes);

// Deterministic debug rendering used by print(). Not meant to be parsed back.
std::string formatDebug(const DynamicValue &value);

bool isValidUtf8(const std::string &s);
bool isValidUtf8(const Bytes &b);

// Lua stack conversion. readLuaValue throws ConversionError for functions,
// userdata, threads and tables nested deeper than kMaxTableDepth; pushLuaValue
// throws for the same depth.
DynamicValue readLuaValue(lua_State *L, int idx);
void pushLuaValue(lua_State *L, const DynamicValue &value);

} // namespace CapBridge
