#pragma once

#include "ErrorSlot.hpp"
#include "LuaValue.hpp"
#include <functional>
#include <map>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

extern "C" {
#include <lua.h>
}

namespace CapBridge {

// Wrong argument count or shape. Raised to the script as a lua error.
class ArgumentError : public std::runtime_error {
public:
    explicit ArgumentError(const std::string &msg) : std::runtime_error(msg) {}
};

enum class ParamType { Any, Text, Integer, Number, Boolean, Bytes, Table };

struct ParamSpec {
    std::string name;
    ParamType type = ParamType::Any;
};

// Arguments after validation. Accessors assume the index was declared with
// the matching ParamType; a mismatch is a registration bug and throws.
class CallArgs {
public:
    size_t size() const { return m_values.size(); }
    const DynamicValue &value(size_t i) const { return m_values.at(i); }
    const std::string &text(size_t i) const;
    int64_t integer(size_t i) const;
    double number(size_t i) const;
    bool boolean(size_t i) const;
    const Bytes &bytes(size_t i) const;
    const DynamicValue &table(size_t i) const;

private:
    friend class CapabilityRegistry;
    std::vector<DynamicValue> m_values;
    std::vector<Bytes> m_bytes; // indexed like m_values, filled for ParamType::Bytes only
};

class CapabilityResult {
public:
    CapabilityResult() = default;
    CapabilityResult(DynamicValue v) : m_value(std::move(v)) {}
    CapabilityResult(SoftFailure) : m_failed(true) {}

    bool failed() const { return m_failed; }
    const DynamicValue &value() const { return m_value; }

private:
    DynamicValue m_value;
    bool m_failed = false;
};

using CapabilityHandler = std::function<CapabilityResult(const CallArgs &args)>;

struct CapabilityDescriptor {
    std::string name;
    std::vector<ParamSpec> params;
    CapabilityHandler handler;
    // false for capabilities that return nothing to lua (print, sleep)
    bool returnsValue = true;

    // documentation, filed into LuaBindingDocs on registration
    std::string signature;
    std::string summary;
    std::string example;
    std::string sourceFile;
};

// Binds capabilities as lua globals. Each global is a C closure carrying the
// registry and its descriptor; the trampoline validates arguments, runs the
// handler and turns soft failures into a nil return.
class CapabilityRegistry {
public:
    CapabilityRegistry(lua_State *L, ErrorSlot &errors);
    ~CapabilityRegistry();

    CapabilityRegistry(const CapabilityRegistry &) = delete;
    CapabilityRegistry &operator=(const CapabilityRegistry &) = delete;

    // Throws std::runtime_error when the name is already taken.
    void add(CapabilityDescriptor desc);

    bool has(const std::string &name) const;
    const CapabilityDescriptor *find(const std::string &name) const;
    std::vector<std::string> names() const;

    ErrorSlot &errors() { return m_errors; }

    // Native entry point with the same validation as a lua call. Throws
    // ArgumentError/ConversionError for programmer errors.
    CapabilityResult invoke(const std::string &name, const std::vector<DynamicValue> &args);

private:
    CallArgs bindArgs(const CapabilityDescriptor &desc, std::vector<DynamicValue> values) const;
    CapabilityResult dispatch(const CapabilityDescriptor &desc, const CallArgs &args);

    static int trampoline(lua_State *L);

    lua_State *m_L;
    ErrorSlot &m_errors;
    std::map<std::string, std::unique_ptr<CapabilityDescriptor>> m_caps;
};

} // namespace CapBridge
