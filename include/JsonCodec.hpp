#pragma once

#include "LuaValue.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace CapBridge {
namespace JsonCodec {

// Fails with outError set when containers nest deeper than kMaxTableDepth.
bool fromJson(const nlohmann::json &j, DynamicValue &out, std::string *outError);

// Sequence tables (keys 1..n, including the empty table) become arrays,
// text-keyed tables become objects. Anything else fails with outError set.
bool toJson(const DynamicValue &value, nlohmann::json &out, std::string *outError);

bool decode(const std::string &text, DynamicValue &out, std::string *outError);
bool encode(const DynamicValue &value, std::string &out, std::string *outError);

} // namespace JsonCodec
} // namespace CapBridge
