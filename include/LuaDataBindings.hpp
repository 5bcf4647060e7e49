#pragma once

namespace CapBridge {

class CapabilityRegistry;

// Structured data capabilities:
//   json_decode(text)                 -> value|nil
//   json_encode(value)                -> text|nil
//   html_select(html, selector)       -> {text=, attrs={}}|nil
//   html_select_list(html, selector)  -> {{text=, attrs={}}, ...}|nil
void registerLuaDataBindings(CapabilityRegistry &reg);

} // namespace CapBridge
