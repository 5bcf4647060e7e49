#pragma once

#include "LuaValue.hpp"
#include <string>
#include <utility>
#include <vector>

namespace CapBridge {

struct HtmlElement {
    std::string text;
    std::vector<std::pair<std::string, std::string>> attrs; // document order

    // {text=..., attrs={name=value, ...}}
    DynamicValue toValue() const;
};

namespace HtmlQuery {
    // Translate a CSS selector (type, *, #id, .class, attribute tests,
    // descendant and child combinators, comma groups) into XPath 1.0.
    bool cssToXPath(const std::string &selector, std::string &outXPath, std::string *outError);

    bool selectAll(const std::string &html, const std::string &selector, std::vector<HtmlElement> &out, std::string *outError);
    // Fails when nothing matches
    bool selectFirst(const std::string &html, const std::string &selector, HtmlElement &out, std::string *outError);
}

} // namespace CapBridge
