#include "HtmlQuery.hpp"
#include <libxml/HTMLparser.h>
#include <libxml/xpath.h>
#include <cctype>
#include <memory>

namespace CapBridge {

DynamicValue HtmlElement::toValue() const
{
    DynamicValue a = DynamicValue::table();
    for (const auto &kv : attrs) a.set(kv.first, DynamicValue::text(kv.second));
    DynamicValue out = DynamicValue::table();
    out.set("text", DynamicValue::text(text));
    out.set("attrs", std::move(a));
    return out;
}

namespace HtmlQuery {

namespace {

// XPath 1.0 has no escapes inside literals
std::string xpathLiteral(const std::string &s)
{
    if (s.find('"') == std::string::npos) return "\"" + s + "\"";
    if (s.find('\'') == std::string::npos) return "'" + s + "'";
    std::string out = "concat(";
    size_t start = 0;
    bool first = true;
    while (start <= s.size())
    {
        size_t q = s.find('"', start);
        std::string part = s.substr(start, q == std::string::npos ? std::string::npos : q - start);
        if (!first) out += ", ";
        out += "\"" + part + "\"";
        first = false;
        if (q == std::string::npos) break;
        out += ", '\"'";
        start = q + 1;
    }
    return out + ")";
}

class SelectorCompiler {
public:
    explicit SelectorCompiler(const std::string &sel) : s(sel) {}

    bool compile(std::string &out, std::string *outError)
    {
        std::string result;
        skipSpace();
        while (true)
        {
            std::string path;
            if (!compileComplex(path)) return fail(outError);
            if (!result.empty()) result += " | ";
            result += path;
            skipSpace();
            if (pos >= s.size()) break;
            if (s[pos] != ',') return fail(outError);
            ++pos;
            skipSpace();
        }
        out = result;
        return true;
    }

private:
    const std::string &s;
    size_t pos = 0;
    std::string error;

    bool fail(std::string *outError)
    {
        if (outError)
            *outError = error.empty() ? "invalid selector near offset " + std::to_string(pos) : error;
        return false;
    }

    void skipSpace()
    {
        while (pos < s.size() && std::isspace(static_cast<unsigned char>(s[pos]))) ++pos;
    }

    static bool isIdentChar(char c)
    {
        unsigned char u = static_cast<unsigned char>(c);
        return std::isalnum(u) || c == '-' || c == '_' || u >= 0x80;
    }

    bool ident(std::string &out)
    {
        size_t start = pos;
        while (pos < s.size() && isIdentChar(s[pos])) ++pos;
        out = s.substr(start, pos - start);
        return !out.empty();
    }

    // sequence of compound selectors joined by combinators
    bool compileComplex(std::string &out)
    {
        std::string axis = "//";
        while (true)
        {
            std::string step;
            if (!compileCompound(step)) return false;
            out += axis + step;

            size_t before = pos;
            skipSpace();
            if (pos >= s.size() || s[pos] == ',') return true;
            if (s[pos] == '>')
            {
                ++pos;
                skipSpace();
                axis = "/";
            }
            else if (pos > before)
                axis = "//";
            else
            {
                error = "unsupported selector syntax at offset " + std::to_string(pos);
                return false;
            }
        }
    }

    bool compileCompound(std::string &out)
    {
        std::string tag;
        std::string preds;
        if (pos < s.size() && s[pos] == '*')
        {
            ++pos;
            tag = "*";
        }
        else if (ident(tag))
        {
            for (auto &c : tag) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        }
        else
            tag = "*";

        bool any = tag != "*" || (pos > 0 && s[pos - 1] == '*');
        while (pos < s.size())
        {
            char c = s[pos];
            if (c == '#')
            {
                ++pos;
                std::string id;
                if (!ident(id)) { error = "expected id after '#'"; return false; }
                preds += "[@id=" + xpathLiteral(id) + "]";
            }
            else if (c == '.')
            {
                ++pos;
                std::string cls;
                if (!ident(cls)) { error = "expected class name after '.'"; return false; }
                preds += "[contains(concat(' ', normalize-space(@class), ' '), " + xpathLiteral(" " + cls + " ") + ")]";
            }
            else if (c == '[')
            {
                ++pos;
                std::string pred;
                if (!compileAttribute(pred)) return false;
                preds += pred;
            }
            else if (c == ':')
            {
                error = "pseudo-classes are not supported";
                return false;
            }
            else
                break;
            any = true;
        }
        if (!any)
        {
            error = "expected selector at offset " + std::to_string(pos);
            return false;
        }
        out = tag + preds;
        return true;
    }

    bool compileAttribute(std::string &out)
    {
        skipSpace();
        std::string name;
        if (!ident(name)) { error = "expected attribute name"; return false; }
        for (auto &c : name) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        skipSpace();
        if (pos < s.size() && s[pos] == ']')
        {
            ++pos;
            out = "[@" + name + "]";
            return true;
        }

        std::string op;
        if (pos < s.size() && s[pos] == '=')
        {
            op = "=";
            ++pos;
        }
        else if (pos + 1 < s.size() && s[pos + 1] == '=' && std::string("~^$*|").find(s[pos]) != std::string::npos)
        {
            op = s.substr(pos, 2);
            pos += 2;
        }
        else
        {
            error = "expected attribute operator";
            return false;
        }

        skipSpace();
        std::string value;
        if (pos < s.size() && (s[pos] == '"' || s[pos] == '\''))
        {
            char q = s[pos++];
            size_t end = s.find(q, pos);
            if (end == std::string::npos) { error = "unterminated string in attribute selector"; return false; }
            value = s.substr(pos, end - pos);
            pos = end + 1;
        }
        else if (!ident(value))
        {
            error = "expected attribute value";
            return false;
        }
        skipSpace();
        if (pos >= s.size() || s[pos] != ']') { error = "expected ']'"; return false; }
        ++pos;

        std::string attr = "@" + name;
        std::string lit = xpathLiteral(value);
        if (op == "=")
            out = "[" + attr + "=" + lit + "]";
        else if (op == "~=")
            out = "[contains(concat(' ', normalize-space(" + attr + "), ' '), " + xpathLiteral(" " + value + " ") + ")]";
        else if (op == "^=")
            out = "[starts-with(" + attr + ", " + lit + ")]";
        else if (op == "$=")
            out = "[substring(" + attr + ", string-length(" + attr + ") - string-length(" + lit + ") + 1) = " + lit + "]";
        else if (op == "*=")
            out = "[contains(" + attr + ", " + lit + ")]";
        else // |=
            out = "[" + attr + "=" + lit + " or starts-with(" + attr + ", " + xpathLiteral(value + "-") + ")]";
        return true;
    }
};

struct DocDeleter { void operator()(xmlDoc *d) const { if (d) xmlFreeDoc(d); } };
struct XPathCtxDeleter { void operator()(xmlXPathContext *c) const { if (c) xmlXPathFreeContext(c); } };
struct XPathObjDeleter { void operator()(xmlXPathObject *o) const { if (o) xmlXPathFreeObject(o); } };

std::string nodeText(xmlNode *node)
{
    xmlChar *content = xmlNodeGetContent(node);
    if (!content) return std::string();
    std::string out(reinterpret_cast<const char *>(content));
    xmlFree(content);
    return out;
}

HtmlElement toElement(xmlNode *node)
{
    HtmlElement el;
    el.text = nodeText(node);
    for (xmlAttr *a = node->properties; a; a = a->next)
    {
        xmlChar *v = xmlNodeListGetString(node->doc, a->children, 1);
        el.attrs.emplace_back(reinterpret_cast<const char *>(a->name), v ? reinterpret_cast<const char *>(v) : "");
        if (v) xmlFree(v);
    }
    return el;
}

} // namespace

bool cssToXPath(const std::string &selector, std::string &outXPath, std::string *outError)
{
    SelectorCompiler c(selector);
    if (!c.compile(outXPath, outError))
        return false;
    if (outXPath.empty())
    {
        if (outError) *outError = "empty selector";
        return false;
    }
    return true;
}

bool selectAll(const std::string &html, const std::string &selector, std::vector<HtmlElement> &out, std::string *outError)
{
    std::string xpath, err;
    if (!cssToXPath(selector, xpath, &err))
    {
        if (outError) *outError = "invalid selector: " + err;
        return false;
    }

    std::unique_ptr<xmlDoc, DocDeleter> doc(htmlReadMemory(html.data(), static_cast<int>(html.size()), nullptr, "UTF-8",
        HTML_PARSE_RECOVER | HTML_PARSE_NOERROR | HTML_PARSE_NOWARNING | HTML_PARSE_NONET));
    if (!doc)
    {
        // libxml2 returns no document for empty input
        out.clear();
        return true;
    }
    std::unique_ptr<xmlXPathContext, XPathCtxDeleter> ctx(xmlXPathNewContext(doc.get()));
    if (!ctx)
    {
        if (outError) *outError = "failed to create xpath context";
        return false;
    }
    std::unique_ptr<xmlXPathObject, XPathObjDeleter> result(
        xmlXPathEvalExpression(reinterpret_cast<const xmlChar *>(xpath.c_str()), ctx.get()));
    if (!result)
    {
        if (outError) *outError = "invalid selector: cannot evaluate " + xpath;
        return false;
    }

    out.clear();
    xmlNodeSet *nodes = result->nodesetval;
    if (!nodes) return true;
    for (int i = 0; i < nodes->nodeNr; ++i)
    {
        xmlNode *n = nodes->nodeTab[i];
        if (n && n->type == XML_ELEMENT_NODE)
            out.push_back(toElement(n));
    }
    return true;
}

bool selectFirst(const std::string &html, const std::string &selector, HtmlElement &out, std::string *outError)
{
    std::vector<HtmlElement> all;
    if (!selectAll(html, selector, all, outError)) return false;
    if (all.empty())
    {
        if (outError) *outError = "css selector didn't match anything";
        return false;
    }
    out = std::move(all.front());
    return true;
}

} // namespace HtmlQuery
} // namespace CapBridge
