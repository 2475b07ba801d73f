#ifndef EYEMAP_SVG_TEMPLATE_HPP
#define EYEMAP_SVG_TEMPLATE_HPP

#include <eyemap/result.hpp>
#include <map>
#include <string>
#include <vector>

namespace eyemap {

/**
 * Values visible to a template: named scalars and named lists of child
 * contexts. Children see their parents' names unless they shadow them.
 */
class TemplateContext {
public:
    void set(const std::string& name, std::string value) { scalars_[name] = std::move(value); }
    void set(const std::string& name, const char* value) { scalars_[name] = value; }

    // Declares the list if it does not exist yet; valid until the next new list
    std::vector<TemplateContext>& list(const std::string& name);

    void append(const std::string& name, TemplateContext child) { list(name).push_back(std::move(child)); }

    const std::string* find_scalar(const std::string& name) const;
    const std::vector<TemplateContext>* find_list(const std::string& name) const;

private:
    // TemplateContext is still incomplete here; std::vector accepts that
    struct NamedList {
        std::string name;
        std::vector<TemplateContext> items;
    };

    std::map<std::string, std::string> scalars_;
    std::vector<NamedList> lists_;
};

/**
 * Logic-less template:
 *   {{name}}              scalar, XML-escaped
 *   {{{name}}}            scalar, raw
 *   {{#name}}...{{/name}} body repeated once per child of list `name`
 *   {{! text}}            comment
 *
 * Parsing happens once; rendering is a pure function of the context.
 */
class SvgTemplate {
public:
    static Result<SvgTemplate> parse(const std::string& source);
    static Result<SvgTemplate> load(const std::string& path);

    Result<std::string> render(const TemplateContext& context) const;

    static std::string escape_xml(const std::string& text);

    struct Node {
        enum class Type { Text, Escaped, Raw, Section };
        Type type = Type::Text;
        std::string text;              // Literal text or variable name
        std::vector<Node> children;    // Section body
    };

private:
    std::vector<Node> nodes_;
};

} // namespace eyemap

#endif // EYEMAP_SVG_TEMPLATE_HPP
