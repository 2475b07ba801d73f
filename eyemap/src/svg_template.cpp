#include <eyemap/svg_template.hpp>
#include <fstream>
#include <sstream>

namespace eyemap {

namespace {

using Node = SvgTemplate::Node;

std::string trim(const std::string& text) {
    const auto begin = text.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) return {};
    const auto end = text.find_last_not_of(" \t\r\n");
    return text.substr(begin, end - begin + 1);
}

Error parse_error(const std::string& message, std::size_t offset) {
    Error e = make_error(ErrorKind::Rendering, message, "template_parse");
    e.field = "offset";
    e.value = std::to_string(offset);
    return e;
}

// Context chain, innermost last
using Scope = std::vector<const TemplateContext*>;

const std::string* lookup_scalar(const Scope& scope, const std::string& name) {
    for (auto it = scope.rbegin(); it != scope.rend(); ++it) {
        if (const std::string* value = (*it)->find_scalar(name)) return value;
    }
    return nullptr;
}

const std::vector<TemplateContext>* lookup_list(const Scope& scope, const std::string& name) {
    for (auto it = scope.rbegin(); it != scope.rend(); ++it) {
        if (const auto* list = (*it)->find_list(name)) return list;
    }
    return nullptr;
}

Status render_nodes(const std::vector<Node>& nodes, Scope& scope, std::string& out) {
    for (const auto& node : nodes) {
        switch (node.type) {
            case Node::Type::Text:
                out += node.text;
                break;
            case Node::Type::Escaped:
            case Node::Type::Raw: {
                const std::string* value = lookup_scalar(scope, node.text);
                if (value == nullptr) {
                    Error e = make_error(ErrorKind::Rendering, "unknown template variable", "template_render");
                    e.field = "name";
                    e.value = node.text;
                    return e;
                }
                out += node.type == Node::Type::Escaped ? SvgTemplate::escape_xml(*value) : *value;
                break;
            }
            case Node::Type::Section: {
                const auto* list = lookup_list(scope, node.text);
                if (list == nullptr) {
                    Error e = make_error(ErrorKind::Rendering, "unknown template section", "template_render");
                    e.field = "name";
                    e.value = node.text;
                    return e;
                }
                for (const auto& child : *list) {
                    scope.push_back(&child);
                    Status status = render_nodes(node.children, scope, out);
                    scope.pop_back();
                    if (!status) return status;
                }
                break;
            }
        }
    }
    return ok_status();
}

} // namespace

const std::string* TemplateContext::find_scalar(const std::string& name) const {
    auto it = scalars_.find(name);
    return it != scalars_.end() ? &it->second : nullptr;
}

std::vector<TemplateContext>& TemplateContext::list(const std::string& name) {
    for (auto& named : lists_) {
        if (named.name == name) return named.items;
    }
    lists_.push_back(NamedList{name, {}});
    return lists_.back().items;
}

const std::vector<TemplateContext>* TemplateContext::find_list(const std::string& name) const {
    for (const auto& named : lists_) {
        if (named.name == name) return &named.items;
    }
    return nullptr;
}

Result<SvgTemplate> SvgTemplate::parse(const std::string& source) {
    // Stack of open sections; the bottom entry is the template root
    std::vector<Node> stack(1);
    std::size_t pos = 0;

    while (pos < source.size()) {
        const std::size_t open = source.find("{{", pos);
        if (open == std::string::npos) {
            stack.back().children.push_back({Node::Type::Text, source.substr(pos), {}});
            break;
        }
        if (open > pos) {
            stack.back().children.push_back({Node::Type::Text, source.substr(pos, open - pos), {}});
        }

        const bool triple = source.compare(open, 3, "{{{") == 0;
        const char* closer = triple ? "}}}" : "}}";
        const std::size_t body_start = open + (triple ? 3 : 2);
        const std::size_t close = source.find(closer, body_start);
        if (close == std::string::npos) {
            return parse_error("unterminated tag", open);
        }

        const std::string tag = trim(source.substr(body_start, close - body_start));
        pos = close + (triple ? 3 : 2);

        if (tag.empty()) {
            return parse_error("empty tag", open);
        }
        if (triple) {
            stack.back().children.push_back({Node::Type::Raw, tag, {}});
            continue;
        }

        switch (tag[0]) {
            case '!':
                break;
            case '#': {
                Node section{Node::Type::Section, trim(tag.substr(1)), {}};
                if (section.text.empty()) return parse_error("section without a name", open);
                stack.push_back(std::move(section));
                break;
            }
            case '/': {
                const std::string name = trim(tag.substr(1));
                if (stack.size() < 2 || stack.back().text != name) {
                    Error e = parse_error("unbalanced section close", open);
                    e.value += " (" + name + ")";
                    return e;
                }
                Node section = std::move(stack.back());
                stack.pop_back();
                stack.back().children.push_back(std::move(section));
                break;
            }
            default:
                stack.back().children.push_back({Node::Type::Escaped, tag, {}});
                break;
        }
    }

    if (stack.size() != 1) {
        Error e = make_error(ErrorKind::Rendering, "unclosed section", "template_parse");
        e.field = "name";
        e.value = stack.back().text;
        return e;
    }

    SvgTemplate result;
    result.nodes_ = std::move(stack.front().children);
    return result;
}

Result<SvgTemplate> SvgTemplate::load(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        Error e = make_error(ErrorKind::Rendering, "template not found", "template_load");
        e.field = "path";
        e.value = path;
        return e;
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    return parse(buffer.str());
}

Result<std::string> SvgTemplate::render(const TemplateContext& context) const {
    std::string out;
    Scope scope{&context};
    Status status = render_nodes(nodes_, scope, out);
    if (!status) return status.error();
    return out;
}

std::string SvgTemplate::escape_xml(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        switch (c) {
            case '&': out += "&amp;"; break;
            case '<': out += "&lt;"; break;
            case '>': out += "&gt;"; break;
            case '"': out += "&quot;"; break;
            case '\'': out += "&#39;"; break;
            default: out += c; break;
        }
    }
    return out;
}

} // namespace eyemap
