#include "document.hpp"
#include <string_view>
#include "../text/string_utils.hpp"

namespace Sightline {
namespace Utils {
namespace Html {

namespace {

bool is_void_element(GumboTag tag) {
    switch (tag) {
        case GUMBO_TAG_AREA:
        case GUMBO_TAG_BASE:
        case GUMBO_TAG_BR:
        case GUMBO_TAG_COL:
        case GUMBO_TAG_EMBED:
        case GUMBO_TAG_HR:
        case GUMBO_TAG_IMG:
        case GUMBO_TAG_INPUT:
        case GUMBO_TAG_LINK:
        case GUMBO_TAG_META:
        case GUMBO_TAG_PARAM:
        case GUMBO_TAG_SOURCE:
        case GUMBO_TAG_TRACK:
        case GUMBO_TAG_WBR: return true;
        default: return false;
    }
}

bool is_hidden_text_container(const GumboNode* node) {
    if (node->type == GUMBO_NODE_TEMPLATE)
        return true;
    if (node->type != GUMBO_NODE_ELEMENT)
        return false;
    switch (node->v.element.tag) {
        case GUMBO_TAG_SCRIPT:
        case GUMBO_TAG_STYLE:
        case GUMBO_TAG_NOSCRIPT:
        case GUMBO_TAG_TEMPLATE: return true;
        default: return false;
    }
}

bool is_raw_text_container(const GumboNode* node) {
    return node && is_element(node)
           && (node->v.element.tag == GUMBO_TAG_SCRIPT || node->v.element.tag == GUMBO_TAG_STYLE);
}

const GumboVector* children_of(const GumboNode* node) {
    if (node->type == GUMBO_NODE_DOCUMENT)
        return &node->v.document.children;
    if (is_element(node))
        return &node->v.element.children;
    return nullptr;
}

void escape_into(std::string& out, std::string_view text, bool attribute_value) {
    for (char c : text) {
        switch (c) {
            case '&': out += "&amp;"; break;
            case '<': out += "&lt;"; break;
            case '>': out += "&gt;"; break;
            case '"':
                if (attribute_value)
                    out += "&quot;";
                else
                    out += c;
                break;
            default: out += c;
        }
    }
}

bool has_class(const GumboNode* node, const std::string& cls) {
    auto classes = attribute(node, "class");
    if (!classes)
        return false;
    for (const auto& token : Text::split_words(*classes)) {
        if (token == cls)
            return true;
    }
    return false;
}

void collect_text(const GumboNode* node, std::string& out) {
    if (node->type == GUMBO_NODE_TEXT || node->type == GUMBO_NODE_CDATA) {
        if (!out.empty())
            out += ' ';
        out += Text::trim(node->v.text.text);
        return;
    }
    if (is_hidden_text_container(node))
        return;
    const GumboVector* children = children_of(node);
    if (!children)
        return;
    for (unsigned int i = 0; i < children->length; ++i)
        collect_text(static_cast<const GumboNode*>(children->data[i]), out);
}

void serialize_into(const GumboNode* node, const std::vector<Selector>& strip, std::string& out) {
    switch (node->type) {
        case GUMBO_NODE_TEXT:
        case GUMBO_NODE_WHITESPACE:
            if (is_raw_text_container(node->parent))
                out += node->v.text.text;
            else
                escape_into(out, node->v.text.text, false);
            return;
        case GUMBO_NODE_CDATA: out += node->v.text.text; return;
        case GUMBO_NODE_COMMENT: return;
        case GUMBO_NODE_DOCUMENT: {
            const GumboVector* children = children_of(node);
            for (unsigned int i = 0; i < children->length; ++i)
                serialize_into(static_cast<const GumboNode*>(children->data[i]), strip, out);
            return;
        }
        case GUMBO_NODE_ELEMENT:
        case GUMBO_NODE_TEMPLATE: break;
    }

    for (const auto& selector : strip) {
        if (selector.matches(node))
            return;
    }

    std::string name = tag_name(node);
    out += '<';
    out += name;
    const GumboVector* attrs = &node->v.element.attributes;
    for (unsigned int i = 0; i < attrs->length; ++i) {
        auto* attr = static_cast<const GumboAttribute*>(attrs->data[i]);
        out += ' ';
        out += attr->name;
        out += "=\"";
        escape_into(out, attr->value, true);
        out += '"';
    }
    out += '>';

    if (is_void_element(node->v.element.tag))
        return;

    const GumboVector* children = &node->v.element.children;
    for (unsigned int i = 0; i < children->length; ++i)
        serialize_into(static_cast<const GumboNode*>(children->data[i]), strip, out);

    out += "</";
    out += name;
    out += '>';
}

}  // namespace

Document::Document(const std::string& html)
    : html_(html), output_(gumbo_parse_with_options(&kGumboDefaultOptions, html_.data(), html_.size())) {
}

Document::~Document() {
    gumbo_destroy_output(&kGumboDefaultOptions, output_);
}

GumboNode* Document::explicit_body() const {
    GumboNode* body = find_first(output_->root, GUMBO_TAG_BODY);
    if (!body || (body->parse_flags & GUMBO_INSERTION_IMPLIED))
        return nullptr;
    return body;
}

std::optional<Selector> Selector::parse(const std::string& text) {
    std::string s = Text::trim(text);
    if (s.empty())
        return std::nullopt;

    Selector selector;
    if (s[0] == '.' || s[0] == '#') {
        if (s.size() == 1)
            return std::nullopt;
        selector.kind_ = s[0] == '.' ? Kind::Class : Kind::Id;
        selector.name_ = s.substr(1);
        return selector;
    }
    if (s[0] == '[') {
        size_t eq = s.find('=');
        if (s.back() != ']' || eq == std::string::npos)
            return std::nullopt;
        std::string value = Text::trim(s.substr(eq + 1, s.size() - eq - 2));
        if (value.size() >= 2 && (value.front() == '"' || value.front() == '\'')
            && value.back() == value.front())
            value = value.substr(1, value.size() - 2);
        selector.kind_  = Kind::Attribute;
        selector.name_  = Text::to_lower(Text::trim(s.substr(1, eq - 1)));
        selector.value_ = value;
        return selector;
    }
    selector.kind_ = Kind::Tag;
    selector.name_ = Text::to_lower(s);
    return selector;
}

std::vector<Selector> Selector::parse_all(const std::vector<std::string>& texts) {
    std::vector<Selector> selectors;
    for (const auto& text : texts) {
        if (auto selector = parse(text))
            selectors.push_back(std::move(*selector));
    }
    return selectors;
}

bool Selector::matches(const GumboNode* node) const {
    if (!is_element(node))
        return false;
    switch (kind_) {
        case Kind::Tag: return tag_name(node) == name_;
        case Kind::Class: return has_class(node, name_);
        case Kind::Id: {
            auto id = attribute(node, "id");
            return id && *id == name_;
        }
        case Kind::Attribute: {
            auto value = attribute(node, name_.c_str());
            return value && *value == value_;
        }
    }
    return false;
}

bool is_element(const GumboNode* node) {
    return node && (node->type == GUMBO_NODE_ELEMENT || node->type == GUMBO_NODE_TEMPLATE);
}

std::string tag_name(const GumboNode* node) {
    if (!is_element(node))
        return "";
    if (node->v.element.tag != GUMBO_TAG_UNKNOWN)
        return gumbo_normalized_tagname(node->v.element.tag);

    GumboStringPiece original = node->v.element.original_tag;
    gumbo_tag_from_original_text(&original);
    return Text::to_lower(std::string(original.data, original.length));
}

std::optional<std::string> attribute(const GumboNode* node, const char* name) {
    if (!is_element(node))
        return std::nullopt;
    GumboAttribute* attr = gumbo_get_attribute(&node->v.element.attributes, name);
    if (!attr)
        return std::nullopt;
    return std::string(attr->value);
}

size_t text_length(const GumboNode* node) {
    if (node->type == GUMBO_NODE_TEXT || node->type == GUMBO_NODE_CDATA)
        return Text::char_length(Text::trim(node->v.text.text));
    if (is_hidden_text_container(node))
        return 0;
    const GumboVector* children = children_of(node);
    if (!children)
        return 0;

    size_t total = 0;
    for (unsigned int i = 0; i < children->length; ++i)
        total += text_length(static_cast<const GumboNode*>(children->data[i]));
    return total;
}

std::string text_content(const GumboNode* node) {
    std::string out;
    collect_text(node, out);
    return out;
}

void find_all(GumboNode* node, GumboTag tag, std::vector<GumboNode*>& out) {
    if (is_element(node) && node->v.element.tag == tag)
        out.push_back(node);
    const GumboVector* children = children_of(node);
    if (!children)
        return;
    for (unsigned int i = 0; i < children->length; ++i)
        find_all(static_cast<GumboNode*>(children->data[i]), tag, out);
}

GumboNode* find_first(GumboNode* node, GumboTag tag) {
    if (is_element(node) && node->v.element.tag == tag)
        return node;
    const GumboVector* children = children_of(node);
    if (!children)
        return nullptr;
    for (unsigned int i = 0; i < children->length; ++i) {
        if (GumboNode* found = find_first(static_cast<GumboNode*>(children->data[i]), tag))
            return found;
    }
    return nullptr;
}

GumboNode* find_first_with_attribute(GumboNode* node, const char* name, const std::string& value) {
    auto attr = attribute(node, name);
    if (attr && Text::iequals(Text::trim(*attr), value))
        return node;
    const GumboVector* children = children_of(node);
    if (!children)
        return nullptr;
    for (unsigned int i = 0; i < children->length; ++i) {
        if (GumboNode* found =
                find_first_with_attribute(static_cast<GumboNode*>(children->data[i]), name, value))
            return found;
    }
    return nullptr;
}

std::string serialize(const GumboNode* node, const std::vector<Selector>& strip) {
    std::string out;
    serialize_into(node, strip, out);
    return out;
}

}  // namespace Html
}  // namespace Utils
}  // namespace Sightline
