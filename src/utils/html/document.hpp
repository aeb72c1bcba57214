#pragma once
#include <gumbo.h>
#include <optional>
#include <string>
#include <vector>

namespace Sightline {
namespace Utils {
namespace Html {

// Owns one gumbo parse. Node pointers handed out are valid for its lifetime.
class Document {
public:
    explicit Document(const std::string& html);
    ~Document();
    Document(const Document&)            = delete;
    Document& operator=(const Document&) = delete;

    GumboNode* root() const {
        return output_->root;
    }

    // <body> when it was written in the source rather than synthesized by the parser.
    GumboNode* explicit_body() const;

private:
    std::string  html_;
    GumboOutput* output_;
};

// A single simple selector: `tag`, `.class`, `#id` or `[attr=value]`.
class Selector {
public:
    static std::optional<Selector> parse(const std::string& text);
    static std::vector<Selector>   parse_all(const std::vector<std::string>& texts);

    bool matches(const GumboNode* node) const;

private:
    enum class Kind { Tag, Class, Id, Attribute };

    Kind        kind_ = Kind::Tag;
    std::string name_;
    std::string value_;
};

bool               is_element(const GumboNode* node);
std::string        tag_name(const GumboNode* node);
std::optional<std::string> attribute(const GumboNode* node, const char* name);

// Sum of whitespace-trimmed text node lengths, skipping script, style,
// noscript and template subtrees.
size_t      text_length(const GumboNode* node);
std::string text_content(const GumboNode* node);

void       find_all(GumboNode* node, GumboTag tag, std::vector<GumboNode*>& out);
GumboNode* find_first(GumboNode* node, GumboTag tag);
GumboNode* find_first_with_attribute(GumboNode* node, const char* name, const std::string& value);

// Outer HTML of `node`, dropping every element matched by `strip`.
std::string serialize(const GumboNode* node, const std::vector<Selector>& strip = {});

}  // namespace Html
}  // namespace Utils
}  // namespace Sightline
