#include "structured_data_check.hpp"
#include <nlohmann/json.hpp>
#include "../../core/logger/logger.hpp"
#include "../../engine/scoring/scoring.hpp"
#include "../../utils/html/document.hpp"
#include "../../utils/text/string_utils.hpp"

namespace Sightline {
namespace Checks {

namespace {

using json = nlohmann::ordered_json;

constexpr const char* JSON_LD_MIME = "application/ld+json";

bool is_json_ld(const GumboNode* script) {
    auto type = Utils::Html::attribute(script, "type");
    if (!type)
        return false;
    std::string mime = *type;
    size_t      semi = mime.find(';');
    if (semi != std::string::npos)
        mime = mime.substr(0, semi);
    return Utils::Text::iequals(Utils::Text::trim(mime), JSON_LD_MIME);
}

std::string raw_text(const GumboNode* element) {
    std::string text;
    const GumboVector* children = &element->v.element.children;
    for (unsigned int i = 0; i < children->length; ++i) {
        auto* child = static_cast<const GumboNode*>(children->data[i]);
        if (child->type == GUMBO_NODE_TEXT || child->type == GUMBO_NODE_WHITESPACE
            || child->type == GUMBO_NODE_CDATA)
            text += child->v.text.text;
    }
    return text;
}

std::string type_of(const json& item) {
    auto it = item.find("@type");
    if (it == item.end())
        return "Unknown";
    if (it->is_string())
        return it->get<std::string>();
    if (it->is_array()) {
        std::vector<std::string> parts;
        for (const auto& t : *it)
            parts.push_back(t.is_string() ? t.get<std::string>() : t.dump());
        return Utils::Text::join(parts, ", ");
    }
    return it->dump();
}

Core::SchemaEntity to_entity(const json& item) {
    Core::SchemaEntity entity;
    entity.type = type_of(item);
    for (const auto& [key, value] : item.items()) {
        if (!Utils::Text::starts_with(key, "@"))
            entity.properties.push_back(key);
    }
    return entity;
}

}  // namespace

std::vector<std::string> StructuredDataCheck::find_json_ld_blocks(const std::string& html) {
    std::vector<std::string> blocks;
    if (html.empty())
        return blocks;

    Utils::Html::Document   doc(html);
    std::vector<GumboNode*> scripts;
    Utils::Html::find_all(doc.root(), GUMBO_TAG_SCRIPT, scripts);
    for (const GumboNode* script : scripts) {
        if (is_json_ld(script))
            blocks.push_back(raw_text(script));
    }
    return blocks;
}

Core::StructuredDataReport StructuredDataCheck::analyze(const std::string& html) {
    Core::StructuredDataReport report;
    if (Utils::Text::is_blank(html)) {
        report.summary = "No HTML to analyze";
        return report;
    }

    for (const auto& block : find_json_ld_blocks(html)) {
        json data = json::parse(block, nullptr, false);
        if (data.is_discarded()) {
            Core::Logger::debug("Skipping malformed JSON-LD block");
            continue;
        }
        if (data.is_array()) {
            for (const auto& item : data) {
                if (item.is_object())
                    report.entities.push_back(to_entity(item));
            }
        }
        else if (data.is_object()) {
            report.entities.push_back(to_entity(data));
        }
    }

    report.blocks_found = static_cast<int>(report.entities.size());
    report.score        = Engine::Scoring::score_structured_data(report.entities);
    report.summary      = report.blocks_found > 0
                              ? std::to_string(report.blocks_found) + " JSON-LD block(s) found"
                              : "No JSON-LD found";
    return report;
}

}  // namespace Checks
}  // namespace Sightline
