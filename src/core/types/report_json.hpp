#pragma once
#include <nlohmann/json.hpp>

#include "report.hpp"

namespace Sightline {
namespace Core {

void to_json(nlohmann::json& j, const AgentAccess& agent);
void to_json(nlohmann::json& j, const RobotsReport& report);
void to_json(nlohmann::json& j, const ContextFileReport& report);
void to_json(nlohmann::json& j, const SchemaEntity& entity);
void to_json(nlohmann::json& j, const StructuredDataReport& report);
void to_json(nlohmann::json& j, const ContentReport& report);
void to_json(nlohmann::json& j, const PageScore& page);
void to_json(nlohmann::json& j, const DiscoveryResult& discovery);
void to_json(nlohmann::json& j, const AuditReport& report);
void to_json(nlohmann::json& j, const SiteAuditReport& report);

}  // namespace Core
}  // namespace Sightline
