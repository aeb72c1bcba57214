#pragma once
#include <string>
#include <vector>
#include "../auditor/auditor.hpp"

namespace Sightline {
namespace Engine {

// Whole audits of many URLs, at most `concurrency` at a time. Results keep the
// order of the input.
class BatchAuditor {
public:
    BatchAuditor(const Auditor& auditor, int concurrency);

    std::vector<SiteAuditReport> audit_sites(const std::vector<std::string>& urls) const;
    std::vector<AuditReport>     audit_urls(const std::vector<std::string>& urls) const;

private:
    const Auditor& auditor_;
    int            concurrency_;

    template <typename Report, typename Run>
    std::vector<Report> run_all(const std::vector<std::string>& urls, Run run) const;
};

}  // namespace Engine
}  // namespace Sightline
