#include "batch_auditor.hpp"
#include <algorithm>
#include <utility>  // Boost 1.74 asio/awaitable.hpp uses std::exchange without it
#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>
#include "../../core/logger/logger.hpp"

namespace Sightline {
namespace Engine {

namespace {

template <typename Report>
Report failed_report(const std::string& url, const std::string& error) {
    Report report;
    report.url = url;
    report.errors.push_back("Audit failed: " + error);
    return report;
}

}  // namespace

BatchAuditor::BatchAuditor(const Auditor& auditor, int concurrency)
    : auditor_(auditor), concurrency_(std::max(1, concurrency)) {
}

template <typename Report, typename Run>
std::vector<Report> BatchAuditor::run_all(const std::vector<std::string>& urls, Run run) const {
    std::vector<Report> reports(urls.size());
    if (urls.empty())
        return reports;

    size_t workers = std::min(urls.size(), static_cast<size_t>(concurrency_));
    Logger::info("Auditing " + std::to_string(urls.size()) + " URLs, "
                 + std::to_string(workers) + " at a time");

    boost::asio::thread_pool pool(workers);
    for (size_t i = 0; i < urls.size(); ++i) {
        boost::asio::post(pool, [&, i] {
            try {
                reports[i] = run(urls[i]);
            } catch (const std::exception& e) {
                Logger::error("Audit of " + urls[i] + " failed: " + e.what());
                reports[i] = failed_report<Report>(urls[i], e.what());
            }
        });
    }
    pool.join();
    return reports;
}

std::vector<SiteAuditReport> BatchAuditor::audit_sites(const std::vector<std::string>& urls) const {
    return run_all<SiteAuditReport>(
        urls, [this](const std::string& url) { return auditor_.audit_site(url); });
}

std::vector<AuditReport> BatchAuditor::audit_urls(const std::vector<std::string>& urls) const {
    return run_all<AuditReport>(urls,
                                [this](const std::string& url) { return auditor_.audit_url(url); });
}

}  // namespace Engine
}  // namespace Sightline
