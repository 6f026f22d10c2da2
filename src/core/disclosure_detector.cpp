// Information disclosure via headers and embedded version strings

#include "disclosure_detector.h"
#include <cstddef>
#include <regex>
#include <set>
#include <utility>

DisclosureDetector::DisclosureDetector(std::vector<std::string> headers)
    : headers_(std::move(headers)) {}

std::vector<std::string> DisclosureDetector::find_versions(const std::string& body) {
    static const std::regex version_rx(
        R"(version["']?\s{0,16}[:=]\s{0,16}["']?([0-9]{1,9}\.[0-9]{1,9}\.[0-9]{1,9}))",
        std::regex::icase);

    auto end = body.size() > kMaxBodyScanBytes
        ? body.begin() + static_cast<std::ptrdiff_t>(kMaxBodyScanBytes)
        : body.end();

    std::vector<std::string> versions;
    std::set<std::string> seen;
    for (auto it = std::sregex_iterator(body.begin(), end, version_rx);
         it != std::sregex_iterator(); ++it) {
        std::string v = (*it)[1].str();
        if (seen.insert(v).second) {
            versions.push_back(v);
        }
    }
    return versions;
}

std::vector<Finding> DisclosureDetector::analyze(const ProbeResult& response) const {
    std::vector<Finding> findings;
    if (!response.ok()) return findings;

    const std::string& url = response.success().final_url;

    for (const auto& name : headers_) {
        const std::string* value = response.header(name);
        if (!value) continue;
        findings.push_back(make_finding(
            FindingCategory::INFO_DISCLOSURE,
            Severity::INFO,
            url,
            name,
            *value
        ));
    }

    for (const auto& version : find_versions(response.success().body)) {
        findings.push_back(make_finding(
            FindingCategory::INFO_DISCLOSURE,
            Severity::INFO,
            url,
            "version string in body",
            version
        ));
    }
    return findings;
}
