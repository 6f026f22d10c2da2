// Security header and cookie attribute checks

#include "header_analyzer.h"
#include <utility>

HeaderAnalyzer::HeaderAnalyzer(std::vector<std::string> security_headers)
    : security_headers_(std::move(security_headers)) {}

HeaderAnalysis HeaderAnalyzer::analyze(const ProbeResult& response) const {
    HeaderAnalysis out;
    if (!response.ok()) return out;

    const std::string& url = response.success().final_url;

    for (const auto& name : security_headers_) {
        if (response.header(name)) {
            out.present.push_back(name);
            continue;
        }
        out.findings.push_back(make_finding(
            FindingCategory::HEADER_MISSING,
            Severity::WARNING,
            url,
            name,
            name + " missing"
        ));
    }

    // Multiple Set-Cookie headers are inspected as one combined value
    auto cookies = response.header_values("set-cookie");
    if (cookies.empty()) return out;

    std::string combined;
    std::string names;
    for (const auto& c : cookies) {
        if (!combined.empty()) combined += ", ";
        combined += c;

        // Only cookie names go into evidence, never values
        std::string name = c.substr(0, c.find_first_of("=;"));
        if (!names.empty()) names += ",";
        names += name;
    }

    static const char* const attributes[] = {"Secure", "HttpOnly", "SameSite"};
    for (const char* attr : attributes) {
        if (combined.find(attr) != std::string::npos) continue;
        out.findings.push_back(make_finding(
            FindingCategory::COOKIE_FLAG,
            Severity::WARNING,
            url,
            attr,
            "cookie " + names + " without " + attr
        ));
    }
    return out;
}
