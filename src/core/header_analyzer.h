#pragma once
#include <schema/finding.h>
#include <schema/probe_result.h>
#include <string>
#include <vector>

// Security header and cookie flag checks on the primary response.

struct HeaderAnalysis {
    std::vector<Finding> findings;
    std::vector<std::string> present;   // Security headers that were set
};

class HeaderAnalyzer {
public:
    /**
     * @brief Create an analyzer for a fixed list of security header names
     * @param security_headers Header names to require (matched case-insensitively)
     */
    explicit HeaderAnalyzer(std::vector<std::string> security_headers);

    /**
     * @brief Check header presence and Set-Cookie attributes
     *
     * Each absent header yields a HeaderMissing warning. If any Set-Cookie
     * header exists, the literal tokens Secure, HttpOnly and SameSite are
     * looked for (case-sensitive) and each missing one yields a CookieFlag
     * warning. A failed probe yields nothing.
     *
     * @param response Primary page probe
     * @return Findings in header-list order, followed by cookie findings
     */
    HeaderAnalysis analyze(const ProbeResult& response) const;

private:
    std::vector<std::string> security_headers_;
};
