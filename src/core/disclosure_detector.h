#pragma once
#include <schema/finding.h>
#include <schema/probe_result.h>
#include <string>
#include <vector>

// Implementation details leaked through response headers or page content.
//
// Header check: each present Server / X-Powered-By header is one Info
// finding carrying the header value.
//
// Body check: semantic-version strings assigned to something named
// "version" (version="1.2.3", Version: 4.5.6, ...). The match has no
// proximity bound beyond the assignment syntax, so it is permissive and can
// fire on unrelated version fields; each distinct version string is reported
// once.

class DisclosureDetector {
public:
    /**
     * @brief Create a detector for the given header names
     * @param headers Headers whose mere presence is a disclosure
     */
    explicit DisclosureDetector(std::vector<std::string> headers = {"Server", "X-Powered-By"});

    std::vector<Finding> analyze(const ProbeResult& response) const;

    /**
     * @brief Distinct version strings found in a body, first-seen order
     */
    static std::vector<std::string> find_versions(const std::string& body);

private:
    std::vector<std::string> headers_;
};
