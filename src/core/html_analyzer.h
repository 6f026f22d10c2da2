#pragma once
#include <schema/finding.h>
#include <schema/probe_result.h>
#include <string>
#include <vector>

// Pattern-based inspection of the primary page body.
// The body is treated as raw text; no DOM is built. Extraction runs in a
// fixed order: comments, inline scripts, external script hosts, forms,
// email addresses, key/secret assignments.

struct HtmlAnalysis {
    std::vector<Finding> findings;
    int comment_count = 0;
    int inline_script_count = 0;
    int form_count = 0;
    std::vector<std::string> external_script_hosts;   // Distinct, first-seen order
    std::vector<std::string> emails;                  // Distinct, capped
};

class HtmlAnalyzer {
public:
    struct Options {
        std::vector<std::string> comment_keywords;
        std::vector<std::string> csrf_keywords;
        int inline_script_threshold;
        size_t max_emails;
        size_t max_scan_bytes;      // Body prefix that is pattern-scanned

        Options()
            : comment_keywords({"password", "key", "secret", "token", "api"}),
              csrf_keywords({"csrf", "token"}),
              inline_script_threshold(10),
              max_emails(5),
              max_scan_bytes(kMaxBodyScanBytes)
        {}
    };

    explicit HtmlAnalyzer(const Options& opts = Options());

    /**
     * @brief Run every extraction over a successful response body
     * @param response Primary page probe; failures and empty bodies yield nothing
     * @return Findings in extraction order plus narrative data
     */
    HtmlAnalysis analyze(const ProbeResult& response) const;

    /**
     * @brief Run every extraction over raw body text
     * @param body Response body
     * @param url URL recorded on findings
     */
    HtmlAnalysis analyze_body(const std::string& body, const std::string& url) const;

    /**
     * @brief Host part of a script src ("relative path" for relative sources)
     */
    static std::string script_host(const std::string& src);

private:
    Options opts_;

    void scan_comments(const std::string& body, const std::string& url, HtmlAnalysis& out) const;
    void scan_scripts(const std::string& body, const std::string& url, HtmlAnalysis& out) const;
    void scan_forms(const std::string& body, const std::string& url, HtmlAnalysis& out) const;
    void scan_emails(const std::string& body, HtmlAnalysis& out) const;
    void scan_secrets(const std::string& body, const std::string& url, HtmlAnalysis& out) const;
};
