// HTML body inspection: comments, scripts, forms, emails, embedded secrets

#include "html_analyzer.h"
#include <algorithm>
#include <cctype>
#include <regex>
#include <set>

// Helper function to convert a string to lowercase for case insensitivity
static std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return std::tolower(c); });
    return s;
}

// Helper function to trim space
static std::string trim(const std::string& s) {
    size_t a = s.find_first_not_of(" \t\r\n");
    if (a == std::string::npos) return "";
    size_t b = s.find_last_not_of(" \t\r\n");
    return s.substr(a, b - a + 1);
}

struct Block {
    std::string attributes;   // Text inside the opening tag after the tag name
    std::string inner;        // Text up to the first closing tag
};

// Non-greedy, case-insensitive extraction of <tag ...>...</tag> spans.
// The opening tag is matched with a regex; the closing tag is the first
// occurrence after it, found on a lower-cased copy of the body.
static std::vector<Block> find_blocks(const std::string& body,
                                      const std::string& lower_body,
                                      const std::string& tag) {
    std::vector<Block> blocks;
    const std::regex open_rx("<" + tag + R"(\b([^>]{0,2048})>)", std::regex::icase);
    const std::string close = "</" + tag + ">";

    auto it = std::sregex_iterator(body.begin(), body.end(), open_rx);
    size_t resume = 0;
    for (; it != std::sregex_iterator(); ++it) {
        size_t open_pos = static_cast<size_t>(it->position(0));
        if (open_pos < resume) continue;   // Nested inside a previous block

        size_t inner_start = open_pos + static_cast<size_t>(it->length(0));
        size_t close_pos = lower_body.find(close, inner_start);
        if (close_pos == std::string::npos) break;

        Block b;
        b.attributes = (*it)[1].str();
        b.inner = body.substr(inner_start, close_pos - inner_start);
        blocks.push_back(std::move(b));
        resume = close_pos + close.size();
    }
    return blocks;
}

HtmlAnalyzer::HtmlAnalyzer(const Options& opts) : opts_(opts) {
    for (auto& k : opts_.comment_keywords) k = to_lower(k);
    for (auto& k : opts_.csrf_keywords) k = to_lower(k);
}

HtmlAnalysis HtmlAnalyzer::analyze(const ProbeResult& response) const {
    if (!response.ok()) return HtmlAnalysis{};
    return analyze_body(response.success().body, response.success().final_url);
}

HtmlAnalysis HtmlAnalyzer::analyze_body(const std::string& full_body, const std::string& url) const {
    HtmlAnalysis out;
    if (full_body.empty()) return out;

    // Oversized bodies are analysed up to the scan limit only
    const std::string body = full_body.size() > opts_.max_scan_bytes
        ? full_body.substr(0, opts_.max_scan_bytes)
        : full_body;

    scan_comments(body, url, out);
    scan_scripts(body, url, out);
    scan_forms(body, url, out);
    scan_emails(body, out);
    scan_secrets(body, url, out);
    return out;
}

void HtmlAnalyzer::scan_comments(const std::string& body, const std::string& url, HtmlAnalysis& out) const {
    size_t pos = 0;
    while ((pos = body.find("<!--", pos)) != std::string::npos) {
        size_t start = pos + 4;
        size_t end = body.find("-->", start);
        if (end == std::string::npos) break;

        std::string comment = trim(body.substr(start, end - start));
        std::string lower = to_lower(comment);
        out.comment_count++;

        for (const auto& keyword : opts_.comment_keywords) {
            if (lower.find(keyword) == std::string::npos) continue;
            out.findings.push_back(make_finding(
                FindingCategory::SENSITIVE_COMMENT,
                Severity::WARNING,
                url,
                "comment contains '" + keyword + "'",
                comment
            ));
            break;
        }
        pos = end + 3;
    }
}

std::string HtmlAnalyzer::script_host(const std::string& src) {
    size_t start;
    if (src.rfind("//", 0) == 0) {
        start = 2;
    } else {
        size_t scheme_end = src.find("://");
        if (scheme_end == std::string::npos) return "relative path";
        start = scheme_end + 3;
    }
    size_t end = src.find_first_of("/?#", start);
    std::string authority = src.substr(start, end == std::string::npos ? std::string::npos : end - start);

    // Strip userinfo
    size_t at = authority.rfind('@');
    if (at != std::string::npos) authority = authority.substr(at + 1);
    return authority.empty() ? "relative path" : to_lower(authority);
}

void HtmlAnalyzer::scan_scripts(const std::string& body, const std::string& url, HtmlAnalysis& out) const {
    static const std::regex src_rx(R"(\bsrc\s{0,16}=\s{0,16}["']([^"']{1,2048})["'])", std::regex::icase);

    const std::string lower_body = to_lower(body);
    std::set<std::string> seen_hosts;

    for (const auto& block : find_blocks(body, lower_body, "script")) {
        std::smatch m;
        if (std::regex_search(block.attributes, m, src_rx)) {
            std::string host = script_host(m[1].str());
            if (seen_hosts.insert(host).second) {
                out.external_script_hosts.push_back(host);
            }
        } else {
            out.inline_script_count++;
        }
    }

    if (out.inline_script_count > opts_.inline_script_threshold) {
        out.findings.push_back(make_finding(
            FindingCategory::INLINE_SCRIPTS,
            Severity::WARNING,
            url,
            "Content-Security-Policy",
            std::to_string(out.inline_script_count) + " inline scripts; consider a Content-Security-Policy"
        ));
    }
}

void HtmlAnalyzer::scan_forms(const std::string& body, const std::string& url, HtmlAnalysis& out) const {
    static const std::regex action_rx(R"(\baction\s{0,16}=\s{0,16}["']([^"']{0,2048})["'])", std::regex::icase);

    const std::string lower_body = to_lower(body);
    for (const auto& block : find_blocks(body, lower_body, "form")) {
        out.form_count++;

        std::string lower_inner = to_lower(block.inner);
        bool has_token = std::any_of(opts_.csrf_keywords.begin(), opts_.csrf_keywords.end(),
            [&](const std::string& k) { return lower_inner.find(k) != std::string::npos; });
        if (has_token) continue;

        std::string action;
        std::smatch m;
        if (std::regex_search(block.attributes, m, action_rx)) {
            action = m[1].str();
        }
        out.findings.push_back(make_finding(
            FindingCategory::NO_CSRF_TOKEN,
            Severity::WARNING,
            url,
            "form " + std::to_string(out.form_count),
            action
        ));
    }
}

void HtmlAnalyzer::scan_emails(const std::string& body, HtmlAnalysis& out) const {
    static const std::regex email_rx(R"(\b[A-Za-z0-9._%+-]{1,64}@[A-Za-z0-9.-]{1,253}\.[A-Za-z]{2,24}\b)");

    std::set<std::string> seen;
    for (auto it = std::sregex_iterator(body.begin(), body.end(), email_rx);
         it != std::sregex_iterator() && out.emails.size() < opts_.max_emails; ++it) {
        std::string email = it->str();
        if (seen.insert(email).second) {
            out.emails.push_back(email);
        }
    }
}

void HtmlAnalyzer::scan_secrets(const std::string& body, const std::string& url, HtmlAnalysis& out) const {
    static const std::regex secret_rx(
        R"((api[_-]?key|token|secret|password)["']?\s{0,16}[:=]\s{0,16}["']([^"']{20,512}))",
        std::regex::icase);

    for (auto it = std::sregex_iterator(body.begin(), body.end(), secret_rx);
         it != std::sregex_iterator(); ++it) {
        std::string key = (*it)[1].str();
        std::string value = (*it)[2].str();

        // Never more than 20 characters of the value leave this function
        out.findings.push_back(make_finding(
            FindingCategory::EXPOSED_SECRET,
            Severity::CRITICAL,
            url,
            key,
            key + ": " + truncate_evidence(value, 20)
        ));
    }
}
