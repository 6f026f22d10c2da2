#pragma once
#include <string>
#include <cstddef>

/**
 * @file finding.h
 * @brief Data structure representing a security finding
 *
 * One detected condition on the audited target: what kind of issue it is,
 * how serious, where it was seen and a short piece of evidence.
 */

enum class FindingCategory {
    HEADER_MISSING,
    COOKIE_FLAG,
    EXPOSED_FILE,
    SENSITIVE_COMMENT,
    NO_CSRF_TOKEN,
    EXPOSED_SECRET,
    WEAK_TLS,
    INFO_DISCLOSURE,
    INLINE_SCRIPTS
};

enum class Severity {
    INFO,
    WARNING,
    CRITICAL
};

// Evidence never exceeds this many characters
constexpr std::size_t kMaxEvidenceLength = 100;

/**
 * Represents a single security finding
 */
struct Finding {
    std::string id;
    std::string url;
    FindingCategory category = FindingCategory::INFO_DISCLOSURE;
    Severity severity = Severity::INFO;
    std::string target_detail;
    std::string evidence;
};

/**
 * @brief Build a finding, capping the evidence at kMaxEvidenceLength
 * @param category Finding category
 * @param severity Finding severity
 * @param url URL the evidence was observed on
 * @param target_detail What was checked (header name, path, key name...)
 * @param evidence Raw evidence; truncated before it is stored
 */
Finding make_finding(FindingCategory category,
                     Severity severity,
                     const std::string& url,
                     const std::string& target_detail,
                     const std::string& evidence);

/**
 * @brief Truncate a string to at most max_len bytes
 *
 * The cut is moved back to a UTF-8 character boundary. Bytes that are not
 * UTF-8 at all (Latin-1 header values, binary junk) are left as they are;
 * JSON output replaces them when serializing.
 */
std::string truncate_evidence(const std::string& text, std::size_t max_len = kMaxEvidenceLength);

std::string to_string(FindingCategory category);
std::string to_string(Severity severity);

/**
 * @brief Parse a category name as produced by to_string
 * @return true if the name was recognised
 */
bool parse_category(const std::string& name, FindingCategory& out);

/**
 * @brief Parse a severity name as produced by to_string
 * @return true if the name was recognised
 */
bool parse_severity(const std::string& name, Severity& out);
