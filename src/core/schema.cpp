/**
 * @file schema.cpp
 * @brief Helpers for the shared data model (findings, probe results, report state)
 */

#include <schema/audit_report.h>
#include <schema/finding.h>
#include <schema/probe_result.h>
#include <algorithm>
#include <cctype>

// Helper function for case-insensitive header name comparison
static bool iequals(const std::string& a, const std::string& b) {
    if (a.size() != b.size()) return false;
    for (size_t i = 0; i < a.size(); i++) {
        if (std::tolower(static_cast<unsigned char>(a[i])) !=
            std::tolower(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
}

const std::string* ProbeResult::header(const std::string& name) const {
    if (!ok()) return nullptr;
    for (const auto& [key, value] : success().headers) {
        if (iequals(key, name)) return &value;
    }
    return nullptr;
}

std::vector<std::string> ProbeResult::header_values(const std::string& name) const {
    std::vector<std::string> values;
    if (!ok()) return values;
    for (const auto& [key, value] : success().headers) {
        if (iequals(key, name)) values.push_back(value);
    }
    return values;
}

std::string to_string(FailureKind kind) {
    switch (kind) {
        case FailureKind::CONNECTION_ERROR:   return "ConnectionError";
        case FailureKind::TIMEOUT:            return "Timeout";
        case FailureKind::TLS_ERROR:          return "TlsError";
        case FailureKind::TOO_MANY_REDIRECTS: return "TooManyRedirects";
        case FailureKind::CANCELLED:          return "Cancelled";
    }
    return "Unknown";
}

std::string truncate_evidence(const std::string& text, std::size_t max_len) {
    if (text.size() <= max_len) return text;

    // Back off so the cut never splits a UTF-8 sequence
    std::size_t cut = max_len;
    while (cut > 0 && (static_cast<unsigned char>(text[cut]) & 0xC0) == 0x80) {
        cut--;
    }
    return text.substr(0, cut);
}

Finding make_finding(FindingCategory category,
                     Severity severity,
                     const std::string& url,
                     const std::string& target_detail,
                     const std::string& evidence) {
    Finding f;
    f.url = url;
    f.category = category;
    f.severity = severity;
    f.target_detail = target_detail;
    f.evidence = truncate_evidence(evidence);
    return f;
}

std::string to_string(FindingCategory category) {
    switch (category) {
        case FindingCategory::HEADER_MISSING:    return "HeaderMissing";
        case FindingCategory::COOKIE_FLAG:       return "CookieFlag";
        case FindingCategory::EXPOSED_FILE:      return "ExposedFile";
        case FindingCategory::SENSITIVE_COMMENT: return "SensitiveComment";
        case FindingCategory::NO_CSRF_TOKEN:     return "NoCsrfToken";
        case FindingCategory::EXPOSED_SECRET:    return "ExposedSecret";
        case FindingCategory::WEAK_TLS:          return "WeakTls";
        case FindingCategory::INFO_DISCLOSURE:   return "InfoDisclosure";
        case FindingCategory::INLINE_SCRIPTS:    return "InlineScripts";
    }
    return "Unknown";
}

std::string to_string(Severity severity) {
    switch (severity) {
        case Severity::INFO:     return "Info";
        case Severity::WARNING:  return "Warning";
        case Severity::CRITICAL: return "Critical";
    }
    return "Unknown";
}

bool parse_category(const std::string& name, FindingCategory& out) {
    static const FindingCategory all[] = {
        FindingCategory::HEADER_MISSING,
        FindingCategory::COOKIE_FLAG,
        FindingCategory::EXPOSED_FILE,
        FindingCategory::SENSITIVE_COMMENT,
        FindingCategory::NO_CSRF_TOKEN,
        FindingCategory::EXPOSED_SECRET,
        FindingCategory::WEAK_TLS,
        FindingCategory::INFO_DISCLOSURE,
        FindingCategory::INLINE_SCRIPTS
    };
    for (auto c : all) {
        if (to_string(c) == name) {
            out = c;
            return true;
        }
    }
    return false;
}

bool parse_severity(const std::string& name, Severity& out) {
    for (auto s : {Severity::INFO, Severity::WARNING, Severity::CRITICAL}) {
        if (to_string(s) == name) {
            out = s;
            return true;
        }
    }
    return false;
}

std::string to_string(AuditState state) {
    switch (state) {
        case AuditState::INIT:      return "Init";
        case AuditState::PROBING:   return "Probing";
        case AuditState::ANALYZING: return "Analyzing";
        case AuditState::DONE:      return "Done";
        case AuditState::FAILED:    return "Failed";
        case AuditState::CANCELLED: return "Cancelled";
    }
    return "Unknown";
}
