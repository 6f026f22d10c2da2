/**
 * @file report_writer.cpp
 * @brief JSON serialization and console rendering of audit reports
 */

#include "report_writer.h"
#include <fstream>
#include <initializer_list>
#include <iomanip>
#include <stdexcept>

namespace report {

using json = nlohmann::json;

static AuditState parse_state(const std::string& name) {
    for (auto s : {AuditState::INIT, AuditState::PROBING, AuditState::ANALYZING,
                   AuditState::DONE, AuditState::FAILED, AuditState::CANCELLED}) {
        if (to_string(s) == name) return s;
    }
    throw std::invalid_argument("unknown audit state: " + name);
}

json to_json(const AuditReport& report) {
    json j;
    j["target"] = report.target;
    j["timestamp"] = report.timestamp;
    j["finished_at"] = report.finished_at;
    j["state"] = to_string(report.state);

    json primary;
    primary["ok"] = report.primary.ok;
    if (report.primary.ok) {
        primary["status"] = report.primary.status;
        primary["final_url"] = report.primary.final_url;
    } else {
        primary["failure_kind"] = report.primary.failure_kind;
        primary["failure_message"] = report.primary.failure_message;
    }
    j["primary"] = primary;

    j["findings"] = json::array();
    for (const auto& f : report.findings) {
        json jf;
        jf["id"] = f.id;
        jf["url"] = f.url;
        jf["category"] = to_string(f.category);
        jf["severity"] = to_string(f.severity);
        jf["target_detail"] = f.target_detail;
        jf["evidence"] = f.evidence;
        j["findings"].push_back(jf);
    }

    j["file_exposure_summary"] = {
        {"checked", report.file_exposure_summary.checked},
        {"exposed", report.file_exposure_summary.exposed}
    };

    j["narrative"] = {
        {"present_headers", report.present_headers},
        {"comment_count", report.comment_count},
        {"inline_script_count", report.inline_script_count},
        {"form_count", report.form_count},
        {"external_script_hosts", report.external_script_hosts},
        {"emails", report.emails}
    };

    j["recommendations"] = report.recommendations;
    return j;
}

AuditReport from_json(const json& j) {
    AuditReport r;
    r.target = j.at("target").get<std::string>();
    r.timestamp = j.value("timestamp", "");
    r.finished_at = j.value("finished_at", "");
    r.state = parse_state(j.value("state", "Init"));

    if (j.contains("primary")) {
        const json& p = j["primary"];
        r.primary.ok = p.value("ok", false);
        r.primary.status = p.value("status", 0L);
        r.primary.final_url = p.value("final_url", "");
        r.primary.failure_kind = p.value("failure_kind", "");
        r.primary.failure_message = p.value("failure_message", "");
    }

    for (const auto& jf : j.at("findings")) {
        Finding f;
        f.id = jf.value("id", "");
        f.url = jf.value("url", "");
        if (!parse_category(jf.at("category").get<std::string>(), f.category)) {
            throw std::invalid_argument("unknown category: " + jf.at("category").get<std::string>());
        }
        if (!parse_severity(jf.at("severity").get<std::string>(), f.severity)) {
            throw std::invalid_argument("unknown severity: " + jf.at("severity").get<std::string>());
        }
        f.target_detail = jf.value("target_detail", "");
        f.evidence = truncate_evidence(jf.value("evidence", ""));
        r.findings.push_back(std::move(f));
    }

    const json& summary = j.at("file_exposure_summary");
    r.file_exposure_summary.checked = summary.at("checked").get<int>();
    r.file_exposure_summary.exposed = summary.at("exposed").get<int>();

    if (j.contains("narrative")) {
        const json& n = j["narrative"];
        r.present_headers = n.value("present_headers", std::vector<std::string>{});
        r.comment_count = n.value("comment_count", 0);
        r.inline_script_count = n.value("inline_script_count", 0);
        r.form_count = n.value("form_count", 0);
        r.external_script_hosts = n.value("external_script_hosts", std::vector<std::string>{});
        r.emails = n.value("emails", std::vector<std::string>{});
    }

    r.recommendations = j.value("recommendations", std::vector<std::string>{});
    return r;
}

static void section(std::ostream& out, const std::string& title) {
    out << "\n" << std::string(60, '=') << "\n";
    out << title << "\n";
    out << std::string(60, '=') << "\n";
}

// Print every finding of the given categories, or a fallback line
static void print_findings(std::ostream& out,
                           const AuditReport& report,
                           std::initializer_list<FindingCategory> categories,
                           const std::string& none_message) {
    bool any = false;
    for (const auto& f : report.findings) {
        bool match = false;
        for (auto c : categories) {
            if (f.category == c) match = true;
        }
        if (!match) continue;
        any = true;
        out << "  [" << std::left << std::setw(8) << to_string(f.severity) << "] "
            << to_string(f.category) << ": " << f.target_detail;
        if (!f.evidence.empty() && f.evidence != f.target_detail) {
            out << " (" << f.evidence << ")";
        }
        out << "\n";
    }
    if (!any) {
        out << "  " << none_message << "\n";
    }
}

void render_text(const AuditReport& report, std::ostream& out) {
    out << "Security audit for: " << report.target << "\n";
    out << "Started: " << report.timestamp << "\n";
    out << "State: " << to_string(report.state) << "\n";

    if (report.primary.ok) {
        out << "Primary page: HTTP " << report.primary.status << " (" << report.primary.final_url << ")\n";
    } else if (!report.primary.failure_kind.empty()) {
        out << "Primary page: " << report.primary.failure_kind << " - " << report.primary.failure_message << "\n";
    }

    section(out, "SSL/TLS ANALYSIS");
    print_findings(out, report, {FindingCategory::WEAK_TLS}, "Transport encryption in place");

    section(out, "SECURITY HEADERS ANALYSIS");
    for (const auto& h : report.present_headers) {
        out << "  present: " << h << "\n";
    }
    print_findings(out, report, {FindingCategory::HEADER_MISSING, FindingCategory::COOKIE_FLAG},
                   "No missing headers or cookie flags");

    section(out, "EXPOSED FILES CHECK");
    print_findings(out, report, {FindingCategory::EXPOSED_FILE}, "No common sensitive files exposed");
    int safe = report.file_exposure_summary.checked - report.file_exposure_summary.exposed;
    out << "  Summary: " << safe << "/" << report.file_exposure_summary.checked
        << " files properly protected\n";

    section(out, "HTML CONTENT ANALYSIS");
    out << "  Comments: " << report.comment_count
        << "  Inline scripts: " << report.inline_script_count
        << "  Forms: " << report.form_count << "\n";
    for (const auto& host : report.external_script_hosts) {
        out << "  external script: " << host << "\n";
    }
    for (const auto& email : report.emails) {
        out << "  email exposed: " << email << "\n";
    }
    print_findings(out, report,
                   {FindingCategory::SENSITIVE_COMMENT, FindingCategory::INLINE_SCRIPTS,
                    FindingCategory::NO_CSRF_TOKEN, FindingCategory::EXPOSED_SECRET},
                   "No sensitive content detected");

    section(out, "INFORMATION DISCLOSURE");
    print_findings(out, report, {FindingCategory::INFO_DISCLOSURE}, "No implementation details disclosed");

    section(out, "SECURITY RECOMMENDATIONS");
    for (size_t i = 0; i < report.recommendations.size(); i++) {
        out << "  " << (i + 1) << ". " << report.recommendations[i] << "\n";
    }

    out << "\n" << std::string(60, '=') << "\n";
    out << "AUDIT " << (report.state == AuditState::DONE ? "COMPLETE" : "INCOMPLETE")
        << ": " << report.findings.size() << " finding(s)\n";
    out << "This is a basic automated scan, not a penetration test.\n";
}

bool write_json(const AuditReport& report, const std::string& path) {
    std::ofstream ofs(path);
    if (!ofs.is_open()) {
        return false;
    }
    // Header values may be Latin-1; invalid bytes become U+FFFD
    ofs << to_json(report).dump(2, ' ', false, json::error_handler_t::replace) << "\n";
    return ofs.good();
}

} // namespace report
