/**
 * @file auditor.cpp
 * @brief Audit orchestration and report assembly
 */

#include "auditor.h"
#include "logging/audit_trail.h"
#include <chrono>
#include <ctime>
#include <future>
#include <iomanip>
#include <sstream>

/// Get current timestamp in ISO8601 format.
static std::string current_utc_timestamp() {
    auto now = std::chrono::system_clock::now();
    auto t = std::chrono::system_clock::to_time_t(now);
    std::tm tm{};
    gmtime_r(&t, &tm);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;
    std::ostringstream ss;
    ss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S") << '.';
    ss << std::setw(3) << std::setfill('0') << ms.count() << "Z";
    return ss.str();
}

static HtmlAnalyzer::Options html_options(const AuditConfig& config) {
    HtmlAnalyzer::Options opts;
    opts.comment_keywords = config.comment_keywords;
    opts.csrf_keywords = config.csrf_keywords;
    opts.inline_script_threshold = config.inline_script_threshold;
    opts.max_emails = config.max_emails;
    return opts;
}

Auditor::Auditor(const ProbeClient& client, const AuditConfig& config, logging::AuditTrail* trail)
    : client_(client),
      config_(config),
      trail_(trail),
      header_analyzer_(config.security_headers),
      html_analyzer_(html_options(config)) {}

void Auditor::transition(AuditReport& report, AuditState next) const {
    report.state = next;
    if (observer_) observer_(next);
}

AuditReport Auditor::run(const Target& target, const CancellationToken& cancel) const {
    AuditReport report;
    report.target = target.url();
    report.timestamp = current_utc_timestamp();

    if (trail_) trail_->record_started(target.url(), config_.sensitive_paths.size(), config_.worker_limit);

    // --- Probing ---
    transition(report, AuditState::PROBING);

    FileExposureProber::Options exposure_opts;
    exposure_opts.worker_limit = config_.worker_limit;
    exposure_opts.timeout_seconds = config_.exposure_timeout_seconds;
    exposure_opts.connect_timeout_seconds = config_.connect_timeout_seconds;
    FileExposureProber prober(client_, config_.sensitive_paths, exposure_opts);

    FileExposureProber::ProbeObserver probe_logger;
    if (trail_) {
        probe_logger = [this](const std::string& url, const ProbeResult& r) {
            trail_->record_probe(url, r);
        };
    }

    // Exposure probes only need the target, so they overlap the primary fetch
    auto exposure_future = std::async(std::launch::async, [&]() {
        return prober.run(target, cancel, probe_logger);
    });

    FetchOptions primary_opts;
    primary_opts.timeout_seconds = config_.primary_timeout_seconds;
    primary_opts.connect_timeout_seconds = config_.connect_timeout_seconds;
    primary_opts.follow_redirects = true;
    primary_opts.max_redirects = config_.max_redirects;
    primary_opts.cancel = cancel;

    ProbeResult primary = client_.fetch(target.url(), primary_opts);
    if (trail_) trail_->record_probe(target.url(), primary);

    ExposureResult exposure = exposure_future.get();

    // --- Analyzing ---
    transition(report, AuditState::ANALYZING);

    if (primary.ok()) {
        report.primary.ok = true;
        report.primary.status = primary.success().status;
        report.primary.final_url = primary.success().final_url;
    } else {
        report.primary.failure_kind = to_string(primary.failure().kind);
        report.primary.failure_message = primary.failure().message;
    }

    std::vector<Finding> tls_findings = tls_checker_.check(target, &primary);

    HeaderAnalysis headers;
    HtmlAnalysis html;
    std::vector<Finding> disclosure;
    if (primary.ok() && !cancel.cancelled()) {
        headers = header_analyzer_.analyze(primary);
        html = html_analyzer_.analyze(primary);
        disclosure = disclosure_detector_.analyze(primary);
    }

    // Phase order, never completion order
    std::vector<Finding>& findings = report.findings;
    for (auto* phase : {&tls_findings, &headers.findings, &exposure.findings, &html.findings, &disclosure}) {
        for (auto& f : *phase) {
            findings.push_back(std::move(f));
        }
    }
    for (size_t i = 0; i < findings.size(); i++) {
        findings[i].id = "finding_" + std::to_string(i + 1);
        if (trail_) trail_->record_finding(findings[i]);
    }

    report.file_exposure_summary = exposure.summary;
    report.present_headers = headers.present;
    report.comment_count = html.comment_count;
    report.inline_script_count = html.inline_script_count;
    report.form_count = html.form_count;
    report.external_script_hosts = html.external_script_hosts;
    report.emails = html.emails;
    report.recommendations = recommendation_engine_.recommend(findings);
    report.finished_at = current_utc_timestamp();

    if (cancel.cancelled()) {
        transition(report, AuditState::CANCELLED);
    } else if (!primary.ok()) {
        transition(report, AuditState::FAILED);
    } else {
        transition(report, AuditState::DONE);
    }

    if (trail_) {
        trail_->record_finished(to_string(report.state), findings.size(),
                                report.file_exposure_summary.checked,
                                report.file_exposure_summary.exposed);
    }
    return report;
}
