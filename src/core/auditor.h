#pragma once
#include "audit_config.h"
#include "cancellation.h"
#include "disclosure_detector.h"
#include "file_exposure.h"
#include "header_analyzer.h"
#include "html_analyzer.h"
#include "http_client.h"
#include "recommendations.h"
#include "target.h"
#include "tls_checker.h"
#include <schema/audit_report.h>
#include <functional>

namespace logging {
class AuditTrail;
}

// Runs one audit against a target and assembles the report.
//
// State machine: Init -> Probing -> Analyzing -> Done.
//   Probing:   the primary page fetch runs while the file-exposure probes
//              run on their own worker pool (they only need the target).
//   Analyzing: TLS check always; header, HTML and disclosure analysis only
//              when the primary fetch produced a response.
//   Done:      findings merged in phase order (TLS, Headers, FileExposure,
//              HTML, Disclosure) and the recommendation checklist attached.
// A primary fetch failure ends in Failed, cancellation in Cancelled; both
// still return a report with whatever was collected.

class Auditor {
public:
    // Invoked on every state transition, mainly for progress output
    using StateObserver = std::function<void(AuditState)>;

    /**
     * @brief Create an auditor
     * @param client Probe client shared by all phases
     * @param config Lookup lists and probe settings
     * @param trail Optional audit trail; may be nullptr
     */
    Auditor(const ProbeClient& client, const AuditConfig& config, logging::AuditTrail* trail = nullptr);

    /**
     * @brief Run the audit; never throws for probe-level problems
     * @param target Parsed target
     * @param cancel Token that stops outstanding probes and skips later phases
     * @return Report, partial when the audit failed or was cancelled
     */
    AuditReport run(const Target& target, const CancellationToken& cancel = CancellationToken()) const;

    void set_state_observer(StateObserver observer) { observer_ = std::move(observer); }

private:
    const ProbeClient& client_;
    AuditConfig config_;
    logging::AuditTrail* trail_;
    StateObserver observer_;

    HeaderAnalyzer header_analyzer_;
    HtmlAnalyzer html_analyzer_;
    TlsChecker tls_checker_;
    DisclosureDetector disclosure_detector_;
    RecommendationEngine recommendation_engine_;

    void transition(AuditReport& report, AuditState next) const;
};
