#pragma once
#include <string>
#include <vector>
#include "finding.h"
#include "probe_result.h"

/**
 * @file audit_report.h
 * @brief Final output of one audit run
 *
 * Built once by the Auditor after every phase has finished (or was skipped)
 * and not modified afterwards.
 */

enum class AuditState {
    INIT,
    PROBING,
    ANALYZING,
    DONE,
    FAILED,
    CANCELLED
};

struct FileExposureSummary {
    int checked = 0;
    int exposed = 0;
};

/**
 * Outcome of the primary page fetch, kept for the report narrative
 */
struct PrimaryProbe {
    bool ok = false;
    long status = 0;
    std::string final_url;
    std::string failure_kind;
    std::string failure_message;
};

struct AuditReport {
    std::string target;
    std::string timestamp;
    std::string finished_at;
    AuditState state = AuditState::INIT;
    PrimaryProbe primary;

    std::vector<Finding> findings;
    FileExposureSummary file_exposure_summary;

    // Narrative data, not scored
    std::vector<std::string> present_headers;
    int comment_count = 0;
    int inline_script_count = 0;
    int form_count = 0;
    std::vector<std::string> external_script_hosts;
    std::vector<std::string> emails;

    std::vector<std::string> recommendations;

    /**
     * @brief Count findings of one category
     */
    int count(FindingCategory category) const {
        int n = 0;
        for (const auto& f : findings) {
            if (f.category == category) n++;
        }
        return n;
    }
};

std::string to_string(AuditState state);
