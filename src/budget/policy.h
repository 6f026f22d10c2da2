#pragma once
#include <schema/audit_report.h>
#include <string>
#include <map>

namespace budget {

// Risk budget evaluation for audit reports.
// Assigns points per finding category and compares the total against
// warning and blocking thresholds, so the CLI exit code can gate a
// deployment pipeline.

struct Policy {
    // Points per finding category name ("ExposedFile", ...)
    std::map<std::string, int> category_scores;

    int warn_threshold = 5;
    int block_threshold = 10;

    /**
     * @brief Load policy from a JSON file, overlaying the defaults
     * @param policy_path Path to policy file
     * @return Loaded policy; defaults if the file cannot be opened
     * @throws std::runtime_error if the file is not valid JSON
     */
    static Policy load(const std::string& policy_path);

    /**
     * @brief Default scores: exposed secrets and files dominate, disclosures are free
     */
    static Policy get_default();
};

struct BudgetResult {
    int total_score = 0;
    std::map<std::string, int> category_counts;
    std::map<std::string, int> category_scores;
    bool exceeds_warn = false;
    bool exceeds_block = false;

    enum class Status {
        PASS,
        WARN,
        BLOCK
    };

    Status status() const {
        if (exceeds_block) return Status::BLOCK;
        if (exceeds_warn) return Status::WARN;
        return Status::PASS;
    }

    int exit_code() const {
        switch (status()) {
            case Status::PASS:  return 0;
            case Status::WARN:  return 1;
            case Status::BLOCK: return 2;
        }
        return 0;
    }

    std::string status_string() const {
        switch (status()) {
            case Status::PASS:  return "PASS";
            case Status::WARN:  return "WARN";
            case Status::BLOCK: return "BLOCK";
        }
        return "UNKNOWN";
    }
};

class BudgetEvaluator {
public:
    explicit BudgetEvaluator(const Policy& policy);

    /**
     * @brief Score the findings of a report
     */
    BudgetResult evaluate(const AuditReport& report) const;

    /**
     * @brief Score a report previously written as JSON
     * @param report_path Path to the JSON report
     * @throws std::runtime_error if the file cannot be read or parsed
     */
    BudgetResult evaluate_file(const std::string& report_path) const;

    /**
     * @brief Print a human-readable budget report
     */
    static void print_report(const BudgetResult& result);

private:
    Policy policy_;
};

} // namespace budget
