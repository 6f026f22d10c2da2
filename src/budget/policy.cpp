// Implementation of risk budget and policy evaluation

#include "policy.h"
#include "report/report_writer.h"
#include <nlohmann/json.hpp>
#include <fstream>
#include <iostream>
#include <iomanip>
#include <stdexcept>

namespace budget {

using json = nlohmann::json;

Policy Policy::get_default() {
    Policy p;
    p.category_scores["HeaderMissing"] = 1;
    p.category_scores["CookieFlag"] = 1;
    p.category_scores["ExposedFile"] = 5;
    p.category_scores["SensitiveComment"] = 2;
    p.category_scores["NoCsrfToken"] = 2;
    p.category_scores["ExposedSecret"] = 8;
    p.category_scores["WeakTls"] = 5;
    p.category_scores["InfoDisclosure"] = 0;
    p.category_scores["InlineScripts"] = 1;

    p.warn_threshold = 5;
    p.block_threshold = 10;
    return p;
}

Policy Policy::load(const std::string& policy_path) {
    std::ifstream in(policy_path);
    if (!in.is_open()) {
        std::cerr << "Warning: Could not open policy file, using defaults\n";
        return get_default();
    }

    json j;
    try {
        in >> j;
    } catch (const json::parse_error& e) {
        throw std::runtime_error("invalid policy file " + policy_path + ": " + e.what());
    }

    Policy p = get_default();
    if (j.contains("category_scores")) {
        for (auto& [key, value] : j["category_scores"].items()) {
            FindingCategory unused;
            if (!parse_category(key, unused)) {
                std::cerr << "Warning: policy scores unknown category '" << key << "'\n";
            }
            p.category_scores[key] = value.get<int>();
        }
    }
    p.warn_threshold = j.value("warn_threshold", p.warn_threshold);
    p.block_threshold = j.value("block_threshold", p.block_threshold);
    return p;
}

BudgetEvaluator::BudgetEvaluator(const Policy& policy)
    : policy_(policy) {}

BudgetResult BudgetEvaluator::evaluate(const AuditReport& report) const {
    BudgetResult result;

    for (const auto& finding : report.findings) {
        std::string category = to_string(finding.category);
        result.category_counts[category]++;

        int score = 0;
        if (policy_.category_scores.count(category)) {
            score = policy_.category_scores.at(category);
        }
        result.category_scores[category] += score;
        result.total_score += score;
    }

    result.exceeds_warn = result.total_score >= policy_.warn_threshold;
    result.exceeds_block = result.total_score >= policy_.block_threshold;
    return result;
}

BudgetResult BudgetEvaluator::evaluate_file(const std::string& report_path) const {
    std::ifstream in(report_path);
    if (!in.is_open()) {
        throw std::runtime_error("could not open report: " + report_path);
    }

    try {
        json j;
        in >> j;
        return evaluate(report::from_json(j));
    } catch (const json::exception& e) {
        throw std::runtime_error("invalid report " + report_path + ": " + e.what());
    } catch (const std::invalid_argument& e) {
        throw std::runtime_error("invalid report " + report_path + ": " + e.what());
    }
}

void BudgetEvaluator::print_report(const BudgetResult& result) {
    std::cout << "\n=== Risk Budget Report ===\n\n";

    std::cout << "Findings by Category:\n";
    for (const auto& [category, count] : result.category_counts) {
        int score = result.category_scores.count(category)
            ? result.category_scores.at(category) : 0;
        std::cout << "  " << std::left << std::setw(20) << category
                  << " Count: " << std::setw(3) << count
                  << " Score: " << score << "\n";
    }

    std::cout << "\n";
    std::cout << "Total Score: " << result.total_score << "\n";
    std::cout << "Status: " << result.status_string() << "\n";

    if (result.exceeds_block) {
        std::cout << "\n   BLOCKED: Risk score exceeds threshold\n";
    } else if (result.exceeds_warn) {
        std::cout << "\n   WARNING: Risk score approaching threshold\n";
    } else {
        std::cout << "\n   PASS: Risk within acceptable limits\n";
    }

    std::cout << "\n";
}

} // namespace budget
