/**
 * @file test_budget.cpp
 * @brief Unit tests for risk budget evaluation
 *
 * Tests policy loading, score calculation, threshold checking, and
 * evaluation of saved JSON reports.
 */

#include <catch2/catch.hpp>
#include "budget/policy.h"
#include "report/report_writer.h"
#include <filesystem>
#include <fstream>

using namespace budget;
namespace fs = std::filesystem;

static Finding finding_of(FindingCategory category) {
    return make_finding(category, Severity::WARNING, "https://example.test/", "detail", "evidence");
}

TEST_CASE("Default policy has expected values", "[budget]") {
    auto policy = Policy::get_default();

    SECTION("Every category is scored") {
        REQUIRE(policy.category_scores.size() == 9);
        REQUIRE(policy.category_scores["HeaderMissing"] == 1);
        REQUIRE(policy.category_scores["ExposedFile"] == 5);
        REQUIRE(policy.category_scores["ExposedSecret"] == 8);
        REQUIRE(policy.category_scores["InfoDisclosure"] == 0);
    }

    SECTION("Thresholds are reasonable") {
        REQUIRE(policy.warn_threshold == 5);
        REQUIRE(policy.block_threshold == 10);
        REQUIRE(policy.block_threshold > policy.warn_threshold);
    }
}

TEST_CASE("Policy loads from JSON file", "[budget]") {
    std::string policy_file = "test_policy.json";

    {
        nlohmann::json policy_json;
        policy_json["category_scores"] = {
            {"HeaderMissing", 3},
            {"WeakTls", 20}
        };
        policy_json["warn_threshold"] = 15;
        policy_json["block_threshold"] = 25;

        std::ofstream out(policy_file);
        out << policy_json.dump(2);
    }

    auto policy = Policy::load(policy_file);

    REQUIRE(policy.category_scores["HeaderMissing"] == 3);
    REQUIRE(policy.category_scores["WeakTls"] == 20);
    REQUIRE(policy.category_scores["ExposedFile"] == 5);
    REQUIRE(policy.warn_threshold == 15);
    REQUIRE(policy.block_threshold == 25);

    fs::remove(policy_file);
}

TEST_CASE("Policy handles missing and broken files", "[budget]") {
    SECTION("Missing file gives defaults") {
        auto policy = Policy::load("nonexistent_policy.json");
        REQUIRE(policy.warn_threshold == 5);
        REQUIRE(policy.block_threshold == 10);
    }

    SECTION("Broken file throws") {
        std::string policy_file = "test_broken_policy.json";
        {
            std::ofstream out(policy_file);
            out << "{ not json";
        }
        REQUIRE_THROWS_AS(Policy::load(policy_file), std::runtime_error);
        fs::remove(policy_file);
    }
}

TEST_CASE("BudgetEvaluator calculates scores correctly", "[budget]") {
    BudgetEvaluator evaluator(Policy::get_default());

    SECTION("Empty report results in zero score") {
        AuditReport report;
        auto result = evaluator.evaluate(report);

        REQUIRE(result.total_score == 0);
        REQUIRE(result.status() == BudgetResult::Status::PASS);
        REQUIRE(result.exit_code() == 0);
    }

    SECTION("Findings accumulate per category") {
        AuditReport report;
        for (int i = 0; i < 3; i++) {
            report.findings.push_back(finding_of(FindingCategory::HEADER_MISSING));
        }
        report.findings.push_back(finding_of(FindingCategory::INFO_DISCLOSURE));

        auto result = evaluator.evaluate(report);

        REQUIRE(result.total_score == 3);
        REQUIRE(result.category_counts["HeaderMissing"] == 3);
        REQUIRE(result.category_scores["HeaderMissing"] == 3);
        REQUIRE(result.category_counts["InfoDisclosure"] == 1);
        REQUIRE(result.status() == BudgetResult::Status::PASS);
    }

    SECTION("Thresholds trigger correct status") {
        AuditReport report;
        report.findings.push_back(finding_of(FindingCategory::EXPOSED_FILE));

        auto result = evaluator.evaluate(report);
        REQUIRE(result.total_score == 5);
        REQUIRE(result.status() == BudgetResult::Status::WARN);
        REQUIRE(result.exit_code() == 1);

        report.findings.push_back(finding_of(FindingCategory::WEAK_TLS));
        result = evaluator.evaluate(report);
        REQUIRE(result.total_score == 10);
        REQUIRE(result.status() == BudgetResult::Status::BLOCK);
        REQUIRE(result.exit_code() == 2);
    }
}

TEST_CASE("BudgetEvaluator evaluates a saved report", "[budget]") {
    std::string report_file = "test_budget_report.json";

    AuditReport saved;
    saved.target = "https://example.test/";
    saved.state = AuditState::DONE;
    saved.file_exposure_summary = {20, 1};
    saved.findings.push_back(finding_of(FindingCategory::EXPOSED_FILE));
    saved.findings.push_back(finding_of(FindingCategory::SENSITIVE_COMMENT));
    REQUIRE(report::write_json(saved, report_file));

    BudgetEvaluator evaluator(Policy::get_default());
    auto result = evaluator.evaluate_file(report_file);

    REQUIRE(result.total_score == 7);
    REQUIRE(result.category_counts["ExposedFile"] == 1);
    REQUIRE(result.category_counts["SensitiveComment"] == 1);
    REQUIRE(result.status() == BudgetResult::Status::WARN);

    fs::remove(report_file);
}

TEST_CASE("BudgetEvaluator rejects unreadable reports", "[budget]") {
    BudgetEvaluator evaluator(Policy::get_default());

    REQUIRE_THROWS_AS(evaluator.evaluate_file("missing_report.json"), std::runtime_error);

    std::string report_file = "test_bad_report.json";
    {
        std::ofstream out(report_file);
        out << R"({"target": "x", "findings": [{"category": "Bogus", "severity": "Info"}],
                  "file_exposure_summary": {"checked": 0, "exposed": 0}})";
    }
    REQUIRE_THROWS_AS(evaluator.evaluate_file(report_file), std::runtime_error);
    fs::remove(report_file);
}
