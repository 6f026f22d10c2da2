/**
 * @file test_report_writer.cpp
 * @brief Unit tests for report serialization and console rendering
 */

#include <catch2/catch.hpp>
#include "report/report_writer.h"
#include <filesystem>
#include <fstream>
#include <sstream>

static AuditReport sample_report() {
    AuditReport r;
    r.target = "https://example.test/";
    r.timestamp = "2025-01-01T00:00:00.000Z";
    r.finished_at = "2025-01-01T00:00:02.500Z";
    r.state = AuditState::DONE;
    r.primary.ok = true;
    r.primary.status = 200;
    r.primary.final_url = "https://example.test/";

    Finding f = make_finding(FindingCategory::EXPOSED_FILE, Severity::CRITICAL,
                             "https://example.test/.env", ".env", ".env");
    f.id = "finding_1";
    r.findings.push_back(f);

    r.file_exposure_summary.checked = 20;
    r.file_exposure_summary.exposed = 1;
    r.present_headers = {"X-Frame-Options"};
    r.form_count = 2;
    r.emails = {"admin@example.test"};
    r.recommendations = {"Add CSRF tokens to all forms"};
    return r;
}

TEST_CASE("Report JSON carries every section", "[report]") {
    auto j = report::to_json(sample_report());

    REQUIRE(j["target"] == "https://example.test/");
    REQUIRE(j["state"] == "Done");
    REQUIRE(j["primary"]["status"] == 200);
    REQUIRE(j["findings"].size() == 1);
    REQUIRE(j["findings"][0]["id"] == "finding_1");
    REQUIRE(j["findings"][0]["category"] == "ExposedFile");
    REQUIRE(j["findings"][0]["severity"] == "Critical");
    REQUIRE(j["file_exposure_summary"]["checked"] == 20);
    REQUIRE(j["file_exposure_summary"]["exposed"] == 1);
    REQUIRE(j["narrative"]["form_count"] == 2);
    REQUIRE(j["recommendations"].size() == 1);
}

TEST_CASE("Report JSON reads back", "[report]") {
    auto original = sample_report();
    auto restored = report::from_json(report::to_json(original));

    REQUIRE(restored.target == original.target);
    REQUIRE(restored.state == AuditState::DONE);
    REQUIRE(restored.findings.size() == 1);
    REQUIRE(restored.findings[0].category == FindingCategory::EXPOSED_FILE);
    REQUIRE(restored.findings[0].severity == Severity::CRITICAL);
    REQUIRE(restored.file_exposure_summary.exposed == 1);
    REQUIRE(restored.emails == original.emails);
}

TEST_CASE("Report JSON with unknown values is rejected", "[report]") {
    auto j = report::to_json(sample_report());

    SECTION("Unknown state") {
        j["state"] = "Sleeping";
        REQUIRE_THROWS_AS(report::from_json(j), std::invalid_argument);
    }

    SECTION("Unknown category") {
        j["findings"][0]["category"] = "Bogus";
        REQUIRE_THROWS_AS(report::from_json(j), std::invalid_argument);
    }

    SECTION("Missing summary") {
        j.erase("file_exposure_summary");
        REQUIRE_THROWS_AS(report::from_json(j), nlohmann::json::exception);
    }
}

TEST_CASE("Text rendering follows phase order", "[report]") {
    std::ostringstream out;
    report::render_text(sample_report(), out);
    std::string text = out.str();

    size_t tls = text.find("SSL/TLS ANALYSIS");
    size_t headers = text.find("SECURITY HEADERS ANALYSIS");
    size_t files = text.find("EXPOSED FILES CHECK");
    size_t html = text.find("HTML CONTENT ANALYSIS");
    size_t disclosure = text.find("INFORMATION DISCLOSURE");
    size_t recs = text.find("SECURITY RECOMMENDATIONS");

    REQUIRE(tls != std::string::npos);
    REQUIRE(tls < headers);
    REQUIRE(headers < files);
    REQUIRE(files < html);
    REQUIRE(html < disclosure);
    REQUIRE(disclosure < recs);

    REQUIRE(text.find("Summary: 19/20 files properly protected") != std::string::npos);
    REQUIRE(text.find("1. Add CSRF tokens to all forms") != std::string::npos);
    REQUIRE(text.find("not a penetration test") != std::string::npos);
}

TEST_CASE("Report file is written when evidence is not clean UTF-8", "[report]") {
    std::string path = "test_report_writer_utf8.json";

    AuditReport r = sample_report();

    // 100-byte cut inside a three-byte character
    std::string comment = "api " + std::string(95, 'x') + "\xE6\x97\xA5\xE6\x9C\xAC";
    Finding cut = make_finding(FindingCategory::SENSITIVE_COMMENT, Severity::WARNING,
                               r.target, "comment contains 'api'", comment);
    cut.id = "finding_2";
    r.findings.push_back(cut);

    Finding banner = make_finding(FindingCategory::INFO_DISCLOSURE, Severity::INFO,
                                  r.target, "Server", "Apache \xE9");
    banner.id = "finding_3";
    r.findings.push_back(banner);

    REQUIRE(report::write_json(r, path));

    std::ifstream in(path);
    nlohmann::json j;
    REQUIRE_NOTHROW(j = nlohmann::json::parse(in));
    REQUIRE(j["findings"].size() == 3);
    REQUIRE(j["findings"][1]["evidence"] == "api " + std::string(95, 'x'));
    REQUIRE(j["findings"][2]["evidence"].get<std::string>().rfind("Apache ", 0) == 0);

    std::filesystem::remove(path);
}

TEST_CASE("Default-constructed finding serializes with defined values", "[report]") {
    AuditReport r = sample_report();
    r.findings.push_back(Finding{});

    auto j = report::to_json(r);
    REQUIRE(j["findings"][1]["category"] == "InfoDisclosure");
    REQUIRE(j["findings"][1]["severity"] == "Info");
}
