/**
 * @file test_audit_config.cpp
 * @brief Unit tests for audit configuration defaults and file loading
 */

#include <catch2/catch.hpp>
#include "core/audit_config.h"
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

static void write_file(const std::string& path, const std::string& content) {
    std::ofstream out(path);
    out << content;
}

TEST_CASE("Default configuration", "[config]") {
    auto c = AuditConfig::get_default();

    REQUIRE(c.security_headers.size() == 7);
    REQUIRE(c.security_headers.front() == "Strict-Transport-Security");
    REQUIRE(c.sensitive_paths.size() == 20);
    REQUIRE(c.sensitive_paths.front() == ".git/config");
    REQUIRE(c.primary_timeout_seconds == 10);
    REQUIRE(c.exposure_timeout_seconds == 5);
    REQUIRE(c.worker_limit == 5);
    REQUIRE(c.inline_script_threshold == 10);
    REQUIRE(c.max_emails == 5);
    REQUIRE(c.audit_log_path.empty());
}

TEST_CASE("Configuration loads from YAML", "[config]") {
    std::string path = "test_config.yaml";
    write_file(path,
        "# audit settings\n"
        "worker_limit: 3\n"
        "primary_timeout_seconds: 20   # slow site\n"
        "user_agent: \"warden-test\"\n"
        "sensitive_paths:\n"
        "  - .env\n"
        "  - backup.sql\n"
        "audit_log_path: logs/audit.jsonl\n");

    auto c = AuditConfig::load(path);

    REQUIRE(c.worker_limit == 3);
    REQUIRE(c.primary_timeout_seconds == 20);
    REQUIRE(c.user_agent == "warden-test");
    REQUIRE(c.sensitive_paths == std::vector<std::string>{".env", "backup.sql"});
    REQUIRE(c.audit_log_path == "logs/audit.jsonl");
    REQUIRE(c.security_headers.size() == 7);

    fs::remove(path);
}

TEST_CASE("Configuration loads from JSON", "[config]") {
    std::string path = "test_config.json";
    write_file(path, R"({"worker_limit": 50, "security_headers": ["X-Frame-Options"], "max_emails": 2})");

    auto c = AuditConfig::load(path);

    REQUIRE(c.worker_limit == 10);
    REQUIRE(c.security_headers == std::vector<std::string>{"X-Frame-Options"});
    REQUIRE(c.max_emails == 2);

    fs::remove(path);
}

TEST_CASE("Missing config file falls back to defaults", "[config]") {
    auto c = AuditConfig::load("no_such_config.yaml");
    REQUIRE(c.sensitive_paths.size() == 20);
}

TEST_CASE("Invalid configuration is rejected", "[config]") {
    std::string path = "test_bad_config.yaml";

    SECTION("Non-numeric value") {
        write_file(path, "worker_limit: many\n");
        REQUIRE_THROWS_AS(AuditConfig::load(path), ConfigError);
    }

    SECTION("Non-positive timeout") {
        write_file(path, "exposure_timeout_seconds: 0\n");
        REQUIRE_THROWS_AS(AuditConfig::load(path), ConfigError);
    }

    SECTION("Broken JSON") {
        write_file(path, "{\"worker_limit\": ");
        REQUIRE_THROWS_AS(AuditConfig::load(path), ConfigError);
    }

    SECTION("List item without a key") {
        write_file(path, "- .env\n");
        REQUIRE_THROWS_AS(AuditConfig::load(path), ConfigError);
    }

    fs::remove(path);
}
