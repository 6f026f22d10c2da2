/**
 * @file test_file_exposure.cpp
 * @brief Unit tests for sensitive path probing
 *
 * Runs the prober against a scripted client. Checks that only a direct
 * 200 counts as exposed, that failures count as safe, and that findings
 * come back in path-list order however many workers ran.
 */

#include <catch2/catch.hpp>
#include "core/audit_config.h"
#include "core/file_exposure.h"
#include "helpers/fake_probe_client.h"
#include <atomic>

using test_helpers::FakeProbeClient;
using test_helpers::make_response;
using test_helpers::make_failure;

TEST_CASE("Only a direct 200 counts as exposed", "[exposure]") {
    FakeProbeClient client;
    auto target = Target::parse("https://example.test");

    client.route("https://example.test/.env", make_response(200, {}, "SECRET=1"));
    client.route("https://example.test/admin", make_response(301, {{"Location", "/login"}}));
    client.route("https://example.test/backup.zip", make_response(403));
    client.route("https://example.test/.git/config",
                 make_failure(FailureKind::TIMEOUT, "operation timed out"));

    FileExposureProber prober(client, {".git/config", ".env", "admin", "backup.zip", "missing.txt"});
    auto result = prober.run(target);

    REQUIRE(result.summary.checked == 5);
    REQUIRE(result.summary.exposed == 1);
    REQUIRE(result.findings.size() == 1);

    const Finding& f = result.findings[0];
    REQUIRE(f.category == FindingCategory::EXPOSED_FILE);
    REQUIRE(f.severity == Severity::CRITICAL);
    REQUIRE(f.url == "https://example.test/.env");
    REQUIRE(f.target_detail == ".env");
    REQUIRE(f.evidence == ".env");
}

TEST_CASE("Exposure probes do not follow redirects", "[exposure]") {
    FakeProbeClient client;
    auto target = Target::parse("https://example.test");

    FileExposureProber::Options opts;
    opts.timeout_seconds = 3;
    FileExposureProber prober(client, {"admin"}, opts);
    prober.run(target);

    test_helpers::RecordedFetch call;
    REQUIRE(client.was_fetched("https://example.test/admin", &call));
    REQUIRE_FALSE(call.follow_redirects);
    REQUIRE(call.timeout_seconds == 3);
}

TEST_CASE("Findings keep path-list order with several workers", "[exposure]") {
    FakeProbeClient client;
    client.set_fallback(make_response(200, {}, "ok"));
    auto target = Target::parse("https://example.test");

    auto paths = AuditConfig::get_default().sensitive_paths;
    FileExposureProber::Options opts;
    opts.worker_limit = 5;
    FileExposureProber prober(client, paths, opts);
    auto result = prober.run(target);

    REQUIRE(client.call_count() == paths.size());
    REQUIRE(result.summary.checked == 20);
    REQUIRE(result.summary.exposed == 20);
    REQUIRE(result.findings.size() == paths.size());
    for (size_t i = 0; i < paths.size(); i++) {
        REQUIRE(result.findings[i].target_detail == paths[i]);
    }
}

TEST_CASE("Checked equals exposed plus safe", "[exposure]") {
    FakeProbeClient client;
    client.set_fallback(make_failure(FailureKind::CONNECTION_ERROR, "connection refused"));
    auto target = Target::parse("https://example.test");

    FileExposureProber prober(client, AuditConfig::get_default().sensitive_paths);
    auto result = prober.run(target);

    REQUIRE(result.summary.checked == 20);
    REQUIRE(result.summary.exposed == 0);
    REQUIRE(result.findings.empty());
}

TEST_CASE("Cancelled prober skips remaining paths", "[exposure]") {
    FakeProbeClient client;
    client.set_fallback(make_response(200));
    auto target = Target::parse("https://example.test");

    CancellationSource cancel;
    cancel.cancel();

    // Observer runs on worker threads, so it only counts
    std::atomic<int> cancelled{0};
    FileExposureProber prober(client, {".env", "admin", "backup.sql"});
    auto result = prober.run(target, cancel.token(),
        [&](const std::string&, const ProbeResult& r) {
            if (!r.ok() && r.failure().kind == FailureKind::CANCELLED) cancelled++;
        });

    REQUIRE(client.call_count() == 0);
    REQUIRE(cancelled.load() == 3);
    REQUIRE(result.summary.checked == 3);
    REQUIRE(result.summary.exposed == 0);
}

TEST_CASE("Empty path list checks nothing", "[exposure]") {
    FakeProbeClient client;
    FileExposureProber prober(client, {});
    auto result = prober.run(Target::parse("https://example.test"));

    REQUIRE(result.summary.checked == 0);
    REQUIRE(client.call_count() == 0);
}
