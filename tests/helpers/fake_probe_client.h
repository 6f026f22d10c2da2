/**
 * @file fake_probe_client.h
 * @brief Scripted ProbeClient and ProbeResult builders for offline tests
 *
 * Lets analyzer and auditor tests run against synthetic responses without
 * any network access. Routes map absolute URLs to canned results; anything
 * unrouted gets the fallback (404 by default).
 *
 * Example usage:
 * @code
 *   test_helpers::FakeProbeClient client;
 *   client.route("https://example.test/", test_helpers::make_response(200, {}, "<html></html>"));
 *   Auditor auditor(client, AuditConfig::get_default());
 *   AuditReport report = auditor.run(Target::parse("https://example.test"));
 * @endcode
 */

#pragma once

#include "core/http_client.h"
#include <map>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace test_helpers {

/**
 * @brief Build a successful probe result
 * @param status HTTP status code
 * @param headers Header name/value pairs (names are lower-cased like the real client)
 * @param body Response body
 * @param final_url URL after redirects
 */
ProbeResult make_response(long status,
                          std::vector<std::pair<std::string, std::string>> headers = {},
                          std::string body = "",
                          std::string final_url = "https://example.test/");

/**
 * @brief Build a failed probe result
 */
ProbeResult make_failure(FailureKind kind, const std::string& message = "simulated failure");

/**
 * One recorded call to the fake
 */
struct RecordedFetch {
    std::string url;
    bool follow_redirects;
    long timeout_seconds;
};

class FakeProbeClient : public ProbeClient {
public:
    FakeProbeClient();

    /**
     * @brief Answer this absolute URL with a fixed result
     */
    void route(const std::string& url, const ProbeResult& result);

    /**
     * @brief Result for any URL without a route
     */
    void set_fallback(const ProbeResult& result);

    /**
     * @brief Cancel the given source once this many fetches have completed
     */
    void cancel_after(size_t completed_calls, CancellationSource* source);

    /**
     * @brief Honour an already-cancelled token like the real client does
     */
    ProbeResult fetch(const std::string& url, const FetchOptions& opts) const override;

    std::vector<RecordedFetch> calls() const;
    size_t call_count() const;

    /**
     * @brief Whether a URL was fetched; copies the recorded call into out when given
     */
    bool was_fetched(const std::string& url, RecordedFetch* out = nullptr) const;

private:
    std::map<std::string, ProbeResult> routes_;
    ProbeResult fallback_;
    size_t cancel_after_ = 0;
    CancellationSource* cancel_source_ = nullptr;

    mutable std::mutex mutex_;
    mutable std::vector<RecordedFetch> calls_;
};

} // namespace test_helpers
