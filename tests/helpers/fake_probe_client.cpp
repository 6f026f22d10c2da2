/**
 * @file fake_probe_client.cpp
 * @brief Implementation of the scripted probe client
 */

#include "fake_probe_client.h"
#include <algorithm>
#include <cctype>

namespace test_helpers {

ProbeResult make_response(long status,
                          std::vector<std::pair<std::string, std::string>> headers,
                          std::string body,
                          std::string final_url) {
    ProbeSuccess s;
    s.status = status;
    for (auto& [name, value] : headers) {
        std::transform(name.begin(), name.end(), name.begin(),
                       [](unsigned char c) { return std::tolower(c); });
    }
    s.headers = std::move(headers);
    s.body = std::move(body);
    s.final_url = std::move(final_url);
    return s;
}

ProbeResult make_failure(FailureKind kind, const std::string& message) {
    return ProbeFailure{kind, message};
}

FakeProbeClient::FakeProbeClient()
    : fallback_(make_response(404, {}, "Not Found")) {}

void FakeProbeClient::route(const std::string& url, const ProbeResult& result) {
    routes_.insert_or_assign(url, result);
}

void FakeProbeClient::set_fallback(const ProbeResult& result) {
    fallback_ = result;
}

void FakeProbeClient::cancel_after(size_t completed_calls, CancellationSource* source) {
    cancel_after_ = completed_calls;
    cancel_source_ = source;
}

ProbeResult FakeProbeClient::fetch(const std::string& url, const FetchOptions& opts) const {
    if (opts.cancel.cancelled()) {
        return make_failure(FailureKind::CANCELLED, "audit cancelled before request");
    }

    auto it = routes_.find(url);
    ProbeResult result = (it != routes_.end()) ? it->second : fallback_;

    std::lock_guard<std::mutex> lock(mutex_);
    calls_.push_back({url, opts.follow_redirects, opts.timeout_seconds});
    if (cancel_source_ && calls_.size() >= cancel_after_) {
        cancel_source_->cancel();
    }
    return result;
}

std::vector<RecordedFetch> FakeProbeClient::calls() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return calls_;
}

size_t FakeProbeClient::call_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return calls_.size();
}

bool FakeProbeClient::was_fetched(const std::string& url, RecordedFetch* out) const {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& c : calls_) {
        if (c.url == url) {
            if (out) *out = c;
            return true;
        }
    }
    return false;
}

} // namespace test_helpers
