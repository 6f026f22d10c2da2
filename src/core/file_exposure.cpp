/**
 * @file file_exposure.cpp
 * @brief Sensitive file probing on a bounded worker pool
 */

#include "file_exposure.h"
#include <algorithm>
#include <atomic>
#include <optional>
#include <thread>
#include <utility>

FileExposureProber::FileExposureProber(const ProbeClient& client,
                                       std::vector<std::string> paths,
                                       const Options& opts)
    : client_(client), paths_(std::move(paths)), opts_(opts) {}

ExposureResult FileExposureProber::run(const Target& target,
                                       const CancellationToken& cancel,
                                       const ProbeObserver& observer) const {
    ExposureResult out;
    out.summary.checked = static_cast<int>(paths_.size());
    if (paths_.empty()) return out;

    FetchOptions fetch_opts;
    fetch_opts.timeout_seconds = opts_.timeout_seconds;
    fetch_opts.connect_timeout_seconds = opts_.connect_timeout_seconds;
    fetch_opts.follow_redirects = false;
    fetch_opts.max_redirects = 0;
    fetch_opts.cancel = cancel;

    // One slot per path; each worker writes only the slots it claimed
    std::vector<std::optional<ProbeResult>> results(paths_.size());
    std::vector<std::string> urls(paths_.size());
    for (size_t i = 0; i < paths_.size(); i++) {
        urls[i] = target.resolve(paths_[i]);
    }

    std::atomic<size_t> next{0};
    auto worker = [&]() {
        for (;;) {
            size_t i = next.fetch_add(1);
            if (i >= paths_.size()) return;

            if (cancel.cancelled()) {
                results[i] = ProbeResult(ProbeFailure{FailureKind::CANCELLED, "skipped: audit cancelled"});
            } else {
                results[i] = client_.fetch(urls[i], fetch_opts);
            }
            if (observer) observer(urls[i], *results[i]);
        }
    };

    size_t worker_count = static_cast<size_t>(std::max(1, opts_.worker_limit));
    worker_count = std::min(worker_count, paths_.size());

    std::vector<std::thread> threads;
    threads.reserve(worker_count);
    for (size_t w = 0; w < worker_count; w++) {
        threads.emplace_back(worker);
    }
    for (auto& t : threads) {
        t.join();
    }

    // Merge in path-list order
    for (size_t i = 0; i < paths_.size(); i++) {
        const ProbeResult& r = *results[i];
        if (r.ok() && r.success().status == 200) {
            out.summary.exposed++;
            out.findings.push_back(make_finding(
                FindingCategory::EXPOSED_FILE,
                Severity::CRITICAL,
                urls[i],
                paths_[i],
                paths_[i]
            ));
        }
    }
    return out;
}
