#pragma once
#include "http_client.h"
#include "target.h"
#include <schema/audit_report.h>
#include <schema/finding.h>
#include <functional>
#include <string>
#include <vector>

// Probes a fixed list of sensitive paths on the target and flags any that
// answer 200 without a redirect. Probes run on a small fixed pool of worker
// threads; results are reported in path-list order regardless of which
// probe finished first.

struct ExposureResult {
    std::vector<Finding> findings;
    FileExposureSummary summary;
};

class FileExposureProber {
public:
    struct Options {
        int worker_limit;
        long timeout_seconds;
        long connect_timeout_seconds;

        Options()
            : worker_limit(5),
              timeout_seconds(5),
              connect_timeout_seconds(5)
        {}
    };

    // Called once per completed probe, from worker threads
    using ProbeObserver = std::function<void(const std::string& url, const ProbeResult& result)>;

    /**
     * @brief Create a prober over a fixed path list
     * @param client Client used for every probe (must be safe to call concurrently)
     * @param paths Relative paths, in reporting order
     * @param opts Concurrency and timeout settings
     */
    FileExposureProber(const ProbeClient& client,
                       std::vector<std::string> paths,
                       const Options& opts = Options());

    /**
     * @brief Probe every path without following redirects
     *
     * Exactly status 200 counts as exposed (Critical ExposedFile finding,
     * evidence = path). Other statuses and probe failures count as safe,
     * so summary.checked == summary.exposed + safe always holds. Paths not
     * yet probed when the token is cancelled are skipped and counted safe.
     *
     * @param target Base target the paths are resolved against
     * @param cancel Cancellation token for the whole audit
     * @param observer Optional per-probe callback (logging)
     * @return Findings in path-list order and the summary counters
     */
    ExposureResult run(const Target& target,
                       const CancellationToken& cancel = CancellationToken(),
                       const ProbeObserver& observer = nullptr) const;

    const std::vector<std::string>& paths() const { return paths_; }

private:
    const ProbeClient& client_;
    std::vector<std::string> paths_;
    Options opts_;
};
