#pragma once
#include <schema/finding.h>
#include <schema/probe_result.h>
#include <fstream>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace logging {

// Tamper-evident record of what an audit probed and found.
//
// One JSON line per event. Every line carries the hash of the line before
// it, and the first line of a file chains from "sha256:genesis". A file may
// hold several audits back to back; each one is a run:
//
//   audit_started   target and probe settings
//   probe_completed one per request (status or failure kind, body size only)
//   finding_recorded one per finding (truncated evidence)
//   audit_finished  final state and counts
//
// Response bodies and full secret values are never written.

namespace events {
constexpr const char* kAuditStarted = "audit_started";
constexpr const char* kProbeCompleted = "probe_completed";
constexpr const char* kFindingRecorded = "finding_recorded";
constexpr const char* kAuditFinished = "audit_finished";
}

struct TrailEntry {
    std::string event;
    std::string run_id;
    std::string timestamp;
    nlohmann::json payload;
    std::string prev_hash;
    std::string entry_hash;

    nlohmann::json to_json() const;

    /**
     * @brief Parse one trail line
     * @throws nlohmann::json::exception if a field is missing or mistyped
     */
    static TrailEntry from_json(const nlohmann::json& j);
};

/**
 * Outcome of checking a trail file. On failure, line is the 1-based line
 * where checking stopped.
 */
struct TrailVerification {
    bool ok = false;
    size_t entries = 0;
    size_t runs = 0;
    size_t line = 0;
    std::string error;
};

class TrailError : public std::runtime_error {
public:
    explicit TrailError(const std::string& what)
        : std::runtime_error(what) {}
};

class AuditTrail {
public:
    /**
     * @brief Open a trail for appending, continuing any chain already in the file
     * @param log_path JSONL file, created if missing
     * @param run_id Identifier stamped on every entry of this run
     */
    AuditTrail(const std::string& log_path, const std::string& run_id);

    bool record_started(const std::string& target, size_t sensitive_paths, int worker_limit);

    bool record_probe(const std::string& url, const ProbeResult& result);

    bool record_finding(const Finding& finding);

    bool record_finished(const std::string& state, size_t findings, int checked, int exposed);

    std::string last_hash() const;

    bool is_open() const { return out_.is_open(); }

    /**
     * @brief Check hashes, chaining and run structure of a trail file
     *
     * Fails on the first unparseable line, hash mismatch, chain break,
     * event outside a run, run interleaving, or a run left without
     * audit_finished.
     */
    static TrailVerification verify(const std::string& log_path);

    /**
     * @brief Read every entry of a trail file
     * @throws TrailError if the file cannot be opened or a line does not parse
     */
    static std::vector<TrailEntry> load(const std::string& log_path);

private:
    std::string log_path_;
    std::string run_id_;
    std::string last_hash_;
    std::ofstream out_;
    mutable std::mutex mutex_;

    bool append(const std::string& event, const nlohmann::json& payload);

    static std::string hash_entry(const TrailEntry& entry);
    static std::string tail_hash(const std::string& log_path);
};

} // namespace logging
