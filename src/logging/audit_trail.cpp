/**
 * @file audit_trail.cpp
 * @brief Hash-chained JSONL audit trail
 */

#include "audit_trail.h"
#include <openssl/evp.h>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace logging {

using json = nlohmann::json;

static const char* const kGenesisHash = "sha256:genesis";

/// Current UTC time, millisecond precision.
static std::string utc_now() {
    auto now = std::chrono::system_clock::now();
    auto t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;
    std::tm tm{};
    gmtime_r(&t, &tm);
    std::ostringstream ss;
    ss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S") << '.'
       << std::setw(3) << std::setfill('0') << ms.count() << 'Z';
    return ss.str();
}

/// Hash string using sha256.
static std::string sha256_hex(const std::string& data) {
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digest_len = 0;
    EVP_MD_CTX* ctx = EVP_MD_CTX_new();
    EVP_DigestInit_ex(ctx, EVP_sha256(), nullptr);
    EVP_DigestUpdate(ctx, data.data(), data.size());
    EVP_DigestFinal_ex(ctx, digest, &digest_len);
    EVP_MD_CTX_free(ctx);

    std::ostringstream ss;
    ss << "sha256:" << std::hex << std::setfill('0');
    for (unsigned int i = 0; i < digest_len; i++) {
        ss << std::setw(2) << static_cast<int>(digest[i]);
    }
    return ss.str();
}

/// Serialize without throwing on bytes that are not UTF-8.
static std::string dump_lenient(const json& j) {
    return j.dump(-1, ' ', false, json::error_handler_t::replace);
}

json TrailEntry::to_json() const {
    return json{
        {"event", event},
        {"run_id", run_id},
        {"timestamp", timestamp},
        {"payload", payload},
        {"prev_hash", prev_hash},
        {"entry_hash", entry_hash}
    };
}

TrailEntry TrailEntry::from_json(const json& j) {
    TrailEntry e;
    e.event = j.at("event").get<std::string>();
    e.run_id = j.at("run_id").get<std::string>();
    e.timestamp = j.at("timestamp").get<std::string>();
    e.payload = j.at("payload");
    e.prev_hash = j.at("prev_hash").get<std::string>();
    e.entry_hash = j.at("entry_hash").get<std::string>();
    return e;
}

// Fields are joined with a separator that cannot occur in the JSON payload
// dump, so moving text between fields changes the hash.
std::string AuditTrail::hash_entry(const TrailEntry& entry) {
    std::string data;
    for (const std::string* field : {&entry.prev_hash, &entry.run_id, &entry.event, &entry.timestamp}) {
        data += *field;
        data += '\n';
    }
    data += dump_lenient(entry.payload);
    return sha256_hex(data);
}

std::string AuditTrail::tail_hash(const std::string& log_path) {
    std::ifstream in(log_path);
    std::string line;
    std::string last;
    while (std::getline(in, line)) {
        if (!line.empty()) last = line;
    }
    if (last.empty()) return "";

    try {
        return TrailEntry::from_json(json::parse(last)).entry_hash;
    } catch (const json::exception& e) {
        std::cerr << "Warning: last entry of " << log_path << " is unreadable (" << e.what()
                  << "); the trail will not verify\n";
        return "";
    }
}

AuditTrail::AuditTrail(const std::string& log_path, const std::string& run_id)
    : log_path_(log_path), run_id_(run_id), last_hash_(tail_hash(log_path)) {
    out_.open(log_path_, std::ios::app);
    if (!out_.is_open()) {
        std::cerr << "Warning: could not open audit trail " << log_path_ << "\n";
    }
}

bool AuditTrail::append(const std::string& event, const json& payload) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!out_.is_open()) {
        return false;
    }

    TrailEntry entry;
    entry.event = event;
    entry.run_id = run_id_;
    entry.timestamp = utc_now();
    // Round-trip so stored and hashed payloads are the same valid UTF-8
    entry.payload = json::parse(dump_lenient(payload));
    entry.prev_hash = last_hash_.empty() ? kGenesisHash : last_hash_;
    entry.entry_hash = hash_entry(entry);

    out_ << dump_lenient(entry.to_json()) << '\n';
    out_.flush();
    if (!out_.good()) {
        return false;
    }
    last_hash_ = entry.entry_hash;
    return true;
}

bool AuditTrail::record_started(const std::string& target, size_t sensitive_paths, int worker_limit) {
    return append(events::kAuditStarted, {
        {"target", target},
        {"sensitive_paths", sensitive_paths},
        {"worker_limit", worker_limit}
    });
}

bool AuditTrail::record_probe(const std::string& url, const ProbeResult& result) {
    json payload{{"url", url}};
    if (result.ok()) {
        payload["status"] = result.success().status;
        payload["final_url"] = result.success().final_url;
        payload["body_bytes"] = result.success().body.size();
    } else {
        payload["failure"] = to_string(result.failure().kind);
        payload["message"] = result.failure().message;
    }
    return append(events::kProbeCompleted, payload);
}

bool AuditTrail::record_finding(const Finding& finding) {
    return append(events::kFindingRecorded, {
        {"id", finding.id},
        {"url", finding.url},
        {"category", to_string(finding.category)},
        {"severity", to_string(finding.severity)},
        {"target_detail", finding.target_detail},
        {"evidence", finding.evidence}
    });
}

bool AuditTrail::record_finished(const std::string& state, size_t findings, int checked, int exposed) {
    return append(events::kAuditFinished, {
        {"state", state},
        {"findings", findings},
        {"checked", checked},
        {"exposed", exposed}
    });
}

std::string AuditTrail::last_hash() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_hash_;
}

std::vector<TrailEntry> AuditTrail::load(const std::string& log_path) {
    std::ifstream in(log_path);
    if (!in.is_open()) {
        throw TrailError("cannot open audit trail " + log_path);
    }

    std::vector<TrailEntry> entries;
    std::string line;
    size_t line_no = 0;
    while (std::getline(in, line)) {
        line_no++;
        try {
            entries.push_back(TrailEntry::from_json(json::parse(line)));
        } catch (const json::exception& e) {
            throw TrailError(log_path + ":" + std::to_string(line_no) + ": " + e.what());
        }
    }
    return entries;
}

TrailVerification AuditTrail::verify(const std::string& log_path) {
    TrailVerification result;

    std::ifstream in(log_path);
    if (!in.is_open()) {
        result.error = "cannot open " + log_path;
        return result;
    }

    auto fail = [&result](size_t line, const std::string& error) {
        result.line = line;
        result.error = error;
        return result;
    };

    std::string expected_prev = kGenesisHash;
    std::string open_run;   // Run that has started but not finished
    std::string line;
    size_t line_no = 0;

    while (std::getline(in, line)) {
        line_no++;

        TrailEntry entry;
        try {
            entry = TrailEntry::from_json(json::parse(line));
        } catch (const json::exception& e) {
            return fail(line_no, std::string("unparseable entry: ") + e.what());
        }

        if (entry.prev_hash != expected_prev) {
            return fail(line_no, line_no == 1 ? "first entry does not chain from genesis"
                                              : "chain break: prev_hash does not match previous entry");
        }
        if (hash_entry(entry) != entry.entry_hash) {
            return fail(line_no, "hash mismatch: entry was modified");
        }

        if (open_run.empty()) {
            if (entry.event != events::kAuditStarted) {
                return fail(line_no, "'" + entry.event + "' outside of a run");
            }
            open_run = entry.run_id;
            result.runs++;
        } else if (entry.run_id != open_run) {
            return fail(line_no, "run " + open_run + " has no audit_finished before run " + entry.run_id);
        } else if (entry.event == events::kAuditStarted) {
            return fail(line_no, "run " + open_run + " started twice");
        } else if (entry.event == events::kAuditFinished) {
            open_run.clear();
        }

        expected_prev = entry.entry_hash;
        result.entries++;
    }

    if (!open_run.empty()) {
        return fail(line_no, "run " + open_run + " has no audit_finished");
    }

    result.ok = true;
    return result;
}

} // namespace logging
