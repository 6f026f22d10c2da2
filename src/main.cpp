#include "core/audit_config.h"
#include "core/auditor.h"
#include "core/cancellation.h"
#include "core/http_client.h"
#include "core/target.h"
#include "logging/audit_trail.h"
#include "budget/policy.h"
#include "report/report_writer.h"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <csignal>
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <sstream>
#include <thread>

namespace {

constexpr int kExitMalformedTarget = 3;
constexpr int kExitConfigError = 4;
constexpr int kExitUsage = 2;
constexpr int kExitInternalError = 5;

std::atomic<bool> g_interrupted{false};

void handle_sigint(int) {
    g_interrupted.store(true);
}

/**
 * @brief Generates a unique identifier for a program run based on current UTC datetime
 * @return A string representing the run identifier
 */
std::string generate_run_id() {
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    std::tm tm{};
    gmtime_r(&time_t, &tm);
    std::ostringstream oss;
    oss << "run_" << std::put_time(&tm, "%Y%m%d_%H%M%S");
    return oss.str();
}

/**
 * Cancels the audit when the deadline passes or SIGINT arrives.
 * Stops polling as soon as the audit finishes.
 */
class Watchdog {
public:
    Watchdog(CancellationSource& source, long deadline_seconds)
        : source_(source), deadline_seconds_(deadline_seconds) {
        thread_ = std::thread([this]() { loop(); });
    }

    ~Watchdog() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            done_ = true;
        }
        cv_.notify_all();
        thread_.join();
    }

private:
    void loop() {
        auto start = std::chrono::steady_clock::now();
        std::unique_lock<std::mutex> lock(mutex_);
        while (!done_) {
            cv_.wait_for(lock, std::chrono::milliseconds(100));
            if (done_) break;
            if (g_interrupted.load()) {
                std::cerr << "Interrupted, cancelling audit...\n";
                source_.cancel();
                break;
            }
            if (deadline_seconds_ > 0 &&
                std::chrono::steady_clock::now() - start >= std::chrono::seconds(deadline_seconds_)) {
                std::cerr << "Deadline of " << deadline_seconds_ << "s reached, cancelling audit...\n";
                source_.cancel();
                break;
            }
        }
    }

    CancellationSource& source_;
    long deadline_seconds_;
    std::thread thread_;
    std::mutex mutex_;
    std::condition_variable cv_;
    bool done_ = false;
};

} // namespace

/**
 * @brief Runs one audit against a target
 * @param argc Argument count from command line
 * @param argv Argument values from command line
 * @return Budget exit code (0/1/2), 3 on a malformed target, 4 on config errors
 */
int run_audit(int argc, char** argv) {
    std::string target_text;
    std::string config_path;
    std::string outfile;
    std::string log_path;
    std::string policy_path;
    long deadline = 0;

    for (int i = 2; i < argc; i++) {
        std::string a = argv[i];
        if (a == "--target" && i + 1 < argc) {
            target_text = argv[++i];
        } else if (a == "--config" && i + 1 < argc) {
            config_path = argv[++i];
        } else if (a == "--out" && i + 1 < argc) {
            outfile = argv[++i];
        } else if (a == "--log" && i + 1 < argc) {
            log_path = argv[++i];
        } else if (a == "--policy" && i + 1 < argc) {
            policy_path = argv[++i];
        } else if (a == "--deadline" && i + 1 < argc) {
            try {
                deadline = std::stol(argv[++i]);
            } catch (const std::exception&) {
                std::cerr << "Error: --deadline expects a number of seconds\n";
                return kExitUsage;
            }
        } else if (target_text.empty() && a.rfind("--", 0) != 0) {
            target_text = a;
        } else {
            std::cerr << "Error: unexpected argument " << a << "\n";
            return kExitUsage;
        }
    }

    if (target_text.empty()) {
        std::cerr << "Error: --target required\n";
        return kExitUsage;
    }

    // Input validation happens before any network activity
    std::optional<Target> target;
    try {
        target = Target::parse(target_text);
    } catch (const MalformedTargetError& e) {
        std::cerr << "Error: malformed target: " << e.what() << "\n";
        return kExitMalformedTarget;
    }

    AuditConfig config;
    budget::Policy policy;
    try {
        config = config_path.empty() ? AuditConfig::get_default() : AuditConfig::load(config_path);
        policy = policy_path.empty() ? budget::Policy::get_default() : budget::Policy::load(policy_path);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return kExitConfigError;
    }
    if (!log_path.empty()) {
        config.audit_log_path = log_path;
    }

    std::string run_id = generate_run_id();
    std::cout << "Starting audit: " << run_id << "\n";
    std::cout << "Target: " << target->url() << "\n";

    std::unique_ptr<logging::AuditTrail> trail;
    if (!config.audit_log_path.empty()) {
        std::filesystem::path parent = std::filesystem::path(config.audit_log_path).parent_path();
        if (!parent.empty()) {
            std::error_code ec;
            std::filesystem::create_directories(parent, ec);
        }
        trail = std::make_unique<logging::AuditTrail>(config.audit_log_path, run_id);
    }

    HttpClient::Options client_opts;
    client_opts.user_agent = config.user_agent;
    HttpClient client(client_opts);

    Auditor auditor(client, config, trail.get());
    auditor.set_state_observer([](AuditState state) {
        std::cout << "[" << to_string(state) << "]\n";
    });

    std::signal(SIGINT, handle_sigint);
    CancellationSource cancel;
    AuditReport report;
    {
        Watchdog watchdog(cancel, deadline);
        report = auditor.run(*target, cancel.token());
    }
    std::signal(SIGINT, SIG_DFL);

    report::render_text(report, std::cout);

    if (!outfile.empty()) {
        if (report::write_json(report, outfile)) {
            std::cout << "Report written to " << outfile << "\n";
        } else {
            std::cerr << "Warning: could not write report to " << outfile << "\n";
        }
    }

    if (trail) {
        logging::TrailVerification check = logging::AuditTrail::verify(config.audit_log_path);
        if (!check.ok) {
            std::cerr << "Warning: audit trail verification failed at line " << check.line
                      << ": " << check.error << "\n";
        }
    }

    budget::BudgetEvaluator evaluator(policy);
    auto result = evaluator.evaluate(report);
    std::cout << "Total risk points: " << result.total_score << " (warn: " << policy.warn_threshold
              << ", block: " << policy.block_threshold << ")\n";
    return result.exit_code();
}

/**
 * @brief Verifies the integrity of an audit trail file
 * @return 0 if verification succeeds, 1 if it fails, 2 if usage is incorrect
 */
int cmd_verify(int argc, char** argv) {
    if (argc < 3) {
        std::cerr << "Usage: warden verify <audit-log.jsonl>\n";
        return kExitUsage;
    }

    std::string log_path = argv[2];
    std::cout << "Verifying audit trail: " << log_path << "\n";

    logging::TrailVerification check = logging::AuditTrail::verify(log_path);
    if (check.ok) {
        std::cout << "OK: " << check.entries << " entries in " << check.runs << " run(s)\n";
        return 0;
    }
    std::cerr << "Verification failed";
    if (check.line > 0) std::cerr << " at line " << check.line;
    std::cerr << ": " << check.error << "\n";
    return 1;
}

/**
 * @brief Re-evaluates a saved JSON report against a risk policy
 * @return Exit code reflecting budget compliance, 2 for usage errors
 */
int cmd_budget(int argc, char** argv) {
    std::string policy_path;
    std::string report_path;

    for (int i = 2; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--policy" && i + 1 < argc) {
            policy_path = argv[++i];
        } else if (report_path.empty()) {
            report_path = arg;
        }
    }

    if (report_path.empty()) {
        std::cerr << "Usage: warden budget [--policy policy.json] <report.json>\n";
        return kExitUsage;
    }

    try {
        budget::Policy policy = policy_path.empty()
            ? budget::Policy::get_default()
            : budget::Policy::load(policy_path);

        budget::BudgetEvaluator evaluator(policy);
        auto result = evaluator.evaluate_file(report_path);
        budget::BudgetEvaluator::print_report(result);
        return result.exit_code();
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return kExitConfigError;
    }
}

int main(int argc, char** argv) {
    if (argc < 2) {
        std::cerr << "Usage:\n";
        std::cerr << "  warden audit --target URL [--config FILE] [--out FILE] [--log FILE]\n";
        std::cerr << "               [--policy FILE] [--deadline SECONDS]\n";
        std::cerr << "  warden verify <audit-log.jsonl>\n";
        std::cerr << "  warden budget [--policy FILE] <report.json>\n";
        return kExitUsage;
    }

    std::string command = argv[1];

    try {
        if (command == "audit") {
            return run_audit(argc, argv);
        } else if (command == "verify") {
            return cmd_verify(argc, argv);
        } else if (command == "budget") {
            return cmd_budget(argc, argv);
        }
    } catch (const std::exception& e) {
        std::cerr << "Fatal: " << e.what() << "\n";
        return kExitInternalError;
    }

    std::cerr << "Unknown command: " << command << "\n";
    return kExitUsage;
}
