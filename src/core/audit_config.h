#pragma once
#include <string>
#include <vector>
#include <stdexcept>

// Immutable lookup lists and runtime knobs for an audit.
// Built once (defaults, optionally overlaid with a config file) and handed
// to the analyzers at construction, so tests can swap in shorter lists.

class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& what)
        : std::runtime_error(what) {}
};

struct AuditConfig {
    // Lookup lists
    std::vector<std::string> security_headers;
    std::vector<std::string> sensitive_paths;
    std::vector<std::string> csrf_keywords;
    std::vector<std::string> comment_keywords;

    // Probe settings
    long primary_timeout_seconds;
    long exposure_timeout_seconds;
    long connect_timeout_seconds;
    long max_redirects;
    int worker_limit;
    std::string user_agent;

    // HTML heuristics
    int inline_script_threshold;
    size_t max_emails;

    // Audit trail location, empty disables it
    std::string audit_log_path;

    AuditConfig()
        : primary_timeout_seconds(10),
          exposure_timeout_seconds(5),
          connect_timeout_seconds(5),
          max_redirects(5),
          worker_limit(5),
          user_agent("warden/0.1"),
          inline_script_threshold(10),
          max_emails(5)
    {}

    /**
     * @brief Built-in configuration with the standard header and path lists
     * @return Default configuration
     */
    static AuditConfig get_default();

    /**
     * @brief Load a JSON or flat YAML file and overlay it on the defaults
     *
     * Recognised keys match the field names above. List values are JSON
     * arrays, or YAML "- item" blocks under the key.
     *
     * @param path Path to the configuration file
     * @return Configuration; defaults if the file does not exist
     * @throws ConfigError if the file exists but holds invalid values
     */
    static AuditConfig load(const std::string& path);

    /**
     * @brief Clamp numeric knobs into their allowed ranges
     */
    void normalize();
};
