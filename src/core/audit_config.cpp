// Audit configuration: built-in lists and file overlay

#include "audit_config.h"
#include <nlohmann/json.hpp>
#include <fstream>
#include <iostream>
#include <sstream>
#include <map>

using json = nlohmann::json;

AuditConfig AuditConfig::get_default() {
    AuditConfig c;
    c.security_headers = {
        "Strict-Transport-Security",
        "X-Frame-Options",
        "X-Content-Type-Options",
        "Content-Security-Policy",
        "X-XSS-Protection",
        "Referrer-Policy",
        "Permissions-Policy"
    };
    c.sensitive_paths = {
        ".git/config",
        ".git/HEAD",
        ".env",
        ".env.local",
        ".env.production",
        "config.php",
        "wp-config.php",
        ".htaccess",
        "phpinfo.php",
        "admin",
        "administrator",
        "wp-admin",
        "phpmyadmin",
        "backup.zip",
        "backup.sql",
        "database.sql",
        "sitemap.xml",
        ".DS_Store",
        "package.json",
        "composer.json"
    };
    c.csrf_keywords = {"csrf", "token"};
    c.comment_keywords = {"password", "key", "secret", "token", "api"};
    return c;
}

void AuditConfig::normalize() {
    if (worker_limit < 1) worker_limit = 1;
    if (worker_limit > 10) worker_limit = 10;
    if (max_redirects < 0) max_redirects = 0;
    if (inline_script_threshold < 0) inline_script_threshold = 0;
}

// Helper function to parse an integer field with a readable error
static long parse_long(const std::string& key, const std::string& value) {
    try {
        size_t used = 0;
        long v = std::stol(value, &used);
        if (used != value.size()) throw std::invalid_argument(value);
        return v;
    } catch (const std::exception&) {
        throw ConfigError("invalid integer for '" + key + "': " + value);
    }
}

// Trim whitespace and surrounding quotes
static std::string clean_scalar(std::string v) {
    v.erase(0, v.find_first_not_of(" \t"));
    v.erase(v.find_last_not_of(" \t\r") + 1);
    if (v.size() >= 2 && ((v.front() == '"' && v.back() == '"') ||
                          (v.front() == '\'' && v.back() == '\''))) {
        v = v.substr(1, v.size() - 2);
    }
    return v;
}

// Apply one scalar setting
static void apply_scalar(AuditConfig& c, const std::string& key, const std::string& value) {
    if (key == "primary_timeout_seconds") {
        c.primary_timeout_seconds = parse_long(key, value);
    } else if (key == "exposure_timeout_seconds") {
        c.exposure_timeout_seconds = parse_long(key, value);
    } else if (key == "connect_timeout_seconds") {
        c.connect_timeout_seconds = parse_long(key, value);
    } else if (key == "max_redirects") {
        c.max_redirects = parse_long(key, value);
    } else if (key == "worker_limit") {
        c.worker_limit = static_cast<int>(parse_long(key, value));
    } else if (key == "inline_script_threshold") {
        c.inline_script_threshold = static_cast<int>(parse_long(key, value));
    } else if (key == "max_emails") {
        long v = parse_long(key, value);
        if (v < 0) throw ConfigError("max_emails must not be negative");
        c.max_emails = static_cast<size_t>(v);
    } else if (key == "user_agent") {
        c.user_agent = value;
    } else if (key == "audit_log_path") {
        c.audit_log_path = value;
    } else {
        std::cerr << "Warning: unknown config key '" << key << "' ignored\n";
    }
}

// Apply one list setting
static void apply_list(AuditConfig& c, const std::string& key, const std::vector<std::string>& items) {
    if (key == "security_headers") {
        c.security_headers = items;
    } else if (key == "sensitive_paths") {
        c.sensitive_paths = items;
    } else if (key == "csrf_keywords") {
        c.csrf_keywords = items;
    } else if (key == "comment_keywords") {
        c.comment_keywords = items;
    } else {
        std::cerr << "Warning: unknown config list '" << key << "' ignored\n";
    }
}

static void overlay_json(AuditConfig& c, const json& j) {
    if (!j.is_object()) {
        throw ConfigError("configuration root must be an object");
    }
    for (auto& [key, value] : j.items()) {
        if (value.is_array()) {
            std::vector<std::string> items;
            for (const auto& item : value) {
                if (!item.is_string()) {
                    throw ConfigError("list '" + key + "' must contain strings");
                }
                items.push_back(item.get<std::string>());
            }
            apply_list(c, key, items);
        } else if (value.is_string()) {
            apply_scalar(c, key, value.get<std::string>());
        } else if (value.is_number_integer()) {
            apply_scalar(c, key, std::to_string(value.get<long>()));
        } else {
            throw ConfigError("unsupported value type for '" + key + "'");
        }
    }
}

// Flat YAML subset: "key: value" scalars and "key:" followed by "- item" lines
static void overlay_yaml(AuditConfig& c, const std::string& content) {
    std::istringstream in(content);
    std::string line;
    std::string list_key;
    std::vector<std::string> list_items;

    auto flush_list = [&]() {
        if (!list_key.empty()) {
            apply_list(c, list_key, list_items);
            list_key.clear();
            list_items.clear();
        }
    };

    while (std::getline(in, line)) {
        // Remove comments
        size_t comment_pos = line.find('#');
        if (comment_pos != std::string::npos) {
            line = line.substr(0, comment_pos);
        }

        std::string trimmed = clean_scalar(line);
        if (trimmed.empty()) continue;

        if (trimmed[0] == '-') {
            if (list_key.empty()) {
                throw ConfigError("list item outside of a list: " + trimmed);
            }
            list_items.push_back(clean_scalar(trimmed.substr(1)));
            continue;
        }

        flush_list();

        size_t colon = trimmed.find(':');
        if (colon == std::string::npos) {
            throw ConfigError("expected 'key: value', got: " + trimmed);
        }
        std::string key = clean_scalar(trimmed.substr(0, colon));
        std::string value = clean_scalar(trimmed.substr(colon + 1));
        if (value.empty()) {
            list_key = key;
        } else {
            apply_scalar(c, key, value);
        }
    }
    flush_list();
}

AuditConfig AuditConfig::load(const std::string& path) {
    AuditConfig c = get_default();

    std::ifstream in(path);
    if (!in.is_open()) {
        std::cerr << "Warning: Could not open config file " << path << ", using defaults\n";
        return c;
    }

    std::string content((std::istreambuf_iterator<char>(in)),
                        std::istreambuf_iterator<char>());

    size_t first = content.find_first_not_of(" \t\r\n");
    if (first != std::string::npos && content[first] == '{') {
        json j;
        try {
            j = json::parse(content);
        } catch (const json::parse_error& e) {
            throw ConfigError("invalid JSON in " + path + ": " + e.what());
        }
        overlay_json(c, j);
    } else {
        overlay_yaml(c, content);
    }

    if (c.primary_timeout_seconds <= 0 || c.exposure_timeout_seconds <= 0 ||
        c.connect_timeout_seconds <= 0) {
        throw ConfigError("timeouts must be positive");
    }
    if (c.security_headers.empty() && c.sensitive_paths.empty()) {
        std::cerr << "Warning: config disables both header and path checks\n";
    }

    c.normalize();
    return c;
}
