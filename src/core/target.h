#pragma once
#include <string>
#include <stdexcept>

// The audited origin, parsed once before any network activity.
// Accepts input with or without a scheme; a missing scheme means https.

class MalformedTargetError : public std::runtime_error {
public:
    explicit MalformedTargetError(const std::string& what)
        : std::runtime_error(what) {}
};

class Target {
public:
    /**
     * @brief Parse a user supplied target string
     * @param text URL such as "example.com" or "http://example.com:8080/app/"
     * @return Parsed target
     * @throws MalformedTargetError if the string cannot be parsed as an http(s) URL
     */
    static Target parse(const std::string& text);

    const std::string& url() const { return url_; }
    const std::string& scheme() const { return scheme_; }
    const std::string& host() const { return host_; }
    const std::string& port() const { return port_; }
    const std::string& path() const { return path_; }

    bool is_https() const { return scheme_ == "https"; }

    /**
     * @brief Scheme, host and explicit port, without a trailing slash
     */
    std::string origin() const;

    /**
     * @brief Resolve a relative reference against the target URL
     * @param relative Path such as ".git/config"
     * @return Absolute URL, or the origin-joined path if resolution fails
     */
    std::string resolve(const std::string& relative) const;

private:
    Target() = default;

    std::string url_;
    std::string scheme_;
    std::string host_;
    std::string port_;
    std::string path_;
};
