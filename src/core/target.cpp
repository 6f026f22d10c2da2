/**
 * @file target.cpp
 * @brief Target URL parsing and relative resolution using the libcurl URL API
 */

#include "target.h"
#include <curl/curl.h>
#include <algorithm>
#include <cctype>

// Helper function to copy and free a URL part, empty if the part is absent
static std::string get_part(CURLU* h, CURLUPart part) {
    char* value = nullptr;
    if (curl_url_get(h, part, &value, 0) != CURLUE_OK || !value) {
        return "";
    }
    std::string out(value);
    curl_free(value);
    return out;
}

// Trim surrounding whitespace
static std::string trim(const std::string& s) {
    size_t a = s.find_first_not_of(" \t\r\n");
    if (a == std::string::npos) return "";
    size_t b = s.find_last_not_of(" \t\r\n");
    return s.substr(a, b - a + 1);
}

Target Target::parse(const std::string& text) {
    std::string input = trim(text);
    if (input.empty()) {
        throw MalformedTargetError("empty target");
    }

    // Default to https when no scheme was given
    if (input.find("://") == std::string::npos) {
        input = "https://" + input;
    }

    CURLU* h = curl_url();
    if (!h) {
        throw MalformedTargetError("could not allocate URL handle");
    }

    CURLUcode rc = curl_url_set(h, CURLUPART_URL, input.c_str(), 0);
    if (rc != CURLUE_OK) {
        std::string reason = curl_url_strerror(rc);
        curl_url_cleanup(h);
        throw MalformedTargetError("cannot parse '" + text + "': " + reason);
    }

    Target t;
    t.scheme_ = get_part(h, CURLUPART_SCHEME);
    t.host_ = get_part(h, CURLUPART_HOST);
    t.port_ = get_part(h, CURLUPART_PORT);
    t.path_ = get_part(h, CURLUPART_PATH);
    t.url_ = get_part(h, CURLUPART_URL);
    curl_url_cleanup(h);

    std::transform(t.scheme_.begin(), t.scheme_.end(), t.scheme_.begin(),
                   [](unsigned char c) { return std::tolower(c); });

    if (t.scheme_ != "http" && t.scheme_ != "https") {
        throw MalformedTargetError("unsupported scheme '" + t.scheme_ + "' in '" + text + "'");
    }
    if (t.host_.empty()) {
        throw MalformedTargetError("no host in '" + text + "'");
    }
    if (t.path_.empty()) {
        t.path_ = "/";
    }
    return t;
}

std::string Target::origin() const {
    std::string out = scheme_ + "://" + host_;
    if (!port_.empty()) {
        out += ":" + port_;
    }
    return out;
}

std::string Target::resolve(const std::string& relative) const {
    CURLU* h = curl_url();
    if (h) {
        // Setting a relative URL on a handle holding an absolute one resolves it
        if (curl_url_set(h, CURLUPART_URL, url_.c_str(), 0) == CURLUE_OK &&
            curl_url_set(h, CURLUPART_URL, relative.c_str(), 0) == CURLUE_OK) {
            std::string resolved = get_part(h, CURLUPART_URL);
            curl_url_cleanup(h);
            if (!resolved.empty()) return resolved;
        } else {
            curl_url_cleanup(h);
        }
    }

    std::string out = origin();
    if (relative.empty() || relative.front() != '/') out += '/';
    out += relative;
    return out;
}
