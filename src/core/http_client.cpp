/**
 * @file http_client.cpp
 * @brief Probe client using libcurl
 */

#include "http_client.h"
#include <curl/curl.h>
#include <stdexcept>
#include <string_view>
#include <algorithm>
#include <utility>
#include <vector>

/// Callback invoked by libcurl to write the received body data.
static size_t write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* s = static_cast<std::string*>(userdata);
    s->append(ptr, size * nmemb);
    return size * nmemb;
}

/// Callback invoked once per header line; keeps only the last response's headers.
static size_t header_callback(char* buffer, size_t size, size_t nitems, void* userdata) {
    size_t total = size * nitems;
    std::string_view hv(buffer, total);
    auto* headers = static_cast<std::vector<std::pair<std::string, std::string>>*>(userdata);

    // A new status line starts a new response (redirect hop)
    if (hv.rfind("HTTP/", 0) == 0) {
        headers->clear();
        return total;
    }

    auto pos = hv.find(':');
    if (pos != std::string_view::npos) {
        std::string name(hv.substr(0, pos));

        size_t val_start = pos + 1;
        while (val_start < hv.size() && (hv[val_start] == ' ' || hv[val_start] == '\t'))
            val_start++;

        size_t val_end = hv.size();
        while (val_end > val_start && (hv[val_end - 1] == '\r' || hv[val_end - 1] == '\n'))
            val_end--;
        std::string value(hv.substr(val_start, val_end - val_start));

        std::transform(name.begin(), name.end(), name.begin(), [](unsigned char c){ return std::tolower(c); });

        headers->emplace_back(std::move(name), std::move(value));
    }
    return total;
}

/// Progress callback; a non-zero return aborts the transfer.
static int xferinfo_callback(void* userdata, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    const auto* token = static_cast<const CancellationToken*>(userdata);
    return token->cancelled() ? 1 : 0;
}

static bool is_absolute_http_url(const std::string& url) {
    return url.rfind("http://", 0) == 0 || url.rfind("https://", 0) == 0;
}

/// Initialize global libcurl state.
HttpClient::HttpClient(const Options& opts) : opts_(opts) {
    CURLcode c = curl_global_init(CURL_GLOBAL_DEFAULT);
    if (c != CURLE_OK) {
        throw std::runtime_error("curl_global_init failed");
    }
}

/// Clean up global libcurl state.
HttpClient::~HttpClient() {
    curl_global_cleanup();
}

FailureKind HttpClient::classify_error(int curl_code) {
    switch (static_cast<CURLcode>(curl_code)) {
        case CURLE_OPERATION_TIMEDOUT:
            return FailureKind::TIMEOUT;
        case CURLE_TOO_MANY_REDIRECTS:
            return FailureKind::TOO_MANY_REDIRECTS;
        case CURLE_ABORTED_BY_CALLBACK:
            return FailureKind::CANCELLED;
        case CURLE_SSL_CONNECT_ERROR:
        case CURLE_PEER_FAILED_VERIFICATION:
        case CURLE_SSL_CERTPROBLEM:
        case CURLE_SSL_CIPHER:
        case CURLE_SSL_CACERT_BADFILE:
        case CURLE_SSL_ISSUER_ERROR:
        case CURLE_SSL_PINNEDPUBKEYNOTMATCH:
        case CURLE_SSL_INVALIDCERTSTATUS:
        case CURLE_SSL_CRL_BADFILE:
        case CURLE_SSL_ENGINE_NOTFOUND:
        case CURLE_SSL_ENGINE_SETFAILED:
        case CURLE_SSL_ENGINE_INITFAILED:
        case CURLE_SSL_SHUTDOWN_FAILED:
        case CURLE_USE_SSL_FAILED:
            return FailureKind::TLS_ERROR;
        default:
            return FailureKind::CONNECTION_ERROR;
    }
}

/// Execute one GET probe and normalise the outcome.
ProbeResult HttpClient::fetch(const std::string& url, const FetchOptions& opts) const {
    if (opts.cancel.cancelled()) {
        return ProbeFailure{FailureKind::CANCELLED, "audit cancelled before request"};
    }
    if (!is_absolute_http_url(url)) {
        return ProbeFailure{FailureKind::CONNECTION_ERROR, "url must be absolute: " + url};
    }
    if (opts.timeout_seconds <= 0) {
        return ProbeFailure{FailureKind::CONNECTION_ERROR, "timeout must be positive"};
    }

    CURL* curl = curl_easy_init();
    if (!curl) {
        return ProbeFailure{FailureKind::CONNECTION_ERROR, "curl_easy_init failed"};
    }

    std::string body;
    std::vector<std::pair<std::string, std::string>> resp_headers;

    // Basic configuration
    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, opts.connect_timeout_seconds);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, opts.timeout_seconds);
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, opts.follow_redirects ? 1L : 0L);
    curl_easy_setopt(curl, CURLOPT_MAXREDIRS, opts.max_redirects);

    // Response and header callbacks
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &body);
    curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, header_callback);
    curl_easy_setopt(curl, CURLOPT_HEADERDATA, &resp_headers);

    // Cancellation
    curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);
    curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, xferinfo_callback);
    curl_easy_setopt(curl, CURLOPT_XFERINFODATA, &opts.cancel);

    // Misc options
    curl_easy_setopt(curl, CURLOPT_USERAGENT, opts_.user_agent.c_str());
    curl_easy_setopt(curl, CURLOPT_VERBOSE, 0L);
    if (opts_.accept_encoding) curl_easy_setopt(curl, CURLOPT_ACCEPT_ENCODING, "");

    // Request headers
    struct curl_slist* curl_headers = nullptr;
    for (const auto& h : opts.headers) {
        std::string line = h.first + ": " + h.second;
        curl_headers = curl_slist_append(curl_headers, line.c_str());
    }
    if (curl_headers) curl_easy_setopt(curl, CURLOPT_HTTPHEADER, curl_headers);

    // Error buffer setup
    char errbuf[CURL_ERROR_SIZE] = {0};
    curl_easy_setopt(curl, CURLOPT_ERRORBUFFER, errbuf);

    CURLcode rc = curl_easy_perform(curl);

    ProbeSuccess success;
    if (rc == CURLE_OK) {
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &success.status);

        char* effective_url = nullptr;
        curl_easy_getinfo(curl, CURLINFO_EFFECTIVE_URL, &effective_url);
        success.final_url = effective_url ? effective_url : url;
        success.body = std::move(body);
        success.headers = std::move(resp_headers);
    }

    // Cleanup
    if (curl_headers) curl_slist_free_all(curl_headers);
    curl_easy_cleanup(curl);

    if (rc != CURLE_OK) {
        std::string message = errbuf[0] ? std::string(errbuf) : curl_easy_strerror(rc);
        return ProbeFailure{classify_error(rc), message};
    }
    return success;
}
