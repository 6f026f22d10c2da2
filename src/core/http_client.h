#pragma once
#include "cancellation.h"
#include <schema/probe_result.h>
#include <string>
#include <map>

// HTTP probing interface and its libcurl implementation.
// Every probe is a single GET; failures come back as ProbeResult values
// (connection error, timeout, TLS error, redirect loop, cancellation) and
// are never thrown.

struct FetchOptions {
    long timeout_seconds;
    long connect_timeout_seconds;
    bool follow_redirects;
    long max_redirects;
    std::map<std::string, std::string> headers;
    CancellationToken cancel;

    FetchOptions()
        : timeout_seconds(10),
          connect_timeout_seconds(5),
          follow_redirects(true),
          max_redirects(5)
    {}
};

class ProbeClient {
public:
    virtual ~ProbeClient() = default;

    /**
     * @brief Issue one GET request (plus redirect hops when enabled)
     * @param url Absolute http(s) URL
     * @param opts Timeout, redirect policy, extra headers and cancellation token
     * @return Response on any HTTP status, typed failure otherwise
     */
    virtual ProbeResult fetch(const std::string& url, const FetchOptions& opts) const = 0;
};

class HttpClient : public ProbeClient {
public:
    struct Options {
        std::string user_agent;
        bool accept_encoding;

        Options()
            : user_agent("warden/0.1"),
              accept_encoding(true)
        {}
    };

    /**
     * @brief Create an HTTP client with the given options
     * @param opts Client configuration (user agent, encoding)
     * @throws std::runtime_error if libcurl global initialisation fails
     */
    explicit HttpClient(const Options& opts = Options());

    ~HttpClient() override;

    HttpClient(const HttpClient&) = delete;
    HttpClient& operator=(const HttpClient&) = delete;

    ProbeResult fetch(const std::string& url, const FetchOptions& opts) const override;

    /**
     * @brief Map a libcurl result code to a probe failure kind
     * @param curl_code CURLcode returned by curl_easy_perform
     * @return Failure kind; anything unrecognised is a connection error
     */
    static FailureKind classify_error(int curl_code);

private:
    Options opts_;
};
