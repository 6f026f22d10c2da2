#pragma once
#include <cstddef>
#include <string>
#include <vector>
#include <utility>
#include <variant>

/**
 * @file probe_result.h
 * @brief Outcome of a single HTTP probe
 *
 * A probe either produces a response (any status code, including 4xx/5xx)
 * or a typed failure. Failures are ordinary values; nothing in the probing
 * path throws.
 */

// Pattern scans never look past this many bytes of a response body
constexpr std::size_t kMaxBodyScanBytes = 512 * 1024;

enum class FailureKind {
    CONNECTION_ERROR,
    TIMEOUT,
    TLS_ERROR,
    TOO_MANY_REDIRECTS,
    CANCELLED
};

/**
 * Response received from the target.
 * Header names are stored lower-cased, in arrival order.
 */
struct ProbeSuccess {
    long status = 0;
    std::vector<std::pair<std::string, std::string>> headers;
    std::string body;
    std::string final_url;
};

struct ProbeFailure {
    FailureKind kind = FailureKind::CONNECTION_ERROR;
    std::string message;
};

class ProbeResult {
public:
    ProbeResult(ProbeSuccess success) : value_(std::move(success)) {}
    ProbeResult(ProbeFailure failure) : value_(std::move(failure)) {}

    bool ok() const { return std::holds_alternative<ProbeSuccess>(value_); }

    /**
     * @brief Access the response; only valid when ok() is true
     * @throws std::bad_variant_access otherwise
     */
    const ProbeSuccess& success() const { return std::get<ProbeSuccess>(value_); }

    /**
     * @brief Access the failure; only valid when ok() is false
     * @throws std::bad_variant_access otherwise
     */
    const ProbeFailure& failure() const { return std::get<ProbeFailure>(value_); }

    /**
     * @brief Case-insensitive lookup of the first header with this name
     * @param name Header name in any case
     * @return Pointer to the value, or nullptr if absent or not a success
     */
    const std::string* header(const std::string& name) const;

    /**
     * @brief All values of a header, in arrival order
     */
    std::vector<std::string> header_values(const std::string& name) const;

private:
    std::variant<ProbeSuccess, ProbeFailure> value_;
};

/**
 * @brief Stable name of a failure kind ("ConnectionError", "Timeout", ...)
 */
std::string to_string(FailureKind kind);
