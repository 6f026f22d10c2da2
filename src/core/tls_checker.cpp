// Transport security check

#include "tls_checker.h"

std::vector<Finding> TlsChecker::check(const Target& target, const ProbeResult* primary) const {
    std::vector<Finding> findings;

    if (!target.is_https()) {
        findings.push_back(make_finding(
            FindingCategory::WEAK_TLS,
            Severity::CRITICAL,
            target.url(),
            target.scheme(),
            "no transport encryption"
        ));
        return findings;
    }

    if (primary && !primary->ok() && primary->failure().kind == FailureKind::TLS_ERROR) {
        findings.push_back(make_finding(
            FindingCategory::WEAK_TLS,
            Severity::CRITICAL,
            target.url(),
            "tls handshake",
            primary->failure().message
        ));
    }
    return findings;
}
