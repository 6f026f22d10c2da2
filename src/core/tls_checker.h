#pragma once
#include "target.h"
#include <schema/finding.h>
#include <schema/probe_result.h>
#include <vector>

// Transport security posture from the target scheme and the outcome of
// the primary fetch. Makes no requests of its own.

class TlsChecker {
public:
    /**
     * @brief Evaluate transport security
     * @param target Audited target; plain http is always one Critical WeakTls
     * @param primary Primary fetch outcome, or nullptr if it never ran;
     *                a TlsError failure on an https target is one Critical WeakTls
     * @return Zero or one finding
     */
    std::vector<Finding> check(const Target& target, const ProbeResult* primary) const;
};
