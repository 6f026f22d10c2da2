#pragma once
#include <schema/finding.h>
#include <string>
#include <vector>

// Advisory checklist appended to every report.
// The list is static: the same 15 items in the same order whatever was found.

class RecommendationEngine {
public:
    /**
     * @brief Produce the advisory checklist for a set of findings
     * @param findings Report findings (only category presence could matter)
     * @return Fixed ordered checklist
     */
    std::vector<std::string> recommend(const std::vector<Finding>& findings) const;

    /**
     * @brief The fixed checklist
     */
    static const std::vector<std::string>& checklist();
};
