#pragma once
#include <schema/audit_report.h>
#include <nlohmann/json.hpp>
#include <ostream>
#include <string>

namespace report {

/**
 * @brief Serialize a report to the structured JSON schema
 *
 * Top-level keys: target, timestamp, finished_at, state, primary, findings
 * (id, url, category, severity, target_detail, evidence),
 * file_exposure_summary (checked, exposed), narrative, recommendations.
 */
nlohmann::json to_json(const AuditReport& report);

/**
 * @brief Rebuild a report from its JSON form
 * @throws nlohmann::json::exception on missing or mistyped fields
 * @throws std::invalid_argument on unknown category or severity names
 */
AuditReport from_json(const nlohmann::json& j);

/**
 * @brief Print the human-readable report
 */
void render_text(const AuditReport& report, std::ostream& out);

/**
 * @brief Write the JSON report to a file
 * @return true if the file was written
 */
bool write_json(const AuditReport& report, const std::string& path);

} // namespace report
