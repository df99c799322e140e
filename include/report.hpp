#ifndef REPORT_HPP
#define REPORT_HPP
#include <string>
#include <nlohmann/json.hpp>
#include "migration.hpp"

/**
 * @brief Serialize a batch report.
 *
 * Layout: `{succeeded, cloned_only, failed, ok, repositories: [...]}` where
 * each repository entry carries name, status, source_url, dest_url, stage,
 * elapsed_ms and, when present, workspace, cleanup_error and error.
 */
nlohmann::json report_to_json(const BatchReport& report);

/**
 * @brief Write report_to_json() to @p path, pretty printed.
 * @return `false` with @p error set when the file cannot be written.
 */
bool write_json_report(const BatchReport& report, const std::string& path, std::string& error);

/** One console line per repository, e.g. `[ OK ] group/app Succeeded (1.2s)`. */
std::string format_outcome_line(const RepoOutcome& outcome);

/** Final console line, e.g. `3 repositories: 1 succeeded, 1 cloned only, 1 failed`. */
std::string format_summary(const BatchReport& report);

#endif // REPORT_HPP
