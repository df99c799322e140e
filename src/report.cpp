#include "report.hpp"
#include <fstream>
#include "time_utils.hpp"

static nlohmann::json outcome_to_json(const RepoOutcome& o) {
    nlohmann::json j{{"name", o.repo_name},
                     {"status", repo_status_name(o.status)},
                     {"source_url", o.source_url},
                     {"dest_url", o.dest_url},
                     {"stage", stage_name(o.stage)},
                     {"elapsed_ms", o.elapsed.count()}};
    if (o.workspace)
        j["workspace"] = o.workspace->string();
    if (!o.cleanup_error.empty())
        j["cleanup_error"] = o.cleanup_error;
    if (o.error) {
        j["error"] = {{"kind", error_kind_name(o.error->kind)},
                      {"stage", stage_name(o.error->failed_at)},
                      {"status", o.error->status},
                      {"diagnostic", o.error->diagnostic}};
    }
    return j;
}

nlohmann::json report_to_json(const BatchReport& report) {
    nlohmann::json repos = nlohmann::json::array();
    for (const auto& o : report.outcomes)
        repos.push_back(outcome_to_json(o));
    return {{"succeeded", report.count(RS_SUCCEEDED)},
            {"cloned_only", report.count(RS_CLONED_ONLY)},
            {"failed", report.count(RS_FAILED)},
            {"ok", report.all_ok()},
            {"repositories", repos}};
}

bool write_json_report(const BatchReport& report, const std::string& path, std::string& error) {
    std::ofstream ofs(path, std::ios::trunc);
    if (!ofs) {
        error = "cannot open " + path;
        return false;
    }
    // git diagnostics are not guaranteed to be valid UTF-8
    ofs << report_to_json(report).dump(2, ' ', false, nlohmann::json::error_handler_t::replace)
        << '\n';
    ofs.flush();
    if (!ofs) {
        error = "failed writing " + path;
        return false;
    }
    return true;
}

std::string format_outcome_line(const RepoOutcome& o) {
    std::string line = o.status == RS_FAILED ? "[FAIL] " : "[ OK ] ";
    line += o.repo_name;
    line += " ";
    line += repo_status_name(o.status);
    line += " (" + format_elapsed(o.elapsed) + ")";
    if (o.error)
        line += ": " + describe_error(*o.error);
    if (o.workspace)
        line += " [kept " + o.workspace->string() + "]";
    if (!o.cleanup_error.empty())
        line += " [cleanup failed: " + o.cleanup_error + "]";
    return line;
}

std::string format_summary(const BatchReport& report) {
    size_t total = report.outcomes.size();
    std::string out = std::to_string(total) + (total == 1 ? " repository: " : " repositories: ");
    out += std::to_string(report.count(RS_SUCCEEDED)) + " succeeded, ";
    out += std::to_string(report.count(RS_CLONED_ONLY)) + " cloned only, ";
    out += std::to_string(report.count(RS_FAILED)) + " failed";
    return out;
}
