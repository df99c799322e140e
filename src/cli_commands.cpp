#include <iostream>
#include <map>
#include <string>

#include "cli_commands.hpp"
#include "logger.hpp"
#include "report.hpp"
#include "time_utils.hpp"

namespace cli {

void setup_logging(const Options& opts) {
    if (opts.logging.log_file.empty())
        return;
    set_json_logging(opts.logging.json_log);
    set_log_compression(opts.logging.compress_logs);
    if (!init_logger(opts.logging.log_file, opts.logging.log_level, opts.logging.max_log_size,
                     opts.logging.max_log_files))
        std::cerr << "Continuing without a log file\n";
}

std::optional<int> handle_dry_run(const Options& opts, std::ostream& out) {
    if (!opts.dry_run)
        return std::nullopt;
    MigrationConfig cfg = build_config(opts);
    auto plan = plan_batch(cfg);
    if (opts.silent)
        return 0;
    out << "Dry run: " << plan.size() << (plan.size() == 1 ? " repository" : " repositories")
        << (cfg.no_push ? ", push disabled" : "") << "\n";
    for (const auto& p : plan) {
        out << "  " << p.repo_name << "\n";
        out << "    clone  " << p.source_url << "\n";
        out << "    into   " << p.workspace.string() << (cfg.clean ? "" : " (kept)") << "\n";
        out << "    " << (cfg.no_push ? "target " : "push   ") << p.dest_url << "\n";
    }
    return 0;
}

std::unique_ptr<MirrorTransport> make_transport(const Options& opts) {
    if (opts.git_cli)
        return std::make_unique<GitCommandTransport>();
    return std::make_unique<LibGit2Transport>();
}

int run_migration(const Options& opts, MirrorTransport& transport, std::ostream& out) {
    MigrationConfig cfg = build_config(opts);
    const bool quiet = opts.silent;

    MigrationCallbacks cb;
    cb.on_start = [&](std::size_t index, std::size_t total, const std::string& repo) {
        log_info("Migrating repository",
                 {{"repo", repo}, {"index", std::to_string(index + 1) + "/" + std::to_string(total)}});
        if (!quiet)
            out << "(" << index + 1 << "/" << total << ") " << repo << "\n";
    };
    cb.on_stage = [&](const std::string& repo, MigrationStage stage) {
        log_debug("Stage reached", {{"repo", repo}, {"stage", stage_name(stage)}});
        if (!quiet)
            out << "  -> " << stage_name(stage) << "\n";
    };
    cb.on_outcome = [&](const RepoOutcome& o) {
        std::map<std::string, std::string> fields{{"repo", o.repo_name},
                                                  {"status", repo_status_name(o.status)},
                                                  {"elapsed", format_elapsed(o.elapsed)}};
        if (o.workspace)
            fields["workspace"] = o.workspace->string();
        if (!o.cleanup_error.empty())
            log_warning("Workspace not removed: " + o.cleanup_error, {{"repo", o.repo_name}});
        if (o.error) {
            fields["kind"] = error_kind_name(o.error->kind);
            fields["stage"] = stage_name(o.error->failed_at);
            fields["status_code"] = std::to_string(o.error->status);
            log_error("Repository migration failed: " + o.error->diagnostic, fields);
        } else {
            log_info("Repository migrated", fields);
        }
        if (!quiet)
            out << format_outcome_line(o) << "\n";
    };

    log_info("Starting migration", {{"repos", std::to_string(cfg.repos.size())},
                                    {"origin", cfg.origin_host},
                                    {"dest", cfg.dest_host},
                                    {"work_root", cfg.work_root.string()},
                                    {"push", cfg.no_push ? "no" : "yes"}});
    BatchReport report = run_batch(cfg, transport, cb);
    std::string summary = format_summary(report);
    log_info("Migration finished: " + summary);
    if (!quiet)
        out << summary << "\n";

    int rc = exit_code(report);
    if (!opts.report_json.empty()) {
        std::string err;
        if (!write_json_report(report, opts.report_json, err)) {
            log_error("Failed to write report: " + err);
            std::cerr << "Failed to write report: " << err << "\n";
            rc = 1;
        }
    }
    return rc;
}

int handle_migration_run(const Options& opts) {
    auto transport = make_transport(opts);
    return run_migration(opts, *transport, std::cout);
}

} // namespace cli
