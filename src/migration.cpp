#include "migration.hpp"
#include <chrono>
#include <exception>
#include <map>
#include <optional>
#include <stdexcept>
#include <utility>

namespace {

// Error kind for a failure that happened after reaching `stage`.
MigrationErrorKind failure_kind(MigrationStage stage) {
    switch (stage) {
    case MigrationStage::Init:
        return MigrationErrorKind::PathConflict;
    case MigrationStage::WorkspaceReady:
        return MigrationErrorKind::CloneFailed;
    case MigrationStage::Fetched:
        return MigrationErrorKind::RetargetFailed;
    default:
        return MigrationErrorKind::PushFailed;
    }
}

class MigrationRun {
  public:
    MigrationRun(const MigrationConfig& cfg, const std::string& name,
                 const MigrationCallbacks& cb)
        : cb_(cb) {
        out_.repo_name = name;
        out_.source_url = source_url_for(cfg, name);
        out_.dest_url = dest_url_for(cfg, name);
    }

    void advance(MigrationStage stage) {
        out_.stage = stage;
        if (cb_.on_stage)
            cb_.on_stage(out_.repo_name, stage);
    }

    void fail(int status, std::string diagnostic) {
        MigrationError err;
        err.kind = failure_kind(out_.stage);
        err.failed_at = out_.stage;
        err.status = status;
        err.diagnostic = std::move(diagnostic);
        out_.status = RS_FAILED;
        out_.error = std::move(err);
    }

    /** Record a failed transport result. @return true when @p res succeeded. */
    bool check(const TransportResult& res) {
        if (res.ok())
            return true;
        fail(res.status, res.output);
        return false;
    }

    RepoOutcome& outcome() { return out_; }

  private:
    const MigrationCallbacks& cb_;
    RepoOutcome out_;
};

} // namespace

std::size_t BatchReport::count(RepoStatus status) const {
    std::size_t n = 0;
    for (const auto& o : outcomes)
        if (o.status == status)
            ++n;
    return n;
}

bool BatchReport::all_ok() const { return count(RS_FAILED) == 0; }

void validate_config(const MigrationConfig& cfg) {
    if (cfg.origin_host.empty())
        throw std::invalid_argument("origin host is empty");
    if (cfg.dest_host.empty())
        throw std::invalid_argument("destination host is empty");
    if (cfg.repos.empty())
        throw std::invalid_argument("no repositories given");
    for (std::size_t i = 0; i < cfg.repos.size(); ++i) {
        if (cfg.repos[i].empty())
            throw std::invalid_argument("repository name #" + std::to_string(i + 1) +
                                        " is empty");
    }
    if (cfg.work_root.empty())
        throw std::invalid_argument("work root is empty");
    if (!cfg.work_root.is_absolute())
        throw std::invalid_argument("work root must be absolute: " + cfg.work_root.string());
}

std::string source_url_for(const MigrationConfig& cfg, const std::string& repo_name) {
    return cfg.origin_host + repo_name + cfg.url_suffix;
}

std::string dest_url_for(const MigrationConfig& cfg, const std::string& repo_name) {
    return cfg.dest_host + repo_name + cfg.url_suffix;
}

RepoOutcome migrate_repo(const MigrationConfig& cfg, const std::string& repo_name,
                         MirrorTransport& transport, const WorkspaceManager& workspaces,
                         const MigrationCallbacks& callbacks, std::size_t occurrence) {
    auto start = std::chrono::steady_clock::now();
    MigrationRun run(cfg, repo_name, callbacks);
    RepoOutcome& out = run.outcome();

    ScopedWorkspace ws(workspaces, repo_name, occurrence);
    if (!ws.acquired()) {
        run.fail(STATUS_NO_EXIT_CODE, ws.error());
    } else {
        try {
            run.advance(MigrationStage::WorkspaceReady);
            if (run.check(transport.fetch_mirror(out.source_url, ws.path()))) {
                run.advance(MigrationStage::Fetched);
                if (run.check(transport.retarget(ws.path(), out.dest_url))) {
                    run.advance(MigrationStage::Retargeted);
                    if (cfg.no_push) {
                        run.advance(MigrationStage::SkippedPush);
                        out.status = RS_CLONED_ONLY;
                    } else if (run.check(transport.push_mirror(ws.path(), out.dest_url))) {
                        run.advance(MigrationStage::Pushed);
                        out.status = RS_SUCCEEDED;
                    }
                }
            }
            out.workspace = ws.release();
            out.cleanup_error = ws.release_error();
            if (out.status != RS_FAILED)
                run.advance(MigrationStage::Done);
        } catch (const std::exception& e) {
            run.fail(STATUS_NO_EXIT_CODE, e.what());
            out.workspace = ws.release();
            out.cleanup_error = ws.release_error();
        }
    }

    out.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);
    return out;
}

BatchReport run_batch(const MigrationConfig& cfg, MirrorTransport& transport,
                      const MigrationCallbacks& callbacks) {
    validate_config(cfg);
    WorkspaceManager workspaces(cfg.work_root, cfg.clean, cfg.force);
    BatchReport report;
    report.outcomes.reserve(cfg.repos.size());
    std::map<std::string, std::size_t> seen;
    for (std::size_t i = 0; i < cfg.repos.size(); ++i) {
        const std::string& name = cfg.repos[i];
        if (callbacks.on_start)
            callbacks.on_start(i, cfg.repos.size(), name);
        report.outcomes.push_back(
            migrate_repo(cfg, name, transport, workspaces, callbacks, seen[name]++));
        if (callbacks.on_outcome)
            callbacks.on_outcome(report.outcomes.back());
    }
    return report;
}

std::vector<PlannedMigration> plan_batch(const MigrationConfig& cfg) {
    validate_config(cfg);
    WorkspaceManager workspaces(cfg.work_root, cfg.clean, cfg.force);
    std::vector<PlannedMigration> plan;
    plan.reserve(cfg.repos.size());
    std::map<std::string, std::size_t> seen;
    for (const auto& name : cfg.repos) {
        PlannedMigration p;
        p.repo_name = name;
        p.source_url = source_url_for(cfg, name);
        p.dest_url = dest_url_for(cfg, name);
        p.workspace = workspaces.path_for(name, seen[name]++);
        plan.push_back(std::move(p));
    }
    return plan;
}

int exit_code(const BatchReport& report) { return report.all_ok() ? 0 : 1; }
