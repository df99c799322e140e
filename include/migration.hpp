#ifndef MIGRATION_HPP
#define MIGRATION_HPP
#include <cstddef>
#include <filesystem>
#include <functional>
#include <string>
#include <vector>

#include "mirror_transport.hpp"
#include "repo.hpp"
#include "workspace.hpp"

/**
 * @brief Immutable input of one migration batch.
 *
 * URLs are built by plain concatenation: `origin_host + name + url_suffix`.
 * Hosts therefore need their trailing separator already in place.
 */
struct MigrationConfig {
    std::string origin_host;
    std::string dest_host;
    std::vector<std::string> repos;
    bool no_push = false;
    bool clean = true;
    bool force = false;
    std::filesystem::path work_root; ///< Must be absolute
    std::string url_suffix;
};

/**
 * @brief Optional progress hooks. Empty functions are skipped.
 */
struct MigrationCallbacks {
    std::function<void(std::size_t index, std::size_t total, const std::string& repo)> on_start;
    std::function<void(const std::string& repo, MigrationStage stage)> on_stage;
    std::function<void(const RepoOutcome& outcome)> on_outcome;
};

/** Ordered outcomes of a batch, one per configured repository. */
struct BatchReport {
    std::vector<RepoOutcome> outcomes;

    std::size_t count(RepoStatus status) const;
    bool all_ok() const;
};

/** A migration as it would run, used for dry runs. */
struct PlannedMigration {
    std::string repo_name;
    std::string source_url;
    std::string dest_url;
    std::filesystem::path workspace;
};

/// Status recorded when a step failed without an exit status of its own.
constexpr int STATUS_NO_EXIT_CODE = -1;

/**
 * @brief Reject a configuration that cannot be run.
 * @throws std::invalid_argument naming the first offending field.
 */
void validate_config(const MigrationConfig& cfg);

std::string source_url_for(const MigrationConfig& cfg, const std::string& repo_name);
std::string dest_url_for(const MigrationConfig& cfg, const std::string& repo_name);

/**
 * @brief Migrate a single repository.
 *
 * Acquires a workspace, fetches the mirror, retargets it and pushes it
 * unless `no_push` is set. The workspace is released exactly once on every
 * path. Failures, including exceptions thrown by @p transport, are returned
 * in the outcome and never propagate.
 *
 * @param occurrence Number of earlier entries named @p repo_name in the
 *        batch, selecting a workspace of its own (see WorkspaceManager::path_for).
 */
RepoOutcome migrate_repo(const MigrationConfig& cfg, const std::string& repo_name,
                         MirrorTransport& transport, const WorkspaceManager& workspaces,
                         const MigrationCallbacks& callbacks = {}, std::size_t occurrence = 0);

/**
 * @brief Migrate every configured repository sequentially in input order.
 *
 * A failed repository never stops the batch. Repeated names are migrated
 * again, each in a separate workspace.
 *
 * @throws std::invalid_argument if @p cfg fails validate_config(), before
 *         any repository is touched.
 */
BatchReport run_batch(const MigrationConfig& cfg, MirrorTransport& transport,
                      const MigrationCallbacks& callbacks = {});

/** @brief List what run_batch() would do without touching anything. */
std::vector<PlannedMigration> plan_batch(const MigrationConfig& cfg);

/** @return 0 when every repository succeeded or was cloned only, 1 otherwise. */
int exit_code(const BatchReport& report);

#endif // MIGRATION_HPP
