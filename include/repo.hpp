#ifndef REPO_HPP
#define REPO_HPP
#include <chrono>
#include <filesystem>
#include <optional>
#include <string>

/**
 * @brief Final status of a single repository migration.
 */
enum RepoStatus {
    RS_SUCCEEDED,   ///< Mirror fetched, retargeted and pushed
    RS_CLONED_ONLY, ///< Mirror fetched and retargeted, push skipped on request
    RS_FAILED       ///< A step failed; see RepoOutcome::error
};

/**
 * @brief Progress of the per-repository state machine.
 *
 * A failure is recorded together with the last stage that completed, so a
 * clone failure is reported as failed at `WorkspaceReady`.
 */
enum class MigrationStage { Init, WorkspaceReady, Fetched, Retargeted, Pushed, SkippedPush, Done };

/**
 * @brief Classification of migration failures.
 */
enum class MigrationErrorKind {
    PathConflict,   ///< Workspace path occupied and `force` not set
    CloneFailed,    ///< Mirror fetch from the source failed
    RetargetFailed, ///< Rewriting the push URL failed
    PushFailed      ///< Mirror push to the destination failed
};

/**
 * @brief Structured failure detail attached to a failed repository.
 */
struct MigrationError {
    MigrationErrorKind kind = MigrationErrorKind::CloneFailed;
    MigrationStage failed_at = MigrationStage::Init; ///< Last stage reached
    int status = 0;                                  ///< Exit status or library error code
    std::string diagnostic;                          ///< Captured output of the failing call
};

/**
 * @brief Result of migrating one repository.
 */
struct RepoOutcome {
    std::string repo_name;
    RepoStatus status = RS_FAILED;
    std::string source_url;
    std::string dest_url;
    MigrationStage stage = MigrationStage::Init;     ///< Last stage reached
    std::optional<MigrationError> error;             ///< Set iff status is RS_FAILED
    std::optional<std::filesystem::path> workspace;  ///< Set iff the mirror was left on disk
    std::string cleanup_error;                       ///< Why a clean workspace was not removed
    std::chrono::milliseconds elapsed{0};
};

const char* repo_status_name(RepoStatus status);
const char* stage_name(MigrationStage stage);
const char* error_kind_name(MigrationErrorKind kind);

/**
 * @brief One-line description of a failure, e.g.
 * `CloneFailed at WorkspaceReady (status 128): fatal: repository not found`.
 */
std::string describe_error(const MigrationError& err);

#endif // REPO_HPP
