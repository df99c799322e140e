#include "repo.hpp"

const char* repo_status_name(RepoStatus status) {
    switch (status) {
    case RS_SUCCEEDED:
        return "Succeeded";
    case RS_CLONED_ONLY:
        return "ClonedOnly";
    case RS_FAILED:
        return "Failed";
    }
    return "Unknown";
}

const char* stage_name(MigrationStage stage) {
    switch (stage) {
    case MigrationStage::Init:
        return "Init";
    case MigrationStage::WorkspaceReady:
        return "WorkspaceReady";
    case MigrationStage::Fetched:
        return "Fetched";
    case MigrationStage::Retargeted:
        return "Retargeted";
    case MigrationStage::Pushed:
        return "Pushed";
    case MigrationStage::SkippedPush:
        return "SkippedPush";
    case MigrationStage::Done:
        return "Done";
    }
    return "Unknown";
}

const char* error_kind_name(MigrationErrorKind kind) {
    switch (kind) {
    case MigrationErrorKind::PathConflict:
        return "PathConflict";
    case MigrationErrorKind::CloneFailed:
        return "CloneFailed";
    case MigrationErrorKind::RetargetFailed:
        return "RetargetFailed";
    case MigrationErrorKind::PushFailed:
        return "PushFailed";
    }
    return "Unknown";
}

std::string describe_error(const MigrationError& err) {
    std::string out = error_kind_name(err.kind);
    out += " at ";
    out += stage_name(err.failed_at);
    out += " (status " + std::to_string(err.status) + ")";
    if (!err.diagnostic.empty())
        out += ": " + err.diagnostic;
    return out;
}
