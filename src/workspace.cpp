#include "workspace.hpp"
#include <cctype>
#include <cstdio>
#include <string>
#include <system_error>
#include <utility>
#include <zlib.h>

namespace fs = std::filesystem;

std::string workspace_dir_name(const std::string& repo_name) {
    std::string out;
    out.reserve(repo_name.size() + 13);
    for (char c : repo_name) {
        unsigned char uc = static_cast<unsigned char>(c);
        if (std::isalnum(uc) || c == '.' || c == '_' || c == '-')
            out += c;
        else
            out += '_';
    }
    uLong crc = crc32(0L, Z_NULL, 0);
    crc = crc32(crc, reinterpret_cast<const Bytef*>(repo_name.data()),
                static_cast<uInt>(repo_name.size()));
    char buf[16];
    std::snprintf(buf, sizeof(buf), "%08lx", static_cast<unsigned long>(crc & 0xffffffffUL));
    out += '-';
    out += buf;
    out += ".git";
    return out;
}

WorkspaceManager::WorkspaceManager(fs::path root, bool clean, bool force)
    : root_(std::move(root)), clean_(clean), force_(force) {}

fs::path WorkspaceManager::path_for(const std::string& repo_name, std::size_t occurrence) const {
    std::string dir = workspace_dir_name(repo_name);
    if (occurrence > 0)
        dir.insert(dir.size() - 4, "-" + std::to_string(occurrence + 1)); // before ".git"
    return root_ / dir;
}

std::optional<fs::path> WorkspaceManager::acquire(const std::string& repo_name,
                                                  std::size_t occurrence,
                                                  std::string& error) const {
    fs::path p = path_for(repo_name, occurrence);
    std::error_code ec;
    fs::file_status st = fs::symlink_status(p, ec);
    if (fs::exists(st)) {
        bool occupied = !fs::is_directory(st);
        if (!occupied) {
            occupied = !fs::is_empty(p, ec);
            if (ec) {
                error = "cannot inspect " + p.string() + ": " + ec.message();
                return std::nullopt;
            }
        }
        if (occupied) {
            if (!force_) {
                error = "workspace " + p.string() + " already exists and is not empty";
                return std::nullopt;
            }
            fs::remove_all(p, ec);
            if (ec) {
                error = "cannot clear " + p.string() + ": " + ec.message();
                return std::nullopt;
            }
        }
    }
    fs::create_directories(p, ec);
    if (ec) {
        error = "cannot create " + p.string() + ": " + ec.message();
        return std::nullopt;
    }
    return p;
}

std::optional<fs::path> WorkspaceManager::release(const fs::path& workspace,
                                                  std::string& error) const {
    if (!clean_)
        return workspace;
    std::error_code ec;
    fs::remove_all(workspace, ec);
    if (ec) {
        error = "cannot remove " + workspace.string() + ": " + ec.message();
        return workspace;
    }
    return std::nullopt;
}

ScopedWorkspace::ScopedWorkspace(const WorkspaceManager& manager, const std::string& repo_name,
                                 std::size_t occurrence)
    : manager_(manager) {
    auto p = manager_.acquire(repo_name, occurrence, err_);
    if (p) {
        path_ = *p;
        held_ = true;
    }
}

ScopedWorkspace::~ScopedWorkspace() { release(); }

bool ScopedWorkspace::acquired() const { return !path_.empty(); }
const std::string& ScopedWorkspace::error() const { return err_; }
const fs::path& ScopedWorkspace::path() const { return path_; }
const std::string& ScopedWorkspace::release_error() const { return release_err_; }

std::optional<fs::path> ScopedWorkspace::release() {
    if (held_) {
        held_ = false;
        retained_ = manager_.release(path_, release_err_);
    }
    return retained_;
}
