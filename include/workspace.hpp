#ifndef WORKSPACE_HPP
#define WORKSPACE_HPP
#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>

/**
 * @brief Directory name used for a repository's mirror.
 *
 * Characters outside `[A-Za-z0-9._-]` are replaced with `_` and the CRC-32 of
 * the raw name is appended, so `group/app` becomes `group_app-<crc>.git`
 * and never collides with a repository literally named `group_app`.
 */
std::string workspace_dir_name(const std::string& repo_name);

/**
 * @brief Allocates and releases per-repository mirror directories below a
 * single root.
 */
class WorkspaceManager {
  public:
    /**
     * @param root  Directory holding all workspaces. Created on first acquire.
     * @param clean Delete each workspace when it is released.
     * @param force Replace existing content at a workspace path instead of
     *              refusing to use it.
     */
    WorkspaceManager(std::filesystem::path root, bool clean, bool force);

    virtual ~WorkspaceManager() = default;

    /**
     * @return Path a workspace for @p repo_name would occupy.
     *
     * @p occurrence counts earlier entries with the same name in one batch.
     * Repeats get a `-<n>` suffix so no two units share a directory.
     */
    std::filesystem::path path_for(const std::string& repo_name,
                                   std::size_t occurrence = 0) const;

    /**
     * @brief Prepare an empty directory for @p repo_name.
     *
     * A non-empty existing path is left untouched unless `force` was given.
     *
     * @param repo_name  Repository name the workspace is derived from.
     * @param occurrence See path_for().
     * @param error      Receives a description of the conflict or I/O failure.
     * @return Workspace path, or `std::nullopt` on failure.
     */
    std::optional<std::filesystem::path> acquire(const std::string& repo_name,
                                                 std::size_t occurrence,
                                                 std::string& error) const;

    /**
     * @brief Release a workspace obtained from acquire().
     *
     * @param error Receives the reason when deletion was attempted and failed.
     * @return The path when the directory remains on disk, otherwise
     *         `std::nullopt`.
     */
    virtual std::optional<std::filesystem::path> release(const std::filesystem::path& workspace,
                                                         std::string& error) const;

  private:
    std::filesystem::path root_;
    bool clean_;
    bool force_;
};

/** RAII holder that pairs one acquire() with exactly one release(). */
class ScopedWorkspace {
  public:
    ScopedWorkspace(const WorkspaceManager& manager, const std::string& repo_name,
                    std::size_t occurrence = 0);
    ~ScopedWorkspace();
    ScopedWorkspace(const ScopedWorkspace&) = delete;
    ScopedWorkspace& operator=(const ScopedWorkspace&) = delete;

    bool acquired() const;
    const std::string& error() const;
    const std::filesystem::path& path() const;

    /**
     * @brief Release now instead of at scope exit. Further calls are no-ops.
     * @return Path of the retained workspace, if it was kept on disk.
     */
    std::optional<std::filesystem::path> release();

    /** @return Reason the last release() could not delete the directory. */
    const std::string& release_error() const;

  private:
    const WorkspaceManager& manager_;
    std::filesystem::path path_;
    bool held_ = false;
    std::optional<std::filesystem::path> retained_;
    std::string err_;
    std::string release_err_;
};

#endif // WORKSPACE_HPP
