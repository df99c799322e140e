#ifndef GIT_UTILS_HPP
#define GIT_UTILS_HPP

#include <git2.h>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace git {
namespace fs = std::filesystem;

/**
 * @brief RAII helper managing global libgit2 initialization.
 *
 * Instantiate once for the lifetime of the application to ensure all libgit2
 * operations are performed after initialization and before shutdown.
 */
struct GitInitGuard {
    GitInitGuard();  ///< Calls `git_libgit2_init()`
    ~GitInitGuard(); ///< Calls `git_libgit2_shutdown()`
};

/**
 * @brief Configure the network timeout applied to libgit2 transfers.
 *
 * @param seconds Timeout in seconds, `0` keeps the library default.
 */
void set_libgit_timeout(unsigned int seconds);

/**
 * @brief Route clone and push traffic through a proxy.
 *
 * @param url Proxy URL, or an empty string to use the git configuration.
 */
void set_proxy(const std::string& url);

// RAII wrappers for libgit2 resources
template <typename T, void (*Free)(T*)> struct GitHandle {
    T* h;
    explicit GitHandle(T* h_ = nullptr) : h(h_) {}
    ~GitHandle() {
        if (h)
            Free(h);
    }
    GitHandle(const GitHandle&) = delete;
    GitHandle& operator=(const GitHandle&) = delete;
    T* get() const { return h; }
};

using repo_ptr = GitHandle<git_repository, git_repository_free>;
using remote_ptr = GitHandle<git_remote, git_remote_free>;
using reference_ptr = GitHandle<git_reference, git_reference_free>;
using ref_iter_ptr = GitHandle<git_reference_iterator, git_reference_iterator_free>;
using config_ptr = GitHandle<git_config, git_config_free>;

/// Ref name to hexadecimal object id.
using RefMap = std::map<std::string, std::string>;

// The utility functions below assume libgit2 is already initialized.

/**
 * @brief Check whether @a p holds a bare repository.
 */
bool is_bare_repo(const fs::path& p);

/**
 * @brief Create a bare mirror clone of @a url at @a dest.
 *
 * The `origin` remote receives the fetch refspec `+refs/*:refs/*` and
 * `remote.origin.mirror = true`, matching `git clone --mirror`.
 *
 * @param dest            Empty or missing directory receiving the mirror.
 * @param url             Source repository URL.
 * @param use_credentials Install the credential callback.
 * @param error           Optional output string receiving a libgit2 error message.
 * @return `0` on success or a negative libgit2 error code.
 */
int mirror_clone(const fs::path& dest, const std::string& url, bool use_credentials = true,
                 std::string* error = nullptr);

/**
 * @brief Set the push URL of @a remote without touching its fetch URL.
 *
 * @return `0` on success or a negative libgit2 error code.
 */
int set_push_url(const fs::path& repo, const std::string& remote, const std::string& url,
                 std::string* error = nullptr);

/**
 * @brief Read the push URL configured for @a remote.
 *
 * @return Push URL or `std::nullopt` when none is set or the lookup fails.
 */
std::optional<std::string> get_push_url(const fs::path& repo, const std::string& remote,
                                        std::string* error = nullptr);

/**
 * @brief Enumerate all direct refs of a repository, excluding `HEAD`.
 *
 * Symbolic refs are resolved to the object they point at.
 */
std::optional<RefMap> list_refs(const fs::path& repo, std::string* error = nullptr);

/**
 * @brief Compute the refspecs needed to turn @a remote_refs into @a local_refs.
 *
 * Every local ref is force-pushed and every remote ref that no longer exists
 * locally is deleted. Peeled tag entries (`^{}`) and `HEAD` are ignored.
 */
std::vector<std::string> mirror_refspecs(const RefMap& local_refs, const RefMap& remote_refs);

/**
 * @brief Push every ref of @a repo to @a url, pruning stale remote refs.
 *
 * The push goes through @a remote when its push URL equals @a url and
 * through an anonymous remote otherwise. A ref rejected by the server counts
 * as a failure.
 *
 * @return `0` on success or a negative libgit2 error code.
 */
int mirror_push(const fs::path& repo, const std::string& remote, const std::string& url,
                bool use_credentials = true, std::string* error = nullptr);

} // namespace git

#endif // GIT_UTILS_HPP
