#ifndef MIRROR_TRANSPORT_HPP
#define MIRROR_TRANSPORT_HPP
#include <filesystem>
#include <string>
#include <utility>

/**
 * @brief Outcome of a single transport primitive.
 *
 * `status` is zero on success. Otherwise it holds the exit status of the
 * underlying git process or the libgit2 error code, and `output` holds the
 * diagnostic text captured from the failing operation.
 */
struct TransportResult {
    int status = 0;
    std::string output;

    bool ok() const { return status == 0; }
};

/**
 * @brief Remote primitives needed to replicate a repository.
 *
 * Implementations are not required to be safe for concurrent use against the
 * same mirror path.
 */
class MirrorTransport {
  public:
    virtual ~MirrorTransport() = default;

    /**
     * @brief Fetch every ref from @p source_url into a new bare mirror at @p dest.
     */
    virtual TransportResult fetch_mirror(const std::string& source_url,
                                         const std::filesystem::path& dest) = 0;

    /**
     * @brief Point the push URL of the mirror's `origin` remote at @p push_url.
     */
    virtual TransportResult retarget(const std::filesystem::path& mirror,
                                     const std::string& push_url) = 0;

    /**
     * @brief Make @p target_url an exact replica of the refs in @p mirror.
     *
     * Existing refs are force-updated and refs missing locally are deleted on
     * the destination.
     */
    virtual TransportResult push_mirror(const std::filesystem::path& mirror,
                                        const std::string& target_url) = 0;
};

/**
 * @brief Transport backed by libgit2.
 *
 * libgit2 must be initialized (see git::GitInitGuard) for the lifetime of
 * the object.
 */
class LibGit2Transport : public MirrorTransport {
  public:
    explicit LibGit2Transport(bool use_credentials = true) : use_credentials_(use_credentials) {}

    TransportResult fetch_mirror(const std::string& source_url,
                                 const std::filesystem::path& dest) override;
    TransportResult retarget(const std::filesystem::path& mirror,
                             const std::string& push_url) override;
    TransportResult push_mirror(const std::filesystem::path& mirror,
                                const std::string& target_url) override;

  private:
    bool use_credentials_;
};

/**
 * @brief Transport that runs the `git` executable in a child process.
 */
class GitCommandTransport : public MirrorTransport {
  public:
    explicit GitCommandTransport(std::string git_exe = "git") : git_exe_(std::move(git_exe)) {}

    TransportResult fetch_mirror(const std::string& source_url,
                                 const std::filesystem::path& dest) override;
    TransportResult retarget(const std::filesystem::path& mirror,
                             const std::string& push_url) override;
    TransportResult push_mirror(const std::filesystem::path& mirror,
                                const std::string& target_url) override;

  private:
    std::string git_exe_;
};

#endif // MIRROR_TRANSPORT_HPP
