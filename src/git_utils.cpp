#include "git_utils.hpp"
#include <cstdlib>
#include <string>
#include <vector>

using namespace std;

namespace git {

static unsigned int g_libgit_timeout = 0;
static std::string g_proxy_url; // NOLINT(runtime/string)

/**
 * @brief Push the stored timeout into the libgit2 global options.
 *
 * Server timeouts are only configurable from libgit2 1.7 on; older versions
 * keep their built-in defaults.
 */
static void apply_libgit_timeout() {
#if LIBGIT2_VER_MAJOR > 1 || (LIBGIT2_VER_MAJOR == 1 && LIBGIT2_VER_MINOR >= 7)
    if (g_libgit_timeout > 0) {
        int ms = static_cast<int>(g_libgit_timeout) * 1000;
        git_libgit2_opts(GIT_OPT_SET_SERVER_CONNECT_TIMEOUT, ms);
        git_libgit2_opts(GIT_OPT_SET_SERVER_TIMEOUT, ms);
    }
#endif
}

/**
 * @brief Configure the global libgit2 network timeout.
 *
 * @param seconds Timeout value in seconds.
 */
void set_libgit_timeout(unsigned int seconds) {
    g_libgit_timeout = seconds;
    apply_libgit_timeout();
}

void set_proxy(const std::string& url) { g_proxy_url = url; }

static void fill_proxy_options(git_proxy_options& proxy) {
    if (g_proxy_url.empty()) {
        proxy.type = GIT_PROXY_AUTO; // honour http.proxy from git config
        return;
    }
    proxy.type = GIT_PROXY_SPECIFIED;
    proxy.url = g_proxy_url.c_str();
}

static std::optional<std::string> safe_getenv(const char* name) {
#ifdef _WIN32
    char* buf = nullptr;
    size_t len = 0;
    if (_dupenv_s(&buf, &len, name) == 0 && buf) {
        std::string v(buf);
        free(buf);
        return v;
    }
    return std::nullopt;
#else
    const char* v = std::getenv(name);
    if (v)
        return std::string(v);
    return std::nullopt;
#endif
}

/**
 * @brief libgit2 credential callback delegating to the ambient credential layer.
 *
 * Credentials are chosen in the following order:
 *  1. Username only, when the server asks for it.
 *  2. SSH agent.
 *  3. Username/password from `GIT_USERNAME`/`GIT_PASSWORD`.
 *  4. Default platform credentials (NTLM/Negotiate).
 *
 * Anything else falls through to libgit2's behaviour without a callback.
 */
int credential_cb(git_credential** out, const char* url, const char* username_from_url,
                  unsigned int allowed_types, void* payload) {
    (void)url;
    (void)payload;
    auto env_user = safe_getenv("GIT_USERNAME");
    auto env_pass = safe_getenv("GIT_PASSWORD");
    const char* user = username_from_url ? username_from_url
                                         : (env_user ? env_user->c_str() : nullptr);
    if ((allowed_types & GIT_CREDENTIAL_USERNAME) && user) {
        if (git_credential_username_new(out, user) == 0)
            return 0;
    }
    if ((allowed_types & GIT_CREDENTIAL_SSH_KEY) && user) {
        if (git_credential_ssh_key_from_agent(out, user) == 0)
            return 0;
    }
    if ((allowed_types & GIT_CREDENTIAL_USERPASS_PLAINTEXT) && env_user && env_pass)
        return git_credential_userpass_plaintext_new(out, env_user->c_str(), env_pass->c_str());
    if (allowed_types & GIT_CREDENTIAL_DEFAULT)
        return git_credential_default_new(out);
    return GIT_PASSTHROUGH;
}

/**
 * @brief Construct the RAII guard and initialize libgit2.
 */
GitInitGuard::GitInitGuard() {
    git_libgit2_init();
    apply_libgit_timeout();
}

/**
 * @brief Destroy the RAII guard and shutdown libgit2.
 */
GitInitGuard::~GitInitGuard() { git_libgit2_shutdown(); }

/**
 * @brief Convert a libgit2 object ID to a hexadecimal string.
 */
static string oid_to_hex(const git_oid& oid) { return string(git_oid_tostr_s(&oid)); }

/**
 * @brief Populate an error string with the last libgit2 error message.
 */
static void set_error(std::string* error) {
    if (!error)
        return;
    const git_error* e = git_error_last();
    if (e && e->message)
        *error = e->message;
    else
        *error = "Unknown libgit2 error";
}

static git_remote_callbacks make_callbacks(bool use_credentials) {
    git_remote_callbacks callbacks = GIT_REMOTE_CALLBACKS_INIT;
    if (use_credentials)
        callbacks.credentials = credential_cb;
    return callbacks;
}

bool is_bare_repo(const fs::path& p) {
    git_repository* raw = nullptr;
    if (git_repository_open_bare(&raw, p.string().c_str()) != 0)
        return false;
    repo_ptr r(raw);
    return git_repository_is_bare(r.get()) == 1;
}

/**
 * @brief Create the `origin` remote with a mirror fetchspec.
 */
static int create_mirror_remote(git_remote** out, git_repository* repo, const char* name,
                                const char* url) {
    int err = git_remote_create_with_fetchspec(out, repo, name, url, "+refs/*:refs/*");
    if (err < 0)
        return err;
    git_config* raw_cfg = nullptr;
    if ((err = git_repository_config(&raw_cfg, repo)) < 0) {
        git_remote_free(*out);
        *out = nullptr;
        return err;
    }
    config_ptr cfg(raw_cfg);
    std::string key = std::string("remote.") + name + ".mirror";
    err = git_config_set_bool(cfg.get(), key.c_str(), 1);
    if (err < 0) {
        git_remote_free(*out);
        *out = nullptr;
    }
    return err;
}

/**
 * @brief Clone every ref of @p url into a bare repository at @p dest.
 *
 * The remote is connected once so the default branch can be read before the
 * download; HEAD of the mirror then points at the same branch as the source.
 * An empty source leaves HEAD unborn.
 */
int mirror_clone(const fs::path& dest, const std::string& url, bool use_credentials,
                 std::string* error) {
    git_repository* raw_repo = nullptr;
    int err = git_repository_init(&raw_repo, dest.string().c_str(), 1);
    if (err != 0) {
        set_error(error);
        return err;
    }
    repo_ptr r(raw_repo);
    git_remote* raw_remote = nullptr;
    err = create_mirror_remote(&raw_remote, r.get(), "origin", url.c_str());
    if (err != 0) {
        set_error(error);
        return err;
    }
    remote_ptr remote(raw_remote);

    git_remote_callbacks callbacks = make_callbacks(use_credentials);
    git_proxy_options proxy = GIT_PROXY_OPTIONS_INIT;
    fill_proxy_options(proxy);
    err = git_remote_connect(remote.get(), GIT_DIRECTION_FETCH, &callbacks, &proxy, nullptr);
    if (err != 0) {
        set_error(error);
        return err;
    }
    git_buf head_branch = GIT_BUF_INIT;
    bool have_head = git_remote_default_branch(&head_branch, remote.get()) == 0;
    std::string head_name = have_head ? std::string(head_branch.ptr, head_branch.size) : "";
    git_buf_dispose(&head_branch);

    git_fetch_options fetch_opts = GIT_FETCH_OPTIONS_INIT;
    fetch_opts.callbacks = callbacks;
    fetch_opts.proxy_opts = proxy;
    fetch_opts.download_tags = GIT_REMOTE_DOWNLOAD_TAGS_ALL;
    err = git_remote_download(remote.get(), nullptr, &fetch_opts);
    if (err == 0)
        err = git_remote_update_tips(remote.get(), &callbacks, 0, GIT_REMOTE_DOWNLOAD_TAGS_ALL,
                                     "clone: mirror");
    if (err != 0) {
        set_error(error);
        git_remote_disconnect(remote.get());
        return err;
    }
    git_remote_disconnect(remote.get());

    if (!head_name.empty()) {
        err = git_repository_set_head(r.get(), head_name.c_str());
        if (err != 0) {
            set_error(error);
            return err;
        }
    }
    return 0;
}

int set_push_url(const fs::path& repo, const std::string& remote, const std::string& url,
                 std::string* error) {
    git_repository* raw = nullptr;
    int err = git_repository_open(&raw, repo.string().c_str());
    if (err != 0) {
        set_error(error);
        return err;
    }
    repo_ptr r(raw);
    git_remote* raw_remote = nullptr;
    err = git_remote_lookup(&raw_remote, r.get(), remote.c_str());
    if (err != 0) {
        set_error(error);
        return err;
    }
    remote_ptr remote_handle(raw_remote);
    err = git_remote_set_pushurl(r.get(), remote.c_str(), url.c_str());
    if (err != 0)
        set_error(error);
    return err;
}

optional<string> get_push_url(const fs::path& repo, const string& remote, string* error) {
    git_repository* raw = nullptr;
    if (git_repository_open(&raw, repo.string().c_str()) != 0) {
        set_error(error);
        return nullopt;
    }
    repo_ptr r(raw);
    git_remote* raw_remote = nullptr;
    if (git_remote_lookup(&raw_remote, r.get(), remote.c_str()) != 0) {
        set_error(error);
        return nullopt;
    }
    remote_ptr remote_handle(raw_remote);
    const char* url = git_remote_pushurl(remote_handle.get());
    if (!url)
        return nullopt;
    return string(url);
}

static int collect_refs(git_repository* repo, RefMap& out) {
    git_reference_iterator* raw_iter = nullptr;
    int err = git_reference_iterator_new(&raw_iter, repo);
    if (err != 0)
        return err;
    ref_iter_ptr iter(raw_iter);
    git_reference* raw_ref = nullptr;
    while ((err = git_reference_next(&raw_ref, iter.get())) == 0) {
        reference_ptr ref(raw_ref);
        const char* name = git_reference_name(ref.get());
        if (!name || string(name) == "HEAD")
            continue;
        git_reference* raw_resolved = nullptr;
        if (git_reference_resolve(&raw_resolved, ref.get()) != 0)
            continue; // dangling symbolic ref
        reference_ptr resolved(raw_resolved);
        const git_oid* oid = git_reference_target(resolved.get());
        if (oid)
            out[name] = oid_to_hex(*oid);
    }
    return err == GIT_ITEROVER ? 0 : err;
}

optional<RefMap> list_refs(const fs::path& repo, string* error) {
    git_repository* raw = nullptr;
    if (git_repository_open(&raw, repo.string().c_str()) != 0) {
        set_error(error);
        return nullopt;
    }
    repo_ptr r(raw);
    RefMap refs;
    if (collect_refs(r.get(), refs) != 0) {
        set_error(error);
        return nullopt;
    }
    return refs;
}

vector<string> mirror_refspecs(const RefMap& local_refs, const RefMap& remote_refs) {
    vector<string> specs;
    for (const auto& [name, oid] : local_refs) {
        (void)oid;
        if (name == "HEAD")
            continue;
        specs.push_back("+" + name + ":" + name);
    }
    for (const auto& [name, oid] : remote_refs) {
        (void)oid;
        if (name == "HEAD" || name.rfind("refs/", 0) != 0)
            continue;
        if (name.size() >= 3 && name.compare(name.size() - 3, 3, "^{}") == 0)
            continue;
        if (!local_refs.count(name))
            specs.push_back(":" + name); // delete stale ref
    }
    return specs;
}

/**
 * @brief Record refs the server refused to update.
 *
 * libgit2 reports a successful push even when individual refs are rejected;
 * a non-null @p status carries the server's reason.
 */
static int push_update_reference_cb(const char* refname, const char* status, void* payload) {
    if (status && payload) {
        auto* rejected = static_cast<vector<string>*>(payload);
        rejected->push_back(string(refname) + ": " + status);
    }
    return 0;
}

int mirror_push(const fs::path& repo, const string& remote, const string& url,
                bool use_credentials, string* error) {
    git_repository* raw_repo = nullptr;
    int err = git_repository_open(&raw_repo, repo.string().c_str());
    if (err != 0) {
        set_error(error);
        return err;
    }
    repo_ptr r(raw_repo);
    RefMap local_refs;
    if ((err = collect_refs(r.get(), local_refs)) != 0) {
        set_error(error);
        return err;
    }

    git_remote* raw_remote = nullptr;
    bool named = false;
    if (git_remote_lookup(&raw_remote, r.get(), remote.c_str()) == 0) {
        const char* push_url = git_remote_pushurl(raw_remote);
        named = push_url && url == push_url;
        if (!named) {
            git_remote_free(raw_remote);
            raw_remote = nullptr;
        }
    }
    if (!named && (err = git_remote_create_anonymous(&raw_remote, r.get(), url.c_str())) != 0) {
        set_error(error);
        return err;
    }
    remote_ptr remote_handle(raw_remote);

    vector<string> rejected;
    git_remote_callbacks callbacks = make_callbacks(use_credentials);
    callbacks.push_update_reference = push_update_reference_cb;
    callbacks.payload = &rejected;
    git_proxy_options proxy = GIT_PROXY_OPTIONS_INIT;
    fill_proxy_options(proxy);

    err = git_remote_connect(remote_handle.get(), GIT_DIRECTION_PUSH, &callbacks, &proxy,
                             nullptr);
    if (err != 0) {
        set_error(error);
        return err;
    }
    RefMap remote_refs;
    const git_remote_head** heads = nullptr;
    size_t count = 0;
    err = git_remote_ls(&heads, &count, remote_handle.get());
    if (err != 0) {
        set_error(error);
        git_remote_disconnect(remote_handle.get());
        return err;
    }
    for (size_t i = 0; i < count; ++i)
        remote_refs[heads[i]->name] = oid_to_hex(heads[i]->oid);
    git_remote_disconnect(remote_handle.get());

    vector<string> specs = mirror_refspecs(local_refs, remote_refs);
    if (specs.empty())
        return 0; // both sides empty
    vector<char*> spec_ptrs;
    spec_ptrs.reserve(specs.size());
    for (auto& s : specs)
        spec_ptrs.push_back(const_cast<char*>(s.c_str()));
    git_strarray arr{spec_ptrs.data(), spec_ptrs.size()};

    git_push_options push_opts = GIT_PUSH_OPTIONS_INIT;
    push_opts.callbacks = callbacks;
    push_opts.proxy_opts = proxy;
    err = git_remote_push(remote_handle.get(), &arr, &push_opts);
    if (err != 0) {
        set_error(error);
        return err;
    }
    if (!rejected.empty()) {
        if (error) {
            string msg = "rejected:";
            for (const auto& rj : rejected)
                msg += " " + rj + ";";
            msg.pop_back();
            *error = msg;
        }
        return GIT_ERROR;
    }
    return 0;
}

} // namespace git
