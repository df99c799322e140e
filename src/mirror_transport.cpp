#include "mirror_transport.hpp"

#include "git_utils.hpp"
#include "system_utils.hpp"

namespace fs = std::filesystem;

static TransportResult from_libgit(int err, std::string& msg) {
    TransportResult res;
    res.status = err;
    if (err != 0)
        res.output = std::move(msg);
    return res;
}

TransportResult LibGit2Transport::fetch_mirror(const std::string& source_url,
                                               const fs::path& dest) {
    std::string err;
    int rc = git::mirror_clone(dest, source_url, use_credentials_, &err);
    return from_libgit(rc, err);
}

TransportResult LibGit2Transport::retarget(const fs::path& mirror, const std::string& push_url) {
    std::string err;
    int rc = git::set_push_url(mirror, "origin", push_url, &err);
    return from_libgit(rc, err);
}

TransportResult LibGit2Transport::push_mirror(const fs::path& mirror,
                                              const std::string& target_url) {
    std::string err;
    int rc = git::mirror_push(mirror, "origin", target_url, use_credentials_, &err);
    return from_libgit(rc, err);
}

static TransportResult from_process(const procutil::ProcessResult& pr) {
    TransportResult res;
    res.status = pr.exit_code;
    res.output = pr.output;
    while (!res.output.empty() && (res.output.back() == '\n' || res.output.back() == '\r'))
        res.output.pop_back();
    return res;
}

TransportResult GitCommandTransport::fetch_mirror(const std::string& source_url,
                                                  const fs::path& dest) {
    return from_process(
        procutil::run_process({git_exe_, "clone", "--mirror", "--", source_url, dest.string()}));
}

TransportResult GitCommandTransport::retarget(const fs::path& mirror,
                                              const std::string& push_url) {
    return from_process(procutil::run_process(
        {git_exe_, "-C", mirror.string(), "remote", "set-url", "--push", "--", "origin", push_url}));
}

TransportResult GitCommandTransport::push_mirror(const fs::path& mirror,
                                                 const std::string& target_url) {
    return from_process(
        procutil::run_process({git_exe_, "-C", mirror.string(), "push", "--mirror", "--",
                               target_url}));
}
