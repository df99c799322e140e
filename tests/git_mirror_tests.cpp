#include <array>
#include <cstdio>
#include "test_common.hpp"
#include "git_utils.hpp"

static std::string run_cmd(const std::string& cmd) {
    std::array<char, 128> buffer{};
    std::string result;
    FILE* pipe = popen(cmd.c_str(), "r");
    if (!pipe)
        return result;
    while (fgets(buffer.data(), static_cast<int>(buffer.size()), pipe))
        result += buffer.data();
    pclose(pipe);
    if (!result.empty() && result.back() == '\n')
        result.pop_back();
    return result;
}

static bool run_git(const fs::path& dir, const std::string& args) {
    std::string cmd = "git -C \"" + dir.string() +
                      "\" -c user.email=you@example.com -c user.name=tester " + args + REDIR;
    return std::system(cmd.c_str()) == 0;
}

/**
 * Layout below @p root:
 *   origin/app.git  bare source with main, feature and tag v1
 *   dest/app.git    bare destination holding a stale branch
 */
static void setup_hosts(const fs::path& root) {
    fs::path origin = root / "origin" / "app.git";
    fs::path dest = root / "dest" / "app.git";
    fs::path work = root / "work";
    fs::create_directories(origin);
    fs::create_directories(dest);
    REQUIRE(run_git(origin, "init --bare"));
    REQUIRE(run_git(dest, "init --bare"));
    REQUIRE(std::system(("git clone \"" + origin.string() + "\" \"" + work.string() + "\"" REDIR)
                            .c_str()) == 0);
    std::ofstream(work / "file.txt") << "hello";
    REQUIRE(run_git(work, "add file.txt"));
    REQUIRE(run_git(work, "commit -m init"));
    REQUIRE(run_git(work, "branch -M main"));
    REQUIRE(run_git(work, "push origin main"));
    REQUIRE(run_git(origin, "symbolic-ref HEAD refs/heads/main"));
    std::ofstream(work / "feature.txt") << "feature";
    REQUIRE(run_git(work, "checkout -b feature"));
    REQUIRE(run_git(work, "add feature.txt"));
    REQUIRE(run_git(work, "commit -m feature"));
    REQUIRE(run_git(work, "push origin feature"));
    REQUIRE(run_git(work, "tag -a v1 -m release main"));
    REQUIRE(run_git(work, "push origin v1"));
    REQUIRE(run_git(work, "push \"" + dest.string() + "\" feature:refs/heads/stale"));
}

static MigrationConfig host_config(const fs::path& root) {
    MigrationConfig cfg;
    cfg.origin_host = (root / "origin").string() + "/";
    cfg.dest_host = (root / "dest").string() + "/";
    cfg.repos = {"app"};
    cfg.work_root = root / "mirrors";
    cfg.url_suffix = ".git";
    return cfg;
}

static void check_full_migration(MirrorTransport& transport, const std::string& name) {
    TempDir tmp(name);
    setup_hosts(tmp.path());
    MigrationConfig cfg = host_config(tmp.path());
    fs::path origin = tmp.path() / "origin" / "app.git";
    fs::path dest = tmp.path() / "dest" / "app.git";

    BatchReport report = run_batch(cfg, transport);
    REQUIRE(report.outcomes.size() == 1);
    INFO(report.outcomes[0].error ? describe_error(*report.outcomes[0].error) : "");
    REQUIRE(report.outcomes[0].status == RS_SUCCEEDED);

    auto src_refs = git::list_refs(origin);
    auto dst_refs = git::list_refs(dest);
    REQUIRE(src_refs);
    REQUIRE(dst_refs);
    REQUIRE(src_refs->count("refs/heads/main") == 1);
    REQUIRE(src_refs->count("refs/tags/v1") == 1);
    REQUIRE(*dst_refs == *src_refs);
    REQUIRE(dst_refs->count("refs/heads/stale") == 0);
    REQUIRE(fs::is_empty(cfg.work_root));

    // a second run leaves the destination unchanged
    BatchReport again = run_batch(cfg, transport);
    REQUIRE(again.outcomes[0].status == RS_SUCCEEDED);
    REQUIRE(*git::list_refs(dest) == *src_refs);
}

static void check_kept_mirror(MirrorTransport& transport, const std::string& name) {
    TempDir tmp(name);
    setup_hosts(tmp.path());
    MigrationConfig cfg = host_config(tmp.path());
    cfg.no_push = true;
    cfg.clean = false;
    fs::path dest = tmp.path() / "dest" / "app.git";
    auto before = git::list_refs(dest);

    BatchReport report = run_batch(cfg, transport);
    const RepoOutcome& o = report.outcomes[0];
    REQUIRE(o.status == RS_CLONED_ONLY);
    REQUIRE(o.workspace);
    REQUIRE(git::is_bare_repo(*o.workspace));
    REQUIRE(git::get_push_url(*o.workspace, "origin") == o.dest_url);
    REQUIRE(run_cmd("git -C \"" + o.workspace->string() + "\" remote get-url origin") ==
            o.source_url);
    REQUIRE(run_cmd("git -C \"" + o.workspace->string() + "\" config remote.origin.mirror") ==
            "true");
    REQUIRE(run_cmd("git -C \"" + o.workspace->string() + "\" symbolic-ref HEAD") ==
            "refs/heads/main");
    REQUIRE(git::list_refs(dest) == before);

    // the kept workspace blocks the next run unless forced
    BatchReport blocked = run_batch(cfg, transport);
    REQUIRE(blocked.outcomes[0].error);
    REQUIRE(blocked.outcomes[0].error->kind == MigrationErrorKind::PathConflict);
    cfg.force = true;
    REQUIRE(run_batch(cfg, transport).outcomes[0].status == RS_CLONED_ONLY);
}

static void check_missing_source(MirrorTransport& transport, const std::string& name) {
    TempDir tmp(name);
    MigrationConfig cfg = host_config(tmp.path());
    cfg.repos = {"does-not-exist"};
    BatchReport report = run_batch(cfg, transport);
    const RepoOutcome& o = report.outcomes[0];
    REQUIRE(o.status == RS_FAILED);
    REQUIRE(o.error->kind == MigrationErrorKind::CloneFailed);
    REQUIRE(o.error->status != 0);
    REQUIRE_FALSE(o.error->diagnostic.empty());
    REQUIRE(exit_code(report) == 1);
}

TEST_CASE("LibGit2Transport mirrors refs and prunes the destination") {
    if (!have_git()) {
        WARN("git not available; skipping");
        return;
    }
    git::GitInitGuard guard;
    LibGit2Transport transport(false);
    check_full_migration(transport, "libgit2_full");
}

TEST_CASE("LibGit2Transport keeps a retargeted mirror") {
    if (!have_git()) {
        WARN("git not available; skipping");
        return;
    }
    git::GitInitGuard guard;
    LibGit2Transport transport(false);
    check_kept_mirror(transport, "libgit2_kept");
}

TEST_CASE("LibGit2Transport reports a missing source") {
    git::GitInitGuard guard;
    LibGit2Transport transport(false);
    check_missing_source(transport, "libgit2_missing");
}

TEST_CASE("GitCommandTransport mirrors refs and prunes the destination") {
    if (!have_git()) {
        WARN("git not available; skipping");
        return;
    }
    git::GitInitGuard guard;
    GitCommandTransport transport;
    check_full_migration(transport, "gitcli_full");
}

TEST_CASE("GitCommandTransport keeps a retargeted mirror") {
    if (!have_git()) {
        WARN("git not available; skipping");
        return;
    }
    git::GitInitGuard guard;
    GitCommandTransport transport;
    check_kept_mirror(transport, "gitcli_kept");
}

TEST_CASE("GitCommandTransport reports a missing source") {
    if (!have_git()) {
        WARN("git not available; skipping");
        return;
    }
    GitCommandTransport transport;
    check_missing_source(transport, "gitcli_missing");
}

TEST_CASE("GitCommandTransport reports a missing executable") {
    TempDir tmp("gitcli_noexe");
    GitCommandTransport transport("repomigrator-no-such-git");
    auto res = transport.fetch_mirror("https://example.invalid/app.git", tmp.path() / "m");
    REQUIRE_FALSE(res.ok());
}

TEST_CASE("GitCommandTransport never reads a URL as an option") {
    if (!have_git()) {
        WARN("git not available; skipping");
        return;
    }
    TempDir tmp("gitcli_dash_url");
    GitCommandTransport transport;
    auto res = transport.fetch_mirror("--version", tmp.path() / "m");
    REQUIRE_FALSE(res.ok());
    REQUIRE(res.output.find("git version") == std::string::npos);
}

TEST_CASE("mirror_refspecs force pushes local refs and deletes stale ones") {
    git::RefMap local{{"refs/heads/main", "aa"}, {"refs/tags/v1", "bb"}, {"HEAD", "aa"}};
    git::RefMap remote{{"refs/heads/main", "cc"},
                       {"refs/heads/old", "dd"},
                       {"refs/tags/v1^{}", "ee"},
                       {"HEAD", "cc"}};
    auto specs = git::mirror_refspecs(local, remote);
    REQUIRE(specs == std::vector<std::string>{"+refs/heads/main:refs/heads/main",
                                              "+refs/tags/v1:refs/tags/v1",
                                              ":refs/heads/old"});
    REQUIRE(git::mirror_refspecs({}, {}).empty());
}

TEST_CASE("set_push_url and get_push_url") {
    if (!have_git()) {
        WARN("git not available; skipping");
        return;
    }
    git::GitInitGuard guard;
    TempDir tmp("push_url");
    REQUIRE(run_git(tmp.path(), "init --bare"));
    REQUIRE(run_git(tmp.path(), "remote add origin https://old.example.com/app.git"));
    REQUIRE_FALSE(git::get_push_url(tmp.path(), "origin"));
    REQUIRE(git::set_push_url(tmp.path(), "origin", "https://new.example.com/app.git") == 0);
    REQUIRE(git::get_push_url(tmp.path(), "origin") == "https://new.example.com/app.git");
    REQUIRE(run_cmd("git -C \"" + tmp.path().string() + "\" remote get-url origin") ==
            "https://old.example.com/app.git");

    std::string err;
    REQUIRE(git::set_push_url(tmp.path(), "upstream", "x", &err) != 0);
    REQUIRE_FALSE(err.empty());
}
