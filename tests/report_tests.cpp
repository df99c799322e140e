#include "test_common.hpp"
#include "report.hpp"

static BatchReport sample_report() {
    BatchReport report;
    RepoOutcome ok;
    ok.repo_name = "group/app";
    ok.status = RS_SUCCEEDED;
    ok.source_url = "https://old/group/app.git";
    ok.dest_url = "https://new/group/app.git";
    ok.stage = MigrationStage::Done;
    ok.elapsed = std::chrono::milliseconds(1234);
    report.outcomes.push_back(ok);

    RepoOutcome kept;
    kept.repo_name = "lib";
    kept.status = RS_CLONED_ONLY;
    kept.stage = MigrationStage::Done;
    kept.workspace = fs::path("/srv/mirrors/lib.git");
    kept.elapsed = std::chrono::milliseconds(40);
    report.outcomes.push_back(kept);

    RepoOutcome bad;
    bad.repo_name = "gone";
    bad.status = RS_FAILED;
    bad.stage = MigrationStage::WorkspaceReady;
    MigrationError err;
    err.kind = MigrationErrorKind::CloneFailed;
    err.failed_at = MigrationStage::WorkspaceReady;
    err.status = 128;
    err.diagnostic = "fatal: repository not found";
    bad.error = err;
    report.outcomes.push_back(bad);
    return report;
}

TEST_CASE("report_to_json layout") {
    auto j = report_to_json(sample_report());
    REQUIRE(j["succeeded"] == 1);
    REQUIRE(j["cloned_only"] == 1);
    REQUIRE(j["failed"] == 1);
    REQUIRE(j["ok"] == false);
    REQUIRE(j["repositories"].size() == 3);

    const auto& first = j["repositories"][0];
    REQUIRE(first["name"] == "group/app");
    REQUIRE(first["status"] == "Succeeded");
    REQUIRE(first["source_url"] == "https://old/group/app.git");
    REQUIRE(first["dest_url"] == "https://new/group/app.git");
    REQUIRE(first["stage"] == "Done");
    REQUIRE(first["elapsed_ms"] == 1234);
    REQUIRE_FALSE(first.contains("error"));
    REQUIRE_FALSE(first.contains("workspace"));

    REQUIRE(j["repositories"][1]["workspace"] == "/srv/mirrors/lib.git");

    const auto& err = j["repositories"][2]["error"];
    REQUIRE(err["kind"] == "CloneFailed");
    REQUIRE(err["stage"] == "WorkspaceReady");
    REQUIRE(err["status"] == 128);
    REQUIRE(err["diagnostic"] == "fatal: repository not found");
}

TEST_CASE("write_json_report") {
    TempDir tmp("report_write");
    fs::path out = tmp.path() / "report.json";
    std::string err;
    REQUIRE(write_json_report(sample_report(), out.string(), err));
    std::ifstream ifs(out);
    auto j = nlohmann::json::parse(ifs);
    REQUIRE(j["repositories"].size() == 3);

    REQUIRE_FALSE(write_json_report(sample_report(), (tmp.path() / "no" / "r.json").string(), err));
    REQUIRE_FALSE(err.empty());
}

TEST_CASE("Cleanup failures are reported") {
    RepoOutcome o;
    o.repo_name = "lib";
    o.status = RS_SUCCEEDED;
    o.stage = MigrationStage::Done;
    o.workspace = fs::path("/srv/mirrors/lib.git");
    o.cleanup_error = "cannot remove /srv/mirrors/lib.git: Permission denied";
    BatchReport report;
    report.outcomes.push_back(o);

    auto j = report_to_json(report);
    REQUIRE(j["repositories"][0]["cleanup_error"] == o.cleanup_error);
    REQUIRE(j["ok"] == true);
    std::string line = format_outcome_line(o);
    REQUIRE(line.find("[cleanup failed: cannot remove") != std::string::npos);

    REQUIRE_FALSE(report_to_json(sample_report())["repositories"][0].contains("cleanup_error"));
}

TEST_CASE("Console lines") {
    BatchReport report = sample_report();
    REQUIRE(format_outcome_line(report.outcomes[0]) == "[ OK ] group/app Succeeded (1.2s)");
    REQUIRE(format_outcome_line(report.outcomes[1]) ==
            "[ OK ] lib ClonedOnly (40ms) [kept " + fs::path("/srv/mirrors/lib.git").string() +
                "]");
    REQUIRE(format_outcome_line(report.outcomes[2]) ==
            "[FAIL] gone Failed (0ms): CloneFailed at WorkspaceReady (status 128): fatal: "
            "repository not found");
    REQUIRE(format_summary(report) == "3 repositories: 1 succeeded, 1 cloned only, 1 failed");

    BatchReport single;
    single.outcomes.push_back(report.outcomes[0]);
    REQUIRE(format_summary(single) == "1 repository: 1 succeeded, 0 cloned only, 0 failed");
}
