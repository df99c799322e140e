#include <zlib.h>
#include <fstream>
#include <nlohmann/json.hpp>
#include <sstream>
#include <string>
#include <vector>
#include "test_common.hpp"

struct LoggerGuard {
    ~LoggerGuard() {
        shutdown_logger();
        set_json_logging(false);
        set_log_compression(false);
        set_log_level(LogLevel::INFO);
    }
};

static std::vector<std::string> read_lines(const fs::path& p) {
    std::ifstream ifs(p);
    std::vector<std::string> lines;
    std::string line;
    while (std::getline(ifs, line))
        lines.push_back(line);
    return lines;
}

static std::string gunzip(const fs::path& p) {
    gzFile in = gzopen(p.string().c_str(), "rb");
    REQUIRE(in != nullptr);
    std::string out;
    char buf[4096];
    int n = 0;
    while ((n = gzread(in, buf, sizeof(buf))) > 0)
        out.append(buf, static_cast<size_t>(n));
    gzclose(in);
    return out;
}

TEST_CASE("Logger rotates and limits files") {
    TempDir tmp("logger_rotate");
    fs::path log = tmp.path() / "migrate.log";
    auto numbered = [&](int i) { return fs::path(log.string() + "." + std::to_string(i)); };

    REQUIRE(init_logger(log.string(), LogLevel::INFO, 100, 2));
    LoggerGuard guard;
    REQUIRE(logger_initialized());
    for (int i = 0; i < 200; ++i)
        log_info("entry " + std::to_string(i));
    flush_logger();
    shutdown_logger();
    REQUIRE_FALSE(logger_initialized());
    REQUIRE(fs::exists(log));
    REQUIRE(fs::exists(numbered(1)));
    REQUIRE(fs::exists(numbered(2)));
    REQUIRE_FALSE(fs::exists(numbered(3)));
    auto last = read_lines(log);
    REQUIRE_FALSE(last.empty());
    REQUIRE(last.back().find("entry 199") != std::string::npos);
}

TEST_CASE("Logger compresses rotated files") {
    TempDir tmp("logger_gzip");
    fs::path log = tmp.path() / "migrate.log";
    set_log_compression(true);
    REQUIRE(init_logger(log.string(), LogLevel::INFO, 200, 3));
    LoggerGuard guard;
    for (int i = 0; i < 50; ++i)
        log_info("compressed entry " + std::to_string(i));
    shutdown_logger();

    fs::path gz = log.string() + ".1.gz";
    REQUIRE(fs::exists(gz));
    REQUIRE_FALSE(fs::exists(log.string() + ".1"));
    REQUIRE(gunzip(gz).find("compressed entry") != std::string::npos);
}

TEST_CASE("Logger filters by level") {
    TempDir tmp("logger_level");
    fs::path log = tmp.path() / "migrate.log";
    REQUIRE(init_logger(log.string(), LogLevel::WARNING));
    LoggerGuard guard;
    log_debug("hidden debug");
    log_info("hidden info");
    log_warning("shown warning");
    log_error("shown error", {{"repo", "group/app"}});
    shutdown_logger();

    auto lines = read_lines(log);
    REQUIRE(lines.size() == 2);
    REQUIRE(lines[0].find("[WARNING] shown warning") != std::string::npos);
    REQUIRE(lines[1].find("[ERROR] shown error repo=group/app") != std::string::npos);
}

TEST_CASE("Logger writes JSON lines") {
    TempDir tmp("logger_json");
    fs::path log = tmp.path() / "migrate.log";
    set_json_logging(true);
    REQUIRE(init_logger(log.string(), LogLevel::DEBUG));
    LoggerGuard guard;
    log_info("Repository migrated", {{"repo", "lib"}, {"status", "Succeeded"}});
    log_error(std::string("bad bytes \xff\xfe"));
    shutdown_logger();

    auto lines = read_lines(log);
    REQUIRE(lines.size() == 2);
    auto j = nlohmann::json::parse(lines[0]);
    REQUIRE(j["level"] == "INFO");
    REQUIRE(j["msg"] == "Repository migrated");
    REQUIRE(j["repo"] == "lib");
    REQUIRE(j["status"] == "Succeeded");
    REQUIRE(j.contains("timestamp"));
    REQUIRE(nlohmann::json::parse(lines[1])["level"] == "ERROR");
}

TEST_CASE("Logger keeps the previous file when the new one cannot be opened") {
    TempDir tmp("logger_reopen");
    fs::path log = tmp.path() / "migrate.log";
    REQUIRE(init_logger(log.string()));
    LoggerGuard guard;
    REQUIRE_FALSE(init_logger((tmp.path() / "missing" / "dir" / "x.log").string()));
    REQUIRE(logger_initialized());
    log_info("still here");
    shutdown_logger();
    auto lines = read_lines(log);
    REQUIRE(lines.size() == 1);
}

TEST_CASE("Log level names") {
    REQUIRE(parse_log_level("debug") == LogLevel::DEBUG);
    REQUIRE(parse_log_level("Warn") == LogLevel::WARNING);
    REQUIRE(parse_log_level("ERROR") == LogLevel::ERR);
    REQUIRE_FALSE(parse_log_level("trace"));
    REQUIRE(std::string(log_level_name(LogLevel::ERR)) == "ERROR");
}
