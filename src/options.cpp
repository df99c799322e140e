#include <algorithm>
#include <climits>
#include <filesystem>
#include <map>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>
#include "arg_parser.hpp"
#include "config_utils.hpp"
#include "options.hpp"
#include "parse_utils.hpp"

namespace fs = std::filesystem;

// Parsing of repository arguments, config files and logging options lives in
// src/options/repo_args.cpp, src/options/config.cpp and
// src/options/logging.cpp.

const OptionTable& option_table() {
    static const OptionTable table{
        {"--origin-host", "--dest-host",   "--repos",       "--repos-file",  "--no-push",
         "--keep",        "--force",       "--work-dir",    "--url-suffix",  "--raw-hosts",
         "--git-cli",     "--timeout",     "--proxy",       "--dry-run",     "--report-json",
         "--silent",      "--log-file",    "--log-level",   "--verbose",     "--json-log",
         "--max-log-size", "--max-log-files", "--compress-logs", "--config-yaml",
         "--config-json", "--help",        "--version"},
        {{'o', "--origin-host"},
         {'d', "--dest-host"},
         {'r', "--repos"},
         {'n', "--no-push"},
         {'k', "--keep"},
         {'f', "--force"},
         {'w', "--work-dir"},
         {'t', "--timeout"},
         {'s', "--silent"},
         {'l', "--log-file"},
         {'L', "--log-level"},
         {'v', "--verbose"},
         {'y', "--config-yaml"},
         {'j', "--config-json"},
         {'h', "--help"},
         {'V', "--version"}},
        {"--origin-host", "--dest-host", "--repos-file", "--work-dir", "--url-suffix",
         "--timeout", "--proxy", "--report-json", "--log-file", "--log-level", "--max-log-size",
         "--max-log-files", "--config-yaml", "--config-json"},
        {"--repos"}};
    return table;
}

ArgParser make_parser(int argc, char* argv[]) {
    const OptionTable& t = option_table();
    return ArgParser(argc, argv, t.known, t.short_map, t.value_flags, t.list_flags);
}

std::string normalize_host(const std::string& host) {
    std::string out = host;
    while (!out.empty() && out.back() == '/')
        out.pop_back();
    return out + "/";
}

Options parse_options(int argc, char* argv[]) {
    ArgParser parser = make_parser(argc, argv);
    if (!parser.unknown_flags().empty())
        throw std::runtime_error("Unknown option: " + parser.unknown_flags().front());
    if (!parser.missing_values().empty())
        throw std::runtime_error(parser.missing_values().front() + " requires a value");
    if (!parser.positional().empty())
        throw std::runtime_error("Unexpected argument: " + parser.positional().front() +
                                 " (use --repos)");

    Options opts;
    opts.show_help = parser.has_flag("--help");
    opts.print_version = parser.has_flag("--version");
    if (opts.show_help || opts.print_version)
        return opts;

    std::map<std::string, std::string> cfg_opts;
    std::vector<std::string> cfg_repos;
    load_config_files(argc, argv, cfg_opts, cfg_repos, opts.config_file);

    const std::set<std::string> cli_only{"--config-yaml", "--config-json", "--help",
                                         "--version"};
    for (const auto& kv : cfg_opts) {
        if (!option_table().known.count(kv.first))
            throw std::runtime_error("Unknown option in config: " + kv.first);
        if (cli_only.count(kv.first))
            throw std::runtime_error("Option not allowed in config: " + kv.first);
    }

    auto cfg_flag = [&](const std::string& k) {
        auto it = cfg_opts.find(k);
        if (it == cfg_opts.end())
            return false;
        bool ok = false;
        bool v = parse_bool(it->second, ok);
        if (!ok)
            throw std::runtime_error("Invalid boolean for " + k + " in config: " + it->second);
        return v;
    };
    auto cfg_opt = [&](const std::string& k) {
        auto it = cfg_opts.find(k);
        if (it != cfg_opts.end())
            return it->second;
        return std::string();
    };
    // Command line first, then config. Empty when neither has it.
    auto value_of = [&](const std::string& k) {
        return parser.has_flag(k) ? parser.get_option(k) : cfg_opt(k);
    };
    auto has_value = [&](const std::string& k) {
        return parser.has_flag(k) || cfg_opts.count(k) > 0;
    };

    parse_repo_args(opts, parser, cfg_opt, cfg_opts, cfg_repos);

    opts.no_push = parser.has_flag("--no-push") || cfg_flag("--no-push");
    opts.keep = parser.has_flag("--keep") || cfg_flag("--keep");
    opts.force = parser.has_flag("--force") || cfg_flag("--force");
    opts.raw_hosts = parser.has_flag("--raw-hosts") || cfg_flag("--raw-hosts");
    opts.git_cli = parser.has_flag("--git-cli") || cfg_flag("--git-cli");
    opts.dry_run = parser.has_flag("--dry-run") || cfg_flag("--dry-run");
    opts.silent = parser.has_flag("--silent") || cfg_flag("--silent");

    if (has_value("--work-dir")) {
        std::string val = value_of("--work-dir");
        if (val.empty())
            throw std::runtime_error("--work-dir requires a path");
        opts.work_dir = val;
    }
    if (has_value("--url-suffix"))
        opts.url_suffix = value_of("--url-suffix");
    if (has_value("--timeout")) {
        bool ok = false;
        auto dur = parse_duration(value_of("--timeout"), ok);
        if (!ok || dur.count() < 1 || dur.count() > INT_MAX)
            throw std::runtime_error("Invalid value for --timeout");
        opts.timeout = dur;
    }
    if (has_value("--proxy")) {
        std::string val = value_of("--proxy");
        if (val.empty())
            throw std::runtime_error("--proxy requires a URL");
        opts.proxy_url = val;
    }
    if (has_value("--report-json")) {
        std::string val = value_of("--report-json");
        if (val.empty())
            throw std::runtime_error("--report-json requires a file");
        opts.report_json = val;
    }
    parse_logging_options(opts, parser, cfg_flag, cfg_opt, cfg_opts);
    return opts;
}

MigrationConfig build_config(const Options& opts) {
    if (opts.origin_host.empty())
        throw std::runtime_error("--origin-host is required");
    if (opts.dest_host.empty())
        throw std::runtime_error("--dest-host is required");
    if (opts.repos.empty())
        throw std::runtime_error("At least one repository is required (--repos)");
    MigrationConfig cfg;
    cfg.origin_host = opts.raw_hosts ? opts.origin_host : normalize_host(opts.origin_host);
    cfg.dest_host = opts.raw_hosts ? opts.dest_host : normalize_host(opts.dest_host);
    cfg.repos = opts.repos;
    cfg.no_push = opts.no_push;
    cfg.clean = !opts.keep;
    cfg.force = opts.force;
    cfg.url_suffix = opts.url_suffix;
    fs::path root = opts.work_dir.empty() ? fs::current_path() : opts.work_dir;
    cfg.work_root = fs::absolute(root).lexically_normal();
    return cfg;
}
