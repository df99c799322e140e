#ifndef OPTIONS_HPP
#define OPTIONS_HPP
#include <chrono>
#include <filesystem>
#include <functional>
#include <map>
#include <set>
#include <string>
#include <vector>
#include "logger.hpp"
#include "migration.hpp"

struct LoggingOptions {
    LogLevel log_level = LogLevel::INFO;
    std::string log_file;
    size_t max_log_size = 0;
    size_t max_log_files = 3;
    bool json_log = false;
    bool compress_logs = false;
};

struct Options {
    std::string origin_host;
    std::string dest_host;
    std::vector<std::string> repos;
    std::filesystem::path repos_file;
    bool no_push = false;
    bool keep = false;
    bool force = false;
    std::filesystem::path work_dir;
    std::string url_suffix = ".git";
    bool raw_hosts = false;
    bool git_cli = false;
    std::chrono::seconds timeout{0};
    std::string proxy_url;
    bool dry_run = false;
    std::string report_json;
    bool silent = false;
    LoggingOptions logging;
    std::filesystem::path config_file;
    bool show_help = false;
    bool print_version = false;
};

using CfgFlagFn = std::function<bool(const std::string&)>;
using CfgOptFn = std::function<std::string(const std::string&)>;

/**
 * Parse command-line arguments and configuration files to populate an Options
 * instance.
 *
 * Values given on the command line override the configuration file. Repository
 * lists from both are concatenated, configuration first.
 *
 * @throws std::runtime_error on unknown flags, missing or malformed values and
 *         unreadable configuration files.
 */
Options parse_options(int argc, char* argv[]);

/**
 * Build the migration input from parsed options.
 *
 * Hosts get exactly one trailing `/` unless `raw_hosts` is set and the work
 * directory is made absolute against the current directory.
 *
 * @throws std::runtime_error when a host or the repository list is missing.
 */
MigrationConfig build_config(const Options& opts);

/** Strip trailing slashes from @p host and append exactly one. */
std::string normalize_host(const std::string& host);

class ArgParser;

/** Every flag the command line and configuration files accept. */
struct OptionTable {
    std::set<std::string> known;
    std::map<char, std::string> short_map;
    std::set<std::string> value_flags; ///< Take exactly one value
    std::set<std::string> list_flags;  ///< Take one or more values
};

const OptionTable& option_table();

/** Parse @p argv against option_table(). */
ArgParser make_parser(int argc, char* argv[]);

/**
 * Load `--config-yaml` / `--config-json` files named on the command line.
 *
 * @param cfg_opts    Receives option values keyed by `--long-name`.
 * @param cfg_repos   Receives repository names listed in the files.
 * @param config_file Set to the last file loaded.
 */
void load_config_files(int argc, char* argv[], std::map<std::string, std::string>& cfg_opts,
                       std::vector<std::string>& cfg_repos, std::filesystem::path& config_file);

/**
 * Collect hosts, repository names and the `--repos-file` list.
 *
 * Side effects on Options: fills origin_host, dest_host, repos, repos_file.
 */
void parse_repo_args(Options& opts, ArgParser& parser, const CfgOptFn& cfg_opt,
                     const std::map<std::string, std::string>& cfg_opts,
                     const std::vector<std::string>& cfg_repos);

/**
 * Read repository names from a file, one per line. Blank lines and text after
 * `#` are ignored.
 *
 * @throws std::runtime_error if the file cannot be read.
 */
std::vector<std::string> read_repos_file(const std::filesystem::path& path);

/**
 * Parse logging flags and options.
 *
 * Side effects on Options: updates opts.logging.
 */
void parse_logging_options(Options& opts, ArgParser& parser, const CfgFlagFn& cfg_flag,
                           const CfgOptFn& cfg_opt,
                           const std::map<std::string, std::string>& cfg_opts);

#endif // OPTIONS_HPP
