// options_repo_args.cpp
//
// Parse hosts and the repository list.

#include <filesystem>
#include <fstream>
#include <map>
#include <stdexcept>
#include <string>

#include "arg_parser.hpp"
#include "config_utils.hpp"
#include "options.hpp"

namespace fs = std::filesystem;

std::vector<std::string> read_repos_file(const fs::path& path) {
    std::ifstream ifs(path);
    if (!ifs)
        throw std::runtime_error("Cannot read repository list: " + path.string());
    std::vector<std::string> repos;
    std::string line;
    while (std::getline(ifs, line)) {
        auto hash = line.find('#');
        if (hash != std::string::npos)
            line.erase(hash);
        auto b = line.find_first_not_of(" \t\r");
        if (b == std::string::npos)
            continue;
        auto e = line.find_last_not_of(" \t\r");
        repos.push_back(line.substr(b, e - b + 1));
    }
    return repos;
}

void parse_repo_args(Options& opts, ArgParser& parser, const CfgOptFn& cfg_opt,
                     const std::map<std::string, std::string>& cfg_opts,
                     const std::vector<std::string>& cfg_repos) {
    if (parser.has_flag("--origin-host") || cfg_opts.count("--origin-host")) {
        std::string val = parser.get_option("--origin-host");
        if (val.empty())
            val = cfg_opt("--origin-host");
        if (val.empty())
            throw std::runtime_error("--origin-host requires a URL");
        opts.origin_host = val;
    }
    if (parser.has_flag("--dest-host") || cfg_opts.count("--dest-host")) {
        std::string val = parser.get_option("--dest-host");
        if (val.empty())
            val = cfg_opt("--dest-host");
        if (val.empty())
            throw std::runtime_error("--dest-host requires a URL");
        opts.dest_host = val;
    }

    opts.repos = cfg_repos;
    for (const auto& val : parser.get_all_options("--repos")) {
        auto names = split_list(val);
        if (names.empty())
            throw std::runtime_error("Empty repository name in --repos");
        opts.repos.insert(opts.repos.end(), names.begin(), names.end());
    }
    if (parser.has_flag("--repos-file") || cfg_opts.count("--repos-file")) {
        std::string val = parser.get_option("--repos-file");
        if (val.empty())
            val = cfg_opt("--repos-file");
        if (val.empty())
            throw std::runtime_error("--repos-file requires a path");
        opts.repos_file = val;
        auto names = read_repos_file(opts.repos_file);
        opts.repos.insert(opts.repos.end(), names.begin(), names.end());
    }
}
