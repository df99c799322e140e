// options_config.cpp
//
// Load configuration from YAML/JSON files named on the command line.

#include <filesystem>
#include <map>
#include <stdexcept>
#include <string>
#include <vector>

#include "arg_parser.hpp"
#include "config_utils.hpp"
#include "options.hpp"

namespace fs = std::filesystem;

void load_config_files(int argc, char* argv[], std::map<std::string, std::string>& cfg_opts,
                       std::vector<std::string>& cfg_repos, fs::path& config_file) {
    ArgParser pre_parser = make_parser(argc, argv);
    for (const auto& cfg : pre_parser.get_all_options("--config-yaml")) {
        if (cfg.empty())
            throw std::runtime_error("--config-yaml requires a file");
        std::string err;
        if (!load_yaml_config(cfg, cfg_opts, cfg_repos, err))
            throw std::runtime_error("Failed to load config " + cfg + ": " + err);
        config_file = cfg;
    }
    for (const auto& cfg : pre_parser.get_all_options("--config-json")) {
        if (cfg.empty())
            throw std::runtime_error("--config-json requires a file");
        std::string err;
        if (!load_json_config(cfg, cfg_opts, cfg_repos, err))
            throw std::runtime_error("Failed to load config " + cfg + ": " + err);
        config_file = cfg;
    }
}
