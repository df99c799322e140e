#include "config_utils.hpp"
#include <yaml-cpp/yaml.h>
#include <fstream>
#include <sstream>
#include <nlohmann/json.hpp>

static const char* const REPOS_KEY = "repos";

static std::string trim(const std::string& s) {
    auto b = s.find_first_not_of(" \t\r\n");
    if (b == std::string::npos)
        return "";
    auto e = s.find_last_not_of(" \t\r\n");
    return s.substr(b, e - b + 1);
}

std::vector<std::string> split_list(const std::string& value) {
    std::vector<std::string> out;
    std::stringstream ss(value);
    std::string item;
    while (std::getline(ss, item, ',')) {
        item = trim(item);
        if (!item.empty())
            out.push_back(item);
    }
    return out;
}

static bool yaml_scalar(const YAML::Node& node, std::string& out) {
    if (node.IsNull()) {
        out.clear();
        return true;
    }
    if (!node.IsScalar())
        return false;
    out = node.Scalar();
    return true;
}

static bool yaml_repos(const YAML::Node& node, std::vector<std::string>& repos,
                       std::string& error) {
    if (node.IsSequence()) {
        for (const auto& item : node) {
            std::string s;
            if (!yaml_scalar(item, s) || trim(s).empty()) {
                error = "'repos' entries must be non-empty strings";
                return false;
            }
            repos.push_back(trim(s));
        }
        return true;
    }
    std::string s;
    if (!yaml_scalar(node, s)) {
        error = "'repos' must be a list or a comma separated string";
        return false;
    }
    for (auto& r : split_list(s))
        repos.push_back(r);
    return true;
}

static bool yaml_collect(const YAML::Node& map, std::map<std::string, std::string>& opts,
                         std::vector<std::string>& repos, std::string& error) {
    for (auto it = map.begin(); it != map.end(); ++it) {
        if (!it->first.IsScalar()) {
            error = "Non-scalar key in configuration";
            return false;
        }
        const std::string key = it->first.as<std::string>();
        const YAML::Node& val = it->second;
        if (key == REPOS_KEY) {
            if (!yaml_repos(val, repos, error))
                return false;
        } else if (val.IsMap()) {
            if (!yaml_collect(val, opts, repos, error))
                return false;
        } else {
            std::string s;
            if (!yaml_scalar(val, s)) {
                error = "Value of '" + key + "' must be a scalar";
                return false;
            }
            opts["--" + key] = s;
        }
    }
    return true;
}

bool load_yaml_config(const std::string& path, std::map<std::string, std::string>& opts,
                      std::vector<std::string>& repos, std::string& error) {
    try {
        std::ifstream ifs(path);
        if (!ifs) {
            error = "Failed to open file";
            return false;
        }
        YAML::Node root = YAML::Load(ifs);
        if (!root.IsMap()) {
            error = "Root YAML node is not a map";
            return false;
        }
        return yaml_collect(root, opts, repos, error);
    } catch (const std::exception& e) {
        error = e.what();
        return false;
    }
}

static bool to_string_value(const nlohmann::json& v, std::string& out) {
    if (v.is_string()) {
        out = v.get<std::string>();
        return true;
    }
    if (v.is_boolean()) {
        out = v.get<bool>() ? "true" : "false";
        return true;
    }
    if (v.is_number_integer()) {
        out = std::to_string(v.get<long long>());
        return true;
    }
    if (v.is_number_unsigned()) {
        out = std::to_string(v.get<unsigned long long>());
        return true;
    }
    if (v.is_number_float()) {
        std::ostringstream oss;
        oss << v.get<double>();
        out = oss.str();
        return true;
    }
    if (v.is_null()) {
        out.clear();
        return true;
    }
    return false;
}

static bool json_collect(const nlohmann::json& obj, std::map<std::string, std::string>& opts,
                         std::vector<std::string>& repos, std::string& error) {
    for (auto it = obj.begin(); it != obj.end(); ++it) {
        const std::string& key = it.key();
        const auto& val = it.value();
        if (key == REPOS_KEY) {
            if (val.is_array()) {
                for (const auto& item : val) {
                    if (!item.is_string() || trim(item.get<std::string>()).empty()) {
                        error = "'repos' entries must be non-empty strings";
                        return false;
                    }
                    repos.push_back(trim(item.get<std::string>()));
                }
            } else if (val.is_string()) {
                for (auto& r : split_list(val.get<std::string>()))
                    repos.push_back(r);
            } else {
                error = "'repos' must be an array or a comma separated string";
                return false;
            }
        } else if (val.is_object()) {
            if (!json_collect(val, opts, repos, error))
                return false;
        } else {
            std::string s;
            if (!to_string_value(val, s)) {
                error = "Value of '" + key + "' must be a scalar";
                return false;
            }
            opts["--" + key] = s;
        }
    }
    return true;
}

bool load_json_config(const std::string& path, std::map<std::string, std::string>& opts,
                      std::vector<std::string>& repos, std::string& error) {
    try {
        std::ifstream ifs(path);
        if (!ifs) {
            error = "Failed to open file";
            return false;
        }
        nlohmann::json root;
        ifs >> root;
        if (!root.is_object()) {
            error = "Root JSON value is not an object";
            return false;
        }
        return json_collect(root, opts, repos, error);
    } catch (const std::exception& e) {
        error = e.what();
        return false;
    }
}
