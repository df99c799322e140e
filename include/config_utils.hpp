#ifndef CONFIG_UTILS_HPP
#define CONFIG_UTILS_HPP
#include <map>
#include <string>
#include <vector>

/**
 * @brief Load options from a YAML file.
 *
 * Top-level scalars become `--key` entries in @p opts. Nested maps are
 * flattened so options may be grouped by category. The `repos` key accepts
 * a sequence or a comma separated scalar and is appended to @p repos in file
 * order.
 *
 * @param path  Filesystem path to the YAML configuration file.
 * @param opts  Map receiving option values keyed by `--long-name`.
 * @param repos Receives repository names listed under `repos`.
 * @param error Output string capturing a human-readable error message on
 *              failure.
 * @return `true` if the configuration was loaded successfully; `false`
 *         otherwise.
 */
bool load_yaml_config(const std::string& path, std::map<std::string, std::string>& opts,
                      std::vector<std::string>& repos, std::string& error);

/**
 * @brief Load options from a JSON file.
 *
 * Same layout as load_yaml_config(): a root object whose keys are long
 * option names, optionally grouped in nested objects.
 */
bool load_json_config(const std::string& path, std::map<std::string, std::string>& opts,
                      std::vector<std::string>& repos, std::string& error);

/**
 * @brief Split a comma separated list, trimming blanks and dropping empty
 * entries.
 */
std::vector<std::string> split_list(const std::string& value);

#endif // CONFIG_UTILS_HPP
