#ifndef ARG_PARSER_HPP
#define ARG_PARSER_HPP
#include <map>
#include <set>
#include <string>
#include <vector>

/**
 * @brief Simple command line argument parser.
 *
 * Long options are written `--flag`, `--opt value` or `--opt=value`. Short
 * options map to their long form through @a short_map and may be bundled
 * (`-nk`); a short option taking a value accepts `-o value`, `-ovalue` and
 * `-o=value`.
 *
 * Only flags listed in @a value_flags consume the following argument. Flags
 * in @a list_flags consume every following argument up to the next one that
 * starts with `-`, so `--repos a b c` yields three values. A bare `--` ends
 * option parsing. Plain flags never swallow a positional argument.
 */
class ArgParser {
    std::set<std::string> flags_;                ///< Flags present on the command line
    std::map<std::string, std::string> options_; ///< Last value of each option
    std::map<std::string, std::vector<std::string>>
        multi_options_;                       ///< Every value for repeatable options
    std::vector<std::string> positional_;     ///< Positional arguments in order
    std::vector<std::string> unknown_flags_;  ///< Flags not present in known_flags
    std::vector<std::string> missing_values_; ///< Value options given without one
    std::set<std::string> known_flags_;       ///< List of accepted flags
    std::map<char, std::string> short_map_;   ///< Mapping of short to long flags
    std::set<std::string> value_flags_;
    std::set<std::string> list_flags_;

    static bool looks_like_flag(const std::string& s) { return s.size() > 1 && s[0] == '-'; }

    bool takes_value(const std::string& key) const {
        return value_flags_.count(key) > 0 || list_flags_.count(key) > 0;
    }

    void add(const std::string& key, bool has_val, std::string val, int& i, int argc,
             char* argv[]) {
        if (!known_flags_.empty() && !known_flags_.count(key)) {
            unknown_flags_.push_back(key);
            return;
        }
        flags_.insert(key);
        if (list_flags_.count(key)) {
            auto& vals = multi_options_[key];
            size_t before = vals.size();
            if (has_val)
                vals.push_back(val);
            while (i + 1 < argc && !looks_like_flag(argv[i + 1]))
                vals.emplace_back(argv[++i]);
            if (vals.size() == before)
                missing_values_.push_back(key);
            else
                options_[key] = vals.back();
            return;
        }
        if (value_flags_.count(key) && !has_val) {
            if (i + 1 < argc && !looks_like_flag(argv[i + 1])) {
                val = argv[++i];
                has_val = true;
            } else {
                missing_values_.push_back(key);
                return;
            }
        }
        if (has_val) {
            options_[key] = val;
            multi_options_[key].push_back(val);
        }
    }

  public:
    /**
     * @brief Parse the given command line arguments.
     *
     * @param argc Argument count from `main`.
     * @param argv Argument vector from `main`.
     * @param known_flags Optional set of flags that are considered valid. If
     *        empty, all flags are treated as known.
     * @param short_map Mapping from single character options (e.g. '-h') to
     *        their long form (e.g. '--help').
     * @param value_flags Flags that require a value.
     * @param list_flags Flags that take one or more values.
     */
    ArgParser(int argc, char* argv[], const std::set<std::string>& known_flags = {},
              const std::map<char, std::string>& short_map = {},
              const std::set<std::string>& value_flags = {},
              const std::set<std::string>& list_flags = {})
        : known_flags_(known_flags), short_map_(short_map), value_flags_(value_flags),
          list_flags_(list_flags) {
        bool only_positional = false;
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            if (only_positional || !looks_like_flag(arg)) {
                positional_.push_back(arg);
            } else if (arg == "--") {
                only_positional = true;
            } else if (arg.rfind("--", 0) == 0) {
                size_t eq = arg.find('=');
                if (eq != std::string::npos)
                    add(arg.substr(0, eq), true, arg.substr(eq + 1), i, argc, argv);
                else
                    add(arg, false, "", i, argc, argv);
            } else {
                std::string body = arg.substr(1);
                for (size_t j = 0; j < body.size(); ++j) {
                    auto it = short_map_.find(body[j]);
                    if (it == short_map_.end()) {
                        unknown_flags_.push_back(std::string("-") + body[j]);
                        break;
                    }
                    const std::string& key = it->second;
                    if (takes_value(key) && j + 1 < body.size()) {
                        std::string rest = body.substr(j + 1);
                        if (rest[0] == '=')
                            rest.erase(0, 1);
                        add(key, true, rest, i, argc, argv);
                        break;
                    }
                    add(key, false, "", i, argc, argv);
                }
            }
        }
    }

    /**
     * @brief Check whether a flag was provided on the command line.
     *
     * @param flag Flag name including the leading `--`.
     * @return `true` if the flag was present, otherwise `false`.
     */
    bool has_flag(const std::string& flag) const { return flags_.count(flag) > 0; }

    /**
     * @brief Retrieve the value associated with an option.
     *
     * If the option was not provided, an empty string is returned.
     *
     * @param opt Option name including the leading `--`.
     * @return Stored option value or empty string if missing.
     */
    std::string get_option(const std::string& opt) const {
        auto it = options_.find(opt);
        if (it != options_.end())
            return it->second;
        return "";
    }

    /**
     * @brief Retrieve all values associated with an option, in command line
     * order.
     */
    std::vector<std::string> get_all_options(const std::string& opt) const {
        auto it = multi_options_.find(opt);
        if (it != multi_options_.end())
            return it->second;
        return {};
    }

    /** @return Set of all flags found during parsing. */
    const std::set<std::string>& flags() const { return flags_; }

    /** @return Map of option names to their parsed values. */
    const std::map<std::string, std::string>& options() const { return options_; }

    /** @return Ordered list of positional arguments. */
    const std::vector<std::string>& positional() const { return positional_; }

    /** @return Flags that were not part of @a known_flags. */
    const std::vector<std::string>& unknown_flags() const { return unknown_flags_; }

    /** @return Value options that appeared without a value. */
    const std::vector<std::string>& missing_values() const { return missing_values_; }
};

#endif // ARG_PARSER_HPP
