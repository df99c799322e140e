#include "help_text.hpp"
#include <algorithm>
#include <iostream>
#include <iomanip>
#include <vector>
#include <map>
#include <cstring>
#include <string>

struct OptionInfo {
    const char* long_flag;
    const char* short_flag;
    const char* arg;
    const char* desc;
    const char* category;
};

void print_help(const char* prog) {
    static const std::vector<OptionInfo> opts = {
        {"--origin-host", "-o", "<url>", "Base URL repositories are cloned from", "Basics"},
        {"--dest-host", "-d", "<url>", "Base URL repositories are pushed to", "Basics"},
        {"--repos", "-r", "<name>...", "Repositories to migrate (repeatable, comma lists ok)",
         "Basics"},
        {"--repos-file", "", "<file>", "Read repository names from a file, one per line",
         "Basics"},
        {"--no-push", "-n", "", "Clone and retarget only, do not push", "Basics"},
        {"--dry-run", "", "", "Print the migration plan and exit", "Basics"},
        {"--work-dir", "-w", "<dir>", "Directory holding the mirrors (default: cwd)",
         "Workspace"},
        {"--keep", "-k", "", "Keep mirrors on disk after migrating", "Workspace"},
        {"--force", "-f", "", "Replace a mirror directory left by an earlier run", "Workspace"},
        {"--url-suffix", "", "<s>", "Appended to repository names in URLs (default .git)",
         "URLs"},
        {"--raw-hosts", "", "", "Use host URLs verbatim without adding a trailing /", "URLs"},
        {"--git-cli", "", "", "Run the git executable instead of libgit2", "Transport"},
        {"--timeout", "-t", "<N[s|m|h]>", "Network timeout for libgit2 operations",
         "Transport"},
        {"--proxy", "", "<url>", "Proxy for libgit2 operations", "Transport"},
        {"--silent", "-s", "", "Disable console output", "Output"},
        {"--report-json", "", "<file>", "Write the batch report as JSON", "Output"},
        {"--log-file", "-l", "<file>", "Write log messages to a file", "Logging"},
        {"--log-level", "-L", "<level>", "DEBUG, INFO, WARNING or ERROR", "Logging"},
        {"--verbose", "-v", "", "Same as --log-level DEBUG", "Logging"},
        {"--json-log", "", "", "Write log lines as JSON", "Logging"},
        {"--max-log-size", "", "<bytes>", "Rotate the log file at this size (KB/MB/GB)",
         "Logging"},
        {"--max-log-files", "", "<n>", "Rotated log files to keep (default 3)", "Logging"},
        {"--compress-logs", "", "", "Gzip rotated log files", "Logging"},
        {"--config-yaml", "-y", "<file>", "Load options from a YAML file", "Config"},
        {"--config-json", "-j", "<file>", "Load options from a JSON file", "Config"},
        {"--help", "-h", "", "Show this message", "Info"},
        {"--version", "-V", "", "Print the version and exit", "Info"}};

    std::map<std::string, std::vector<const OptionInfo*>> groups;
    size_t width = 0;
    for (const auto& o : opts) {
        groups[o.category].push_back(&o);
        std::string flag = "  ";
        flag += std::strlen(o.short_flag) ? std::string(o.short_flag) + ", " : "    ";
        flag += o.long_flag;
        if (std::strlen(o.arg))
            flag += " " + std::string(o.arg);
        width = std::max(width, flag.size());
    }

    std::cout << "repomigrator - Git repository mirror migration\n";
    std::cout << "Mirrors repositories from one host to another, every branch and tag.\n";
    std::cout << "Configuration can be read from YAML or JSON files.\n\n";
    std::cout << "Usage: " << prog
              << " --origin-host <url> --dest-host <url> --repos <name>... [options]\n\n";
    const std::vector<std::string> order{"Basics",    "Workspace", "URLs",   "Transport",
                                         "Output",    "Logging",   "Config", "Info"};
    for (const auto& cat : order) {
        if (!groups.count(cat))
            continue;
        std::cout << cat << ":\n";
        for (const auto* o : groups[cat]) {
            std::string flag = "  ";
            if (std::strlen(o->short_flag))
                flag += std::string(o->short_flag) + ", ";
            else
                flag += "    ";
            flag += o->long_flag;
            if (std::strlen(o->arg))
                flag += " " + std::string(o->arg);
            std::cout << std::left << std::setw(static_cast<int>(width) + 2) << flag << o->desc
                      << "\n";
        }
        std::cout << "\n";
    }
    std::cout << "Exit status is 0 when every repository succeeded, 1 otherwise.\n";
}
