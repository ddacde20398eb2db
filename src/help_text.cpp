#include "help_text.hpp"
#include <algorithm>
#include <cstring>
#include <iomanip>
#include <iostream>
#include <map>
#include <string>
#include <vector>

struct OptionInfo {
    const char* long_flag;
    const char* short_flag;
    const char* arg;
    const char* desc;
    const char* category;
};

void print_help(const char* prog) {
    static const std::vector<OptionInfo> opts = {
        {"--dry-run", "-n", "", "Show what would change without writing files", "Basics"},
        {"--watch", "-w", "", "Watch the paths and scrub files as they change", "Basics"},
        {"--threads", "-t", "<n>", "Worker threads for a single pass (default: all cores)",
         "Basics"},
        {"--debounce", "", "<ms|s>", "Quiet period before a changed file is scrubbed (300ms)",
         "Basics"},
        {"--config", "-c", "<file>", "Load settings from a TOML, YAML or JSON file", "Config"},
        {"--force", "-f", "", "Let init overwrite an existing .ghostscrub", "Config"},
        {"--verbose", "-v", "", "Show a diff of every change", "Display"},
        {"--silent", "-s", "", "Only print errors", "Display"},
        {"--no-colors", "-C", "", "Disable ANSI colors", "Display"},
        {"--log-file", "-l", "<file>", "Write a log file", "Logging"},
        {"--log-level", "-L", "<level>", "debug, info, warning or error (default: info)",
         "Logging"},
        {"--json-log", "", "", "Write log entries as JSON lines", "Logging"},
        {"--max-log-size", "", "<bytes>", "Rotate the log file at this size (e.g. 10MB)",
         "Logging"},
        {"--max-log-files", "", "<n>", "Rotated log files to keep (default 3)", "Logging"},
        {"--compress-logs", "", "", "Gzip rotated log files", "Logging"},
        {"--help", "-h", "", "Show this help", "Basics"},
        {"--version", "-V", "", "Print the version", "Basics"}};

    std::map<std::string, std::vector<const OptionInfo*>> groups;
    size_t width = 0;
    auto flag_text = [](const OptionInfo& o) {
        std::string flag = "  ";
        if (std::strlen(o.short_flag))
            flag += std::string(o.short_flag) + ", ";
        else
            flag += "    ";
        flag += o.long_flag;
        if (std::strlen(o.arg))
            flag += " " + std::string(o.arg);
        return flag;
    };
    for (const auto& o : opts) {
        groups[o.category].push_back(&o);
        width = std::max(width, flag_text(o).size());
    }

    std::cout << "ghostscrub - strip invisible and stray whitespace characters from text files\n";
    std::cout << "Removes zero-width characters, non-breaking spaces, control characters,\n";
    std::cout << "exotic Unicode whitespace and trailing whitespace.\n\n";
    std::cout << "Usage: " << prog << " [options] [PATH...]\n";
    std::cout << "       " << prog << " init [--force]\n\n";
    std::cout << "PATH may be a file, a directory (walked recursively) or a glob pattern.\n";
    std::cout << "Defaults to the current directory.\n\n";
    const std::vector<std::string> order{"Basics", "Display", "Config", "Logging"};
    for (const auto& cat : order) {
        if (!groups.count(cat))
            continue;
        std::cout << cat << ":\n";
        for (const auto* o : groups[cat]) {
            std::cout << std::left << std::setw(static_cast<int>(width) + 2) << flag_text(*o)
                      << o->desc << "\n";
        }
        std::cout << "\n";
    }
    std::cout << "Exit status: 0 on success, 1 on fatal errors, 2 if any file failed.\n";
}
