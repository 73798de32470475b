#include "help_text.hpp"
#include "content.hpp"
#include <algorithm>
#include <cstring>
#include <iomanip>
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

static std::string format_flag(const OptionInfo& o) {
    std::string flag = "  ";
    if (std::strlen(o.short_flag))
        flag += std::string(o.short_flag) + ", ";
    else
        flag += "    ";
    flag += o.long_flag;
    if (std::strlen(o.arg))
        flag += " " + std::string(o.arg);
    return flag;
}

void print_help(const char* prog, std::ostream& os) {
    static const std::vector<OptionInfo> opts = {
        {"--backend", "-b", "<gh|api>",
         "Remote backend (default: api when the token variable is set, else gh)", "Remote"},
        {"--token-env", "", "<var>", "Environment variable holding the token (GITHUB_TOKEN)",
         "Remote"},
        {"--api-url", "", "<url>", "REST API root (https://api.github.com)", "Remote"},
        {"--web-url", "", "<url>", "Web root used for repository URLs (https://github.com)",
         "Remote"},
        {"--gh-path", "", "<path>", "GitHub CLI executable (gh)", "Remote"},
        {"--git-path", "", "<path>", "git executable checked before starting (git)", "Remote"},
        {"--timeout", "", "<sec>", "Per-request HTTP timeout, 0 for none (default 0)", "Remote"},
        {"--no-embed-token", "", "",
         "Do not store the token in the remote URL; supply it at push time instead", "Remote"},
        {"--description", "", "<text>", "Repository description", "Repository"},
        {"--private", "-p", "", "Create a private repository", "Repository"},
        {"--public", "", "", "Create a public repository (default)", "Repository"},
        {"--remote", "", "<name>", "Name of the remote to bind (origin)", "Repository"},
        {"--workspace", "-w", "<dir>", "Local project directory (current directory)",
         "Repository"},
        {"--config-yaml", "-y", "<file>", "Load options from YAML file", "Config"},
        {"--config-json", "-j", "<file>", "Load options from JSON file", "Config"},
        {"--auto-config", "", "", "Load .repo-bootstrap.yaml or .json from the workspace",
         "Config"},
        {"--log-dir", "-d", "<path>", "Directory for repo-bootstrap.log", "Logging"},
        {"--log-file", "-l", "<file>", "Log file path", "Logging"},
        {"--log-level", "-L", "<level>", "DEBUG, INFO, WARNING or ERROR", "Logging"},
        {"--verbose", "-g", "", "Shortcut for --log-level DEBUG", "Logging"},
        {"--json-log", "", "", "Write log entries as JSON lines", "Logging"},
        {"--max-log-size", "", "<bytes>", "Rotate the log after this size (e.g. 1M)", "Logging"},
        {"--max-log-files", "", "<n>", "Rotated log files to keep (default 3)", "Logging"},
        {"--compress-logs", "", "", "Gzip rotated log files", "Logging"},
        {"--no-colors", "-C", "", "Disable ANSI colors", "Display"},
        {"--silent", "-s", "", "Only print errors and the final result lines", "Display"},
        {"--version", "-V", "", "Show version", "Basics"},
        {"--help", "-h", "", "Show this message", "Basics"}};

    std::map<std::string, std::vector<const OptionInfo*>> groups;
    size_t width = 0;
    for (const auto& o : opts) {
        groups[o.category].push_back(&o);
        width = std::max(width, format_flag(o).size());
    }

    os << "repo-bootstrap - create a GitHub repository from the current project and open a "
          "pull request\n\n";
    os << "Usage: " << prog << " [options] OWNER REPO_NAME\n\n";
    os << "Required files:\n";
    for (const auto& path : content::required_paths())
        os << "  " << path << "\n";
    os << "\n";
    const std::vector<std::string> order{"Basics", "Remote", "Repository",
                                         "Config", "Logging", "Display"};
    for (const auto& cat : order) {
        if (!groups.count(cat))
            continue;
        os << cat << ":\n";
        for (const auto* o : groups[cat]) {
            os << std::left << std::setw(static_cast<int>(width) + 2) << format_flag(*o)
               << o->desc << "\n";
        }
        os << "\n";
    }
    os << "The api backend stores the token in the remote URL unless --no-embed-token is "
          "given.\n";
}
