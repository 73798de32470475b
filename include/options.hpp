#ifndef OPTIONS_HPP
#define OPTIONS_HPP
#include <chrono>
#include <filesystem>
#include <string>
#include <vector>
#include "logger.hpp"
#include "models.hpp"

enum class BackendKind { Auto, Gh, Api };

/** @return "auto", "gh" or "api". */
const char* backend_kind_name(BackendKind kind);

struct LoggingOptions {
    LogLevel log_level = LogLevel::INFO;
    std::filesystem::path log_dir;
    std::string log_file;
    size_t max_log_size = 0;
    size_t max_log_files = 3;
    bool json_log = false;
    bool compress_logs = false;
};

/**
 * @brief Settings describing how the remote platform is reached.
 */
struct RemoteOptions {
    BackendKind backend = BackendKind::Auto;
    std::string token_env = "GITHUB_TOKEN";
    std::string api_url = "https://api.github.com";
    std::string web_url = "https://github.com";
    std::string gh_path = "gh";
    std::string git_path = "git";
    std::string remote_name = "origin";
    bool embed_token = true;
    std::chrono::seconds timeout{0};
};

struct Options {
    std::vector<std::string> positional; ///< OWNER and REPO_NAME, checked by the validator
    std::string description;
    Visibility visibility = Visibility::Public;
    std::filesystem::path workspace;
    RemoteOptions remote;
    LoggingOptions logging;
    bool no_colors = false;
    bool silent = false;
    bool show_help = false;
    bool print_version = false;
    bool auto_config = false;
    std::filesystem::path config_file;
};

/**
 * @brief Parse command line arguments merged over optional config files.
 *
 * Config files named by `--config-yaml`/`--config-json` (or discovered with
 * `--auto-config` in the workspace) provide defaults; command line values
 * win. Positional arguments are collected as given and not counted here.
 *
 * @throws std::runtime_error on unknown options, missing or invalid values,
 *         and unreadable config files.
 */
Options parse_options(int argc, char* argv[]);

/**
 * @brief Turn BackendKind::Auto into a concrete backend.
 *
 * @param token_present Whether the token variable is set and non-empty.
 * @return BackendKind::Api when a token is present, otherwise BackendKind::Gh.
 */
BackendKind resolve_backend(BackendKind requested, bool token_present);

#endif // OPTIONS_HPP
