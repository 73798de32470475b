#include <climits>
#include <filesystem>
#include <map>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include "arg_parser.hpp"
#include "config_utils.hpp"
#include "content.hpp"
#include "options.hpp"
#include "parse_utils.hpp"

namespace fs = std::filesystem;

namespace {

const std::set<std::string> kValueFlags{
    "--backend",     "--token-env",    "--api-url",      "--web-url",    "--gh-path",
    "--git-path",    "--remote",       "--description",  "--workspace",  "--timeout",
    "--log-dir",     "--log-file",     "--log-level",    "--max-log-size",
    "--max-log-files", "--config-yaml", "--config-json"};

const std::set<std::string> kSwitches{"--private",    "--public",    "--no-embed-token",
                                      "--verbose",    "--json-log",  "--compress-logs",
                                      "--no-colors",  "--silent",    "--help",
                                      "--version",    "--auto-config"};

const std::map<char, std::string> kShortOpts{
    {'h', "--help"},     {'V', "--version"},    {'b', "--backend"},   {'p', "--private"},
    {'w', "--workspace"}, {'d', "--log-dir"},   {'l', "--log-file"},  {'L', "--log-level"},
    {'g', "--verbose"},  {'y', "--config-yaml"}, {'j', "--config-json"}, {'s', "--silent"},
    {'C', "--no-colors"}};

std::set<std::string> known_flags() {
    std::set<std::string> known = kValueFlags;
    known.insert(kSwitches.begin(), kSwitches.end());
    return known;
}

void load_config(const fs::path& path, bool yaml, std::map<std::string, std::string>& cfg) {
    std::string err;
    bool ok = yaml ? load_yaml_config(path.string(), cfg, err)
                   : load_json_config(path.string(), cfg, err);
    if (!ok)
        throw std::runtime_error("Failed to load config " + path.string() + ": " + err);
}

} // namespace

const char* backend_kind_name(BackendKind kind) {
    switch (kind) {
    case BackendKind::Auto:
        return "auto";
    case BackendKind::Gh:
        return "gh";
    case BackendKind::Api:
        return "api";
    }
    return "auto";
}

BackendKind resolve_backend(BackendKind requested, bool token_present) {
    if (requested != BackendKind::Auto)
        return requested;
    return token_present ? BackendKind::Api : BackendKind::Gh;
}

Options parse_options(int argc, char* argv[]) {
    const std::set<std::string> known = known_flags();
    ArgParser parser(argc, argv, known, kShortOpts, kValueFlags);
    if (!parser.unknown_flags().empty())
        throw std::runtime_error("Unknown option: " + parser.unknown_flags().front());
    if (!parser.missing_values().empty())
        throw std::runtime_error(parser.missing_values().front() + " requires a value");

    Options opts;
    opts.positional = parser.positional();
    opts.show_help = parser.has_flag("--help");
    opts.print_version = parser.has_flag("--version");

    std::map<std::string, std::string> cfg_opts;
    if (parser.has_flag("--config-yaml")) {
        opts.config_file = parser.get_option("--config-yaml");
        load_config(opts.config_file, true, cfg_opts);
    }
    if (parser.has_flag("--config-json")) {
        opts.config_file = parser.get_option("--config-json");
        load_config(opts.config_file, false, cfg_opts);
    }

    auto cfg_flag = [&](const std::string& k) {
        auto it = cfg_opts.find(k);
        if (it == cfg_opts.end())
            return false;
        bool ok = false;
        bool v = parse_bool(it->second, ok);
        if (!ok)
            throw std::runtime_error("Invalid value for " + k + " in config: " + it->second);
        return v;
    };
    auto switch_on = [&](const std::string& k) { return parser.has_flag(k) || cfg_flag(k); };
    // Command line value first, then config.
    auto value_of = [&](const std::string& k) -> std::optional<std::string> {
        if (parser.has_value(k))
            return parser.get_option(k);
        auto it = cfg_opts.find(k);
        if (it != cfg_opts.end())
            return it->second;
        return std::nullopt;
    };

    if (auto ws = value_of("--workspace")) {
        if (ws->empty())
            throw std::runtime_error("--workspace requires a path");
        opts.workspace = *ws;
    } else {
        opts.workspace = fs::current_path();
    }

    opts.auto_config = switch_on("--auto-config");
    if (opts.auto_config && opts.config_file.empty()) {
        fs::path found = find_auto_config(opts.workspace);
        if (!found.empty()) {
            load_config(found, found.extension() == ".yaml", cfg_opts);
            opts.config_file = found;
        }
    }

    for (const auto& kv : cfg_opts) {
        if (!known.count(kv.first))
            throw std::runtime_error("Unknown option in config: " + kv.first);
    }

    if (auto v = value_of("--backend")) {
        if (*v == "gh")
            opts.remote.backend = BackendKind::Gh;
        else if (*v == "api")
            opts.remote.backend = BackendKind::Api;
        else if (*v == "auto")
            opts.remote.backend = BackendKind::Auto;
        else
            throw std::runtime_error("Invalid value for --backend: " + *v);
    }

    auto non_empty = [&](const std::string& k, std::string& dst) {
        if (auto v = value_of(k)) {
            if (v->empty())
                throw std::runtime_error(k + " requires a value");
            dst = *v;
        }
    };
    non_empty("--token-env", opts.remote.token_env);
    non_empty("--api-url", opts.remote.api_url);
    non_empty("--web-url", opts.remote.web_url);
    non_empty("--gh-path", opts.remote.gh_path);
    non_empty("--git-path", opts.remote.git_path);
    non_empty("--remote", opts.remote.remote_name);
    while (!opts.remote.api_url.empty() && opts.remote.api_url.back() == '/')
        opts.remote.api_url.pop_back();

    opts.description = content::default_description();
    if (auto v = value_of("--description"))
        opts.description = *v;

    if (parser.has_flag("--private") && parser.has_flag("--public"))
        throw std::runtime_error("--private and --public are mutually exclusive");
    if (parser.has_flag("--private"))
        opts.visibility = Visibility::Private;
    else if (!parser.has_flag("--public") && cfg_flag("--private"))
        opts.visibility = Visibility::Private;

    opts.remote.embed_token = !switch_on("--no-embed-token");

    if (auto v = value_of("--timeout")) {
        bool ok = false;
        opts.remote.timeout = parse_duration(*v, INT_MAX, ok);
        if (!ok)
            throw std::runtime_error("Invalid value for --timeout: " + *v);
    }

    if (switch_on("--verbose"))
        opts.logging.log_level = LogLevel::DEBUG;
    if (auto v = value_of("--log-level")) {
        if (!parse_log_level(*v, opts.logging.log_level))
            throw std::runtime_error("Invalid log level: " + *v);
    }
    if (auto v = value_of("--log-dir")) {
        if (v->empty())
            throw std::runtime_error("--log-dir requires a path");
        opts.logging.log_dir = *v;
    }
    if (auto v = value_of("--log-file"))
        opts.logging.log_file = *v;
    if (auto v = value_of("--max-log-size")) {
        bool ok = false;
        opts.logging.max_log_size = parse_bytes(*v, 0, SIZE_MAX, ok);
        if (!ok)
            throw std::runtime_error("Invalid value for --max-log-size: " + *v);
    }
    if (auto v = value_of("--max-log-files")) {
        bool ok = false;
        opts.logging.max_log_files = parse_size_t(*v, 1, 100, ok);
        if (!ok)
            throw std::runtime_error("Invalid value for --max-log-files: " + *v);
    }
    opts.logging.json_log = switch_on("--json-log");
    opts.logging.compress_logs = switch_on("--compress-logs");

    opts.no_colors = switch_on("--no-colors");
    opts.silent = switch_on("--silent");
    return opts;
}
