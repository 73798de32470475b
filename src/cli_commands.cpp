#include "cli_commands.hpp"

#include <cstring>
#include <filesystem>

#include "content.hpp"
#include "help_text.hpp"
#include "logger.hpp"
#include "preconditions.hpp"
#include "remote_backend.hpp"
#include "version.hpp"
#include "workflow.hpp"

namespace fs = std::filesystem;

namespace cli {

std::optional<int> handle_info_queries(const Options& opts, const char* prog, std::ostream& out) {
    if (opts.show_help) {
        print_help(prog, out);
        return 0;
    }
    if (opts.print_version) {
        out << REPOBOOTSTRAP_VERSION << "\n";
        return 0;
    }
    return std::nullopt;
}

bool setup_logging(const Options& opts) {
    const LoggingOptions& lo = opts.logging;
    std::string path = lo.log_file;
    if (path.empty() && !lo.log_dir.empty())
        path = (lo.log_dir / "repo-bootstrap.log").string();
    if (path.empty())
        return false;
    set_json_logging(lo.json_log);
    set_log_compression(lo.compress_logs);
    init_logger(path, lo.log_level, lo.max_log_size, lo.max_log_files);
    return logger_initialized();
}

namespace {

void print_success(const WorkflowOutcome& outcome, const RemoteBackend& backend,
                   const RepositoryDescriptor& repo, const Options& opts, Console& console) {
    console.plain();
    console.banner("🎉 SUCCESS!");
    console.plain();
    console.note("Next steps:");
    console.note("  1. Review PR at " + outcome.pull_request.url);
    console.note("  2. Wait for CI checks to pass");
    console.note("  3. Merge when ready");
    auto notes = backend.closing_notes(repo, opts.remote.remote_name);
    if (!notes.empty()) {
        console.plain();
        for (const auto& line : notes)
            console.warn(line);
    }
    console.plain();
    console.result("Repository: " + outcome.repository_url);
    console.result("Pull Request: " + outcome.pull_request.url);
}

} // namespace

int handle_bootstrap_run(const Options& opts, const std::optional<std::string>& token,
                         Console& console) {
    bool token_present = token && !token->empty();
    BackendKind kind = resolve_backend(opts.remote.backend, token_present);
    auto backend = make_backend(kind, opts, token);
    return handle_bootstrap_run(opts, *backend, console);
}

int handle_bootstrap_run(const Options& opts, RemoteBackend& backend, Console& console) {
    // An ArgumentError leaves no trace on disk, log file included.
    if (repository_from_arguments(opts))
        setup_logging(opts);
    log_info("Starting bootstrap", {{"backend", backend.name()},
                                    {"workspace", opts.workspace.string()},
                                    {"version", REPOBOOTSTRAP_VERSION}});

    std::string label = std::strcmp(backend.name(), "api") == 0 ? "API" : backend.name();
    console.banner("GitHub Repo Creation with " + label);
    if (opts.positional.size() == 2) {
        console.note("Owner: " + opts.positional[0]);
        console.note("Repo: " + opts.positional[1]);
    }
    console.plain();

    auto outcome = run_workflow(opts, backend, console);
    if (!outcome) {
        console.error(describe(outcome.error()));
        return 1;
    }
    RepositoryDescriptor repo{opts.positional[0], opts.positional[1], opts.visibility,
                              opts.description};
    print_success(outcome.value(), backend, repo, opts, console);
    return 0;
}

} // namespace cli
