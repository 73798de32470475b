#include "test_common.hpp"
#include "cli_commands.hpp"
#include "console.hpp"
#include "version.hpp"
#include <sstream>

TEST_CASE("handle_info_queries prints help") {
    Options opts;
    opts.show_help = true;
    std::ostringstream out;
    auto rc = cli::handle_info_queries(opts, "repo-bootstrap", out);
    REQUIRE(rc.has_value());
    REQUIRE(*rc == 0);
    REQUIRE(out.str().find("Usage: repo-bootstrap [options] OWNER REPO_NAME") != std::string::npos);
    REQUIRE(out.str().find("--token-env") != std::string::npos);
}

TEST_CASE("handle_info_queries prints version") {
    Options opts;
    opts.print_version = true;
    std::ostringstream out;
    auto rc = cli::handle_info_queries(opts, "repo-bootstrap", out);
    REQUIRE(rc.has_value());
    REQUIRE(*rc == 0);
    REQUIRE(out.str() == std::string(REPOBOOTSTRAP_VERSION) + "\n");
}

TEST_CASE("handle_info_queries is silent without flags") {
    Options opts;
    std::ostringstream out;
    REQUIRE_FALSE(cli::handle_info_queries(opts, "repo-bootstrap", out).has_value());
    REQUIRE(out.str().empty());
}

TEST_CASE("setup_logging opens a file inside the log directory") {
    fs::path dir = fs::temp_directory_path() / "rb_cli_logdir";
    FS_REMOVE_ALL(dir);
    Options opts;
    opts.logging.log_dir = dir / "nested";
    REQUIRE(cli::setup_logging(opts));
    log_info("hello from cli test");
    shutdown_logger();
    REQUIRE(fs::exists(dir / "nested" / "repo-bootstrap.log"));
    REQUIRE(rbt::read_file(dir / "nested" / "repo-bootstrap.log").find("hello from cli test") !=
            std::string::npos);
    FS_REMOVE_ALL(dir);
}

TEST_CASE("setup_logging does nothing without a destination") {
    Options opts;
    REQUIRE_FALSE(cli::setup_logging(opts));
    REQUIRE_FALSE(logger_initialized());
}

TEST_CASE("handle_bootstrap_run reports argument errors on stderr") {
    git::GitInitGuard guard;
    std::ostringstream out;
    std::ostringstream err;
    Console console(out, err, false, false);
    Options opts;
    opts.positional = {"only-one"};
    opts.remote.backend = BackendKind::Api;
    REQUIRE(cli::handle_bootstrap_run(opts, std::nullopt, console) == 1);
    REQUIRE(err.str() == "Error [ArgumentError]: expected OWNER and REPO_NAME, got 1 argument(s)\n");
    REQUIRE(out.str().find("=== GitHub Repo Creation with API ===") != std::string::npos);
    REQUIRE(out.str().find("Repository:") == std::string::npos);
}

TEST_CASE("handle_bootstrap_run picks the API backend when a token is present") {
    git::GitInitGuard guard;
    fs::path ws = rbt::make_workspace("rb_cli_api_ws");
    rbt::FakeHttpServer server({{401, R"({"message":"Bad credentials"})"}});
    std::ostringstream out;
    std::ostringstream err;
    Console console(out, err, false, false);
    Options opts;
    opts.positional = {"acme", "demo-pipeline"};
    opts.workspace = ws;
    opts.remote.git_path = "sh";
    opts.remote.api_url = server.url();
    REQUIRE(cli::handle_bootstrap_run(opts, std::string("ghp_secret"), console) == 1);
    REQUIRE(out.str().find("=== GitHub Repo Creation with API ===") != std::string::npos);
    REQUIRE(out.str().find("Owner: acme") != std::string::npos);
    REQUIRE(out.str().find("Repo: demo-pipeline") != std::string::npos);
    REQUIRE(err.str().rfind("Error [InvalidCredential]:", 0) == 0);
    REQUIRE(err.str().find("Bad credentials") != std::string::npos);
    auto reqs = server.requests();
    REQUIRE(reqs.size() == 1);
    REQUIRE(reqs[0].path == "/user");
    REQUIRE_FALSE(git::is_git_repo(ws));
    FS_REMOVE_ALL(ws);
}

TEST_CASE("handle_bootstrap_run falls back to gh without a token") {
    git::GitInitGuard guard;
    std::ostringstream out;
    std::ostringstream err;
    Console console(out, err, false, false);
    Options opts;
    opts.positional = {"acme", "demo-pipeline"};
    opts.workspace = fs::temp_directory_path();
    opts.remote.gh_path = "rb-no-such-gh";
    REQUIRE(cli::handle_bootstrap_run(opts, std::string(), console) == 1);
    REQUIRE(out.str().find("=== GitHub Repo Creation with gh ===") != std::string::npos);
    REQUIRE(err.str() == "Error [MissingTool]: rb-no-such-gh is not installed\n");
}

namespace {

std::vector<std::string> lines_of(const std::string& text) {
    std::vector<std::string> lines;
    std::istringstream in(text);
    std::string line;
    while (std::getline(in, line))
        lines.push_back(line);
    return lines;
}

Options demo_options(const fs::path& ws) {
    Options opts;
    opts.positional = {"acme", "demo-pipeline"};
    opts.workspace = ws;
    opts.description = content::default_description();
    return opts;
}

} // namespace

TEST_CASE("handle_bootstrap_run ends a successful run with the result lines") {
    git::GitInitGuard guard;
    rbt::IdentityScope identity("rb_cli_success");
    fs::path ws = rbt::make_workspace("rb_cli_success_ws");
    fs::path remote = fs::temp_directory_path() / "rb_cli_success_remote.git";
    FS_REMOVE_ALL(remote);
    rbt::FakeBackend backend(remote);
    std::ostringstream out;
    std::ostringstream err;
    Console console(out, err, false, false);

    REQUIRE(cli::handle_bootstrap_run(demo_options(ws), backend, console) == 0);
    INFO(err.str());
    REQUIRE(err.str().empty());
    auto lines = lines_of(out.str());
    REQUIRE(lines.size() > 2);
    REQUIRE(lines.front() == "=== GitHub Repo Creation with fake ===");
    REQUIRE(lines[lines.size() - 2] == "Repository: https://github.com/acme/demo-pipeline");
    REQUIRE(lines.back() == "Pull Request: https://github.com/acme/demo-pipeline/pull/1");
    REQUIRE(out.str().find("🎉 SUCCESS!") != std::string::npos);
    FS_REMOVE_ALL(ws);
    FS_REMOVE_ALL(remote);
}

TEST_CASE("Silent runs still print the result lines") {
    git::GitInitGuard guard;
    rbt::IdentityScope identity("rb_cli_silent");
    fs::path ws = rbt::make_workspace("rb_cli_silent_ws");
    fs::path remote = fs::temp_directory_path() / "rb_cli_silent_remote.git";
    FS_REMOVE_ALL(remote);
    rbt::FakeBackend backend(remote);
    std::ostringstream out;
    std::ostringstream err;
    Console console(out, err, false, true);

    REQUIRE(cli::handle_bootstrap_run(demo_options(ws), backend, console) == 0);
    REQUIRE(lines_of(out.str()) ==
            std::vector<std::string>{"Repository: https://github.com/acme/demo-pipeline",
                                     "Pull Request: https://github.com/acme/demo-pipeline/pull/1"});
    FS_REMOVE_ALL(ws);
    FS_REMOVE_ALL(remote);
}

TEST_CASE("Argument errors create no log file") {
    git::GitInitGuard guard;
    fs::path dir = fs::temp_directory_path() / "rb_cli_arg_logs";
    FS_REMOVE_ALL(dir);
    fs::path remote = fs::temp_directory_path() / "rb_cli_arg_remote.git";
    rbt::FakeBackend backend(remote);
    std::ostringstream out;
    std::ostringstream err;
    Console console(out, err, false, false);
    Options opts;
    opts.positional = {"acme"};
    opts.logging.log_dir = dir / "logs";
    opts.logging.log_file = (dir / "run.log").string();

    REQUIRE(cli::handle_bootstrap_run(opts, backend, console) == 1);
    REQUIRE(err.str().rfind("Error [ArgumentError]:", 0) == 0);
    REQUIRE_FALSE(logger_initialized());
    REQUIRE_FALSE(fs::exists(dir));
    REQUIRE(backend.calls() == 0);
}

TEST_CASE("Valid arguments open the log file before the workflow runs") {
    git::GitInitGuard guard;
    fs::path dir = fs::temp_directory_path() / "rb_cli_run_logs";
    FS_REMOVE_ALL(dir);
    fs::path remote = fs::temp_directory_path() / "rb_cli_run_remote.git";
    rbt::FakeBackend backend(remote);
    backend.tools = {"rb-missing-tool"};
    std::ostringstream out;
    std::ostringstream err;
    Console console(out, err, false, false);
    Options opts;
    opts.positional = {"acme", "demo-pipeline"};
    opts.logging.log_dir = dir;

    REQUIRE(cli::handle_bootstrap_run(opts, backend, console) == 1);
    REQUIRE(logger_initialized());
    shutdown_logger();
    std::string log = rbt::read_file(dir / "repo-bootstrap.log");
    REQUIRE(log.find("Starting bootstrap") != std::string::npos);
    REQUIRE(log.find("MissingTool") != std::string::npos);
    FS_REMOVE_ALL(dir);
}
