/**
 * @file repo_bootstrap.cpp
 * @brief CLI entry point creating a GitHub repository from the working
 * directory and opening the first pull request.
 */

#include <unistd.h>
#include <cstdlib>
#include <iostream>

#include "cli_commands.hpp"
#include "console.hpp"
#include "git_utils.hpp"
#include "logger.hpp"
#include "stage_result.hpp"

/**
 * @brief Application entry point.
 *
 * Parses options, reads the token variable and runs the workflow.
 *
 * @return 0 on success or when printing help/version, 1 on any failure.
 */
int main(int argc, char* argv[]) {
    git::GitInitGuard git_guard;
    Options opts;
    try {
        opts = parse_options(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << describe(Failure{FailureKind::ArgumentError, e.what()}) << "\n";
        return 1;
    }
    if (auto rc = cli::handle_info_queries(opts, argv[0], std::cout); rc)
        return *rc;

    bool colors = !opts.no_colors && isatty(STDOUT_FILENO);
    Console console(std::cout, std::cerr, colors, opts.silent);

    std::optional<std::string> token;
    if (const char* value = std::getenv(opts.remote.token_env.c_str()))
        token = value;
    int rc = cli::handle_bootstrap_run(opts, token, console);
    shutdown_logger();
    return rc;
}
