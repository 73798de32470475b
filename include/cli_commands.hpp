#pragma once

#include <optional>
#include <ostream>
#include <string>

#include "console.hpp"
#include "options.hpp"
#include "remote_backend.hpp"

namespace cli {

/**
 * @brief Handle `--help` and `--version`.
 *
 * Returns exit code 0 when one of them was printed or `std::nullopt` if
 * neither flag was supplied.
 */
std::optional<int> handle_info_queries(const Options& opts, const char* prog, std::ostream& out);

/**
 * @brief Start the file logger when `--log-file` or `--log-dir` is given.
 *
 * Called by handle_bootstrap_run once OWNER and REPO_NAME are valid.
 *
 * @return `true` when a log file was opened.
 */
bool setup_logging(const Options& opts);

/**
 * @brief Run the bootstrap workflow and report its outcome.
 *
 * @param token Value of the token variable named by `--token-env`, if set.
 * @return 0 on success, 1 on any failure.
 */
int handle_bootstrap_run(const Options& opts, const std::optional<std::string>& token,
                         Console& console);

/// Same as above with an already constructed backend.
int handle_bootstrap_run(const Options& opts, RemoteBackend& backend, Console& console);

} // namespace cli
