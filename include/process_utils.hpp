#ifndef PROCESS_UTILS_HPP
#define PROCESS_UTILS_HPP

#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace procutil {

struct ProcessResult {
    int exit_code = -1; ///< Exit status, 128+N when killed by signal N, -1 when never started
    std::string out;
    std::string err;

    bool ok() const { return exit_code == 0; }
};

/**
 * @brief Resolve an executable the way a shell would.
 *
 * A @p name containing a slash is checked directly; otherwise each entry of
 * the colon separated @p path_env is searched in order.
 *
 * @return Absolute or given path of the executable, or `std::nullopt`.
 */
std::optional<std::string> find_executable(const std::string& name, const std::string& path_env);

/// find_executable() against the current `PATH`.
std::optional<std::string> find_executable(const std::string& name);

/**
 * @brief Run a program to completion and capture its output.
 *
 * The child inherits the environment plus @p env overrides, its stdin is
 * `/dev/null`. stdout and stderr are drained concurrently.
 *
 * @param exe  Program name or path (looked up on `PATH` by execvp).
 * @param args Arguments after argv[0].
 * @param cwd  Working directory for the child; empty keeps the current one.
 * @param env  Extra environment variables for the child.
 */
ProcessResult run_process(const std::string& exe, const std::vector<std::string>& args,
                          const std::filesystem::path& cwd = {},
                          const std::map<std::string, std::string>& env = {});

} // namespace procutil

#endif // PROCESS_UTILS_HPP
